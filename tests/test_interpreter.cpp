#include "interpreter/interpreter.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <new>
#include <stdexcept>
#include <thread>

#include "fake_backend.hpp"
#include "sandbox/backend_error.hpp"

using codebox::interpreter::ConfigurationError;
using codebox::interpreter::FailureKind;
using codebox::interpreter::Interpreter;
using codebox::interpreter::InterpreterOptions;
using codebox::sandbox::ExecRequest;
using codebox::sandbox::ExecResponse;
using codebox::testing::FakeBackend;

namespace {

InterpreterOptions DefaultOptions() {
    InterpreterOptions options{};
    options.working_dir = "/workspace";
    return options;
}

}  // namespace

TEST(InterpreterTest, SuccessOrdersStdoutBeforeTimingLine) {
    Interpreter interpreter(DefaultOptions(), FakeBackend::Returning("42\n", "", 0));

    const auto result = interpreter.Run("print(42)");

    EXPECT_TRUE(result.Succeeded());
    EXPECT_FALSE(result.failure_kind.has_value());
    EXPECT_FALSE(result.failure_detail.has_value());
    EXPECT_FALSE(result.stack_trace.has_value());
    ASSERT_EQ(result.term_out.size(), 2u);
    EXPECT_EQ(result.term_out[0], "42\n");
    EXPECT_EQ(result.term_out[1], "Execution time: a moment (time limit is an hour).");
    EXPECT_GE(result.exec_time, 0.0);
}

TEST(InterpreterTest, StderrComesBeforeStdout) {
    Interpreter interpreter(DefaultOptions(), FakeBackend::Returning("out", "warning: deprecated", 0));

    const auto result = interpreter.Run("x = 1");

    EXPECT_TRUE(result.Succeeded());
    ASSERT_EQ(result.term_out.size(), 3u);
    EXPECT_EQ(result.term_out[0], "warning: deprecated");
    EXPECT_EQ(result.term_out[1], "out");
    EXPECT_EQ(result.term_out[2].rfind("Execution time: ", 0), 0u);
}

TEST(InterpreterTest, EmptyStreamsLeaveOnlyTimingLine) {
    Interpreter interpreter(DefaultOptions(), FakeBackend::Returning("", "", 0));

    const auto result = interpreter.Run("pass");

    ASSERT_EQ(result.term_out.size(), 1u);
    EXPECT_EQ(result.term_out[0], "Execution time: a moment (time limit is an hour).");
}

TEST(InterpreterTest, NonZeroExitIsRuntimeFailure) {
    Interpreter interpreter(DefaultOptions(),
                            FakeBackend::Returning("", "Traceback...\nZeroDivisionError", 1));

    const auto result = interpreter.Run("1/0");

    ASSERT_TRUE(result.failure_kind.has_value());
    EXPECT_EQ(*result.failure_kind, FailureKind::kRuntimeFailure);
    EXPECT_EQ(result.FailureKindName(), "RuntimeFailure");
    ASSERT_TRUE(result.failure_detail.has_value());
    EXPECT_EQ(*result.failure_detail, (nlohmann::json{{"exit_status", 1}}));
    ASSERT_EQ(result.term_out.size(), 2u);
    EXPECT_EQ(result.term_out[0], "Traceback...\nZeroDivisionError");
    EXPECT_FALSE(result.stack_trace.has_value());
}

TEST(InterpreterTest, RuntimeFailureCarriesExactExitStatus) {
    for (int status : {2, 124, 137, 255, -1}) {
        Interpreter interpreter(DefaultOptions(), FakeBackend::Returning("", "", status));
        const auto result = interpreter.Run("code");
        ASSERT_TRUE(result.failure_kind.has_value()) << status;
        EXPECT_EQ(*result.failure_kind, FailureKind::kRuntimeFailure);
        EXPECT_EQ((*result.failure_detail)["exit_status"].get<int>(), status);
    }
}

TEST(InterpreterTest, BackendExceptionIsDispatchFailure) {
    auto backend = std::make_shared<FakeBackend>([](const ExecRequest&) -> ExecResponse {
        throw codebox::sandbox::TransportError("connection reset");
    });
    Interpreter interpreter(DefaultOptions(), backend);

    codebox::interpreter::ExecutionResult result;
    EXPECT_NO_THROW(result = interpreter.Run("print(1)"));

    ASSERT_TRUE(result.failure_kind.has_value());
    EXPECT_EQ(*result.failure_kind, FailureKind::kDispatchFailure);
    ASSERT_EQ(result.term_out.size(), 1u);
    EXPECT_EQ(result.term_out[0], "connection reset");
    ASSERT_TRUE(result.failure_detail.has_value());
    EXPECT_EQ((*result.failure_detail)["error_type"], "TransportError");
    EXPECT_EQ((*result.failure_detail)["error"], "connection reset");
    EXPECT_GE(result.exec_time, 0.0);
}

TEST(InterpreterTest, ForeignExceptionNamesItsType) {
    auto backend = std::make_shared<FakeBackend>([](const ExecRequest&) -> ExecResponse {
        throw std::out_of_range("bad index");
    });
    Interpreter interpreter(DefaultOptions(), backend);

    const auto result = interpreter.Run("x");

    ASSERT_TRUE(result.failure_kind.has_value());
    EXPECT_EQ(*result.failure_kind, FailureKind::kDispatchFailure);
    EXPECT_EQ(result.term_out, std::vector<std::string>{"bad index"});
    const auto error_type = (*result.failure_detail)["error_type"].get<std::string>();
    EXPECT_NE(error_type.find("out_of_range"), std::string::npos);
}

TEST(InterpreterTest, ElapsedTimeCoversFailedCall) {
    auto backend = std::make_shared<FakeBackend>([](const ExecRequest&) -> ExecResponse {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        throw codebox::sandbox::MalformedResponseError("garbage");
    });
    Interpreter interpreter(DefaultOptions(), backend);

    const auto result = interpreter.Run("x");

    EXPECT_GE(result.exec_time, 0.04);
    EXPECT_EQ((*result.failure_detail)["error_type"], "MalformedResponseError");
}

TEST(InterpreterTest, NoBackendThrowsConfigurationError) {
    Interpreter interpreter(DefaultOptions());

    EXPECT_FALSE(interpreter.HasBackend());
    EXPECT_THROW(interpreter.Run("print(1)"), ConfigurationError);
    EXPECT_THROW(interpreter.Run("print(1)", false), ConfigurationError);
}

TEST(InterpreterTest, PassesConfiguredRequestToBackend) {
    auto backend = FakeBackend::Returning("", "", 0);
    InterpreterOptions options = DefaultOptions();
    options.timeout = std::chrono::seconds(90);
    options.command = {"python3", "-u"};
    Interpreter interpreter(options, backend);

    const auto result = interpreter.Run("print('hi')", false);

    const auto requests = backend->Requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].command, (std::vector<std::string>{"python3", "-u"}));
    EXPECT_EQ(requests[0].input, "print('hi')");
    EXPECT_EQ(requests[0].timeout, std::chrono::seconds(90));
    EXPECT_EQ(requests[0].working_dir, "/workspace");
    EXPECT_FALSE(requests[0].reset_session);
    EXPECT_EQ(result.term_out.back(), "Execution time: a moment (time limit is a minute).");
}

TEST(InterpreterTest, ResetSessionDoesNotChangeOutcomeShape) {
    Interpreter interpreter(DefaultOptions(), FakeBackend::Returning("ok\n", "", 3));

    const auto fresh = interpreter.Run("x", true);
    const auto resumed = interpreter.Run("x", false);

    EXPECT_EQ(fresh.term_out.size(), resumed.term_out.size());
    EXPECT_EQ(fresh.failure_kind, resumed.failure_kind);
    EXPECT_EQ(fresh.failure_detail, resumed.failure_detail);
}

TEST(InterpreterTest, LegacyConstructorKeepsDefaults) {
    Interpreter interpreter(std::filesystem::path("/tmp/agent"));

    EXPECT_EQ(interpreter.WorkingDir(), "/tmp/agent");
    EXPECT_EQ(interpreter.Timeout(), std::chrono::seconds(3600));
    EXPECT_FALSE(interpreter.FormatTbIpython());
    EXPECT_EQ(interpreter.AgentFileName(), "runfile.py");
    EXPECT_EQ(interpreter.Command(), std::vector<std::string>{"python3"});
}

TEST(InterpreterTest, OptionsFromConfigCopiesEveryField) {
    codebox::config::InterpreterConfig config{};
    config.working_dir = "/srv/work";
    config.timeout_s = 10;
    config.format_tb_ipython = true;
    config.agent_file_name = "solution.py";
    config.command = {"python3.11"};

    const auto options = codebox::interpreter::OptionsFromConfig(config);

    EXPECT_EQ(options.working_dir, "/srv/work");
    EXPECT_EQ(options.timeout, std::chrono::seconds(10));
    EXPECT_TRUE(options.format_tb_ipython);
    EXPECT_EQ(options.agent_file_name, "solution.py");
    EXPECT_EQ(options.command, std::vector<std::string>{"python3.11"});
}

TEST(InterpreterTest, ConcurrentRunsShareOneInstance) {
    auto backend = std::make_shared<FakeBackend>([](const ExecRequest& request) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        ExecResponse response{};
        response.stdout_text = request.input;
        return response;
    });
    const Interpreter interpreter(DefaultOptions(), backend);

    std::vector<std::future<codebox::interpreter::ExecutionResult>> futures;
    for (int i = 0; i < 8; ++i) {
        futures.push_back(interpreter.RunAsync("job " + std::to_string(i)));
    }
    for (int i = 0; i < 8; ++i) {
        const auto result = futures[i].get();
        EXPECT_TRUE(result.Succeeded());
        EXPECT_EQ(result.term_out[0], "job " + std::to_string(i));
    }
    EXPECT_EQ(backend->Requests().size(), 8u);
}

TEST(InterpreterTest, RunAsyncSurfacesConfigurationError) {
    const Interpreter interpreter(DefaultOptions());
    auto future = interpreter.RunAsync("x");
    EXPECT_THROW(future.get(), ConfigurationError);
}

TEST(InterpreterTest, NonStandardThrowIsDispatchFailure) {
    struct Unusual {};
    auto backend = std::make_shared<FakeBackend>([](const ExecRequest&) -> ExecResponse {
        throw Unusual{};
    });
    Interpreter interpreter(DefaultOptions(), backend);

    codebox::interpreter::ExecutionResult result;
    EXPECT_NO_THROW(result = interpreter.Run("x"));

    ASSERT_TRUE(result.failure_kind.has_value());
    EXPECT_EQ(*result.failure_kind, FailureKind::kDispatchFailure);
    EXPECT_EQ(result.term_out, std::vector<std::string>{"unknown exception"});
    EXPECT_EQ((*result.failure_detail)["error_type"], "unknown");
    EXPECT_GE(result.exec_time, 0.0);
}

TEST(InterpreterTest, BadAllocFromBackendPropagates) {
    auto backend = std::make_shared<FakeBackend>([](const ExecRequest&) -> ExecResponse {
        throw std::bad_alloc();
    });
    Interpreter interpreter(DefaultOptions(), backend);
    EXPECT_THROW(interpreter.Run("x"), std::bad_alloc);
}

TEST(InterpreterTest, NonUtf8OutputStillSerializes) {
    Interpreter interpreter(DefaultOptions(), FakeBackend::Returning("\xff\xfe binary", "", 0));

    const auto result = interpreter.Run("import sys; sys.stdout.buffer.write(b'\\xff\\xfe binary')");

    ASSERT_EQ(result.term_out[0], "\xff\xfe binary");
    EXPECT_NO_THROW(codebox::interpreter::DumpJson(result, 2));
}

TEST(InterpreterTest, OptionsFromConfigIgnoresNonPositiveTimeout) {
    codebox::config::InterpreterConfig config{};
    config.timeout_s = -5;
    EXPECT_EQ(codebox::interpreter::OptionsFromConfig(config).timeout, std::chrono::seconds(3600));

    config.timeout_s = 0;
    EXPECT_EQ(codebox::interpreter::OptionsFromConfig(config).timeout, std::chrono::seconds(3600));
}

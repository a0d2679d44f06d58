#include "interpreter/interpreter.hpp"

#include <new>
#include <typeinfo>

#include <boost/core/demangle.hpp>

#include "sandbox/backend_error.hpp"
#include "utils/common.hpp"
#include "utils/duration.hpp"
#include "utils/logging.hpp"

namespace codebox::interpreter {

using codebox::utils::Log;
using codebox::utils::LogLevel;

InterpreterOptions OptionsFromConfig(const codebox::config::InterpreterConfig& config) {
    InterpreterOptions options{};
    options.working_dir = config.working_dir;
    if (config.timeout_s > 0) {
        options.timeout = std::chrono::seconds(config.timeout_s);
    } else {
        Log(LogLevel::kWarn, "interpreter",
            "ignoring non-positive timeout " + std::to_string(config.timeout_s) + "s");
    }
    options.format_tb_ipython = config.format_tb_ipython;
    options.agent_file_name = config.agent_file_name;
    if (!config.command.empty()) {
        options.command = config.command;
    }
    return options;
}

Interpreter::Interpreter(InterpreterOptions options,
                         std::shared_ptr<codebox::sandbox::ExecutionBackend> backend)
    : options_(std::move(options)),
      backend_(std::move(backend)) {}

Interpreter::Interpreter(const std::filesystem::path& working_dir,
                         std::chrono::seconds timeout,
                         bool format_tb_ipython,
                         std::string agent_file_name,
                         std::shared_ptr<codebox::sandbox::ExecutionBackend> backend)
    : Interpreter(InterpreterOptions{working_dir.string(), timeout, format_tb_ipython,
                                     std::move(agent_file_name), {"python3"}},
                  std::move(backend)) {}

ExecutionResult Interpreter::Run(const std::string& code, bool reset_session) const {
    if (!backend_) {
        throw ConfigurationError("an execution backend is required to run code");
    }

    codebox::sandbox::ExecRequest request{};
    request.command = options_.command;
    request.input = code;
    request.timeout = options_.timeout;
    request.working_dir = options_.working_dir;
    request.reset_session = reset_session;

    Log(LogLevel::kDebug, "interpreter",
        "run backend=" + backend_->Name() + " cmd=" + codebox::utils::Join(request.command, " ") +
        " bytes=" + std::to_string(code.size()));

    const auto start = codebox::utils::SteadyNow();
    try {
        const auto response = backend_->Exec(request);
        const auto exec_time = codebox::utils::SecondsSince(start);
        if (response.timed_out) {
            Log(LogLevel::kWarn, "interpreter",
                "execution hit the time limit of " + std::to_string(options_.timeout.count()) + "s");
        }
        return FromResponse(response, exec_time);
    } catch (const std::bad_alloc&) {
        throw;
    } catch (const codebox::sandbox::BackendError& ex) {
        return FromError(ex.Kind(), ex.what(), codebox::utils::SecondsSince(start));
    } catch (const std::exception& ex) {
        return FromError(boost::core::demangle(typeid(ex).name()), ex.what(),
                         codebox::utils::SecondsSince(start));
    } catch (...) {
        return FromError("unknown", "unknown exception", codebox::utils::SecondsSince(start));
    }
}

std::future<ExecutionResult> Interpreter::RunAsync(std::string code, bool reset_session) const {
    return std::async(std::launch::async, [this, code = std::move(code), reset_session]() {
        return Run(code, reset_session);
    });
}

ExecutionResult Interpreter::FromResponse(const codebox::sandbox::ExecResponse& response,
                                          double exec_time) const {
    ExecutionResult result{};
    result.exec_time = exec_time;
    if (!response.stderr_text.empty()) {
        result.term_out.push_back(response.stderr_text);
    }
    if (!response.stdout_text.empty()) {
        result.term_out.push_back(response.stdout_text);
    }
    result.term_out.push_back(
        "Execution time: " + codebox::utils::NaturalDelta(exec_time) +
        " (time limit is " + codebox::utils::NaturalDelta(options_.timeout) + ").");

    if (response.exit_status != 0) {
        result.failure_kind = FailureKind::kRuntimeFailure;
        result.failure_detail = nlohmann::json{{"exit_status", response.exit_status}};
        Log(LogLevel::kWarn, "interpreter",
            "exit status " + std::to_string(response.exit_status));
    } else {
        Log(LogLevel::kInfo, "interpreter", "exit status 0");
    }
    return result;
}

ExecutionResult Interpreter::FromError(const std::string& error_type,
                                       const std::string& message,
                                       double exec_time) const {
    Log(LogLevel::kWarn, "interpreter", "dispatch failed " + error_type + ": " + message);
    ExecutionResult result{};
    result.exec_time = exec_time;
    result.term_out.push_back(message);
    result.failure_kind = FailureKind::kDispatchFailure;
    result.failure_detail = nlohmann::json{{"error_type", error_type}, {"error", message}};
    return result;
}

}  // namespace codebox::interpreter

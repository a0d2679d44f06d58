#pragma once

#include <chrono>
#include <filesystem>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "interpreter/execution_result.hpp"
#include "sandbox/execution_backend.hpp"

namespace codebox::interpreter {

// Thrown by Run when the interpreter has no backend to execute on.
class ConfigurationError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

struct InterpreterOptions {
    std::string working_dir;
    std::chrono::seconds timeout{3600};
    // Traceback style for an in-process backend; unused when delegating.
    bool format_tb_ipython = false;
    // File name the agent's code is associated with; informational only.
    std::string agent_file_name = "runfile.py";
    std::vector<std::string> command = {"python3"};
};

InterpreterOptions OptionsFromConfig(const codebox::config::InterpreterConfig& config);

// Runs code snippets on an ExecutionBackend under a time limit and turns
// whatever happens into an ExecutionResult. Holds only immutable state, so one
// instance may serve concurrent Run calls if the backend allows it.
class Interpreter {
public:
    explicit Interpreter(InterpreterOptions options,
                         std::shared_ptr<codebox::sandbox::ExecutionBackend> backend = nullptr);
    Interpreter(const std::filesystem::path& working_dir,
                std::chrono::seconds timeout = std::chrono::seconds(3600),
                bool format_tb_ipython = false,
                std::string agent_file_name = "runfile.py",
                std::shared_ptr<codebox::sandbox::ExecutionBackend> backend = nullptr);

    // Never throws for backend failures; those come back as a dispatch
    // failure. Throws ConfigurationError when no backend is configured.
    ExecutionResult Run(const std::string& code, bool reset_session = true) const;
    // The interpreter must outlive the returned future.
    std::future<ExecutionResult> RunAsync(std::string code, bool reset_session = true) const;

    const std::string& WorkingDir() const { return options_.working_dir; }
    std::chrono::seconds Timeout() const { return options_.timeout; }
    bool FormatTbIpython() const { return options_.format_tb_ipython; }
    const std::string& AgentFileName() const { return options_.agent_file_name; }
    const std::vector<std::string>& Command() const { return options_.command; }
    bool HasBackend() const { return static_cast<bool>(backend_); }

private:
    ExecutionResult FromResponse(const codebox::sandbox::ExecResponse& response, double exec_time) const;
    ExecutionResult FromError(const std::string& error_type, const std::string& message, double exec_time) const;

    InterpreterOptions options_;
    std::shared_ptr<codebox::sandbox::ExecutionBackend> backend_;
};

}  // namespace codebox::interpreter

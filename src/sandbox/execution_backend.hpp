#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "config/config_schema.hpp"

namespace codebox::sandbox {

struct ExecRequest {
    std::vector<std::string> command;
    std::string input;
    std::chrono::seconds timeout{3600};
    std::string working_dir;
    bool reset_session = true;
};

struct ExecResponse {
    std::string stdout_text;
    std::string stderr_text;
    int exit_status = 0;
    bool timed_out = false;
};

// Runs a command somewhere isolated and reports what it printed and how it
// exited. Implementations must terminate the command once request.timeout
// elapses and must throw BackendError (or a subclass) when no response can be
// produced. Exec may be called concurrently from several threads.
class ExecutionBackend {
public:
    virtual ~ExecutionBackend() = default;
    virtual ExecResponse Exec(const ExecRequest& request) = 0;
    virtual std::string Name() const = 0;
};

// Returns nullptr for an unknown backend type.
std::shared_ptr<ExecutionBackend> CreateBackend(const codebox::config::Config& config);

}  // namespace codebox::sandbox

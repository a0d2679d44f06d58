#pragma once

#include <chrono>
#include <string>
#include <sys/types.h>

#include "sandbox/execution_backend.hpp"

namespace codebox::sandbox {

// Runs the command as a local child process. Offers no isolation of its own;
// it is the building block for ContainerBackend and a convenient backend for
// trusted development setups.
class ProcessBackend : public ExecutionBackend {
public:
    explicit ProcessBackend(std::chrono::seconds kill_grace = std::chrono::seconds(2));

    ExecResponse Exec(const ExecRequest& request) override;
    std::string Name() const override { return "process"; }

    static constexpr int kTimeoutExitStatus = 124;

    // Polls pid until it exits (true) or the deadline passes (false). Retries
    // on EINTR; any other waitpid failure throws MalformedResponseError.
    static bool WaitUntil(pid_t pid, std::chrono::steady_clock::time_point deadline, int& status,
                          std::chrono::milliseconds interval = std::chrono::milliseconds(50));

private:
    std::chrono::seconds kill_grace_;
};

}  // namespace codebox::sandbox

#pragma once

#include <string>
#include <vector>

#include "sandbox/execution_backend.hpp"
#include "sandbox/process_backend.hpp"

namespace codebox::sandbox {

// Runs the command inside an already running container through
// "docker exec -i". The container is expected to be started, and torn down,
// by whoever owns the sandbox.
class ContainerBackend : public ExecutionBackend {
public:
    ContainerBackend(std::string container, std::string docker_binary = "docker");

    ExecResponse Exec(const ExecRequest& request) override;
    std::string Name() const override { return "container"; }

    std::vector<std::string> BuildCommand(const ExecRequest& request) const;

private:
    std::string container_;
    std::string docker_binary_;
    ProcessBackend process_;
};

}  // namespace codebox::sandbox

#include "sandbox/container_backend.hpp"

#include "sandbox/backend_error.hpp"

namespace codebox::sandbox {

ContainerBackend::ContainerBackend(std::string container, std::string docker_binary)
    : container_(std::move(container)),
      docker_binary_(docker_binary.empty() ? std::string("docker") : std::move(docker_binary)) {}

std::vector<std::string> ContainerBackend::BuildCommand(const ExecRequest& request) const {
    std::vector<std::string> command{docker_binary_, "exec", "-i"};
    if (!request.working_dir.empty()) {
        command.push_back("-w");
        command.push_back(request.working_dir);
    }
    command.push_back(container_);
    command.insert(command.end(), request.command.begin(), request.command.end());
    return command;
}

ExecResponse ContainerBackend::Exec(const ExecRequest& request) {
    if (container_.empty()) {
        throw SpawnError("no container configured");
    }
    if (request.command.empty()) {
        throw SpawnError("empty command");
    }
    ExecRequest outer = request;
    outer.command = BuildCommand(request);
    // The working directory applies inside the container, not to the docker CLI.
    outer.working_dir.clear();
    return process_.Exec(outer);
}

}  // namespace codebox::sandbox

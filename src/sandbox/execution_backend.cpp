#include "sandbox/execution_backend.hpp"

#include "sandbox/container_backend.hpp"
#include "sandbox/http_backend.hpp"
#include "sandbox/process_backend.hpp"
#include "utils/logging.hpp"

namespace codebox::sandbox {

std::shared_ptr<ExecutionBackend> CreateBackend(const codebox::config::Config& config) {
    const auto& backend = config.backend;
    if (backend.type == "process") {
        return std::make_shared<ProcessBackend>();
    }
    if (backend.type == "container" || backend.type == "docker") {
        return std::make_shared<ContainerBackend>(backend.container, backend.docker_binary);
    }
    if (backend.type == "http") {
        return std::make_shared<HttpBackend>(backend.url, backend.api_key);
    }
    codebox::utils::Log(codebox::utils::LogLevel::kError, "backend",
                        "unknown backend type: " + backend.type);
    return nullptr;
}

}  // namespace codebox::sandbox

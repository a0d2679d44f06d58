#pragma once

#include <chrono>
#include <string>

#include "sandbox/execution_backend.hpp"
#include "nlohmann/json.hpp"

namespace codebox::sandbox {

// Forwards each request to a remote sandbox service:
//   POST <base_url>/exec  {"cmd", "input", "timeout", "cwd", "reset_session"}
// and expects {"stdout", "stderr", "returncode"[, "timed_out"]} back.
class HttpBackend : public ExecutionBackend {
public:
    HttpBackend(std::string base_url,
                std::string api_key = {},
                std::chrono::seconds connect_timeout = std::chrono::seconds(10));

    ExecResponse Exec(const ExecRequest& request) override;
    std::string Name() const override { return "http"; }

    static nlohmann::json BuildPayload(const ExecRequest& request);
    // Throws MalformedResponseError when the body does not carry a response.
    static ExecResponse ParseResponse(const std::string& body);

    // Added on top of the request timeout before the client gives up reading.
    static constexpr std::chrono::seconds kReadMargin{30};

private:
    std::string base_url_;
    std::string api_key_;
    std::chrono::seconds connect_timeout_;
};

}  // namespace codebox::sandbox

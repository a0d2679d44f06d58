#include "sandbox/http_backend.hpp"

#include <cstdint>
#include <limits>
#include <stdexcept>

#include "httplib.h"
#include "sandbox/backend_error.hpp"
#include "utils/logging.hpp"

namespace codebox::sandbox {
namespace {

struct ParsedUrl {
    bool https = false;
    std::string host;
    int port = 80;
    std::string base_path;
};

ParsedUrl ParseUrl(const std::string& url) {
    ParsedUrl parsed{};
    std::string working = url;
    if (working.rfind("https://", 0) == 0) {
        parsed.https = true;
        parsed.port = 443;
        working = working.substr(8);
    } else if (working.rfind("http://", 0) == 0) {
        working = working.substr(7);
    }

    const auto slash_pos = working.find('/');
    std::string host_port = working;
    if (slash_pos != std::string::npos) {
        host_port = working.substr(0, slash_pos);
        parsed.base_path = working.substr(slash_pos);
    }

    const auto colon_pos = host_port.find(':');
    if (colon_pos != std::string::npos) {
        parsed.host = host_port.substr(0, colon_pos);
        try {
            parsed.port = std::stoi(host_port.substr(colon_pos + 1));
        } catch (const std::logic_error&) {
            throw TransportError("invalid sandbox url: " + url);
        }
    } else {
        parsed.host = host_port;
    }
    if (parsed.host.empty()) {
        throw TransportError("invalid sandbox url: " + url);
    }

    if (!parsed.base_path.empty() && parsed.base_path.back() == '/') {
        parsed.base_path.pop_back();
    }
    return parsed;
}

// Rejects integers that do not fit an exit status instead of truncating them.
int ReadExitStatus(const nlohmann::json& value) {
    if (value.is_number_unsigned()) {
        const auto status = value.get<std::uint64_t>();
        if (status > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
            throw MalformedResponseError("sandbox returncode out of range: " + std::to_string(status));
        }
        return static_cast<int>(status);
    }
    const auto status = value.get<std::int64_t>();
    if (status < std::numeric_limits<int>::min() || status > std::numeric_limits<int>::max()) {
        throw MalformedResponseError("sandbox returncode out of range: " + std::to_string(status));
    }
    return static_cast<int>(status);
}

}  // namespace

HttpBackend::HttpBackend(std::string base_url,
                         std::string api_key,
                         std::chrono::seconds connect_timeout)
    : base_url_(std::move(base_url)),
      api_key_(std::move(api_key)),
      connect_timeout_(connect_timeout) {}

nlohmann::json HttpBackend::BuildPayload(const ExecRequest& request) {
    return {
        {"cmd", request.command},
        {"input", request.input},
        {"timeout", request.timeout.count()},
        {"cwd", request.working_dir},
        {"reset_session", request.reset_session}
    };
}

ExecResponse HttpBackend::ParseResponse(const std::string& body) {
    auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        throw MalformedResponseError("sandbox response is not a JSON object");
    }
    if (!json.contains("returncode") || !json["returncode"].is_number_integer()) {
        throw MalformedResponseError("sandbox response has no integer returncode");
    }

    ExecResponse response{};
    response.exit_status = ReadExitStatus(json["returncode"]);
    for (const auto* key : {"stdout", "stderr"}) {
        if (!json.contains(key) || json[key].is_null()) {
            continue;
        }
        if (!json[key].is_string()) {
            throw MalformedResponseError(std::string("sandbox response field '") + key + "' is not a string");
        }
    }
    if (json.contains("stdout") && json["stdout"].is_string()) {
        response.stdout_text = json["stdout"].get<std::string>();
    }
    if (json.contains("stderr") && json["stderr"].is_string()) {
        response.stderr_text = json["stderr"].get<std::string>();
    }
    if (json.contains("timed_out") && json["timed_out"].is_boolean()) {
        response.timed_out = json["timed_out"].get<bool>();
    }
    return response;
}

ExecResponse HttpBackend::Exec(const ExecRequest& request) {
    const auto parsed = ParseUrl(base_url_);
    std::string scheme_host_port = parsed.https ? "https://" : "http://";
    scheme_host_port += parsed.host + ":" + std::to_string(parsed.port);
    const auto endpoint = parsed.base_path + "/exec";

    httplib::Client client(scheme_host_port);
    client.set_connection_timeout(connect_timeout_.count(), 0);
    client.set_read_timeout((request.timeout + kReadMargin).count(), 0);

    httplib::Headers headers;
    if (!api_key_.empty()) {
        headers.emplace("Authorization", "Bearer " + api_key_);
    }

    codebox::utils::Log(codebox::utils::LogLevel::kDebug, "http",
                        "POST " + scheme_host_port + endpoint);

    const auto payload = BuildPayload(request).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    auto result = client.Post(endpoint.c_str(), headers, payload, "application/json");
    if (!result) {
        const auto err_text = httplib::to_string(result.error());
        codebox::utils::Log(codebox::utils::LogLevel::kError, "http",
                            "request failed: " + err_text);
        throw TransportError("sandbox request failed: " + err_text);
    }
    if (result->status >= 400) {
        codebox::utils::Log(codebox::utils::LogLevel::kError, "http",
                            "HTTP " + std::to_string(result->status) + " body=" + result->body);
        throw TransportError("sandbox returned HTTP " + std::to_string(result->status));
    }
    return ParseResponse(result->body);
}

}  // namespace codebox::sandbox

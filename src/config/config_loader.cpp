#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <optional>
#include <sstream>
#include <stdexcept>

#include "utils/logging.hpp"

namespace codebox::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

bool ParseBool(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

int ParseInt(const std::string& value, int fallback) {
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stoi(value, &consumed);
        return consumed == value.size() ? parsed : fallback;
    } catch (const std::invalid_argument&) {
        return fallback;
    } catch (const std::out_of_range&) {
        return fallback;
    }
}

// A time limit must be a positive number of seconds that fits an int.
int ParseTimeout(const std::string& value, int fallback) {
    const auto parsed = ParseInt(value, fallback);
    return parsed > 0 ? parsed : fallback;
}

std::optional<int> ReadTimeout(const nlohmann::json& value) {
    if (value.is_number_unsigned()) {
        const auto seconds = value.get<std::uint64_t>();
        if (seconds > 0 && seconds <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
            return static_cast<int>(seconds);
        }
        return std::nullopt;
    }
    const auto seconds = value.get<std::int64_t>();
    if (seconds > 0 && seconds <= std::numeric_limits<int>::max()) {
        return static_cast<int>(seconds);
    }
    return std::nullopt;
}

std::vector<std::string> SplitWords(const std::string& value) {
    std::vector<std::string> items;
    std::istringstream stream(value);
    std::string item;
    while (stream >> item) {
        items.push_back(item);
    }
    return items;
}

void ApplyInterpreterConfig(InterpreterConfig& target, const nlohmann::json& source) {
    if (!source.is_object()) {
        return;
    }
    if (source.contains("workingDir") && source["workingDir"].is_string()) {
        target.working_dir = source["workingDir"].get<std::string>();
    }
    if (source.contains("timeoutS") && source["timeoutS"].is_number_integer()) {
        const auto timeout_s = ReadTimeout(source["timeoutS"]);
        if (timeout_s) {
            target.timeout_s = *timeout_s;
        } else {
            codebox::utils::Log(codebox::utils::LogLevel::kWarn, "config",
                                "ignoring invalid timeoutS " + source["timeoutS"].dump());
        }
    }
    if (source.contains("formatTbIpython") && source["formatTbIpython"].is_boolean()) {
        target.format_tb_ipython = source["formatTbIpython"].get<bool>();
    }
    if (source.contains("agentFileName") && source["agentFileName"].is_string()) {
        target.agent_file_name = source["agentFileName"].get<std::string>();
    }
    if (source.contains("command") && source["command"].is_array()) {
        std::vector<std::string> command;
        for (const auto& item : source["command"]) {
            if (item.is_string()) {
                command.push_back(item.get<std::string>());
            }
        }
        if (!command.empty()) {
            target.command = std::move(command);
        }
    }
}

void ApplyBackendConfig(BackendConfig& target, const nlohmann::json& source) {
    if (!source.is_object()) {
        return;
    }
    if (source.contains("type") && source["type"].is_string()) {
        target.type = source["type"].get<std::string>();
    }
    if (source.contains("container") && source["container"].is_string()) {
        target.container = source["container"].get<std::string>();
    }
    if (source.contains("dockerBinary") && source["dockerBinary"].is_string()) {
        target.docker_binary = source["dockerBinary"].get<std::string>();
    }
    if (source.contains("url") && source["url"].is_string()) {
        target.url = source["url"].get<std::string>();
    }
    if (source.contains("apiKey") && source["apiKey"].is_string()) {
        target.api_key = source["apiKey"].get<std::string>();
    }
}

}  // namespace

std::filesystem::path GetConfigPath() {
    const auto explicit_path = GetEnv("CODEBOX_CONFIG");
    if (!explicit_path.empty()) {
        return std::filesystem::path(explicit_path);
    }
    return GetHomePath() / ".codebox" / "config.json";
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }
    if (data.contains("interpreter")) {
        ApplyInterpreterConfig(config.interpreter, data["interpreter"]);
    }
    if (data.contains("backend")) {
        ApplyBackendConfig(config.backend, data["backend"]);
    }
    if (data.contains("logging") && data["logging"].is_object()) {
        const auto& logging = data["logging"];
        if (logging.contains("level") && logging["level"].is_string()) {
            config.logging.level = logging["level"].get<std::string>();
        }
    }
}

void ApplyEnvOverrides(Config& config) {
    const auto working_dir = GetEnvFallback(
        "CODEBOX_INTERPRETER__WORKING_DIR",
        "CODEBOX_WORKING_DIR");
    if (!working_dir.empty()) {
        config.interpreter.working_dir = working_dir;
    }

    const auto timeout = GetEnvFallback(
        "CODEBOX_INTERPRETER__TIMEOUT_S",
        "CODEBOX_TIMEOUT_S");
    if (!timeout.empty()) {
        config.interpreter.timeout_s = ParseTimeout(timeout, config.interpreter.timeout_s);
    }

    const auto format_tb = GetEnvFallback(
        "CODEBOX_INTERPRETER__FORMAT_TB_IPYTHON",
        "CODEBOX_FORMAT_TB_IPYTHON");
    if (!format_tb.empty()) {
        config.interpreter.format_tb_ipython = ParseBool(format_tb);
    }

    const auto command = GetEnvFallback(
        "CODEBOX_INTERPRETER__COMMAND",
        "CODEBOX_COMMAND");
    if (!command.empty()) {
        auto words = SplitWords(command);
        if (!words.empty()) {
            config.interpreter.command = std::move(words);
        }
    }

    const auto backend_type = GetEnvFallback(
        "CODEBOX_BACKEND__TYPE",
        "CODEBOX_BACKEND");
    if (!backend_type.empty()) {
        config.backend.type = backend_type;
    }

    const auto container = GetEnvFallback(
        "CODEBOX_BACKEND__CONTAINER",
        "CODEBOX_CONTAINER");
    if (!container.empty()) {
        config.backend.container = container;
    }

    const auto url = GetEnvFallback(
        "CODEBOX_BACKEND__URL",
        "CODEBOX_SANDBOX_URL");
    if (!url.empty()) {
        config.backend.url = url;
    }

    const auto api_key = GetEnvFallback(
        "CODEBOX_BACKEND__API_KEY",
        "CODEBOX_SANDBOX_API_KEY");
    if (!api_key.empty()) {
        config.backend.api_key = api_key;
    }

    const auto log_level = GetEnvFallback(
        "CODEBOX_LOGGING__LEVEL",
        "CODEBOX_LOG_LEVEL");
    if (!log_level.empty()) {
        config.logging.level = log_level;
    }
}

Config LoadConfig(const std::filesystem::path& path) {
    Config config{};

    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        std::ifstream input(path);
        auto data = nlohmann::json::parse(input, nullptr, false);
        if (data.is_discarded()) {
            codebox::utils::Log(codebox::utils::LogLevel::kWarn, "config",
                                "ignoring unparsable config file " + path.string());
        } else {
            ApplyConfigFromJson(config, data);
        }
    }

    ApplyEnvOverrides(config);
    return config;
}

Config LoadConfig() {
    return LoadConfig(GetConfigPath());
}

nlohmann::json ConfigToJson(const Config& config) {
    return {
        {"interpreter", {
            {"workingDir", config.interpreter.working_dir},
            {"timeoutS", config.interpreter.timeout_s},
            {"formatTbIpython", config.interpreter.format_tb_ipython},
            {"agentFileName", config.interpreter.agent_file_name},
            {"command", config.interpreter.command}
        }},
        {"backend", {
            {"type", config.backend.type},
            {"container", config.backend.container},
            {"dockerBinary", config.backend.docker_binary},
            {"url", config.backend.url},
            {"apiKey", config.backend.api_key.empty() ? "" : "***"}
        }},
        {"logging", {
            {"level", config.logging.level}
        }}
    };
}

}  // namespace codebox::config

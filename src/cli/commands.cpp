#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "config/config_loader.hpp"
#include "interpreter/interpreter.hpp"
#include "sandbox/execution_backend.hpp"
#include "utils/logging.hpp"
#include "nlohmann/json.hpp"

namespace {

constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

struct CliOptions {
    std::string command;
    std::string source = "-";
    bool json = false;
    std::optional<int> timeout_s;
    std::optional<std::filesystem::path> config_path;
};

void PrintUsage() {
    std::cout << "Usage: codebox_cli run <file|-> [--json] [--timeout <seconds>] [--config <path>]\n"
              << "       codebox_cli config [--config <path>]" << std::endl;
}

std::optional<CliOptions> ParseArgs(int argc, char** argv) {
    if (argc < 2) {
        return std::nullopt;
    }
    CliOptions options{};
    options.command = argv[1];
    bool have_source = false;
    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--json") {
            options.json = true;
        } else if (arg == "--timeout" && i + 1 < argc) {
            try {
                options.timeout_s = std::stoi(argv[++i]);
            } catch (const std::logic_error&) {
                std::cerr << "invalid --timeout value: " << argv[i] << std::endl;
                return std::nullopt;
            }
            if (*options.timeout_s <= 0) {
                std::cerr << "--timeout must be a positive number of seconds" << std::endl;
                return std::nullopt;
            }
        } else if (arg == "--config" && i + 1 < argc) {
            options.config_path = std::filesystem::path(argv[++i]);
        } else if (!have_source && (arg == "-" || arg.rfind("--", 0) != 0)) {
            options.source = arg;
            have_source = true;
        } else {
            std::cerr << "unknown argument: " << arg << std::endl;
            return std::nullopt;
        }
    }
    return options;
}

std::optional<std::string> ReadSource(const std::string& source) {
    if (source == "-") {
        return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }
    std::ifstream input(source, std::ios::binary);
    if (!input.is_open()) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

codebox::config::Config LoadCliConfig(const CliOptions& options) {
    auto config = options.config_path ? codebox::config::LoadConfig(*options.config_path)
                                      : codebox::config::LoadConfig();
    if (options.timeout_s) {
        config.interpreter.timeout_s = *options.timeout_s;
    }
    const auto level = codebox::utils::ParseLogLevel(config.logging.level);
    if (level) {
        codebox::utils::SetLogConfig(codebox::utils::LogConfig{*level});
    } else {
        std::cerr << "[config] unknown log level " << config.logging.level << ", using info" << std::endl;
    }
    return config;
}

int RunCode(const CliOptions& options) {
    const auto config = LoadCliConfig(options);
    const auto code = ReadSource(options.source);
    if (!code) {
        std::cerr << "cannot read " << options.source << std::endl;
        return kExitUsage;
    }

    const codebox::interpreter::Interpreter interpreter(
        codebox::interpreter::OptionsFromConfig(config.interpreter),
        codebox::sandbox::CreateBackend(config));

    codebox::interpreter::ExecutionResult result;
    try {
        result = interpreter.Run(*code);
    } catch (const codebox::interpreter::ConfigurationError& ex) {
        std::cerr << "[config] " << ex.what() << std::endl;
        return kExitUsage;
    }

    if (options.json) {
        std::cout << codebox::interpreter::DumpJson(result, 2) << std::endl;
    } else {
        for (const auto& line : result.term_out) {
            std::cout << line;
            if (line.empty() || line.back() != '\n') {
                std::cout << '\n';
            }
        }
        std::cout.flush();
    }
    return result.Succeeded() ? 0 : kExitFailure;
}

int PrintConfig(const CliOptions& options) {
    const auto config = LoadCliConfig(options);
    std::cout << codebox::config::ConfigToJson(config).dump(2) << std::endl;
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    const auto options = ParseArgs(argc, argv);
    if (!options) {
        PrintUsage();
        return kExitUsage;
    }
    if (options->command == "run") {
        return RunCode(*options);
    }
    if (options->command == "config") {
        return PrintConfig(*options);
    }
    PrintUsage();
    return kExitUsage;
}

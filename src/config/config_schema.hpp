#pragma once

#include <string>
#include <vector>

namespace codebox::config {

struct InterpreterConfig {
    std::string working_dir = ".";
    int timeout_s = 3600;
    bool format_tb_ipython = false;
    std::string agent_file_name = "runfile.py";
    std::vector<std::string> command = {"python3"};
};

struct BackendConfig {
    std::string type = "process";
    std::string container;
    std::string docker_binary = "docker";
    std::string url = "http://127.0.0.1:8080";
    std::string api_key;
};

struct LoggingConfig {
    std::string level = "info";
};

struct Config {
    InterpreterConfig interpreter;
    BackendConfig backend;
    LoggingConfig logging;
};

}  // namespace codebox::config

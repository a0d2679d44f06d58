#include "agent/tools/run_code.hpp"

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace codebox::agent::tools {

RunCodeTool::RunCodeTool(std::shared_ptr<const codebox::interpreter::Interpreter> interpreter)
    : interpreter_(std::move(interpreter)) {}

nlohmann::json RunCodeTool::Parameters() const {
    return {
        {"type", "object"},
        {"properties", {
            {"code", {{"type", "string"}}},
            {"reset_session", {{"type", "boolean"}}}
        }},
        {"required", nlohmann::json::array({"code"})}
    };
}

std::string RunCodeTool::Execute(const nlohmann::json& arguments) {
    if (!arguments.is_object() || !arguments.contains("code") || !arguments["code"].is_string()) {
        return "Error: missing code";
    }
    const auto code = arguments["code"].get<std::string>();
    if (!interpreter_) {
        return "Error: no interpreter configured";
    }
    bool reset_session = true;
    if (arguments.contains("reset_session") && arguments["reset_session"].is_boolean()) {
        reset_session = arguments["reset_session"].get<bool>();
    }

    codebox::interpreter::ExecutionResult result;
    try {
        result = interpreter_->Run(code, reset_session);
    } catch (const codebox::interpreter::ConfigurationError& ex) {
        codebox::utils::Log(codebox::utils::LogLevel::kError, "run_code", ex.what());
        return std::string("Error: ") + ex.what();
    }

    const auto output = codebox::utils::Join(result.term_out, "\n");
    if (result.Succeeded()) {
        return output;
    }
    return "[" + result.FailureKindName() + "]\n" + output;
}

}  // namespace codebox::agent::tools

#pragma once

#include <memory>
#include <string>

#include "agent/tools/tool.hpp"
#include "interpreter/interpreter.hpp"

namespace codebox::agent::tools {

class RunCodeTool : public Tool {
public:
    explicit RunCodeTool(std::shared_ptr<const codebox::interpreter::Interpreter> interpreter);

    std::string Name() const override { return "run_code"; }
    std::string Description() const override {
        return "Execute a code snippet in the sandbox and return its output.";
    }
    nlohmann::json Parameters() const override;
    std::string Execute(const nlohmann::json& arguments) override;

private:
    std::shared_ptr<const codebox::interpreter::Interpreter> interpreter_;
};

}  // namespace codebox::agent::tools

#pragma once

#include <string>

#include "nlohmann/json.hpp"

namespace codebox::agent::tools {

// A capability an agent loop can invoke by name. Arguments arrive as the JSON
// object the model produced; the returned text is fed back to the model.
class Tool {
public:
    virtual ~Tool() = default;
    virtual std::string Name() const = 0;
    virtual std::string Description() const = 0;
    // JSON schema of the accepted arguments.
    virtual nlohmann::json Parameters() const = 0;
    virtual std::string Execute(const nlohmann::json& arguments) = 0;
};

}  // namespace codebox::agent::tools

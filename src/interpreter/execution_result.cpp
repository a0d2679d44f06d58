#include "interpreter/execution_result.hpp"

#include <stdexcept>

namespace codebox::interpreter {
namespace {

nlohmann::json StackToJson(const std::vector<StackFrame>& frames) {
    nlohmann::json json = nlohmann::json::array();
    for (const auto& frame : frames) {
        json.push_back({
            {"file", frame.file},
            {"line", frame.line},
            {"function", frame.function},
            {"source", frame.source}
        });
    }
    return json;
}

std::vector<StackFrame> StackFromJson(const nlohmann::json& json) {
    if (!json.is_array()) {
        throw std::invalid_argument("exc_stack must be an array");
    }
    std::vector<StackFrame> frames;
    for (const auto& item : json) {
        if (!item.is_object()) {
            throw std::invalid_argument("exc_stack entries must be objects");
        }
        StackFrame frame{};
        frame.file = item.value("file", std::string());
        frame.line = item.value("line", 0);
        frame.function = item.value("function", std::string());
        frame.source = item.value("source", std::string());
        frames.push_back(std::move(frame));
    }
    return frames;
}

}  // namespace

const char* ToString(FailureKind kind) {
    switch (kind) {
        case FailureKind::kRuntimeFailure: return "RuntimeFailure";
        case FailureKind::kDispatchFailure: return "DispatchFailure";
    }
    return "Unknown";
}

std::optional<FailureKind> ParseFailureKind(const std::string& value) {
    if (value == "RuntimeFailure") {
        return FailureKind::kRuntimeFailure;
    }
    if (value == "DispatchFailure") {
        return FailureKind::kDispatchFailure;
    }
    return std::nullopt;
}

std::string ExecutionResult::FailureKindName() const {
    return failure_kind ? ToString(*failure_kind) : std::string();
}

nlohmann::json ToJson(const ExecutionResult& result) {
    nlohmann::json json = nlohmann::json::object();
    json["term_out"] = result.term_out;
    json["exec_time"] = result.exec_time;
    json["exc_type"] = result.failure_kind ? nlohmann::json(ToString(*result.failure_kind))
                                           : nlohmann::json(nullptr);
    json["exc_info"] = result.failure_detail ? *result.failure_detail : nlohmann::json(nullptr);
    json["exc_stack"] = result.stack_trace ? StackToJson(*result.stack_trace) : nlohmann::json(nullptr);
    return json;
}

std::string DumpJson(const ExecutionResult& result, int indent) {
    return ToJson(result).dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

ExecutionResult ExecutionResultFromJson(const nlohmann::json& data) {
    if (!data.is_object()) {
        throw std::invalid_argument("execution result must be a JSON object");
    }
    ExecutionResult result{};

    if (!data.contains("term_out") || !data["term_out"].is_array()) {
        throw std::invalid_argument("term_out must be an array of strings");
    }
    for (const auto& line : data["term_out"]) {
        if (!line.is_string()) {
            throw std::invalid_argument("term_out must be an array of strings");
        }
        result.term_out.push_back(line.get<std::string>());
    }

    if (!data.contains("exec_time") || !data["exec_time"].is_number()) {
        throw std::invalid_argument("exec_time must be a number");
    }
    result.exec_time = data["exec_time"].get<double>();
    if (result.exec_time < 0.0) {
        throw std::invalid_argument("exec_time must not be negative");
    }

    if (data.contains("exc_type") && !data["exc_type"].is_null()) {
        if (!data["exc_type"].is_string()) {
            throw std::invalid_argument("exc_type must be a string");
        }
        const auto name = data["exc_type"].get<std::string>();
        result.failure_kind = ParseFailureKind(name);
        if (!result.failure_kind) {
            throw std::invalid_argument("unknown exc_type: " + name);
        }
    }
    if (data.contains("exc_info") && !data["exc_info"].is_null()) {
        result.failure_detail = data["exc_info"];
    }
    if (result.failure_kind.has_value() != result.failure_detail.has_value()) {
        throw std::invalid_argument("exc_type and exc_info must be both set or both null");
    }

    if (data.contains("exc_stack") && !data["exc_stack"].is_null()) {
        result.stack_trace = StackFromJson(data["exc_stack"]);
    }
    return result;
}

}  // namespace codebox::interpreter

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace codebox::interpreter {

enum class FailureKind {
    kRuntimeFailure,   // the code ran and exited non-zero
    kDispatchFailure   // the backend could not be invoked
};

const char* ToString(FailureKind kind);
std::optional<FailureKind> ParseFailureKind(const std::string& value);

struct StackFrame {
    std::string file;
    int line = 0;
    std::string function;
    std::string source;
};

struct ExecutionResult {
    // stderr, then stdout, then the timing line.
    std::vector<std::string> term_out;
    double exec_time = 0.0;
    std::optional<FailureKind> failure_kind;
    // Set exactly when failure_kind is set.
    std::optional<nlohmann::json> failure_detail;
    // Only an in-process backend could fill this; delegating backends leave it empty.
    std::optional<std::vector<StackFrame>> stack_trace;

    bool Succeeded() const { return !failure_kind.has_value(); }
    std::string FailureKindName() const;
};

nlohmann::json ToJson(const ExecutionResult& result);
// Serializes ToJson(result); bytes that are not valid UTF-8 in captured output
// are replaced with U+FFFD instead of failing.
std::string DumpJson(const ExecutionResult& result, int indent = -1);
// Throws std::invalid_argument for documents that are not a valid result.
ExecutionResult ExecutionResultFromJson(const nlohmann::json& data);

}  // namespace codebox::interpreter

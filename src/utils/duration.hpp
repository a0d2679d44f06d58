#pragma once

#include <chrono>
#include <string>

namespace codebox::utils {

// Coarse, human-readable rendering of a time span: "a moment", "3 seconds",
// "an hour", "2 days", "1 year, 3 months". Sub-second precision is dropped
// and negative spans are rendered by magnitude.
std::string NaturalDelta(double seconds);
std::string NaturalDelta(std::chrono::seconds duration);

}  // namespace codebox::utils

#pragma once

#include <chrono>
#include <sstream>
#include <string>
#include <vector>

namespace codebox::utils {

inline std::string Join(const std::vector<std::string>& items, const std::string& delimiter) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            oss << delimiter;
        }
        oss << items[i];
    }
    return oss.str();
}

inline std::chrono::steady_clock::time_point SteadyNow() {
    return std::chrono::steady_clock::now();
}

inline double SecondsSince(std::chrono::steady_clock::time_point start) {
    const auto elapsed = std::chrono::duration<double>(SteadyNow() - start).count();
    return elapsed < 0.0 ? 0.0 : elapsed;
}

}  // namespace codebox::utils

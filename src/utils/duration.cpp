#include "utils/duration.hpp"

#include <cmath>

namespace codebox::utils {
namespace {

constexpr long long kSecondsPerDay = 86400;
constexpr long long kDaysPerYear = 365;
constexpr double kDaysPerMonth = 30.5;

std::string Plural(long long count, const char* unit) {
    return std::to_string(count) + " " + unit + (count == 1 ? "" : "s");
}

}  // namespace

std::string NaturalDelta(double seconds) {
    if (!std::isfinite(seconds)) {
        return "a moment";
    }
    const auto total = static_cast<long long>(std::fabs(seconds));
    auto days = total / kSecondsPerDay;
    const auto secs = total % kSecondsPerDay;
    const auto years = days / kDaysPerYear;
    days %= kDaysPerYear;
    const auto months = static_cast<long long>(static_cast<double>(days) / kDaysPerMonth);

    if (years == 0 && days == 0) {
        if (secs == 0) {
            return "a moment";
        }
        if (secs == 1) {
            return "a second";
        }
        if (secs < 60) {
            return Plural(secs, "second");
        }
        if (secs < 120) {
            return "a minute";
        }
        if (secs < 3600) {
            return Plural(secs / 60, "minute");
        }
        if (secs < 7200) {
            return "an hour";
        }
        return Plural(secs / 3600, "hour");
    }
    if (years == 0) {
        if (days == 1) {
            return "a day";
        }
        if (months == 0) {
            return Plural(days, "day");
        }
        if (months == 1) {
            return "a month";
        }
        return Plural(months, "month");
    }
    if (years == 1) {
        if (months == 0 && days == 0) {
            return "a year";
        }
        if (months == 0) {
            return "1 year, " + Plural(days, "day");
        }
        return "1 year, " + Plural(months, "month");
    }
    return Plural(years, "year");
}

std::string NaturalDelta(std::chrono::seconds duration) {
    return NaturalDelta(static_cast<double>(duration.count()));
}

}  // namespace codebox::utils

#pragma once

#include <string>
#include <optional>
#include <cstdint>

namespace util {
    std::string current_iso8601();

    // Days since 1970-01-01 for an ISO "YYYY-MM-DD" date (time suffix ignored)
    std::optional<int64_t> parse_date_days(const std::string& iso_date);
    std::string format_date_days(int64_t days);

    double round_to(double value, int decimals);
}

#include "util.hpp"
#include <chrono>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace util {

namespace {

// Civil calendar <-> day count (proleptic Gregorian)
int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

bool is_leap(int64_t y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned days_in_month(int64_t y, unsigned m) {
    static const unsigned lengths[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && is_leap(y)) return 29;
    return lengths[m - 1];
}

} // namespace

std::string current_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto itt = std::chrono::system_clock::to_time_t(now);
    std::ostringstream ss;
    ss << std::put_time(std::gmtime(&itt), "%FT%TZ");
    return ss.str();
}

std::optional<int64_t> parse_date_days(const std::string& iso_date) {
    if (iso_date.size() < 10) return std::nullopt;
    if (iso_date[4] != '-' || iso_date[7] != '-') return std::nullopt;

    for (size_t i : {0u, 1u, 2u, 3u, 5u, 6u, 8u, 9u}) {
        if (iso_date[i] < '0' || iso_date[i] > '9') return std::nullopt;
    }
    if (iso_date.size() > 10 && iso_date[10] != 'T' && iso_date[10] != ' ') {
        return std::nullopt;
    }

    int64_t year = std::stoi(iso_date.substr(0, 4));
    unsigned month = static_cast<unsigned>(std::stoi(iso_date.substr(5, 2)));
    unsigned day = static_cast<unsigned>(std::stoi(iso_date.substr(8, 2)));

    if (month < 1 || month > 12) return std::nullopt;
    if (day < 1 || day > days_in_month(year, month)) return std::nullopt;

    return days_from_civil(year, month, day);
}

std::string format_date_days(int64_t days) {
    days += 719468;
    const int64_t era = (days >= 0 ? days : days - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(days - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    const int64_t y = static_cast<int64_t>(yoe) + era * 400 + (m <= 2);

    std::ostringstream ss;
    ss << std::setfill('0') << std::setw(4) << y << '-'
       << std::setw(2) << m << '-' << std::setw(2) << d;
    return ss.str();
}

double round_to(double value, int decimals) {
    double factor = std::pow(10.0, decimals);
    return std::round(value * factor) / factor;
}

} // namespace util

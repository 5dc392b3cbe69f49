#pragma once

#include "../src/util.hpp"
#include "../src/wellness.hpp"
#include <optional>
#include <string>

namespace fixtures {

// Date `offset` days after 2024-01-01
inline std::string day(int offset) {
    static const int64_t base = *util::parse_date_days("2024-01-01");
    return util::format_date_days(base + offset);
}

inline WellnessRecord record(int offset, std::optional<double> hrv, std::optional<double> rhr,
                             std::optional<double> sleep_score = 80.0) {
    WellnessRecord rec;
    rec.date = day(offset);
    rec.hrv = hrv;
    rec.rhr = rhr;
    rec.sleep_score = sleep_score;
    return rec;
}

// hrv 45, rhr 50, sleep score 80, fatigue = stress = 2
inline WellnessRecord steady_day(int offset) {
    WellnessRecord rec = record(offset, 45.0, 50.0, 80.0);
    rec.fatigue = 2;
    rec.stress = 2;
    return rec;
}

// `days` steady historical days followed by an identical current day
inline ScoringInput steady_input(int days = 60) {
    ScoringInput input;
    for (int i = 0; i < days; i++) {
        input.historical.push_back(steady_day(i));
    }
    input.current = steady_day(days);
    return input;
}

}

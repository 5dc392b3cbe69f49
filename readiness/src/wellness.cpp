#include "wellness.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <cmath>
#include <limits>
#include <stdexcept>

std::optional<int64_t> WellnessRecord::day_index() const {
    return util::parse_date_days(date);
}

bool WellnessRecord::has_objective_data() const {
    return (hrv && *hrv > 0) || (rhr && *rhr > 0) || sleep_score || sleep_hours;
}

std::optional<double> WellnessParser::read_double(const nlohmann::json& raw,
                                                  const char* camel, const char* snake) {
    for (const char* key : {camel, snake}) {
        auto it = raw.find(key);
        if (it == raw.end() || it->is_null()) continue;
        if (!it->is_number()) {
            throw std::invalid_argument(std::string("field '") + key + "' must be numeric");
        }
        return it->get<double>();
    }
    return std::nullopt;
}

std::optional<int> WellnessParser::read_rating(const nlohmann::json& raw, const char* key) {
    auto it = raw.find(key);
    if (it == raw.end() || it->is_null()) return std::nullopt;
    if (!it->is_number()) {
        throw std::invalid_argument(std::string("rating '") + key + "' must be numeric");
    }
    double value = it->get<double>();
    if (!std::isfinite(value) || value < std::numeric_limits<int>::min() ||
        value > std::numeric_limits<int>::max()) {
        spdlog::warn("Rating '{}' out of range ({}), treated as missing", key, value);
        return std::nullopt;
    }
    // Fractional ratings (e.g. mood 2.5) round to the nearest step
    return static_cast<int>(std::lround(value));
}

WellnessRecord WellnessParser::parse_record(const nlohmann::json& raw) {
    if (!raw.is_object()) {
        throw std::invalid_argument("wellness record must be a JSON object");
    }

    WellnessRecord rec;
    // Platform exports use "id" for the date key
    rec.date = raw.value("date", raw.value("id", std::string()));

    rec.hrv = read_double(raw, "hrv", "hrv");
    rec.rhr = read_double(raw, "restingHR", "rhr");
    if (!rec.rhr) rec.rhr = read_double(raw, "restingHr", "resting_hr");
    rec.sleep_score = read_double(raw, "sleepScore", "sleep_score");
    rec.sleep_hours = read_double(raw, "sleepHours", "sleep_hours");

    // Raw exports carry sleep duration in seconds
    if (!rec.sleep_hours) {
        if (auto secs = read_double(raw, "sleepSecs", "sleep_secs")) {
            rec.sleep_hours = *secs / 3600.0;
        }
    }

    rec.fatigue = read_rating(raw, "fatigue");
    rec.stress = read_rating(raw, "stress");
    rec.motivation = read_rating(raw, "motivation");
    rec.mood = read_rating(raw, "mood");
    rec.soreness = read_rating(raw, "soreness");
    rec.injury = read_rating(raw, "injury");
    rec.sleep_quality = read_rating(raw, "sleepQuality");
    if (!rec.sleep_quality) rec.sleep_quality = read_rating(raw, "sleep_quality");

    rec.alcohol = read_rating(raw, "alcohol").value_or(0);

    if (!rec.date.empty() && !rec.day_index()) {
        spdlog::warn("Wellness record has unparsable date '{}'", rec.date);
    }

    return rec;
}

std::vector<WellnessRecord> WellnessParser::parse_records(const nlohmann::json& raw) {
    if (!raw.is_array()) {
        throw std::invalid_argument("historical wellness data must be a JSON array");
    }

    std::vector<WellnessRecord> records;
    records.reserve(raw.size());
    for (const auto& item : raw) {
        records.push_back(parse_record(item));
    }
    return records;
}

ScoringInput WellnessParser::parse_input(const nlohmann::json& raw) {
    if (!raw.contains("current")) {
        throw std::invalid_argument("input requires a 'current' wellness record");
    }

    ScoringInput input;
    input.current = parse_record(raw.at("current"));
    if (raw.contains("historical")) {
        input.historical = parse_records(raw.at("historical"));
    }

    spdlog::debug("Parsed scoring input for {} with {} historical records",
                  input.current.date, input.historical.size());
    return input;
}

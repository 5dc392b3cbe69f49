#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

// One athlete-day of wellness telemetry.
// Subjective ratings use the platform scale: 1 = best, 4 = worst.
struct WellnessRecord {
    std::string date;                     // YYYY-MM-DD

    std::optional<double> hrv;            // ms (rMSSD)
    std::optional<double> rhr;            // bpm
    std::optional<double> sleep_score;    // 0-100
    std::optional<double> sleep_hours;

    std::optional<int> fatigue;
    std::optional<int> stress;
    std::optional<int> motivation;
    std::optional<int> mood;
    std::optional<int> soreness;
    std::optional<int> injury;
    std::optional<int> sleep_quality;

    int alcohol = 0;                      // 0=none, 1=light, 2=heavy

    std::optional<int64_t> day_index() const;
    bool has_objective_data() const;
};

struct ScoringInput {
    WellnessRecord current;
    std::vector<WellnessRecord> historical;
};

class WellnessParser {
public:
    // Accepts both the platform's camelCase keys and snake_case
    static WellnessRecord parse_record(const nlohmann::json& raw);
    static std::vector<WellnessRecord> parse_records(const nlohmann::json& raw);
    static ScoringInput parse_input(const nlohmann::json& raw);

private:
    static std::optional<double> read_double(const nlohmann::json& raw,
                                             const char* camel, const char* snake);
    static std::optional<int> read_rating(const nlohmann::json& raw, const char* key);
};

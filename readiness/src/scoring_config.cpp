#include "scoring_config.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <cmath>
#include <string>

namespace {

template <typename T>
void merge_field(const nlohmann::json& section, const char* key, T& field,
                 const std::string& section_name) {
    auto it = section.find(key);
    if (it == section.end() || it->is_null()) return;
    if (!it->is_number()) {
        throw ConfigError(section_name + "." + key + " must be numeric");
    }
    field = it->get<T>();
}

const nlohmann::json* find_section(const nlohmann::json& overrides, const char* name) {
    auto it = overrides.find(name);
    if (it == overrides.end() || it->is_null()) return nullptr;
    if (!it->is_object()) {
        throw ConfigError(std::string(name) + " must be an object");
    }
    return &(*it);
}

} // namespace

ScoringConfig ScoringConfig::defaults() {
    return ScoringConfig{};
}

ScoringConfig ScoringConfig::with_overrides(const nlohmann::json& overrides) const {
    if (overrides.is_null()) return *this;
    if (!overrides.is_object()) {
        throw ConfigError("override must be a JSON object");
    }

    static const char* known_sections[] = {
        "weights", "hrv", "rhr", "sleep", "subjective", "penalties",
        "zones", "confidence", "trend", "stddev_floor"
    };
    for (const auto& item : overrides.items()) {
        bool known = false;
        for (const char* name : known_sections) {
            if (item.key() == name) known = true;
        }
        if (!known) {
            spdlog::warn("Ignoring unknown scoring config section '{}'", item.key());
        }
    }

    ScoringConfig cfg = *this;

    if (auto s = find_section(overrides, "weights")) {
        merge_field(*s, "hrv", cfg.weights.hrv, "weights");
        merge_field(*s, "rhr", cfg.weights.rhr, "weights");
        merge_field(*s, "sleep", cfg.weights.sleep, "weights");
        merge_field(*s, "subjective", cfg.weights.subjective, "weights");
    }

    if (auto s = find_section(overrides, "hrv")) {
        merge_field(*s, "baseline_days", cfg.hrv.baseline_days, "hrv");
        merge_field(*s, "rolling_days", cfg.hrv.rolling_days, "hrv");
        merge_field(*s, "min_samples", cfg.hrv.min_samples, "hrv");
        merge_field(*s, "sensitivity_factor", cfg.hrv.sensitivity_factor, "hrv");
        merge_field(*s, "sigmoid_k", cfg.hrv.sigmoid_k, "hrv");
        merge_field(*s, "sigmoid_c", cfg.hrv.sigmoid_c, "hrv");
        merge_field(*s, "saturation_z", cfg.hrv.saturation_z, "hrv");
        merge_field(*s, "default_log_mean", cfg.hrv.default_log_mean, "hrv");
        merge_field(*s, "default_log_stddev", cfg.hrv.default_log_stddev, "hrv");
    }

    if (auto s = find_section(overrides, "rhr")) {
        merge_field(*s, "baseline_days", cfg.rhr.baseline_days, "rhr");
        merge_field(*s, "min_samples", cfg.rhr.min_samples, "rhr");
        merge_field(*s, "linear_baseline", cfg.rhr.linear_baseline, "rhr");
        merge_field(*s, "linear_slope", cfg.rhr.linear_slope, "rhr");
        merge_field(*s, "default_mean", cfg.rhr.default_mean, "rhr");
        merge_field(*s, "default_stddev", cfg.rhr.default_stddev, "rhr");
    }

    if (auto s = find_section(overrides, "sleep")) {
        merge_field(*s, "min_hours", cfg.sleep.min_hours, "sleep");
        merge_field(*s, "target_hours", cfg.sleep.target_hours, "sleep");
        merge_field(*s, "debt_days", cfg.sleep.debt_days, "sleep");
        merge_field(*s, "short_sleep_factor", cfg.sleep.short_sleep_factor, "sleep");
        merge_field(*s, "neutral_fraction", cfg.sleep.neutral_fraction, "sleep");
        merge_field(*s, "debt_rate", cfg.sleep.debt_rate, "sleep");
        merge_field(*s, "debt_floor", cfg.sleep.debt_floor, "sleep");
    }

    if (auto s = find_section(overrides, "subjective")) {
        merge_field(*s, "w_fatigue", cfg.subjective.w_fatigue, "subjective");
        merge_field(*s, "w_stress", cfg.subjective.w_stress, "subjective");
        merge_field(*s, "w_motivation", cfg.subjective.w_motivation, "subjective");
        merge_field(*s, "w_mood", cfg.subjective.w_mood, "subjective");
        merge_field(*s, "missing_penalty", cfg.subjective.missing_penalty, "subjective");
        merge_field(*s, "default_fatigue", cfg.subjective.default_fatigue, "subjective");
        merge_field(*s, "default_stress", cfg.subjective.default_stress, "subjective");
        merge_field(*s, "default_motivation", cfg.subjective.default_motivation, "subjective");
        merge_field(*s, "default_mood", cfg.subjective.default_mood, "subjective");
    }

    if (auto s = find_section(overrides, "penalties")) {
        merge_field(*s, "alcohol_light", cfg.penalties.alcohol_light, "penalties");
        merge_field(*s, "alcohol_heavy", cfg.penalties.alcohol_heavy, "penalties");
        merge_field(*s, "soreness_mild", cfg.penalties.soreness_mild, "penalties");
        merge_field(*s, "soreness_moderate", cfg.penalties.soreness_moderate, "penalties");
        merge_field(*s, "soreness_severe", cfg.penalties.soreness_severe, "penalties");
        merge_field(*s, "motivation_low", cfg.penalties.motivation_low, "penalties");
        merge_field(*s, "motivation_low_threshold", cfg.penalties.motivation_low_threshold, "penalties");
        merge_field(*s, "injury_minor_cap", cfg.penalties.injury_minor_cap, "penalties");
        merge_field(*s, "injury_moderate_cap", cfg.penalties.injury_moderate_cap, "penalties");
        merge_field(*s, "injury_severe_cap", cfg.penalties.injury_severe_cap, "penalties");
    }

    if (auto s = find_section(overrides, "zones")) {
        merge_field(*s, "prime", cfg.zones.prime, "zones");
        merge_field(*s, "moderate", cfg.zones.moderate, "zones");
    }

    if (auto s = find_section(overrides, "confidence")) {
        merge_field(*s, "low_below_days", cfg.confidence.low_below_days, "confidence");
        merge_field(*s, "medium_below_days", cfg.confidence.medium_below_days, "confidence");
    }

    if (auto s = find_section(overrides, "trend")) {
        merge_field(*s, "lookback_days", cfg.trend.lookback_days, "trend");
        merge_field(*s, "strong_positive", cfg.trend.strong_positive, "trend");
        merge_field(*s, "positive", cfg.trend.positive, "trend");
        merge_field(*s, "negative", cfg.trend.negative, "trend");
        merge_field(*s, "strong_negative", cfg.trend.strong_negative, "trend");
        merge_field(*s, "volatility_period", cfg.trend.volatility_period, "trend");
        merge_field(*s, "bollinger_period", cfg.trend.bollinger_period, "trend");
        merge_field(*s, "bollinger_multiplier", cfg.trend.bollinger_multiplier, "trend");
        merge_field(*s, "min_data_points", cfg.trend.min_data_points, "trend");
        merge_field(*s, "window_days", cfg.trend.window_days, "trend");
        merge_field(*s, "high_level", cfg.trend.high_level, "trend");
        merge_field(*s, "medium_level", cfg.trend.medium_level, "trend");
    }

    merge_field(overrides, "stddev_floor", cfg.stddev_floor, "config");

    cfg.validate();
    return cfg;
}

void ScoringConfig::validate() const {
    double total = weights.total();
    if (std::fabs(total - 100.0) > 1e-6) {
        throw ConfigError("component weights must sum to 100, got " + std::to_string(total));
    }
    if (weights.hrv < 0 || weights.rhr < 0 || weights.sleep < 0 || weights.subjective < 0) {
        throw ConfigError("component weights must be non-negative");
    }

    double subjective_total = subjective.w_fatigue + subjective.w_stress +
                              subjective.w_motivation + subjective.w_mood;
    if (std::fabs(subjective_total - 1.0) > 1e-6) {
        throw ConfigError("subjective field weights must sum to 1");
    }

    if (hrv.baseline_days <= 0 || hrv.rolling_days <= 0 || rhr.baseline_days <= 0) {
        throw ConfigError("baseline windows must be positive");
    }
    if (hrv.min_samples < 2 || rhr.min_samples < 2) {
        throw ConfigError("baseline minimum samples must be at least 2");
    }
    if (hrv.default_log_stddev <= 0 || rhr.default_stddev <= 0 || stddev_floor <= 0) {
        throw ConfigError("standard deviation defaults and floor must be positive");
    }
    if (sleep.min_hours <= 0 || sleep.target_hours <= 0 || sleep.debt_days < 0) {
        throw ConfigError("sleep hours and debt window must be positive");
    }
    if (zones.moderate > zones.prime) {
        throw ConfigError("moderate zone threshold exceeds prime threshold");
    }
    if (confidence.low_below_days > confidence.medium_below_days) {
        throw ConfigError("confidence thresholds out of order");
    }
    if (trend.lookback_days <= 0 || trend.volatility_period <= 0 ||
        trend.bollinger_period < 2 || trend.min_data_points < 2 || trend.window_days <= 0) {
        throw ConfigError("trend periods must be positive");
    }
    if (!(trend.strong_negative <= trend.negative && trend.negative <= trend.positive &&
          trend.positive <= trend.strong_positive)) {
        throw ConfigError("momentum thresholds out of order");
    }
    if (trend.medium_level > trend.high_level) {
        throw ConfigError("trend score levels out of order");
    }
}

nlohmann::json ScoringConfig::to_json() const {
    return {
        {"weights", {
            {"hrv", weights.hrv}, {"rhr", weights.rhr},
            {"sleep", weights.sleep}, {"subjective", weights.subjective}
        }},
        {"hrv", {
            {"baseline_days", hrv.baseline_days}, {"rolling_days", hrv.rolling_days},
            {"min_samples", hrv.min_samples}, {"sensitivity_factor", hrv.sensitivity_factor},
            {"sigmoid_k", hrv.sigmoid_k}, {"sigmoid_c", hrv.sigmoid_c},
            {"saturation_z", hrv.saturation_z}, {"default_log_mean", hrv.default_log_mean},
            {"default_log_stddev", hrv.default_log_stddev}
        }},
        {"rhr", {
            {"baseline_days", rhr.baseline_days}, {"min_samples", rhr.min_samples},
            {"linear_baseline", rhr.linear_baseline}, {"linear_slope", rhr.linear_slope},
            {"default_mean", rhr.default_mean}, {"default_stddev", rhr.default_stddev}
        }},
        {"sleep", {
            {"min_hours", sleep.min_hours}, {"target_hours", sleep.target_hours},
            {"debt_days", sleep.debt_days}, {"short_sleep_factor", sleep.short_sleep_factor},
            {"neutral_fraction", sleep.neutral_fraction}, {"debt_rate", sleep.debt_rate},
            {"debt_floor", sleep.debt_floor}
        }},
        {"subjective", {
            {"w_fatigue", subjective.w_fatigue}, {"w_stress", subjective.w_stress},
            {"w_motivation", subjective.w_motivation}, {"w_mood", subjective.w_mood},
            {"missing_penalty", subjective.missing_penalty},
            {"default_fatigue", subjective.default_fatigue},
            {"default_stress", subjective.default_stress},
            {"default_motivation", subjective.default_motivation},
            {"default_mood", subjective.default_mood}
        }},
        {"penalties", {
            {"alcohol_light", penalties.alcohol_light}, {"alcohol_heavy", penalties.alcohol_heavy},
            {"soreness_mild", penalties.soreness_mild},
            {"soreness_moderate", penalties.soreness_moderate},
            {"soreness_severe", penalties.soreness_severe},
            {"motivation_low", penalties.motivation_low},
            {"motivation_low_threshold", penalties.motivation_low_threshold},
            {"injury_minor_cap", penalties.injury_minor_cap},
            {"injury_moderate_cap", penalties.injury_moderate_cap},
            {"injury_severe_cap", penalties.injury_severe_cap}
        }},
        {"zones", {{"prime", zones.prime}, {"moderate", zones.moderate}}},
        {"confidence", {
            {"low_below_days", confidence.low_below_days},
            {"medium_below_days", confidence.medium_below_days}
        }},
        {"trend", {
            {"lookback_days", trend.lookback_days},
            {"strong_positive", trend.strong_positive}, {"positive", trend.positive},
            {"negative", trend.negative}, {"strong_negative", trend.strong_negative},
            {"volatility_period", trend.volatility_period},
            {"bollinger_period", trend.bollinger_period},
            {"bollinger_multiplier", trend.bollinger_multiplier},
            {"min_data_points", trend.min_data_points}, {"window_days", trend.window_days},
            {"high_level", trend.high_level}, {"medium_level", trend.medium_level}
        }},
        {"stddev_floor", stddev_floor}
    };
}

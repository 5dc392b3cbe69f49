#pragma once

#include <nlohmann/json.hpp>

// Maximum points per component; must total 100
struct ComponentWeights {
    double hrv = 40.0;
    double rhr = 25.0;
    double sleep = 15.0;
    double subjective = 20.0;

    double total() const { return hrv + rhr + sleep + subjective; }
};

struct HrvConfig {
    int baseline_days = 60;          // long window, current day excluded
    int rolling_days = 7;            // recent window, current day included
    int min_samples = 7;
    double sensitivity_factor = 0.75; // saturation trigger in long-window SDs
    double sigmoid_k = 1.0;
    double sigmoid_c = -0.5;          // horizontal shift (buffer zone)
    double saturation_z = 1.5;
    double default_log_mean = 3.912023005428146; // ln(50 ms)
    double default_log_stddev = 0.2;
};

struct RhrConfig {
    int baseline_days = 30;
    int min_samples = 7;
    double linear_baseline = 17.5;   // 70% of the RHR weight at z = 0
    double linear_slope = 7.5;       // points per SD
    double default_mean = 60.0;
    double default_stddev = 5.0;
};

struct SleepConfig {
    double min_hours = 5.0;
    double target_hours = 5.5;
    int debt_days = 3;
    double short_sleep_factor = 0.8;
    double neutral_fraction = 0.5;   // share of the weight when no sleep data
    double debt_rate = 0.05;         // multiplier loss per hour of debt
    double debt_floor = 0.7;
};

struct SubjectiveConfig {
    double w_fatigue = 0.35;
    double w_stress = 0.25;
    double w_motivation = 0.20;
    double w_mood = 0.20;
    double missing_penalty = 0.05;   // per missing primary rating

    // Internal-scale (1-5, 5 = best) fallbacks for missing ratings
    int default_fatigue = 4;
    int default_stress = 4;
    int default_motivation = 4;
    int default_mood = 4;
};

struct PenaltyConfig {
    double alcohol_light = 0.85;
    double alcohol_heavy = 0.6;
    double soreness_mild = 0.9;
    double soreness_moderate = 0.75;
    double soreness_severe = 0.5;
    double motivation_low = 0.9;
    int motivation_low_threshold = 2; // internal scale
    double injury_minor_cap = 70.0;
    double injury_moderate_cap = 50.0;
    double injury_severe_cap = 30.0;
};

struct ZoneConfig {
    int prime = 85;
    int moderate = 65;
};

struct ConfidenceConfig {
    int low_below_days = 30;
    int medium_below_days = 60;
};

struct TrendConfig {
    int lookback_days = 7;
    double strong_positive = 10.0;
    double positive = 2.0;
    double negative = -2.0;
    double strong_negative = -10.0;

    int volatility_period = 14;
    int bollinger_period = 20;
    double bollinger_multiplier = 1.5;

    int min_data_points = 15;
    int window_days = 90;

    double high_level = 85.0;
    double medium_level = 65.0;

    double volatility_alpha() const { return 2.0 / (volatility_period + 1); }
};

struct ScoringConfig {
    ComponentWeights weights;
    HrvConfig hrv;
    RhrConfig rhr;
    SleepConfig sleep;
    SubjectiveConfig subjective;
    PenaltyConfig penalties;
    ZoneConfig zones;
    ConfidenceConfig confidence;
    TrendConfig trend;

    double stddev_floor = 1e-3;

    static ScoringConfig defaults();

    // Deep merge: each section keeps every key the override does not name
    ScoringConfig with_overrides(const nlohmann::json& overrides) const;

    void validate() const;

    nlohmann::json to_json() const;
};

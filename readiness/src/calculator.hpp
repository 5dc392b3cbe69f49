#pragma once

#include "wellness.hpp"
#include "scoring_config.hpp"
#include "baseline.hpp"
#include "components.hpp"
#include "modifiers.hpp"
#include "subjective.hpp"
#include "trend.hpp"
#include <optional>
#include <string>
#include <vector>

enum class TrainingZone {
    Prime,
    Moderate,
    Low
};

struct ZoneRecommendation {
    TrainingZone zone;
    std::string name;
    std::string color;
    std::string description;
    std::string action;
    std::string approach;
    std::string examples;
};

struct DataQuality {
    int hrv_days;
    int rhr_days;
    Confidence confidence;
    std::string message;    // empty when confidence is high
};

struct Diagnostics {
    Baselines baselines;
    double hrv_z;
    bool parasympathetic_saturation;
    double sleep_debt_hours;
    SubjectiveInputs subjective;
    int missing_subjective;
};

struct ReadinessResult {
    std::string date;
    int score;                        // 0-100
    double base_score;                // sum of components, before modifiers
    Components components;
    ComponentWeights weights;         // maximum points per component
    Modifiers modifiers;
    double multiplier;
    std::optional<double> injury_cap;
    ZoneRecommendation recommendation;
    DataQuality data_quality;
    std::string readiness_level;
    std::optional<Diagnostics> diagnostics;
};

struct ReadinessWithTrend {
    ReadinessResult readiness;
    TrendResult trend;
};

struct ScoreOptions {
    bool include_diagnostics = false;
};

class ReadinessCalculator {
public:
    // Throws ConfigError when the configuration does not validate
    explicit ReadinessCalculator(ScoringConfig config = ScoringConfig::defaults());

    // Throws ValidationError listing every missing or invalid required field
    ReadinessResult score(const ScoringInput& input,
                          const ScoreOptions& options = ScoreOptions()) const;

    ReadinessWithTrend score_with_trend(const ScoringInput& input,
                                        const ScoreOptions& options = ScoreOptions()) const;

    // Fast path: trend from previously computed scores. Today's score is
    // appended when the series has no point for the current date.
    ReadinessWithTrend score_with_trend(const ScoringInput& input,
                                        const std::vector<ScorePoint>& series,
                                        const ScoreOptions& options = ScoreOptions()) const;

    // One result per qualifying day within window_days of current.date, oldest
    // first, each scored against the records up to that day. Days failing
    // validation are skipped.
    std::vector<ReadinessResult> score_history(const ScoringInput& input,
                                               int window_days) const;

    const ScoringConfig& config() const { return config_; }

    static void validate(const WellnessRecord& current);

    static ZoneRecommendation recommend(int score, const ZoneConfig& zones);
    static DataQuality assess_data_quality(const Baselines& baselines,
                                           const ConfidenceConfig& config);

private:
    ScoringConfig config_;
};

std::string to_string(TrainingZone zone);

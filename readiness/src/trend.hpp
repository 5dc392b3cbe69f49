#pragma once

#include "interpretation.hpp"
#include "wellness.hpp"
#include "scoring_config.hpp"
#include <string>
#include <vector>

class ReadinessCalculator;

struct ScorePoint {
    std::string date;
    double score;
};

struct VolatilityReading {
    double value = 0.0;
    VolatilityTier tier = VolatilityTier::Moderate;
    double band_position = 0.0;   // SDs from the envelope middle, clamped to +/-2
};

struct TrendResult {
    bool sufficient_data = false;
    int data_points = 0;
    double current_score = 0.0;

    double momentum = 0.0;        // percent change over the lookback
    MomentumCategory momentum_category = MomentumCategory::Neutral;
    MomentumStrength momentum_strength = MomentumStrength::Neutral;

    double volatility = 0.0;      // score points
    VolatilityTier volatility_tier = VolatilityTier::Moderate;
    double band_position = 0.0;

    TrendState state = TrendState::Balanced;
    std::string state_label;
    Confidence confidence = Confidence::Low;
    std::string interpretation;
};

class TrendAnalyzer {
public:
    explicit TrendAnalyzer(const ReadinessCalculator& calculator);

    // Re-scores every qualifying day of the input history
    TrendResult analyze(const ScoringInput& input) const;

    // Pre-computed series; points after target_date or outside the window are ignored.
    // Dates may carry a time suffix; the last point given for a day wins.
    TrendResult analyze(const std::vector<ScorePoint>& series,
                        const std::string& target_date) const;

    std::vector<ScorePoint> build_series(const ScoringInput& input) const;

    // Percent change from the point `lookback` entries back; 0 when that point is 0
    static double momentum(const std::vector<ScorePoint>& series, int lookback);

    // EMA of |score[i] - score[i-1]|; empty with fewer than period + 1 points
    static std::vector<double> volatility_series(const std::vector<ScorePoint>& series,
                                                 int period);

    static VolatilityReading classify_volatility(const std::vector<double>& volatility,
                                                 const TrendConfig& config);

    static Confidence confidence_for(int data_points);

private:
    const ReadinessCalculator& calculator_;

    TrendResult summarize(const std::vector<ScorePoint>& series) const;
};

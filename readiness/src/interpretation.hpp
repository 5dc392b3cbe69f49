#pragma once

#include "scoring_config.hpp"
#include <optional>
#include <string>

enum class ScoreLevel {
    Low,      // < 65
    Medium,   // 65-84
    High      // >= 85
};

enum class MomentumCategory {
    Positive,
    Neutral,
    Negative
};

enum class MomentumStrength {
    StrongPositive,
    Positive,
    Neutral,
    Negative,
    StrongNegative
};

enum class VolatilityTier {
    Low,
    Moderate,
    High
};

// Numeric values are the published state codes
enum class TrendState {
    Peaking = 1,
    StableAdaptation = 2,
    EarlyFatigue = 3,
    ProductiveRebound = 4,
    Balanced = 5,
    FunctionalOverreaching = 6,
    RecoveryInProgress = 7,
    StagnantFatigue = 8,
    AcuteMaladaptation = 9
};

enum class Confidence {
    Low,
    Medium,
    High
};

struct InterpretationCell {
    const char* assessment;
    const char* detail;
};

class TrendInterpreter {
public:
    static ScoreLevel level_for(double score, const TrendConfig& config);
    static MomentumCategory categorize(double momentum, const TrendConfig& config);
    static MomentumStrength strength(double momentum, const TrendConfig& config);

    static TrendState classify(ScoreLevel level, MomentumCategory momentum);
    static int state_code(TrendState state) { return static_cast<int>(state); }
    static std::string state_label(TrendState state);
    static std::string state_key(TrendState state);

    // nullopt for a (state, tier) pair with no matrix entry
    static std::optional<InterpretationCell> lookup(TrendState state, VolatilityTier tier);

    static std::string interpret(double score, double momentum, double volatility,
                                 VolatilityTier tier, TrendState state,
                                 const TrendConfig& config);

    // Generic text from the raw numbers
    static std::string fallback(double score, double momentum, double volatility,
                                const TrendConfig& config);

    static std::string recommended_action(double score, double momentum, VolatilityTier tier,
                                          const TrendConfig& config);

    static std::string insufficient_data(int points, int required);
};

std::string to_string(ScoreLevel level);
std::string to_string(MomentumCategory category);
std::string to_string(MomentumStrength strength);
std::string to_string(VolatilityTier tier);
std::string to_string(Confidence confidence);

// Overall readiness wording at 85 / 70 / 55 / 45
std::string readiness_level_description(double score);

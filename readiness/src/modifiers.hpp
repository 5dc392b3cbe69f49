#pragma once

#include "subjective.hpp"
#include "wellness.hpp"
#include "scoring_config.hpp"
#include <optional>
#include <string>
#include <vector>

struct ModifierDecision {
    bool applied = false;
    double value = 1.0;       // multiplier, or the ceiling for injury
    std::string reason;
};

struct Modifiers {
    ModifierDecision alcohol;
    ModifierDecision soreness;
    ModifierDecision motivation;
    ModifierDecision sleep_debt;
    ModifierDecision injury;  // ceiling, not part of the product
};

struct ModifierOutcome {
    Modifiers modifiers;
    double multiplier;               // product of the multiplicative modifiers
    std::optional<double> cap;       // injury ceiling
    double sleep_debt_hours;
    int final_score;
};

class ModifierEngine {
public:
    // final = clip(round(min(base * product, cap)), 0, 100)
    static ModifierOutcome apply(double base_score,
                                 const WellnessRecord& current,
                                 const SubjectiveInputs& inputs,
                                 const std::vector<WellnessRecord>& historical,
                                 const ScoringConfig& config);

    // Sum of max(0, target - hours) over the trailing debt window ending at
    // current.date; only records carrying sleep hours contribute
    static double sleep_debt_hours(const WellnessRecord& current,
                                   const std::vector<WellnessRecord>& historical,
                                   const SleepConfig& config);

private:
    static ModifierDecision alcohol(int level, const PenaltyConfig& p);
    static ModifierDecision soreness(std::optional<Severity> s, const PenaltyConfig& p);
    static ModifierDecision motivation(std::optional<int> internal, const PenaltyConfig& p);
    static ModifierDecision sleep_debt(double debt_hours, const SleepConfig& s);
    static ModifierDecision injury(std::optional<Severity> s, const PenaltyConfig& p);
};

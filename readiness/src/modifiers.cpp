#include "modifiers.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>
#include <map>

ModifierDecision ModifierEngine::alcohol(int level, const PenaltyConfig& p) {
    ModifierDecision d;
    if (level == 1) {
        d.applied = true;
        d.value = p.alcohol_light;
        d.reason = "Light alcohol intake";
    } else if (level >= 2) {
        d.applied = true;
        d.value = p.alcohol_heavy;
        d.reason = "Heavy alcohol intake";
    }
    return d;
}

ModifierDecision ModifierEngine::soreness(std::optional<Severity> s, const PenaltyConfig& p) {
    ModifierDecision d;
    if (!s || *s == Severity::None) return d;

    d.applied = true;
    switch (*s) {
        case Severity::Mild:
            d.value = p.soreness_mild;
            d.reason = "Mild muscle soreness";
            break;
        case Severity::Moderate:
            d.value = p.soreness_moderate;
            d.reason = "Moderate muscle soreness";
            break;
        case Severity::Severe:
            d.value = p.soreness_severe;
            d.reason = "Severe muscle soreness";
            break;
        case Severity::None:
            break;
    }
    return d;
}

ModifierDecision ModifierEngine::motivation(std::optional<int> internal, const PenaltyConfig& p) {
    ModifierDecision d;
    if (internal && *internal <= p.motivation_low_threshold) {
        d.applied = true;
        d.value = p.motivation_low;
        d.reason = "Low motivation";
    }
    return d;
}

ModifierDecision ModifierEngine::sleep_debt(double debt_hours, const SleepConfig& s) {
    ModifierDecision d;
    if (debt_hours <= 0) return d;

    d.applied = true;
    d.value = std::max(s.debt_floor, 1.0 - s.debt_rate * debt_hours);
    d.reason = fmt::format("Sleep debt of {:.1f}h over {} days", debt_hours, s.debt_days);
    return d;
}

ModifierDecision ModifierEngine::injury(std::optional<Severity> s, const PenaltyConfig& p) {
    ModifierDecision d;
    if (!s || *s == Severity::None) return d;

    d.applied = true;
    switch (*s) {
        case Severity::Mild:
            d.value = p.injury_minor_cap;
            d.reason = "Minor injury";
            break;
        case Severity::Moderate:
            d.value = p.injury_moderate_cap;
            d.reason = "Moderate injury";
            break;
        case Severity::Severe:
            d.value = p.injury_severe_cap;
            d.reason = "Severe injury";
            break;
        case Severity::None:
            break;
    }
    return d;
}

double ModifierEngine::sleep_debt_hours(const WellnessRecord& current,
                                        const std::vector<WellnessRecord>& historical,
                                        const SleepConfig& config) {
    auto anchor = current.day_index();
    if (!anchor) return 0.0;

    // One value per day; the current record wins over history
    std::map<int64_t, double> hours_by_day;
    for (const auto& rec : historical) {
        auto day = rec.day_index();
        if (!day || !rec.sleep_hours) continue;
        int64_t days_before = *anchor - *day;
        if (days_before >= 0 && days_before < config.debt_days) {
            hours_by_day[*day] = *rec.sleep_hours;
        }
    }
    if (current.sleep_hours) {
        hours_by_day[*anchor] = *current.sleep_hours;
    }

    double debt = 0.0;
    for (const auto& [day, hours] : hours_by_day) {
        debt += std::max(0.0, config.target_hours - hours);
    }
    return debt;
}

ModifierOutcome ModifierEngine::apply(double base_score,
                                      const WellnessRecord& current,
                                      const SubjectiveInputs& inputs,
                                      const std::vector<WellnessRecord>& historical,
                                      const ScoringConfig& config) {
    ModifierOutcome out;
    out.sleep_debt_hours = sleep_debt_hours(current, historical, config.sleep);

    out.modifiers.alcohol = alcohol(current.alcohol, config.penalties);
    out.modifiers.soreness = soreness(inputs.soreness, config.penalties);
    out.modifiers.motivation = motivation(inputs.motivation, config.penalties);
    out.modifiers.sleep_debt = sleep_debt(out.sleep_debt_hours, config.sleep);
    out.modifiers.injury = injury(inputs.injury, config.penalties);

    out.multiplier = 1.0;
    for (const auto* d : {&out.modifiers.alcohol, &out.modifiers.soreness,
                          &out.modifiers.motivation, &out.modifiers.sleep_debt}) {
        if (d->applied) out.multiplier *= d->value;
    }

    double adjusted = base_score * out.multiplier;
    if (out.modifiers.injury.applied) {
        out.cap = out.modifiers.injury.value;
        adjusted = std::min(adjusted, *out.cap);
    }

    if (!std::isfinite(adjusted)) adjusted = 0.0;
    out.final_score = static_cast<int>(std::clamp(std::round(adjusted), 0.0, 100.0));

    spdlog::debug("Modifiers for {}: base={:.2f} multiplier={:.3f} cap={} final={}",
                  current.date, base_score, out.multiplier,
                  out.cap ? fmt::format("{:.0f}", *out.cap) : "none", out.final_score);
    return out;
}

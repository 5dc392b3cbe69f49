#include "subjective.hpp"

namespace {
    // Index = raw rating - 1
    constexpr int kFatigueStress[4] = {5, 4, 2, 1};
    constexpr int kMotivationMood[4] = {5, 4, 3, 1};
}

std::string severity_to_string(Severity s) {
    switch (s) {
        case Severity::None: return "none";
        case Severity::Mild: return "mild";
        case Severity::Moderate: return "moderate";
        case Severity::Severe: return "severe";
    }
    return "none";
}

std::optional<int> WellnessScale::lookup(const int (&table)[4], std::optional<int> raw) {
    if (!raw || *raw < 1 || *raw > 4) return std::nullopt;
    return table[*raw - 1];
}

std::optional<int> WellnessScale::fatigue(std::optional<int> raw) {
    return lookup(kFatigueStress, raw);
}

std::optional<int> WellnessScale::stress(std::optional<int> raw) {
    return lookup(kFatigueStress, raw);
}

std::optional<int> WellnessScale::motivation(std::optional<int> raw) {
    return lookup(kMotivationMood, raw);
}

std::optional<int> WellnessScale::mood(std::optional<int> raw) {
    return lookup(kMotivationMood, raw);
}

std::optional<Severity> WellnessScale::severity(std::optional<int> raw) {
    if (!raw) return std::nullopt;
    switch (*raw) {
        case 1: return Severity::None;
        case 2: return Severity::Mild;
        case 3: return Severity::Moderate;
        case 4: return Severity::Severe;
        default: return std::nullopt;
    }
}

SubjectiveInputs WellnessScale::convert(const WellnessRecord& record) {
    SubjectiveInputs in;
    in.fatigue = fatigue(record.fatigue);
    in.stress = stress(record.stress);
    in.motivation = motivation(record.motivation);
    in.mood = mood(record.mood);
    in.soreness = severity(record.soreness);
    in.injury = severity(record.injury);
    return in;
}

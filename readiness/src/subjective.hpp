#pragma once

#include "wellness.hpp"
#include <optional>
#include <string>

enum class Severity {
    None,
    Mild,
    Moderate,
    Severe
};

std::string severity_to_string(Severity s);

// Internal scale: 1 = worst, 5 = best. Absent fields stay nullopt.
struct SubjectiveInputs {
    std::optional<int> fatigue;
    std::optional<int> stress;
    std::optional<int> motivation;
    std::optional<int> mood;
    std::optional<Severity> soreness;
    std::optional<Severity> injury;
};

class WellnessScale {
public:
    // Platform 1-4 (1 = best) to internal 1-5 (5 = best).
    // Out-of-range ratings come back as nullopt.
    static std::optional<int> fatigue(std::optional<int> raw);
    static std::optional<int> stress(std::optional<int> raw);
    static std::optional<int> motivation(std::optional<int> raw);
    static std::optional<int> mood(std::optional<int> raw);

    static std::optional<Severity> severity(std::optional<int> raw);

    static SubjectiveInputs convert(const WellnessRecord& record);

private:
    static std::optional<int> lookup(const int (&table)[4], std::optional<int> raw);
};

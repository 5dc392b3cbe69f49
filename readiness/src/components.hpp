#pragma once

#include "baseline.hpp"
#include "subjective.hpp"
#include "scoring_config.hpp"
#include <string>

struct Components {
    double hrv = 0.0;
    double rhr = 0.0;
    double sleep = 0.0;
    double subjective = 0.0;

    double total() const { return hrv + rhr + sleep + subjective; }

    // HRV + RHR + sleep, the physiological part of the score
    double objective() const { return hrv + rhr + sleep; }
};

struct HrvScore {
    double score;
    double z;
    bool saturation;   // parasympathetic saturation override fired
};

class HrvScorer {
public:
    // Logistic curve, max / (1 + e^(-k (z - c))). At z == c the score is max / 2.
    // An invalid baseline scores z = 0 and never triggers saturation.
    static HrvScore score(double current_hrv, double current_rhr,
                          const HrvBaseline& hrv, const RhrBaseline& rhr,
                          const HrvConfig& config, double max_points,
                          double stddev_floor);

    // ln(hrv) below mean - sensitivity * sd while RHR is under its mean
    static bool parasympathetic_saturation(double current_hrv, double current_rhr,
                                           const HrvBaseline& hrv, const RhrBaseline& rhr,
                                           const HrvConfig& config);

    static double sigmoid(double z, const HrvConfig& config, double max_points);
};

class RhrScorer {
public:
    // linear_baseline + slope * z, z = 0 while the baseline is invalid
    static double score(double current_rhr, const RhrBaseline& rhr,
                        const RhrConfig& config, double max_points,
                        double stddev_floor);
};

class SleepScorer {
public:
    static double score(const WellnessRecord& record, const SleepConfig& config,
                        double max_points);

    // Quality estimate on 0-100 when only duration is known
    static double quality_from_hours(double hours, const SleepConfig& config);
};

class SubjectiveScorer {
public:
    static double score(const SubjectiveInputs& inputs, const SubjectiveConfig& config,
                        double max_points);

    static int missing_primary(const SubjectiveInputs& inputs);
};

// Label for a component expressed as a share of its weight
std::string component_status(double score, double max_points);

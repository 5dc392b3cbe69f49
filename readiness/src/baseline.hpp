#pragma once

#include "wellness.hpp"
#include "scoring_config.hpp"
#include <vector>
#include <utility>

// HRV statistics are on the natural-log scale
struct HrvBaseline {
    double long_mean;
    double long_stddev;
    double recent_mean;
    int sample_count;    // long-window samples
    int recent_count;
    bool is_valid;
};

struct RhrBaseline {
    double mean;
    double stddev;
    int sample_count;
    bool is_valid;
};

struct Baselines {
    HrvBaseline hrv;
    RhrBaseline rhr;
};

class BaselineCalculator {
public:
    // Windows are anchored on current.date; records after it are ignored.
    // The current record supersedes a historical record with the same date.
    static Baselines compute(const std::vector<WellnessRecord>& historical,
                             const WellnessRecord& current,
                             const ScoringConfig& config);

    static HrvBaseline compute_hrv(const std::vector<WellnessRecord>& historical,
                                   const WellnessRecord& current,
                                   const HrvConfig& config);

    static RhrBaseline compute_rhr(const std::vector<WellnessRecord>& historical,
                                   const WellnessRecord& current,
                                   const RhrConfig& config);

private:
    static std::vector<std::pair<int64_t, const WellnessRecord*>> dated_records(
        const std::vector<WellnessRecord>& historical,
        const WellnessRecord& current);
};

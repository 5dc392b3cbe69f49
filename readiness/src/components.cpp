#include "components.hpp"
#include "stats.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

HrvScore HrvScorer::score(double current_hrv, double current_rhr,
                          const HrvBaseline& hrv, const RhrBaseline& rhr,
                          const HrvConfig& config, double max_points,
                          double stddev_floor) {
    HrvScore out{0.0, 0.0, false};

    // Without enough history there is nothing personal to compare against
    if (!hrv.is_valid) {
        spdlog::debug("HRV baseline invalid ({} samples), scoring neutral", hrv.sample_count);
        out.score = sigmoid(0.0, config, max_points);
        return out;
    }

    out.z = stats::z_score(hrv.recent_mean, hrv.long_mean, hrv.long_stddev, stddev_floor);
    out.saturation = parasympathetic_saturation(current_hrv, current_rhr, hrv, rhr, config);

    if (out.saturation) {
        spdlog::debug("Parasympathetic saturation: ln(hrv)={:.4f} rhr={:.1f}, z {:.3f} -> {:.2f}",
                      std::log(current_hrv), current_rhr, out.z, config.saturation_z);
        out.z = config.saturation_z;
    }

    out.score = sigmoid(out.z, config, max_points);
    return out;
}

bool HrvScorer::parasympathetic_saturation(double current_hrv, double current_rhr,
                                           const HrvBaseline& hrv, const RhrBaseline& rhr,
                                           const HrvConfig& config) {
    if (current_hrv <= 0) return false;

    double threshold = hrv.long_mean - config.sensitivity_factor * hrv.long_stddev;
    return std::log(current_hrv) < threshold && current_rhr < rhr.mean;
}

double HrvScorer::sigmoid(double z, const HrvConfig& config, double max_points) {
    double value = max_points / (1.0 + std::exp(-config.sigmoid_k * (z - config.sigmoid_c)));
    if (!std::isfinite(value)) return z > config.sigmoid_c ? max_points : 0.0;
    return std::clamp(value, 0.0, max_points);
}

double RhrScorer::score(double current_rhr, const RhrBaseline& rhr,
                        const RhrConfig& config, double max_points,
                        double stddev_floor) {
    if (!rhr.is_valid) {
        return std::clamp(config.linear_baseline, 0.0, max_points);
    }

    // Lower resting HR is better
    double z = -stats::z_score(current_rhr, rhr.mean, rhr.stddev, stddev_floor);
    double value = config.linear_baseline + config.linear_slope * z;
    return std::clamp(value, 0.0, max_points);
}

double SleepScorer::quality_from_hours(double hours, const SleepConfig& config) {
    if (hours >= config.target_hours) return 100.0;

    if (hours >= config.min_hours) {
        double span = config.target_hours - config.min_hours;
        if (span <= 0) return 100.0;
        return 70.0 + 30.0 * (hours - config.min_hours) / span;
    }

    return std::max(0.0, 70.0 * hours / config.min_hours);
}

double SleepScorer::score(const WellnessRecord& record, const SleepConfig& config,
                          double max_points) {
    if (!record.sleep_score && !record.sleep_hours) {
        return max_points * config.neutral_fraction;
    }

    double quality = record.sleep_score
        ? *record.sleep_score
        : quality_from_hours(*record.sleep_hours, config);

    double value = std::clamp(quality, 0.0, 100.0) / 100.0 * max_points;

    // A good quality score cannot fully offset a short night
    if (record.sleep_hours && *record.sleep_hours < config.min_hours) {
        double hours = std::max(0.0, *record.sleep_hours);
        value *= (hours / config.min_hours) * config.short_sleep_factor;
    }

    return std::clamp(value, 0.0, max_points);
}

int SubjectiveScorer::missing_primary(const SubjectiveInputs& inputs) {
    int missing = 0;
    if (!inputs.fatigue) missing++;
    if (!inputs.stress) missing++;
    if (!inputs.motivation) missing++;
    if (!inputs.mood) missing++;
    return missing;
}

double SubjectiveScorer::score(const SubjectiveInputs& inputs, const SubjectiveConfig& config,
                               double max_points) {
    double fatigue = inputs.fatigue.value_or(config.default_fatigue);
    double stress = inputs.stress.value_or(config.default_stress);
    double motivation = inputs.motivation.value_or(config.default_motivation);
    double mood = inputs.mood.value_or(config.default_mood);

    double weight_sum = config.w_fatigue + config.w_stress + config.w_motivation + config.w_mood;
    double weighted = (fatigue * config.w_fatigue +
                       stress * config.w_stress +
                       motivation * config.w_motivation +
                       mood * config.w_mood) / weight_sum;

    double normalized = (weighted - 1.0) / 4.0;
    int missing = missing_primary(inputs);
    double penalty = std::max(0.0, 1.0 - config.missing_penalty * missing);

    return std::clamp(max_points * normalized * penalty, 0.0, max_points);
}

std::string component_status(double score, double max_points) {
    if (max_points <= 0) return "Poor";

    double pct = score / max_points * 100.0;
    if (pct >= 90) return "Excellent";
    if (pct >= 75) return "Good";
    if (pct >= 60) return "Fair";
    if (pct >= 45) return "Below average";
    return "Poor";
}

#include "baseline.hpp"
#include "stats.hpp"
#include <spdlog/spdlog.h>
#include <cmath>
#include <utility>

std::vector<std::pair<int64_t, const WellnessRecord*>> BaselineCalculator::dated_records(
    const std::vector<WellnessRecord>& historical,
    const WellnessRecord& current) {

    std::vector<std::pair<int64_t, const WellnessRecord*>> out;
    out.reserve(historical.size() + 1);

    auto current_day = current.day_index();
    for (const auto& rec : historical) {
        auto day = rec.day_index();
        if (!day) continue;
        if (current_day && *day == *current_day) continue;  // superseded
        out.emplace_back(*day, &rec);
    }
    if (current_day) {
        out.emplace_back(*current_day, &current);
    }
    return out;
}

Baselines BaselineCalculator::compute(const std::vector<WellnessRecord>& historical,
                                      const WellnessRecord& current,
                                      const ScoringConfig& config) {
    Baselines b;
    b.hrv = compute_hrv(historical, current, config.hrv);
    b.rhr = compute_rhr(historical, current, config.rhr);

    spdlog::debug("Baselines for {}: hrv mean60={:.4f} sd60={:.4f} mean7={:.4f} n={} valid={}, "
                  "rhr mean30={:.2f} sd30={:.2f} n={} valid={}",
                  current.date,
                  b.hrv.long_mean, b.hrv.long_stddev, b.hrv.recent_mean,
                  b.hrv.sample_count, b.hrv.is_valid,
                  b.rhr.mean, b.rhr.stddev, b.rhr.sample_count, b.rhr.is_valid);
    return b;
}

HrvBaseline BaselineCalculator::compute_hrv(const std::vector<WellnessRecord>& historical,
                                            const WellnessRecord& current,
                                            const HrvConfig& config) {
    HrvBaseline out{config.default_log_mean, config.default_log_stddev,
                    config.default_log_mean, 0, 0, false};

    auto anchor = current.day_index();
    if (!anchor) return out;

    std::vector<double> long_window;
    std::vector<double> recent_window;

    for (const auto& [day, rec] : dated_records(historical, current)) {
        if (!rec->hrv || *rec->hrv <= 0) continue;

        int64_t days_before = *anchor - day;
        double ln_hrv = std::log(*rec->hrv);

        if (days_before > 0 && days_before <= config.baseline_days) {
            long_window.push_back(ln_hrv);
        }
        if (days_before >= 0 && days_before < config.rolling_days) {
            recent_window.push_back(ln_hrv);
        }
    }

    out.sample_count = static_cast<int>(long_window.size());
    out.recent_count = static_cast<int>(recent_window.size());

    if (out.sample_count >= config.min_samples) {
        out.long_mean = stats::mean(long_window);
        out.long_stddev = stats::sample_stddev(long_window);
        out.is_valid = true;
    }

    out.recent_mean = recent_window.empty() ? out.long_mean : stats::mean(recent_window);
    return out;
}

RhrBaseline BaselineCalculator::compute_rhr(const std::vector<WellnessRecord>& historical,
                                            const WellnessRecord& current,
                                            const RhrConfig& config) {
    RhrBaseline out{config.default_mean, config.default_stddev, 0, false};

    auto anchor = current.day_index();
    if (!anchor) return out;

    std::vector<double> window;
    for (const auto& [day, rec] : dated_records(historical, current)) {
        if (!rec->rhr || *rec->rhr <= 0) continue;

        int64_t days_before = *anchor - day;
        if (days_before >= 0 && days_before <= config.baseline_days) {
            window.push_back(*rec->rhr);
        }
    }

    out.sample_count = static_cast<int>(window.size());
    if (out.sample_count >= config.min_samples) {
        out.mean = stats::mean(window);
        out.stddev = stats::sample_stddev(window);
        out.is_valid = true;
    }
    return out;
}

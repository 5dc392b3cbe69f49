#include "calculator.hpp"
#include "errors.hpp"
#include "interpretation.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>
#include <map>
#include <utility>

ReadinessCalculator::ReadinessCalculator(ScoringConfig config)
    : config_(std::move(config)) {
    config_.validate();
}

void ReadinessCalculator::validate(const WellnessRecord& current) {
    std::vector<FieldError> errors;

    if (current.date.empty()) {
        errors.push_back({"date", "date is required"});
    } else if (!current.day_index()) {
        errors.push_back({"date", "date must be YYYY-MM-DD"});
    }

    if (!current.hrv) {
        errors.push_back({"hrv", "hrv is required"});
    } else if (!std::isfinite(*current.hrv) || *current.hrv <= 0) {
        errors.push_back({"hrv", "hrv must be a positive number"});
    }

    if (!current.rhr) {
        errors.push_back({"rhr", "rhr is required"});
    } else if (!std::isfinite(*current.rhr) || *current.rhr <= 0) {
        errors.push_back({"rhr", "rhr must be a positive number"});
    }

    if (!errors.empty()) {
        throw ValidationError(std::move(errors));
    }
}

ReadinessResult ReadinessCalculator::score(const ScoringInput& input,
                                           const ScoreOptions& options) const {
    const auto& current = input.current;
    validate(current);

    auto baselines = BaselineCalculator::compute(input.historical, current, config_);
    auto subjective = WellnessScale::convert(current);

    const auto& w = config_.weights;
    auto hrv = HrvScorer::score(*current.hrv, *current.rhr, baselines.hrv, baselines.rhr,
                                config_.hrv, w.hrv, config_.stddev_floor);

    ReadinessResult result;
    result.date = current.date;
    result.components.hrv = hrv.score;
    result.components.rhr = RhrScorer::score(*current.rhr, baselines.rhr, config_.rhr,
                                             w.rhr, config_.stddev_floor);
    result.components.sleep = SleepScorer::score(current, config_.sleep, w.sleep);
    result.components.subjective = SubjectiveScorer::score(subjective, config_.subjective,
                                                           w.subjective);
    result.weights = w;
    result.base_score = result.components.total();

    auto outcome = ModifierEngine::apply(result.base_score, current, subjective,
                                         input.historical, config_);
    result.score = outcome.final_score;
    result.modifiers = outcome.modifiers;
    result.multiplier = outcome.multiplier;
    result.injury_cap = outcome.cap;

    result.recommendation = recommend(result.score, config_.zones);
    result.data_quality = assess_data_quality(baselines, config_.confidence);
    result.readiness_level = readiness_level_description(result.score);

    if (options.include_diagnostics) {
        result.diagnostics = Diagnostics{baselines, hrv.z, hrv.saturation,
                                         outcome.sleep_debt_hours, subjective,
                                         SubjectiveScorer::missing_primary(subjective)};
    }

    spdlog::debug("Readiness {}: hrv={:.2f} rhr={:.2f} sleep={:.2f} subjective={:.2f} "
                  "base={:.2f} score={} zone={}",
                  result.date, result.components.hrv, result.components.rhr,
                  result.components.sleep, result.components.subjective,
                  result.base_score, result.score, result.recommendation.name);
    return result;
}

std::vector<ReadinessResult> ReadinessCalculator::score_history(const ScoringInput& input,
                                                                int window_days) const {
    std::vector<ReadinessResult> results;

    auto target = input.current.day_index();
    if (!target) return results;

    // One record per day, the current record has the last word on its date
    std::map<int64_t, WellnessRecord> by_day;
    for (const auto& rec : input.historical) {
        if (auto day = rec.day_index()) by_day[*day] = rec;
    }
    by_day[*target] = input.current;

    std::vector<WellnessRecord> history;
    history.reserve(by_day.size());

    for (const auto& [day, rec] : by_day) {
        if (day > *target) break;
        history.push_back(rec);

        if (*target - day > window_days) continue;
        if (!rec.has_objective_data()) continue;

        ScoringInput day_input;
        day_input.current = rec;
        day_input.historical.assign(history.begin(), history.end() - 1);

        try {
            results.push_back(score(day_input));
        } catch (const ValidationError& e) {
            spdlog::debug("Skipping {} in score history: {}", rec.date, e.what());
        }
    }

    return results;
}

ReadinessWithTrend ReadinessCalculator::score_with_trend(const ScoringInput& input,
                                                         const ScoreOptions& options) const {
    ReadinessWithTrend out;
    out.readiness = score(input, options);
    out.trend = TrendAnalyzer(*this).analyze(input);
    return out;
}

ReadinessWithTrend ReadinessCalculator::score_with_trend(const ScoringInput& input,
                                                         const std::vector<ScorePoint>& series,
                                                         const ScoreOptions& options) const {
    ReadinessWithTrend out;
    out.readiness = score(input, options);

    std::vector<ScorePoint> points = series;
    auto today = input.current.day_index();
    bool has_today = std::any_of(points.begin(), points.end(), [&](const ScorePoint& p) {
        return util::parse_date_days(p.date) == today;
    });
    if (!has_today) {
        points.push_back({input.current.date, static_cast<double>(out.readiness.score)});
    }

    out.trend = TrendAnalyzer(*this).analyze(points, input.current.date);
    return out;
}

ZoneRecommendation ReadinessCalculator::recommend(int score, const ZoneConfig& zones) {
    if (score >= zones.prime) {
        return {TrainingZone::Prime, "Prime", "#4CAF50",
                "The body has fully adapted to the training load and super-compensation is "
                "likely. A rare chance to push limits.",
                "High intensity as planned, or more",
                "If the body feels good, consider adding a little volume or intensity. "
                "A day to train with confidence.",
                "The most demanding sessions as planned: VO2max intervals, all-out time "
                "trials, near-1RM strength work."};
    }

    if (score >= zones.moderate) {
        return {TrainingZone::Moderate, "Moderate", "#FFA500",
                "Productive training is possible, but not suited to maximal stress.",
                "Lower-intensity training",
                "High intensity is possible with careful self-regulation.",
                "Zone 2 endurance, technique practice, moderate-volume strength training."};
    }

    return {TrainingZone::Low, "Low", "#F44336",
            "Recovery has not kept up and physiological or psychological stress is high. "
            "Further stress sharply raises the risk of injury or overtraining.",
            "Maximise recovery",
            "High-intensity training is strongly discouraged. Any session should aim to "
            "promote recovery; doing nothing is often the most productive choice.",
            "Active or complete rest: full rest, an easy walk, stretching, foam rolling, "
            "yoga, or other activity that promotes blood flow and relaxation."};
}

DataQuality ReadinessCalculator::assess_data_quality(const Baselines& baselines,
                                                     const ConfidenceConfig& config) {
    DataQuality dq;
    dq.hrv_days = baselines.hrv.sample_count;
    dq.rhr_days = baselines.rhr.sample_count;

    // The RHR window is shorter than the medium threshold, so only HRV
    // history can lift confidence past medium
    int days = std::min(dq.hrv_days, dq.rhr_days);
    if (days < config.low_below_days) {
        dq.confidence = Confidence::Low;
        dq.message = fmt::format("Only {} days of baseline data. The score is provisional "
                                 "until {} days have been recorded.",
                                 days, config.low_below_days);
    } else if (dq.hrv_days < config.medium_below_days) {
        dq.confidence = Confidence::Medium;
        dq.message = fmt::format("{} days of HRV history. Accuracy improves once {} days "
                                 "are available.", dq.hrv_days, config.medium_below_days);
    } else {
        dq.confidence = Confidence::High;
    }
    return dq;
}

std::string to_string(TrainingZone zone) {
    switch (zone) {
        case TrainingZone::Prime: return "Prime";
        case TrainingZone::Moderate: return "Moderate";
        case TrainingZone::Low: return "Low";
    }
    return "Low";
}

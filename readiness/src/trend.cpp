#include "trend.hpp"
#include "calculator.hpp"
#include "stats.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <utility>

TrendAnalyzer::TrendAnalyzer(const ReadinessCalculator& calculator)
    : calculator_(calculator) {}

std::vector<ScorePoint> TrendAnalyzer::build_series(const ScoringInput& input) const {
    std::vector<ScorePoint> series;
    for (const auto& result : calculator_.score_history(input,
                                                        calculator_.config().trend.window_days)) {
        series.push_back({result.date, static_cast<double>(result.score)});
    }
    return series;
}

TrendResult TrendAnalyzer::analyze(const ScoringInput& input) const {
    return summarize(build_series(input));
}

TrendResult TrendAnalyzer::analyze(const std::vector<ScorePoint>& series,
                                   const std::string& target_date) const {
    const auto& trend_cfg = calculator_.config().trend;
    auto target = util::parse_date_days(target_date);

    std::vector<std::pair<int64_t, ScorePoint>> dated;
    for (const auto& point : series) {
        auto day = util::parse_date_days(point.date);
        if (!day || !std::isfinite(point.score)) continue;
        if (target && (*day > *target || *target - *day > trend_cfg.window_days)) continue;
        dated.emplace_back(*day, point);
    }

    std::stable_sort(dated.begin(), dated.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });

    // One point per day; the later entry for a day replaces the earlier one
    std::vector<ScorePoint> filtered;
    filtered.reserve(dated.size());
    for (size_t i = 0; i < dated.size(); i++) {
        if (i > 0 && dated[i].first == dated[i - 1].first) {
            filtered.back() = std::move(dated[i].second);
        } else {
            filtered.push_back(std::move(dated[i].second));
        }
    }
    return summarize(filtered);
}

double TrendAnalyzer::momentum(const std::vector<ScorePoint>& series, int lookback) {
    if (series.size() < 2 || lookback <= 0) return 0.0;

    size_t last = series.size() - 1;
    size_t past = last >= static_cast<size_t>(lookback) ? last - lookback : 0;

    double past_score = series[past].score;
    if (past_score == 0.0) return 0.0;
    return (series[last].score - past_score) / past_score * 100.0;
}

std::vector<double> TrendAnalyzer::volatility_series(const std::vector<ScorePoint>& series,
                                                     int period) {
    if (period <= 0 || series.size() < static_cast<size_t>(period) + 1) return {};

    std::vector<double> true_ranges;
    true_ranges.reserve(series.size() - 1);
    for (size_t i = 1; i < series.size(); i++) {
        true_ranges.push_back(std::abs(series[i].score - series[i - 1].score));
    }
    return stats::ema(true_ranges, static_cast<size_t>(period));
}

VolatilityReading TrendAnalyzer::classify_volatility(const std::vector<double>& volatility,
                                                     const TrendConfig& config) {
    VolatilityReading reading;
    if (volatility.empty()) return reading;

    reading.value = volatility.back();

    auto env = stats::trailing_envelope(volatility,
                                        static_cast<size_t>(config.bollinger_period),
                                        config.bollinger_multiplier);
    if (!env) return reading;

    if (reading.value > env->upper) {
        reading.tier = VolatilityTier::High;
    } else if (reading.value < env->lower) {
        reading.tier = VolatilityTier::Low;
    }

    if (env->stddev > 0) {
        reading.band_position = std::clamp((reading.value - env->middle) / env->stddev, -2.0, 2.0);
    }
    return reading;
}

Confidence TrendAnalyzer::confidence_for(int data_points) {
    if (data_points >= 30) return Confidence::High;
    if (data_points >= 15) return Confidence::Medium;
    return Confidence::Low;
}

TrendResult TrendAnalyzer::summarize(const std::vector<ScorePoint>& series) const {
    const auto& cfg = calculator_.config().trend;

    TrendResult result;
    result.data_points = static_cast<int>(series.size());
    if (!series.empty()) result.current_score = series.back().score;

    if (result.data_points < cfg.min_data_points) {
        result.state = TrendState::Balanced;
        result.state_label = TrendInterpreter::state_label(result.state);
        result.confidence = Confidence::Low;
        result.interpretation = TrendInterpreter::insufficient_data(result.data_points,
                                                                   cfg.min_data_points);
        spdlog::debug("Trend: insufficient data ({} of {} points)",
                      result.data_points, cfg.min_data_points);
        return result;
    }

    result.sufficient_data = true;

    result.momentum = momentum(series, cfg.lookback_days);
    result.momentum_category = TrendInterpreter::categorize(result.momentum, cfg);
    result.momentum_strength = TrendInterpreter::strength(result.momentum, cfg);

    auto reading = classify_volatility(volatility_series(series, cfg.volatility_period), cfg);
    result.volatility = reading.value;
    result.volatility_tier = reading.tier;
    result.band_position = reading.band_position;

    auto level = TrendInterpreter::level_for(result.current_score, cfg);
    result.state = TrendInterpreter::classify(level, result.momentum_category);
    result.state_label = TrendInterpreter::state_label(result.state);
    result.confidence = confidence_for(result.data_points);

    result.interpretation = TrendInterpreter::interpret(result.current_score, result.momentum,
                                                        result.volatility, result.volatility_tier,
                                                        result.state, cfg);

    spdlog::debug("Trend: score={:.0f} momentum={:.2f}% volatility={:.2f} ({}) state={} ({})",
                  result.current_score, result.momentum, result.volatility,
                  to_string(result.volatility_tier), TrendInterpreter::state_code(result.state),
                  result.state_label);
    return result;
}

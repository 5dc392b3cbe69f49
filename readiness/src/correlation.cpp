#include "correlation.hpp"
#include "calculator.hpp"
#include "stats.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>
#include <functional>
#include <stdexcept>

CorrelationAnalyzer::CorrelationAnalyzer(const ReadinessCalculator& calculator, int max_lag)
    : calculator_(calculator)
    , max_lag_(std::max(0, max_lag))
{}

DetailedComponents CorrelationAnalyzer::detail(const Components& components) {
    DetailedComponents d;
    d.components = components;
    d.objective = components.objective();
    d.subjective = components.subjective;
    d.total = d.objective + d.subjective;
    return d;
}

std::vector<ScoredDay> CorrelationAnalyzer::score_days(const ScoringInput& input) const {
    std::map<std::string, const WellnessRecord*> by_date;
    for (const auto& rec : input.historical) by_date[rec.date] = &rec;
    by_date[input.current.date] = &input.current;

    std::vector<ScoredDay> days;
    for (const auto& result : calculator_.score_history(input,
                                                        calculator_.config().trend.window_days)) {
        auto it = by_date.find(result.date);
        if (it == by_date.end()) continue;
        days.push_back({result.date, result.components.objective(), *it->second});
    }
    return days;
}

std::vector<CorrelationResult> CorrelationAnalyzer::analyze(const ScoringInput& input) const {
    return analyze(score_days(input), max_lag_);
}

std::vector<CorrelationResult> CorrelationAnalyzer::analyze(const std::vector<ScoredDay>& days,
                                                            int max_lag) {
    using Extractor = std::function<std::optional<int>(const WellnessRecord&)>;
    const std::vector<std::pair<std::string, Extractor>> metrics = {
        {"fatigue", [](const WellnessRecord& r) { return r.fatigue; }},
        {"stress", [](const WellnessRecord& r) { return r.stress; }},
        {"soreness", [](const WellnessRecord& r) { return r.soreness; }},
        {"motivation", [](const WellnessRecord& r) { return r.motivation; }},
        {"sleep_quality", [](const WellnessRecord& r) { return r.sleep_quality; }},
    };

    std::vector<CorrelationResult> results;
    if (days.empty()) return results;

    for (const auto& [name, extract] : metrics) {
        std::vector<double> objective;
        std::vector<double> values;
        for (const auto& day : days) {
            if (auto v = extract(day.record)) {
                objective.push_back(day.objective);
                values.push_back(*v);
            }
        }

        if (values.size() < days.size() * 0.8) {
            spdlog::debug("Correlation: skipping {} ({} of {} days)", name, values.size(), days.size());
            continue;
        }
        results.push_back(time_lagged(objective, values, name, max_lag));
    }

    std::stable_sort(results.begin(), results.end(), [](const auto& a, const auto& b) {
        return std::abs(a.correlation) > std::abs(b.correlation);
    });
    return results;
}

CorrelationResult CorrelationAnalyzer::time_lagged(const std::vector<double>& objective,
                                                   const std::vector<double>& metric,
                                                   const std::string& metric_name,
                                                   int max_lag) {
    if (objective.size() != metric.size()) {
        throw std::invalid_argument("objective and metric series must be the same length");
    }

    CorrelationResult result;
    result.metric = metric_name;
    result.data_points = static_cast<int>(objective.size());

    const long n = static_cast<long>(objective.size());
    for (int lag = -max_lag; lag <= max_lag; lag++) {
        long len = n - std::abs(lag);
        if (len < 3) continue;

        // Negative lag: earlier metric against later objective score
        long obj_start = lag < 0 ? -lag : 0;
        long met_start = lag > 0 ? lag : 0;

        std::vector<double> x(objective.begin() + obj_start, objective.begin() + obj_start + len);
        std::vector<double> y(metric.begin() + met_start, metric.begin() + met_start + len);

        double r = stats::pearson(x, y);
        result.lag_correlations[lag] = r;

        if (std::abs(r) > std::abs(result.correlation)) {
            result.correlation = r;
            result.optimal_lag = lag;
        }
    }

    int aligned = result.data_points - std::abs(result.optimal_lag);
    result.p_value = p_value(result.correlation, aligned);
    result.strength = strength(result.correlation);
    result.interpretation = interpret(metric_name, result.optimal_lag, result.correlation,
                                      result.data_points);
    return result;
}

double CorrelationAnalyzer::p_value(double r, int n) {
    if (n <= 2) return 1.0;

    double denom = 1.0 - r * r;
    if (denom <= 0) return 0.01;

    double t = std::abs(r * std::sqrt((n - 2) / denom));
    if (t > 3.0) return 0.01;
    if (t > 2.0) return 0.05;
    if (t > 1.7) return 0.10;
    return 0.20;
}

std::string CorrelationAnalyzer::strength(double r) {
    double a = std::abs(r);
    if (a >= 0.7) return "very strong";
    if (a >= 0.5) return "strong";
    if (a >= 0.3) return "moderate";
    if (a >= 0.2) return "weak";
    return "very weak";
}

std::string CorrelationAnalyzer::interpret(const std::string& metric, int lag, double r,
                                           int data_points) {
    std::string when;
    if (lag < 0) when = fmt::format("{} from {} day(s) earlier", metric, -lag);
    else if (lag > 0) when = fmt::format("{} {} day(s) later", metric, lag);
    else when = fmt::format("Same-day {}", metric);

    std::string text = fmt::format("{} shows a {} {} correlation with the objective readiness "
                                   "score (r = {:.2f}).",
                                   when, strength(r), r > 0 ? "positive" : "negative", r);

    double a = std::abs(r);
    if (a >= 0.5) {
        if (lag < 0) {
            text += fmt::format("\nChanges in {} likely affect physical state {} day(s) later.",
                                metric, -lag);
        } else if (lag > 0) {
            text += fmt::format("\nThe current physical state may predict {} {} day(s) ahead.",
                                metric, lag);
        } else {
            text += fmt::format("\n{} moves closely with physical state.", metric);
        }
    } else if (a >= 0.3) {
        text += "\nSome relationship exists, but other factors need to be considered.";
    } else {
        text += "\nThe statistical relationship is weak and the individual effect is limited.";
    }

    if (data_points < 30) {
        text += fmt::format("\n(Note: only {} data points; more data is recommended.)", data_points);
    }
    return text;
}

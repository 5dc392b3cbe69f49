#pragma once

#include "components.hpp"
#include "wellness.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

class ReadinessCalculator;

struct DetailedComponents {
    Components components;
    double objective;     // HRV + RHR + sleep
    double subjective;
    double total;
};

struct CorrelationResult {
    std::string metric;
    int optimal_lag = 0;          // < 0: metric leads, > 0: metric follows
    double correlation = 0.0;     // r at the optimal lag
    double p_value = 1.0;
    std::string strength;
    std::string interpretation;
    int data_points = 0;
    std::map<int, double> lag_correlations;
};

// Objective score of one day paired with that day's raw wellness record
struct ScoredDay {
    std::string date;
    double objective;
    WellnessRecord record;
};

class CorrelationAnalyzer {
public:
    explicit CorrelationAnalyzer(const ReadinessCalculator& calculator, int max_lag = 7);

    static DetailedComponents detail(const Components& components);

    std::vector<ScoredDay> score_days(const ScoringInput& input) const;

    // Every subjective metric present on at least 80% of the scored days,
    // strongest |r| first
    std::vector<CorrelationResult> analyze(const ScoringInput& input) const;
    static std::vector<CorrelationResult> analyze(const std::vector<ScoredDay>& days,
                                                  int max_lag);

    // Pearson r for lags -max_lag..+max_lag; lags with fewer than 3 aligned points are skipped
    static CorrelationResult time_lagged(const std::vector<double>& objective,
                                         const std::vector<double>& metric,
                                         const std::string& metric_name,
                                         int max_lag);

    // Coarse two-sided estimate from the t statistic
    static double p_value(double r, int n);
    static std::string strength(double r);

private:
    const ReadinessCalculator& calculator_;
    int max_lag_;

    static std::string interpret(const std::string& metric, int lag, double r, int data_points);
};

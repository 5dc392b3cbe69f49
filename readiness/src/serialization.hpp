#pragma once

#include "calculator.hpp"
#include "correlation.hpp"
#include "trend.hpp"
#include <nlohmann/json.hpp>
#include <vector>

class ResultSerializer {
public:
    static nlohmann::json to_json(const ReadinessResult& result);
    static nlohmann::json to_json(const TrendResult& trend);
    static nlohmann::json to_json(const CorrelationResult& correlation);
    static nlohmann::json to_json(const ReadinessWithTrend& combined);
    static nlohmann::json to_json(const std::vector<CorrelationResult>& correlations);

    // Custom-field update for the wellness platform
    static nlohmann::json wellness_update(const ReadinessResult& result, const TrendResult& trend);

private:
    static nlohmann::json modifier_json(const ModifierDecision& decision);
    static nlohmann::json components_json(const Components& c, const ComponentWeights& w);
    static nlohmann::json detailed_json(const DetailedComponents& d);
    static nlohmann::json diagnostics_json(const Diagnostics& d);
};

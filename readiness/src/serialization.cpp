#include "serialization.hpp"
#include "interpretation.hpp"
#include "util.hpp"

nlohmann::json ResultSerializer::modifier_json(const ModifierDecision& decision) {
    nlohmann::json j = {
        {"applied", decision.applied},
        {"value", util::round_to(decision.value, 3)}
    };
    if (!decision.reason.empty()) {
        j["reason"] = decision.reason;
    }
    return j;
}

nlohmann::json ResultSerializer::components_json(const Components& c, const ComponentWeights& w) {
    auto component = [](double score, double max_points) {
        return nlohmann::json{
            {"score", util::round_to(score, 1)},
            {"max", max_points},
            {"status", component_status(score, max_points)}
        };
    };

    return {
        {"hrv", component(c.hrv, w.hrv)},
        {"rhr", component(c.rhr, w.rhr)},
        {"sleep", component(c.sleep, w.sleep)},
        {"subjective", component(c.subjective, w.subjective)}
    };
}

nlohmann::json ResultSerializer::detailed_json(const DetailedComponents& d) {
    return {
        {"objective", util::round_to(d.objective, 1)},
        {"subjective", util::round_to(d.subjective, 1)},
        {"total", util::round_to(d.total, 1)}
    };
}

nlohmann::json ResultSerializer::diagnostics_json(const Diagnostics& d) {
    auto rating = [](const std::optional<int>& v) -> nlohmann::json {
        if (!v) return nullptr;
        return *v;
    };
    auto severity = [](const std::optional<Severity>& s) -> nlohmann::json {
        if (!s) return nullptr;
        return severity_to_string(*s);
    };

    return {
        {"baselines", {
            {"hrv", {
                {"mean60", d.baselines.hrv.long_mean},
                {"sd60", d.baselines.hrv.long_stddev},
                {"mean7", d.baselines.hrv.recent_mean},
                {"samples", d.baselines.hrv.sample_count},
                {"recent_samples", d.baselines.hrv.recent_count},
                {"valid", d.baselines.hrv.is_valid}
            }},
            {"rhr", {
                {"mean30", d.baselines.rhr.mean},
                {"sd30", d.baselines.rhr.stddev},
                {"samples", d.baselines.rhr.sample_count},
                {"valid", d.baselines.rhr.is_valid}
            }}
        }},
        {"hrv_z", d.hrv_z},
        {"parasympathetic_saturation", d.parasympathetic_saturation},
        {"sleep_debt_hours", util::round_to(d.sleep_debt_hours, 2)},
        {"subjective", {
            {"fatigue", rating(d.subjective.fatigue)},
            {"stress", rating(d.subjective.stress)},
            {"motivation", rating(d.subjective.motivation)},
            {"mood", rating(d.subjective.mood)},
            {"soreness", severity(d.subjective.soreness)},
            {"injury", severity(d.subjective.injury)},
            {"missing", d.missing_subjective}
        }}
    };
}

nlohmann::json ResultSerializer::to_json(const ReadinessResult& result) {
    const auto& zone = result.recommendation;

    nlohmann::json j = {
        {"date", result.date},
        {"score", result.score},
        {"base_score", util::round_to(result.base_score, 1)},
        {"readiness_level", result.readiness_level},
        {"components", components_json(result.components, result.weights)},
        {"detailed_components", detailed_json(CorrelationAnalyzer::detail(result.components))},
        {"modifiers", {
            {"alcohol", modifier_json(result.modifiers.alcohol)},
            {"soreness", modifier_json(result.modifiers.soreness)},
            {"motivation", modifier_json(result.modifiers.motivation)},
            {"sleep_debt", modifier_json(result.modifiers.sleep_debt)},
            {"injury", modifier_json(result.modifiers.injury)}
        }},
        {"multiplier", util::round_to(result.multiplier, 3)},
        {"recommendation", {
            {"zone", to_string(zone.zone)},
            {"name", zone.name},
            {"color", zone.color},
            {"description", zone.description},
            {"action", zone.action},
            {"approach", zone.approach},
            {"examples", zone.examples}
        }},
        {"data_quality", {
            {"hrv_days", result.data_quality.hrv_days},
            {"rhr_days", result.data_quality.rhr_days},
            {"confidence", to_string(result.data_quality.confidence)}
        }}
    };

    if (result.injury_cap) {
        j["injury_cap"] = *result.injury_cap;
    }
    if (!result.data_quality.message.empty()) {
        j["data_quality"]["message"] = result.data_quality.message;
    }
    if (result.diagnostics) {
        j["diagnostics"] = diagnostics_json(*result.diagnostics);
    }
    return j;
}

nlohmann::json ResultSerializer::to_json(const TrendResult& trend) {
    return {
        {"sufficient_data", trend.sufficient_data},
        {"data_points", trend.data_points},
        {"current_score", trend.current_score},
        {"momentum", {
            {"value", util::round_to(trend.momentum, 2)},
            {"category", to_string(trend.momentum_category)},
            {"strength", to_string(trend.momentum_strength)}
        }},
        {"volatility", {
            {"value", util::round_to(trend.volatility, 2)},
            {"level", to_string(trend.volatility_tier)},
            {"band_position", util::round_to(trend.band_position, 2)}
        }},
        {"trend_state", trend.state_label},
        {"trend_state_code", TrendInterpreter::state_code(trend.state)},
        {"trend_state_key", TrendInterpreter::state_key(trend.state)},
        {"confidence", to_string(trend.confidence)},
        {"interpretation", trend.interpretation}
    };
}

nlohmann::json ResultSerializer::to_json(const CorrelationResult& correlation) {
    nlohmann::json lags = nlohmann::json::object();
    for (const auto& [lag, r] : correlation.lag_correlations) {
        lags[std::to_string(lag)] = util::round_to(r, 3);
    }

    return {
        {"metric", correlation.metric},
        {"optimal_lag", correlation.optimal_lag},
        {"correlation", util::round_to(correlation.correlation, 3)},
        {"p_value", correlation.p_value},
        {"strength", correlation.strength},
        {"interpretation", correlation.interpretation},
        {"data_points", correlation.data_points},
        {"lag_correlations", lags}
    };
}

nlohmann::json ResultSerializer::to_json(const std::vector<CorrelationResult>& correlations) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& c : correlations) {
        arr.push_back(to_json(c));
    }
    return arr;
}

nlohmann::json ResultSerializer::to_json(const ReadinessWithTrend& combined) {
    auto j = to_json(combined.readiness);
    j["trend"] = to_json(combined.trend);
    return j;
}

nlohmann::json ResultSerializer::wellness_update(const ReadinessResult& result,
                                                 const TrendResult& trend) {
    return {
        {"readiness", result.score},
        {"UCRMomentum", util::round_to(trend.momentum, 1)},
        {"UCRVolatility", util::round_to(trend.volatility, 2)},
        {"UCRVolatilityLevel", to_string(trend.volatility_tier)},
        {"UCRVolatilityBandPosition", util::round_to(trend.band_position, 2)},
        {"UCRTrendState", TrendInterpreter::state_code(trend.state)},
        {"UCRTrendInterpretation", trend.interpretation}
    };
}

#include "config.hpp"
#include "calculator.hpp"
#include "correlation.hpp"
#include "errors.hpp"
#include "serialization.hpp"
#include "scoring_config.hpp"
#include "util.hpp"
#include "wellness.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <fstream>
#include <iostream>

void setup_logging(const std::string& log_level) {
    // stdout carries the JSON result
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("readiness", console_sink);

    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
    spdlog::debug("Logging initialized at level: {}", log_level);
}

nlohmann::json read_json_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("cannot open " + path);
    }
    return nlohmann::json::parse(in);
}

// An unusable override file is reported and the defaults are kept
ScoringConfig load_scoring_config(const std::string& path) {
    auto defaults = ScoringConfig::defaults();
    if (path.empty()) return defaults;

    try {
        auto overrides = read_json_file(path);
        auto cfg = defaults.with_overrides(overrides);
        spdlog::info("Loaded scoring overrides from {}", path);
        return cfg;
    } catch (const ConfigError& e) {
        spdlog::warn("{}; using default scoring config", e.what());
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Malformed scoring override {}: {}; using defaults", path, e.what());
    } catch (const std::runtime_error& e) {
        spdlog::warn("Scoring override unavailable: {}; using defaults", e.what());
    }
    return defaults;
}

int main(int argc, char** argv) {
    try {
        Config config = Config::from_env();
        setup_logging(config.log_level);
        config.validate();

        if (argc < 2) {
            spdlog::error("Usage: {} <input.json>", argv[0]);
            return 2;
        }

        auto raw = read_json_file(argv[1]);
        ScoringInput input = WellnessParser::parse_input(raw);

        // An inline "config" object takes precedence over READINESS_CONFIG
        ScoringConfig scoring = load_scoring_config(config.readiness_config_path);
        if (raw.contains("config")) {
            try {
                scoring = scoring.with_overrides(raw.at("config"));
            } catch (const ConfigError& e) {
                spdlog::warn("{}; ignoring inline override", e.what());
            }
        }

        ReadinessCalculator calculator(scoring);

        ScoreOptions options;
        options.include_diagnostics = config.include_diagnostics;

        spdlog::info("Scoring {} with {} historical records",
                     input.current.date, input.historical.size());

        ReadinessWithTrend combined;
        if (raw.contains("scores")) {
            std::vector<ScorePoint> series;
            for (const auto& p : raw.at("scores")) {
                series.push_back({p.at("date").get<std::string>(), p.at("score").get<double>()});
            }
            combined = calculator.score_with_trend(input, series, options);
        } else {
            combined = calculator.score_with_trend(input, options);
        }

        nlohmann::json out = ResultSerializer::to_json(combined);
        out["service"] = config.service_name;
        out["generated_at"] = util::current_iso8601();

        if (config.include_correlations) {
            CorrelationAnalyzer analyzer(calculator, config.correlation_max_lag);
            out["correlations"] = ResultSerializer::to_json(analyzer.analyze(input));
        }
        if (config.emit_wellness_update) {
            out["wellness_update"] = ResultSerializer::wellness_update(combined.readiness,
                                                                       combined.trend);
        }

        std::cout << out.dump(2) << std::endl;

        spdlog::info("Readiness {} for {} ({}), trend state {}",
                     combined.readiness.score, combined.readiness.date,
                     combined.readiness.recommendation.name, combined.trend.state_label);

    } catch (const ValidationError& e) {
        spdlog::error("{}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }

    return 0;
}

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/calculator.hpp"
#include "../src/errors.hpp"
#include "../src/serialization.hpp"
#include "fixtures.hpp"
#include <cmath>
#include <utility>

using Catch::Approx;

TEST_CASE("Readiness over a steady history", "[calculator]") {
    ReadinessCalculator calculator;
    auto result = calculator.score(fixtures::steady_input(60));

    SECTION("Components") {
        REQUIRE(result.components.hrv == Approx(40.0 / (1.0 + std::exp(-0.5))));
        REQUIRE(result.components.rhr == Approx(17.5));
        REQUIRE(result.components.sleep == Approx(12.0));
        REQUIRE(result.components.subjective == Approx(13.5));
        REQUIRE(result.base_score == Approx(67.898).epsilon(1e-4));
    }

    SECTION("Score and zone") {
        REQUIRE(result.score == 68);
        REQUIRE(result.date == fixtures::day(60));
        REQUIRE(result.recommendation.zone == TrainingZone::Moderate);
        REQUIRE(result.recommendation.color == "#FFA500");
        REQUIRE(result.readiness_level == "Moderate - Normal training appropriate");
        REQUIRE(result.multiplier == Approx(1.0));
        REQUIRE_FALSE(result.injury_cap.has_value());
    }

    SECTION("Data quality") {
        REQUIRE(result.data_quality.hrv_days == 60);
        REQUIRE(result.data_quality.rhr_days == 31);
        REQUIRE(result.data_quality.confidence == Confidence::High);
        REQUIRE(result.data_quality.message.empty());
    }

    SECTION("Diagnostics are opt-in") {
        REQUIRE_FALSE(result.diagnostics.has_value());

        ScoreOptions options;
        options.include_diagnostics = true;
        auto detailed = calculator.score(fixtures::steady_input(60), options);
        REQUIRE(detailed.diagnostics.has_value());
        REQUIRE(detailed.diagnostics->hrv_z == Approx(0.0).margin(1e-9));
        REQUIRE_FALSE(detailed.diagnostics->parasympathetic_saturation);
        REQUIRE(detailed.diagnostics->missing_subjective == 2);
        REQUIRE(detailed.diagnostics->baselines.hrv.sample_count == 60);
        REQUIRE(detailed.score == result.score);
    }
}

TEST_CASE("Modifiers flow into the final score", "[calculator]") {
    ReadinessCalculator calculator;

    SECTION("Heavy alcohol") {
        auto input = fixtures::steady_input(60);
        input.current.alcohol = 2;
        auto result = calculator.score(input);
        REQUIRE(result.score == 41);
        REQUIRE(result.modifiers.alcohol.applied);
        REQUIRE(result.recommendation.zone == TrainingZone::Low);
    }

    SECTION("Injury keeps the score under its ceiling") {
        auto input = fixtures::steady_input(60);
        input.current.injury = 4;
        auto result = calculator.score(input);
        REQUIRE(result.score <= 30);
        REQUIRE(result.injury_cap.has_value());
    }

    SECTION("Clipped sleep score") {
        auto input = fixtures::steady_input(60);
        input.current.sleep_score = 140.0;
        REQUIRE(calculator.score(input).components.sleep == Approx(15.0));
    }
}

TEST_CASE("Required fields are validated together", "[calculator]") {
    ReadinessCalculator calculator;
    ScoringInput input;
    input.current.rhr = -1.0;

    try {
        calculator.score(input);
        FAIL("expected ValidationError");
    } catch (const ValidationError& e) {
        REQUIRE(e.errors().size() == 3);
        REQUIRE(e.has_field("date"));
        REQUIRE(e.has_field("hrv"));
        REQUIRE(e.has_field("rhr"));
        REQUIRE(std::string(e.what()).find("Validation failed") == 0);
    }

    SECTION("Malformed date") {
        auto steady = fixtures::steady_input(10);
        steady.current.date = "2024-13-01";
        REQUIRE_THROWS_AS(calculator.score(steady), ValidationError);
    }
}

TEST_CASE("Short history scores physiology as neutral", "[calculator]") {
    ReadinessCalculator calculator;

    auto short_input = [](double hrv, double rhr) {
        auto input = fixtures::steady_input(3);
        for (auto& rec : input.historical) {
            rec.hrv = hrv;
            rec.rhr = rhr;
        }
        input.current.hrv = hrv;
        input.current.rhr = rhr;
        return input;
    };

    ScoreOptions options;
    options.include_diagnostics = true;

    const std::vector<std::pair<double, double>> readings = {
        {25.0, 45.0}, {40.0, 65.0}, {100.0, 55.0}
    };
    for (const auto& [hrv, rhr] : readings) {
        auto result = calculator.score(short_input(hrv, rhr), options);

        REQUIRE_FALSE(result.diagnostics->baselines.hrv.is_valid);
        REQUIRE_FALSE(result.diagnostics->baselines.rhr.is_valid);
        REQUIRE_FALSE(result.diagnostics->parasympathetic_saturation);
        REQUIRE(result.components.hrv == Approx(40.0 / (1.0 + std::exp(-0.5))));
        REQUIRE(result.components.rhr == Approx(17.5));
        REQUIRE(result.score == 68);
        REQUIRE(result.recommendation.zone == TrainingZone::Moderate);
        REQUIRE(result.data_quality.confidence == Confidence::Low);
    }
}

TEST_CASE("Data quality confidence", "[calculator]") {
    ReadinessCalculator calculator;

    auto medium = calculator.score(fixtures::steady_input(40)).data_quality;
    REQUIRE(medium.confidence == Confidence::Medium);
    REQUIRE_FALSE(medium.message.empty());

    auto low = calculator.score(fixtures::steady_input(20)).data_quality;
    REQUIRE(low.confidence == Confidence::Low);
    REQUIRE(low.hrv_days == 20);
    REQUIRE(low.rhr_days == 21);
}

TEST_CASE("Scoring is deterministic", "[calculator]") {
    ReadinessCalculator calculator;
    auto input = fixtures::steady_input(60);
    input.current.alcohol = 1;
    input.current.soreness = 2;

    ScoreOptions options;
    options.include_diagnostics = true;
    auto first = ResultSerializer::to_json(calculator.score(input, options)).dump();
    auto second = ResultSerializer::to_json(calculator.score(input, options)).dump();
    REQUIRE(first == second);
}

TEST_CASE("Better sleep never lowers the score", "[calculator]") {
    ReadinessCalculator calculator;
    int prev = -1;
    for (double sleep : {20.0, 40.0, 60.0, 80.0, 100.0}) {
        auto input = fixtures::steady_input(60);
        input.current.sleep_score = sleep;
        int score = calculator.score(input).score;
        REQUIRE(score >= prev);
        prev = score;
    }
}

TEST_CASE("Zone recommendation boundaries", "[calculator]") {
    ZoneConfig zones;
    REQUIRE(ReadinessCalculator::recommend(85, zones).zone == TrainingZone::Prime);
    REQUIRE(ReadinessCalculator::recommend(84, zones).zone == TrainingZone::Moderate);
    REQUIRE(ReadinessCalculator::recommend(65, zones).zone == TrainingZone::Moderate);
    REQUIRE(ReadinessCalculator::recommend(64, zones).zone == TrainingZone::Low);
    REQUIRE(ReadinessCalculator::recommend(100, zones).color == "#4CAF50");
    REQUIRE(to_string(TrainingZone::Low) == "Low");
}

TEST_CASE("Invalid configuration is refused", "[calculator]") {
    auto cfg = ScoringConfig::defaults();
    cfg.weights.hrv = 10.0;
    REQUIRE_THROWS_AS(ReadinessCalculator(cfg), ConfigError);
}

TEST_CASE("Score history", "[calculator]") {
    ReadinessCalculator calculator;
    auto input = fixtures::steady_input(60);

    SECTION("One result per day in the window, oldest first") {
        auto history = calculator.score_history(input, 90);
        REQUIRE(history.size() == 61);
        REQUIRE(history.front().date == fixtures::day(0));
        REQUIRE(history.back().date == fixtures::day(60));
        REQUIRE(history.back().score == 68);
    }

    SECTION("Window limits the days scored") {
        REQUIRE(calculator.score_history(input, 10).size() == 11);
    }

    SECTION("Days that fail validation are skipped") {
        input.historical[30] = fixtures::record(30, std::nullopt, std::nullopt, 80.0);
        REQUIRE(calculator.score_history(input, 90).size() == 60);
    }
}

TEST_CASE("Readiness with trend", "[calculator]") {
    ReadinessCalculator calculator;
    auto input = fixtures::steady_input(60);

    SECTION("Trend from the scored history") {
        auto combined = calculator.score_with_trend(input);
        REQUIRE(combined.readiness.score == 68);
        REQUIRE(combined.trend.sufficient_data);
        REQUIRE(combined.trend.data_points == 61);
        REQUIRE(combined.trend.current_score == Approx(68.0));
    }

    SECTION("Fast path appends today's score") {
        std::vector<ScorePoint> series;
        for (int i = 40; i < 60; i++) series.push_back({fixtures::day(i), 68.0});

        auto combined = calculator.score_with_trend(input, series);
        REQUIRE(combined.trend.data_points == 21);
        REQUIRE(combined.trend.current_score == Approx(68.0));
    }

    SECTION("Fast path keeps an existing point for today") {
        std::vector<ScorePoint> series;
        for (int i = 41; i <= 60; i++) series.push_back({fixtures::day(i), 68.0});
        series.back().score = 50.0;

        auto combined = calculator.score_with_trend(input, series);
        REQUIRE(combined.trend.data_points == 20);
        REQUIRE(combined.trend.current_score == Approx(50.0));
        REQUIRE(combined.readiness.score == 68);
    }

    SECTION("Fast path matches today by day, ignoring a time suffix") {
        auto short_input = fixtures::steady_input(20);
        std::vector<ScorePoint> series;
        for (int i = 0; i <= 20; i++) series.push_back({fixtures::day(i) + "T00:00:00", 60.0});

        auto combined = calculator.score_with_trend(short_input, series);
        REQUIRE(combined.readiness.score == 68);
        REQUIRE(combined.trend.data_points == 21);
        REQUIRE(combined.trend.current_score == Approx(60.0));
        REQUIRE(combined.trend.momentum == 0.0);
    }
}

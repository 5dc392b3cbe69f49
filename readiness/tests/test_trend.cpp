#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/trend.hpp"
#include "../src/calculator.hpp"
#include "fixtures.hpp"
#include <algorithm>

using Catch::Approx;

namespace {

std::vector<ScorePoint> series_of(const std::vector<double>& scores) {
    std::vector<ScorePoint> series;
    for (size_t i = 0; i < scores.size(); i++) {
        series.push_back({fixtures::day(static_cast<int>(i)), scores[i]});
    }
    return series;
}

std::string last_day(const std::vector<ScorePoint>& series) {
    return series.back().date;
}

bool starts_with(const std::string& text, const std::string& prefix) {
    return text.rfind(prefix, 0) == 0;
}

}

TEST_CASE("Momentum over the lookback", "[trend]") {
    auto series = series_of({50, 52, 54, 56, 58, 60, 62, 64, 66});
    REQUIRE(TrendAnalyzer::momentum(series, 7) == Approx((66.0 - 52.0) / 52.0 * 100.0));

    SECTION("Short series compares with the first point") {
        REQUIRE(TrendAnalyzer::momentum(series_of({50, 60}), 7) == Approx(20.0));
    }

    SECTION("Zero past score gives zero momentum") {
        REQUIRE(TrendAnalyzer::momentum(series_of({0, 10, 20, 30, 40, 50, 60, 70}), 7) == 0.0);
    }

    SECTION("Single point has no momentum") {
        REQUIRE(TrendAnalyzer::momentum(series_of({70}), 7) == 0.0);
    }
}

TEST_CASE("Volatility series", "[trend]") {
    SECTION("Needs one more point than the period") {
        REQUIRE(TrendAnalyzer::volatility_series(series_of(std::vector<double>(14, 70.0)), 14).empty());
        REQUIRE(TrendAnalyzer::volatility_series(series_of(std::vector<double>(15, 70.0)), 14).size() == 14);
    }

    SECTION("Smooths absolute day-to-day changes") {
        auto vol = TrendAnalyzer::volatility_series(series_of({70, 60, 70}), 1);
        REQUIRE(vol.size() == 2);
        REQUIRE(vol[0] == Approx(10.0));
        REQUIRE(vol[1] == Approx(10.0));
    }

    SECTION("Fewer values than the envelope period stay moderate") {
        TrendConfig cfg;
        auto reading = TrendAnalyzer::classify_volatility({1.0, 5.0, 9.0}, cfg);
        REQUIRE(reading.value == Approx(9.0));
        REQUIRE(reading.tier == VolatilityTier::Moderate);
        REQUIRE(reading.band_position == 0.0);
    }
}

TEST_CASE("Trend confidence by data points", "[trend]") {
    REQUIRE(TrendAnalyzer::confidence_for(30) == Confidence::High);
    REQUIRE(TrendAnalyzer::confidence_for(29) == Confidence::Medium);
    REQUIRE(TrendAnalyzer::confidence_for(15) == Confidence::Medium);
    REQUIRE(TrendAnalyzer::confidence_for(14) == Confidence::Low);
}

TEST_CASE("Trend analysis of score series", "[trend]") {
    ReadinessCalculator calculator;
    TrendAnalyzer analyzer(calculator);

    SECTION("Flat series is balanced") {
        auto series = series_of(std::vector<double>(30, 70.0));
        auto trend = analyzer.analyze(series, last_day(series));

        REQUIRE(trend.sufficient_data);
        REQUIRE(trend.momentum == 0.0);
        REQUIRE(trend.volatility == Approx(0.0).margin(1e-12));
        REQUIRE(trend.volatility_tier == VolatilityTier::Moderate);
        REQUIRE(trend.state == TrendState::Balanced);
        REQUIRE(trend.confidence == Confidence::High);
        REQUIRE(starts_with(trend.interpretation, "[Typical balance]"));
    }

    SECTION("Too few points") {
        auto series = series_of({50, 58, 51, 60, 52, 61, 53, 62, 54, 70});
        auto trend = analyzer.analyze(series, last_day(series));

        REQUIRE_FALSE(trend.sufficient_data);
        REQUIRE(trend.data_points == 10);
        REQUIRE(trend.momentum == 0.0);
        REQUIRE(trend.volatility == 0.0);
        REQUIRE(trend.band_position == 0.0);
        REQUIRE(trend.state == TrendState::Balanced);
        REQUIRE(trend.confidence == Confidence::Low);
        REQUIRE(starts_with(trend.interpretation, "Insufficient data for trend analysis"));
    }

    SECTION("Rising high scores are peaking") {
        std::vector<double> scores;
        for (int s = 60; s < 90; s++) scores.push_back(s);
        auto series = series_of(scores);
        auto trend = analyzer.analyze(series, last_day(series));

        REQUIRE(trend.state == TrendState::Peaking);
        REQUIRE(trend.momentum_category == MomentumCategory::Positive);
        REQUIRE(trend.volatility == Approx(1.0));
        REQUIRE(trend.confidence == Confidence::High);
        REQUIRE(starts_with(trend.interpretation, "[Good peaking]"));
    }

    SECTION("Falling low scores are acute maladaptation") {
        std::vector<double> scores;
        for (int s = 89; s >= 60; s--) scores.push_back(s);
        auto series = series_of(scores);
        auto trend = analyzer.analyze(series, last_day(series));

        REQUIRE(trend.state == TrendState::AcuteMaladaptation);
        REQUIRE(trend.momentum_strength == MomentumStrength::StrongNegative);
        REQUIRE(starts_with(trend.interpretation, "[Ongoing deterioration]"));
    }

    SECTION("Sudden jump is high volatility") {
        std::vector<double> scores(35, 70.0);
        scores.push_back(90.0);
        auto series = series_of(scores);
        auto trend = analyzer.analyze(series, last_day(series));

        REQUIRE(trend.volatility_tier == VolatilityTier::High);
        REQUIRE(trend.band_position == Approx(2.0));
        REQUIRE(trend.state == TrendState::Peaking);
        REQUIRE(starts_with(trend.interpretation, "[Unstable peak]"));
    }

    SECTION("Points are ordered by date and filtered by the target") {
        auto series = series_of(std::vector<double>(20, 70.0));
        std::reverse(series.begin(), series.end());
        series.push_back({fixtures::day(25), 10.0});    // after the target date
        series.push_back({"not-a-date", 10.0});

        auto trend = analyzer.analyze(series, fixtures::day(19));
        REQUIRE(trend.data_points == 20);
        REQUIRE(trend.current_score == Approx(70.0));
    }

    SECTION("Same-day points collapse to the last one given") {
        auto series = series_of(std::vector<double>(20, 70.0));
        series.push_back({fixtures::day(19) + "T18:30:00", 40.0});
        series.push_back({fixtures::day(5) + "T07:00:00", 55.0});

        auto trend = analyzer.analyze(series, fixtures::day(19));
        REQUIRE(trend.data_points == 20);
        REQUIRE(trend.current_score == Approx(40.0));
    }

    SECTION("Points older than the window are dropped") {
        auto series = series_of(std::vector<double>(100, 70.0));
        auto trend = analyzer.analyze(series, last_day(series));
        REQUIRE(trend.data_points == 91);
    }
}

TEST_CASE("Calm day after a choppy stretch is low volatility", "[trend]") {
    auto cfg = ScoringConfig::defaults().with_overrides(
        nlohmann::json::parse(R"({"trend": {"volatility_period": 1}})"));
    ReadinessCalculator calculator(cfg);
    TrendAnalyzer analyzer(calculator);

    std::vector<double> scores;
    for (int i = 0; i < 22; i++) scores.push_back(i % 2 == 0 ? 60.0 : 70.0);
    scores.push_back(70.0);
    auto series = series_of(scores);

    auto trend = analyzer.analyze(series, last_day(series));
    REQUIRE(trend.volatility == Approx(0.0).margin(1e-12));
    REQUIRE(trend.volatility_tier == VolatilityTier::Low);
    REQUIRE(trend.band_position == Approx(-2.0));
    REQUIRE(trend.state == TrendState::Balanced);
    REQUIRE(trend.confidence == Confidence::Medium);
    REQUIRE(starts_with(trend.interpretation, "[Stable baseline]"));
}

TEST_CASE("Trend from a wellness history", "[trend]") {
    ReadinessCalculator calculator;
    TrendAnalyzer analyzer(calculator);
    auto input = fixtures::steady_input(60);

    auto series = analyzer.build_series(input);
    REQUIRE(series.size() == 61);
    REQUIRE(series.back().date == fixtures::day(60));

    auto trend = analyzer.analyze(input);
    REQUIRE(trend.data_points == 61);
    REQUIRE(trend.current_score == Approx(68.0));
    REQUIRE(trend.momentum == Approx(0.0).margin(1e-9));
    REQUIRE(trend.state == TrendState::Balanced);
    REQUIRE(trend.confidence == Confidence::High);
}

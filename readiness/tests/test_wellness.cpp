#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/wellness.hpp"
#include "../src/util.hpp"
#include <stdexcept>

using Catch::Approx;

TEST_CASE("Date helpers", "[util]") {
    SECTION("Days between dates across a leap day") {
        auto a = util::parse_date_days("2024-02-28");
        auto b = util::parse_date_days("2024-03-01");
        REQUIRE(a.has_value());
        REQUIRE(b.has_value());
        REQUIRE(*b - *a == 2);
    }

    SECTION("Epoch and formatting") {
        REQUIRE(util::parse_date_days("1970-01-01") == 0);
        REQUIRE(util::format_date_days(*util::parse_date_days("2023-12-31")) == "2023-12-31");
    }

    SECTION("Time suffix is ignored") {
        REQUIRE(util::parse_date_days("2024-05-10T06:30:00") == util::parse_date_days("2024-05-10"));
    }

    SECTION("Invalid dates are rejected") {
        REQUIRE_FALSE(util::parse_date_days("2024-02-30").has_value());
        REQUIRE_FALSE(util::parse_date_days("2023-02-29").has_value());
        REQUIRE_FALSE(util::parse_date_days("24-01-01").has_value());
        REQUIRE_FALSE(util::parse_date_days("2024/01/01").has_value());
        REQUIRE_FALSE(util::parse_date_days("").has_value());
    }

    SECTION("Rounding") {
        REQUIRE(util::round_to(3.14159, 1) == Approx(3.1));
        REQUIRE(util::round_to(2.675, 0) == Approx(3.0));
    }
}

TEST_CASE("Parse wellness records", "[wellness]") {
    SECTION("Platform camelCase export") {
        auto raw = nlohmann::json::parse(R"({
            "id": "2024-06-01", "hrv": 52.5, "restingHR": 48, "sleepScore": 82,
            "sleepSecs": 27000, "fatigue": 2, "stress": 1, "motivation": 3,
            "mood": 2, "soreness": 1, "injury": 1, "sleepQuality": 2
        })");

        auto rec = WellnessParser::parse_record(raw);
        REQUIRE(rec.date == "2024-06-01");
        REQUIRE(rec.hrv.value() == Approx(52.5));
        REQUIRE(rec.rhr.value() == Approx(48.0));
        REQUIRE(rec.sleep_score.value() == Approx(82.0));
        REQUIRE(rec.sleep_hours.value() == Approx(7.5));
        REQUIRE(rec.fatigue == 2);
        REQUIRE(rec.motivation == 3);
        REQUIRE(rec.sleep_quality == 2);
        REQUIRE(rec.alcohol == 0);
    }

    SECTION("snake_case keys") {
        auto raw = nlohmann::json::parse(R"({
            "date": "2024-06-02", "rhr": 51, "sleep_score": 70, "sleep_hours": 6.5,
            "sleep_quality": 3, "alcohol": 1
        })");

        auto rec = WellnessParser::parse_record(raw);
        REQUIRE(rec.date == "2024-06-02");
        REQUIRE_FALSE(rec.hrv.has_value());
        REQUIRE(rec.rhr.value() == Approx(51.0));
        REQUIRE(rec.sleep_hours.value() == Approx(6.5));
        REQUIRE(rec.sleep_quality == 3);
        REQUIRE(rec.alcohol == 1);
    }

    SECTION("Null fields are absent") {
        auto rec = WellnessParser::parse_record(
            nlohmann::json::parse(R"({"date": "2024-06-03", "hrv": null, "fatigue": null})"));
        REQUIRE_FALSE(rec.hrv.has_value());
        REQUIRE_FALSE(rec.fatigue.has_value());
        REQUIRE_FALSE(rec.has_objective_data());
    }

    SECTION("Fractional ratings round to the nearest step") {
        auto rec = WellnessParser::parse_record(
            nlohmann::json::parse(R"({"date": "2024-06-03", "mood": 2.4, "stress": 2.6})"));
        REQUIRE(rec.mood == 2);
        REQUIRE(rec.stress == 3);
    }

    SECTION("Ratings beyond the integer range are absent") {
        auto rec = WellnessParser::parse_record(
            nlohmann::json::parse(R"({"date": "2024-06-03", "mood": 1e20, "stress": -1e20, "alcohol": 1e20})"));
        REQUIRE_FALSE(rec.mood.has_value());
        REQUIRE_FALSE(rec.stress.has_value());
        REQUIRE(rec.alcohol == 0);
    }

    SECTION("Wrong types are rejected") {
        REQUIRE_THROWS_AS(WellnessParser::parse_record(
            nlohmann::json::parse(R"({"date": "2024-06-03", "hrv": "high"})")),
            std::invalid_argument);
        REQUIRE_THROWS_AS(WellnessParser::parse_record(nlohmann::json::array()),
                          std::invalid_argument);
    }
}

TEST_CASE("Parse scoring input", "[wellness]") {
    SECTION("Current and historical records") {
        auto raw = nlohmann::json::parse(R"({
            "current": {"date": "2024-06-03", "hrv": 50, "rhr": 49},
            "historical": [
                {"date": "2024-06-01", "hrv": 48, "rhr": 50},
                {"date": "2024-06-02", "hrv": 47, "rhr": 51}
            ]
        })");

        auto input = WellnessParser::parse_input(raw);
        REQUIRE(input.current.date == "2024-06-03");
        REQUIRE(input.historical.size() == 2);
        REQUIRE(input.historical[1].rhr.value() == Approx(51.0));
    }

    SECTION("Historical data is optional") {
        auto input = WellnessParser::parse_input(
            nlohmann::json::parse(R"({"current": {"date": "2024-06-03"}})"));
        REQUIRE(input.historical.empty());
    }

    SECTION("Missing current record is rejected") {
        REQUIRE_THROWS_AS(WellnessParser::parse_input(nlohmann::json::parse(R"({"historical": []})")),
                          std::invalid_argument);
    }

    SECTION("Historical data must be an array") {
        REQUIRE_THROWS_AS(WellnessParser::parse_input(
            nlohmann::json::parse(R"({"current": {}, "historical": {}})")),
            std::invalid_argument);
    }
}

TEST_CASE("Objective data detection", "[wellness]") {
    WellnessRecord rec;
    rec.date = "2024-06-03";
    REQUIRE_FALSE(rec.has_objective_data());

    rec.sleep_hours = 7.0;
    REQUIRE(rec.has_objective_data());

    WellnessRecord zero_hrv;
    zero_hrv.hrv = 0.0;
    REQUIRE_FALSE(zero_hrv.has_objective_data());
}

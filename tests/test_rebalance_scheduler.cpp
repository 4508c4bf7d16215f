// SPDX-License-Identifier: MIT
#include <catch2/catch.hpp>
#include "backtest/rebalance_scheduler.hpp"
#include "model/errors.hpp"
#include <nlohmann/json.hpp>

using namespace convexfolio;
using namespace convexfolio::backtest;

namespace {

RebalanceScheduler make_scheduler(RebalanceFrequency frequency) {
    RebalanceConfig cfg;
    cfg.frequency = frequency;
    return RebalanceScheduler(cfg);
}

} // namespace

TEST_CASE("RebalanceScheduler calendar triggers", "[RebalanceScheduler]") {
    SECTION("Every period") {
        auto s = make_scheduler(RebalanceFrequency::EVERY_PERIOD);
        REQUIRE(s.is_calendar_trigger("2022-02-01", "2022-02-02"));
    }

    SECTION("Weekly: Monday opens a new week") {
        auto s = make_scheduler(RebalanceFrequency::WEEKLY);
        // 2021-10-29 is a Friday, 2021-11-01 a Monday, 2021-11-07 a Sunday
        REQUIRE(s.is_calendar_trigger("2021-10-29", "2021-11-01"));
        REQUIRE(!s.is_calendar_trigger("2021-11-01", "2021-11-03"));
        REQUIRE(!s.is_calendar_trigger("2021-11-01", "2021-11-07"));
        REQUIRE(s.is_calendar_trigger("2021-11-07", "2021-11-08"));
    }

    SECTION("Monthly") {
        auto s = make_scheduler(RebalanceFrequency::MONTHLY);
        REQUIRE(s.is_calendar_trigger("2021-10-29", "2021-11-01"));
        REQUIRE(!s.is_calendar_trigger("2021-11-01", "2021-11-15"));
        REQUIRE(s.is_calendar_trigger("2021-11-30", "2022-11-01"));
    }

    SECTION("Quarterly") {
        auto s = make_scheduler(RebalanceFrequency::QUARTERLY);
        REQUIRE(s.is_calendar_trigger("2021-12-31", "2022-01-03"));
        REQUIRE(!s.is_calendar_trigger("2022-01-03", "2022-03-31"));
        REQUIRE(s.is_calendar_trigger("2022-03-31", "2022-04-01"));
    }

    SECTION("Annually") {
        auto s = make_scheduler(RebalanceFrequency::ANNUALLY);
        REQUIRE(s.is_calendar_trigger("2021-12-31", "2022-01-03"));
        REQUIRE(!s.is_calendar_trigger("2022-01-03", "2022-12-30"));
    }
}

TEST_CASE("RebalanceScheduler schedule over a sample", "[RebalanceScheduler]") {
    const std::vector<std::string> dates = {
        "2024-01-29", "2024-01-30", "2024-02-01", "2024-02-05",
        "2024-03-28", "2024-04-02", "2024-12-31", "2025-01-02"
    };

    SECTION("Every period returns every row") {
        auto rows = make_scheduler(RebalanceFrequency::EVERY_PERIOD).schedule(dates);
        REQUIRE(rows == std::vector<size_t>{0, 1, 2, 3, 4, 5, 6, 7});
    }

    SECTION("First observation always opens a period") {
        auto rows = make_scheduler(RebalanceFrequency::ANNUALLY).schedule(dates);
        REQUIRE(rows == std::vector<size_t>{0, 7});
    }

    SECTION("Monthly") {
        auto rows = make_scheduler(RebalanceFrequency::MONTHLY).schedule(dates);
        REQUIRE(rows == std::vector<size_t>{0, 2, 4, 5, 6, 7});
    }

    SECTION("Quarterly") {
        auto rows = make_scheduler(RebalanceFrequency::QUARTERLY).schedule(dates);
        REQUIRE(rows == std::vector<size_t>{0, 5, 6, 7});
    }

    SECTION("Weekly") {
        // 2024-01-29 and 2024-02-05 are Mondays
        auto rows = make_scheduler(RebalanceFrequency::WEEKLY).schedule(dates);
        REQUIRE(rows == std::vector<size_t>{0, 3, 4, 5, 6});
    }

    SECTION("Empty sample") {
        REQUIRE(make_scheduler(RebalanceFrequency::MONTHLY).schedule({}).empty());
    }

    SECTION("Malformed date") {
        REQUIRE_THROWS_AS(make_scheduler(RebalanceFrequency::MONTHLY).schedule({"2024-01-29", "2024/02/01"}),
                          ValidationError);
    }
}

TEST_CASE("RebalanceScheduler date validation", "[RebalanceScheduler]") {
    REQUIRE(RebalanceScheduler::is_valid_date("2024-02-29"));
    REQUIRE(!RebalanceScheduler::is_valid_date("2024-13-01"));
    REQUIRE(!RebalanceScheduler::is_valid_date("2024-00-10"));
    REQUIRE(!RebalanceScheduler::is_valid_date("2024-1-01"));
    REQUIRE(!RebalanceScheduler::is_valid_date("20240101"));
    REQUIRE(!RebalanceScheduler::is_valid_date("abcd-ef-gh"));
}

TEST_CASE("RebalanceConfig parsing", "[RebalanceScheduler]") {
    REQUIRE(RebalanceConfig::parse_frequency("daily") == RebalanceFrequency::EVERY_PERIOD);
    REQUIRE(RebalanceConfig::parse_frequency("every_period") == RebalanceFrequency::EVERY_PERIOD);
    REQUIRE(RebalanceConfig::parse_frequency("W") == RebalanceFrequency::WEEKLY);
    REQUIRE(RebalanceConfig::parse_frequency("Monthly") == RebalanceFrequency::MONTHLY);
    REQUIRE(RebalanceConfig::parse_frequency("q") == RebalanceFrequency::QUARTERLY);
    REQUIRE(RebalanceConfig::parse_frequency("yearly") == RebalanceFrequency::ANNUALLY);
    REQUIRE_THROWS_AS(RebalanceConfig::parse_frequency("fortnightly"), ValidationError);

    REQUIRE(to_string(RebalanceFrequency::QUARTERLY) == "quarterly");
    REQUIRE(RebalanceConfig::from_string("annual").frequency == RebalanceFrequency::ANNUALLY);

    SECTION("From JSON") {
        auto j = nlohmann::json::parse(R"({"frequency": "weekly"})");
        REQUIRE(RebalanceConfig::from_json(j).frequency == RebalanceFrequency::WEEKLY);
        REQUIRE(RebalanceConfig::from_json(nlohmann::json::object()).frequency == RebalanceFrequency::MONTHLY);
    }
}

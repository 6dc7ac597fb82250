#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cloudspend/cost_types.h>
#include <cloudspend/errors.h>
#include <limits>

using namespace cloudspend;
using Catch::Matchers::WithinAbs;

TEST_CASE("Date - Parse and format", "[date]") {
    Date d = Date::Parse("2024-02-29");
    REQUIRE(d.Year() == 2024);
    REQUIRE(d.Month() == 2u);
    REQUIRE(d.Day() == 29u);
    REQUIRE(d.ToString() == "2024-02-29");

    SECTION("Rejects malformed text") {
        REQUIRE_THROWS_AS(Date::Parse("2024-2-29"), InvalidInputError);
        REQUIRE_THROWS_AS(Date::Parse("2024/02/29"), InvalidInputError);
        REQUIRE_THROWS_AS(Date::Parse("2024-02-29T00"), InvalidInputError);
        REQUIRE_THROWS_AS(Date::Parse(""), InvalidInputError);
    }

    SECTION("Rejects impossible dates") {
        REQUIRE_THROWS_AS(Date::Parse("2023-02-29"), InvalidInputError);
        REQUIRE_THROWS_AS(Date::Parse("2024-13-01"), InvalidInputError);
        REQUIRE_THROWS_AS(Date(2024, 4, 31), InvalidInputError);
    }
}

TEST_CASE("Date - Day arithmetic", "[date]") {
    Date d(2023, 12, 30);
    REQUIRE(d.AddDays(3).ToString() == "2024-01-02");
    REQUIRE(d.AddDays(-365).ToString() == "2022-12-30");
    REQUIRE(Date::DaysBetween(Date(2024, 1, 1), Date(2024, 3, 1)) == 60);
    REQUIRE(Date::DaysBetween(Date(2024, 3, 1), Date(2024, 1, 1)) == -60);
    REQUIRE(Date::FromDayNumber(0) == Date(1970, 1, 1));
    REQUIRE(Date(2024, 1, 1) < Date(2024, 1, 2));
}

TEST_CASE("Cost series - Validation", "[series]") {
    Date start(2024, 5, 1);

    SECTION("Gaps are allowed") {
        CostSeries series = {{start, 1.0}, {start.AddDays(3), 2.0}};
        REQUIRE_NOTHROW(ValidateSeries(series));
    }

    SECTION("Duplicate dates") {
        CostSeries series = {{start, 1.0}, {start, 2.0}};
        REQUIRE_THROWS_AS(ValidateSeries(series), InvalidInputError);
    }

    SECTION("Descending dates") {
        CostSeries series = {{start.AddDays(1), 1.0}, {start, 2.0}};
        REQUIRE_THROWS_AS(ValidateSeries(series), InvalidInputError);
    }

    SECTION("Negative or non-finite amounts") {
        REQUIRE_THROWS_AS(ValidateSeries({{start, -0.01}}), InvalidInputError);
        REQUIRE_THROWS_AS(ValidateSeries({{start, std::numeric_limits<double>::quiet_NaN()}}),
                          InvalidInputError);
    }
}

TEST_CASE("Service breakdown - Top services and merge", "[series][services]") {
    ServiceBreakdown breakdown = {
        {"Amazon S3", 25.0},
        {"Amazon EC2", 50.0},
        {"AWS Lambda", 25.0},
    };

    auto top = TopServices(breakdown);
    REQUIRE(top.size() == 3);
    REQUIRE(top[0].service == "Amazon EC2");
    REQUIRE_THAT(top[0].share_pct, WithinAbs(50.0, 1e-12));
    // Ties ordered by name
    REQUIRE(top[1].service == "AWS Lambda");
    REQUIRE(top[2].service == "Amazon S3");

    REQUIRE(TopServices(breakdown, 1).size() == 1);

    auto merged = MergeBreakdowns({breakdown, {{"Amazon EC2", 10.0}, {"NAT Gateway", 5.0}}});
    REQUIRE(merged.at("Amazon EC2") == 60.0);
    REQUIRE(merged.at("NAT Gateway") == 5.0);

    REQUIRE_THROWS_AS(ValidateBreakdown({{"", 1.0}}), InvalidInputError);
    REQUIRE_THROWS_AS(ValidateBreakdown({{"Amazon EC2", -1.0}}), InvalidInputError);
}

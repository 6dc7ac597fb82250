#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "data/csv_cost_data_provider.h"
#include <cloudspend/errors.h>
#include <chrono>
#include <filesystem>
#include <fstream>

using namespace cloudspend;
using namespace cloudspend::analyzer::data;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("CsvCostDataProvider - Parse daily costs", "[csv]") {
    SECTION("Header, comments and blank lines") {
        auto series = CsvCostDataProvider::ParseDailyCosts(
            "date,amount\n"
            "# exported 2024-03-04\n"
            "\n"
            "2024-03-01,100.50\r\n"
            "\"2024-03-02\",\"110.25\"\n"
            "2024-03-03, 95\n");

        REQUIRE(series.size() == 3);
        REQUIRE(series[0].date == Date(2024, 3, 1));
        REQUIRE_THAT(series[0].amount, WithinAbs(100.50, 1e-12));
        REQUIRE_THAT(series[1].amount, WithinAbs(110.25, 1e-12));
        REQUIRE_THAT(series[2].amount, WithinAbs(95.0, 1e-12));
    }

    SECTION("No header") {
        auto series = CsvCostDataProvider::ParseDailyCosts("2024-03-01,1\n2024-03-02,2\n");
        REQUIRE(series.size() == 2);
    }

    SECTION("Unsorted rows are sorted") {
        auto series = CsvCostDataProvider::ParseDailyCosts(
            "2024-03-03,3\n2024-03-01,1\n2024-03-02,2\n");
        REQUIRE(series[0].date == Date(2024, 3, 1));
        REQUIRE(series[2].date == Date(2024, 3, 3));
    }

    SECTION("Empty input") {
        REQUIRE(CsvCostDataProvider::ParseDailyCosts("date,amount\n").empty());
    }
}

TEST_CASE("CsvCostDataProvider - Rejects bad daily rows", "[csv]") {
    SECTION("Bad amount after data") {
        REQUIRE_THROWS_WITH(
            CsvCostDataProvider::ParseDailyCosts("2024-03-01,1\n2024-03-02,abc\n", "daily.csv"),
            ContainsSubstring("daily.csv:2"));
    }

    SECTION("Missing column") {
        REQUIRE_THROWS_AS(CsvCostDataProvider::ParseDailyCosts("2024-03-01\n"), ExternalProviderError);
    }

    SECTION("Bad date") {
        REQUIRE_THROWS_AS(CsvCostDataProvider::ParseDailyCosts("03/01/2024,5\n"), ExternalProviderError);
    }

    SECTION("Duplicate date") {
        REQUIRE_THROWS_AS(CsvCostDataProvider::ParseDailyCosts("2024-03-01,5\n2024-03-01,6\n"),
                          ExternalProviderError);
    }

    SECTION("Negative amount") {
        REQUIRE_THROWS_AS(CsvCostDataProvider::ParseDailyCosts("2024-03-01,-5\n"), ExternalProviderError);
    }
}

TEST_CASE("CsvCostDataProvider - Parse service costs", "[csv]") {
    auto breakdown = CsvCostDataProvider::ParseServiceCosts(
        "service,amount\n"
        "Amazon EC2,860.25\n"
        "\"Amazon Relational Database Service, Aurora\",420.10\n"
        "Amazon EC2,39.75\n");

    REQUIRE(breakdown.size() == 2);
    REQUIRE_THAT(breakdown.at("Amazon EC2"), WithinAbs(900.0, 1e-9));
    REQUIRE_THAT(breakdown.at("Amazon Relational Database Service, Aurora"), WithinAbs(420.10, 1e-9));

    REQUIRE_THROWS_AS(CsvCostDataProvider::ParseServiceCosts("Amazon S3,-1\n"), ExternalProviderError);
    REQUIRE_THROWS_AS(CsvCostDataProvider::ParseServiceCosts(",12\n"), ExternalProviderError);
}

TEST_CASE("CsvCostDataProvider - Fetch from files", "[csv]") {
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    auto dir = std::filesystem::temp_directory_path() / ("cloudspend_csv_" + std::to_string(stamp));
    std::filesystem::create_directories(dir);
    auto daily = dir / "daily.csv";
    auto services = dir / "services.csv";
    {
        std::ofstream out(daily);
        out << "date,amount\n";
        for (int d = 1; d <= 10; d++) {
            out << Date(2024, 5, d).ToString() << "," << 100 + d << "\n";
        }
        std::ofstream svc(services);
        svc << "service,amount\nAmazon EC2,700\nAmazon S3,300\n";
    }

    SECTION("Range filter is inclusive") {
        CsvCostDataProvider provider(daily.string(), services.string());
        auto series = provider.FetchDailyCosts(Date(2024, 5, 3), Date(2024, 5, 6));
        REQUIRE(series.size() == 4);
        REQUIRE(series.front().date == Date(2024, 5, 3));
        REQUIRE(series.back().date == Date(2024, 5, 6));
        REQUIRE(series.back().amount == 106.0);

        auto breakdown = provider.FetchServiceBreakdown(Date(2024, 5, 3), Date(2024, 5, 6));
        REQUIRE(breakdown.at("Amazon EC2") == 700.0);
    }

    SECTION("No service file") {
        CsvCostDataProvider provider(daily.string());
        REQUIRE(provider.FetchServiceBreakdown(Date(2024, 5, 1), Date(2024, 5, 10)).empty());
    }

    SECTION("Missing daily file") {
        CsvCostDataProvider provider((dir / "absent.csv").string());
        REQUIRE_THROWS_AS(provider.FetchDailyCosts(Date(2024, 5, 1), Date(2024, 5, 10)),
                          ExternalProviderError);
    }

    std::filesystem::remove_all(dir);
}

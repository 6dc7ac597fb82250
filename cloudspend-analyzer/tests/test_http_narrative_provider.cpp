#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "narrative/http_narrative_provider.h"
#include "narrative/mock_narrative_provider.h"
#include <cloudspend/cost_forecaster.h>
#include <cloudspend/errors.h>
#include <nlohmann/json.hpp>

using namespace cloudspend;
using namespace cloudspend::analyzer::narrative;
using Catch::Matchers::ContainsSubstring;
using nlohmann::json;

namespace {

ForecastResult SampleForecast() {
    ForecastResult forecast;
    forecast.horizon_days = 30;
    forecast.projected_total = 3150.0;
    forecast.daily_average = 105.0;
    forecast.trend = TrendDirection::Increasing;
    forecast.growth_rate_pct = 12.5;
    forecast.volatility_pct = 8.0;
    forecast.confidence = ForecastConfidence::High;
    forecast.history_days = 30;
    forecast.monthly_run_rate = 3150.0;
    forecast.min_daily = 90.0;
    forecast.max_daily = 120.0;
    forecast.total_period = 3000.0;
    forecast.assumptions = {"Linear trend continues"};
    return forecast;
}

NarrativeContext SampleContext() {
    NarrativeContext context;
    context.services = {{"Amazon EC2", 2000.0}, {"Amazon S3", 1000.0}};
    context.period_total = 3000.0;
    context.period_days = 30;
    return context;
}

} // namespace

TEST_CASE("HttpNarrativeProvider - Request body", "[narrative][http]") {
    HttpNarrativeOptions options;
    options.model = "gpt-4o-mini";
    options.api_key = "sk-test";
    options.max_output_tokens = 400;
    HttpNarrativeProvider provider(options);

    json body = provider.BuildRequestBody(SampleForecast(), SampleContext());
    REQUIRE(body["model"] == "gpt-4o-mini");
    REQUIRE(body["max_output_tokens"] == 400);
    REQUIRE(body["instructions"].is_string());

    const std::string input = body["input"].get<std::string>();
    REQUIRE_THAT(input, ContainsSubstring("HISTORICAL DATA (30 days)"));
    REQUIRE_THAT(input, ContainsSubstring("$3000.00"));
    REQUIRE_THAT(input, ContainsSubstring("increasing (+12.5% growth rate)"));
    REQUIRE_THAT(input, ContainsSubstring("Projected total: $3150.00"));
    REQUIRE_THAT(input, ContainsSubstring("1. Amazon EC2: $2000.00 (66.7%)"));
    REQUIRE_THAT(input, ContainsSubstring("- Linear trend continues"));
    // The key never travels in the body
    REQUIRE_THAT(body.dump(), !ContainsSubstring("sk-test"));
}

TEST_CASE("HttpNarrativeProvider - Extract text", "[narrative][http]") {
    SECTION("Top-level output_text") {
        auto text = HttpNarrativeProvider::ExtractText(json{{"output_text", "Costs rise."}});
        REQUIRE(text == std::string("Costs rise."));
    }

    SECTION("Message content parts") {
        auto response = json::parse(R"({
            "output": [
                {"type": "reasoning", "summary": []},
                {"type": "message", "content": [
                    {"type": "output_text", "text": "First paragraph."},
                    {"type": "refusal", "refusal": "no"},
                    {"type": "text", "text": "Second paragraph.\n\n"}
                ]}
            ]
        })");
        auto text = HttpNarrativeProvider::ExtractText(response);
        REQUIRE(text == std::string("First paragraph.\nSecond paragraph."));
    }

    SECTION("Empty output_text falls through to messages") {
        auto response = json::parse(R"({
            "output_text": "",
            "output": [{"type": "message", "content": [{"type": "output_text", "text": "  Body  "}]}]
        })");
        REQUIRE(HttpNarrativeProvider::ExtractText(response) == std::string("Body"));
    }

    SECTION("Nothing usable") {
        REQUIRE_FALSE(HttpNarrativeProvider::ExtractText(json::array()).has_value());
        REQUIRE_FALSE(HttpNarrativeProvider::ExtractText(json::object()).has_value());
        REQUIRE_FALSE(HttpNarrativeProvider::ExtractText(
            json::parse(R"({"output": [{"type": "message", "content": []}]})")).has_value());
    }
}

TEST_CASE("HttpNarrativeProvider - Missing API key", "[narrative][http]") {
    HttpNarrativeProvider provider(HttpNarrativeOptions{});
    REQUIRE(provider.Name() == "openai");
    REQUIRE_THROWS_AS(provider.Explain(SampleForecast(), SampleContext(), std::chrono::milliseconds(100)),
                      ExternalProviderError);
}

TEST_CASE("HttpNarrativeProvider - Unreachable endpoint", "[narrative][http]") {
    HttpNarrativeOptions options;
    options.base_url = "http://127.0.0.1:1";
    options.api_key = "sk-test";
    HttpNarrativeProvider provider(options);

    REQUIRE_THROWS_AS(provider.Explain(SampleForecast(), SampleContext(), std::chrono::milliseconds(200)),
                      ExternalProviderError);
}

TEST_CASE("MockNarrativeProvider - Summary text", "[narrative]") {
    MockNarrativeProvider provider;
    auto text = provider.Explain(SampleForecast(), SampleContext(), std::chrono::milliseconds(0));
    REQUIRE(text.has_value());
    REQUIRE_THAT(*text, ContainsSubstring("[mock] Spend is increasing (+12.5%)"));
    REQUIRE_THAT(*text, ContainsSubstring("$3150.00 over the next 30 days"));
    REQUIRE_THAT(*text, ContainsSubstring("Largest service: Amazon EC2 (66.7% of spend)"));
}

// http_narrative_provider.cpp - HTTP narrative provider implementation
#include "narrative/http_narrative_provider.h"
#include <cloudspend/cost_forecaster.h>
#include <cloudspend/errors.h>

#define CPPHTTPLIB_OPENSSL_SUPPORT
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

using json = nlohmann::json;

namespace cloudspend::analyzer::narrative {

namespace {

constexpr const char* kSystemInstructions =
    "You are a FinOps analyst. Explain the numeric cloud cost forecast you are given "
    "in plain language. Do not change the numbers. Be specific with dollar amounts, "
    "name the risk factors and the early warning signs to watch for.";

} // namespace

HttpNarrativeProvider::HttpNarrativeProvider(HttpNarrativeOptions options)
    : options_(std::move(options)) {
}

std::string HttpNarrativeProvider::BuildPrompt(const ForecastResult& forecast,
                                               const NarrativeContext& context) {
    std::string prompt = fmt::format(
        "HISTORICAL DATA ({} days):\n"
        "- Total spend: ${:.2f}\n"
        "- Average daily (history): ${:.2f} - ${:.2f} per day\n"
        "- Trend: {} ({:+.1f}% growth rate)\n"
        "- Volatility: {:.1f}%\n\n"
        "FORECAST ({} days, {} confidence):\n"
        "- Projected total: ${:.2f}\n"
        "- Projected daily average: ${:.2f}\n"
        "- Monthly run rate: ${:.2f}\n",
        context.period_days > 0 ? context.period_days : forecast.history_days,
        context.period_total > 0.0 ? context.period_total : forecast.total_period,
        forecast.min_daily, forecast.max_daily,
        ToString(forecast.trend), forecast.growth_rate_pct,
        forecast.volatility_pct,
        forecast.horizon_days, ToString(forecast.confidence),
        forecast.projected_total,
        forecast.daily_average,
        forecast.monthly_run_rate);

    auto top = TopServices(context.services, 5);
    if (!top.empty()) {
        prompt += "\nTOP SERVICES:\n";
        int rank = 1;
        for (const auto& share : top) {
            prompt += fmt::format("{}. {}: ${:.2f} ({:.1f}%)\n",
                                  rank++, share.service, share.amount, share.share_pct);
        }
    }

    if (!forecast.assumptions.empty()) {
        prompt += "\nASSUMPTIONS:\n";
        for (const auto& assumption : forecast.assumptions) {
            prompt += "- " + assumption + "\n";
        }
    }

    prompt += "\nExplain whether costs will rise, fall or stay stable and why, "
              "the main risks to this forecast, and cost control measures.";
    return prompt;
}

json HttpNarrativeProvider::BuildRequestBody(const ForecastResult& forecast,
                                             const NarrativeContext& context) const {
    json body;
    body["model"] = options_.model;
    body["instructions"] = kSystemInstructions;
    body["input"] = BuildPrompt(forecast, context);
    body["max_output_tokens"] = options_.max_output_tokens;
    return body;
}

std::optional<std::string> HttpNarrativeProvider::ExtractText(const json& response) {
    if (!response.is_object()) {
        return std::nullopt;
    }

    if (response.contains("output_text") && response["output_text"].is_string()) {
        std::string text = response["output_text"].get<std::string>();
        if (!text.empty()) return text;
    }

    std::string combined;
    if (response.contains("output") && response["output"].is_array()) {
        for (const auto& item : response["output"]) {
            if (!item.is_object() || item.value("type", "") != "message") continue;
            if (!item.contains("content") || !item["content"].is_array()) continue;

            for (const auto& content : item["content"]) {
                if (!content.is_object()) continue;
                const std::string type = content.value("type", "");
                if ((type == "output_text" || type == "text") && content.contains("text")) {
                    if (!combined.empty()) combined += "\n";
                    combined += content["text"].get<std::string>();
                }
            }
        }
    }

    // Trim trailing whitespace
    size_t end = combined.find_last_not_of(" \t\r\n");
    if (end == std::string::npos) {
        return std::nullopt;
    }
    combined.erase(end + 1);
    size_t begin = combined.find_first_not_of(" \t\r\n");
    return combined.substr(begin);
}

std::optional<std::string> HttpNarrativeProvider::Explain(const ForecastResult& forecast,
                                                          const NarrativeContext& context,
                                                          std::chrono::milliseconds timeout) {
    if (options_.api_key.empty()) {
        throw ExternalProviderError("Narrative provider API key is not set");
    }

    httplib::Client client(options_.base_url);
    if (!client.is_valid()) {
        throw ExternalProviderError("Invalid narrative endpoint: " + options_.base_url);
    }
    client.set_connection_timeout(timeout);
    client.set_read_timeout(timeout);
    client.set_write_timeout(timeout);

    httplib::Headers headers = {
        {"Authorization", "Bearer " + options_.api_key}
    };

    const std::string payload = BuildRequestBody(forecast, context).dump();
    spdlog::debug("Requesting narrative from {}{} (model {})",
                  options_.base_url, options_.path, options_.model);

    auto res = client.Post(options_.path, headers, payload, "application/json");
    if (!res) {
        throw ExternalProviderError("Narrative request failed: " + httplib::to_string(res.error()));
    }
    if (res->status != 200) {
        throw ExternalProviderError(fmt::format("Narrative provider returned HTTP {}: {}",
                                                res->status, res->body.substr(0, 200)));
    }

    json response;
    try {
        response = json::parse(res->body);
    } catch (const json::exception& e) {
        throw ExternalProviderError(std::string("Narrative response is not JSON: ") + e.what());
    }

    auto text = ExtractText(response);
    if (!text) {
        spdlog::warn("Narrative provider response contained no text output");
    }
    return text;
}

} // namespace cloudspend::analyzer::narrative

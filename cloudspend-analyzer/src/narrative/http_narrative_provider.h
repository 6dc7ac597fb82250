// http_narrative_provider.h - Forecast narratives from an OpenAI Responses-compatible API
#pragma once

#include <cloudspend/narrative_provider.h>
#include <nlohmann/json_fwd.hpp>
#include <string>

namespace cloudspend::analyzer::narrative {

struct HttpNarrativeOptions {
    std::string base_url = "https://api.openai.com";   // scheme://host[:port]
    std::string path = "/v1/responses";
    std::string model = "gpt-4o-mini";
    std::string api_key;
    int max_output_tokens = 1000;
};

class HttpNarrativeProvider : public NarrativeProvider {
public:
    explicit HttpNarrativeProvider(HttpNarrativeOptions options);

    std::string Name() const override { return "openai"; }

    std::optional<std::string> Explain(
        const ForecastResult& forecast,
        const NarrativeContext& context,
        std::chrono::milliseconds timeout
    ) override;

    // Request pieces, exposed for tests
    static std::string BuildPrompt(const ForecastResult& forecast, const NarrativeContext& context);
    nlohmann::json BuildRequestBody(const ForecastResult& forecast, const NarrativeContext& context) const;

    /**
     * Pull the generated text out of a Responses API reply: top-level
     * "output_text", else the text parts of every "message" output item
     * @return nullopt when the reply holds no text
     */
    static std::optional<std::string> ExtractText(const nlohmann::json& response);

private:
    HttpNarrativeOptions options_;
};

} // namespace cloudspend::analyzer::narrative

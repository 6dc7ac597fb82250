// mock_narrative_provider.h - Offline narrative provider
#pragma once

#include <cloudspend/narrative_provider.h>

namespace cloudspend::analyzer::narrative {

// Produces a fixed-format summary from the forecast numbers without any network call
class MockNarrativeProvider : public NarrativeProvider {
public:
    std::string Name() const override { return "mock"; }

    std::optional<std::string> Explain(
        const ForecastResult& forecast,
        const NarrativeContext& context,
        std::chrono::milliseconds timeout
    ) override;
};

} // namespace cloudspend::analyzer::narrative

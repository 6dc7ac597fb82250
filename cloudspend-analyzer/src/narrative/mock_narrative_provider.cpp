// mock_narrative_provider.cpp
#include "narrative/mock_narrative_provider.h"
#include <cloudspend/cost_forecaster.h>
#include <fmt/format.h>

namespace cloudspend::analyzer::narrative {

std::optional<std::string> MockNarrativeProvider::Explain(const ForecastResult& forecast,
                                                          const NarrativeContext& context,
                                                          std::chrono::milliseconds /*timeout*/) {
    std::string text = fmt::format(
        "[mock] Spend is {} ({:+.1f}%). Expect about ${:.2f} over the next {} days "
        "(${:.2f}/day, {} confidence).",
        ToString(forecast.trend), forecast.growth_rate_pct,
        forecast.projected_total, forecast.horizon_days,
        forecast.daily_average, ToString(forecast.confidence));

    auto top = TopServices(context.services, 1);
    if (!top.empty()) {
        text += fmt::format(" Largest service: {} ({:.1f}% of spend).",
                            top.front().service, top.front().share_pct);
    }
    return text;
}

} // namespace cloudspend::analyzer::narrative

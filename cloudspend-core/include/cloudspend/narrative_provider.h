#pragma once

#include "api_export.h"
#include "cost_types.h"
#include <chrono>
#include <optional>
#include <string>

namespace cloudspend {

struct ForecastResult;

// Extra facts a provider may weave into its explanation
struct CLOUDSPEND_API NarrativeContext {
    ServiceBreakdown services;
    double period_total = 0.0;
    int period_days = 0;
};

/**
 * Capability interface for the advisory natural-language explanation of a
 * forecast. Implementations wrap a specific text-generation provider.
 *
 * Explain() may block; callers bound it with a timeout and treat its
 * output as supplementary only.
 */
class CLOUDSPEND_API NarrativeProvider {
public:
    virtual ~NarrativeProvider() = default;

    // Provider name for logs ("openai", "mock", ...)
    virtual std::string Name() const = 0;

    /**
     * @return Explanation text, or nullopt when the provider has nothing to say
     * @throws ExternalProviderError when the provider call fails
     */
    virtual std::optional<std::string> Explain(
        const ForecastResult& forecast,
        const NarrativeContext& context,
        std::chrono::milliseconds timeout
    ) = 0;
};

} // namespace cloudspend

// cost_data_provider.h - Source of daily cost series and service breakdowns
#pragma once

#include <cloudspend/cost_types.h>
#include <string>

namespace cloudspend::analyzer::data {

/**
 * Replayable source of cost data. Implementations raise
 * ExternalProviderError when the underlying source cannot be read.
 */
class CostDataProvider {
public:
    virtual ~CostDataProvider() = default;

    virtual std::string Name() const = 0;

    // Daily totals with dates in [start, end], ascending
    virtual CostSeries FetchDailyCosts(const Date& start, const Date& end) = 0;

    // Per-service totals over [start, end]
    virtual ServiceBreakdown FetchServiceBreakdown(const Date& start, const Date& end) = 0;
};

} // namespace cloudspend::analyzer::data

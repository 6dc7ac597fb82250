// csv_cost_data_provider.h - Replays exported cost data from CSV files
#pragma once

#include "data/cost_data_provider.h"
#include <string>

namespace cloudspend::analyzer::data {

/**
 * Reads `date,amount` rows for daily costs and `service,amount` rows for
 * the service breakdown. A header line is optional; blank lines and lines
 * starting with '#' are skipped. Files are re-read on every fetch.
 */
class CsvCostDataProvider : public CostDataProvider {
public:
    // service_costs_path may be empty (no breakdown available)
    CsvCostDataProvider(std::string daily_costs_path, std::string service_costs_path = "");

    std::string Name() const override { return "csv"; }

    CostSeries FetchDailyCosts(const Date& start, const Date& end) override;
    ServiceBreakdown FetchServiceBreakdown(const Date& start, const Date& end) override;

    // Parse CSV text; exposed for tests. Throws ExternalProviderError on bad rows.
    static CostSeries ParseDailyCosts(const std::string& text, const std::string& source = "<memory>");
    static ServiceBreakdown ParseServiceCosts(const std::string& text, const std::string& source = "<memory>");

private:
    static std::string ReadFile(const std::string& path);

    std::string daily_costs_path_;
    std::string service_costs_path_;
};

} // namespace cloudspend::analyzer::data

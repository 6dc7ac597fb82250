// analysis_orchestrator.h - Runs one full analysis pass over a cost data source
#pragma once

#include "core/config_manager.h"
#include "data/cost_data_provider.h"
#include <cloudspend/anomaly_detector.h>
#include <cloudspend/cost_forecaster.h>
#include <cloudspend/narrative_provider.h>
#include <cloudspend/recommendation.h>
#include <cloudspend/savings_ledger.h>
#include <cloudspend/stats_utils.h>
#include <nlohmann/json_fwd.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cloudspend::analyzer::core {

struct AnomalySummary {
    int total = 0;
    int high = 0;
    int medium = 0;
    int low = 0;
    std::optional<stats::DescriptiveStats> daily_stats;     // Over the analysed period
};

struct AnalysisReport {
    // Meta
    std::string account_name;
    std::string data_source;
    Date start_date;
    Date end_date;
    int period_days = 0;
    int64_t generated_at = 0;                   // Unix seconds
    std::string status = "ok";                  // ok | degraded
    std::vector<std::string> warnings;

    // Inputs as analysed
    CostSeries daily_costs;
    double total_cost = 0.0;
    ServiceBreakdown service_breakdown;
    std::vector<ServiceShare> top_services;

    std::vector<Anomaly> anomalies;
    AnomalySummary anomaly_summary;

    std::optional<ForecastResult> forecast;
    std::optional<BudgetAlert> budget_alert;

    std::optional<LedgerSummary> ledger_summary;
    std::vector<Recommendation> top_pending;    // By estimated savings, at most kTopPending

    void AddWarning(const std::string& warning);
};

/**
 * Sequences the engines for one run: fetch costs, detect anomalies,
 * forecast, check the budget and summarise the ledger.
 *
 * Failures of external collaborators (data source, narrative provider)
 * become warnings and a "degraded" report. Invalid configuration and
 * ledger storage errors are thrown to the caller.
 */
class AnalysisOrchestrator {
public:
    static constexpr size_t kTopPending = 5;
    static constexpr size_t kTopServices = 10;

    AnalysisOrchestrator(
        AppConfig config,
        std::shared_ptr<data::CostDataProvider> data_provider,
        std::shared_ptr<SavingsLedger> ledger = nullptr,
        std::shared_ptr<NarrativeProvider> narrative_provider = nullptr
    );

    // end_date overrides the configured end date (default: yesterday UTC)
    AnalysisReport Run(std::optional<Date> end_date = std::nullopt);

    const AppConfig& GetConfig() const { return config_; }

private:
    Date ResolveEndDate(const std::optional<Date>& end_date) const;
    void RunForecast(AnalysisReport& report, const ServiceBreakdown& services);
    void SummarizeLedger(AnalysisReport& report);

    AppConfig config_;
    std::shared_ptr<data::CostDataProvider> data_provider_;
    std::shared_ptr<SavingsLedger> ledger_;
    std::shared_ptr<NarrativeProvider> narrative_provider_;
};

void to_json(nlohmann::json& j, const AnomalySummary& summary);
void to_json(nlohmann::json& j, const AnalysisReport& report);

} // namespace cloudspend::analyzer::core

// analysis_orchestrator.cpp - Analysis pass implementation
#include "core/analysis_orchestrator.h"
#include <cloudspend/errors.h>
#include <cloudspend/json_serialization.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <chrono>

using json = nlohmann::json;

namespace cloudspend::analyzer::core {

namespace {

// Days averaged for the current spend rate used in breach timing
constexpr size_t kCurrentRateDays = 7;

double CurrentDailyRate(const CostSeries& series) {
    if (series.empty()) return 0.0;
    const size_t n = std::min(series.size(), kCurrentRateDays);
    double sum = 0.0;
    for (size_t i = series.size() - n; i < series.size(); ++i) {
        sum += series[i].amount;
    }
    return sum / static_cast<double>(n);
}

} // namespace

void AnalysisReport::AddWarning(const std::string& warning) {
    spdlog::warn("{}", warning);
    warnings.push_back(warning);
    status = "degraded";
}

AnalysisOrchestrator::AnalysisOrchestrator(AppConfig config,
                                           std::shared_ptr<data::CostDataProvider> data_provider,
                                           std::shared_ptr<SavingsLedger> ledger,
                                           std::shared_ptr<NarrativeProvider> narrative_provider)
    : config_(std::move(config)),
      data_provider_(std::move(data_provider)),
      ledger_(std::move(ledger)),
      narrative_provider_(std::move(narrative_provider)) {
    if (!data_provider_) {
        throw InvalidInputError("AnalysisOrchestrator requires a cost data provider");
    }
    if (config_.data_source.history_days <= 0) {
        throw InvalidInputError("data_source.history_days must be positive");
    }
}

Date AnalysisOrchestrator::ResolveEndDate(const std::optional<Date>& end_date) const {
    if (end_date) {
        return *end_date;
    }
    if (!config_.data_source.end_date.empty()) {
        return Date::Parse(config_.data_source.end_date);
    }
    // Today's billing data is incomplete
    return Date::Today().AddDays(-1);
}

AnalysisReport AnalysisOrchestrator::Run(std::optional<Date> end_date) {
    AnalysisReport report;
    report.account_name = config_.account_name;
    report.data_source = data_provider_->Name();
    report.end_date = ResolveEndDate(end_date);
    report.start_date = report.end_date.AddDays(-(config_.data_source.history_days - 1));
    report.period_days = config_.data_source.history_days;
    report.generated_at = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    spdlog::info("Analyzing '{}' from {} to {} ({} source)",
                 report.account_name, report.start_date.ToString(),
                 report.end_date.ToString(), report.data_source);

    // Daily costs
    try {
        report.daily_costs = data_provider_->FetchDailyCosts(report.start_date, report.end_date);
        ValidateSeries(report.daily_costs);
    } catch (const ExternalProviderError& e) {
        report.daily_costs.clear();
        report.AddWarning(fmt::format("Cost data unavailable from {}: {}", report.data_source, e.what()));
    } catch (const InvalidInputError& e) {
        report.daily_costs.clear();
        report.AddWarning(fmt::format("Cost data from {} rejected: {}", report.data_source, e.what()));
    }
    report.total_cost = TotalCost(report.daily_costs);

    // Service breakdown
    ServiceBreakdown services;
    try {
        services = data_provider_->FetchServiceBreakdown(report.start_date, report.end_date);
        ValidateBreakdown(services);
        report.service_breakdown = services;
        report.top_services = TopServices(services, kTopServices);
    } catch (const ExternalProviderError& e) {
        services.clear();
        report.AddWarning(fmt::format("Service breakdown unavailable from {}: {}", report.data_source, e.what()));
    } catch (const InvalidInputError& e) {
        services.clear();
        report.AddWarning(fmt::format("Service breakdown from {} rejected: {}", report.data_source, e.what()));
    }

    // Anomalies
    report.anomalies = AnomalyDetector::Detect(report.daily_costs, config_.anomaly);
    for (const auto& anomaly : report.anomalies) {
        report.anomaly_summary.total++;
        switch (anomaly.severity) {
            case AnomalySeverity::High: report.anomaly_summary.high++; break;
            case AnomalySeverity::Medium: report.anomaly_summary.medium++; break;
            case AnomalySeverity::Low: report.anomaly_summary.low++; break;
        }
    }
    if (!report.daily_costs.empty()) {
        report.anomaly_summary.daily_stats = stats::ComputeStats(Amounts(report.daily_costs));
    }

    RunForecast(report, services);
    SummarizeLedger(report);

    spdlog::info("Analysis complete: status={}, {} anomalies, {} warnings",
                 report.status, report.anomalies.size(), report.warnings.size());
    return report;
}

void AnalysisOrchestrator::RunForecast(AnalysisReport& report, const ServiceBreakdown& services) {
    try {
        report.forecast = CostForecaster::Forecast(report.daily_costs, config_.forecast.horizon_days,
                                                   config_.forecast);
    } catch (const InsufficientDataError& e) {
        report.AddWarning(fmt::format("Forecast skipped: {}", e.what()));
        return;
    }

    if (narrative_provider_) {
        NarrativeContext context;
        context.services = services;
        context.period_total = report.total_cost;
        context.period_days = report.period_days;

        bool attached = CostForecaster::AttachNarrative(*report.forecast, narrative_provider_, context,
                                                        config_.forecast.narrative_timeout);
        if (!attached) {
            report.AddWarning(fmt::format("Narrative unavailable from provider '{}'",
                                          narrative_provider_->Name()));
        }
    }

    if (config_.monthly_budget) {
        report.budget_alert = CostForecaster::CheckBudget(*report.forecast, *config_.monthly_budget,
                                                          CurrentDailyRate(report.daily_costs),
                                                          report.end_date, config_.budget);
        if (report.budget_alert->severity != BudgetSeverity::None) {
            spdlog::warn("Projected spend {:.2f} exceeds budget {:.2f} ({:+.1f}%, {})",
                         report.budget_alert->projected_spend, report.budget_alert->monthly_budget,
                         report.budget_alert->overage_pct, ToString(report.budget_alert->severity));
        }
    }
}

void AnalysisOrchestrator::SummarizeLedger(AnalysisReport& report) {
    if (!ledger_) {
        return;
    }

    std::vector<Recommendation> all = ledger_->List();
    report.ledger_summary = SavingsLedger::Summarize(all);

    for (const auto& rec : all) {
        if (rec.status == RecommendationStatus::Pending) {
            report.top_pending.push_back(rec);
        }
    }
    std::stable_sort(report.top_pending.begin(), report.top_pending.end(),
                     [](const Recommendation& a, const Recommendation& b) {
                         return a.estimated_monthly_savings > b.estimated_monthly_savings;
                     });
    if (report.top_pending.size() > kTopPending) {
        report.top_pending.resize(kTopPending);
    }
}

// ============================================================================
// JSON
// ============================================================================

void to_json(json& j, const AnomalySummary& summary) {
    j = json{
        {"total", summary.total},
        {"high", summary.high},
        {"medium", summary.medium},
        {"low", summary.low},
        {"daily_stats", nullptr}
    };
    if (summary.daily_stats) {
        const auto& s = *summary.daily_stats;
        j["daily_stats"] = json{
            {"count", s.count},
            {"mean", s.mean},
            {"median", s.median},
            {"std_dev", s.std_dev},
            {"min", s.min},
            {"max", s.max},
            {"q1", s.q1},
            {"q3", s.q3},
            {"iqr", s.iqr}
        };
    }
}

void to_json(json& j, const AnalysisReport& report) {
    j = json{
        {"meta", {
            {"account_name", report.account_name},
            {"data_source", report.data_source},
            {"start_date", report.start_date},
            {"end_date", report.end_date},
            {"period_days", report.period_days},
            {"generated_at", report.generated_at}
        }},
        {"status", report.status},
        {"warnings", report.warnings},
        {"total_cost", report.total_cost},
        {"daily_costs", report.daily_costs},
        {"top_services", report.top_services},
        {"anomalies", report.anomalies},
        {"anomaly_summary", report.anomaly_summary},
        {"forecast", nullptr},
        {"budget_alert", nullptr},
        {"ledger_summary", nullptr},
        {"top_pending_recommendations", report.top_pending}
    };
    if (report.forecast) j["forecast"] = *report.forecast;
    if (report.budget_alert) j["budget_alert"] = *report.budget_alert;
    if (report.ledger_summary) j["ledger_summary"] = *report.ledger_summary;
}

} // namespace cloudspend::analyzer::core

#include <cloudspend/json_serialization.h>
#include <cloudspend/errors.h>
#include <nlohmann/json.hpp>

namespace cloudspend {

namespace {

template <typename T>
nlohmann::json OptionalJson(const std::optional<T>& value) {
    if (!value) return nullptr;
    return nlohmann::json(*value);
}

} // namespace

void to_json(nlohmann::json& j, const Date& date) {
    j = date.ToString();
}

void from_json(const nlohmann::json& j, Date& date) {
    date = Date::Parse(j.get<std::string>());
}

void to_json(nlohmann::json& j, const DailyCostPoint& point) {
    j = nlohmann::json{
        {"date", point.date},
        {"amount", point.amount}
    };
}

void from_json(const nlohmann::json& j, DailyCostPoint& point) {
    point.date = j.at("date").get<Date>();
    if (j.contains("amount")) {
        point.amount = j.at("amount").get<double>();
    } else {
        point.amount = j.at("cost").get<double>();
    }
}

void to_json(nlohmann::json& j, const ServiceShare& share) {
    j = nlohmann::json{
        {"service", share.service},
        {"amount", share.amount},
        {"share_pct", share.share_pct}
    };
}

void to_json(nlohmann::json& j, const Anomaly& anomaly) {
    nlohmann::json rules = nlohmann::json::array();
    if (anomaly.z_score_rule) rules.push_back("z_score");
    if (anomaly.iqr_rule) rules.push_back("iqr");

    j = nlohmann::json{
        {"date", anomaly.date},
        {"amount", anomaly.amount},
        {"baseline_mean", anomaly.baseline_mean},
        {"baseline_stddev", anomaly.baseline_stddev},
        {"baseline_points", anomaly.baseline_points},
        {"z_score", OptionalJson(anomaly.z_score)},
        {"iqr_lower", anomaly.iqr_lower},
        {"iqr_upper", anomaly.iqr_upper},
        {"severity", ToString(anomaly.severity)},
        {"rules", rules},
        {"reason", anomaly.reason}
    };
}

void to_json(nlohmann::json& j, const ForecastResult& forecast) {
    j = nlohmann::json{
        {"horizon_days", forecast.horizon_days},
        {"projected_total", forecast.projected_total},
        {"daily_average", forecast.daily_average},
        {"trend", ToString(forecast.trend)},
        {"growth_rate_pct", forecast.growth_rate_pct},
        {"volatility_pct", forecast.volatility_pct},
        {"confidence", ToString(forecast.confidence)},
        {"history_days", forecast.history_days},
        {"history_span_days", forecast.history_span_days},
        {"slope", forecast.slope},
        {"intercept", forecast.intercept},
        {"monthly_run_rate", forecast.monthly_run_rate},
        {"min_daily", forecast.min_daily},
        {"max_daily", forecast.max_daily},
        {"total_period", forecast.total_period},
        {"last_observed", forecast.last_observed},
        {"assumptions", forecast.assumptions},
        {"narrative", OptionalJson(forecast.narrative)}
    };
}

void to_json(nlohmann::json& j, const BudgetAlert& alert) {
    j = nlohmann::json{
        {"monthly_budget", alert.monthly_budget},
        {"projected_spend", alert.projected_spend},
        {"overage", alert.overage},
        {"overage_pct", alert.overage_pct},
        {"severity", ToString(alert.severity)},
        {"days_until_breach", OptionalJson(alert.days_until_breach)},
        {"breach_date", OptionalJson(alert.breach_date)},
        {"recommended_daily_reduction", alert.recommended_daily_reduction}
    };
}

void to_json(nlohmann::json& j, const Recommendation& rec) {
    j = nlohmann::json{
        {"id", rec.id},
        {"title", rec.title},
        {"type", rec.type},
        {"estimated_monthly_savings", rec.estimated_monthly_savings},
        {"risk_level", ToString(rec.risk_level)},
        {"effort", ToString(rec.effort)},
        {"status", ToString(rec.status)},
        {"created_at", rec.created_at},
        {"resolved_at", OptionalJson(rec.resolved_at)},
        {"actual_monthly_savings", OptionalJson(rec.actual_monthly_savings)},
        {"notes", OptionalJson(rec.notes)},
        {"account_name", rec.account_name},
        {"description", rec.description},
        {"quick_win", rec.IsQuickWin()}
    };
}

void to_json(nlohmann::json& j, const CostSnapshot& snapshot) {
    j = nlohmann::json{
        {"id", snapshot.id},
        {"snapshot_date", snapshot.snapshot_date},
        {"account_name", snapshot.account_name},
        {"total_cost", snapshot.total_cost},
        {"period_days", snapshot.period_days},
        {"service_breakdown", OptionalJson(snapshot.service_breakdown)}
    };
}

void to_json(nlohmann::json& j, const LedgerSummary& summary) {
    j = nlohmann::json{
        {"total", summary.total},
        {"pending", summary.pending},
        {"implemented", summary.implemented},
        {"rejected", summary.rejected},
        {"implementation_rate_pct", summary.implementation_rate_pct},
        {"estimated_savings_total", summary.estimated_savings_total},
        {"implemented_savings_estimated_total", summary.implemented_savings_estimated_total},
        {"actual_savings_total", summary.actual_savings_total},
        {"annual_projection", summary.annual_projection},
        {"forecast_accuracy_pct", OptionalJson(summary.forecast_accuracy_pct)}
    };
}

void from_json(const nlohmann::json& j, RecommendationCandidate& candidate) {
    candidate.title = j.at("title").get<std::string>();
    candidate.type = j.contains("type") ? j.at("type").get<std::string>()
                                        : j.at("recommendation_type").get<std::string>();
    candidate.estimated_monthly_savings =
        j.contains("estimated_monthly_savings") ? j.at("estimated_monthly_savings").get<double>()
                                                : j.value("savings", 0.0);
    if (j.contains("risk_level")) {
        candidate.risk_level = ParseRiskLevel(j.at("risk_level").get<std::string>());
    } else if (j.contains("risk")) {
        candidate.risk_level = ParseRiskLevel(j.at("risk").get<std::string>());
    }
    if (j.contains("effort")) {
        candidate.effort = ParseEffort(j.at("effort").get<std::string>());
    }
    candidate.account_name = j.value("account_name", std::string("default"));
    candidate.description = j.value("description", std::string());
}

} // namespace cloudspend

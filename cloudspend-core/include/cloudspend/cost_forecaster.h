#pragma once

#include "api_export.h"
#include "analysis_config.h"
#include "cost_types.h"
#include "narrative_provider.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cloudspend {

enum class TrendDirection {
    Increasing,
    Decreasing,
    Stable
};

enum class ForecastConfidence {
    Low,
    Medium,
    High
};

enum class BudgetSeverity {
    None,
    Low,
    Medium,
    High
};

CLOUDSPEND_API const char* ToString(TrendDirection trend);
CLOUDSPEND_API const char* ToString(ForecastConfidence confidence);
CLOUDSPEND_API const char* ToString(BudgetSeverity severity);

// ============================================================================
// Result Structures
// ============================================================================

struct CLOUDSPEND_API ForecastResult {
    int horizon_days = 0;
    double projected_total = 0.0;               // daily_average * horizon_days
    double daily_average = 0.0;                 // Fitted line at the horizon midpoint
    TrendDirection trend = TrendDirection::Stable;
    double growth_rate_pct = 0.0;               // Fitted change across observed history
    double volatility_pct = 0.0;                // Coefficient of variation of raw amounts
    ForecastConfidence confidence = ForecastConfidence::Low;

    // Fit details and history summary
    int history_days = 0;                       // Points used
    int history_span_days = 0;                  // First to last date, inclusive
    double slope = 0.0;                         // Per calendar day
    double intercept = 0.0;                     // At the first date
    double monthly_run_rate = 0.0;
    double min_daily = 0.0;
    double max_daily = 0.0;
    double total_period = 0.0;
    Date last_observed;
    std::vector<std::string> assumptions;

    std::optional<std::string> narrative;       // Advisory only
};

struct CLOUDSPEND_API BudgetAlert {
    double monthly_budget = 0.0;
    double projected_spend = 0.0;
    double overage = 0.0;                       // Negative = under budget
    double overage_pct = 0.0;
    BudgetSeverity severity = BudgetSeverity::None;
    std::optional<int> days_until_breach;
    std::optional<Date> breach_date;
    double recommended_daily_reduction = 0.0;   // Cut per day to land on budget
};

// ============================================================================
// Forecaster
// ============================================================================

/**
 * Linear-trend spend forecaster with budget checks.
 *
 * The numeric path is pure and deterministic. The optional narrative step
 * consults a NarrativeProvider on a separate thread, bounded by
 * ForecastConfig::narrative_timeout, and can never change or fail the
 * numeric result.
 */
class CLOUDSPEND_API CostForecaster {
public:
    /**
     * Fit a linear trend and project spend over the horizon
     * @param series Ascending daily costs, at least 2 points
     * @param horizon_days Days to project, > 0
     * @throws InsufficientDataError with fewer than 2 points
     * @throws InvalidInputError for a bad horizon or series
     */
    static ForecastResult Forecast(
        const CostSeries& series,
        int horizon_days,
        const ForecastConfig& config = ForecastConfig{}
    );

    /**
     * Forecast, then ask the provider to explain it. Provider failures and
     * timeouts leave narrative empty.
     */
    static ForecastResult ForecastWithNarrative(
        const CostSeries& series,
        int horizon_days,
        const std::shared_ptr<NarrativeProvider>& provider,
        const NarrativeContext& context,
        const ForecastConfig& config = ForecastConfig{}
    );

    /**
     * Attach a narrative to an existing forecast (numeric fields untouched)
     * @return true when a narrative was attached
     */
    static bool AttachNarrative(
        ForecastResult& forecast,
        const std::shared_ptr<NarrativeProvider>& provider,
        const NarrativeContext& context,
        std::chrono::milliseconds timeout
    );

    /**
     * Compare projected spend with a monthly budget
     * @param monthly_budget > 0
     * @param current_daily_rate >= 0, used to time the breach
     * @param as_of Day the projection starts from
     * @throws InvalidInputError for a non-positive budget or negative rate
     */
    static BudgetAlert CheckBudget(
        const ForecastResult& forecast,
        double monthly_budget,
        double current_daily_rate,
        const Date& as_of,
        const BudgetConfig& config = BudgetConfig{}
    );

    // As above with as_of = today (UTC)
    static BudgetAlert CheckBudget(
        const ForecastResult& forecast,
        double monthly_budget,
        double current_daily_rate
    );

private:
    static TrendDirection ClassifyTrend(double growth_rate_pct, const ForecastConfig& config);
    static ForecastConfidence ClassifyConfidence(double volatility_pct, int history_days,
                                                 const ForecastConfig& config);
};

} // namespace cloudspend

#include <cloudspend/cost_forecaster.h>
#include <cloudspend/errors.h>
#include <cloudspend/stats_utils.h>
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>
#include <future>
#include <thread>

namespace cloudspend {

const char* ToString(TrendDirection trend) {
    switch (trend) {
        case TrendDirection::Increasing: return "increasing";
        case TrendDirection::Decreasing: return "decreasing";
        case TrendDirection::Stable: return "stable";
    }
    return "stable";
}

const char* ToString(ForecastConfidence confidence) {
    switch (confidence) {
        case ForecastConfidence::Low: return "low";
        case ForecastConfidence::Medium: return "medium";
        case ForecastConfidence::High: return "high";
    }
    return "low";
}

const char* ToString(BudgetSeverity severity) {
    switch (severity) {
        case BudgetSeverity::None: return "none";
        case BudgetSeverity::Low: return "low";
        case BudgetSeverity::Medium: return "medium";
        case BudgetSeverity::High: return "high";
    }
    return "none";
}

// ============================================================================
// Forecasting
// ============================================================================

ForecastResult CostForecaster::Forecast(const CostSeries& series, int horizon_days,
                                        const ForecastConfig& config) {
    if (horizon_days <= 0) {
        throw InvalidInputError("horizon_days must be positive, got " + std::to_string(horizon_days));
    }
    ValidateSeries(series);
    if (series.size() < 2) {
        throw InsufficientDataError("Forecasting requires at least 2 days of history, got " +
                                    std::to_string(series.size()));
    }

    // x is the calendar offset from the first day so gaps keep their position
    const Date first = series.front().date;
    std::vector<double> x;
    x.reserve(series.size());
    for (const auto& point : series) {
        x.push_back(static_cast<double>(Date::DaysBetween(first, point.date)));
    }
    const std::vector<double> y = Amounts(series);
    const stats::LinearFit fit = stats::LinearRegression(x, y);

    ForecastResult result;
    result.horizon_days = horizon_days;
    result.history_days = static_cast<int>(series.size());
    result.history_span_days = static_cast<int>(x.back()) + 1;
    result.slope = fit.slope;
    result.intercept = fit.intercept;
    result.last_observed = series.back().date;

    // Midpoint of the future days x_last+1 .. x_last+horizon
    const double x_last = x.back();
    const double x_mid = x_last + (horizon_days + 1) / 2.0;
    result.daily_average = std::max(0.0, fit.At(x_mid));
    result.projected_total = result.daily_average * horizon_days;
    result.monthly_run_rate = result.daily_average * config.run_rate_days;

    const double mean = stats::Mean(y);
    const double fitted_start = fit.At(0.0);
    const double fitted_end = fit.At(x_last);
    const double base = fitted_start > 0.0 ? fitted_start : mean;
    result.growth_rate_pct = base > 0.0 ? (fitted_end - fitted_start) / base * 100.0 : 0.0;
    result.trend = ClassifyTrend(result.growth_rate_pct, config);

    result.volatility_pct = stats::CoefficientOfVariationPct(y);
    result.confidence = ClassifyConfidence(result.volatility_pct, result.history_days, config);

    result.min_daily = stats::Min(y);
    result.max_daily = stats::Max(y);
    result.total_period = TotalCost(series);

    result.assumptions = {
        fmt::format("Based on {} days of history ({} to {})", result.history_days,
                    first.ToString(), result.last_observed.ToString()),
        fmt::format("Assumes the {} trend continues", ToString(result.trend)),
        fmt::format("Fitted growth across history: {:+.1f}%", result.growth_rate_pct),
        fmt::format("Volatility: {:.1f}%", result.volatility_pct)
    };
    if (result.history_span_days > result.history_days) {
        result.assumptions.push_back(fmt::format("{} calendar days had no data and were not filled",
                                                 result.history_span_days - result.history_days));
    }

    spdlog::debug("CostForecaster: slope={:.4f} daily_average={:.2f} trend={} confidence={}",
                  result.slope, result.daily_average, ToString(result.trend),
                  ToString(result.confidence));
    return result;
}

TrendDirection CostForecaster::ClassifyTrend(double growth_rate_pct, const ForecastConfig& config) {
    if (growth_rate_pct > config.trend_band_pct) return TrendDirection::Increasing;
    if (growth_rate_pct < -config.trend_band_pct) return TrendDirection::Decreasing;
    return TrendDirection::Stable;
}

ForecastConfidence CostForecaster::ClassifyConfidence(double volatility_pct, int history_days,
                                                      const ForecastConfig& config) {
    if (volatility_pct < config.high_confidence_volatility_pct &&
        history_days >= config.high_confidence_min_days) {
        return ForecastConfidence::High;
    }
    if (volatility_pct < config.medium_confidence_volatility_pct) {
        return ForecastConfidence::Medium;
    }
    return ForecastConfidence::Low;
}

// ============================================================================
// Narrative
// ============================================================================

ForecastResult CostForecaster::ForecastWithNarrative(const CostSeries& series, int horizon_days,
                                                     const std::shared_ptr<NarrativeProvider>& provider,
                                                     const NarrativeContext& context,
                                                     const ForecastConfig& config) {
    ForecastResult result = Forecast(series, horizon_days, config);
    AttachNarrative(result, provider, context, config.narrative_timeout);
    return result;
}

bool CostForecaster::AttachNarrative(ForecastResult& forecast,
                                     const std::shared_ptr<NarrativeProvider>& provider,
                                     const NarrativeContext& context,
                                     std::chrono::milliseconds timeout) {
    if (!provider) {
        return false;
    }

    // The worker owns copies so an abandoned call never touches caller state
    auto snapshot = std::make_shared<const ForecastResult>(forecast);
    auto shared_context = std::make_shared<const NarrativeContext>(context);
    auto promise = std::make_shared<std::promise<std::optional<std::string>>>();
    std::future<std::optional<std::string>> pending = promise->get_future();

    std::thread([provider, snapshot, shared_context, promise, timeout]() {
        try {
            promise->set_value(provider->Explain(*snapshot, *shared_context, timeout));
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    }).detach();

    if (pending.wait_for(timeout) != std::future_status::ready) {
        spdlog::warn("Narrative provider '{}' timed out after {} ms, continuing without narrative",
                     provider->Name(), timeout.count());
        return false;
    }

    try {
        std::optional<std::string> text = pending.get();
        if (!text || text->empty()) {
            spdlog::info("Narrative provider '{}' returned no text", provider->Name());
            return false;
        }
        forecast.narrative = std::move(*text);
        return true;
    } catch (const ExternalProviderError& e) {
        spdlog::warn("Narrative provider '{}' failed: {}", provider->Name(), e.what());
    } catch (const std::exception& e) {
        spdlog::warn("Narrative provider '{}' raised: {}", provider->Name(), e.what());
    }
    return false;
}

// ============================================================================
// Budget
// ============================================================================

BudgetAlert CostForecaster::CheckBudget(const ForecastResult& forecast, double monthly_budget,
                                        double current_daily_rate, const Date& as_of,
                                        const BudgetConfig& config) {
    if (!std::isfinite(monthly_budget) || monthly_budget <= 0.0) {
        throw InvalidInputError("monthly_budget must be positive");
    }
    if (!std::isfinite(current_daily_rate) || current_daily_rate < 0.0) {
        throw InvalidInputError("current_daily_rate must be a non-negative amount");
    }

    BudgetAlert alert;
    alert.monthly_budget = monthly_budget;
    alert.projected_spend = forecast.projected_total;
    alert.overage = forecast.projected_total - monthly_budget;
    alert.overage_pct = alert.overage / monthly_budget * 100.0;

    if (alert.overage <= 0.0) {
        alert.severity = BudgetSeverity::None;
        return alert;
    }

    if (alert.overage_pct < config.medium_overage_pct) {
        alert.severity = BudgetSeverity::Low;
    } else if (alert.overage_pct <= config.high_overage_pct) {
        alert.severity = BudgetSeverity::Medium;
    } else {
        alert.severity = BudgetSeverity::High;
    }

    if (forecast.horizon_days > 0) {
        alert.recommended_daily_reduction = alert.overage / forecast.horizon_days;
    }

    if (current_daily_rate > 0.0) {
        const double days = std::ceil(monthly_budget / current_daily_rate);
        if (days <= forecast.horizon_days) {
            alert.days_until_breach = static_cast<int>(days);
            alert.breach_date = as_of.AddDays(static_cast<int64_t>(days));
        }
    }

    spdlog::info("Budget check: projected {:.2f} vs budget {:.2f} ({:+.1f}%), severity {}",
                 alert.projected_spend, monthly_budget, alert.overage_pct,
                 ToString(alert.severity));
    return alert;
}

BudgetAlert CostForecaster::CheckBudget(const ForecastResult& forecast, double monthly_budget,
                                        double current_daily_rate) {
    return CheckBudget(forecast, monthly_budget, current_daily_rate, Date::Today());
}

} // namespace cloudspend

#pragma once

#include "api_export.h"
#include <chrono>

namespace cloudspend {

// Thresholds for AnomalyDetector. Passed explicitly into every call.
struct CLOUDSPEND_API AnomalyConfig {
    int lookback_days = 7;              // Trailing calendar window for the baseline
    int min_days = 7;                   // Shorter series are not analysed
    int min_baseline_points = 5;        // Capped at lookback_days
    double z_threshold = 2.0;           // |z| >= this fires the z-score rule
    double high_z_threshold = 3.0;      // |z| >= this is high severity
    double iqr_multiplier = 1.5;
    // Stddev used for a zero-variance window, as a fraction of |baseline
    // mean|. A flat non-zero baseline then still yields a finite z.
    // 0 disables the floor.
    double min_stddev_ratio = 0.01;
};

// Trend, volatility and confidence bands for CostForecaster
struct CLOUDSPEND_API ForecastConfig {
    int horizon_days = 30;
    double trend_band_pct = 1.0;                // |growth| <= band is stable
    double high_confidence_volatility_pct = 10.0;
    double medium_confidence_volatility_pct = 25.0;
    int high_confidence_min_days = 14;
    int run_rate_days = 30;                     // monthly_run_rate = daily_average * this
    std::chrono::milliseconds narrative_timeout{15000};
};

// Severity bands on overage_pct for budget checks
struct CLOUDSPEND_API BudgetConfig {
    double medium_overage_pct = 5.0;    // < this is low
    double high_overage_pct = 15.0;     // > this is high
};

} // namespace cloudspend

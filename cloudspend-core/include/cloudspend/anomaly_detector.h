#pragma once

#include "api_export.h"
#include "analysis_config.h"
#include "cost_types.h"
#include <optional>
#include <string>
#include <vector>

namespace cloudspend {

enum class AnomalySeverity {
    Low,
    Medium,
    High
};

CLOUDSPEND_API const char* ToString(AnomalySeverity severity);

// A flagged day. Produced once, never mutated.
struct CLOUDSPEND_API Anomaly {
    Date date;
    double amount = 0.0;
    double baseline_mean = 0.0;
    double baseline_stddev = 0.0;           // Raw sample stddev of the window
    std::optional<double> z_score;          // Absent when undefined
    double iqr_lower = 0.0;
    double iqr_upper = 0.0;
    AnomalySeverity severity = AnomalySeverity::Low;
    bool z_score_rule = false;              // Which rules fired
    bool iqr_rule = false;
    int baseline_points = 0;
    std::string reason;
};

/**
 * Flags anomalous days in a daily cost series.
 *
 * Each day is compared to the trailing lookback window that precedes it
 * (never the day itself, never later days) with two independent rules:
 * a z-score rule and an IQR fence rule. Results are the union, one entry
 * per day, ordered by date.
 *
 * Stateless; safe to call concurrently on independent series.
 */
class CLOUDSPEND_API AnomalyDetector {
public:
    /**
     * Detect anomalies using the window sizes from config
     * @param series Ascending daily costs (gaps allowed)
     * @return Anomalies by date; empty when series has fewer than config.min_days points
     * @throws InvalidInputError for an unordered or negative series
     */
    static std::vector<Anomaly> Detect(
        const CostSeries& series,
        const AnomalyConfig& config = AnomalyConfig{}
    );

    /**
     * Detect anomalies with explicit window sizes (overrides config)
     * @param lookback_days Trailing calendar window, > 0
     * @param min_days Minimum series length, > 0
     */
    static std::vector<Anomaly> Detect(
        const CostSeries& series,
        int lookback_days,
        int min_days,
        const AnomalyConfig& config = AnomalyConfig{}
    );

private:
    static std::optional<Anomaly> Evaluate(
        const DailyCostPoint& candidate,
        const std::vector<double>& window,
        const AnomalyConfig& config
    );
};

} // namespace cloudspend

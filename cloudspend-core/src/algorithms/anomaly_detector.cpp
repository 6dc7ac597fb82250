#include <cloudspend/anomaly_detector.h>
#include <cloudspend/errors.h>
#include <cloudspend/stats_utils.h>
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>

namespace cloudspend {

const char* ToString(AnomalySeverity severity) {
    switch (severity) {
        case AnomalySeverity::Low: return "low";
        case AnomalySeverity::Medium: return "medium";
        case AnomalySeverity::High: return "high";
    }
    return "low";
}

std::vector<Anomaly> AnomalyDetector::Detect(const CostSeries& series,
                                             const AnomalyConfig& config) {
    return Detect(series, config.lookback_days, config.min_days, config);
}

std::vector<Anomaly> AnomalyDetector::Detect(const CostSeries& series,
                                             int lookback_days,
                                             int min_days,
                                             const AnomalyConfig& config) {
    if (lookback_days <= 0 || min_days <= 0) {
        throw InvalidInputError("lookback_days and min_days must be positive");
    }
    ValidateSeries(series);

    std::vector<Anomaly> anomalies;
    if (series.size() < static_cast<size_t>(min_days)) {
        spdlog::debug("AnomalyDetector: {} days of history, need {} - skipping",
                      series.size(), min_days);
        return anomalies;
    }

    const size_t required = static_cast<size_t>(
        std::max(1, std::min(lookback_days, config.min_baseline_points)));

    // Window start index advances monotonically with the candidate date
    size_t window_start = 0;
    for (size_t i = 0; i < series.size(); i++) {
        const Date earliest = series[i].date.AddDays(-lookback_days);
        while (window_start < i && series[window_start].date < earliest) {
            window_start++;
        }

        if (i - window_start < required) {
            continue;
        }

        std::vector<double> window;
        window.reserve(i - window_start);
        for (size_t j = window_start; j < i; j++) {
            window.push_back(series[j].amount);
        }

        if (auto anomaly = Evaluate(series[i], window, config)) {
            anomalies.push_back(std::move(*anomaly));
        }
    }

    spdlog::debug("AnomalyDetector: {} anomalies in {} days (lookback {})",
                  anomalies.size(), series.size(), lookback_days);
    return anomalies;
}

std::optional<Anomaly> AnomalyDetector::Evaluate(const DailyCostPoint& candidate,
                                                 const std::vector<double>& window,
                                                 const AnomalyConfig& config) {
    const double mean = stats::Mean(window);
    const double stddev = stats::StdDev(window);
    const stats::IQRBounds bounds = stats::ComputeIQRBounds(window, config.iqr_multiplier);

    // Only a zero-variance window takes the floor. A flat non-zero baseline
    // then still yields a finite z; a zero floor leaves z undefined and the
    // IQR rule alone decides.
    const double effective_stddev =
        stddev > 0.0 ? stddev : config.min_stddev_ratio * std::abs(mean);

    std::optional<double> z;
    if (effective_stddev > 0.0) {
        z = (candidate.amount - mean) / effective_stddev;
    }

    const bool z_fired = z && std::abs(*z) >= config.z_threshold;
    const bool iqr_fired = !bounds.Contains(candidate.amount);
    if (!z_fired && !iqr_fired) {
        return std::nullopt;
    }

    Anomaly anomaly;
    anomaly.date = candidate.date;
    anomaly.amount = candidate.amount;
    anomaly.baseline_mean = mean;
    anomaly.baseline_stddev = stddev;
    anomaly.z_score = z;
    anomaly.iqr_lower = bounds.lower;
    anomaly.iqr_upper = bounds.upper;
    anomaly.z_score_rule = z_fired;
    anomaly.iqr_rule = iqr_fired;
    anomaly.baseline_points = static_cast<int>(window.size());

    anomaly.severity = AnomalySeverity::Low;
    if (z_fired) {
        anomaly.severity = std::abs(*z) >= config.high_z_threshold
            ? AnomalySeverity::High
            : AnomalySeverity::Medium;
    }

    std::vector<std::string> reasons;
    if (z_fired) {
        reasons.push_back(fmt::format("z-score {:.2f} beyond +/-{:.1f} of {}-day baseline mean {:.2f}",
                                      *z, config.z_threshold, window.size(), mean));
    }
    if (iqr_fired) {
        reasons.push_back(fmt::format("IQR: amount {:.2f} outside [{:.2f}, {:.2f}]",
                                      candidate.amount, bounds.lower, bounds.upper));
    }
    if (!z) {
        reasons.push_back("zero-variance baseline, z-score undefined");
    }
    for (size_t i = 0; i < reasons.size(); i++) {
        if (i > 0) anomaly.reason += "; ";
        anomaly.reason += reasons[i];
    }

    return anomaly;
}

} // namespace cloudspend

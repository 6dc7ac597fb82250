#pragma once

/**
 * stats_utils.h - Statistical primitives shared by anomaly detection and forecasting
 *
 * Pure math functions that work on std::vector<double>.
 * Header-only; no function mutates its input.
 */

#include "api_export.h"
#include "errors.h"
#include <vector>
#include <cmath>
#include <algorithm>
#include <numeric>
#include <string>

namespace cloudspend {
namespace stats {

inline void RequireNonEmpty(const std::vector<double>& data, const char* what) {
    if (data.empty()) {
        throw InsufficientDataError(std::string(what) + " requires at least one value");
    }
}

// ===== Basic Statistics =====

inline double Mean(const std::vector<double>& data) {
    RequireNonEmpty(data, "Mean");
    return std::accumulate(data.begin(), data.end(), 0.0) / data.size();
}

// Sample variance (n-1) by default; 0 for a single value
inline double Variance(const std::vector<double>& data, bool sample = true) {
    RequireNonEmpty(data, "Variance");
    if (data.size() < 2) return 0.0;
    double mean = Mean(data);
    double sum = 0.0;
    for (double v : data) sum += (v - mean) * (v - mean);
    return sum / (sample ? data.size() - 1 : data.size());
}

inline double StdDev(const std::vector<double>& data, bool sample = true) {
    return std::sqrt(Variance(data, sample));
}

inline double Min(const std::vector<double>& data) {
    RequireNonEmpty(data, "Min");
    return *std::min_element(data.begin(), data.end());
}

inline double Max(const std::vector<double>& data) {
    RequireNonEmpty(data, "Max");
    return *std::max_element(data.begin(), data.end());
}

// ===== Percentiles =====

// Linear interpolation between closest ranks, p in [0, 1]
inline double Percentile(const std::vector<double>& data, double p) {
    RequireNonEmpty(data, "Percentile");
    std::vector<double> sorted = data;
    std::sort(sorted.begin(), sorted.end());
    p = std::min(1.0, std::max(0.0, p));
    double idx = p * (sorted.size() - 1);
    size_t lo = static_cast<size_t>(idx);
    size_t hi = std::min(lo + 1, sorted.size() - 1);
    double frac = idx - lo;
    return sorted[lo] * (1 - frac) + sorted[hi] * frac;
}

inline double Q1(const std::vector<double>& data) { return Percentile(data, 0.25); }
inline double Q3(const std::vector<double>& data) { return Percentile(data, 0.75); }
inline double IQR(const std::vector<double>& data) { return Q3(data) - Q1(data); }

struct IQRBounds {
    double q1 = 0.0;
    double q3 = 0.0;
    double iqr = 0.0;
    double lower = 0.0;     // q1 - k * iqr
    double upper = 0.0;     // q3 + k * iqr

    bool Contains(double value) const { return value >= lower && value <= upper; }
};

inline IQRBounds ComputeIQRBounds(const std::vector<double>& data, double k = 1.5) {
    IQRBounds b;
    b.q1 = Q1(data);
    b.q3 = Q3(data);
    b.iqr = b.q3 - b.q1;
    b.lower = b.q1 - k * b.iqr;
    b.upper = b.q3 + k * b.iqr;
    return b;
}

// ===== Dispersion =====

// stddev / mean * 100; 0 when the mean is 0
inline double CoefficientOfVariationPct(const std::vector<double>& data) {
    double mean = Mean(data);
    if (mean == 0.0) return 0.0;
    return StdDev(data) / std::abs(mean) * 100.0;
}

// ===== Regression =====

struct LinearFit {
    double slope = 0.0;
    double intercept = 0.0;

    double At(double x) const { return intercept + slope * x; }
};

/**
 * Ordinary least squares fit of y = intercept + slope * x
 * @throws InsufficientDataError with fewer than 2 points or no spread in x
 */
inline LinearFit LinearRegression(const std::vector<double>& x, const std::vector<double>& y) {
    if (x.size() != y.size()) {
        throw InvalidInputError("LinearRegression needs x and y of equal length");
    }
    if (x.size() < 2) {
        throw InsufficientDataError("LinearRegression requires at least 2 points, got " +
                                    std::to_string(x.size()));
    }

    double mean_x = Mean(x);
    double mean_y = Mean(y);
    double sxx = 0.0, sxy = 0.0;
    for (size_t i = 0; i < x.size(); i++) {
        double dx = x[i] - mean_x;
        sxx += dx * dx;
        sxy += dx * (y[i] - mean_y);
    }
    if (sxx == 0.0) {
        throw InsufficientDataError("LinearRegression requires at least 2 distinct x values");
    }

    LinearFit fit;
    fit.slope = sxy / sxx;
    fit.intercept = mean_y - fit.slope * mean_x;
    return fit;
}

// Fit over (index, value) pairs, index = 0..n-1
inline LinearFit LinearRegression(const std::vector<double>& y) {
    std::vector<double> x(y.size());
    std::iota(x.begin(), x.end(), 0.0);
    return LinearRegression(x, y);
}

// ===== Descriptive Stats Struct =====

struct DescriptiveStats {
    size_t count = 0;
    double mean = 0.0;
    double median = 0.0;
    double std_dev = 0.0;
    double min = 0.0;
    double max = 0.0;
    double q1 = 0.0;
    double q3 = 0.0;
    double iqr = 0.0;
};

inline DescriptiveStats ComputeStats(const std::vector<double>& data) {
    DescriptiveStats s;
    if (data.empty()) return s;

    s.count = data.size();
    s.mean = Mean(data);
    s.median = Percentile(data, 0.5);
    s.std_dev = StdDev(data);
    s.min = Min(data);
    s.max = Max(data);
    s.q1 = Q1(data);
    s.q3 = Q3(data);
    s.iqr = s.q3 - s.q1;

    return s;
}

} // namespace stats
} // namespace cloudspend

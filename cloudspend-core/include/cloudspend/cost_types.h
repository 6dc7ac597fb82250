#pragma once

#include "api_export.h"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace cloudspend {

// ============================================================================
// Calendar date
// ============================================================================

/**
 * Proleptic Gregorian calendar date without a time of day.
 * Arithmetic goes through a day count relative to 1970-01-01.
 */
class CLOUDSPEND_API Date {
public:
    Date() = default;
    Date(int year, unsigned month, unsigned day);

    /**
     * Parse an ISO date ("YYYY-MM-DD")
     * @throws InvalidInputError on malformed text or an impossible date
     */
    static Date Parse(const std::string& text);

    // Date from days since 1970-01-01
    static Date FromDayNumber(int64_t days);

    // Current date in UTC
    static Date Today();

    int64_t DayNumber() const;
    Date AddDays(int64_t days) const;
    std::string ToString() const;

    int Year() const { return year_; }
    unsigned Month() const { return month_; }
    unsigned Day() const { return day_; }

    // b - a in days (negative when b is earlier)
    static int64_t DaysBetween(const Date& a, const Date& b);

    bool operator==(const Date& other) const { return DayNumber() == other.DayNumber(); }
    bool operator!=(const Date& other) const { return !(*this == other); }
    bool operator<(const Date& other) const { return DayNumber() < other.DayNumber(); }
    bool operator<=(const Date& other) const { return DayNumber() <= other.DayNumber(); }
    bool operator>(const Date& other) const { return DayNumber() > other.DayNumber(); }
    bool operator>=(const Date& other) const { return DayNumber() >= other.DayNumber(); }

private:
    int year_ = 1970;
    unsigned month_ = 1;
    unsigned day_ = 1;
};

// ============================================================================
// Cost series
// ============================================================================

// One day of spend. A missing date in a series means "no data", not zero.
struct CLOUDSPEND_API DailyCostPoint {
    Date date;
    double amount = 0.0;
};

using CostSeries = std::vector<DailyCostPoint>;

// Service name -> spend for a period
using ServiceBreakdown = std::map<std::string, double>;

struct CLOUDSPEND_API ServiceShare {
    std::string service;
    double amount = 0.0;
    double share_pct = 0.0;     // Share of the breakdown total
};

/**
 * Check that dates are strictly ascending and amounts finite and >= 0
 * @throws InvalidInputError naming the first offending point
 */
CLOUDSPEND_API void ValidateSeries(const CostSeries& series);

/**
 * Check names are non-empty and amounts finite and >= 0
 * @throws InvalidInputError
 */
CLOUDSPEND_API void ValidateBreakdown(const ServiceBreakdown& breakdown);

// Amounts of a series in order
CLOUDSPEND_API std::vector<double> Amounts(const CostSeries& series);

// Sum of all amounts
CLOUDSPEND_API double TotalCost(const CostSeries& series);

/**
 * Largest services first (ties by name), each with its share of the total
 * @param limit Maximum entries returned (0 = all)
 */
CLOUDSPEND_API std::vector<ServiceShare> TopServices(const ServiceBreakdown& breakdown,
                                                     size_t limit = 0);

// Sum breakdowns from several accounts or periods
CLOUDSPEND_API ServiceBreakdown MergeBreakdowns(const std::vector<ServiceBreakdown>& breakdowns);

} // namespace cloudspend

#include <cloudspend/cost_types.h>
#include <cloudspend/errors.h>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <numeric>

namespace cloudspend {

namespace {

bool IsLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

unsigned DaysInMonth(int year, unsigned month) {
    static const unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && IsLeapYear(year)) return 29;
    return kDays[month - 1];
}

// Civil date <-> day count conversions (era based, valid for the whole
// proleptic Gregorian range)
int64_t DaysFromCivil(int y, unsigned m, unsigned d) {
    y -= m <= 2 ? 1 : 0;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

void CivilFromDays(int64_t z, int& y, unsigned& m, unsigned& d) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y = static_cast<int>(static_cast<int64_t>(yoe) + era * 400 + (m <= 2 ? 1 : 0));
}

} // namespace

// ============================================================================
// Date
// ============================================================================

Date::Date(int year, unsigned month, unsigned day)
    : year_(year), month_(month), day_(day) {
    if (month < 1 || month > 12 || day < 1 || day > DaysInMonth(year, month)) {
        char buf[64];
        std::snprintf(buf, sizeof(buf), "Invalid calendar date %04d-%02u-%02u", year, month, day);
        throw InvalidInputError(buf);
    }
}

Date Date::Parse(const std::string& text) {
    int year = 0;
    unsigned month = 0, day = 0;
    char tail = 0;
    if (text.size() != 10 || text[4] != '-' || text[7] != '-' ||
        std::sscanf(text.c_str(), "%4d-%2u-%2u%c", &year, &month, &day, &tail) != 3) {
        throw InvalidInputError("Invalid date '" + text + "', expected YYYY-MM-DD");
    }
    return Date(year, month, day);
}

Date Date::FromDayNumber(int64_t days) {
    int y = 0;
    unsigned m = 0, d = 0;
    CivilFromDays(days, y, m, d);
    return Date(y, m, d);
}

Date Date::Today() {
    auto now = std::chrono::system_clock::now();
    int64_t seconds = std::chrono::duration_cast<std::chrono::seconds>(
        now.time_since_epoch()).count();
    int64_t days = seconds / 86400;
    if (seconds < 0 && seconds % 86400 != 0) --days;
    return FromDayNumber(days);
}

int64_t Date::DayNumber() const {
    return DaysFromCivil(year_, month_, day_);
}

Date Date::AddDays(int64_t days) const {
    return FromDayNumber(DayNumber() + days);
}

std::string Date::ToString() const {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", year_, month_, day_);
    return buf;
}

int64_t Date::DaysBetween(const Date& a, const Date& b) {
    return b.DayNumber() - a.DayNumber();
}

// ============================================================================
// Series helpers
// ============================================================================

void ValidateSeries(const CostSeries& series) {
    for (size_t i = 0; i < series.size(); i++) {
        const auto& point = series[i];
        if (!std::isfinite(point.amount) || point.amount < 0.0) {
            throw InvalidInputError("Cost on " + point.date.ToString() +
                                    " must be a finite non-negative amount");
        }
        if (i > 0 && point.date <= series[i - 1].date) {
            throw InvalidInputError("Cost series dates must be strictly ascending (at " +
                                    point.date.ToString() + ")");
        }
    }
}

void ValidateBreakdown(const ServiceBreakdown& breakdown) {
    for (const auto& [service, amount] : breakdown) {
        if (service.empty()) {
            throw InvalidInputError("Service breakdown contains an empty service name");
        }
        if (!std::isfinite(amount) || amount < 0.0) {
            throw InvalidInputError("Spend for service '" + service +
                                    "' must be a finite non-negative amount");
        }
    }
}

std::vector<double> Amounts(const CostSeries& series) {
    std::vector<double> values;
    values.reserve(series.size());
    for (const auto& point : series) {
        values.push_back(point.amount);
    }
    return values;
}

double TotalCost(const CostSeries& series) {
    return std::accumulate(series.begin(), series.end(), 0.0,
                           [](double sum, const DailyCostPoint& p) { return sum + p.amount; });
}

std::vector<ServiceShare> TopServices(const ServiceBreakdown& breakdown, size_t limit) {
    double total = 0.0;
    for (const auto& entry : breakdown) total += entry.second;

    std::vector<ServiceShare> shares;
    shares.reserve(breakdown.size());
    for (const auto& [service, amount] : breakdown) {
        ServiceShare share;
        share.service = service;
        share.amount = amount;
        share.share_pct = total > 0.0 ? amount / total * 100.0 : 0.0;
        shares.push_back(share);
    }

    // std::map iterates by name, so a stable sort keeps ties alphabetical
    std::stable_sort(shares.begin(), shares.end(),
                     [](const ServiceShare& a, const ServiceShare& b) {
                         return a.amount > b.amount;
                     });

    if (limit > 0 && shares.size() > limit) {
        shares.resize(limit);
    }
    return shares;
}

ServiceBreakdown MergeBreakdowns(const std::vector<ServiceBreakdown>& breakdowns) {
    ServiceBreakdown merged;
    for (const auto& breakdown : breakdowns) {
        for (const auto& [service, amount] : breakdown) {
            merged[service] += amount;
        }
    }
    return merged;
}

} // namespace cloudspend

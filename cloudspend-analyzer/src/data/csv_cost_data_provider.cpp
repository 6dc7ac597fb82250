// csv_cost_data_provider.cpp - CSV replay implementation
#include "data/csv_cost_data_provider.h"
#include <cloudspend/errors.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>
#include <vector>

namespace cloudspend::analyzer::data {

namespace {

std::string Trim(const std::string& s) {
    const char* ws = " \t\r\n\"";
    size_t begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

// Split "a,b" at the last comma so names may contain commas
bool SplitRow(const std::string& line, std::string& key, std::string& value) {
    size_t comma = line.rfind(',');
    if (comma == std::string::npos) return false;
    key = Trim(line.substr(0, comma));
    value = Trim(line.substr(comma + 1));
    return true;
}

bool ParseAmount(const std::string& text, double& amount) {
    if (text.empty()) return false;
    try {
        size_t consumed = 0;
        amount = std::stod(text, &consumed);
        return consumed == text.size();
    } catch (const std::exception&) {
        return false;
    }
}

template <typename RowFn>
void ForEachRow(const std::string& text, const std::string& source, RowFn fn) {
    std::istringstream stream(text);
    std::string line;
    int line_num = 0;
    bool first_data_line = true;

    while (std::getline(stream, line)) {
        line_num++;
        std::string trimmed = Trim(line);
        if (trimmed.empty() || trimmed[0] == '#') continue;

        std::string key, value;
        if (!SplitRow(trimmed, key, value)) {
            throw ExternalProviderError(source + ":" + std::to_string(line_num) +
                                        ": expected two comma-separated columns");
        }

        double amount = 0.0;
        if (!ParseAmount(value, amount)) {
            // Header line
            if (first_data_line) {
                first_data_line = false;
                continue;
            }
            throw ExternalProviderError(source + ":" + std::to_string(line_num) +
                                        ": invalid amount '" + value + "'");
        }
        first_data_line = false;
        fn(line_num, key, amount);
    }
}

} // namespace

CsvCostDataProvider::CsvCostDataProvider(std::string daily_costs_path, std::string service_costs_path)
    : daily_costs_path_(std::move(daily_costs_path)),
      service_costs_path_(std::move(service_costs_path)) {
}

std::string CsvCostDataProvider::ReadFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ExternalProviderError("Cannot open cost file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

CostSeries CsvCostDataProvider::ParseDailyCosts(const std::string& text, const std::string& source) {
    CostSeries series;
    ForEachRow(text, source, [&](int line_num, const std::string& key, double amount) {
        try {
            series.push_back({Date::Parse(key), amount});
        } catch (const InvalidInputError& e) {
            throw ExternalProviderError(source + ":" + std::to_string(line_num) + ": " + e.what());
        }
    });

    // Exports are not always sorted; the engines require ascending dates
    std::stable_sort(series.begin(), series.end(),
                     [](const DailyCostPoint& a, const DailyCostPoint& b) { return a.date < b.date; });
    try {
        ValidateSeries(series);
    } catch (const InvalidInputError& e) {
        throw ExternalProviderError(source + ": " + e.what());
    }
    return series;
}

ServiceBreakdown CsvCostDataProvider::ParseServiceCosts(const std::string& text, const std::string& source) {
    ServiceBreakdown breakdown;
    ForEachRow(text, source, [&](int line_num, const std::string& key, double amount) {
        if (key.empty()) {
            throw ExternalProviderError(source + ":" + std::to_string(line_num) + ": empty service name");
        }
        if (!std::isfinite(amount) || amount < 0.0) {
            throw ExternalProviderError(source + ":" + std::to_string(line_num) + ": negative amount");
        }
        breakdown[key] += amount;
    });
    return breakdown;
}

CostSeries CsvCostDataProvider::FetchDailyCosts(const Date& start, const Date& end) {
    CostSeries all = ParseDailyCosts(ReadFile(daily_costs_path_), daily_costs_path_);

    CostSeries in_range;
    for (const auto& point : all) {
        if (point.date >= start && point.date <= end) {
            in_range.push_back(point);
        }
    }
    spdlog::debug("CSV provider: {} of {} daily rows in [{}, {}]",
                  in_range.size(), all.size(), start.ToString(), end.ToString());
    return in_range;
}

ServiceBreakdown CsvCostDataProvider::FetchServiceBreakdown(const Date& /*start*/, const Date& /*end*/) {
    // Service exports are already aggregated over the reporting period
    if (service_costs_path_.empty()) {
        return {};
    }
    return ParseServiceCosts(ReadFile(service_costs_path_), service_costs_path_);
}

} // namespace cloudspend::analyzer::data

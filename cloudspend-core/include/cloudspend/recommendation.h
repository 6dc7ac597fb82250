#pragma once

#include "api_export.h"
#include "cost_types.h"
#include <cstdint>
#include <optional>
#include <string>

namespace cloudspend {

enum class RiskLevel {
    Low,
    Medium,
    High
};

enum class Effort {
    QuickWin,
    Medium,
    Large
};

enum class RecommendationStatus {
    Pending,
    Implemented,
    Rejected
};

CLOUDSPEND_API const char* ToString(RiskLevel risk);
CLOUDSPEND_API const char* ToString(Effort effort);
CLOUDSPEND_API const char* ToString(RecommendationStatus status);

// Parsers accept the ToString() spellings; they throw InvalidInputError otherwise
CLOUDSPEND_API RiskLevel ParseRiskLevel(const std::string& text);
CLOUDSPEND_API Effort ParseEffort(const std::string& text);
CLOUDSPEND_API RecommendationStatus ParseRecommendationStatus(const std::string& text);

// What an upstream analysis pass proposes; the ledger assigns id and timestamps
struct CLOUDSPEND_API RecommendationCandidate {
    std::string title;
    std::string type;                       // e.g. "EC2_rightsizing", "S3_lifecycle"
    double estimated_monthly_savings = 0.0;
    RiskLevel risk_level = RiskLevel::Medium;
    Effort effort = Effort::Medium;
    std::string account_name = "default";
    std::string description;
};

struct CLOUDSPEND_API Recommendation {
    int64_t id = 0;
    std::string title;
    std::string type;
    double estimated_monthly_savings = 0.0;
    RiskLevel risk_level = RiskLevel::Medium;
    Effort effort = Effort::Medium;
    RecommendationStatus status = RecommendationStatus::Pending;
    int64_t created_at = 0;                         // Unix seconds, UTC
    std::optional<int64_t> resolved_at;             // Set iff resolved
    std::optional<double> actual_monthly_savings;   // Required when implemented
    std::optional<std::string> notes;
    std::string account_name = "default";
    std::string description;

    bool IsResolved() const { return status != RecommendationStatus::Pending; }
    bool IsQuickWin() const { return effort == Effort::QuickWin && risk_level == RiskLevel::Low; }
};

// Spend recorded for a period, kept for trend history
struct CLOUDSPEND_API CostSnapshot {
    int64_t id = 0;
    Date snapshot_date;
    std::string account_name = "default";
    double total_cost = 0.0;
    int period_days = 0;
    std::optional<ServiceBreakdown> service_breakdown;
};

// Aggregate ROI view of the ledger
struct CLOUDSPEND_API LedgerSummary {
    int64_t total = 0;
    int64_t pending = 0;
    int64_t implemented = 0;
    int64_t rejected = 0;
    double implementation_rate_pct = 0.0;
    double estimated_savings_total = 0.0;
    double implemented_savings_estimated_total = 0.0;
    double actual_savings_total = 0.0;
    double annual_projection = 0.0;
    std::optional<double> forecast_accuracy_pct;    // Absent when nothing qualifies
};

} // namespace cloudspend

#pragma once

/**
 * json_serialization.h - nlohmann::json conversions for every output record
 *
 * Field names match the data model; optional fields serialize as null.
 * Found by ADL, so `nlohmann::json j = forecast;` works directly.
 */

#include "api_export.h"
#include "anomaly_detector.h"
#include "cost_forecaster.h"
#include "cost_types.h"
#include "recommendation.h"
#include <nlohmann/json_fwd.hpp>

namespace cloudspend {

CLOUDSPEND_API void to_json(nlohmann::json& j, const Date& date);
CLOUDSPEND_API void from_json(const nlohmann::json& j, Date& date);

CLOUDSPEND_API void to_json(nlohmann::json& j, const DailyCostPoint& point);
// Accepts {"date": "...", "amount": x} or the legacy {"date": "...", "cost": x}
CLOUDSPEND_API void from_json(const nlohmann::json& j, DailyCostPoint& point);

CLOUDSPEND_API void to_json(nlohmann::json& j, const ServiceShare& share);
CLOUDSPEND_API void to_json(nlohmann::json& j, const Anomaly& anomaly);
CLOUDSPEND_API void to_json(nlohmann::json& j, const ForecastResult& forecast);
CLOUDSPEND_API void to_json(nlohmann::json& j, const BudgetAlert& alert);
CLOUDSPEND_API void to_json(nlohmann::json& j, const Recommendation& rec);
CLOUDSPEND_API void to_json(nlohmann::json& j, const CostSnapshot& snapshot);
CLOUDSPEND_API void to_json(nlohmann::json& j, const LedgerSummary& summary);

// Candidates supplied by upstream analysis passes
CLOUDSPEND_API void from_json(const nlohmann::json& j, RecommendationCandidate& candidate);

} // namespace cloudspend

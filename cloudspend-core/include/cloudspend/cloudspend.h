#pragma once

// Main header file for the CloudSpend core library
// Include this to get access to all analysis and ledger functionality

#define CLOUDSPEND_VERSION_MAJOR 0
#define CLOUDSPEND_VERSION_MINOR 3
#define CLOUDSPEND_VERSION_PATCH 0

// API export macros
#include "api_export.h"

// Core types (no dependencies first)
#include "errors.h"
#include "cost_types.h"
#include "stats_utils.h"
#include "analysis_config.h"

// Algorithms
#include "anomaly_detector.h"
#include "narrative_provider.h"
#include "cost_forecaster.h"

// Recommendation ledger and its storage backends
#include "recommendation.h"
#include "ledger_store.h"
#include "sqlite_ledger_store.h"
#include "savings_ledger.h"

#include "json_serialization.h"

namespace cloudspend {

// Get version string
CLOUDSPEND_API const char* GetVersionString();

} // namespace cloudspend

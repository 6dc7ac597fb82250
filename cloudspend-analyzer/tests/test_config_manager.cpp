#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "core/config_manager.h"
#include <chrono>
#include <filesystem>
#include <fstream>

using namespace cloudspend::analyzer::core;
using Catch::Matchers::WithinAbs;

namespace {

std::filesystem::path TempPath(const std::string& name) {
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    return std::filesystem::temp_directory_path() /
           ("cloudspend_" + name + "_" + std::to_string(stamp) + ".yaml");
}

void WriteFile(const std::filesystem::path& path, const std::string& text) {
    std::ofstream out(path);
    out << text;
}

} // namespace

TEST_CASE("ConfigManager - Defaults", "[config]") {
    AppConfig config = ConfigManager::GetDefaultConfig();
    REQUIRE(config.account_name == "default");
    REQUIRE_FALSE(config.monthly_budget.has_value());
    REQUIRE(config.anomaly.lookback_days == 7);
    REQUIRE(config.anomaly.z_threshold == 2.0);
    REQUIRE(config.forecast.horizon_days == 30);
    REQUIRE(config.data_source.type == "demo");
    REQUIRE(config.data_source.history_days == 30);
    REQUIRE(config.narrative.provider == "none");
    REQUIRE(config.log_level == "info");
}

TEST_CASE("ConfigManager - Load YAML", "[config]") {
    auto path = TempPath("load");
    WriteFile(path, R"(
analysis:
  account_name: prod
  monthly_budget: 9000
  anomaly:
    lookback_days: 14
    z_threshold: 2.5
  forecast:
    horizon_days: 60
  budget:
    high_overage_pct: 20
data_source:
  type: csv
  daily_costs_csv: /data/daily.csv
  history_days: 45
ledger:
  db_path: /var/lib/cloudspend/ledger.db
narrative:
  provider: mock
  timeout_ms: 2500
logging:
  level: debug
)");

    ConfigManager manager;
    REQUIRE(manager.Load(path.string()));
    const AppConfig& config = manager.GetConfig();

    REQUIRE(config.account_name == "prod");
    REQUIRE(config.monthly_budget.has_value());
    REQUIRE_THAT(*config.monthly_budget, WithinAbs(9000.0, 1e-9));
    REQUIRE(config.anomaly.lookback_days == 14);
    REQUIRE(config.anomaly.z_threshold == 2.5);
    REQUIRE(config.anomaly.high_z_threshold == 3.0);
    REQUIRE(config.forecast.horizon_days == 60);
    REQUIRE(config.budget.high_overage_pct == 20.0);
    REQUIRE(config.budget.medium_overage_pct == 5.0);
    REQUIRE(config.data_source.type == "csv");
    REQUIRE(config.data_source.daily_costs_csv == "/data/daily.csv");
    REQUIRE(config.data_source.history_days == 45);
    REQUIRE(config.ledger_db_path == "/var/lib/cloudspend/ledger.db");
    REQUIRE(config.narrative.provider == "mock");
    REQUIRE(config.forecast.narrative_timeout == std::chrono::milliseconds(2500));
    REQUIRE(config.log_level == "debug");

    std::filesystem::remove(path);
}

TEST_CASE("ConfigManager - Missing and malformed files", "[config]") {
    ConfigManager manager;
    AppConfig config;
    config.account_name = "stale";

    SECTION("Missing file yields defaults") {
        REQUIRE(manager.LoadConfig(TempPath("missing").string(), config));
        REQUIRE(config.account_name == "default");
    }

    SECTION("Malformed YAML yields defaults and failure") {
        auto path = TempPath("bad");
        WriteFile(path, "analysis: [unclosed\n  anomaly: {");
        REQUIRE_FALSE(manager.LoadConfig(path.string(), config));
        REQUIRE(config.account_name == "default");
        std::filesystem::remove(path);
    }

    SECTION("Wrong value type yields failure") {
        auto path = TempPath("type");
        WriteFile(path, "analysis:\n  anomaly:\n    lookback_days: seven\n");
        REQUIRE_FALSE(manager.LoadConfig(path.string(), config));
        std::filesystem::remove(path);
    }
}

TEST_CASE("ConfigManager - Save and reload", "[config]") {
    AppConfig original = ConfigManager::GetDefaultConfig();
    original.account_name = "staging";
    original.monthly_budget = 2500.0;
    original.anomaly.iqr_multiplier = 2.0;
    original.data_source.type = "csv";
    original.data_source.daily_costs_csv = "daily.csv";
    original.narrative.model = "gpt-4.1-mini";
    original.log_file = "cloudspend.log";

    auto path = TempPath("save");
    ConfigManager manager;
    REQUIRE(manager.SaveConfig(original, path.string()));

    AppConfig loaded;
    REQUIRE(manager.LoadConfig(path.string(), loaded));
    REQUIRE(loaded.account_name == "staging");
    REQUIRE(loaded.monthly_budget == 2500.0);
    REQUIRE(loaded.anomaly.iqr_multiplier == 2.0);
    REQUIRE(loaded.data_source.type == "csv");
    REQUIRE(loaded.data_source.daily_costs_csv == "daily.csv");
    REQUIRE(loaded.data_source.end_date.empty());
    REQUIRE(loaded.narrative.model == "gpt-4.1-mini");
    REQUIRE(loaded.log_file == "cloudspend.log");

    std::filesystem::remove(path);
}

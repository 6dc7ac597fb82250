// config_manager.h - YAML configuration loading/saving
#pragma once

#include <cloudspend/analysis_config.h>
#include <optional>
#include <string>

namespace cloudspend::analyzer::core {

// Where daily costs come from
struct DataSourceConfig {
    std::string type = "demo";          // demo | csv
    std::string daily_costs_csv;        // date,amount
    std::string service_costs_csv;      // service,amount
    int history_days = 30;              // Days fetched for analysis
    std::string end_date;               // YYYY-MM-DD, empty = today
};

struct NarrativeConfig {
    std::string provider = "none";      // none | mock | openai
    std::string endpoint = "https://api.openai.com";
    std::string model = "gpt-4o-mini";
    std::string api_key_env = "OPENAI_API_KEY";
    int timeout_ms = 15000;
};

struct AppConfig {
    // Analysis
    AnomalyConfig anomaly;
    ForecastConfig forecast;
    BudgetConfig budget;
    std::optional<double> monthly_budget;
    std::string account_name = "default";

    DataSourceConfig data_source;

    // Ledger
    std::string ledger_db_path = "./cloudspend_ledger.db";
    int ledger_busy_timeout_ms = 5000;

    NarrativeConfig narrative;

    // Logging
    std::string log_level = "info";
    std::string log_file;
};

class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager() = default;

    // Load config from YAML file into internal cache
    bool Load(const std::string& path);

    // Load config from YAML file
    bool LoadConfig(const std::string& path, AppConfig& config);

    // Save config to YAML file
    bool SaveConfig(const AppConfig& config, const std::string& path);

    const AppConfig& GetConfig() const { return cached_config_; }
    void SetConfig(const AppConfig& config) { cached_config_ = config; }

    static AppConfig GetDefaultConfig();

    // Get config file path (checks multiple locations)
    static std::string FindConfigFile();

private:
    std::string last_loaded_path_;
    AppConfig cached_config_;
};

} // namespace cloudspend::analyzer::core

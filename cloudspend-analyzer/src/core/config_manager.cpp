// config_manager.cpp - YAML configuration implementation
#include "core/config_manager.h"
#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <vector>
#include <spdlog/spdlog.h>

namespace cloudspend::analyzer::core {

ConfigManager::ConfigManager() {
    cached_config_ = GetDefaultConfig();
    spdlog::debug("ConfigManager created");
}

bool ConfigManager::Load(const std::string& path) {
    return LoadConfig(path, cached_config_);
}

bool ConfigManager::LoadConfig(const std::string& path, AppConfig& config) {
    try {
        if (!std::filesystem::exists(path)) {
            spdlog::warn("Config file not found: {}, using defaults", path);
            config = GetDefaultConfig();
            return true;
        }

        YAML::Node yaml = YAML::LoadFile(path);
        last_loaded_path_ = path;
        AppConfig loaded = GetDefaultConfig();

        // Analysis settings
        if (yaml["analysis"]) {
            auto analysis = yaml["analysis"];
            if (analysis["account_name"]) loaded.account_name = analysis["account_name"].as<std::string>();
            if (analysis["monthly_budget"] && !analysis["monthly_budget"].IsNull()) {
                loaded.monthly_budget = analysis["monthly_budget"].as<double>();
            }

            if (analysis["anomaly"]) {
                auto anomaly = analysis["anomaly"];
                if (anomaly["lookback_days"]) loaded.anomaly.lookback_days = anomaly["lookback_days"].as<int>();
                if (anomaly["min_days"]) loaded.anomaly.min_days = anomaly["min_days"].as<int>();
                if (anomaly["min_baseline_points"]) loaded.anomaly.min_baseline_points = anomaly["min_baseline_points"].as<int>();
                if (anomaly["z_threshold"]) loaded.anomaly.z_threshold = anomaly["z_threshold"].as<double>();
                if (anomaly["high_z_threshold"]) loaded.anomaly.high_z_threshold = anomaly["high_z_threshold"].as<double>();
                if (anomaly["iqr_multiplier"]) loaded.anomaly.iqr_multiplier = anomaly["iqr_multiplier"].as<double>();
                if (anomaly["min_stddev_ratio"]) loaded.anomaly.min_stddev_ratio = anomaly["min_stddev_ratio"].as<double>();
            }

            if (analysis["forecast"]) {
                auto forecast = analysis["forecast"];
                if (forecast["horizon_days"]) loaded.forecast.horizon_days = forecast["horizon_days"].as<int>();
                if (forecast["trend_band_pct"]) loaded.forecast.trend_band_pct = forecast["trend_band_pct"].as<double>();
                if (forecast["high_confidence_volatility_pct"]) {
                    loaded.forecast.high_confidence_volatility_pct = forecast["high_confidence_volatility_pct"].as<double>();
                }
                if (forecast["medium_confidence_volatility_pct"]) {
                    loaded.forecast.medium_confidence_volatility_pct = forecast["medium_confidence_volatility_pct"].as<double>();
                }
                if (forecast["high_confidence_min_days"]) {
                    loaded.forecast.high_confidence_min_days = forecast["high_confidence_min_days"].as<int>();
                }
                if (forecast["run_rate_days"]) loaded.forecast.run_rate_days = forecast["run_rate_days"].as<int>();
            }

            if (analysis["budget"]) {
                auto budget = analysis["budget"];
                if (budget["medium_overage_pct"]) loaded.budget.medium_overage_pct = budget["medium_overage_pct"].as<double>();
                if (budget["high_overage_pct"]) loaded.budget.high_overage_pct = budget["high_overage_pct"].as<double>();
            }
        }

        // Data source settings
        if (yaml["data_source"]) {
            auto source = yaml["data_source"];
            if (source["type"]) loaded.data_source.type = source["type"].as<std::string>();
            if (source["daily_costs_csv"]) loaded.data_source.daily_costs_csv = source["daily_costs_csv"].as<std::string>();
            if (source["service_costs_csv"]) loaded.data_source.service_costs_csv = source["service_costs_csv"].as<std::string>();
            if (source["history_days"]) loaded.data_source.history_days = source["history_days"].as<int>();
            if (source["end_date"]) loaded.data_source.end_date = source["end_date"].as<std::string>();
        }

        // Ledger settings
        if (yaml["ledger"]) {
            auto ledger = yaml["ledger"];
            if (ledger["db_path"]) loaded.ledger_db_path = ledger["db_path"].as<std::string>();
            if (ledger["busy_timeout_ms"]) loaded.ledger_busy_timeout_ms = ledger["busy_timeout_ms"].as<int>();
        }

        // Narrative settings
        if (yaml["narrative"]) {
            auto narrative = yaml["narrative"];
            if (narrative["provider"]) loaded.narrative.provider = narrative["provider"].as<std::string>();
            if (narrative["endpoint"]) loaded.narrative.endpoint = narrative["endpoint"].as<std::string>();
            if (narrative["model"]) loaded.narrative.model = narrative["model"].as<std::string>();
            if (narrative["api_key_env"]) loaded.narrative.api_key_env = narrative["api_key_env"].as<std::string>();
            if (narrative["timeout_ms"]) loaded.narrative.timeout_ms = narrative["timeout_ms"].as<int>();
        }
        loaded.forecast.narrative_timeout = std::chrono::milliseconds(loaded.narrative.timeout_ms);

        // Logging settings
        if (yaml["logging"]) {
            auto logging = yaml["logging"];
            if (logging["level"]) loaded.log_level = logging["level"].as<std::string>();
            if (logging["file"]) loaded.log_file = logging["file"].as<std::string>();
        }

        config = loaded;
        spdlog::info("Config loaded from: {}", path);
        return true;

    } catch (const YAML::Exception& e) {
        spdlog::error("Failed to parse config file: {}", e.what());
        config = GetDefaultConfig();
        return false;
    } catch (const std::exception& e) {
        spdlog::error("Failed to load config: {}", e.what());
        config = GetDefaultConfig();
        return false;
    }
}

bool ConfigManager::SaveConfig(const AppConfig& config, const std::string& path) {
    try {
        std::filesystem::path file_path(path);
        if (file_path.has_parent_path()) {
            std::filesystem::create_directories(file_path.parent_path());
        }

        YAML::Emitter out;
        out << YAML::BeginMap;

        out << YAML::Key << "analysis" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "account_name" << YAML::Value << config.account_name;
        if (config.monthly_budget) {
            out << YAML::Key << "monthly_budget" << YAML::Value << *config.monthly_budget;
        }

        out << YAML::Key << "anomaly" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "lookback_days" << YAML::Value << config.anomaly.lookback_days;
        out << YAML::Key << "min_days" << YAML::Value << config.anomaly.min_days;
        out << YAML::Key << "min_baseline_points" << YAML::Value << config.anomaly.min_baseline_points;
        out << YAML::Key << "z_threshold" << YAML::Value << config.anomaly.z_threshold;
        out << YAML::Key << "high_z_threshold" << YAML::Value << config.anomaly.high_z_threshold;
        out << YAML::Key << "iqr_multiplier" << YAML::Value << config.anomaly.iqr_multiplier;
        out << YAML::Key << "min_stddev_ratio" << YAML::Value << config.anomaly.min_stddev_ratio;
        out << YAML::EndMap;

        out << YAML::Key << "forecast" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "horizon_days" << YAML::Value << config.forecast.horizon_days;
        out << YAML::Key << "trend_band_pct" << YAML::Value << config.forecast.trend_band_pct;
        out << YAML::Key << "high_confidence_volatility_pct" << YAML::Value << config.forecast.high_confidence_volatility_pct;
        out << YAML::Key << "medium_confidence_volatility_pct" << YAML::Value << config.forecast.medium_confidence_volatility_pct;
        out << YAML::Key << "high_confidence_min_days" << YAML::Value << config.forecast.high_confidence_min_days;
        out << YAML::Key << "run_rate_days" << YAML::Value << config.forecast.run_rate_days;
        out << YAML::EndMap;

        out << YAML::Key << "budget" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "medium_overage_pct" << YAML::Value << config.budget.medium_overage_pct;
        out << YAML::Key << "high_overage_pct" << YAML::Value << config.budget.high_overage_pct;
        out << YAML::EndMap;
        out << YAML::EndMap;

        out << YAML::Key << "data_source" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "type" << YAML::Value << config.data_source.type;
        out << YAML::Key << "daily_costs_csv" << YAML::Value << config.data_source.daily_costs_csv;
        out << YAML::Key << "service_costs_csv" << YAML::Value << config.data_source.service_costs_csv;
        out << YAML::Key << "history_days" << YAML::Value << config.data_source.history_days;
        out << YAML::Key << "end_date" << YAML::Value << config.data_source.end_date;
        out << YAML::EndMap;

        out << YAML::Key << "ledger" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "db_path" << YAML::Value << config.ledger_db_path;
        out << YAML::Key << "busy_timeout_ms" << YAML::Value << config.ledger_busy_timeout_ms;
        out << YAML::EndMap;

        out << YAML::Key << "narrative" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "provider" << YAML::Value << config.narrative.provider;
        out << YAML::Key << "endpoint" << YAML::Value << config.narrative.endpoint;
        out << YAML::Key << "model" << YAML::Value << config.narrative.model;
        out << YAML::Key << "api_key_env" << YAML::Value << config.narrative.api_key_env;
        out << YAML::Key << "timeout_ms" << YAML::Value << config.narrative.timeout_ms;
        out << YAML::EndMap;

        out << YAML::Key << "logging" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "level" << YAML::Value << config.log_level;
        out << YAML::Key << "file" << YAML::Value << config.log_file;
        out << YAML::EndMap;

        out << YAML::EndMap;

        std::ofstream file(path);
        if (!file) {
            spdlog::error("Cannot open config file for writing: {}", path);
            return false;
        }
        file << out.c_str();
        file.close();

        spdlog::info("Config saved to: {}", path);
        return true;

    } catch (const std::exception& e) {
        spdlog::error("Failed to save config: {}", e.what());
        return false;
    }
}

AppConfig ConfigManager::GetDefaultConfig() {
    return AppConfig{};
}

std::string ConfigManager::FindConfigFile() {
    // Check in order of priority
    std::vector<std::string> paths = {
        "./config/cloudspend.yaml",
        "./cloudspend.yaml",
        "../config/cloudspend.yaml",
        std::string(getenv("HOME") ? getenv("HOME") : "") + "/.config/cloudspend/cloudspend.yaml",
    };

    for (const auto& path : paths) {
        if (!path.empty() && std::filesystem::exists(path)) {
            return path;
        }
    }

    return "./config/cloudspend.yaml";  // Default location
}

} // namespace cloudspend::analyzer::core

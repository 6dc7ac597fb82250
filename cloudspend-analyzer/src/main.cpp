// main.cpp - cloudspend command-line entry point
#include <cloudspend/cloudspend.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <vector>
#include "core/analysis_orchestrator.h"
#include "core/config_manager.h"
#include "data/csv_cost_data_provider.h"
#include "data/demo_cost_data_provider.h"
#include "narrative/http_narrative_provider.h"
#include "narrative/mock_narrative_provider.h"

using json = nlohmann::json;
using namespace cloudspend;
using namespace cloudspend::analyzer;

namespace {

// Process exit codes
constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;           // Bad arguments, invalid input or config
constexpr int kExitData = 2;            // Not enough data, external source failed
constexpr int kExitLedgerConflict = 3;  // Unknown id or invalid status transition
constexpr int kExitStorage = 4;         // Ledger database failure

// Thrown for malformed command lines
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& message) : std::runtime_error(message) {}
};

// --key=value options and bare positionals, in order
struct CommandLine {
    std::vector<std::string> positionals;
    std::map<std::string, std::string> options;

    bool Has(const std::string& key) const { return options.count(key) > 0; }

    std::string Get(const std::string& key, const std::string& fallback = "") const {
        auto it = options.find(key);
        return it != options.end() ? it->second : fallback;
    }

    std::string Require(const std::string& key) const {
        auto it = options.find(key);
        if (it == options.end() || it->second.empty()) {
            throw UsageError("missing required option --" + key + "=...");
        }
        return it->second;
    }

    double GetDouble(const std::string& key) const {
        const std::string text = Require(key);
        try {
            size_t consumed = 0;
            double value = std::stod(text, &consumed);
            if (consumed != text.size()) throw UsageError("");
            return value;
        } catch (const std::exception&) {
            throw UsageError("--" + key + " expects a number, got '" + text + "'");
        }
    }

    int64_t GetInt(const std::string& key) const {
        const std::string text = Require(key);
        try {
            size_t consumed = 0;
            long long value = std::stoll(text, &consumed);
            if (consumed != text.size()) throw UsageError("");
            return value;
        } catch (const std::exception&) {
            throw UsageError("--" + key + " expects an integer, got '" + text + "'");
        }
    }
};

CommandLine ParseCommandLine(int argc, char** argv) {
    CommandLine cmd;
    for (int i = 1; i < argc; ++i) {
        if (std::strncmp(argv[i], "--", 2) == 0) {
            const char* arg = argv[i] + 2;
            const char* eq = std::strchr(arg, '=');
            if (eq) {
                cmd.options[std::string(arg, eq - arg)] = std::string(eq + 1);
            } else {
                cmd.options[arg] = "true";
            }
        } else if (std::strcmp(argv[i], "-h") == 0) {
            cmd.options["help"] = "true";
        } else {
            cmd.positionals.emplace_back(argv[i]);
        }
    }
    return cmd;
}

void PrintUsage() {
    std::cerr <<
        "Usage: cloudspend [--config=PATH] [--db=PATH] [--log-level=LEVEL] <command> [options]\n"
        "\n"
        "Commands:\n"
        "  analyze            Detect anomalies, forecast spend, check budget, summarise ROI\n"
        "      [--end-date=YYYY-MM-DD] [--days=N] [--budget=AMOUNT] [--horizon=N]\n"
        "      [--source=demo|csv] [--daily-csv=PATH] [--services-csv=PATH]\n"
        "      [--account=NAME] [--narrative=none|mock|openai] [--no-ledger]\n"
        "  ledger add         --title=T --type=T --savings=AMOUNT [--risk=low|medium|high]\n"
        "                     [--effort=quick_win|medium|large] [--account=NAME] [--description=D]\n"
        "  ledger import      --file=PATH (JSON array of candidates)\n"
        "  ledger seed-demo   Load the demo recommendations (once)\n"
        "  ledger resolve     --id=N --status=implemented|rejected [--actual=AMOUNT] [--notes=TEXT]\n"
        "  ledger get         --id=N\n"
        "  ledger list        [--status=pending|implemented|rejected]\n"
        "  ledger summary\n"
        "  snapshot add       --total=AMOUNT --period-days=N [--account=NAME] [--date=YYYY-MM-DD]\n"
        "                     [--services-csv=PATH]\n"
        "  snapshot trend     [--account=NAME] [--limit=N]\n"
        "  version\n";
}

void PrintJson(const json& value) {
    std::cout << value.dump(2) << std::endl;
}

void ConfigureLogging(const core::AppConfig& config, const std::string& level_override) {
    std::vector<spdlog::sink_ptr> sinks;
    // stdout carries JSON output only
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (!config.log_file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file));
        } catch (const spdlog::spdlog_ex& e) {
            std::cerr << "Cannot open log file " << config.log_file << ": " << e.what() << std::endl;
        }
    }

    auto logger = std::make_shared<spdlog::logger>("cloudspend", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);

    const std::string level = level_override.empty() ? config.log_level : level_override;
    spdlog::level::level_enum parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && level != "off") {
        spdlog::warn("Unknown log level '{}', using info", level);
        parsed = spdlog::level::info;
    }
    spdlog::set_level(parsed);
}

std::shared_ptr<SavingsLedger> OpenLedger(const core::AppConfig& config) {
    auto store = std::make_shared<SqliteLedgerStore>(config.ledger_db_path, config.ledger_busy_timeout_ms);
    if (!store->Initialize()) {
        throw StorageError("Failed to open ledger database: " + config.ledger_db_path);
    }
    return std::make_shared<SavingsLedger>(store);
}

std::shared_ptr<data::CostDataProvider> MakeDataProvider(const core::AppConfig& config) {
    const auto& source = config.data_source;
    if (source.type == "demo") {
        return std::make_shared<data::DemoCostDataProvider>(config.account_name);
    }
    if (source.type == "csv") {
        if (source.daily_costs_csv.empty()) {
            throw UsageError("data_source.daily_costs_csv is required for the csv source");
        }
        return std::make_shared<data::CsvCostDataProvider>(source.daily_costs_csv, source.service_costs_csv);
    }
    throw UsageError("unknown data source type '" + source.type + "'");
}

std::shared_ptr<NarrativeProvider> MakeNarrativeProvider(const core::AppConfig& config) {
    const auto& settings = config.narrative;
    if (settings.provider == "none" || settings.provider.empty()) {
        return nullptr;
    }
    if (settings.provider == "mock") {
        return std::make_shared<narrative::MockNarrativeProvider>();
    }
    if (settings.provider == "openai") {
        narrative::HttpNarrativeOptions options;
        options.base_url = settings.endpoint;
        options.model = settings.model;
        const char* key = std::getenv(settings.api_key_env.c_str());
        if (key) {
            options.api_key = key;
        } else {
            spdlog::warn("Environment variable {} is not set; narratives will be unavailable",
                         settings.api_key_env);
        }
        return std::make_shared<narrative::HttpNarrativeProvider>(options);
    }
    throw UsageError("unknown narrative provider '" + settings.provider + "'");
}

// ============================================================================
// Commands
// ============================================================================

int RunAnalyze(const CommandLine& cmd, core::AppConfig config) {
    if (cmd.Has("days")) config.data_source.history_days = static_cast<int>(cmd.GetInt("days"));
    if (cmd.Has("budget")) config.monthly_budget = cmd.GetDouble("budget");
    if (cmd.Has("horizon")) config.forecast.horizon_days = static_cast<int>(cmd.GetInt("horizon"));
    if (cmd.Has("source")) config.data_source.type = cmd.Get("source");
    if (cmd.Has("daily-csv")) {
        config.data_source.type = "csv";
        config.data_source.daily_costs_csv = cmd.Get("daily-csv");
    }
    if (cmd.Has("services-csv")) config.data_source.service_costs_csv = cmd.Get("services-csv");
    if (cmd.Has("account")) config.account_name = cmd.Get("account");
    if (cmd.Has("narrative")) config.narrative.provider = cmd.Get("narrative");

    std::optional<Date> end_date;
    if (cmd.Has("end-date")) end_date = Date::Parse(cmd.Get("end-date"));

    std::shared_ptr<SavingsLedger> ledger;
    if (!cmd.Has("no-ledger")) {
        ledger = OpenLedger(config);
    }

    core::AnalysisOrchestrator orchestrator(config, MakeDataProvider(config), ledger,
                                            MakeNarrativeProvider(config));
    core::AnalysisReport report = orchestrator.Run(end_date);

    if (ledger && !report.daily_costs.empty()) {
        std::optional<ServiceBreakdown> services;
        if (!report.service_breakdown.empty()) services = report.service_breakdown;
        ledger->AddCostSnapshot(report.total_cost, report.period_days, report.account_name,
                                services, report.end_date);
    }

    PrintJson(report);
    return kExitOk;
}

int RunLedger(const CommandLine& cmd, const core::AppConfig& config) {
    if (cmd.positionals.size() < 2) {
        throw UsageError("ledger requires a subcommand");
    }
    const std::string& sub = cmd.positionals[1];
    auto ledger = OpenLedger(config);

    if (sub == "add") {
        RecommendationCandidate candidate;
        candidate.title = cmd.Require("title");
        candidate.type = cmd.Require("type");
        candidate.estimated_monthly_savings = cmd.GetDouble("savings");
        if (cmd.Has("risk")) candidate.risk_level = ParseRiskLevel(cmd.Get("risk"));
        if (cmd.Has("effort")) candidate.effort = ParseEffort(cmd.Get("effort"));
        candidate.account_name = cmd.Get("account", config.account_name);
        candidate.description = cmd.Get("description");

        int64_t id = ledger->Add(candidate);
        PrintJson(ledger->Get(id));
        return kExitOk;
    }

    if (sub == "import") {
        const std::string path = cmd.Require("file");
        std::ifstream file(path);
        if (!file.is_open()) {
            throw InvalidInputError("Cannot open " + path);
        }
        json candidates;
        try {
            candidates = json::parse(file);
        } catch (const json::exception& e) {
            throw InvalidInputError("Invalid JSON in " + path + ": " + e.what());
        }
        if (!candidates.is_array()) {
            throw InvalidInputError(path + " must hold a JSON array of recommendations");
        }

        json added = json::array();
        for (const auto& item : candidates) {
            RecommendationCandidate candidate;
            try {
                candidate = item.get<RecommendationCandidate>();
            } catch (const json::exception& e) {
                throw InvalidInputError("Invalid recommendation in " + path + ": " + e.what());
            }
            // Re-importing a file leaves already recorded rows untouched
            added.push_back(ledger->Get(ledger->AddIfAbsent(candidate).first));
        }
        PrintJson(added);
        return kExitOk;
    }

    if (sub == "seed-demo") {
        PrintJson(data::DemoCostDataProvider::SeedLedger(*ledger));
        return kExitOk;
    }

    if (sub == "resolve") {
        const int64_t id = cmd.GetInt("id");
        const RecommendationStatus status = ParseRecommendationStatus(cmd.Require("status"));
        std::optional<double> actual;
        if (cmd.Has("actual")) actual = cmd.GetDouble("actual");
        std::optional<std::string> notes;
        if (cmd.Has("notes")) notes = cmd.Get("notes");

        PrintJson(ledger->Resolve(id, status, actual, notes));
        return kExitOk;
    }

    if (sub == "get") {
        PrintJson(ledger->Get(cmd.GetInt("id")));
        return kExitOk;
    }

    if (sub == "list") {
        std::optional<RecommendationStatus> status;
        if (cmd.Has("status")) status = ParseRecommendationStatus(cmd.Get("status"));
        PrintJson(ledger->List(status));
        return kExitOk;
    }

    if (sub == "summary") {
        PrintJson(ledger->Summary());
        return kExitOk;
    }

    throw UsageError("unknown ledger subcommand '" + sub + "'");
}

int RunSnapshot(const CommandLine& cmd, const core::AppConfig& config) {
    if (cmd.positionals.size() < 2) {
        throw UsageError("snapshot requires a subcommand");
    }
    const std::string& sub = cmd.positionals[1];
    auto ledger = OpenLedger(config);
    const std::string account = cmd.Get("account", config.account_name);

    if (sub == "add") {
        const double total = cmd.GetDouble("total");
        const int period_days = static_cast<int>(cmd.GetInt("period-days"));
        std::optional<Date> date;
        if (cmd.Has("date")) date = Date::Parse(cmd.Get("date"));

        std::optional<ServiceBreakdown> services;
        if (cmd.Has("services-csv")) {
            const std::string path = cmd.Get("services-csv");
            std::ifstream file(path);
            if (!file.is_open()) {
                throw InvalidInputError("Cannot open " + path);
            }
            std::stringstream buffer;
            buffer << file.rdbuf();
            services = data::CsvCostDataProvider::ParseServiceCosts(buffer.str(), path);
        }

        CostSnapshot snapshot;
        snapshot.id = ledger->AddCostSnapshot(total, period_days, account, services, date);
        snapshot.snapshot_date = date ? *date : Date::Today();
        snapshot.account_name = account.empty() ? "default" : account;
        snapshot.total_cost = total;
        snapshot.period_days = period_days;
        snapshot.service_breakdown = services;
        PrintJson(snapshot);
        return kExitOk;
    }

    if (sub == "trend") {
        size_t limit = 30;
        if (cmd.Has("limit")) {
            const int64_t requested = cmd.GetInt("limit");
            if (requested <= 0) throw UsageError("--limit must be positive");
            limit = static_cast<size_t>(requested);
        }
        PrintJson(ledger->CostTrend(account, limit));
        return kExitOk;
    }

    throw UsageError("unknown snapshot subcommand '" + sub + "'");
}

int Dispatch(const CommandLine& cmd, const core::AppConfig& config) {
    const std::string& command = cmd.positionals.front();
    if (command == "analyze") return RunAnalyze(cmd, config);
    if (command == "ledger") return RunLedger(cmd, config);
    if (command == "snapshot") return RunSnapshot(cmd, config);
    if (command == "version") {
        std::cout << "cloudspend " << GetVersionString() << std::endl;
        return kExitOk;
    }
    throw UsageError("unknown command '" + command + "'");
}

} // namespace

int main(int argc, char** argv) {
    CommandLine cmd = ParseCommandLine(argc, argv);
    if (cmd.Has("help") || cmd.positionals.empty()) {
        PrintUsage();
        return cmd.Has("help") ? kExitOk : kExitUsage;
    }

    // Config loading logs before the configured sinks exist; keep stdout for JSON
    spdlog::set_default_logger(spdlog::stderr_color_mt("startup"));

    core::ConfigManager config_manager;
    const std::string config_path = cmd.Get("config", core::ConfigManager::FindConfigFile());
    if (!config_manager.Load(config_path)) {
        std::cerr << "Invalid configuration file: " << config_path << std::endl;
        return kExitUsage;
    }
    core::AppConfig config = config_manager.GetConfig();
    if (cmd.Has("db")) config.ledger_db_path = cmd.Get("db");

    ConfigureLogging(config, cmd.Get("log-level"));
    spdlog::debug("CloudSpend v{}", GetVersionString());

    try {
        return Dispatch(cmd, config);
    } catch (const UsageError& e) {
        spdlog::error("{}", e.what());
        PrintUsage();
        return kExitUsage;
    } catch (const InvalidInputError& e) {
        spdlog::error("Invalid input: {}", e.what());
        return kExitUsage;
    } catch (const InsufficientDataError& e) {
        spdlog::error("Insufficient data: {}", e.what());
        return kExitData;
    } catch (const ExternalProviderError& e) {
        spdlog::error("External provider failed: {}", e.what());
        return kExitData;
    } catch (const NotFoundError& e) {
        spdlog::error("{}", e.what());
        return kExitLedgerConflict;
    } catch (const InvalidTransitionError& e) {
        spdlog::error("{}", e.what());
        return kExitLedgerConflict;
    } catch (const StorageError& e) {
        spdlog::error("Ledger storage error: {}", e.what());
        return kExitStorage;
    } catch (const CostAnalysisError& e) {
        spdlog::error("{}", e.what());
        return kExitData;
    } catch (const std::exception& e) {
        spdlog::critical("Unexpected error: {}", e.what());
        return kExitData;
    }
}

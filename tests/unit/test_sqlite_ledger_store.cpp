#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cloudspend/errors.h>
#include <cloudspend/savings_ledger.h>
#include <cloudspend/sqlite_ledger_store.h>
#include <sqlite3.h>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <thread>
#include <vector>

using namespace cloudspend;
using Catch::Matchers::WithinAbs;

namespace {

// Unique database path, removed with its WAL side files
class TempDatabase {
public:
    explicit TempDatabase(const std::string& name) {
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = (std::filesystem::temp_directory_path() /
                 ("cloudspend_" + name + "_" + std::to_string(stamp) + ".db")).string();
        Remove();
    }
    ~TempDatabase() { Remove(); }

    const std::string& Path() const { return path_; }

private:
    void Remove() {
        std::error_code ec;
        for (const char* suffix : {"", "-wal", "-shm", "-journal"}) {
            std::filesystem::remove(path_ + suffix, ec);
        }
    }

    std::string path_;
};

std::shared_ptr<SqliteLedgerStore> OpenStore(const std::string& path) {
    auto store = std::make_shared<SqliteLedgerStore>(path);
    REQUIRE(store->Initialize());
    return store;
}

RecommendationCandidate Candidate(const std::string& title, double estimate) {
    RecommendationCandidate candidate;
    candidate.title = title;
    candidate.type = "S3_lifecycle";
    candidate.estimated_monthly_savings = estimate;
    candidate.risk_level = RiskLevel::Low;
    candidate.effort = Effort::QuickWin;
    candidate.account_name = "prod";
    candidate.description = "80% objects untouched for 45+ days";
    return candidate;
}

void ExecRaw(sqlite3* db, const char* sql) {
    char* error = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &error);
    std::string message = error ? error : "";
    sqlite3_free(error);
    INFO(message);
    REQUIRE(rc == SQLITE_OK);
}

} // namespace

TEST_CASE("SqliteLedgerStore - Fresh database", "[sqlite][ledger]") {
    TempDatabase db("fresh");
    auto store = OpenStore(db.Path());

    REQUIRE(store->IsInitialized());
    REQUIRE(store->GetSchemaVersion() == SqliteLedgerStore::kSchemaVersion);
    REQUIRE(store->Describe() == "sqlite:" + db.Path());
}

TEST_CASE("SqliteLedgerStore - Recommendation round-trip", "[sqlite][ledger]") {
    TempDatabase db("roundtrip");
    SavingsLedger ledger(OpenStore(db.Path()), []() { return int64_t{1710000000}; });

    auto candidate = Candidate("Add S3 lifecycle policy", 120.5);
    int64_t id = ledger.Add(candidate);
    Recommendation rec = ledger.Get(id);

    REQUIRE(rec.id == id);
    REQUIRE(rec.title == candidate.title);
    REQUIRE(rec.type == candidate.type);
    REQUIRE(rec.estimated_monthly_savings == candidate.estimated_monthly_savings);
    REQUIRE(rec.risk_level == candidate.risk_level);
    REQUIRE(rec.effort == candidate.effort);
    REQUIRE(rec.status == RecommendationStatus::Pending);
    REQUIRE(rec.created_at == 1710000000);
    REQUIRE(rec.account_name == candidate.account_name);
    REQUIRE(rec.description == candidate.description);
    REQUIRE_FALSE(rec.resolved_at.has_value());
    REQUIRE_FALSE(rec.actual_monthly_savings.has_value());
    REQUIRE_FALSE(rec.notes.has_value());

    Recommendation resolved = ledger.MarkImplemented(id, 110.25, std::string("Applied to 3 buckets"));
    Recommendation reread = ledger.Get(id);
    REQUIRE(reread.status == RecommendationStatus::Implemented);
    REQUIRE(reread.resolved_at == resolved.resolved_at);
    REQUIRE(reread.actual_monthly_savings == 110.25);
    REQUIRE(reread.notes == resolved.notes);
}

TEST_CASE("SqliteLedgerStore - Committed state survives reopen", "[sqlite][durability]") {
    TempDatabase db("durable");
    int64_t implemented_id = 0;
    int64_t pending_id = 0;

    {
        SavingsLedger ledger(OpenStore(db.Path()));
        implemented_id = ledger.Add(Candidate("Rightsize EC2", 100.0));
        pending_id = ledger.Add(Candidate("Delete idle EBS", 40.0));
        ledger.MarkImplemented(implemented_id, 97.0);
        ledger.AddCostSnapshot(2850.0, 30, "prod", ServiceBreakdown{{"Amazon EC2", 2000.0}},
                               Date(2024, 6, 30));
    }

    SavingsLedger reopened(OpenStore(db.Path()));
    REQUIRE(reopened.Get(implemented_id).status == RecommendationStatus::Implemented);
    REQUIRE(reopened.Get(pending_id).status == RecommendationStatus::Pending);

    LedgerSummary summary = reopened.Summary();
    REQUIRE(summary.total == 2);
    REQUIRE_THAT(*summary.forecast_accuracy_pct, WithinAbs(97.0, 1e-9));

    auto trend = reopened.CostTrend("prod");
    REQUIRE(trend.size() == 1);
    REQUIRE(trend[0].snapshot_date == Date(2024, 6, 30));
    REQUIRE(trend[0].service_breakdown->at("Amazon EC2") == 2000.0);

    // AUTOINCREMENT never reuses ids
    REQUIRE(reopened.Add(Candidate("Next", 1.0)) > pending_id);
}

TEST_CASE("SqliteLedgerStore - Failed transaction rolls back", "[sqlite][ledger]") {
    TempDatabase db("rollback");
    auto store = OpenStore(db.Path());

    Recommendation rec;
    rec.title = "Doomed";
    rec.type = "test";
    REQUIRE_THROWS_AS(store->RunInTransaction(TransactionMode::ReadWrite, [&](LedgerTransaction& txn) {
        txn.InsertRecommendation(rec);
        throw InvalidInputError("abort");
    }), InvalidInputError);

    store->RunInTransaction(TransactionMode::ReadOnly, [&](LedgerTransaction& txn) {
        REQUIRE(txn.ListRecommendations(std::nullopt).empty());
    });
}

TEST_CASE("SqliteLedgerStore - Migration from the legacy layout", "[sqlite][migration]") {
    TempDatabase db("migrate");

    {
        sqlite3* raw = nullptr;
        REQUIRE(sqlite3_open(db.Path().c_str(), &raw) == SQLITE_OK);
        ExecRaw(raw, R"(
            CREATE TABLE recommendations (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                created_date TEXT NOT NULL,
                account_name TEXT,
                recommendation_type TEXT NOT NULL,
                title TEXT NOT NULL,
                description TEXT,
                estimated_monthly_savings REAL,
                risk_level TEXT,
                effort TEXT,
                status TEXT DEFAULT 'pending',
                implemented_date TEXT,
                actual_monthly_savings REAL,
                notes TEXT
            );
            CREATE TABLE cost_snapshots (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                snapshot_date TEXT,
                account_name TEXT,
                total_cost REAL NOT NULL,
                period_days INTEGER,
                service_breakdown TEXT
            );
            INSERT INTO recommendations (id, created_date, account_name, recommendation_type, title,
                                         description, estimated_monthly_savings, risk_level, effort)
            VALUES (2, '2024-03-01 12:00:00', 'prod', 'EC2_rightsizing', 'Legacy pending',
                    'm5.xlarge at 12% CPU', 50.0, 'low', 'quick_win');
            INSERT INTO recommendations (id, created_date, account_name, recommendation_type, title,
                                         estimated_monthly_savings, risk_level, effort, status,
                                         implemented_date, actual_monthly_savings, notes)
            VALUES (5, '2024-03-01 12:00:00', NULL, 'S3_lifecycle', 'Legacy done',
                    80.0, 'medium', 'medium', 'implemented', '2024-03-02 12:00:00', 76.0, 'moved');
            INSERT INTO recommendations (id, created_date, recommendation_type, title,
                                         estimated_monthly_savings, risk_level, effort, status)
            VALUES (9, '2024-03-01 12:00:00', 'NAT_gateway', 'Legacy rejected',
                    30.0, 'High', 'unknown', 'rejected');
            INSERT INTO cost_snapshots (snapshot_date, account_name, total_cost, period_days)
            VALUES ('2024-03-01', 'prod', 900.0, 7), ('2024-03-01', 'prod', 950.0, 7);
        )");
        sqlite3_close(raw);
    }

    auto store = OpenStore(db.Path());
    REQUIRE(store->GetSchemaVersion() == SqliteLedgerStore::kSchemaVersion);

    SavingsLedger ledger(store);
    Recommendation pending = ledger.Get(2);
    REQUIRE(pending.title == "Legacy pending");
    REQUIRE(pending.account_name == "prod");
    REQUIRE(pending.description == "m5.xlarge at 12% CPU");
    REQUIRE(pending.effort == Effort::QuickWin);
    REQUIRE(pending.status == RecommendationStatus::Pending);
    REQUIRE(pending.created_at == 1709294400);
    REQUIRE_FALSE(pending.resolved_at.has_value());

    Recommendation done = ledger.Get(5);
    REQUIRE(done.status == RecommendationStatus::Implemented);
    REQUIRE(done.account_name == "default");
    REQUIRE(done.description.empty());
    REQUIRE(done.resolved_at == 1709294400 + 86400);
    REQUIRE(done.actual_monthly_savings == 76.0);
    REQUIRE(done.notes == "moved");

    Recommendation rejected = ledger.Get(9);
    REQUIRE(rejected.status == RecommendationStatus::Rejected);
    REQUIRE(rejected.risk_level == RiskLevel::High);
    REQUIRE(rejected.effort == Effort::Medium);
    REQUIRE(rejected.resolved_at == rejected.created_at);

    // Duplicate snapshots of one day collapse to the newest
    auto trend = ledger.CostTrend("prod");
    REQUIRE(trend.size() == 1);
    REQUIRE(trend[0].total_cost == 950.0);

    int64_t next = ledger.Add(Candidate("After migration", 10.0));
    REQUIRE(next == 10);

    SECTION("Reopening a migrated database is a no-op") {
        auto again = OpenStore(db.Path());
        REQUIRE(again->GetSchemaVersion() == SqliteLedgerStore::kSchemaVersion);
        SavingsLedger reopened(again);
        REQUIRE(reopened.List().size() == 4);
    }
}

TEST_CASE("SqliteLedgerStore - Snapshot for the same account and day is replaced", "[sqlite][snapshot]") {
    TempDatabase db("snapshot_upsert");
    auto store = OpenStore(db.Path());
    SavingsLedger ledger(store);
    const Date day = Date::Parse("2024-05-10");

    int64_t first = ledger.AddCostSnapshot(1200.0, 7, "prod", std::nullopt, day);
    int64_t second = ledger.AddCostSnapshot(1350.0, 14, "prod",
                                            ServiceBreakdown{{"Amazon EC2", 1000.0}}, day);
    ledger.AddCostSnapshot(400.0, 7, "staging", std::nullopt, day);

    REQUIRE(second == first);
    auto trend = ledger.CostTrend("prod");
    REQUIRE(trend.size() == 1);
    REQUIRE(trend[0].id == first);
    REQUIRE(trend[0].total_cost == 1350.0);
    REQUIRE(trend[0].period_days == 14);
    REQUIRE(trend[0].service_breakdown.has_value());
    REQUIRE(ledger.CostTrend("staging").size() == 1);

    // Survives a reopen with the unique key in place
    SavingsLedger reopened(OpenStore(db.Path()));
    REQUIRE(reopened.CostTrend("prod").size() == 1);
}

TEST_CASE("SqliteLedgerStore - Newer schema is refused", "[sqlite][migration]") {
    TempDatabase db("future");
    {
        sqlite3* raw = nullptr;
        REQUIRE(sqlite3_open(db.Path().c_str(), &raw) == SQLITE_OK);
        ExecRaw(raw, "CREATE TABLE recommendations (id INTEGER PRIMARY KEY); PRAGMA user_version = 99;");
        sqlite3_close(raw);
    }

    SqliteLedgerStore store(db.Path());
    REQUIRE_FALSE(store.Initialize());
    REQUIRE_FALSE(store.IsInitialized());
}

TEST_CASE("SqliteLedgerStore - Concurrent resolves have one winner", "[sqlite][concurrency]") {
    TempDatabase db("concurrent");
    int64_t id = 0;
    {
        SavingsLedger setup(OpenStore(db.Path()));
        id = setup.Add(Candidate("Contended", 100.0));
    }

    SECTION("Separate connections") {
        constexpr int kWorkers = 4;
        std::vector<std::shared_ptr<SavingsLedger>> ledgers;
        for (int i = 0; i < kWorkers; i++) {
            ledgers.push_back(std::make_shared<SavingsLedger>(OpenStore(db.Path())));
        }

        std::atomic<int> winners{0};
        std::atomic<int> conflicts{0};
        std::vector<std::thread> threads;
        for (int i = 0; i < kWorkers; i++) {
            threads.emplace_back([&, i]() {
                try {
                    ledgers[i]->MarkImplemented(id, 90.0 + i);
                    winners++;
                } catch (const InvalidTransitionError&) {
                    conflicts++;
                }
            });
        }
        for (auto& t : threads) t.join();

        REQUIRE(winners == 1);
        REQUIRE(conflicts == kWorkers - 1);
        REQUIRE(ledgers[0]->Summary().implemented == 1);
    }

    SECTION("Shared connection") {
        auto ledger = std::make_shared<SavingsLedger>(OpenStore(db.Path()));
        std::atomic<int> winners{0};
        std::atomic<int> conflicts{0};
        std::vector<std::thread> threads;
        for (int i = 0; i < 4; i++) {
            threads.emplace_back([&]() {
                try {
                    ledger->MarkRejected(id);
                    winners++;
                } catch (const InvalidTransitionError&) {
                    conflicts++;
                }
            });
        }
        for (auto& t : threads) t.join();

        REQUIRE(winners == 1);
        REQUIRE(conflicts == 3);
    }
}

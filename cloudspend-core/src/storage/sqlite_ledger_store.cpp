// sqlite_ledger_store.cpp - SQLite persistence for the recommendation ledger
#include <cloudspend/sqlite_ledger_store.h>
#include <cloudspend/errors.h>
#include <sqlite3.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <memory>

namespace cloudspend {

namespace {

using StatementPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

StatementPtr Prepare(sqlite3* db, const char* sql) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw StorageError(std::string("Failed to prepare statement: ") + sqlite3_errmsg(db));
    }
    return StatementPtr(stmt, &sqlite3_finalize);
}

void StepDone(sqlite3* db, sqlite3_stmt* stmt) {
    int rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        throw StorageError(std::string("SQL step failed: ") + sqlite3_errmsg(db));
    }
}

void BindText(sqlite3_stmt* stmt, int index, const std::string& value) {
    sqlite3_bind_text(stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

std::string ColumnText(sqlite3_stmt* stmt, int index) {
    const unsigned char* text = sqlite3_column_text(stmt, index);
    if (!text) return {};
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt, index)));
}

bool ColumnIsNull(sqlite3_stmt* stmt, int index) {
    return sqlite3_column_type(stmt, index) == SQLITE_NULL;
}

constexpr const char* kSelectRecommendation = R"(
    SELECT id, title, recommendation_type, estimated_monthly_savings, risk_level, effort,
           status, created_at, resolved_at, actual_monthly_savings, notes,
           account_name, description
    FROM recommendations
)";

Recommendation ReadRecommendation(sqlite3_stmt* stmt) {
    Recommendation rec;
    rec.id = sqlite3_column_int64(stmt, 0);
    rec.title = ColumnText(stmt, 1);
    rec.type = ColumnText(stmt, 2);
    rec.estimated_monthly_savings = sqlite3_column_double(stmt, 3);
    rec.risk_level = ParseRiskLevel(ColumnText(stmt, 4));
    rec.effort = ParseEffort(ColumnText(stmt, 5));
    rec.status = ParseRecommendationStatus(ColumnText(stmt, 6));
    rec.created_at = sqlite3_column_int64(stmt, 7);
    if (!ColumnIsNull(stmt, 8)) rec.resolved_at = sqlite3_column_int64(stmt, 8);
    if (!ColumnIsNull(stmt, 9)) rec.actual_monthly_savings = sqlite3_column_double(stmt, 9);
    if (!ColumnIsNull(stmt, 10)) rec.notes = ColumnText(stmt, 10);
    rec.account_name = ColumnText(stmt, 11);
    rec.description = ColumnText(stmt, 12);
    return rec;
}

// Binds every column except id, in the order used by INSERT and UPDATE below
void BindRecommendationColumns(sqlite3_stmt* stmt, const Recommendation& rec) {
    BindText(stmt, 1, rec.title);
    BindText(stmt, 2, rec.type);
    sqlite3_bind_double(stmt, 3, rec.estimated_monthly_savings);
    BindText(stmt, 4, ToString(rec.risk_level));
    BindText(stmt, 5, ToString(rec.effort));
    BindText(stmt, 6, ToString(rec.status));
    sqlite3_bind_int64(stmt, 7, rec.created_at);
    if (rec.resolved_at) {
        sqlite3_bind_int64(stmt, 8, *rec.resolved_at);
    } else {
        sqlite3_bind_null(stmt, 8);
    }
    if (rec.actual_monthly_savings) {
        sqlite3_bind_double(stmt, 9, *rec.actual_monthly_savings);
    } else {
        sqlite3_bind_null(stmt, 9);
    }
    if (rec.notes) {
        BindText(stmt, 10, *rec.notes);
    } else {
        sqlite3_bind_null(stmt, 10);
    }
    BindText(stmt, 11, rec.account_name);
    BindText(stmt, 12, rec.description);
}

class SqliteTransaction : public LedgerTransaction {
public:
    SqliteTransaction(sqlite3* db, bool read_only) : db_(db), read_only_(read_only) {}

    int64_t InsertRecommendation(const Recommendation& rec) override {
        RequireWritable();
        auto stmt = Prepare(db_, R"(
            INSERT INTO recommendations
                (title, recommendation_type, estimated_monthly_savings, risk_level, effort,
                 status, created_at, resolved_at, actual_monthly_savings, notes,
                 account_name, description)
            VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
        )");
        BindRecommendationColumns(stmt.get(), rec);
        StepDone(db_, stmt.get());
        return sqlite3_last_insert_rowid(db_);
    }

    std::optional<Recommendation> FindRecommendation(int64_t id) override {
        std::string sql = std::string(kSelectRecommendation) + " WHERE id = ?;";
        auto stmt = Prepare(db_, sql.c_str());
        sqlite3_bind_int64(stmt.get(), 1, id);

        int rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_ROW) {
            return ReadRecommendation(stmt.get());
        }
        if (rc != SQLITE_DONE) {
            throw StorageError(std::string("Failed to read recommendation: ") + sqlite3_errmsg(db_));
        }
        return std::nullopt;
    }

    void UpdateRecommendation(const Recommendation& rec) override {
        RequireWritable();
        auto stmt = Prepare(db_, R"(
            UPDATE recommendations
            SET title = ?, recommendation_type = ?, estimated_monthly_savings = ?,
                risk_level = ?, effort = ?, status = ?, created_at = ?, resolved_at = ?,
                actual_monthly_savings = ?, notes = ?, account_name = ?, description = ?
            WHERE id = ?;
        )");
        BindRecommendationColumns(stmt.get(), rec);
        sqlite3_bind_int64(stmt.get(), 13, rec.id);
        StepDone(db_, stmt.get());

        if (sqlite3_changes(db_) == 0) {
            throw NotFoundError("Recommendation " + std::to_string(rec.id) + " not found");
        }
    }

    std::vector<Recommendation> ListRecommendations(
        std::optional<RecommendationStatus> status) override {
        std::string sql = kSelectRecommendation;
        if (status) sql += " WHERE status = ?";
        sql += " ORDER BY created_at DESC, id DESC;";

        auto stmt = Prepare(db_, sql.c_str());
        if (status) BindText(stmt.get(), 1, ToString(*status));

        std::vector<Recommendation> rows;
        int rc;
        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
            rows.push_back(ReadRecommendation(stmt.get()));
        }
        if (rc != SQLITE_DONE) {
            throw StorageError(std::string("Failed to list recommendations: ") + sqlite3_errmsg(db_));
        }
        return rows;
    }

    int64_t UpsertSnapshot(const CostSnapshot& snapshot) override {
        RequireWritable();
        auto stmt = Prepare(db_, R"(
            INSERT INTO cost_snapshots
                (snapshot_date, account_name, total_cost, period_days, service_breakdown)
            VALUES (?, ?, ?, ?, ?)
            ON CONFLICT(account_name, snapshot_date) DO UPDATE SET
                total_cost = excluded.total_cost,
                period_days = excluded.period_days,
                service_breakdown = excluded.service_breakdown
            RETURNING id;
        )");
        BindText(stmt.get(), 1, snapshot.snapshot_date.ToString());
        BindText(stmt.get(), 2, snapshot.account_name);
        sqlite3_bind_double(stmt.get(), 3, snapshot.total_cost);
        sqlite3_bind_int(stmt.get(), 4, snapshot.period_days);
        if (snapshot.service_breakdown) {
            BindText(stmt.get(), 5, nlohmann::json(*snapshot.service_breakdown).dump());
        } else {
            sqlite3_bind_null(stmt.get(), 5);
        }
        if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
            throw StorageError(std::string("Failed to write cost snapshot: ") + sqlite3_errmsg(db_));
        }
        int64_t id = sqlite3_column_int64(stmt.get(), 0);
        StepDone(db_, stmt.get());
        return id;
    }

    std::vector<CostSnapshot> ListSnapshots(const std::string& account_name,
                                            size_t limit) override {
        auto stmt = Prepare(db_, R"(
            SELECT id, snapshot_date, account_name, total_cost, period_days, service_breakdown
            FROM cost_snapshots
            WHERE account_name = ?
            ORDER BY snapshot_date DESC, id DESC
            LIMIT ?;
        )");
        BindText(stmt.get(), 1, account_name);
        sqlite3_bind_int64(stmt.get(), 2, static_cast<sqlite3_int64>(limit));

        std::vector<CostSnapshot> rows;
        int rc;
        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
            CostSnapshot snapshot;
            snapshot.id = sqlite3_column_int64(stmt.get(), 0);
            snapshot.snapshot_date = Date::Parse(ColumnText(stmt.get(), 1));
            snapshot.account_name = ColumnText(stmt.get(), 2);
            snapshot.total_cost = sqlite3_column_double(stmt.get(), 3);
            snapshot.period_days = sqlite3_column_int(stmt.get(), 4);
            if (!ColumnIsNull(stmt.get(), 5)) {
                try {
                    snapshot.service_breakdown =
                        nlohmann::json::parse(ColumnText(stmt.get(), 5)).get<ServiceBreakdown>();
                } catch (const nlohmann::json::exception& e) {
                    throw StorageError("Corrupt service breakdown in snapshot " +
                                       std::to_string(snapshot.id) + ": " + e.what());
                }
            }
            rows.push_back(std::move(snapshot));
        }
        if (rc != SQLITE_DONE) {
            throw StorageError(std::string("Failed to list cost snapshots: ") + sqlite3_errmsg(db_));
        }
        return rows;
    }

private:
    void RequireWritable() const {
        if (read_only_) {
            throw StorageError("Write attempted inside a read-only ledger transaction");
        }
    }

    sqlite3* db_;
    bool read_only_;
};

} // namespace

SqliteLedgerStore::SqliteLedgerStore(const std::string& db_path, int busy_timeout_ms)
    : db_path_(db_path), busy_timeout_ms_(busy_timeout_ms) {
}

SqliteLedgerStore::~SqliteLedgerStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool SqliteLedgerStore::Initialize() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (initialized_) {
        return true;
    }

    int rc = sqlite3_open(db_path_.c_str(), &db_);
    if (rc != SQLITE_OK) {
        spdlog::error("Failed to open ledger database {}: {}", db_path_,
                      db_ ? sqlite3_errmsg(db_) : "out of memory");
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    sqlite3_busy_timeout(db_, busy_timeout_ms_);

    // WAL lets readers see a consistent snapshot while a writer commits;
    // FULL sync makes every commit durable before it returns
    if (!ExecuteSQL("PRAGMA journal_mode=WAL;")) {
        spdlog::warn("WAL journal unavailable for {}, using the default journal", db_path_);
    }
    if (!ExecuteSQL("PRAGMA synchronous=FULL;") || !ExecuteSQL("PRAGMA foreign_keys=ON;")) {
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    if (!CreateOrMigrateSchema()) {
        spdlog::error("Failed to prepare ledger schema in {}", db_path_);
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    initialized_ = true;
    spdlog::info("Savings ledger initialized: {} (schema v{})", db_path_, kSchemaVersion);
    return true;
}

namespace {

constexpr const char* kCreateRecommendations = R"(
    CREATE TABLE recommendations (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        title TEXT NOT NULL,
        recommendation_type TEXT NOT NULL,
        estimated_monthly_savings REAL NOT NULL CHECK (estimated_monthly_savings >= 0),
        risk_level TEXT NOT NULL,
        effort TEXT NOT NULL,
        status TEXT NOT NULL DEFAULT 'pending',
        created_at INTEGER NOT NULL,
        resolved_at INTEGER,
        actual_monthly_savings REAL,
        notes TEXT,
        account_name TEXT NOT NULL DEFAULT 'default',
        description TEXT NOT NULL DEFAULT ''
    );
)";

} // namespace

bool SqliteLedgerStore::CreateOrMigrateSchema() {
    if (!ExecuteSQL("BEGIN IMMEDIATE;")) {
        return false;
    }

    bool ok = true;
    try {
        int version = GetSchemaVersion();

        if (!TableExists("recommendations")) {
            ok = ExecuteSQL(kCreateRecommendations);
        } else if (version == 0 && HasColumn("recommendations", "created_date")) {
            ok = MigrateLegacyLayout();
        } else if (version != kSchemaVersion) {
            spdlog::error("Ledger {} has schema v{}, supported is v{}",
                          db_path_, version, kSchemaVersion);
            ok = false;
        }
    } catch (const StorageError& e) {
        spdlog::error("Ledger schema inspection failed: {}", e.what());
        ok = false;
    }

    const char* create_snapshots = R"(
        CREATE TABLE IF NOT EXISTS cost_snapshots (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            snapshot_date TEXT NOT NULL,
            account_name TEXT NOT NULL DEFAULT 'default',
            total_cost REAL NOT NULL,
            period_days INTEGER NOT NULL,
            service_breakdown TEXT
        );
        CREATE INDEX IF NOT EXISTS idx_recommendations_status ON recommendations(status);
    )";
    ok = ok && ExecuteSQL(create_snapshots);
    ok = ok && EnsureSnapshotKey();
    ok = ok && ExecuteSQL("PRAGMA user_version = " + std::to_string(kSchemaVersion) + ";");

    if (!ok) {
        if (!ExecuteSQL("ROLLBACK;")) {
            spdlog::error("Rollback of schema changes failed on {}", db_path_);
        }
        return false;
    }
    return ExecuteSQL("COMMIT;");
}

bool SqliteLedgerStore::MigrateLegacyLayout() {
    spdlog::info("Migrating legacy ledger layout in {} to v{}", db_path_, kSchemaVersion);

    // Legacy rows keep their ids. Timestamps were "YYYY-MM-DD HH:MM:SS" text
    // without a zone and are read as UTC; unparseable ones become 0. Unknown risk or effort values fall
    // back to medium so every row reads back.
    const char* copy_rows = R"(
        INSERT INTO recommendations
            (id, title, recommendation_type, estimated_monthly_savings, risk_level, effort,
             status, created_at, resolved_at, actual_monthly_savings, notes,
             account_name, description)
        SELECT id,
               title,
               recommendation_type,
               MAX(COALESCE(estimated_monthly_savings, 0), 0),
               CASE LOWER(risk_level) WHEN 'low' THEN 'low' WHEN 'high' THEN 'high'
                    ELSE 'medium' END,
               CASE LOWER(effort) WHEN 'quick_win' THEN 'quick_win'
                    WHEN 'large' THEN 'large' WHEN 'complex' THEN 'large'
                    ELSE 'medium' END,
               row_status,
               created,
               CASE WHEN row_status = 'pending' THEN NULL
                    ELSE COALESCE(CAST(strftime('%s', implemented_date) AS INTEGER), created) END,
               CASE WHEN row_status = 'implemented' THEN actual_monthly_savings END,
               notes,
               COALESCE(NULLIF(account_name, ''), 'default'),
               COALESCE(description, '')
        FROM (
            SELECT *,
                   COALESCE(CAST(strftime('%s', created_date) AS INTEGER), 0) AS created,
                   CASE LOWER(COALESCE(status, 'pending'))
                        WHEN 'implemented' THEN 'implemented'
                        WHEN 'rejected' THEN 'rejected'
                        ELSE 'pending' END AS row_status
            FROM recommendations_legacy
        );
    )";

    // Legacy snapshots allowed a missing account, period or date
    const char* fix_snapshots = R"(
        UPDATE cost_snapshots SET account_name = 'default'
            WHERE account_name IS NULL OR account_name = '';
        UPDATE cost_snapshots SET period_days = 0 WHERE period_days IS NULL;
        DELETE FROM cost_snapshots WHERE snapshot_date IS NULL;
    )";

    bool ok = ExecuteSQL("ALTER TABLE recommendations RENAME TO recommendations_legacy;") &&
              ExecuteSQL(kCreateRecommendations) &&
              ExecuteSQL(copy_rows);
    // The sequence may have run past the highest surviving id
    ok = ok && ExecuteSQL(R"(
        UPDATE sqlite_sequence
           SET seq = (SELECT MAX(seq) FROM sqlite_sequence
                       WHERE name IN ('recommendations', 'recommendations_legacy'))
         WHERE name = 'recommendations';
    )");
    ok = ok && ExecuteSQL("DROP TABLE recommendations_legacy;");
    if (ok && TableExists("cost_snapshots")) {
        ok = ExecuteSQL(fix_snapshots);
    }
    return ok;
}

bool SqliteLedgerStore::EnsureSnapshotKey() {
    auto stmt = Prepare(db_, R"(
        SELECT 1 FROM sqlite_master
        WHERE type = 'index' AND name = 'idx_snapshots_account_date';
    )");
    if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        return true;
    }

    // One snapshot per account and day; the newest duplicate wins
    return ExecuteSQL(R"(
        DELETE FROM cost_snapshots
         WHERE id NOT IN (SELECT MAX(id) FROM cost_snapshots
                           GROUP BY account_name, snapshot_date);
        DROP INDEX IF EXISTS idx_snapshots_account;
        CREATE UNIQUE INDEX idx_snapshots_account_date
            ON cost_snapshots(account_name, snapshot_date);
    )");
}

bool SqliteLedgerStore::HasColumn(const std::string& table, const std::string& column) {
    std::string sql = "PRAGMA table_info(" + table + ");";
    auto stmt = Prepare(db_, sql.c_str());
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        if (ColumnText(stmt.get(), 1) == column) {
            return true;
        }
    }
    return false;
}

bool SqliteLedgerStore::TableExists(const std::string& name) {
    auto stmt = Prepare(db_, "SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?;");
    BindText(stmt.get(), 1, name);
    return sqlite3_step(stmt.get()) == SQLITE_ROW;
}

int SqliteLedgerStore::GetSchemaVersion() {
    auto stmt = Prepare(db_, "PRAGMA user_version;");
    if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        return sqlite3_column_int(stmt.get(), 0);
    }
    return 0;
}

bool SqliteLedgerStore::ExecuteSQL(const std::string& sql) {
    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        spdlog::error("SQL error: {}", err_msg ? err_msg : sqlite3_errstr(rc));
        sqlite3_free(err_msg);
        return false;
    }
    return true;
}

void SqliteLedgerStore::ExecuteOrThrow(const char* sql) {
    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        std::string message = err_msg ? err_msg : sqlite3_errstr(rc);
        sqlite3_free(err_msg);
        throw StorageError(std::string("'") + sql + "' failed: " + message);
    }
}

void SqliteLedgerStore::RunInTransaction(TransactionMode mode,
                                         const std::function<void(LedgerTransaction&)>& fn) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!initialized_ || !db_) {
        throw StorageError("Ledger store " + db_path_ + " is not initialized");
    }

    const bool read_only = mode == TransactionMode::ReadOnly;
    ExecuteOrThrow(read_only ? "BEGIN DEFERRED;" : "BEGIN IMMEDIATE;");

    SqliteTransaction txn(db_, read_only);
    try {
        fn(txn);
    } catch (...) {
        if (!ExecuteSQL("ROLLBACK;")) {
            spdlog::error("Rollback failed on {}", db_path_);
        }
        throw;
    }

    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, "COMMIT;", nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        std::string message = err_msg ? err_msg : sqlite3_errstr(rc);
        sqlite3_free(err_msg);
        if (!ExecuteSQL("ROLLBACK;")) {
            spdlog::error("Rollback after failed commit also failed on {}", db_path_);
        }
        throw StorageError("Commit failed on " + db_path_ + ": " + message);
    }
}

} // namespace cloudspend

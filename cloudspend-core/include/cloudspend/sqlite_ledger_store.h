#pragma once

#include "api_export.h"
#include "ledger_store.h"
#include <mutex>
#include <string>

// Forward declaration for SQLite
struct sqlite3;

namespace cloudspend {

/**
 * SQLite-backed ledger store.
 *
 * Write transactions start with BEGIN IMMEDIATE so the database write lock
 * is held across the whole read-modify-write; other connections (other
 * processes included) wait up to the busy timeout. The database runs in WAL
 * mode with synchronous=FULL, so a committed transaction survives a crash
 * right after RunInTransaction returns.
 *
 * Schema version lives in PRAGMA user_version. A database in the legacy
 * layout (created_date/implemented_date text columns, no user_version) is
 * rebuilt in place with its ids kept. Cost snapshots are unique per
 * (account_name, snapshot_date).
 */
class CLOUDSPEND_API SqliteLedgerStore : public LedgerStore {
public:
    static constexpr int kSchemaVersion = 2;

    explicit SqliteLedgerStore(const std::string& db_path, int busy_timeout_ms = 5000);
    ~SqliteLedgerStore() override;

    SqliteLedgerStore(const SqliteLedgerStore&) = delete;
    SqliteLedgerStore& operator=(const SqliteLedgerStore&) = delete;

    // Open the database and create or migrate the schema
    bool Initialize();
    bool IsInitialized() const { return initialized_; }

    void RunInTransaction(TransactionMode mode,
                          const std::function<void(LedgerTransaction&)>& fn) override;

    std::string Describe() const override { return "sqlite:" + db_path_; }

    int GetSchemaVersion();

private:
    bool CreateOrMigrateSchema();
    bool MigrateLegacyLayout();
    bool EnsureSnapshotKey();
    bool TableExists(const std::string& name);
    bool HasColumn(const std::string& table, const std::string& column);
    bool ExecuteSQL(const std::string& sql);
    void ExecuteOrThrow(const char* sql);

    sqlite3* db_ = nullptr;
    std::string db_path_;
    int busy_timeout_ms_;
    bool initialized_ = false;
    std::mutex mutex_;
};

} // namespace cloudspend

#pragma once

#include "api_export.h"
#include "recommendation.h"
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace cloudspend {

enum class TransactionMode {
    ReadOnly,       // Consistent snapshot, writes rejected
    ReadWrite       // Serialized with every other writer
};

/**
 * Operations available inside one store transaction. Only valid for the
 * duration of the RunInTransaction callback that received it.
 */
class CLOUDSPEND_API LedgerTransaction {
public:
    virtual ~LedgerTransaction() = default;

    // Stores rec (its id is ignored) and returns the newly assigned id
    virtual int64_t InsertRecommendation(const Recommendation& rec) = 0;

    virtual std::optional<Recommendation> FindRecommendation(int64_t id) = 0;

    // Overwrites the row with rec.id; throws NotFoundError if absent
    virtual void UpdateRecommendation(const Recommendation& rec) = 0;

    // Newest first (created_at desc, id desc); all rows when status is empty
    virtual std::vector<Recommendation> ListRecommendations(
        std::optional<RecommendationStatus> status) = 0;

    // One row per (account_name, snapshot_date): an existing row is
    // overwritten and keeps its id. Returns the row id.
    virtual int64_t UpsertSnapshot(const CostSnapshot& snapshot) = 0;

    // Newest first (snapshot_date desc, id desc), at most limit rows
    virtual std::vector<CostSnapshot> ListSnapshots(const std::string& account_name,
                                                    size_t limit) = 0;
};

/**
 * Transactional store for the recommendation ledger.
 *
 * RunInTransaction executes fn as a single atomic transaction: changes are
 * committed (durably, for persistent stores) when fn returns and rolled
 * back when it throws, in which case the exception propagates unchanged.
 * Concurrent read-write transactions never interleave.
 */
class CLOUDSPEND_API LedgerStore {
public:
    virtual ~LedgerStore() = default;

    virtual void RunInTransaction(TransactionMode mode,
                                  const std::function<void(LedgerTransaction&)>& fn) = 0;

    // Human-readable location for logs
    virtual std::string Describe() const = 0;
};

/**
 * Process-local store. Each transaction works on a copy of the state under
 * a mutex and swaps it in on success. Used for ephemeral runs and tests.
 */
class CLOUDSPEND_API InMemoryLedgerStore : public LedgerStore {
public:
    InMemoryLedgerStore() = default;

    void RunInTransaction(TransactionMode mode,
                          const std::function<void(LedgerTransaction&)>& fn) override;

    std::string Describe() const override { return "in-memory"; }

    struct State {
        std::map<int64_t, Recommendation> recommendations;
        std::vector<CostSnapshot> snapshots;
        int64_t next_recommendation_id = 1;
        int64_t next_snapshot_id = 1;
    };

private:
    State state_;
    std::mutex mutex_;
};

} // namespace cloudspend

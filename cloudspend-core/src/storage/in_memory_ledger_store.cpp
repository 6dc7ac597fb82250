#include <cloudspend/ledger_store.h>
#include <cloudspend/errors.h>
#include <algorithm>

namespace cloudspend {

namespace {

class InMemoryTransaction : public LedgerTransaction {
public:
    InMemoryTransaction(InMemoryLedgerStore::State& state, bool read_only)
        : state_(state), read_only_(read_only) {}

    int64_t InsertRecommendation(const Recommendation& rec) override {
        RequireWritable();
        Recommendation stored = rec;
        stored.id = state_.next_recommendation_id++;
        state_.recommendations[stored.id] = stored;
        return stored.id;
    }

    std::optional<Recommendation> FindRecommendation(int64_t id) override {
        auto it = state_.recommendations.find(id);
        if (it == state_.recommendations.end()) return std::nullopt;
        return it->second;
    }

    void UpdateRecommendation(const Recommendation& rec) override {
        RequireWritable();
        auto it = state_.recommendations.find(rec.id);
        if (it == state_.recommendations.end()) {
            throw NotFoundError("Recommendation " + std::to_string(rec.id) + " not found");
        }
        it->second = rec;
    }

    std::vector<Recommendation> ListRecommendations(
        std::optional<RecommendationStatus> status) override {
        std::vector<Recommendation> rows;
        for (const auto& entry : state_.recommendations) {
            if (!status || entry.second.status == *status) {
                rows.push_back(entry.second);
            }
        }
        std::sort(rows.begin(), rows.end(), [](const Recommendation& a, const Recommendation& b) {
            if (a.created_at != b.created_at) return a.created_at > b.created_at;
            return a.id > b.id;
        });
        return rows;
    }

    int64_t UpsertSnapshot(const CostSnapshot& snapshot) override {
        RequireWritable();
        for (auto& existing : state_.snapshots) {
            if (existing.account_name == snapshot.account_name &&
                existing.snapshot_date == snapshot.snapshot_date) {
                int64_t id = existing.id;
                existing = snapshot;
                existing.id = id;
                return id;
            }
        }
        CostSnapshot stored = snapshot;
        stored.id = state_.next_snapshot_id++;
        state_.snapshots.push_back(stored);
        return stored.id;
    }

    std::vector<CostSnapshot> ListSnapshots(const std::string& account_name,
                                            size_t limit) override {
        std::vector<CostSnapshot> rows;
        for (const auto& snapshot : state_.snapshots) {
            if (snapshot.account_name == account_name) rows.push_back(snapshot);
        }
        std::sort(rows.begin(), rows.end(), [](const CostSnapshot& a, const CostSnapshot& b) {
            if (a.snapshot_date != b.snapshot_date) return a.snapshot_date > b.snapshot_date;
            return a.id > b.id;
        });
        if (rows.size() > limit) rows.resize(limit);
        return rows;
    }

private:
    void RequireWritable() const {
        if (read_only_) {
            throw StorageError("Write attempted inside a read-only ledger transaction");
        }
    }

    InMemoryLedgerStore::State& state_;
    bool read_only_;
};

} // namespace

void InMemoryLedgerStore::RunInTransaction(TransactionMode mode,
                                           const std::function<void(LedgerTransaction&)>& fn) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Work on a copy; a throwing fn leaves state_ untouched
    State working = state_;
    InMemoryTransaction txn(working, mode == TransactionMode::ReadOnly);
    fn(txn);

    if (mode == TransactionMode::ReadWrite) {
        state_ = std::move(working);
    }
}

} // namespace cloudspend

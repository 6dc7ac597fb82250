#pragma once

#include "api_export.h"
#include "ledger_store.h"
#include "recommendation.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace cloudspend {

/**
 * Durable ledger of optimization recommendations and their measured ROI.
 *
 * Lifecycle: pending -> implemented | rejected, both terminal. Rows are
 * never deleted. Every mutation runs as one store transaction, so two
 * concurrent resolves of the same id cannot both succeed.
 */
class CLOUDSPEND_API SavingsLedger {
public:
    // Returns Unix seconds; injectable for deterministic tests
    using Clock = std::function<int64_t()>;

    explicit SavingsLedger(std::shared_ptr<LedgerStore> store, Clock clock = {});

    /**
     * Record a new pending recommendation
     * @return Store-assigned id
     * @throws InvalidInputError for an empty title/type or a negative estimate
     */
    int64_t Add(const RecommendationCandidate& candidate);

    // Add unless a row with the same title, type and account already exists.
    // Returns the id of the new or matching row and whether it was inserted.
    std::pair<int64_t, bool> AddIfAbsent(const RecommendationCandidate& candidate);

    /**
     * Resolve a pending recommendation
     * @param status Implemented or Rejected
     * @param actual_savings Required for Implemented, optional for Rejected
     * @throws NotFoundError if id is unknown
     * @throws InvalidTransitionError if already resolved or status is Pending
     * @throws InvalidInputError if an implemented resolve lacks actual savings
     */
    Recommendation Resolve(
        int64_t id,
        RecommendationStatus status,
        std::optional<double> actual_savings = std::nullopt,
        std::optional<std::string> notes = std::nullopt
    );

    Recommendation MarkImplemented(int64_t id, double actual_savings,
                                   std::optional<std::string> notes = std::nullopt);
    Recommendation MarkRejected(int64_t id, std::optional<std::string> reason = std::nullopt);

    // @throws NotFoundError
    Recommendation Get(int64_t id);

    // Newest first; all statuses when status is empty
    std::vector<Recommendation> List(std::optional<RecommendationStatus> status = std::nullopt);

    // Aggregates from one consistent snapshot of the store
    LedgerSummary Summary();

    // Pure aggregation used by Summary()
    static LedgerSummary Summarize(const std::vector<Recommendation>& recommendations);

    // ---- Cost snapshots ----

    int64_t AddCostSnapshot(double total_cost, int period_days,
                            const std::string& account_name = "default",
                            std::optional<ServiceBreakdown> service_breakdown = std::nullopt,
                            std::optional<Date> snapshot_date = std::nullopt);

    std::vector<CostSnapshot> CostTrend(const std::string& account_name = "default",
                                        size_t limit = 30);

    LedgerStore& Store() { return *store_; }

private:
    int64_t Now() const;
    Recommendation NewRecommendation(const RecommendationCandidate& candidate) const;

    std::shared_ptr<LedgerStore> store_;
    Clock clock_;
};

} // namespace cloudspend

#include <cloudspend/savings_ledger.h>
#include <cloudspend/errors.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <cmath>

namespace cloudspend {

namespace {

bool IsNonNegativeAmount(double value) {
    return std::isfinite(value) && value >= 0.0;
}

} // namespace

SavingsLedger::SavingsLedger(std::shared_ptr<LedgerStore> store, Clock clock)
    : store_(std::move(store)), clock_(std::move(clock)) {
    if (!store_) {
        throw InvalidInputError("SavingsLedger requires a store");
    }
}

int64_t SavingsLedger::Now() const {
    if (clock_) {
        return clock_();
    }
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

// ============================================================================
// Lifecycle
// ============================================================================

Recommendation SavingsLedger::NewRecommendation(const RecommendationCandidate& candidate) const {
    if (candidate.title.empty()) {
        throw InvalidInputError("Recommendation title must not be empty");
    }
    if (candidate.type.empty()) {
        throw InvalidInputError("Recommendation type must not be empty");
    }
    if (!IsNonNegativeAmount(candidate.estimated_monthly_savings)) {
        throw InvalidInputError("Estimated monthly savings must be a non-negative amount");
    }

    Recommendation rec;
    rec.title = candidate.title;
    rec.type = candidate.type;
    rec.estimated_monthly_savings = candidate.estimated_monthly_savings;
    rec.risk_level = candidate.risk_level;
    rec.effort = candidate.effort;
    rec.status = RecommendationStatus::Pending;
    rec.created_at = Now();
    rec.account_name = candidate.account_name.empty() ? "default" : candidate.account_name;
    rec.description = candidate.description;
    return rec;
}

int64_t SavingsLedger::Add(const RecommendationCandidate& candidate) {
    Recommendation rec = NewRecommendation(candidate);

    int64_t id = 0;
    store_->RunInTransaction(TransactionMode::ReadWrite, [&](LedgerTransaction& txn) {
        id = txn.InsertRecommendation(rec);
    });

    spdlog::info("Ledger: added recommendation {} '{}' (est. {:.2f}/month)",
                 id, rec.title, rec.estimated_monthly_savings);
    return id;
}

std::pair<int64_t, bool> SavingsLedger::AddIfAbsent(const RecommendationCandidate& candidate) {
    Recommendation rec = NewRecommendation(candidate);

    int64_t id = 0;
    bool inserted = false;
    // Lookup and insert share the write lock, so two callers cannot both insert
    store_->RunInTransaction(TransactionMode::ReadWrite, [&](LedgerTransaction& txn) {
        for (const auto& existing : txn.ListRecommendations(std::nullopt)) {
            if (existing.title == rec.title && existing.type == rec.type &&
                existing.account_name == rec.account_name) {
                id = existing.id;
                return;
            }
        }
        id = txn.InsertRecommendation(rec);
        inserted = true;
    });

    if (inserted) {
        spdlog::info("Ledger: added recommendation {} '{}' (est. {:.2f}/month)",
                     id, rec.title, rec.estimated_monthly_savings);
    } else {
        spdlog::debug("Ledger: '{}' already recorded as {}", rec.title, id);
    }
    return {id, inserted};
}

Recommendation SavingsLedger::Resolve(int64_t id, RecommendationStatus status,
                                      std::optional<double> actual_savings,
                                      std::optional<std::string> notes) {
    if (status == RecommendationStatus::Pending) {
        throw InvalidTransitionError("Recommendation " + std::to_string(id) +
                                     " cannot be resolved back to pending");
    }
    if (status == RecommendationStatus::Implemented && !actual_savings) {
        throw InvalidInputError("Implementing recommendation " + std::to_string(id) +
                                " requires actual monthly savings");
    }
    if (actual_savings && !IsNonNegativeAmount(*actual_savings)) {
        throw InvalidInputError("Actual monthly savings must be a non-negative amount");
    }

    const int64_t resolved_at = Now();
    Recommendation updated;

    // Read and write in one transaction: a concurrent resolve of the same id
    // observes the committed status and fails below
    store_->RunInTransaction(TransactionMode::ReadWrite, [&](LedgerTransaction& txn) {
        std::optional<Recommendation> current = txn.FindRecommendation(id);
        if (!current) {
            throw NotFoundError("Recommendation " + std::to_string(id) + " not found");
        }
        if (current->IsResolved()) {
            throw InvalidTransitionError("Recommendation " + std::to_string(id) +
                                         " is already " + ToString(current->status));
        }

        updated = *current;
        updated.status = status;
        updated.resolved_at = resolved_at;
        updated.actual_monthly_savings = actual_savings;
        updated.notes = std::move(notes);
        txn.UpdateRecommendation(updated);
    });

    spdlog::info("Ledger: recommendation {} marked {}", id, ToString(status));
    return updated;
}

Recommendation SavingsLedger::MarkImplemented(int64_t id, double actual_savings,
                                              std::optional<std::string> notes) {
    return Resolve(id, RecommendationStatus::Implemented, actual_savings, std::move(notes));
}

Recommendation SavingsLedger::MarkRejected(int64_t id, std::optional<std::string> reason) {
    return Resolve(id, RecommendationStatus::Rejected, std::nullopt, std::move(reason));
}

Recommendation SavingsLedger::Get(int64_t id) {
    std::optional<Recommendation> found;
    store_->RunInTransaction(TransactionMode::ReadOnly, [&](LedgerTransaction& txn) {
        found = txn.FindRecommendation(id);
    });
    if (!found) {
        throw NotFoundError("Recommendation " + std::to_string(id) + " not found");
    }
    return *found;
}

std::vector<Recommendation> SavingsLedger::List(std::optional<RecommendationStatus> status) {
    std::vector<Recommendation> rows;
    store_->RunInTransaction(TransactionMode::ReadOnly, [&](LedgerTransaction& txn) {
        rows = txn.ListRecommendations(status);
    });
    return rows;
}

// ============================================================================
// ROI
// ============================================================================

LedgerSummary SavingsLedger::Summary() {
    return Summarize(List());
}

LedgerSummary SavingsLedger::Summarize(const std::vector<Recommendation>& recommendations) {
    LedgerSummary summary;
    double accuracy_sum = 0.0;
    int accuracy_count = 0;

    for (const auto& rec : recommendations) {
        summary.total++;
        summary.estimated_savings_total += rec.estimated_monthly_savings;

        switch (rec.status) {
            case RecommendationStatus::Pending:
                summary.pending++;
                break;
            case RecommendationStatus::Rejected:
                summary.rejected++;
                break;
            case RecommendationStatus::Implemented:
                summary.implemented++;
                summary.implemented_savings_estimated_total += rec.estimated_monthly_savings;
                if (rec.actual_monthly_savings) {
                    summary.actual_savings_total += *rec.actual_monthly_savings;

                    const double estimate = rec.estimated_monthly_savings;
                    if (estimate > 0.0) {
                        double accuracy = 100.0 * (1.0 - std::abs(estimate - *rec.actual_monthly_savings) / estimate);
                        accuracy_sum += std::min(100.0, std::max(0.0, accuracy));
                        accuracy_count++;
                    }
                }
                break;
        }
    }

    if (summary.total > 0) {
        summary.implementation_rate_pct =
            static_cast<double>(summary.implemented) / summary.total * 100.0;
    }
    summary.annual_projection = summary.actual_savings_total * 12.0;
    if (accuracy_count > 0) {
        summary.forecast_accuracy_pct = accuracy_sum / accuracy_count;
    }
    return summary;
}

// ============================================================================
// Cost snapshots
// ============================================================================

int64_t SavingsLedger::AddCostSnapshot(double total_cost, int period_days,
                                       const std::string& account_name,
                                       std::optional<ServiceBreakdown> service_breakdown,
                                       std::optional<Date> snapshot_date) {
    if (!IsNonNegativeAmount(total_cost)) {
        throw InvalidInputError("Snapshot total cost must be a non-negative amount");
    }
    if (period_days <= 0) {
        throw InvalidInputError("Snapshot period_days must be positive");
    }
    if (service_breakdown) {
        ValidateBreakdown(*service_breakdown);
    }

    CostSnapshot snapshot;
    snapshot.snapshot_date = snapshot_date ? *snapshot_date : Date::FromDayNumber(Now() / 86400);
    snapshot.account_name = account_name.empty() ? "default" : account_name;
    snapshot.total_cost = total_cost;
    snapshot.period_days = period_days;
    snapshot.service_breakdown = std::move(service_breakdown);

    int64_t id = 0;
    store_->RunInTransaction(TransactionMode::ReadWrite, [&](LedgerTransaction& txn) {
        id = txn.UpsertSnapshot(snapshot);
    });

    spdlog::debug("Ledger: cost snapshot {} for '{}' ({:.2f} over {} days)",
                  id, snapshot.account_name, total_cost, period_days);
    return id;
}

std::vector<CostSnapshot> SavingsLedger::CostTrend(const std::string& account_name, size_t limit) {
    std::vector<CostSnapshot> rows;
    store_->RunInTransaction(TransactionMode::ReadOnly, [&](LedgerTransaction& txn) {
        rows = txn.ListSnapshots(account_name, limit);
    });
    return rows;
}

} // namespace cloudspend

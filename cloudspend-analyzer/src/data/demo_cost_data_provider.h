// demo_cost_data_provider.h - Deterministic sample data for offline runs
#pragma once

#include "data/cost_data_provider.h"
#include <cloudspend/recommendation.h>
#include <cloudspend/savings_ledger.h>
#include <optional>
#include <string>
#include <vector>

namespace cloudspend::analyzer::data {

// Demo seed for the savings ledger; actual_savings set means already implemented
struct DemoRecommendation {
    RecommendationCandidate candidate;
    std::optional<double> actual_savings;
};

/**
 * Weekly wave plus linear drift around a per-account base cost. Values
 * depend only on the requested range, so repeated runs are identical.
 */
class DemoCostDataProvider : public CostDataProvider {
public:
    struct Profile {
        std::string account_name;
        double base = 280.0;
        double drift = 0.25;        // Relative increase across the range
        double jitter = 1.5;
        ServiceBreakdown services;
    };

    // account: prod | staging | dev (unknown names fall back to prod)
    explicit DemoCostDataProvider(const std::string& account = "prod");
    explicit DemoCostDataProvider(Profile profile);

    std::string Name() const override { return "demo"; }

    CostSeries FetchDailyCosts(const Date& start, const Date& end) override;
    ServiceBreakdown FetchServiceBreakdown(const Date& start, const Date& end) override;

    const Profile& GetProfile() const { return profile_; }

    static Profile ProfileFor(const std::string& account);
    static std::vector<DemoRecommendation> DemoRecommendations();

    // Records the demo seeds once; running it again changes nothing.
    // Returns the seed rows as stored.
    static std::vector<Recommendation> SeedLedger(SavingsLedger& ledger);

private:
    Profile profile_;
};

} // namespace cloudspend::analyzer::data

// demo_cost_data_provider.cpp - Deterministic demo data
#include "data/demo_cost_data_provider.h"
#include <cloudspend/errors.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>

namespace cloudspend::analyzer::data {

namespace {

double RoundCents(double value) {
    return std::round(value * 100.0) / 100.0;
}

} // namespace

DemoCostDataProvider::DemoCostDataProvider(const std::string& account)
    : profile_(ProfileFor(account)) {
}

DemoCostDataProvider::DemoCostDataProvider(Profile profile)
    : profile_(std::move(profile)) {
}

DemoCostDataProvider::Profile DemoCostDataProvider::ProfileFor(const std::string& account) {
    Profile profile;
    if (account == "staging") {
        profile.account_name = "staging";
        profile.base = 85.0;
        profile.drift = 0.05;
        profile.jitter = 0.6;
        profile.services = {
            {"Amazon EC2", 210.40},
            {"Amazon RDS", 98.15},
            {"Amazon S3", 55.30},
            {"AWS Lambda", 22.90},
            {"NAT Gateway", 18.60},
        };
    } else if (account == "dev") {
        profile.account_name = "dev";
        profile.base = 35.0;
        profile.drift = -0.03;
        profile.jitter = 0.4;
        profile.services = {
            {"Amazon EC2", 75.50},
            {"Amazon S3", 28.15},
            {"AWS Lambda", 16.30},
            {"Amazon CloudWatch", 9.80},
        };
    } else {
        if (account != "prod" && account != "default") {
            spdlog::warn("Unknown demo account '{}', using prod profile", account);
        }
        profile.account_name = "prod";
        profile.services = {
            {"Amazon EC2", 860.25},
            {"Amazon RDS", 420.10},
            {"Amazon S3", 180.60},
            {"AWS Lambda", 95.40},
            {"NAT Gateway", 72.25},
            {"AWS KMS", 33.10},
        };
    }
    return profile;
}

CostSeries DemoCostDataProvider::FetchDailyCosts(const Date& start, const Date& end) {
    if (end < start) {
        throw InvalidInputError("Demo range end " + end.ToString() + " is before start " + start.ToString());
    }

    const int64_t days = Date::DaysBetween(start, end) + 1;
    CostSeries series;
    series.reserve(static_cast<size_t>(days));

    for (int64_t i = 0; i < days; ++i) {
        const double wave = static_cast<double>((i % 7) - 3) * 0.12;
        const double trend = profile_.drift * (static_cast<double>(i) / std::max<int64_t>(days - 1, 1));
        const double jitter = profile_.jitter * static_cast<double>((i % 3) - 1);
        const double cost = std::max(0.5, profile_.base + profile_.base * (wave + trend) + jitter);
        series.push_back({start.AddDays(i), RoundCents(cost)});
    }
    return series;
}

ServiceBreakdown DemoCostDataProvider::FetchServiceBreakdown(const Date& start, const Date& end) {
    // Scale the fixed mix so it sums to the daily total over the range
    const double period_total = TotalCost(FetchDailyCosts(start, end));
    double mix_total = 0.0;
    for (const auto& [service, amount] : profile_.services) {
        mix_total += amount;
    }
    if (mix_total <= 0.0) {
        return profile_.services;
    }

    ServiceBreakdown scaled;
    for (const auto& [service, amount] : profile_.services) {
        scaled[service] = RoundCents(amount / mix_total * period_total);
    }
    return scaled;
}

std::vector<DemoRecommendation> DemoCostDataProvider::DemoRecommendations() {
    std::vector<DemoRecommendation> seeds;

    DemoRecommendation rightsizing;
    rightsizing.candidate.title = "Downsize EC2 m5.4xlarge to m5.xlarge (prod)";
    rightsizing.candidate.type = "EC2_rightsizing";
    rightsizing.candidate.estimated_monthly_savings = 420.0;
    rightsizing.candidate.description = "CPU < 15% over 30 days; safe resize during maintenance window";
    rightsizing.candidate.risk_level = RiskLevel::Low;
    rightsizing.candidate.effort = Effort::QuickWin;
    rightsizing.candidate.account_name = "prod";
    rightsizing.actual_savings = 400.0;
    seeds.push_back(rightsizing);

    DemoRecommendation lifecycle;
    lifecycle.candidate.title = "Add S3 lifecycle policy to enable Intelligent-Tiering (prod)";
    lifecycle.candidate.type = "S3_lifecycle";
    lifecycle.candidate.estimated_monthly_savings = 120.0;
    lifecycle.candidate.description = "80% objects untouched for 45+ days";
    lifecycle.candidate.risk_level = RiskLevel::Low;
    lifecycle.candidate.effort = Effort::QuickWin;
    lifecycle.candidate.account_name = "prod";
    seeds.push_back(lifecycle);

    DemoRecommendation nat;
    nat.candidate.title = "Consolidate NAT gateways across AZs (staging/dev)";
    nat.candidate.type = "network_optimization";
    nat.candidate.estimated_monthly_savings = 95.0;
    nat.candidate.description = "Low traffic in non-prod; use single NAT gateway";
    nat.candidate.risk_level = RiskLevel::Medium;
    nat.candidate.effort = Effort::Medium;
    nat.candidate.account_name = "staging";
    seeds.push_back(nat);

    return seeds;
}

std::vector<Recommendation> DemoCostDataProvider::SeedLedger(SavingsLedger& ledger) {
    std::vector<Recommendation> rows;
    for (const auto& seed : DemoRecommendations()) {
        int64_t id = ledger.AddIfAbsent(seed.candidate).first;
        Recommendation rec = ledger.Get(id);
        // A seed left pending by an interrupted run still gets its outcome
        if (seed.actual_savings && rec.status == RecommendationStatus::Pending) {
            rec = ledger.MarkImplemented(id, *seed.actual_savings, std::string("demo seed"));
        }
        rows.push_back(std::move(rec));
    }
    return rows;
}

} // namespace cloudspend::analyzer::data

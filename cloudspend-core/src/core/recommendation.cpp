#include <cloudspend/recommendation.h>
#include <cloudspend/errors.h>

namespace cloudspend {

const char* ToString(RiskLevel risk) {
    switch (risk) {
        case RiskLevel::Low: return "low";
        case RiskLevel::Medium: return "medium";
        case RiskLevel::High: return "high";
    }
    return "medium";
}

const char* ToString(Effort effort) {
    switch (effort) {
        case Effort::QuickWin: return "quick_win";
        case Effort::Medium: return "medium";
        case Effort::Large: return "large";
    }
    return "medium";
}

const char* ToString(RecommendationStatus status) {
    switch (status) {
        case RecommendationStatus::Pending: return "pending";
        case RecommendationStatus::Implemented: return "implemented";
        case RecommendationStatus::Rejected: return "rejected";
    }
    return "pending";
}

RiskLevel ParseRiskLevel(const std::string& text) {
    if (text == "low") return RiskLevel::Low;
    if (text == "medium") return RiskLevel::Medium;
    if (text == "high") return RiskLevel::High;
    throw InvalidInputError("Unknown risk level '" + text + "'");
}

Effort ParseEffort(const std::string& text) {
    if (text == "quick_win") return Effort::QuickWin;
    if (text == "medium") return Effort::Medium;
    // Older ledgers used "complex" for large efforts
    if (text == "large" || text == "complex") return Effort::Large;
    throw InvalidInputError("Unknown effort '" + text + "'");
}

RecommendationStatus ParseRecommendationStatus(const std::string& text) {
    if (text == "pending") return RecommendationStatus::Pending;
    if (text == "implemented") return RecommendationStatus::Implemented;
    if (text == "rejected") return RecommendationStatus::Rejected;
    throw InvalidInputError("Unknown recommendation status '" + text + "'");
}

} // namespace cloudspend

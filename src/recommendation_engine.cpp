/**
 * @file recommendation_engine.cpp
 * @brief Implementation of the posture recommendation rules
 */

#include "posture_analyzer/recommendation_engine.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iterator>
#include <string>

namespace posture_analyzer {

namespace {

std::string formatValue(const char* format, double value) {
    char buffer[160];
    snprintf(buffer, sizeof(buffer), format, value);
    return std::string(buffer);
}

} // namespace

// ============================================================================
// Fallback factory and list helpers
// ============================================================================

Recommendation makeFallbackRecommendation(FallbackReason reason) {
    Recommendation rec;
    rec.category = RecommendationCategory::POSTURE;
    rec.priority = Priority::LOW;
    rec.is_fallback = true;

    switch (reason) {
        case FallbackReason::NO_DETECTION:
            rec.title = "Basic recommendation";
            rec.description =
                "Detailed analysis could not be performed. Regular physical activity is recommended.";
            rec.action_steps = {
                "Do a short exercise routine every morning",
                "Watch your posture while working"
            };
            break;
        case FallbackReason::NORMAL_RANGE:
        default:
            rec.title = "Posture within normal range";
            rec.description =
                "Posture is within normal range. Continue maintaining an active lifestyle.";
            rec.action_steps = {
                "Keep up regular physical activity",
                "Take a short movement break every hour of sitting",
                "Repeat the posture check in a month"
            };
            break;
    }

    return rec;
}

std::vector<Recommendation> capRecommendations(
    const std::vector<Recommendation>& recommendations,
    size_t max_count
) {
    size_t n = std::min(max_count, recommendations.size());
    return std::vector<Recommendation>(recommendations.begin(), recommendations.begin() + n);
}

std::vector<Recommendation> activeRecommendations(
    const std::vector<Recommendation>& recommendations,
    Timestamp now
) {
    std::vector<Recommendation> active;
    std::copy_if(recommendations.begin(), recommendations.end(), std::back_inserter(active),
                 [now](const Recommendation& rec) { return rec.isActive(now); });
    return active;
}

// ============================================================================
// Rule table
// ============================================================================

std::vector<Recommendation> RecommendationEngine::generate(const PostureMetrics& metrics) const {
    std::vector<Recommendation> recommendations;

    if (metrics.hasShoulderImbalance()) {
        recommendations.push_back(shoulderImbalance(*metrics.shoulder));
    }
    if (metrics.hasForwardHead()) {
        recommendations.push_back(forwardHead(*metrics.head));
    }
    if (metrics.hasHipImbalance()) {
        recommendations.push_back(hipImbalance(*metrics.hip));
    }
    if (metrics.hasKneeValgus()) {
        recommendations.push_back(kneeValgus(*metrics.knee));
    }

    if (recommendations.empty()) {
        recommendations.push_back(makeFallbackRecommendation(FallbackReason::NORMAL_RANGE));
    }

    return recommendations;
}

Recommendation RecommendationEngine::shoulderImbalance(const ShoulderMetrics& shoulder) {
    Recommendation rec;
    rec.category = RecommendationCategory::POSTURE;
    rec.priority = Priority::HIGH;
    rec.title = "Shoulder imbalance correction";
    rec.description = formatValue("Detected shoulder tilt of %.1f°", std::abs(shoulder.slope_deg));
    rec.action_steps = {
        "Perform \"face pull\" exercise: 3 sets of 15 repetitions",
        "Chest muscle stretching 2-3 times daily for 30 seconds",
        "Strengthen rear delts and rhomboid muscles",
        "Monitor shoulder position throughout the day"
    };
    return rec;
}

Recommendation RecommendationEngine::forwardHead(const HeadMetrics& head) {
    Recommendation rec;
    rec.category = RecommendationCategory::POSTURE;
    rec.priority = Priority::MEDIUM;
    rec.title = "Forward head posture correction";
    rec.description = formatValue("Detected head tilt of %.1f° relative to the shoulder line",
                                  std::abs(head.tilt_deg));
    rec.action_steps = {
        "Chin tucks: 3 sets of 10 repetitions",
        "Strengthen deep neck flexors",
        "Check workspace ergonomics: monitor at eye level",
        "Take a posture break every 30-45 minutes"
    };
    return rec;
}

Recommendation RecommendationEngine::hipImbalance(const HipMetrics& hip) {
    Recommendation rec;
    rec.category = RecommendationCategory::POSTURE;
    rec.priority = Priority::MEDIUM;
    rec.title = "Pelvic position correction";
    rec.description = formatValue("Detected pelvic area imbalance of %.1f°", std::abs(hip.slope_deg));
    rec.action_steps = {
        "Side plank on each side: 3 sets of 30-60 seconds",
        "Strengthen gluteus medius",
        "Stretch quadratus lumborum",
        "Check workspace ergonomics"
    };
    return rec;
}

Recommendation RecommendationEngine::kneeValgus(const KneeMetrics& knee) {
    Recommendation rec;
    rec.category = RecommendationCategory::EXERCISE;
    rec.priority = Priority::HIGH;
    rec.title = "Knee valgus correction";
    rec.description = formatValue(
        "Detected tendency for knee inward collapse (indicator %.1f)", knee.valgus_indicator);
    rec.action_steps = {
        "Hip abduction in lying position: 3x15",
        "Squats with knee control",
        "Strengthen outer thigh muscles",
        "IT-band stretching"
    };
    return rec;
}

} // namespace posture_analyzer

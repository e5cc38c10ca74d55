/**
 * @file recommendation_engine.hpp
 * @brief Deterministic rule table mapping posture flags to recommendations
 */

#pragma once

#include "common.hpp"
#include "data_types.hpp"
#include <cstddef>
#include <vector>

namespace posture_analyzer {

/**
 * @brief Build the generic fallback recommendation
 *
 * The only way fallback records are created. NORMAL_RANGE is emitted by the
 * rule engine when nothing fires; NO_DETECTION by the pipeline when no view
 * produced a pose.
 */
Recommendation makeFallbackRecommendation(FallbackReason reason);

/**
 * @brief Keep the first max_count recommendations
 */
std::vector<Recommendation> capRecommendations(
    const std::vector<Recommendation>& recommendations,
    size_t max_count
);

/**
 * @brief Recommendations that are neither completed nor expired at `now`
 */
std::vector<Recommendation> activeRecommendations(
    const std::vector<Recommendation>& recommendations,
    Timestamp now
);

/**
 * @brief Evaluates the posture rule table
 *
 * Rule order is fixed: shoulder imbalance, forward head, hip imbalance,
 * knee valgus. Each rule contributes at most one record.
 */
class RecommendationEngine {
public:
    RecommendationEngine() = default;

    /**
     * @brief Generate recommendations for a (possibly partial) record
     * @return At least one recommendation, in rule order
     */
    std::vector<Recommendation> generate(const PostureMetrics& metrics) const;

private:
    static Recommendation shoulderImbalance(const ShoulderMetrics& shoulder);
    static Recommendation forwardHead(const HeadMetrics& head);
    static Recommendation hipImbalance(const HipMetrics& hip);
    static Recommendation kneeValgus(const KneeMetrics& knee);
};

} // namespace posture_analyzer

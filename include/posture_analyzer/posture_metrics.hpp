/**
 * @file posture_metrics.hpp
 * @brief Geometric posture metrics from named landmarks
 */

#pragma once

#include "common.hpp"
#include "config.hpp"
#include "data_types.hpp"
#include <Eigen/Dense>
#include <optional>

namespace posture_analyzer {

/**
 * @brief Angle of the segment left->right against horizontal, in degrees
 *
 * Returns 0 when both points share the same x. Image y grows downwards, so a
 * positive angle means the right point sits lower in the image.
 */
double pairSlopeDegrees(const Eigen::Vector2d& left, const Eigen::Vector2d& right);

/**
 * @brief Derives slope, offset and ratio indicators from a keypoint set
 *
 * Four independent sub-analyses (shoulders, head, hips, knees). A sub-analysis
 * whose landmarks are incomplete yields nullopt instead of zeros.
 */
class PostureMetricsCalculator {
public:
    explicit PostureMetricsCalculator(const Config& config);

    /**
     * @brief Run all sub-analyses (posture_score is left unset)
     */
    PostureMetrics compute(const KeypointSet& keypoints) const;

    std::optional<ShoulderMetrics> analyzeShoulders(const KeypointSet& keypoints) const;
    std::optional<HeadMetrics> analyzeHead(const KeypointSet& keypoints) const;
    std::optional<HipMetrics> analyzeHips(const KeypointSet& keypoints) const;
    std::optional<KneeMetrics> analyzeKnees(const KeypointSet& keypoints) const;

    /**
     * @brief Minimum visibility over the key landmarks that are present
     */
    std::optional<double> detectionConfidence(const KeypointSet& keypoints) const;

private:
    PairAlignmentMetrics analyzePair(
        const Landmark& left,
        const Landmark& right,
        double imbalance_threshold_px
    ) const;

    Config config_;  // Store by value
};

} // namespace posture_analyzer

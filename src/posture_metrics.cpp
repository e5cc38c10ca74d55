/**
 * @file posture_metrics.cpp
 * @brief Implementation of PostureMetricsCalculator
 */

#include "posture_analyzer/posture_metrics.hpp"
#include <algorithm>
#include <cmath>
#include <initializer_list>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace posture_analyzer {

namespace {

constexpr double kRadToDeg = 180.0 / M_PI;

const Landmark* find(const KeypointSet& keypoints, AnatomicalPoint point) {
    auto it = keypoints.find(point);
    return it == keypoints.end() ? nullptr : &it->second;
}

double minVisibility(std::initializer_list<const Landmark*> landmarks) {
    double result = 1.0;
    for (const Landmark* lm : landmarks) {
        result = std::min(result, lm->visibility);
    }
    return result;
}

} // namespace

double pairSlopeDegrees(const Eigen::Vector2d& left, const Eigen::Vector2d& right) {
    Eigen::Vector2d d = right - left;
    if (d.x() == 0.0) {
        return 0.0;
    }
    return std::atan2(d.y(), d.x()) * kRadToDeg;
}

PostureMetricsCalculator::PostureMetricsCalculator(const Config& config)
    : config_(config) {
}

PostureMetrics PostureMetricsCalculator::compute(const KeypointSet& keypoints) const {
    PostureMetrics metrics;
    metrics.shoulder = analyzeShoulders(keypoints);
    metrics.head = analyzeHead(keypoints);
    metrics.hip = analyzeHips(keypoints);
    metrics.knee = analyzeKnees(keypoints);
    metrics.detection_confidence = detectionConfidence(keypoints);
    return metrics;
}

// ============================================================================
// Paired segments (shoulders, hips)
// ============================================================================

PairAlignmentMetrics PostureMetricsCalculator::analyzePair(
    const Landmark& left,
    const Landmark& right,
    double imbalance_threshold_px
) const {
    Eigen::Vector2d l = left.position();
    Eigen::Vector2d r = right.position();

    double height_diff = l.y() - r.y();

    PairAlignmentMetrics result;
    result.slope_deg = roundTo(pairSlopeDegrees(l, r), 2);
    result.height_diff_px = roundTo(height_diff, 1);
    result.span_px = roundTo(r.x() - l.x(), 1);
    result.has_imbalance = std::abs(height_diff) > imbalance_threshold_px;
    result.confidence = std::min(left.visibility, right.visibility);
    return result;
}

std::optional<ShoulderMetrics> PostureMetricsCalculator::analyzeShoulders(
    const KeypointSet& keypoints
) const {
    const Landmark* left = find(keypoints, AnatomicalPoint::LEFT_SHOULDER);
    const Landmark* right = find(keypoints, AnatomicalPoint::RIGHT_SHOULDER);
    if (!left || !right) {
        return std::nullopt;
    }
    return analyzePair(*left, *right, config_.shoulder_imbalance_px);
}

std::optional<HipMetrics> PostureMetricsCalculator::analyzeHips(
    const KeypointSet& keypoints
) const {
    const Landmark* left = find(keypoints, AnatomicalPoint::LEFT_HIP);
    const Landmark* right = find(keypoints, AnatomicalPoint::RIGHT_HIP);
    if (!left || !right) {
        return std::nullopt;
    }
    return analyzePair(*left, *right, config_.hip_imbalance_px);
}

// ============================================================================
// Head
// ============================================================================

std::optional<HeadMetrics> PostureMetricsCalculator::analyzeHead(
    const KeypointSet& keypoints
) const {
    const Landmark* nose = find(keypoints, AnatomicalPoint::NOSE);
    const Landmark* left = find(keypoints, AnatomicalPoint::LEFT_SHOULDER);
    const Landmark* right = find(keypoints, AnatomicalPoint::RIGHT_SHOULDER);
    if (!nose || !left || !right) {
        return std::nullopt;
    }

    Eigen::Vector2d shoulder_mid = 0.5 * (left->position() + right->position());
    Eigen::Vector2d offset = nose->position() - shoulder_mid;

    double tilt_deg = 0.0;
    if (offset.y() != 0.0) {
        tilt_deg = std::atan2(offset.x(), std::abs(offset.y())) * kRadToDeg;
    }

    HeadMetrics result;
    result.tilt_deg = roundTo(tilt_deg, 2);
    result.offset_x_px = roundTo(offset.x(), 1);
    result.offset_y_px = roundTo(offset.y(), 1);
    result.forward_head = std::abs(offset.x()) > config_.forward_head_px;
    result.confidence = minVisibility({nose, left, right});
    return result;
}

// ============================================================================
// Knees
// ============================================================================

std::optional<KneeMetrics> PostureMetricsCalculator::analyzeKnees(
    const KeypointSet& keypoints
) const {
    const Landmark* left_knee = find(keypoints, AnatomicalPoint::LEFT_KNEE);
    const Landmark* right_knee = find(keypoints, AnatomicalPoint::RIGHT_KNEE);
    const Landmark* left_ankle = find(keypoints, AnatomicalPoint::LEFT_ANKLE);
    const Landmark* right_ankle = find(keypoints, AnatomicalPoint::RIGHT_ANKLE);
    const Landmark* left_hip = find(keypoints, AnatomicalPoint::LEFT_HIP);
    const Landmark* right_hip = find(keypoints, AnatomicalPoint::RIGHT_HIP);
    if (!left_knee || !right_knee || !left_ankle || !right_ankle || !left_hip || !right_hip) {
        return std::nullopt;
    }

    double knee_distance = std::abs(left_knee->pixel.x - right_knee->pixel.x);
    double ankle_distance = std::abs(left_ankle->pixel.x - right_ankle->pixel.x);
    double hip_distance = std::abs(left_hip->pixel.x - right_hip->pixel.x);

    // Knees closer together than ankles read as inward collapse
    double valgus = 0.0;
    if (ankle_distance > 0.0 && hip_distance > 0.0) {
        double knee_ratio = knee_distance / ankle_distance;
        valgus = std::max(0.0, (1.0 - knee_ratio) * 100.0);
    }

    KneeMetrics result;
    result.valgus_indicator = roundTo(valgus, 2);
    result.has_valgus = valgus > config_.knee_valgus_threshold;
    result.knee_distance_px = roundTo(knee_distance, 1);
    result.ankle_distance_px = roundTo(ankle_distance, 1);
    result.hip_distance_px = roundTo(hip_distance, 1);
    result.confidence = minVisibility(
        {left_knee, right_knee, left_ankle, right_ankle, left_hip, right_hip}
    );
    return result;
}

// ============================================================================
// Confidence
// ============================================================================

std::optional<double> PostureMetricsCalculator::detectionConfidence(
    const KeypointSet& keypoints
) const {
    static const AnatomicalPoint kKeyPoints[] = {
        AnatomicalPoint::NOSE,
        AnatomicalPoint::LEFT_SHOULDER, AnatomicalPoint::RIGHT_SHOULDER,
        AnatomicalPoint::LEFT_HIP, AnatomicalPoint::RIGHT_HIP,
        AnatomicalPoint::LEFT_KNEE, AnatomicalPoint::RIGHT_KNEE
    };

    std::optional<double> confidence;
    for (AnatomicalPoint point : kKeyPoints) {
        const Landmark* lm = find(keypoints, point);
        if (!lm) {
            continue;
        }
        confidence = confidence ? std::min(*confidence, lm->visibility) : lm->visibility;
    }
    return confidence;
}

} // namespace posture_analyzer

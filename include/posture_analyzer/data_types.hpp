/**
 * @file data_types.hpp
 * @brief Core records: landmarks, posture metrics, recommendations, plans, progress
 */

#pragma once

#include "common.hpp"
#include <Eigen/Dense>
#include <opencv2/core.hpp>
#include <cstdio>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace posture_analyzer {

// ============================================================================
// Pose input
// ============================================================================

/**
 * @brief Single landmark as emitted by the pose-estimation model
 */
struct RawLandmark {
    LandmarkIndex index;
    double x;                 ///< Normalized [0, 1]
    double y;                 ///< Normalized [0, 1]
    double z = 0.0;           ///< Relative depth (model units)
    double visibility = 0.0;  ///< Detection confidence [0, 1]
};

/**
 * @brief Output of one pose-estimation pass over one photograph
 *
 * An empty landmark list means the model found no pose at all.
 */
struct PoseObservation {
    ViewType view = ViewType::FRONT;
    cv::Size image_size;
    std::vector<RawLandmark> landmarks;

    bool hasDetection() const { return !landmarks.empty(); }
};

/**
 * @brief Named anatomical point in pixel space
 */
struct Landmark {
    AnatomicalPoint name;
    cv::Point2d pixel;       ///< Pixel coordinates
    double z = 0.0;
    double visibility = 0.0;
    cv::Point2d normalized;  ///< Original [0, 1] coordinates

    Eigen::Vector2d position() const {
        return Eigen::Vector2d(pixel.x, pixel.y);
    }
};

using KeypointSet = std::map<AnatomicalPoint, Landmark>;

// ============================================================================
// Posture metrics
// ============================================================================

/**
 * @brief Alignment of a left/right landmark pair (shoulders or hips)
 */
struct PairAlignmentMetrics {
    double slope_deg;         ///< Segment angle vs. horizontal, 0 when points share x
    double height_diff_px;    ///< left.y - right.y
    double span_px;           ///< right.x - left.x
    bool has_imbalance;
    double confidence;        ///< min visibility of the pair
};

using ShoulderMetrics = PairAlignmentMetrics;
using HipMetrics = PairAlignmentMetrics;

/**
 * @brief Head position relative to the shoulder midpoint
 */
struct HeadMetrics {
    double tilt_deg;
    double offset_x_px;       ///< nose.x - shoulder_mid.x
    double offset_y_px;       ///< nose.y - shoulder_mid.y
    bool forward_head;
    double confidence;        ///< min visibility of nose and both shoulders
};

/**
 * @brief 1-D knee valgus proxy from horizontal joint spacing
 *
 * Not a joint angle: compares knee spacing to ankle spacing only.
 */
struct KneeMetrics {
    double valgus_indicator;  ///< 0-100
    bool has_valgus;
    double knee_distance_px;
    double ankle_distance_px;
    double hip_distance_px;
    double confidence;        ///< min visibility of knees, ankles and hips
};

/**
 * @brief Per-analysis posture record
 *
 * Each sub-analysis is present only if all of its landmarks were detected.
 */
struct PostureMetrics {
    std::optional<ShoulderMetrics> shoulder;
    std::optional<HeadMetrics> head;
    std::optional<HipMetrics> hip;
    std::optional<KneeMetrics> knee;

    std::optional<double> posture_score;         ///< [1, 10]
    std::optional<double> detection_confidence;  ///< min visibility of key landmarks

    bool empty() const {
        return !shoulder && !head && !hip && !knee;
    }

    bool hasShoulderImbalance() const { return shoulder && shoulder->has_imbalance; }
    bool hasHipImbalance() const { return hip && hip->has_imbalance; }
    bool hasForwardHead() const { return head && head->forward_head; }
    bool hasKneeValgus() const { return knee && knee->has_valgus; }

    std::string toString() const {
        char buffer[256];
        snprintf(buffer, sizeof(buffer),
                 "PostureMetrics(score=%s, shoulder=%s, head=%s, hip=%s, knee=%s)",
                 posture_score ? std::to_string(*posture_score).c_str() : "n/a",
                 shoulder ? (shoulder->has_imbalance ? "IMBALANCE" : "ok") : "n/a",
                 head ? (head->forward_head ? "FORWARD" : "ok") : "n/a",
                 hip ? (hip->has_imbalance ? "IMBALANCE" : "ok") : "n/a",
                 knee ? (knee->has_valgus ? "VALGUS" : "ok") : "n/a");
        return std::string(buffer);
    }
};

// ============================================================================
// Recommendations
// ============================================================================

/**
 * @brief Actionable recommendation produced by the rule engine
 */
struct Recommendation {
    RecommendationCategory category = RecommendationCategory::POSTURE;
    Priority priority = Priority::MEDIUM;
    std::string title;
    std::string description;
    std::vector<std::string> action_steps;

    bool is_completed = false;
    std::optional<Timestamp> completed_at;
    std::optional<Timestamp> expires_at;

    bool is_fallback = false;  ///< Built by makeFallbackRecommendation()

    void markCompleted(Timestamp now) {
        is_completed = true;
        completed_at = now;
    }

    bool isExpired(Timestamp now) const {
        return expires_at.has_value() && now >= *expires_at;
    }

    bool isActive(Timestamp now) const {
        return !is_completed && !isExpired(now);
    }
};

// ============================================================================
// Body composition
// ============================================================================

struct BodyCompositionEstimate {
    double body_fat_pct;                 ///< [5, 50]
    double muscle_mass_pct;              ///< Derived from body fat
    std::optional<int> visceral_fat_level;  ///< [1, 30], only with WHR
    std::optional<BodyShape> body_shape;    ///< Only with WHR

    std::string toString() const {
        char buffer[160];
        snprintf(buffer, sizeof(buffer),
                 "BodyComposition(fat=%.1f%%, muscle=%.1f%%, visceral=%s, shape=%s)",
                 body_fat_pct, muscle_mass_pct,
                 visceral_fat_level ? std::to_string(*visceral_fat_level).c_str() : "n/a",
                 body_shape ? posture_analyzer::toString(*body_shape).c_str() : "n/a");
        return std::string(buffer);
    }
};

// ============================================================================
// Workout plan
// ============================================================================

struct Exercise {
    std::string name;
    std::optional<int> sets;
    std::optional<std::string> reps;      ///< e.g. "12-15", "10 each leg"
    std::optional<std::string> duration;  ///< e.g. "30 sec"
};

/**
 * @brief Generated training plan
 *
 * The corrective warm-up is kept apart from the main exercise list.
 */
struct WorkoutPlan {
    std::string name;
    std::string description;
    WorkoutType type;
    FitnessTier difficulty;
    int duration_minutes;
    std::vector<Exercise> exercises;
    std::optional<std::vector<Exercise>> corrective_warmup;
};

// ============================================================================
// Progress
// ============================================================================

/**
 * @brief Historical metric values at one point in time
 */
struct MetricSnapshot {
    std::string date;  ///< ISO-8601 date
    std::optional<double> weight_kg;
    std::optional<double> posture_score;
    std::optional<double> shoulder_slope_deg;
};

/**
 * @brief Change between two snapshots
 */
struct ProgressSnapshot {
    std::string period_start;
    std::string period_end;
    std::optional<double> weight_change;         ///< kg, negative = loss
    std::optional<double> posture_score_change;
    std::optional<double> shoulder_improvement;  ///< deg, positive = straighter
    double overall_score;                        ///< [1, 10]

    std::string toString() const {
        char buffer[160];
        snprintf(buffer, sizeof(buffer), "Progress(%s..%s, score=%.1f)",
                 period_start.c_str(), period_end.c_str(), overall_score);
        return std::string(buffer);
    }
};

} // namespace posture_analyzer

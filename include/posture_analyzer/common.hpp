/**
 * @file common.hpp
 * @brief Common enums, string conversions and numeric helpers for posture analysis
 */

#pragma once

#include <cmath>
#include <cstdint>
#include <optional>
#include <string>

namespace posture_analyzer {

// ============================================================================
// Enumerations
// ============================================================================

/**
 * @brief Named anatomical points tracked by the analyzer
 */
enum class AnatomicalPoint {
    NOSE,
    LEFT_EYE,
    RIGHT_EYE,
    LEFT_EAR,
    RIGHT_EAR,
    LEFT_SHOULDER,
    RIGHT_SHOULDER,
    LEFT_ELBOW,
    RIGHT_ELBOW,
    LEFT_WRIST,
    RIGHT_WRIST,
    LEFT_HIP,
    RIGHT_HIP,
    LEFT_KNEE,
    RIGHT_KNEE,
    LEFT_ANKLE,
    RIGHT_ANKLE,
    LEFT_HEEL,
    RIGHT_HEEL,
    LEFT_FOOT,
    RIGHT_FOOT
};

/**
 * @brief Recommendation category
 */
enum class RecommendationCategory {
    EXERCISE,
    NUTRITION,
    POSTURE,
    LIFESTYLE,
    RECOVERY
};

/**
 * @brief Recommendation priority (ascending severity)
 */
enum class Priority {
    LOW,
    MEDIUM,
    HIGH,
    CRITICAL
};

/**
 * @brief Silhouette class derived from waist-to-hip ratio
 */
enum class BodyShape {
    APPLE,
    PEAR,
    RECTANGLE
};

enum class Gender {
    MALE,
    FEMALE
};

/**
 * @brief Training goal from the user profile
 */
enum class Goal {
    LOSE,      ///< Weight loss
    MAINTAIN,  ///< Keep current form
    GAIN       ///< Muscle gain
};

/**
 * @brief Coarse difficulty bucket derived from the activity multiplier
 */
enum class FitnessTier {
    BEGINNER,
    INTERMEDIATE,
    ADVANCED
};

enum class WorkoutType {
    STRENGTH,
    CARDIO,
    FLEXIBILITY,
    BALANCE,
    REHABILITATION
};

/**
 * @brief Which photograph a pose observation came from
 */
enum class ViewType {
    FRONT,
    BACK
};

/**
 * @brief Why a fallback recommendation was produced
 */
enum class FallbackReason {
    NORMAL_RANGE,  ///< Every rule evaluated, none fired
    NO_DETECTION   ///< No usable pose in any view
};

// ============================================================================
// String conversions
// ============================================================================

inline std::string toString(AnatomicalPoint point) {
    switch (point) {
        case AnatomicalPoint::NOSE: return "nose";
        case AnatomicalPoint::LEFT_EYE: return "left_eye";
        case AnatomicalPoint::RIGHT_EYE: return "right_eye";
        case AnatomicalPoint::LEFT_EAR: return "left_ear";
        case AnatomicalPoint::RIGHT_EAR: return "right_ear";
        case AnatomicalPoint::LEFT_SHOULDER: return "left_shoulder";
        case AnatomicalPoint::RIGHT_SHOULDER: return "right_shoulder";
        case AnatomicalPoint::LEFT_ELBOW: return "left_elbow";
        case AnatomicalPoint::RIGHT_ELBOW: return "right_elbow";
        case AnatomicalPoint::LEFT_WRIST: return "left_wrist";
        case AnatomicalPoint::RIGHT_WRIST: return "right_wrist";
        case AnatomicalPoint::LEFT_HIP: return "left_hip";
        case AnatomicalPoint::RIGHT_HIP: return "right_hip";
        case AnatomicalPoint::LEFT_KNEE: return "left_knee";
        case AnatomicalPoint::RIGHT_KNEE: return "right_knee";
        case AnatomicalPoint::LEFT_ANKLE: return "left_ankle";
        case AnatomicalPoint::RIGHT_ANKLE: return "right_ankle";
        case AnatomicalPoint::LEFT_HEEL: return "left_heel";
        case AnatomicalPoint::RIGHT_HEEL: return "right_heel";
        case AnatomicalPoint::LEFT_FOOT: return "left_foot";
        case AnatomicalPoint::RIGHT_FOOT: return "right_foot";
        default: return "unknown";
    }
}

inline std::string toString(RecommendationCategory category) {
    switch (category) {
        case RecommendationCategory::EXERCISE: return "exercise";
        case RecommendationCategory::NUTRITION: return "nutrition";
        case RecommendationCategory::POSTURE: return "posture";
        case RecommendationCategory::LIFESTYLE: return "lifestyle";
        case RecommendationCategory::RECOVERY: return "recovery";
        default: return "unknown";
    }
}

inline std::string toString(Priority priority) {
    switch (priority) {
        case Priority::LOW: return "low";
        case Priority::MEDIUM: return "medium";
        case Priority::HIGH: return "high";
        case Priority::CRITICAL: return "critical";
        default: return "unknown";
    }
}

inline std::string toString(BodyShape shape) {
    switch (shape) {
        case BodyShape::APPLE: return "apple";
        case BodyShape::PEAR: return "pear";
        case BodyShape::RECTANGLE: return "rectangle";
        default: return "unknown";
    }
}

inline std::string toString(Gender gender) {
    switch (gender) {
        case Gender::MALE: return "M";
        case Gender::FEMALE: return "F";
        default: return "unknown";
    }
}

inline std::string toString(Goal goal) {
    switch (goal) {
        case Goal::LOSE: return "lose";
        case Goal::MAINTAIN: return "maintain";
        case Goal::GAIN: return "gain";
        default: return "unknown";
    }
}

inline std::string toString(FitnessTier tier) {
    switch (tier) {
        case FitnessTier::BEGINNER: return "beginner";
        case FitnessTier::INTERMEDIATE: return "intermediate";
        case FitnessTier::ADVANCED: return "advanced";
        default: return "unknown";
    }
}

inline std::string toString(WorkoutType type) {
    switch (type) {
        case WorkoutType::STRENGTH: return "strength";
        case WorkoutType::CARDIO: return "cardio";
        case WorkoutType::FLEXIBILITY: return "flexibility";
        case WorkoutType::BALANCE: return "balance";
        case WorkoutType::REHABILITATION: return "rehabilitation";
        default: return "unknown";
    }
}

inline std::string toString(ViewType view) {
    switch (view) {
        case ViewType::FRONT: return "front";
        case ViewType::BACK: return "back";
        default: return "unknown";
    }
}

inline std::string toString(FallbackReason reason) {
    switch (reason) {
        case FallbackReason::NORMAL_RANGE: return "normal_range";
        case FallbackReason::NO_DETECTION: return "no_detection";
        default: return "unknown";
    }
}

/**
 * @brief Parse gender code ("M"/"F", case-insensitive)
 */
inline std::optional<Gender> parseGender(const std::string& code) {
    if (code == "M" || code == "m") return Gender::MALE;
    if (code == "F" || code == "f") return Gender::FEMALE;
    return std::nullopt;
}

inline std::optional<Goal> parseGoal(const std::string& name) {
    if (name == "lose") return Goal::LOSE;
    if (name == "maintain") return Goal::MAINTAIN;
    if (name == "gain") return Goal::GAIN;
    return std::nullopt;
}

// ============================================================================
// Numeric helpers
// ============================================================================

/**
 * @brief Round to a fixed number of decimals (half away from zero)
 */
inline double roundTo(double value, int decimals) {
    double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

// ============================================================================
// Type aliases for clarity
// ============================================================================

using LandmarkIndex = int32_t;
using Timestamp = double;  ///< Seconds since the Unix epoch

} // namespace posture_analyzer

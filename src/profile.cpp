/**
 * @file profile.cpp
 * @brief Derived anthropometrics for UserProfile and BodyMeasurements
 */

#include "posture_analyzer/profile.hpp"
#include <cmath>

namespace posture_analyzer {

// ============================================================================
// UserProfile
// ============================================================================

std::optional<double> UserProfile::bmi() const {
    if (bmi_override) {
        return *bmi_override;
    }
    if (!height_cm || !weight_kg || *height_cm <= 0.0 || *weight_kg <= 0.0) {
        return std::nullopt;
    }

    double height_m = *height_cm / 100.0;
    return roundTo(*weight_kg / (height_m * height_m), 1);
}

std::optional<int> UserProfile::bmr() const {
    if (!weight_kg || !height_cm || !age || !gender) {
        return std::nullopt;
    }

    double bmr = 10.0 * *weight_kg + 6.25 * *height_cm - 5.0 * *age;
    bmr += (*gender == Gender::MALE) ? 5.0 : -161.0;
    return static_cast<int>(std::round(bmr));
}

std::optional<int> UserProfile::tdee() const {
    auto base = bmr();
    if (!base) {
        return std::nullopt;
    }
    return static_cast<int>(std::round(*base * activity_level));
}

std::optional<int> UserProfile::targetCalories() const {
    auto expenditure = tdee();
    if (!expenditure) {
        return std::nullopt;
    }

    switch (goal) {
        case Goal::LOSE: return *expenditure - 400;
        case Goal::GAIN: return *expenditure + 300;
        case Goal::MAINTAIN:
        default: return *expenditure;
    }
}

// ============================================================================
// BodyMeasurements
// ============================================================================

std::optional<double> BodyMeasurements::whr() const {
    if (whr_override) {
        return *whr_override;
    }
    if (!waist_cm || !hip_cm || *waist_cm <= 0.0 || *hip_cm <= 0.0) {
        return std::nullopt;
    }
    return roundTo(*waist_cm / *hip_cm, 3);
}

} // namespace posture_analyzer

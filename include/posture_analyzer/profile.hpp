/**
 * @file profile.hpp
 * @brief User profile and body measurement inputs with derived anthropometrics
 */

#pragma once

#include "common.hpp"
#include <optional>

namespace posture_analyzer {

/**
 * @brief Profile supplied by the profile collaborator
 *
 * BMI may be given directly or derived from height and weight.
 */
struct UserProfile {
    std::optional<double> bmi_override;  ///< Explicit BMI, wins over height/weight
    std::optional<double> height_cm;
    std::optional<double> weight_kg;
    std::optional<int> age;
    std::optional<Gender> gender;

    double activity_level = 1.55;  ///< One of {1.2, 1.375, 1.55, 1.725, 1.9}
    Goal goal = Goal::LOSE;

    /**
     * @brief Body-mass index, rounded to one decimal
     */
    std::optional<double> bmi() const;

    /**
     * @brief Basal metabolic rate (Mifflin-St Jeor), kcal/day
     */
    std::optional<int> bmr() const;

    /**
     * @brief Total daily energy expenditure, kcal/day
     */
    std::optional<int> tdee() const;

    /**
     * @brief Daily calorie target for the profile goal
     */
    std::optional<int> targetCalories() const;
};

/**
 * @brief Circumference measurements from the measurement collaborator
 */
struct BodyMeasurements {
    std::optional<double> waist_cm;
    std::optional<double> hip_cm;
    std::optional<double> whr_override;  ///< Explicit WHR, wins over circumferences

    /**
     * @brief Waist-to-hip ratio, rounded to three decimals
     */
    std::optional<double> whr() const;
};

} // namespace posture_analyzer

/**
 * @file body_composition.hpp
 * @brief Closed-form body composition estimate from anthropometrics
 */

#pragma once

#include "common.hpp"
#include "config.hpp"
#include "data_types.hpp"
#include "profile.hpp"
#include <optional>

namespace posture_analyzer {

/**
 * @brief Estimates body fat, muscle share, visceral fat and body shape
 *
 * Visceral fat and body shape are only produced when a waist-to-hip ratio is
 * available. Visceral breakpoints depend on gender while the shape
 * thresholds do not.
 */
class BodyCompositionEstimator {
public:
    /**
     * @throws std::runtime_error if the config has an inverted bound pair
     */
    explicit BodyCompositionEstimator(const Config& config);

    /**
     * @brief Estimate from explicit inputs
     */
    BodyCompositionEstimate estimate(
        double bmi,
        int age,
        Gender gender,
        const std::optional<double>& whr = std::nullopt
    ) const;

    /**
     * @brief Estimate from collaborator records
     * @return nullopt if BMI, age or gender is missing from the profile
     */
    std::optional<BodyCompositionEstimate> estimate(
        const UserProfile& profile,
        const std::optional<BodyMeasurements>& measurements = std::nullopt
    ) const;

    double bodyFatPercent(double bmi, int age, Gender gender) const;
    double muscleMassPercent(double body_fat_pct) const;
    int visceralFatLevel(double whr, Gender gender) const;
    BodyShape classifyShape(double whr) const;

private:
    Config config_;  // Store by value
};

} // namespace posture_analyzer

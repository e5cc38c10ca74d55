/**
 * @file body_composition.cpp
 * @brief Implementation of BodyCompositionEstimator
 */

#include "posture_analyzer/body_composition.hpp"
#include <algorithm>
#include <cmath>

namespace posture_analyzer {

BodyCompositionEstimator::BodyCompositionEstimator(const Config& config)
    : config_(config) {
    validateConfig(config_);
}

double BodyCompositionEstimator::bodyFatPercent(double bmi, int age, Gender gender) const {
    // BMI/age regression, sex offset -16.2 (male) or -5.4
    double offset = (gender == Gender::MALE) ? 16.2 : 5.4;
    double body_fat = 1.20 * bmi + 0.23 * age - offset;
    return std::clamp(roundTo(body_fat, 1), config_.body_fat_min_pct, config_.body_fat_max_pct);
}

double BodyCompositionEstimator::muscleMassPercent(double body_fat_pct) const {
    return roundTo((100.0 - body_fat_pct) * config_.muscle_factor, 1);
}

int BodyCompositionEstimator::visceralFatLevel(double whr, Gender gender) const {
    double visceral;
    if (gender == Gender::MALE) {
        double bp = config_.visceral_breakpoint_male;
        visceral = (whr > bp) ? 15.0 + (whr - bp) * 20.0 : whr * 12.0;
    } else {
        double bp = config_.visceral_breakpoint_female;
        visceral = (whr > bp) ? 10.0 + (whr - bp) * 25.0 : whr * 10.0;
    }

    visceral = std::clamp(visceral,
                          double(config_.visceral_min),
                          double(config_.visceral_max));
    return static_cast<int>(std::round(visceral));
}

BodyShape BodyCompositionEstimator::classifyShape(double whr) const {
    if (whr > config_.apple_whr) {
        return BodyShape::APPLE;
    }
    if (whr < config_.pear_whr) {
        return BodyShape::PEAR;
    }
    return BodyShape::RECTANGLE;
}

BodyCompositionEstimate BodyCompositionEstimator::estimate(
    double bmi,
    int age,
    Gender gender,
    const std::optional<double>& whr
) const {
    BodyCompositionEstimate result;
    result.body_fat_pct = bodyFatPercent(bmi, age, gender);
    result.muscle_mass_pct = muscleMassPercent(result.body_fat_pct);

    if (whr && *whr > 0.0) {
        result.visceral_fat_level = visceralFatLevel(*whr, gender);
        result.body_shape = classifyShape(*whr);
    }

    return result;
}

std::optional<BodyCompositionEstimate> BodyCompositionEstimator::estimate(
    const UserProfile& profile,
    const std::optional<BodyMeasurements>& measurements
) const {
    auto bmi = profile.bmi();
    if (!bmi || !profile.age || !profile.gender) {
        return std::nullopt;
    }

    std::optional<double> whr;
    if (measurements) {
        whr = measurements->whr();
    }

    return estimate(*bmi, *profile.age, *profile.gender, whr);
}

} // namespace posture_analyzer

/**
 * @file progress_tracker.cpp
 * @brief Implementation of ProgressDeltaCalculator
 */

#include "posture_analyzer/progress_tracker.hpp"
#include <algorithm>
#include <cmath>

namespace posture_analyzer {

ProgressDeltaCalculator::ProgressDeltaCalculator(const Config& config)
    : config_(config) {
    validateConfig(config_);
}

ProgressSnapshot ProgressDeltaCalculator::compute(
    const MetricSnapshot& start,
    const MetricSnapshot& end
) const {
    ProgressSnapshot progress;
    progress.period_start = start.date;
    progress.period_end = end.date;

    if (start.weight_kg && end.weight_kg) {
        progress.weight_change = roundTo(*end.weight_kg - *start.weight_kg, 1);
    }
    if (start.posture_score && end.posture_score) {
        progress.posture_score_change = roundTo(*end.posture_score - *start.posture_score, 1);
    }
    if (start.shoulder_slope_deg && end.shoulder_slope_deg) {
        progress.shoulder_improvement = roundTo(
            std::abs(*start.shoulder_slope_deg) - std::abs(*end.shoulder_slope_deg), 2);
    }

    progress.overall_score = overallScore(progress.weight_change, progress.posture_score_change);
    return progress;
}

double ProgressDeltaCalculator::overallScore(
    const std::optional<double>& weight_change,
    const std::optional<double>& posture_score_change
) const {
    double score = config_.progress_base_score;

    if (weight_change && *weight_change < 0.0) {
        score += std::min(std::abs(*weight_change) * config_.weight_loss_factor,
                          config_.weight_loss_cap);
    }

    if (posture_score_change) {
        score += std::min(*posture_score_change * config_.posture_change_factor,
                          config_.posture_change_cap);
    }

    return std::clamp(roundTo(score, 1), config_.score_min, config_.score_max);
}

} // namespace posture_analyzer

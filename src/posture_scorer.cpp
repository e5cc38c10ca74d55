/**
 * @file posture_scorer.cpp
 * @brief Implementation of PostureScorer
 */

#include "posture_analyzer/posture_scorer.hpp"
#include <algorithm>
#include <cmath>

namespace posture_analyzer {

PostureScorer::PostureScorer(const Config& config)
    : config_(config) {
    validateConfig(config_);
}

std::map<std::string, double> PostureScorer::penalties(const PostureMetrics& metrics) const {
    std::map<std::string, double> result;

    if (metrics.shoulder) {
        result["shoulder_slope"] = std::min(
            std::abs(metrics.shoulder->slope_deg) / config_.shoulder_slope_divisor,
            config_.shoulder_penalty_cap);
        if (metrics.shoulder->has_imbalance) {
            result["shoulder_imbalance"] = config_.flag_penalty;
        }
    }

    if (metrics.hip) {
        result["hip_slope"] = std::min(
            std::abs(metrics.hip->slope_deg) / config_.hip_slope_divisor,
            config_.hip_penalty_cap);
        if (metrics.hip->has_imbalance) {
            result["hip_imbalance"] = config_.flag_penalty;
        }
    }

    if (metrics.head) {
        result["head_tilt"] = std::min(
            std::abs(metrics.head->tilt_deg) / config_.head_tilt_divisor,
            config_.head_penalty_cap);
        if (metrics.head->forward_head) {
            result["forward_head"] = config_.flag_penalty;
        }
    }

    if (metrics.knee) {
        result["knee_valgus"] = std::min(
            metrics.knee->valgus_indicator / config_.knee_valgus_divisor,
            config_.knee_penalty_cap);
    }

    return result;
}

std::optional<double> PostureScorer::score(const PostureMetrics& metrics) const {
    if (metrics.empty()) {
        return std::nullopt;
    }

    double score = config_.score_max;
    for (const auto& [name, penalty] : penalties(metrics)) {
        score -= penalty;
    }

    score = std::clamp(score, config_.score_min, config_.score_max);
    return roundTo(score, 1);
}

std::optional<double> PostureScorer::combineViews(
    const std::optional<double>& front_score,
    const std::optional<double>& back_score
) {
    if (front_score && back_score) {
        return (*front_score + *back_score) / 2.0;
    }
    if (front_score) {
        return front_score;
    }
    return back_score;
}

} // namespace posture_analyzer

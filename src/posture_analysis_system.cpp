/**
 * @file posture_analysis_system.cpp
 * @brief Implementation of the posture analysis pipeline
 */

#include "posture_analyzer/posture_analysis_system.hpp"
#include "posture_analyzer/keypoint_normalizer.hpp"
#include "posture_analyzer/posture_metrics.hpp"
#include "posture_analyzer/posture_scorer.hpp"
#include "posture_analyzer/recommendation_engine.hpp"
#include <initializer_list>
#include <iostream>

namespace posture_analyzer {

PostureAnalysisSystem::PostureAnalysisSystem(const Config& config)
    : cfg_(config) {

    // Build stages from member cfg_, not the parameter
    metrics_calculator_ = std::make_unique<PostureMetricsCalculator>(cfg_);
    scorer_ = std::make_unique<PostureScorer>(cfg_);
    recommendation_engine_ = std::make_unique<RecommendationEngine>();
}

PostureAnalysisSystem::~PostureAnalysisSystem() = default;

ViewAnalysis PostureAnalysisSystem::analyzeView(const PoseObservation& observation) const {
    ViewAnalysis view;
    view.view = observation.view;
    view.detected = observation.hasDetection();

    if (!view.detected) {
        return view;
    }

    view.keypoints = normalizeKeypoints(observation);
    view.metrics = metrics_calculator_->compute(view.keypoints);
    view.metrics.posture_score = scorer_->score(view.metrics);
    return view;
}

PostureAnalysisResult PostureAnalysisSystem::analyze(
    const std::optional<PoseObservation>& front,
    const std::optional<PoseObservation>& back
) {
    analysis_count_++;

    PostureAnalysisResult result;

    if (front) {
        result.front = analyzeView(*front);
        result.front->view = ViewType::FRONT;
    }
    if (back) {
        result.back = analyzeView(*back);
        result.back->view = ViewType::BACK;
    }

    for (const auto* view : {&result.front, &result.back}) {
        if (!*view) {
            continue;
        }
        if (!(*view)->detected) {
            log("No pose detected in " + toString((*view)->view) + " view");
        } else if (!(*view)->isScored()) {
            log("Pose in " + toString((*view)->view) + " view too incomplete to score");
        }
    }

    bool front_scored = result.front && result.front->isScored();
    bool back_scored = result.back && result.back->isScored();

    // === FALLBACK: nothing to score ===
    if (!front_scored && !back_scored) {
        result.posture_score = cfg_.no_detection_score;
        result.recommendations = {makeFallbackRecommendation(FallbackReason::NO_DETECTION)};
        result.recommendations_generated = 1;
        result.used_fallback = true;
        fallback_count_++;
        last_penalties_.clear();

        log("Using fallback result (score " + std::to_string(result.posture_score) + ")");
        last_result_ = result;
        return result;
    }

    // === MERGE: front first, back fills the hip ===
    result.metrics = front_scored ? result.front->metrics : result.back->metrics;

    if (front_scored && back_scored && !result.metrics.hip && result.back->metrics.hip) {
        result.metrics.hip = result.back->metrics.hip;
        result.hip_from_back = true;
        log("Hip metric taken from back view");
    }

    auto combined = PostureScorer::combineViews(
        front_scored ? result.front->metrics.posture_score : std::optional<double>(),
        back_scored ? result.back->metrics.posture_score : std::optional<double>()
    );
    result.posture_score = *combined;
    result.metrics.posture_score = combined;

    // === RECOMMENDATIONS ===
    auto recommendations = recommendation_engine_->generate(result.metrics);
    result.recommendations_generated = recommendations.size();
    result.recommendations = capRecommendations(
        recommendations, size_t(cfg_.max_recommendations_per_analysis));

    if (result.recommendations.size() < recommendations.size()) {
        log("Truncated recommendations from " + std::to_string(recommendations.size()) +
            " to " + std::to_string(result.recommendations.size()));
    }

    last_penalties_ = scorer_->penalties(result.metrics);
    last_result_ = result;
    return result;
}

std::map<std::string, double> PostureAnalysisSystem::getStatus() const {
    std::map<std::string, double> status;
    status["analysis_count"] = analysis_count_;
    status["fallback_count"] = fallback_count_;

    if (!last_result_) {
        return status;
    }

    const auto& r = *last_result_;
    status["posture_score"] = r.posture_score;
    status["used_fallback"] = r.used_fallback ? 1.0 : 0.0;
    status["hip_from_back"] = r.hip_from_back ? 1.0 : 0.0;
    status["recommendations_generated"] = double(r.recommendations_generated);
    status["recommendations_kept"] = double(r.recommendations.size());

    if (r.front) {
        status["front_detected"] = r.front->detected ? 1.0 : 0.0;
        status["front_landmarks"] = double(r.front->keypoints.size());
        if (r.front->metrics.posture_score) {
            status["front_score"] = *r.front->metrics.posture_score;
        }
    }
    if (r.back) {
        status["back_detected"] = r.back->detected ? 1.0 : 0.0;
        status["back_landmarks"] = double(r.back->keypoints.size());
        if (r.back->metrics.posture_score) {
            status["back_score"] = *r.back->metrics.posture_score;
        }
    }
    if (r.metrics.detection_confidence) {
        status["detection_confidence"] = *r.metrics.detection_confidence;
    }

    for (const auto& [k, v] : last_penalties_) {
        status["penalty_" + k] = v;
    }

    return status;
}

void PostureAnalysisSystem::log(const std::string& message) const {
    if (cfg_.verbose) {
        std::cout << "[PostureAnalysisSystem] " << message << "\n";
    }
}

} // namespace posture_analyzer

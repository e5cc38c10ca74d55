/**
 * @file posture_analysis_system.hpp
 * @brief Posture pipeline: normalizer -> metrics -> score -> recommendations
 */

#pragma once

#include "common.hpp"
#include "config.hpp"
#include "data_types.hpp"
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace posture_analyzer {

// Forward declarations
class PostureMetricsCalculator;
class PostureScorer;
class RecommendationEngine;

/**
 * @brief Result of analyzing one photograph
 */
struct ViewAnalysis {
    ViewType view;
    bool detected = false;   ///< Pose model returned landmarks
    KeypointSet keypoints;
    PostureMetrics metrics;  ///< posture_score unset if no sub-analysis was possible

    bool isScored() const { return metrics.posture_score.has_value(); }
};

/**
 * @brief Combined front/back posture analysis
 */
struct PostureAnalysisResult {
    std::optional<ViewAnalysis> front;
    std::optional<ViewAnalysis> back;

    PostureMetrics metrics;   ///< Primary view, hip filled from back view if missing
    double posture_score = 0.0;  ///< Mean over scored views, or the no-detection score
    std::vector<Recommendation> recommendations;  ///< Capped, rule order preserved

    size_t recommendations_generated = 0;  ///< Before the cap
    bool used_fallback = false;            ///< No view could be scored
    bool hip_from_back = false;
};

/**
 * @brief Main posture analysis pipeline
 *
 * Front view takes precedence; the back view contributes its score to the
 * average and fills in the hip metric when the front view has none. When no
 * view can be scored, the pipeline returns the fixed fallback score and a
 * single generic recommendation instead of failing.
 *
 * The stages are stateless. The system only keeps diagnostics of the last
 * run, so use one instance per thread.
 */
class PostureAnalysisSystem {
public:
    explicit PostureAnalysisSystem(const Config& config = Config());
    ~PostureAnalysisSystem();

    /**
     * @brief Normalize, measure and score a single observation
     *
     * @throws std::invalid_argument if the observation has landmarks but a
     *         non-positive image size
     */
    ViewAnalysis analyzeView(const PoseObservation& observation) const;

    /**
     * @brief Analyze front and/or back observations
     *
     * @param front Front-view observation, nullopt if no photo was taken
     * @param back Back-view observation, nullopt if no photo was taken
     */
    PostureAnalysisResult analyze(
        const std::optional<PoseObservation>& front,
        const std::optional<PoseObservation>& back = std::nullopt
    );

    /**
     * @brief Diagnostics of the last analyze() call
     */
    std::map<std::string, double> getStatus() const;

    const Config& config() const { return cfg_; }

private:
    void log(const std::string& message) const;

    Config cfg_;

    std::unique_ptr<PostureMetricsCalculator> metrics_calculator_;
    std::unique_ptr<PostureScorer> scorer_;
    std::unique_ptr<RecommendationEngine> recommendation_engine_;

    // Telemetry
    int analysis_count_ = 0;
    int fallback_count_ = 0;
    std::optional<PostureAnalysisResult> last_result_;
    std::map<std::string, double> last_penalties_;
};

} // namespace posture_analyzer

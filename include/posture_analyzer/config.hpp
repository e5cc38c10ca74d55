/**
 * @file config.hpp
 * @brief Analysis configuration: every threshold and weight in one place
 */

#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace posture_analyzer {

/**
 * @brief System configuration with all tunable parameters
 *
 * Defaults are the stock rule constants. Pixel thresholds are in
 * source-image pixels, angles in degrees.
 */
struct Config {
    // =========================================================================
    // GEOMETRIC THRESHOLDS
    // =========================================================================

    double shoulder_imbalance_px = 10.0;  ///< |left.y - right.y| above this flags shoulders
    double hip_imbalance_px = 8.0;        ///< |left.y - right.y| above this flags hips
    double forward_head_px = 15.0;        ///< |nose.x - shoulder_mid.x| above this flags head
    double knee_valgus_threshold = 15.0;  ///< Valgus indicator (0-100) above this flags knees

    // =========================================================================
    // POSTURE SCORE
    // =========================================================================

    double score_max = 10.0;
    double score_min = 1.0;
    double no_detection_score = 5.0;      ///< Substituted when no view yields a pose

    double shoulder_slope_divisor = 5.0;  ///< deg per penalty point
    double shoulder_penalty_cap = 2.5;
    double hip_slope_divisor = 5.0;       ///< deg per penalty point
    double hip_penalty_cap = 2.0;
    double head_tilt_divisor = 10.0;      ///< deg per penalty point
    double head_penalty_cap = 1.5;
    double knee_valgus_divisor = 20.0;    ///< indicator units per penalty point
    double knee_penalty_cap = 1.5;
    double flag_penalty = 1.0;            ///< Per raised imbalance / forward-head flag

    // =========================================================================
    // RECOMMENDATIONS
    // =========================================================================

    int max_recommendations_per_analysis = 3;  ///< Cap applied by the pipeline

    // =========================================================================
    // BODY COMPOSITION
    // =========================================================================

    double body_fat_min_pct = 5.0;
    double body_fat_max_pct = 50.0;
    double muscle_factor = 0.45;          ///< Share of lean mass counted as muscle
    int visceral_min = 1;
    int visceral_max = 30;
    double visceral_breakpoint_male = 1.0;    ///< WHR
    double visceral_breakpoint_female = 0.85; ///< WHR
    double apple_whr = 0.85;              ///< WHR strictly above -> apple
    double pear_whr = 0.75;               ///< WHR strictly below -> pear

    // =========================================================================
    // WORKOUT PLAN
    // =========================================================================

    double beginner_max_activity = 1.375;     ///< Activity multiplier
    double intermediate_max_activity = 1.55;  ///< Activity multiplier
    int advanced_extra_sets = 1;

    // =========================================================================
    // PROGRESS
    // =========================================================================

    double progress_base_score = 5.0;
    double weight_loss_factor = 0.5;      ///< Points per kg lost
    double weight_loss_cap = 2.5;
    double posture_change_factor = 0.5;   ///< Points per posture-score point
    double posture_change_cap = 2.5;

    // =========================================================================
    // DIAGNOSTICS
    // =========================================================================

    bool verbose = false;  ///< Log pipeline events to stdout
};

/**
 * @brief Override defaults with the keys present in a JSON object
 *
 * @throws std::runtime_error on inverted bounds
 * @throws nlohmann::json::exception on mistyped values
 */
Config configFromJson(const nlohmann::json& j);

/**
 * @brief Check that every lower bound is at or below its upper bound
 *
 * @throws std::runtime_error naming the first inverted pair
 */
void validateConfig(const Config& config);

/**
 * @brief Dump the effective configuration
 */
nlohmann::json configToJson(const Config& config);

/**
 * @brief Load configuration from a JSON file
 *
 * @throws std::runtime_error if the file is missing or not valid JSON
 */
Config loadConfig(const std::string& path);

} // namespace posture_analyzer

/**
 * @file serialization.hpp
 * @brief JSON conversion for collaborator inputs and analysis records
 *
 * Absent optional fields are omitted from the output, never written as zero.
 */

#pragma once

#include "common.hpp"
#include "data_types.hpp"
#include "posture_analysis_system.hpp"
#include "profile.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace posture_analyzer {

// ============================================================================
// Output records
// ============================================================================

nlohmann::json toJson(const Landmark& landmark);
nlohmann::json toJson(const KeypointSet& keypoints);
nlohmann::json toJson(const PostureMetrics& metrics);
nlohmann::json toJson(const Recommendation& recommendation);
nlohmann::json toJson(const std::vector<Recommendation>& recommendations);
nlohmann::json toJson(const BodyCompositionEstimate& estimate);
nlohmann::json toJson(const Exercise& exercise);
nlohmann::json toJson(const WorkoutPlan& plan);
nlohmann::json toJson(const ProgressSnapshot& progress);
nlohmann::json toJson(const ViewAnalysis& view);
nlohmann::json toJson(const PostureAnalysisResult& result);

// ============================================================================
// Collaborator inputs
// ============================================================================

/**
 * @brief Parse a pose observation
 *
 * Expected shape:
 * ```json
 * {"width": 640, "height": 480,
 *  "landmarks": [{"index": 0, "x": 0.5, "y": 0.2, "z": -0.1, "visibility": 0.98}]}
 * ```
 *
 * @throws std::runtime_error on missing or mistyped fields
 */
PoseObservation observationFromJson(const nlohmann::json& j, ViewType view = ViewType::FRONT);

/**
 * @brief Parse a user profile (all fields optional except where noted)
 *
 * Keys: bmi, height_cm, weight_kg, age, gender ("M"/"F"),
 * activity_level, goal ("lose"/"maintain"/"gain").
 *
 * @throws std::runtime_error on unknown gender/goal codes or mistyped fields
 */
UserProfile profileFromJson(const nlohmann::json& j);

/**
 * @brief Parse body measurements (keys: waist_cm, hip_cm, whr)
 */
BodyMeasurements measurementsFromJson(const nlohmann::json& j);

/**
 * @brief Parse a metric snapshot (keys: date, weight_kg, posture_score, shoulder_slope_deg)
 */
MetricSnapshot snapshotFromJson(const nlohmann::json& j);

/**
 * @brief Read and parse a JSON file
 *
 * @throws std::runtime_error if the file is missing or not valid JSON
 */
nlohmann::json loadJsonFile(const std::string& path);

} // namespace posture_analyzer

/**
 * @file serialization.cpp
 * @brief Implementation of JSON conversion
 */

#include "posture_analyzer/serialization.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace posture_analyzer {

using json = nlohmann::json;

namespace {

template <typename T>
void putIfPresent(json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    }
}

template <typename T>
std::optional<T> getOptional(const json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) {
        return std::nullopt;
    }
    return j.at(key).get<T>();
}

json pairToJson(const PairAlignmentMetrics& m) {
    json j;
    j["slope_degrees"] = m.slope_deg;
    j["height_difference_px"] = m.height_diff_px;
    j["span_px"] = m.span_px;
    j["has_imbalance"] = m.has_imbalance;
    j["confidence"] = m.confidence;
    return j;
}

} // namespace

// ============================================================================
// Output records
// ============================================================================

json toJson(const Landmark& landmark) {
    json j;
    j["x"] = landmark.pixel.x;
    j["y"] = landmark.pixel.y;
    j["z"] = landmark.z;
    j["visibility"] = landmark.visibility;
    j["x_norm"] = landmark.normalized.x;
    j["y_norm"] = landmark.normalized.y;
    return j;
}

json toJson(const KeypointSet& keypoints) {
    json j = json::object();
    for (const auto& [name, landmark] : keypoints) {
        j[toString(name)] = toJson(landmark);
    }
    return j;
}

json toJson(const PostureMetrics& metrics) {
    json j = json::object();

    if (metrics.shoulder) {
        j["shoulder"] = pairToJson(*metrics.shoulder);
    }
    if (metrics.head) {
        json head;
        head["tilt_degrees"] = metrics.head->tilt_deg;
        head["offset_x_px"] = metrics.head->offset_x_px;
        head["offset_y_px"] = metrics.head->offset_y_px;
        head["forward_head_posture"] = metrics.head->forward_head;
        head["confidence"] = metrics.head->confidence;
        j["head"] = head;
    }
    if (metrics.hip) {
        j["hip"] = pairToJson(*metrics.hip);
    }
    if (metrics.knee) {
        json knee;
        knee["valgus_indicator"] = metrics.knee->valgus_indicator;
        knee["has_knee_valgus"] = metrics.knee->has_valgus;
        knee["knee_distance_px"] = metrics.knee->knee_distance_px;
        knee["ankle_distance_px"] = metrics.knee->ankle_distance_px;
        knee["hip_distance_px"] = metrics.knee->hip_distance_px;
        knee["confidence"] = metrics.knee->confidence;
        j["knee"] = knee;
    }

    putIfPresent(j, "posture_score", metrics.posture_score);
    putIfPresent(j, "detection_confidence", metrics.detection_confidence);
    return j;
}

json toJson(const Recommendation& rec) {
    json j;
    j["category"] = toString(rec.category);
    j["priority"] = toString(rec.priority);
    j["title"] = rec.title;
    j["description"] = rec.description;
    j["action_steps"] = rec.action_steps;
    j["is_completed"] = rec.is_completed;
    j["is_fallback"] = rec.is_fallback;
    putIfPresent(j, "completed_at", rec.completed_at);
    putIfPresent(j, "expires_at", rec.expires_at);
    return j;
}

json toJson(const std::vector<Recommendation>& recommendations) {
    json j = json::array();
    for (const auto& rec : recommendations) {
        j.push_back(toJson(rec));
    }
    return j;
}

json toJson(const BodyCompositionEstimate& estimate) {
    json j;
    j["estimated_body_fat"] = estimate.body_fat_pct;
    j["estimated_muscle_mass"] = estimate.muscle_mass_pct;
    putIfPresent(j, "visceral_fat_level", estimate.visceral_fat_level);
    if (estimate.body_shape) {
        j["body_shape_type"] = toString(*estimate.body_shape);
    }
    return j;
}

json toJson(const Exercise& exercise) {
    json j;
    j["name"] = exercise.name;
    putIfPresent(j, "sets", exercise.sets);
    putIfPresent(j, "reps", exercise.reps);
    putIfPresent(j, "duration", exercise.duration);
    return j;
}

json toJson(const WorkoutPlan& plan) {
    json j;
    j["name"] = plan.name;
    j["description"] = plan.description;
    j["workout_type"] = toString(plan.type);
    j["difficulty"] = toString(plan.difficulty);
    j["duration_minutes"] = plan.duration_minutes;

    j["exercises"] = json::array();
    for (const auto& exercise : plan.exercises) {
        j["exercises"].push_back(toJson(exercise));
    }

    if (plan.corrective_warmup) {
        j["corrective_warmup"] = json::array();
        for (const auto& exercise : *plan.corrective_warmup) {
            j["corrective_warmup"].push_back(toJson(exercise));
        }
    }
    return j;
}

json toJson(const ProgressSnapshot& progress) {
    json j;
    j["period_start"] = progress.period_start;
    j["period_end"] = progress.period_end;
    putIfPresent(j, "weight_change", progress.weight_change);
    putIfPresent(j, "posture_score_change", progress.posture_score_change);
    putIfPresent(j, "shoulder_improvement", progress.shoulder_improvement);
    j["overall_score"] = progress.overall_score;
    return j;
}

json toJson(const ViewAnalysis& view) {
    json j;
    j["view"] = toString(view.view);
    j["detected"] = view.detected;
    j["keypoints"] = toJson(view.keypoints);
    j["metrics"] = toJson(view.metrics);
    return j;
}

json toJson(const PostureAnalysisResult& result) {
    json j;
    if (result.front) {
        j["front"] = toJson(*result.front);
    }
    if (result.back) {
        j["back"] = toJson(*result.back);
    }
    j["metrics"] = toJson(result.metrics);
    j["posture_score"] = result.posture_score;
    j["recommendations"] = toJson(result.recommendations);
    j["recommendations_generated"] = result.recommendations_generated;
    j["used_fallback"] = result.used_fallback;
    j["hip_from_back"] = result.hip_from_back;
    return j;
}

// ============================================================================
// Collaborator inputs
// ============================================================================

PoseObservation observationFromJson(const json& j, ViewType view) {
    try {
        PoseObservation obs;
        obs.view = view;
        obs.image_size = cv::Size(j.at("width").get<int>(), j.at("height").get<int>());

        for (const auto& item : j.at("landmarks")) {
            RawLandmark lm;
            lm.index = item.at("index").get<LandmarkIndex>();
            lm.x = item.at("x").get<double>();
            lm.y = item.at("y").get<double>();
            lm.z = item.value("z", 0.0);
            lm.visibility = item.value("visibility", 0.0);
            obs.landmarks.push_back(lm);
        }
        return obs;
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Invalid pose observation: ") + e.what());
    }
}

UserProfile profileFromJson(const json& j) {
    try {
        UserProfile profile;
        profile.bmi_override = getOptional<double>(j, "bmi");
        profile.height_cm = getOptional<double>(j, "height_cm");
        profile.weight_kg = getOptional<double>(j, "weight_kg");
        profile.age = getOptional<int>(j, "age");

        if (auto code = getOptional<std::string>(j, "gender")) {
            profile.gender = parseGender(*code);
            if (!profile.gender) {
                throw std::runtime_error("Unknown gender code: " + *code);
            }
        }

        profile.activity_level = j.value("activity_level", profile.activity_level);

        if (auto name = getOptional<std::string>(j, "goal")) {
            auto goal = parseGoal(*name);
            if (!goal) {
                throw std::runtime_error("Unknown goal: " + *name);
            }
            profile.goal = *goal;
        }
        return profile;
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Invalid profile: ") + e.what());
    }
}

BodyMeasurements measurementsFromJson(const json& j) {
    try {
        BodyMeasurements m;
        m.waist_cm = getOptional<double>(j, "waist_cm");
        m.hip_cm = getOptional<double>(j, "hip_cm");
        m.whr_override = getOptional<double>(j, "whr");
        return m;
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Invalid measurements: ") + e.what());
    }
}

MetricSnapshot snapshotFromJson(const json& j) {
    try {
        MetricSnapshot s;
        s.date = j.at("date").get<std::string>();
        s.weight_kg = getOptional<double>(j, "weight_kg");
        s.posture_score = getOptional<double>(j, "posture_score");
        s.shoulder_slope_deg = getOptional<double>(j, "shoulder_slope_deg");
        return s;
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Invalid snapshot: ") + e.what());
    }
}

json loadJsonFile(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        throw std::runtime_error("File not found: " + path);
    }

    std::ifstream file(path);
    json j;
    try {
        file >> j;
    } catch (const json::exception& e) {
        throw std::runtime_error("Failed to parse " + path + ": " + e.what());
    }
    return j;
}

} // namespace posture_analyzer

/**
 * @file test_analysis_system.cpp
 * @brief End-to-end tests for the front/back posture pipeline and JSON I/O
 */

#include "test_helpers.hpp"
#include <posture_analyzer/posture_analysis_system.hpp>
#include <posture_analyzer/serialization.hpp>
#include <stdexcept>

using namespace posture_analyzer;
using test_support::check;
using test_support::checkNear;
using test_support::checkThrows;
using test_support::moveLandmark;
using test_support::uprightPose;

namespace {

std::filesystem::path g_data_dir;

PoseObservation loadView(const std::string& name, ViewType view) {
    return observationFromJson(loadJsonFile((g_data_dir / name).string()), view);
}

PoseObservation slouchedPose() {
    auto obs = uprightPose();
    moveLandmark(obs, 12, 600, 330);  // right shoulder drops 30 px
    moveLandmark(obs, 0, 540, 150);   // nose 40 px off the shoulder midpoint
    moveLandmark(obs, 24, 560, 565);  // right hip drops 15 px
    moveLandmark(obs, 25, 470, 750);  // knees collapse inward
    moveLandmark(obs, 26, 530, 750);
    return obs;
}

// ============================================================================
// Fallback
// ============================================================================

void testNoDetectionFallback() {
    PostureAnalysisSystem system;
    auto empty = loadView("empty_view.json", ViewType::FRONT);
    auto result = system.analyze(empty, empty);

    check(result.used_fallback, __LINE__);
    checkNear(result.posture_score, 5.0, 1e-12, __LINE__);
    check(result.recommendations.size() == 1, __LINE__);
    check(result.recommendations[0].is_fallback, __LINE__);
    check(result.recommendations[0].title == "Basic recommendation", __LINE__);
    check(result.front && !result.front->detected, __LINE__);
    check(result.back && !result.back->detected, __LINE__);
}

void testNoPhotosFallback() {
    PostureAnalysisSystem system;
    auto result = system.analyze(std::nullopt, std::nullopt);
    check(result.used_fallback, __LINE__);
    check(!result.front && !result.back, __LINE__);
    check(result.recommendations.size() == 1, __LINE__);
}

void testUnscorableDetectionFallsBack() {
    PostureAnalysisSystem system;
    PoseObservation hands;
    hands.image_size = cv::Size(1000, 1000);
    hands.landmarks = {test_support::pixelLandmark(15, 300, 500),
                       test_support::pixelLandmark(16, 700, 500)};

    auto result = system.analyze(hands);
    check(result.front->detected, __LINE__);
    check(!result.front->isScored(), __LINE__);
    check(result.used_fallback, __LINE__);
    checkNear(result.posture_score, 5.0, 1e-12, __LINE__);
}

// ============================================================================
// Scoring and merging
// ============================================================================

void testUprightFrontOnly() {
    PostureAnalysisSystem system;
    auto result = system.analyze(uprightPose());

    check(!result.used_fallback, __LINE__);
    checkNear(result.posture_score, 10.0, 1e-9, __LINE__);
    check(result.recommendations.size() == 1, __LINE__);
    check(result.recommendations[0].title == "Posture within normal range", __LINE__);
    check(result.front->keypoints.size() == 9, __LINE__);
}

void testFrontAndBackFixtures() {
    PostureAnalysisSystem system;
    auto front = loadView("front_view.json", ViewType::FRONT);
    auto back = loadView("back_view.json", ViewType::BACK);
    auto result = system.analyze(front, back);

    check(result.front && result.back, __LINE__);
    checkNear(*result.front->metrics.posture_score, 7.9, 1e-9, __LINE__);
    checkNear(*result.back->metrics.posture_score, 7.0, 1e-9, __LINE__);
    checkNear(result.posture_score, 7.45, 1e-9, __LINE__);

    // Front has no hips, so the back view fills them in
    check(!result.front->metrics.hip.has_value(), __LINE__);
    check(result.hip_from_back, __LINE__);
    check(result.metrics.hip.has_value(), __LINE__);
    check(result.metrics.hasHipImbalance(), __LINE__);
    checkNear(result.metrics.shoulder->slope_deg, 5.71, 1e-9, __LINE__);
    checkNear(*result.metrics.detection_confidence, 0.95, 1e-12, __LINE__);

    check(result.recommendations.size() == 2, __LINE__);
    check(result.recommendations[0].title == "Shoulder imbalance correction", __LINE__);
    check(result.recommendations[1].title == "Pelvic position correction", __LINE__);
}

void testFrontHipTakesPrecedence() {
    PostureAnalysisSystem system;
    auto back = loadView("back_view.json", ViewType::BACK);
    auto result = system.analyze(uprightPose(), back);

    check(!result.hip_from_back, __LINE__);
    check(!result.metrics.hasHipImbalance(), __LINE__);
}

void testBackOnly() {
    PostureAnalysisSystem system;
    auto back = loadView("back_view.json", ViewType::BACK);
    auto result = system.analyze(std::nullopt, back);

    check(!result.used_fallback, __LINE__);
    checkNear(result.posture_score, 7.0, 1e-9, __LINE__);
    check(result.metrics.hasHipImbalance(), __LINE__);
    check(!result.hip_from_back, __LINE__);
}

void testRecommendationsCapped() {
    PostureAnalysisSystem system;
    auto result = system.analyze(slouchedPose());

    check(result.recommendations_generated == 4, __LINE__);
    check(result.recommendations.size() == 3, __LINE__);
    check(result.recommendations[0].title == "Shoulder imbalance correction", __LINE__);
    check(result.recommendations[2].title == "Pelvic position correction", __LINE__);
    check(result.posture_score >= 1.0 && result.posture_score < 5.0, __LINE__);
}

void testInvalidImageSizeThrows() {
    PostureAnalysisSystem system;
    auto obs = uprightPose();
    obs.image_size = cv::Size(0, 0);
    checkThrows<std::invalid_argument>([&] { system.analyze(obs); }, __LINE__);
}

void testConfigOverrides() {
    Config cfg = loadConfig((g_data_dir / "config.json").string());
    PostureAnalysisSystem system(cfg);

    auto empty = loadView("empty_view.json", ViewType::FRONT);
    checkNear(system.analyze(empty).posture_score, 4.5, 1e-12, __LINE__);

    auto result = system.analyze(slouchedPose());
    check(result.recommendations.size() == 2, __LINE__);
}

void testStatus() {
    PostureAnalysisSystem system;
    check(system.getStatus().at("analysis_count") == 0.0, __LINE__);

    system.analyze(std::nullopt);
    auto front = loadView("front_view.json", ViewType::FRONT);
    auto back = loadView("back_view.json", ViewType::BACK);
    system.analyze(front, back);

    auto status = system.getStatus();
    check(status.at("analysis_count") == 2.0, __LINE__);
    check(status.at("fallback_count") == 1.0, __LINE__);
    check(status.at("hip_from_back") == 1.0, __LINE__);
    checkNear(status.at("posture_score"), 7.45, 1e-9, __LINE__);
    check(status.count("penalty_shoulder_slope") == 1, __LINE__);
    check(status.count("penalty_hip_imbalance") == 1, __LINE__);
}

// ============================================================================
// JSON I/O
// ============================================================================

void testResultSerialization() {
    PostureAnalysisSystem system;
    auto front = loadView("front_view.json", ViewType::FRONT);
    auto j = toJson(system.analyze(front));

    check(j.at("used_fallback") == false, __LINE__);
    check(j.at("recommendations").is_array(), __LINE__);
    check(j.at("front").at("view") == "front", __LINE__);
    check(j.at("front").at("keypoints").contains("left_shoulder"), __LINE__);
    check(j.at("metrics").contains("shoulder"), __LINE__);
    check(!j.at("metrics").contains("hip"), __LINE__);
    check(!j.contains("back"), __LINE__);
}

void testMalformedInputs() {
    nlohmann::json no_size = {{"landmarks", nlohmann::json::array()}};
    checkThrows<std::runtime_error>([&] { observationFromJson(no_size); }, __LINE__);

    nlohmann::json bad_landmark = {
        {"width", 100}, {"height", 100},
        {"landmarks", {{{"index", 0}, {"x", "left"}, {"y", 0.5}}}}
    };
    checkThrows<std::runtime_error>([&] { observationFromJson(bad_landmark); }, __LINE__);

    checkThrows<std::runtime_error>([&] { profileFromJson({{"gender", "X"}}); }, __LINE__);
    checkThrows<std::runtime_error>([&] { profileFromJson({{"goal", "bulk"}}); }, __LINE__);
    checkThrows<std::runtime_error>([&] { snapshotFromJson({{"weight_kg", 70.0}}); }, __LINE__);
    checkThrows<std::runtime_error>(
        [&] { loadJsonFile((g_data_dir / "missing.json").string()); }, __LINE__);
}

void testCollaboratorRecords() {
    auto profile = profileFromJson(loadJsonFile((g_data_dir / "profile.json").string()));
    check(*profile.gender == Gender::MALE, __LINE__);
    check(profile.goal == Goal::LOSE, __LINE__);
    check(*profile.age == 30, __LINE__);
    check(*profile.bmr() == 1780, __LINE__);

    auto m = measurementsFromJson(loadJsonFile((g_data_dir / "measurements.json").string()));
    checkNear(*m.whr(), 0.9, 1e-12, __LINE__);

    auto s = snapshotFromJson({{"date", "2024-03-01"}, {"posture_score", 6.5}});
    check(s.date == "2024-03-01", __LINE__);
    check(!s.weight_kg.has_value(), __LINE__);
    checkNear(*s.posture_score, 6.5, 1e-12, __LINE__);
}

} // namespace

int main(int argc, char** argv) {
    g_data_dir = test_support::dataDir(argc, argv);

    return test_support::runAll("POSTURE ANALYSIS SYSTEM", {
        {"no detection fallback", testNoDetectionFallback},
        {"no photos fallback", testNoPhotosFallback},
        {"unscorable detection falls back", testUnscorableDetectionFallsBack},
        {"upright front only", testUprightFrontOnly},
        {"front and back fixtures", testFrontAndBackFixtures},
        {"front hip takes precedence", testFrontHipTakesPrecedence},
        {"back only", testBackOnly},
        {"recommendations capped", testRecommendationsCapped},
        {"invalid image size throws", testInvalidImageSizeThrows},
        {"config overrides", testConfigOverrides},
        {"status", testStatus},
        {"result serialization", testResultSerialization},
        {"malformed inputs", testMalformedInputs},
        {"collaborator records", testCollaboratorRecords}
    });
}

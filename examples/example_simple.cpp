/**
 * @file example_simple.cpp
 * @brief Simple example showing basic posture analyzer usage
 */

#include <posture_analyzer/body_composition.hpp>
#include <posture_analyzer/posture_analysis_system.hpp>
#include <posture_analyzer/progress_tracker.hpp>
#include <posture_analyzer/workout_planner.hpp>
#include <iostream>

using namespace posture_analyzer;

int main() {
    std::cout << "=== Posture Analyzer Simple Example ===" << std::endl;
    std::cout << std::endl;

    // Image parameters (example: portrait phone photo)
    int width = 1080, height = 1920;

    // Simulated pose-model output (normalized coordinates)
    auto landmark = [](int index, double x, double y, double visibility) {
        RawLandmark lm;
        lm.index = index;
        lm.x = x;
        lm.y = y;
        lm.visibility = visibility;
        return lm;
    };

    PoseObservation front;
    front.view = ViewType::FRONT;
    front.image_size = cv::Size(width, height);
    front.landmarks = {
        landmark(0, 0.505, 0.120, 0.99),   // nose
        landmark(11, 0.400, 0.220, 0.98),  // left shoulder
        landmark(12, 0.600, 0.230, 0.97),  // right shoulder (slightly lower)
        landmark(23, 0.440, 0.500, 0.95),  // left hip
        landmark(24, 0.560, 0.502, 0.94),  // right hip
        landmark(25, 0.450, 0.700, 0.92),  // left knee
        landmark(26, 0.550, 0.700, 0.91),  // right knee
        landmark(27, 0.440, 0.900, 0.88),  // left ankle
        landmark(28, 0.560, 0.900, 0.87)   // right ankle
    };

    // Create analyzer
    Config config;
    config.verbose = true;
    PostureAnalysisSystem analyzer(config);

    std::cout << "Analyzer created!" << std::endl;
    std::cout << "  Image size: " << width << "x" << height << std::endl;
    std::cout << "  Landmarks: " << front.landmarks.size() << std::endl;
    std::cout << std::endl;

    // Back photo was not taken
    std::cout << "--- POSTURE ANALYSIS ---" << std::endl;
    PostureAnalysisResult result;
    try {
        result = analyzer.analyze(front, std::nullopt);
    } catch (const std::exception& e) {
        std::cerr << "Error analyzing pose: " << e.what() << std::endl;
        return 1;
    }

    std::cout << result.metrics.toString() << std::endl;
    std::cout << "Posture score: " << result.posture_score << " / 10" << std::endl;
    if (result.metrics.shoulder) {
        std::cout << "Shoulder slope: " << result.metrics.shoulder->slope_deg << "°"
                  << " (height diff " << result.metrics.shoulder->height_diff_px << " px)"
                  << std::endl;
    }

    std::cout << "\nRecommendations:" << std::endl;
    for (const auto& rec : result.recommendations) {
        std::cout << "  [" << toString(rec.priority) << "] " << rec.title << std::endl;
        std::cout << "    " << rec.description << std::endl;
        for (const auto& step : rec.action_steps) {
            std::cout << "    - " << step << std::endl;
        }
    }

    // Body composition and plan from a user profile
    std::cout << "\n--- BODY COMPOSITION ---" << std::endl;
    UserProfile profile;
    profile.height_cm = 178.0;
    profile.weight_kg = 84.0;
    profile.age = 34;
    profile.gender = Gender::MALE;
    profile.activity_level = 1.55;
    profile.goal = Goal::LOSE;

    BodyMeasurements measurements;
    measurements.waist_cm = 94.0;
    measurements.hip_cm = 102.0;

    BodyCompositionEstimator estimator(config);
    if (auto body = estimator.estimate(profile, measurements)) {
        std::cout << body->toString() << std::endl;
    }
    if (auto calories = profile.targetCalories()) {
        std::cout << "Target calories: " << *calories << " kcal/day" << std::endl;
    }

    std::cout << "\n--- WORKOUT PLAN ---" << std::endl;
    WorkoutPlanGenerator planner(config);
    WorkoutPlan plan = planner.generate(profile, result.metrics);
    std::cout << plan.name << " (" << toString(plan.difficulty) << ", "
              << plan.duration_minutes << " min)" << std::endl;
    if (plan.corrective_warmup) {
        std::cout << "  Warm-up:" << std::endl;
        for (const auto& ex : *plan.corrective_warmup) {
            std::cout << "    " << ex.name << std::endl;
        }
    }
    for (const auto& ex : plan.exercises) {
        std::cout << "  " << ex.name;
        if (ex.sets) std::cout << " " << *ex.sets << "x";
        if (ex.reps) std::cout << *ex.reps;
        if (ex.duration) std::cout << " " << *ex.duration;
        std::cout << std::endl;
    }

    // Progress against a previous check-in
    std::cout << "\n--- PROGRESS ---" << std::endl;
    MetricSnapshot previous{"2024-01-01", 86.5, 6.2, 4.1};
    MetricSnapshot current{"2024-02-01", *profile.weight_kg, result.posture_score,
                           result.metrics.shoulder ? std::optional<double>(result.metrics.shoulder->slope_deg)
                                                   : std::nullopt};
    ProgressDeltaCalculator tracker(config);
    std::cout << tracker.compute(previous, current).toString() << std::endl;

    // Print final status
    std::cout << "\n--- FINAL STATUS ---" << std::endl;
    for (const auto& [key, value] : analyzer.getStatus()) {
        std::cout << "  " << key << ": " << value << std::endl;
    }

    std::cout << "\nExample complete!" << std::endl;
    return 0;
}

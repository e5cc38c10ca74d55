/**
 * @file analyze_landmarks.cpp
 * @brief Command-line posture analysis of pose-model landmark files
 *
 * Reads a front (and optionally a back) landmark JSON file, runs the full
 * pipeline and prints the result as JSON. With a profile it also emits the body
 * composition estimate and a workout plan.
 */

#include <posture_analyzer/body_composition.hpp>
#include <posture_analyzer/posture_analysis_system.hpp>
#include <posture_analyzer/serialization.hpp>
#include <posture_analyzer/workout_planner.hpp>
#include <nlohmann/json.hpp>
#include <iostream>
#include <optional>
#include <string>

using json = nlohmann::json;
using namespace posture_analyzer;

namespace {

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --front PATH         Front-view landmarks JSON (required)\n";
    std::cout << "  --back PATH          Back-view landmarks JSON\n";
    std::cout << "  --profile PATH       User profile JSON (enables body composition and plan)\n";
    std::cout << "  --measurements PATH  Waist/hip measurements JSON\n";
    std::cout << "  --config PATH        Analyzer configuration JSON\n";
    std::cout << "  --verbose            Log pipeline events\n";
    std::cout << "  --help, -h           Show this help\n";
}

int run(const std::string& front_path,
        const std::string& back_path,
        const std::string& profile_path,
        const std::string& measurements_path,
        const std::string& config_path,
        bool verbose) {
    Config config = config_path.empty() ? Config() : loadConfig(config_path);
    if (verbose) {
        config.verbose = true;
    }

    std::optional<PoseObservation> front =
        observationFromJson(loadJsonFile(front_path), ViewType::FRONT);
    std::optional<PoseObservation> back;
    if (!back_path.empty()) {
        back = observationFromJson(loadJsonFile(back_path), ViewType::BACK);
    }

    PostureAnalysisSystem analyzer(config);
    PostureAnalysisResult result = analyzer.analyze(front, back);

    json output;
    output["posture"] = toJson(result);

    if (!profile_path.empty()) {
        UserProfile profile = profileFromJson(loadJsonFile(profile_path));

        std::optional<BodyMeasurements> measurements;
        if (!measurements_path.empty()) {
            measurements = measurementsFromJson(loadJsonFile(measurements_path));
        }

        BodyCompositionEstimator estimator(config);
        if (auto body = estimator.estimate(profile, measurements)) {
            output["body_composition"] = toJson(*body);
        } else if (verbose) {
            std::cerr << "[analyze_landmarks] Profile lacks BMI, age or gender; "
                      << "skipping body composition\n";
        }

        // Imbalance flags only mean something if a pose was measured
        std::optional<PostureMetrics> posture;
        if (!result.used_fallback) {
            posture = result.metrics;
        }

        WorkoutPlanGenerator planner(config);
        output["workout_plan"] = toJson(planner.generate(profile, posture));

        if (auto calories = profile.targetCalories()) {
            output["target_calories"] = *calories;
        }
    }

    std::cout << output.dump(2) << "\n";
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    // Simple argument parsing
    std::string front_path;
    std::string back_path;
    std::string profile_path;
    std::string measurements_path;
    std::string config_path;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--front" && i + 1 < argc) {
            front_path = argv[++i];
        } else if (arg == "--back" && i + 1 < argc) {
            back_path = argv[++i];
        } else if (arg == "--profile" && i + 1 < argc) {
            profile_path = argv[++i];
        } else if (arg == "--measurements" && i + 1 < argc) {
            measurements_path = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--verbose") {
            verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "ERROR: Unknown option: " << arg << "\n";
            printUsage(argv[0]);
            return 1;
        }
    }

    if (front_path.empty()) {
        std::cerr << "ERROR: --front is required\n";
        printUsage(argv[0]);
        return 1;
    }

    try {
        return run(front_path, back_path, profile_path, measurements_path, config_path, verbose);
    } catch (const std::exception& e) {
        std::cerr << "EXCEPTION: " << e.what() << "\n";
        return 1;
    }
}

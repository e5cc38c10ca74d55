/**
 * @file workout_planner.cpp
 * @brief Implementation of WorkoutPlanGenerator
 */

#include "posture_analyzer/workout_planner.hpp"
#include <string>
#include <utility>

namespace posture_analyzer {

namespace {

Exercise repsExercise(const std::string& name, int sets, const std::string& reps) {
    Exercise ex;
    ex.name = name;
    ex.sets = sets;
    ex.reps = reps;
    return ex;
}

Exercise timedExercise(const std::string& name, std::optional<int> sets, const std::string& duration) {
    Exercise ex;
    ex.name = name;
    ex.sets = sets;
    ex.duration = duration;
    return ex;
}

} // namespace

WorkoutPlanGenerator::WorkoutPlanGenerator(const Config& config)
    : config_(config) {
    validateConfig(config_);
}

FitnessTier WorkoutPlanGenerator::tierForActivity(double activity_multiplier) const {
    if (activity_multiplier <= config_.beginner_max_activity) {
        return FitnessTier::BEGINNER;
    }
    if (activity_multiplier <= config_.intermediate_max_activity) {
        return FitnessTier::INTERMEDIATE;
    }
    return FitnessTier::ADVANCED;
}

// ============================================================================
// Templates
// ============================================================================

WorkoutPlan WorkoutPlanGenerator::baseTemplate(Goal goal) const {
    WorkoutPlan plan;

    switch (goal) {
        case Goal::LOSE:
            plan.name = "Weight Loss Program";
            plan.description = "Combination of strength and cardio exercises";
            plan.type = WorkoutType::CARDIO;
            plan.duration_minutes = 45;
            plan.exercises = {
                repsExercise("Squats", 3, "12-15"),
                repsExercise("Push-ups", 3, "10-12"),
                timedExercise("Plank", 3, "30-60 sec"),
                repsExercise("Lunges", 3, "10 each leg"),
                timedExercise("Cardio intervals", std::nullopt, "15-20 min")
            };
            break;

        case Goal::GAIN:
            plan.name = "Muscle Building Program";
            plan.description = "Strength training with progressive overload";
            plan.type = WorkoutType::STRENGTH;
            plan.duration_minutes = 60;
            plan.exercises = {
                repsExercise("Bench Press", 4, "8-10"),
                repsExercise("Barbell Squat", 4, "8-10"),
                repsExercise("Deadlift", 3, "6-8"),
                repsExercise("Overhead Press", 3, "8-10"),
                repsExercise("Pull-ups", 3, "to failure")
            };
            break;

        case Goal::MAINTAIN:
        default:
            plan.name = "Fitness Maintenance Program";
            plan.description = "Balanced workouts for general health";
            plan.type = WorkoutType::STRENGTH;
            plan.duration_minutes = 40;
            plan.exercises = {
                repsExercise("Squats", 3, "12-15"),
                repsExercise("Push-ups", 3, "10-15"),
                timedExercise("Plank", 3, "45 sec"),
                repsExercise("Lunges", 3, "12 each leg"),
                repsExercise("Back Extensions", 3, "15")
            };
            break;
    }

    return plan;
}

std::vector<Exercise> WorkoutPlanGenerator::correctiveWarmup(const ImbalanceFlags& flags) const {
    std::vector<Exercise> warmup;

    if (flags.shoulder) {
        warmup.push_back(repsExercise("Face Pull", 3, "15"));
        warmup.push_back(timedExercise("Chest Stretch", std::nullopt, "30 sec"));
    }
    if (flags.hip) {
        warmup.push_back(timedExercise("Side Plank", 3, "30 sec"));
        warmup.push_back(repsExercise("Side-lying Leg Lifts", 3, "12"));
    }

    return warmup;
}

// ============================================================================
// Generation
// ============================================================================

WorkoutPlan WorkoutPlanGenerator::generate(
    Goal goal,
    FitnessTier tier,
    const ImbalanceFlags& flags
) const {
    WorkoutPlan plan = baseTemplate(goal);
    plan.difficulty = tier;

    if (tier == FitnessTier::ADVANCED) {
        for (auto& exercise : plan.exercises) {
            if (exercise.sets) {
                *exercise.sets += config_.advanced_extra_sets;
            }
        }
    }

    auto warmup = correctiveWarmup(flags);
    if (!warmup.empty()) {
        plan.corrective_warmup = std::move(warmup);
    }

    return plan;
}

WorkoutPlan WorkoutPlanGenerator::generate(
    const UserProfile& profile,
    const std::optional<PostureMetrics>& posture
) const {
    ImbalanceFlags flags;
    if (posture) {
        flags = ImbalanceFlags::fromMetrics(*posture);
    }
    return generate(profile.goal, tierForActivity(profile.activity_level), flags);
}

} // namespace posture_analyzer

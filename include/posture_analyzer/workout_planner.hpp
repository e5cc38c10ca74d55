/**
 * @file workout_planner.hpp
 * @brief Goal/tier workout templates with posture-driven corrective warm-ups
 */

#pragma once

#include "common.hpp"
#include "config.hpp"
#include "data_types.hpp"
#include "profile.hpp"
#include <optional>
#include <vector>

namespace posture_analyzer {

/**
 * @brief Imbalance flags that drive the corrective warm-up
 */
struct ImbalanceFlags {
    bool shoulder = false;
    bool hip = false;

    static ImbalanceFlags fromMetrics(const PostureMetrics& metrics) {
        ImbalanceFlags flags;
        flags.shoulder = metrics.hasShoulderImbalance();
        flags.hip = metrics.hasHipImbalance();
        return flags;
    }
};

/**
 * @brief Selects and adapts a fixed training template
 *
 * Pure function of (goal, tier, imbalance flags).
 */
class WorkoutPlanGenerator {
public:
    explicit WorkoutPlanGenerator(const Config& config);

    /**
     * @brief Map an activity multiplier to a fitness tier
     */
    FitnessTier tierForActivity(double activity_multiplier) const;

    /**
     * @brief Build the plan for a goal and tier
     */
    WorkoutPlan generate(Goal goal, FitnessTier tier, const ImbalanceFlags& flags = {}) const;

    /**
     * @brief Build the plan from a profile and, optionally, the latest posture record
     */
    WorkoutPlan generate(
        const UserProfile& profile,
        const std::optional<PostureMetrics>& posture = std::nullopt
    ) const;

    /**
     * @brief Corrective exercises for the raised flags (empty if none)
     */
    std::vector<Exercise> correctiveWarmup(const ImbalanceFlags& flags) const;

private:
    WorkoutPlan baseTemplate(Goal goal) const;

    Config config_;  // Store by value
};

} // namespace posture_analyzer

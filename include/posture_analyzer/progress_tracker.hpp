/**
 * @file progress_tracker.hpp
 * @brief Longitudinal change between two metric snapshots
 */

#pragma once

#include "common.hpp"
#include "config.hpp"
#include "data_types.hpp"
#include <optional>

namespace posture_analyzer {

/**
 * @brief Computes weight/posture deltas and an aggregate progress score
 *
 * Weight loss raises the score; weight gain is not penalized. Posture change
 * counts both ways, capped on the upside.
 */
class ProgressDeltaCalculator {
public:
    explicit ProgressDeltaCalculator(const Config& config);

    /**
     * @brief Compare two snapshots bounding a period
     *
     * Deltas are present only when both snapshots carry the value.
     */
    ProgressSnapshot compute(const MetricSnapshot& start, const MetricSnapshot& end) const;

    /**
     * @brief Aggregate score in [1, 10]
     */
    double overallScore(
        const std::optional<double>& weight_change,
        const std::optional<double>& posture_score_change
    ) const;

private:
    Config config_;  // Store by value
};

} // namespace posture_analyzer

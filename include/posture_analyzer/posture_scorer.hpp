/**
 * @file posture_scorer.hpp
 * @brief Weighted-penalty posture score
 */

#pragma once

#include "common.hpp"
#include "config.hpp"
#include "data_types.hpp"
#include <map>
#include <optional>
#include <string>

namespace posture_analyzer {

/**
 * @brief Combines posture metrics into a single score in [1, 10]
 *
 * Starts at 10 and subtracts capped continuous penalties plus a fixed penalty
 * per raised flag. A flag and its continuous penalty both apply, so scores
 * drop sharply around the flag thresholds.
 */
class PostureScorer {
public:
    explicit PostureScorer(const Config& config);

    /**
     * @brief Score a metrics record
     * @return nullopt if no sub-analysis is present
     */
    std::optional<double> score(const PostureMetrics& metrics) const;

    /**
     * @brief Individual penalties applied for a record (for diagnostics)
     */
    std::map<std::string, double> penalties(const PostureMetrics& metrics) const;

    /**
     * @brief Overall score across front and back views
     *
     * Mean of both when both exist, otherwise whichever exists.
     */
    static std::optional<double> combineViews(
        const std::optional<double>& front_score,
        const std::optional<double>& back_score
    );

private:
    Config config_;  // Store by value
};

} // namespace posture_analyzer

/**
 * @file keypoint_normalizer.hpp
 * @brief Map raw pose-model landmark indices to named anatomical points
 */

#pragma once

#include "common.hpp"
#include "data_types.hpp"
#include <opencv2/core.hpp>
#include <utility>
#include <vector>

namespace posture_analyzer {

/**
 * @brief Fixed vocabulary: anatomical point -> pose-model landmark index
 *
 * Indices follow the 33-point full-body topology of the upstream model.
 */
const std::vector<std::pair<AnatomicalPoint, LandmarkIndex>>& landmarkIndexMap();

/**
 * @brief Pose-model index for a named point
 */
LandmarkIndex landmarkIndex(AnatomicalPoint point);

/**
 * @brief Convert raw landmarks to named pixel-space landmarks
 *
 * Points the model did not report are left out of the result.
 *
 * @param landmarks Raw landmarks with normalized coordinates
 * @param image_size Source image size in pixels
 * @return Named landmarks with x = x_norm * width, y = y_norm * height
 *
 * @throws std::invalid_argument if image_size is not positive
 */
KeypointSet normalizeKeypoints(
    const std::vector<RawLandmark>& landmarks,
    const cv::Size& image_size
);

/**
 * @brief Convenience overload for a full observation
 */
KeypointSet normalizeKeypoints(const PoseObservation& observation);

} // namespace posture_analyzer

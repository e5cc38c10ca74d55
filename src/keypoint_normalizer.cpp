/**
 * @file keypoint_normalizer.cpp
 * @brief Implementation of landmark index mapping and pixel conversion
 */

#include "posture_analyzer/keypoint_normalizer.hpp"
#include <stdexcept>
#include <unordered_map>

namespace posture_analyzer {

const std::vector<std::pair<AnatomicalPoint, LandmarkIndex>>& landmarkIndexMap() {
    static const std::vector<std::pair<AnatomicalPoint, LandmarkIndex>> kMap = {
        {AnatomicalPoint::NOSE, 0},
        {AnatomicalPoint::LEFT_EYE, 1},
        {AnatomicalPoint::RIGHT_EYE, 2},
        {AnatomicalPoint::LEFT_EAR, 7},
        {AnatomicalPoint::RIGHT_EAR, 8},
        {AnatomicalPoint::LEFT_SHOULDER, 11},
        {AnatomicalPoint::RIGHT_SHOULDER, 12},
        {AnatomicalPoint::LEFT_ELBOW, 13},
        {AnatomicalPoint::RIGHT_ELBOW, 14},
        {AnatomicalPoint::LEFT_WRIST, 15},
        {AnatomicalPoint::RIGHT_WRIST, 16},
        {AnatomicalPoint::LEFT_HIP, 23},
        {AnatomicalPoint::RIGHT_HIP, 24},
        {AnatomicalPoint::LEFT_KNEE, 25},
        {AnatomicalPoint::RIGHT_KNEE, 26},
        {AnatomicalPoint::LEFT_ANKLE, 27},
        {AnatomicalPoint::RIGHT_ANKLE, 28},
        {AnatomicalPoint::LEFT_HEEL, 29},
        {AnatomicalPoint::RIGHT_HEEL, 30},
        {AnatomicalPoint::LEFT_FOOT, 31},
        {AnatomicalPoint::RIGHT_FOOT, 32}
    };
    return kMap;
}

LandmarkIndex landmarkIndex(AnatomicalPoint point) {
    for (const auto& [name, idx] : landmarkIndexMap()) {
        if (name == point) {
            return idx;
        }
    }
    throw std::invalid_argument("No landmark index for " + toString(point));
}

KeypointSet normalizeKeypoints(
    const std::vector<RawLandmark>& landmarks,
    const cv::Size& image_size
) {
    if (image_size.width <= 0 || image_size.height <= 0) {
        throw std::invalid_argument("Image size must be positive");
    }

    // First occurrence of an index wins
    std::unordered_map<LandmarkIndex, const RawLandmark*> by_index;
    for (const auto& raw : landmarks) {
        by_index.emplace(raw.index, &raw);
    }

    KeypointSet keypoints;
    for (const auto& [name, idx] : landmarkIndexMap()) {
        auto it = by_index.find(idx);
        if (it == by_index.end()) {
            continue;
        }

        const RawLandmark& raw = *it->second;
        Landmark lm;
        lm.name = name;
        lm.pixel = cv::Point2d(raw.x * image_size.width, raw.y * image_size.height);
        lm.z = raw.z;
        lm.visibility = raw.visibility;
        lm.normalized = cv::Point2d(raw.x, raw.y);
        keypoints.emplace(name, lm);
    }

    return keypoints;
}

KeypointSet normalizeKeypoints(const PoseObservation& observation) {
    return normalizeKeypoints(observation.landmarks, observation.image_size);
}

} // namespace posture_analyzer

#pragma once

#include "passcheck/face/FaceTypes.hpp"
#include <opencv2/core.hpp>
#include <optional>
#include <vector>

namespace passcheck {
namespace face {

/**
 * @brief Semantic landmark indices used for feature extraction
 *
 * Defaults follow the 68-point iBUG layout produced by FacemarkLBF.
 * Sides are image sides (left = left half of the picture).
 */
struct LandmarkIndexMap {
    int left_eye_top = 37;
    int left_eye_bottom = 41;
    int left_eye_left = 36;
    int left_eye_right = 39;

    int right_eye_top = 44;
    int right_eye_bottom = 46;
    int right_eye_left = 42;
    int right_eye_right = 45;

    int mouth_top = 62;         ///< Inner upper lip centre
    int mouth_bottom = 66;      ///< Inner lower lip centre
    int mouth_left = 48;
    int mouth_right = 54;

    int left_eyebrow_inner = 21;

    /// Largest index referenced by the map
    int maxIndex() const;

    /// Default map for 68-point models
    static LandmarkIndexMap ibug68();
};

/**
 * @brief Count landmark points that are finite and inside the image
 */
size_t countResolvedPoints(const std::vector<cv::Point2f>& points, const cv::Size& image_size);

/**
 * @brief Detection confidence from the resolved landmark fraction
 * @return min(1, resolved / expected), 0 if nothing is expected
 */
float landmarkConfidence(size_t resolved, size_t expected);

/**
 * @brief Face box from the extremal landmark coordinates
 *
 * Expanded by @p padding of the box size on each side and clamped to the
 * image bounds.
 */
cv::Rect computeFaceBoundingBox(const std::vector<cv::Point2f>& points,
                                const cv::Size& image_size,
                                float padding = 0.1f);

/**
 * @brief Derive eye, mouth and eyebrow features from landmark points
 * @return nullopt if the point list does not cover every index in @p indices
 */
std::optional<LandmarkFeatures> extractFeatures(const std::vector<cv::Point2f>& points,
                                                const LandmarkIndexMap& indices,
                                                const cv::Size& image_size);

} // namespace face
} // namespace passcheck

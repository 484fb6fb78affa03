#pragma once

#include <opencv2/core.hpp>

namespace passcheck {
namespace checks {

/**
 * @brief Grow a face box by @p padding pixels on every side
 *
 * The origin is clamped to the image first and the size then limited to
 * what remains of the image, so a box near the top-left corner keeps its
 * full padded size instead of being cut on both sides.
 */
cv::Rect padFaceRegion(const cv::Rect& face, int padding, const cv::Size& image_size);

/**
 * @brief Intersection of @p rect with the image area (may be empty)
 */
cv::Rect clampToImage(const cv::Rect& rect, const cv::Size& image_size);

/**
 * @brief Population standard deviation over every channel value of @p region
 */
double channelValueStdDev(const cv::Mat& region);

/**
 * @brief Fraction of non-zero pixels in a single-channel mask
 */
double nonZeroRatio(const cv::Mat& mask);

} // namespace checks
} // namespace passcheck

#pragma once

#include "passcheck/face/FaceTypes.hpp"
#include <opencv2/core.hpp>

namespace passcheck {
namespace face {

/**
 * @brief Source of face landmark detections for the validation pipeline
 *
 * Implementations must not throw for a well-formed image; an image without
 * a face yields FaceDetectionResult::notFound().
 */
class LandmarkProvider {
public:
    virtual ~LandmarkProvider() = default;

    /**
     * @brief Detect the (single) face in an image and derive its features
     * @param image 8-bit BGR or grayscale image
     */
    virtual FaceDetectionResult detect(const cv::Mat& image) = 0;
};

} // namespace face
} // namespace passcheck

#pragma once

#include <opencv2/core.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace passcheck {
namespace face {

/**
 * @brief Geometric features derived from facial landmarks
 *
 * "left" and "right" follow the image (camera) side: the left eye is the
 * eye in the left half of the picture, which is the subject's own right
 * eye. Checks that talk to the subject must mirror these names.
 */
struct LandmarkFeatures {
    // Eye openness (height / width of the eye opening, 0 if width is 0)
    double left_eye_ratio = 0.0;
    double right_eye_ratio = 0.0;
    int left_eye_width = 0;             ///< Eye width in pixels
    int right_eye_width = 0;

    // Eye pixel regions used for glare/coverage analysis
    cv::Rect left_eye_region;
    cv::Rect right_eye_region;

    // Mouth geometry in pixels
    int mouth_upper = 0;                ///< y of the upper lip centre
    int mouth_lower = 0;                ///< y of the lower lip centre
    int mouth_width = 0;

    double eyebrow_raise = 0.0;         ///< |eyebrow_inner_y - eye_top_y| / image height
    double mouth_symmetry = 1.0;        ///< 1 = mouth centred horizontally in the image

    nlohmann::json toJson() const;
};

/**
 * @brief Outcome of one landmark detection pass
 *
 * Produced once per validation run and shared read-only by all checks.
 * A missing face is a normal outcome, not an error.
 */
struct FaceDetectionResult {
    bool face_found = false;
    float confidence = 0.0f;                    ///< Fraction of expected landmarks resolved (0-1)
    std::optional<cv::Rect> face_bbox;          ///< Padded face box in image coordinates
    std::optional<LandmarkFeatures> features;

    /**
     * @brief Result for an image without a detectable face
     */
    static FaceDetectionResult notFound();

    /**
     * @brief Centre of the bounding box (integer arithmetic)
     * @return (x + w/2, y + h/2), or nullopt without a bounding box
     */
    std::optional<cv::Point> getFaceCenter() const;

    /**
     * @brief Area of the bounding box in pixels
     * @return w * h, or nullopt without a bounding box
     */
    std::optional<int> getFaceSize() const;

    bool hasBoundingBox() const { return face_found && face_bbox.has_value(); }
    bool hasFeatures() const { return face_found && features.has_value(); }

    nlohmann::json toJson() const;
};

/// JSON array [x, y, width, height]
nlohmann::json rectToJson(const cv::Rect& rect);

} // namespace face
} // namespace passcheck

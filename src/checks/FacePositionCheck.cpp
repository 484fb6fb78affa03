#include "passcheck/checks/FacePositionCheck.hpp"
#include <algorithm>
#include <cmath>

namespace passcheck {
namespace checks {

FacePositionCheck::FacePositionCheck(const FacePositionParams& params)
    : PhotoCheck(params.threshold), params_(params) {
    params_.validate();
}

std::string FacePositionCheck::description() const {
    return "Checks that the face is centred and correctly sized in the frame";
}

model::CheckResult FacePositionCheck::evaluate(const model::PhotoRecord& photo,
                                               const face::FaceDetectionResult& detection) const {
    const cv::Mat& image = requireImage(photo);

    if (!detection.face_found) {
        return noFaceResult("No face detected. Make sure your face is visible", "no_face_detected");
    }
    if (!detection.face_bbox) {
        return noFaceResult("No face detected: the face could not be located", "no_bounding_box");
    }

    const auto center = detection.getFaceCenter();
    const auto size = detection.getFaceSize();
    const cv::Rect& box = *detection.face_bbox;
    if (!center || !size || box.width <= 0 || box.height <= 0) {
        return noFaceResult("No face detected: the face could not be analysed", "invalid_face_data");
    }

    const double img_width = image.cols;
    const double img_height = image.rows;
    const double img_center_x = img_width / 2.0;
    const double img_center_y = img_height / 2.0;

    // Centring
    const double offset_x = std::abs(center->x - img_center_x) / img_width;
    const double offset_y = std::abs(center->y - img_center_y) / img_height;
    const double max_offset = std::max(offset_x, offset_y);

    double centering_score = 1.0;
    if (max_offset > params_.center_tolerance) {
        centering_score = std::max(0.0, 1.0 - (max_offset - params_.center_tolerance) / params_.center_tolerance);
    }

    // Distance to the camera
    const double size_ratio = static_cast<double>(*size) / (img_width * img_height);
    double size_score = 1.0;
    if (size_ratio < params_.min_size_ratio) {
        size_score = std::max(0.0, 1.0 - (params_.min_size_ratio - size_ratio) / params_.min_size_ratio);
    } else if (size_ratio > params_.max_size_ratio) {
        size_score = std::max(0.0, 1.0 - (size_ratio - params_.max_size_ratio) / params_.max_size_ratio);
    }

    // Face boxes of a frontal head are about as wide as tall or narrower
    const double aspect_ratio = static_cast<double>(box.width) / box.height;
    double aspect_score = 1.0;
    if (aspect_ratio < params_.min_aspect || aspect_ratio > params_.max_aspect) {
        const double distance = aspect_ratio < params_.min_aspect
            ? params_.min_aspect - aspect_ratio
            : aspect_ratio - params_.max_aspect;
        aspect_score = std::max(0.0, 1.0 - distance * params_.aspect_falloff);
    }

    const double confidence = std::min(1.0, centering_score * params_.centering_weight +
                                            size_score * params_.size_weight +
                                            aspect_score * params_.aspect_weight);
    const bool passed = confidence >= getThreshold();

    std::string message;
    if (passed) {
        message = "Face position is correct";
    } else if (centering_score < 0.7) {
        if (offset_x > offset_y) {
            message = center->x < img_center_x ? "Move further to the right in the frame"
                                               : "Move further to the left in the frame";
        } else {
            message = center->y < img_center_y ? "Move further down in the frame"
                                               : "Move further up in the frame";
        }
    } else if (size_score < 0.7) {
        message = size_ratio < params_.min_size_ratio ? "Move closer to the camera"
                                                      : "Move further away from the camera";
    } else if (aspect_score < 0.7) {
        message = "Keep your head straight and look directly into the camera";
    } else {
        message = "Adjust your position for a better passport photo";
    }

    nlohmann::json details = {
        {"center_offset_x", offset_x},
        {"center_offset_y", offset_y},
        {"face_size_ratio", size_ratio},
        {"aspect_ratio", aspect_ratio},
        {"centering_score", centering_score},
        {"size_score", size_score},
        {"aspect_score", aspect_score}
    };

    return makeResult(passed, confidence, message, std::move(details));
}

} // namespace checks
} // namespace passcheck

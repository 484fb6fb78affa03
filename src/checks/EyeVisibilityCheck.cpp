#include "passcheck/checks/EyeVisibilityCheck.hpp"
#include "passcheck/checks/ImageRegions.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>

namespace passcheck {
namespace checks {

std::string subjectEyeName(ImageSide side) {
    const bool image_left = side == ImageSide::LEFT;
    if (kProviderEyesMirrored) {
        return image_left ? "right" : "left";
    }
    return image_left ? "left" : "right";
}

EyeVisibilityCheck::EyeVisibilityCheck(const EyeVisibilityParams& params)
    : PhotoCheck(params.threshold), params_(params) {
    params_.validate();
}

std::string EyeVisibilityCheck::description() const {
    return "Checks that both eyes are open and clearly visible";
}

double EyeVisibilityCheck::opennessScore(double eye_ratio) const {
    if (eye_ratio >= params_.acceptable_ratio) {
        return 1.0;
    }
    if (eye_ratio >= params_.closed_ratio) {
        // Half open: 0.6 at the closed breakpoint rising to 1.0
        return 0.6 + (eye_ratio - params_.closed_ratio) /
                     (params_.acceptable_ratio - params_.closed_ratio) * 0.4;
    }
    return std::max(0.0, eye_ratio / params_.closed_ratio * 0.5);
}

double EyeVisibilityCheck::coverageScore(const cv::Mat& gray, const cv::Rect& eye_region) const {
    if (eye_region.area() <= 0) {
        return 0.8;
    }

    const cv::Rect clipped = clampToImage(eye_region, gray.size());
    if (clipped.empty()) {
        return 0.5;
    }

    cv::Mat glare;
    cv::compare(gray(clipped), static_cast<double>(params_.glare_level), glare, cv::CMP_GT);
    const double bright_ratio = nonZeroRatio(glare);

    if (bright_ratio > params_.heavy_glare_fraction) {
        return 0.5;
    }
    if (bright_ratio > params_.light_glare_fraction) {
        return 0.7;
    }
    return 1.0;
}

model::CheckResult EyeVisibilityCheck::evaluate(const model::PhotoRecord& photo,
                                                const face::FaceDetectionResult& detection) const {
    const cv::Mat& image = requireImage(photo);

    if (!detection.face_found) {
        return noFaceResult("No face detected", "no_face_detected");
    }
    if (!detection.features) {
        return noFaceResult("No face detected: the eyes could not be located", "no_landmarks");
    }

    const face::LandmarkFeatures& features = *detection.features;
    const double left_ratio = features.left_eye_ratio;
    const double right_ratio = features.right_eye_ratio;

    const bool left_open = left_ratio >= params_.closed_ratio;
    const bool right_open = right_ratio >= params_.closed_ratio;

    const double left_score = opennessScore(left_ratio);
    const double right_score = opennessScore(right_ratio);

    const cv::Mat gray = toGray(image);
    const double coverage = (coverageScore(gray, features.left_eye_region) +
                             coverageScore(gray, features.right_eye_region)) / 2.0;

    const double openness = (left_score + right_score) / 2.0;
    const double confidence = std::min(1.0, openness * params_.openness_weight +
                                            coverage * params_.coverage_weight);
    const bool passed = confidence >= getThreshold() && left_open && right_open;

    std::string message;
    if (passed) {
        message = "Both eyes are clearly visible";
    } else if (!left_open && !right_open) {
        message = "Open your eyes for the passport photo";
    } else if (!left_open) {
        message = "Open your " + subjectEyeName(ImageSide::LEFT) + " eye for the passport photo";
    } else if (!right_open) {
        message = "Open your " + subjectEyeName(ImageSide::RIGHT) + " eye for the passport photo";
    } else if (coverage < params_.coverage_warning_score) {
        message = "Make sure your eyes are not covered by reflections or hair";
    } else {
        message = "Eyes are not fully visible";
    }

    nlohmann::json details = {
        {"left_eye_aspect_ratio", left_ratio},
        {"right_eye_aspect_ratio", right_ratio},
        {"left_eye_open", left_open},
        {"right_eye_open", right_open},
        {"left_score", left_score},
        {"right_score", right_score},
        {"coverage_score", coverage}
    };

    return makeResult(passed, confidence, message, std::move(details));
}

} // namespace checks
} // namespace passcheck

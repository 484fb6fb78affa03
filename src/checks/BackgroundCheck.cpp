#include "passcheck/checks/BackgroundCheck.hpp"
#include "passcheck/checks/ImageRegions.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>

namespace passcheck {
namespace checks {

BackgroundCheck::BackgroundCheck(const BackgroundParams& params)
    : PhotoCheck(params.threshold), params_(params) {
    params_.validate();
}

std::string BackgroundCheck::description() const {
    return "Checks that the background is neutral and uniform";
}

cv::Rect BackgroundCheck::subjectRegion(const cv::Rect& face, const cv::Size& image_size) const {
    const int x = std::max(0, face.x - static_cast<int>(face.width * params_.mask_left));
    const int y = std::max(0, face.y - static_cast<int>(face.height * params_.mask_top));
    const int width = std::min(image_size.width - x, static_cast<int>(face.width * params_.mask_width));
    const int height = std::min(image_size.height - y, static_cast<int>(face.height * params_.mask_height));
    return clampToImage(cv::Rect(x, y, std::max(0, width), std::max(0, height)), image_size);
}

model::CheckResult BackgroundCheck::evaluate(const model::PhotoRecord& photo,
                                             const face::FaceDetectionResult& detection) const {
    const cv::Mat& image = requireImage(photo);

    if (!detection.hasBoundingBox()) {
        return noFaceResult("No face detected: the background cannot be separated from the subject",
                            "no_face_for_reference");
    }

    cv::Mat background_mask(image.size(), CV_8UC1, cv::Scalar(255));
    background_mask(subjectRegion(*detection.face_bbox, image.size())).setTo(0);

    const int background_pixels = cv::countNonZero(background_mask);
    if (background_pixels < params_.min_background_pixels) {
        return makeResult(true, params_.small_background_confidence, "Background is acceptable",
                          {{"note", "small_background"}});
    }

    const cv::Mat bgr = toBgr(image);
    cv::Mat gray;
    cv::cvtColor(bgr, gray, cv::COLOR_BGR2GRAY);

    cv::Scalar gray_mean, gray_std;
    cv::meanStdDev(gray, gray_mean, gray_std, background_mask);
    const double bg_mean = gray_mean[0];
    const double bg_std = gray_std[0];

    cv::Scalar color_mean, color_std;
    cv::meanStdDev(bgr, color_mean, color_std, background_mask);
    const double bg_color_std = (color_std[0] + color_std[1] + color_std[2]) / 3.0;

    cv::Mat edges;
    cv::Canny(gray, edges, 50, 150);
    cv::Mat background_edges;
    cv::bitwise_and(edges, background_mask, background_edges);
    const double edge_ratio = static_cast<double>(cv::countNonZero(background_edges)) / background_pixels;

    double uniformity_score = 0.3;
    if (bg_std < 20.0) {
        uniformity_score = 1.0;
    } else if (bg_std < 40.0) {
        uniformity_score = 0.7;
    } else if (bg_std < 60.0) {
        uniformity_score = 0.5;
    }

    double color_score = 0.4;
    if (bg_color_std < 15.0) {
        color_score = 1.0;
    } else if (bg_color_std < 30.0) {
        color_score = 0.7;
    }

    double edge_score = 0.3;
    if (edge_ratio < 0.05) {
        edge_score = 1.0;
    } else if (edge_ratio < 0.10) {
        edge_score = 0.7;
    } else if (edge_ratio < 0.20) {
        edge_score = 0.5;
    }

    // Passport backgrounds should be light
    double brightness_bonus = 0.0;
    if (bg_mean > 180.0) {
        brightness_bonus = 0.1;
    } else if (bg_mean > 150.0) {
        brightness_bonus = 0.05;
    }

    const double confidence = std::min(1.0, uniformity_score * params_.uniformity_weight +
                                            color_score * params_.color_weight +
                                            edge_score * params_.edge_weight +
                                            brightness_bonus);
    const bool passed = confidence >= getThreshold();

    std::string message;
    if (passed) {
        message = "Background is acceptable";
    } else if (edge_score < 0.5) {
        message = "Background contains distracting objects. Use a neutral background";
    } else if (uniformity_score < 0.5) {
        message = "Background is not uniform enough. Use a plain background";
    } else {
        message = "Use a neutral, light background for the passport photo";
    }

    nlohmann::json details = {
        {"bg_std", bg_std},
        {"bg_mean", bg_mean},
        {"bg_color_std", bg_color_std},
        {"edge_ratio", edge_ratio},
        {"uniformity_score", uniformity_score},
        {"color_score", color_score},
        {"edge_score", edge_score}
    };

    return makeResult(passed, confidence, message, std::move(details));
}

} // namespace checks
} // namespace passcheck

#include "passcheck/checks/ShadowCheck.hpp"
#include "passcheck/checks/ImageRegions.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>

namespace passcheck {
namespace checks {

ShadowCheck::ShadowCheck(const ShadowParams& params)
    : PhotoCheck(params.threshold), params_(params) {
    params_.validate();
}

std::string ShadowCheck::description() const {
    return "Checks the photo for disturbing shadows";
}

model::CheckResult ShadowCheck::evaluate(const model::PhotoRecord& photo,
                                         const face::FaceDetectionResult& detection) const {
    const cv::Mat gray = toGray(requireImage(photo));

    cv::Mat region = gray;
    if (detection.hasBoundingBox()) {
        // Include neck and shoulders
        const cv::Rect& face = *detection.face_bbox;
        const int padding = static_cast<int>(face.height * params_.face_padding);
        const cv::Rect padded = padFaceRegion(face, padding, gray.size());
        if (!padded.empty()) {
            region = gray(padded);
        }
    }

    cv::Mat dark_mask;
    cv::compare(region, static_cast<double>(params_.dark_level), dark_mask, cv::CMP_LT);
    const cv::Mat kernel = cv::getStructuringElement(cv::MORPH_RECT,
                                                     cv::Size(params_.morph_kernel, params_.morph_kernel));
    cv::morphologyEx(dark_mask, dark_mask, cv::MORPH_OPEN, kernel);

    const double total_pixels = static_cast<double>(region.total());
    const int shadow_pixels = cv::countNonZero(dark_mask);
    const double shadow_ratio = shadow_pixels / total_pixels;

    cv::Mat edges;
    cv::Canny(dark_mask, edges, 50, 150);
    const double edge_ratio = cv::countNonZero(edges) / total_pixels;

    cv::Scalar mean, stddev;
    cv::meanStdDev(region, mean, stddev);
    const double std_dev = stddev[0];

    double ratio_score = 1.0;
    if (shadow_ratio > params_.max_dark_ratio) {
        const double excess = shadow_ratio - params_.max_dark_ratio;
        ratio_score = std::max(0.0, 1.0 - excess / params_.max_dark_ratio);
    }

    // Fewer mask edges means softer transitions
    double edge_score = 1.0;
    if (edge_ratio >= params_.edge_ratio_limit) {
        edge_score = std::max(0.0, 1.0 - (edge_ratio - params_.edge_ratio_limit) / params_.edge_falloff);
    }

    double uniformity_score = 1.0;
    if (std_dev >= params_.uneven_std) {
        uniformity_score = std::max(0.0, 1.0 - (std_dev - params_.uneven_std) / params_.uneven_std);
    } else if (std_dev >= params_.smooth_std) {
        uniformity_score = 0.8;
    }

    const double confidence = std::min(1.0, ratio_score * params_.ratio_weight +
                                            edge_score * params_.edge_weight +
                                            uniformity_score * params_.uniformity_weight);
    const bool passed = confidence >= getThreshold();

    std::string message;
    if (passed) {
        message = "No disturbing shadows detected";
    } else if (shadow_ratio > params_.max_dark_ratio * 2.0) {
        message = "A lot of shadow detected. Improve the lighting";
    } else if (edge_score < 0.5) {
        message = "Hard shadows detected. Use diffuse light";
    } else if (uniformity_score < 0.6) {
        message = "Uneven lighting. Adjust the light sources";
    } else {
        message = "Light shadows detected. Adjust the lighting for the best result";
    }

    nlohmann::json details = {
        {"shadow_ratio", shadow_ratio},
        {"shadow_pixels", shadow_pixels},
        {"edge_ratio", edge_ratio},
        {"std_deviation", std_dev},
        {"ratio_score", ratio_score},
        {"edge_score", edge_score},
        {"uniformity_score", uniformity_score}
    };

    return makeResult(passed, confidence, message, std::move(details));
}

} // namespace checks
} // namespace passcheck

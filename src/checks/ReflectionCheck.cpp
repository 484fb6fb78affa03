#include "passcheck/checks/ReflectionCheck.hpp"
#include "passcheck/checks/ImageRegions.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>

namespace passcheck {
namespace checks {

ReflectionCheck::ReflectionCheck(const ReflectionParams& params)
    : PhotoCheck(params.threshold), params_(params) {
    params_.validate();
}

std::string ReflectionCheck::description() const {
    return "Checks the photo for disturbing reflections and glare";
}

model::CheckResult ReflectionCheck::evaluate(const model::PhotoRecord& photo,
                                             const face::FaceDetectionResult& detection) const {
    const cv::Mat gray = toGray(requireImage(photo));

    cv::Mat region = gray;
    if (detection.hasBoundingBox()) {
        const cv::Rect face = clampToImage(*detection.face_bbox, gray.size());
        if (!face.empty()) {
            region = gray(face);
        }
    }

    cv::Mat bright_mask;
    cv::compare(region, static_cast<double>(params_.bright_level), bright_mask, cv::CMP_GE);
    const cv::Mat kernel = cv::getStructuringElement(cv::MORPH_RECT,
                                                     cv::Size(params_.morph_kernel, params_.morph_kernel));
    cv::morphologyEx(bright_mask, bright_mask, cv::MORPH_OPEN, kernel);

    const int reflection_pixels = cv::countNonZero(bright_mask);
    const double reflection_ratio = static_cast<double>(reflection_pixels) / static_cast<double>(region.total());

    cv::Mat labels, stats, centroids;
    const int num_labels = cv::connectedComponentsWithStats(bright_mask, labels, stats, centroids, 8);

    int significant = 0;
    nlohmann::json large_reflections = nlohmann::json::array();
    for (int i = 1; i < num_labels; ++i) {   // label 0 is the background
        const int area = stats.at<int>(i, cv::CC_STAT_AREA);
        if (area > params_.min_blob_area) {
            ++significant;
            large_reflections.push_back({
                {"area", area},
                {"center", {centroids.at<double>(i, 0), centroids.at<double>(i, 1)}}
            });
        }
    }

    double ratio_score = 1.0;
    if (reflection_ratio > params_.max_bright_ratio) {
        const double excess = reflection_ratio - params_.max_bright_ratio;
        ratio_score = std::max(0.0, 1.0 - excess / params_.max_bright_ratio);
    }

    double count_score = 1.0;
    if (significant > params_.tolerated_blobs) {
        count_score = std::max(0.0, 1.0 - (significant - params_.tolerated_blobs) * params_.blob_penalty);
    } else if (significant > 0) {
        count_score = 0.7;
    }

    const double confidence = std::min(1.0, ratio_score * params_.ratio_weight +
                                            count_score * params_.count_weight);
    const bool passed = confidence >= getThreshold();

    std::string message;
    if (passed) {
        message = "No significant reflections detected";
    } else if (significant > params_.multiple_blob_warning) {
        message = "Multiple reflections detected. Avoid direct light and reflections in glasses";
    } else if (reflection_ratio > params_.max_bright_ratio * 2.0) {
        message = "Strong reflection detected. Adjust the lighting";
    } else {
        message = "Slight reflection detected. Adjust your position or the lighting";
    }

    nlohmann::json details = {
        {"reflection_ratio", reflection_ratio},
        {"reflection_pixels", reflection_pixels},
        {"significant_reflections", significant},
        {"large_reflections", std::move(large_reflections)},
        {"ratio_score", ratio_score},
        {"count_score", count_score}
    };

    return makeResult(passed, confidence, message, std::move(details));
}

} // namespace checks
} // namespace passcheck

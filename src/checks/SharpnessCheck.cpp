#include "passcheck/checks/SharpnessCheck.hpp"
#include "passcheck/checks/ImageRegions.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>

namespace passcheck {
namespace checks {

SharpnessCheck::SharpnessCheck(const SharpnessParams& params)
    : PhotoCheck(params.threshold), params_(params) {
    params_.validate();
}

std::string SharpnessCheck::description() const {
    return "Checks that the photo is in focus and not blurred";
}

model::CheckResult SharpnessCheck::evaluate(const model::PhotoRecord& photo,
                                            const face::FaceDetectionResult& detection) const {
    cv::Mat gray = toGray(requireImage(photo));

    bool focused_on_face = false;
    if (detection.hasBoundingBox()) {
        const cv::Rect& face = *detection.face_bbox;
        const int padding = static_cast<int>(std::min(face.width, face.height) * params_.face_padding);
        const cv::Rect region = padFaceRegion(face, padding, gray.size());
        if (!region.empty()) {
            gray = gray(region);
            focused_on_face = true;
        }
    }

    cv::Mat laplacian;
    cv::Laplacian(gray, laplacian, CV_64F);
    cv::Scalar mean, stddev;
    cv::meanStdDev(laplacian, mean, stddev);
    const double variance = stddev[0] * stddev[0];

    const double confidence = variance >= params_.min_variance
        ? std::min(1.0, variance / (params_.min_variance * 2.0))
        : variance / params_.min_variance;

    const std::string fail_message = variance < params_.min_variance * 0.5
        ? "Photo is blurry. Hold the camera still and make sure it is focused"
        : "Photo is not sharp enough. Please try again";

    nlohmann::json details = {
        {"laplacian_variance", variance},
        {"min_variance_threshold", params_.min_variance},
        {"focused_on_face", focused_on_face}
    };

    return scoredResult(confidence, "Photo is sharp enough", fail_message, std::move(details));
}

} // namespace checks
} // namespace passcheck

#include "passcheck/checks/BrightnessCheck.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>

namespace passcheck {
namespace checks {

BrightnessCheck::BrightnessCheck(const BrightnessParams& params)
    : PhotoCheck(params.threshold), params_(params) {
    params_.validate();
}

std::string BrightnessCheck::description() const {
    return "Checks that the photo is neither too dark nor too bright";
}

model::CheckResult BrightnessCheck::evaluate(const model::PhotoRecord& photo,
                                             const face::FaceDetectionResult& /*detection*/) const {
    const cv::Mat gray = toGray(requireImage(photo));

    const double mean_brightness = cv::mean(gray)[0];

    // 256-bin histogram normalized to a distribution
    cv::Mat hist;
    const int hist_size = 256;
    const float range[] = {0.0f, 256.0f};
    const float* ranges[] = {range};
    const int channels[] = {0};
    cv::calcHist(&gray, 1, channels, cv::Mat(), hist, 1, &hist_size, ranges);
    hist /= static_cast<double>(gray.total());

    const int over_bin = std::clamp(params_.overexposed_bin, 0, hist_size);
    const int under_bin = std::clamp(params_.underexposed_bin, 0, hist_size);
    const double overexposed_ratio = cv::sum(hist.rowRange(over_bin, hist_size))[0];
    const double underexposed_ratio = cv::sum(hist.rowRange(0, under_bin))[0];

    double brightness_score = 1.0;
    if (mean_brightness < params_.min_brightness || mean_brightness > params_.max_brightness) {
        const double distance = mean_brightness < params_.min_brightness
            ? params_.min_brightness - mean_brightness
            : mean_brightness - params_.max_brightness;
        brightness_score = std::max(0.0, 1.0 - distance / params_.falloff);
    }

    const double extreme_score = 1.0 - std::min(1.0, (overexposed_ratio + underexposed_ratio) * 2.0);

    const double confidence = std::min(1.0, brightness_score * params_.brightness_weight +
                                            extreme_score * params_.extremes_weight);
    const bool passed = confidence >= getThreshold();

    std::string message;
    if (passed) {
        message = "Exposure is correct";
    } else if (mean_brightness < params_.min_brightness) {
        message = "Photo is too dark. Add more light";
    } else if (mean_brightness > params_.max_brightness) {
        message = "Photo is too bright. Reduce the exposure";
    } else if (overexposed_ratio > params_.exposure_warning_ratio) {
        message = "Too much overexposure detected";
    } else if (underexposed_ratio > params_.exposure_warning_ratio) {
        message = "Too much underexposure detected";
    } else {
        message = "Exposure is not optimal";
    }

    nlohmann::json details = {
        {"mean_brightness", mean_brightness},
        {"overexposed_ratio", overexposed_ratio},
        {"underexposed_ratio", underexposed_ratio},
        {"brightness_score", brightness_score},
        {"extreme_score", extreme_score}
    };

    return makeResult(passed, confidence, message, std::move(details));
}

} // namespace checks
} // namespace passcheck

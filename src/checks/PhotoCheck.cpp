#include "passcheck/checks/PhotoCheck.hpp"
#include "passcheck/core/exception.h"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>

namespace passcheck {
namespace checks {

PhotoCheck::PhotoCheck(double threshold) : threshold_(threshold) {
    validateThreshold(threshold);
}

void PhotoCheck::setThreshold(double threshold) {
    validateThreshold(threshold);
    threshold_.store(threshold);
}

void PhotoCheck::validateThreshold(double threshold) {
    if (!std::isfinite(threshold) || threshold < 0.0 || threshold > 1.0) {
        PASSCHECK_THROW(core::InvalidArgumentException,
                        "Threshold must be between 0.0 and 1.0 (got " + std::to_string(threshold) + ")");
    }
}

const cv::Mat& PhotoCheck::requireImage(const model::PhotoRecord& photo) {
    const cv::Mat& image = photo.getImage();
    if (image.data == nullptr || image.empty()) {
        PASSCHECK_THROW(core::InvalidInputException, "Photo has no image data");
    }
    if (image.dims != 2 || image.depth() != CV_8U) {
        PASSCHECK_THROW(core::InvalidInputException, "Photo image must be a 2-D 8-bit image");
    }
    const int channels = image.channels();
    if (channels != 1 && channels != 3 && channels != 4) {
        PASSCHECK_THROW(core::InvalidInputException,
                        "Unsupported channel count: " + std::to_string(channels));
    }
    return image;
}

cv::Mat PhotoCheck::toGray(const cv::Mat& image) {
    cv::Mat gray;
    switch (image.channels()) {
        case 3:
            cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
            break;
        case 4:
            cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
            break;
        default:
            gray = image;
            break;
    }
    return gray;
}

cv::Mat PhotoCheck::toBgr(const cv::Mat& image) {
    cv::Mat bgr;
    switch (image.channels()) {
        case 1:
            cv::cvtColor(image, bgr, cv::COLOR_GRAY2BGR);
            break;
        case 4:
            cv::cvtColor(image, bgr, cv::COLOR_BGRA2BGR);
            break;
        default:
            bgr = image;
            break;
    }
    return bgr;
}

model::CheckResult PhotoCheck::scoredResult(double confidence, const std::string& pass_message,
                                            const std::string& fail_message,
                                            nlohmann::json details) const {
    confidence = std::clamp(confidence, 0.0, 1.0);
    const bool passed = confidence >= getThreshold();
    return model::CheckResult(name(), passed, confidence,
                              passed ? pass_message : fail_message, std::move(details));
}

model::CheckResult PhotoCheck::makeResult(bool passed, double confidence, const std::string& message,
                                          nlohmann::json details) const {
    return model::CheckResult(name(), passed, std::clamp(confidence, 0.0, 1.0), message,
                              std::move(details));
}

model::CheckResult PhotoCheck::noFaceResult(const std::string& message, const std::string& reason) const {
    return model::CheckResult(name(), false, 0.0, message, {{"error", reason}});
}

} // namespace checks
} // namespace passcheck

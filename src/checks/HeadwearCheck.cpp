#include "passcheck/checks/HeadwearCheck.hpp"
#include "passcheck/checks/ImageRegions.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>

namespace passcheck {
namespace checks {

namespace {

// HSV skin ranges: light skin, and a wider low-saturation range for darker skin
const cv::Scalar kSkinLower(0, 20, 70);
const cv::Scalar kSkinUpper(20, 255, 255);
const cv::Scalar kDarkSkinLower(0, 10, 40);
const cv::Scalar kDarkSkinUpper(25, 200, 255);

} // namespace

HeadwearCheck::HeadwearCheck(const HeadwearParams& params)
    : PhotoCheck(params.threshold), params_(params) {
    params_.validate();
}

std::string HeadwearCheck::description() const {
    return "Checks that no headwear is worn";
}

double HeadwearCheck::skinRatio(const cv::Mat& bgr_region) {
    cv::Mat hsv;
    cv::cvtColor(bgr_region, hsv, cv::COLOR_BGR2HSV);

    cv::Mat skin, dark_skin;
    cv::inRange(hsv, kSkinLower, kSkinUpper, skin);
    cv::inRange(hsv, kDarkSkinLower, kDarkSkinUpper, dark_skin);
    cv::bitwise_or(skin, dark_skin, skin);
    return nonZeroRatio(skin);
}

model::CheckResult HeadwearCheck::evaluate(const model::PhotoRecord& photo,
                                           const face::FaceDetectionResult& detection) const {
    const cv::Mat& image = requireImage(photo);

    if (!detection.hasBoundingBox()) {
        return noFaceResult("No face detected", "no_face_detected");
    }

    const cv::Rect& face = *detection.face_bbox;
    const int band_top = std::max(0, face.y - static_cast<int>(face.height * params_.band_height));
    const cv::Rect band = clampToImage(cv::Rect(face.x, band_top, face.width, face.y - band_top),
                                       image.size());

    if (band.empty()) {
        // Face touches the top edge: nothing to inspect
        return makeResult(true, params_.small_region_confidence, "No headwear detected",
                          {{"note", "small_region"}});
    }

    const cv::Mat region = toBgr(image)(band);

    const double skin_ratio = skinRatio(region);

    cv::Mat gray, dark;
    cv::cvtColor(region, gray, cv::COLOR_BGR2GRAY);
    cv::compare(gray, static_cast<double>(params_.dark_level), dark, cv::CMP_LT);
    const double dark_ratio = nonZeroRatio(dark);

    const double color_std = channelValueStdDev(region);

    // Later rules override earlier ones
    bool has_headwear = false;
    double confidence = 1.0;
    if (skin_ratio < params_.hat_skin_ratio && dark_ratio > params_.hat_dark_ratio) {
        has_headwear = true;
        confidence = 0.2;
    }
    if (skin_ratio < params_.covered_skin_ratio) {
        has_headwear = true;
        confidence = 0.1;
    }
    if (color_std < params_.uniform_std && skin_ratio < params_.uniform_skin_ratio) {
        has_headwear = true;
        confidence = 0.3;
    }

    const std::string message = has_headwear
        ? "Remove any headwear (cap, hat) for the passport photo"
        : "No headwear detected";

    nlohmann::json details = {
        {"skin_ratio", skin_ratio},
        {"dark_ratio", dark_ratio},
        {"color_std", color_std},
        {"has_headwear", has_headwear}
    };

    return makeResult(!has_headwear, confidence, message, std::move(details));
}

} // namespace checks
} // namespace passcheck

#pragma once

#include "passcheck/checks/PhotoCheck.hpp"
#include "passcheck/checks/CheckConfig.hpp"

namespace passcheck {
namespace checks {

/**
 * @brief Detects caps, hats and similar in the band above the face box
 *
 * The forehead band should be mostly skin or hair. Little skin combined
 * with dark or uniform colour is taken as headwear. Any headwear finding
 * fails the check regardless of the threshold.
 */
class HeadwearCheck : public PhotoCheck {
public:
    explicit HeadwearCheck(const HeadwearParams& params = HeadwearParams());

    model::CheckResult evaluate(const model::PhotoRecord& photo,
                                const face::FaceDetectionResult& detection) const override;

    std::string name() const override { return "headwear"; }
    std::string description() const override;

    const HeadwearParams& getParams() const { return params_; }

    /// Fraction of skin-toned pixels in a BGR region
    static double skinRatio(const cv::Mat& bgr_region);

private:
    HeadwearParams params_;
};

} // namespace checks
} // namespace passcheck

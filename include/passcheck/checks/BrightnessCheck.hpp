#pragma once

#include "passcheck/checks/PhotoCheck.hpp"
#include "passcheck/checks/CheckConfig.hpp"

namespace passcheck {
namespace checks {

/**
 * @brief Exposure check on the whole image
 *
 * Scores the mean gray level against the accepted range and penalizes
 * histogram mass in the clipped tails. Does not need a face.
 */
class BrightnessCheck : public PhotoCheck {
public:
    explicit BrightnessCheck(const BrightnessParams& params = BrightnessParams());

    model::CheckResult evaluate(const model::PhotoRecord& photo,
                                const face::FaceDetectionResult& detection) const override;

    std::string name() const override { return "brightness"; }
    std::string description() const override;

    const BrightnessParams& getParams() const { return params_; }

private:
    BrightnessParams params_;
};

} // namespace checks
} // namespace passcheck

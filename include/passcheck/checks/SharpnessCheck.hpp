#pragma once

#include "passcheck/checks/PhotoCheck.hpp"
#include "passcheck/checks/CheckConfig.hpp"

namespace passcheck {
namespace checks {

/**
 * @brief Focus check based on the variance of the Laplacian
 *
 * Uses the padded face box when a face was found, the whole image
 * otherwise.
 */
class SharpnessCheck : public PhotoCheck {
public:
    explicit SharpnessCheck(const SharpnessParams& params = SharpnessParams());

    model::CheckResult evaluate(const model::PhotoRecord& photo,
                                const face::FaceDetectionResult& detection) const override;

    std::string name() const override { return "sharpness"; }
    std::string description() const override;

    const SharpnessParams& getParams() const { return params_; }

private:
    SharpnessParams params_;
};

} // namespace checks
} // namespace passcheck

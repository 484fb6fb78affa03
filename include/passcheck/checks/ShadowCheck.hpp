#pragma once

#include "passcheck/checks/PhotoCheck.hpp"
#include "passcheck/checks/CheckConfig.hpp"

namespace passcheck {
namespace checks {

/**
 * @brief Shadow check on the padded face region (or whole image)
 *
 * Combines the dark-pixel share, the edge density of the dark mask (hard
 * shadow borders) and the intensity spread of the region.
 */
class ShadowCheck : public PhotoCheck {
public:
    explicit ShadowCheck(const ShadowParams& params = ShadowParams());

    model::CheckResult evaluate(const model::PhotoRecord& photo,
                                const face::FaceDetectionResult& detection) const override;

    std::string name() const override { return "shadow"; }
    std::string description() const override;

    const ShadowParams& getParams() const { return params_; }

private:
    ShadowParams params_;
};

} // namespace checks
} // namespace passcheck

#pragma once

#include "passcheck/checks/PhotoCheck.hpp"
#include "passcheck/checks/CheckConfig.hpp"

namespace passcheck {
namespace checks {

/**
 * @brief Framing check: face centred, at the right distance, facing the camera
 *
 * Requires a face with a bounding box; without one the check fails with
 * confidence 0.
 */
class FacePositionCheck : public PhotoCheck {
public:
    explicit FacePositionCheck(const FacePositionParams& params = FacePositionParams());

    model::CheckResult evaluate(const model::PhotoRecord& photo,
                                const face::FaceDetectionResult& detection) const override;

    std::string name() const override { return "face_position"; }
    std::string description() const override;

    const FacePositionParams& getParams() const { return params_; }

private:
    FacePositionParams params_;
};

} // namespace checks
} // namespace passcheck

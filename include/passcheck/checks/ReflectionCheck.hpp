#pragma once

#include "passcheck/checks/PhotoCheck.hpp"
#include "passcheck/checks/CheckConfig.hpp"

namespace passcheck {
namespace checks {

/**
 * @brief Glare check: specular highlights on the face (or whole image)
 *
 * Bright pixels are thresholded, cleaned with a morphological open and
 * grouped into 8-connected blobs; only blobs above the minimum area count.
 */
class ReflectionCheck : public PhotoCheck {
public:
    explicit ReflectionCheck(const ReflectionParams& params = ReflectionParams());

    model::CheckResult evaluate(const model::PhotoRecord& photo,
                                const face::FaceDetectionResult& detection) const override;

    std::string name() const override { return "reflection"; }
    std::string description() const override;

    const ReflectionParams& getParams() const { return params_; }

private:
    ReflectionParams params_;
};

} // namespace checks
} // namespace passcheck

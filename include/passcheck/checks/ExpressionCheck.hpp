#pragma once

#include "passcheck/checks/PhotoCheck.hpp"
#include "passcheck/checks/CheckConfig.hpp"

namespace passcheck {
namespace checks {

/**
 * @brief Neutral expression check (closed mouth, relaxed eyebrows)
 *
 * Requires landmark features; fails with confidence 0 without them.
 */
class ExpressionCheck : public PhotoCheck {
public:
    explicit ExpressionCheck(const ExpressionParams& params = ExpressionParams());

    model::CheckResult evaluate(const model::PhotoRecord& photo,
                                const face::FaceDetectionResult& detection) const override;

    std::string name() const override { return "expression"; }
    std::string description() const override;

    const ExpressionParams& getParams() const { return params_; }

    /// Mouth height / width, 0 for a zero-width mouth
    static double mouthAspectRatio(const face::LandmarkFeatures& features);

private:
    double featureScore(const face::LandmarkFeatures& features) const;

    ExpressionParams params_;
};

} // namespace checks
} // namespace passcheck

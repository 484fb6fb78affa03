#pragma once

#include "passcheck/checks/PhotoCheck.hpp"
#include "passcheck/checks/CheckConfig.hpp"

namespace passcheck {
namespace checks {

/**
 * @brief Image side of an eye as reported by the landmark provider
 */
enum class ImageSide {
    LEFT,
    RIGHT
};

/**
 * @brief True: the provider's image-left eye is the subject's right eye
 *
 * Landmark features name eyes by image side. A subject facing the camera
 * sees that picture mirrored, so feedback for the image-left eye has to
 * say "right eye".
 */
constexpr bool kProviderEyesMirrored = true;

/**
 * @brief Word the subject uses for the eye on @p side of the image
 * @return "left" or "right"
 */
std::string subjectEyeName(ImageSide side);

/**
 * @brief Eyes open and not hidden by glare
 *
 * Each eye's aspect ratio is scored against the closed and acceptable
 * breakpoints; bright pixels inside the eye regions lower a coverage score.
 * An eye below the closed breakpoint fails the check whatever the blended
 * confidence.
 */
class EyeVisibilityCheck : public PhotoCheck {
public:
    explicit EyeVisibilityCheck(const EyeVisibilityParams& params = EyeVisibilityParams());

    model::CheckResult evaluate(const model::PhotoRecord& photo,
                                const face::FaceDetectionResult& detection) const override;

    std::string name() const override { return "eye_visibility"; }
    std::string description() const override;

    const EyeVisibilityParams& getParams() const { return params_; }

    /// Openness score of one eye in [0, 1]
    double opennessScore(double eye_ratio) const;

    /// Coverage score of one eye region (1 = fully visible)
    double coverageScore(const cv::Mat& gray, const cv::Rect& eye_region) const;

private:
    EyeVisibilityParams params_;
};

} // namespace checks
} // namespace passcheck

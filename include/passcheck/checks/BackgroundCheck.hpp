#pragma once

#include "passcheck/checks/PhotoCheck.hpp"
#include "passcheck/checks/CheckConfig.hpp"

namespace passcheck {
namespace checks {

/**
 * @brief Plain, light background check
 *
 * Everything outside an expanded face box (head, neck and shoulders) is
 * treated as background and scored on intensity spread, colour spread,
 * edge density and brightness. Fails with confidence 0 without a face,
 * since the background cannot be separated from the subject.
 */
class BackgroundCheck : public PhotoCheck {
public:
    explicit BackgroundCheck(const BackgroundParams& params = BackgroundParams());

    model::CheckResult evaluate(const model::PhotoRecord& photo,
                                const face::FaceDetectionResult& detection) const override;

    std::string name() const override { return "background"; }
    std::string description() const override;

    const BackgroundParams& getParams() const { return params_; }

    /// Subject area excluded from the background, clamped to the image
    cv::Rect subjectRegion(const cv::Rect& face, const cv::Size& image_size) const;

private:
    BackgroundParams params_;
};

} // namespace checks
} // namespace passcheck

#pragma once

#include "passcheck/model/PhotoRecord.hpp"
#include "passcheck/face/FaceTypes.hpp"
#include <opencv2/core.hpp>
#include <nlohmann/json.hpp>
#include <atomic>
#include <string>

namespace passcheck {
namespace checks {

/**
 * @brief Common contract of the compliance checks
 *
 * A check scores one aspect of a photo. It reads the image and the shared
 * landmark result, never modifies either, and keeps no state between calls
 * apart from its threshold. evaluate() may be called concurrently on
 * different photos.
 */
class PhotoCheck {
public:
    /**
     * @throws core::InvalidArgumentException if threshold is outside [0, 1]
     */
    explicit PhotoCheck(double threshold);
    virtual ~PhotoCheck() = default;

    /**
     * @brief Score the photo
     * @throws core::InvalidInputException if the photo has no usable image
     */
    virtual model::CheckResult evaluate(const model::PhotoRecord& photo,
                                        const face::FaceDetectionResult& detection) const = 0;

    /// Stable identifier, used as CheckResult::getCheckName()
    virtual std::string name() const = 0;

    virtual std::string description() const = 0;

    double getThreshold() const { return threshold_.load(); }

    /**
     * @throws core::InvalidArgumentException if threshold is outside [0, 1]
     */
    void setThreshold(double threshold);

protected:
    /**
     * @brief Image of @p photo after validation
     *
     * Accepts 8-bit images with 1, 3 (BGR) or 4 (BGRA) channels.
     */
    static const cv::Mat& requireImage(const model::PhotoRecord& photo);

    /// Gray copy (or view for single-channel input)
    static cv::Mat toGray(const cv::Mat& image);

    /// 3-channel BGR copy (or view for BGR input)
    static cv::Mat toBgr(const cv::Mat& image);

    /// Result whose pass flag is confidence >= threshold
    model::CheckResult scoredResult(double confidence, const std::string& pass_message,
                                    const std::string& fail_message, nlohmann::json details) const;

    model::CheckResult makeResult(bool passed, double confidence, const std::string& message,
                                  nlohmann::json details) const;

    /// Automatic failure for checks that need a face
    model::CheckResult noFaceResult(const std::string& message, const std::string& reason) const;

private:
    static void validateThreshold(double threshold);

    std::atomic<double> threshold_;
};

} // namespace checks
} // namespace passcheck

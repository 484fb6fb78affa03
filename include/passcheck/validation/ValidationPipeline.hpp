#pragma once

#include "passcheck/checks/CheckConfig.hpp"
#include "passcheck/checks/PhotoCheck.hpp"
#include "passcheck/face/LandmarkProvider.hpp"
#include "passcheck/model/PhotoRecord.hpp"
#include "passcheck/validation/ValidationObserver.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace passcheck {
namespace validation {

using CheckPtr = std::shared_ptr<checks::PhotoCheck>;

/**
 * @brief The nine production checks in their fixed order
 *
 * brightness, sharpness, face_position, expression, eye_visibility,
 * reflection, shadow, headwear, background
 *
 * @throws core::InvalidArgumentException if @p config is invalid
 */
std::vector<CheckPtr> createDefaultChecks(const checks::CheckConfig& config = checks::CheckConfig());

/**
 * @brief Runs landmark detection once and every registered check in order
 *
 * A run is synchronous. Landmark detection happens exactly once per run
 * and its result is shared read-only by all checks. An exception raised by
 * one check is logged and recorded as a failed result for that check; the
 * remaining checks still run, so a record always ends up with one result
 * per registered check, in registration order.
 *
 * Registration methods are thread-safe; a run works on a snapshot of the
 * check and observer lists taken when it starts.
 */
class ValidationPipeline {
public:
    /**
     * @brief Pipeline with the default checks built from @p config
     */
    explicit ValidationPipeline(std::shared_ptr<face::LandmarkProvider> provider,
                                const checks::CheckConfig& config = checks::CheckConfig());

    /**
     * @brief Pipeline with an explicit check list
     */
    ValidationPipeline(std::shared_ptr<face::LandmarkProvider> provider,
                       std::vector<CheckPtr> checks);

    ValidationPipeline(const ValidationPipeline&) = delete;
    ValidationPipeline& operator=(const ValidationPipeline&) = delete;

    /**
     * @brief Validate @p photo in place
     *
     * Previous results of the record are cleared first.
     *
     * @return Reference to @p photo
     * @throws core::InvalidInputException if the photo has no image
     */
    model::PhotoRecord& run(model::PhotoRecord& photo);

    /**
     * @brief Append a check (replaces an existing check of the same name)
     * @throws core::InvalidArgumentException for a null check
     */
    void addCheck(CheckPtr check);

    /**
     * @brief Remove the check named @p name
     * @return false if no such check is registered
     */
    bool removeCheck(const std::string& name);

    /**
     * @brief Copy of the registered checks in run order
     */
    std::vector<CheckPtr> getChecks() const;

    std::vector<std::string> getCheckNames() const;

    void addObserver(std::shared_ptr<ValidationObserver> observer);
    void removeObserver(const std::shared_ptr<ValidationObserver>& observer);

private:
    face::FaceDetectionResult detectFace(const cv::Mat& image) const;

    model::CheckResult runCheck(const checks::PhotoCheck& check,
                                const model::PhotoRecord& photo,
                                const face::FaceDetectionResult& detection) const;

    void notifyProgress(const std::vector<std::shared_ptr<ValidationObserver>>& observers,
                        const std::string& message) const;
    void notifyCheckCompleted(const std::vector<std::shared_ptr<ValidationObserver>>& observers,
                              const model::CheckResult& result) const;
    void notifyComplete(const std::vector<std::shared_ptr<ValidationObserver>>& observers,
                        const model::PhotoRecord& photo) const;

    std::shared_ptr<face::LandmarkProvider> provider_;
    std::vector<CheckPtr> checks_;
    std::vector<std::shared_ptr<ValidationObserver>> observers_;
    mutable std::mutex mutex_;
};

} // namespace validation
} // namespace passcheck

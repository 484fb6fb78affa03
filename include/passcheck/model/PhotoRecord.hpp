#pragma once

#include "passcheck/core/types.hpp"
#include <opencv2/core.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace passcheck {
namespace model {

/**
 * @brief Decision state of a photo
 */
enum class PhotoStatus {
    PENDING,    ///< No check results yet
    APPROVED,   ///< Every check passed
    REJECTED    ///< At least one check failed
};

std::string photoStatusToString(PhotoStatus status);

/**
 * @brief Immutable outcome of one compliance check
 *
 * Details hold plain JSON values (numbers, strings, booleans, arrays,
 * objects) so they can be handed to persistence without conversion.
 * A null details value means "no details".
 */
class CheckResult {
public:
    /**
     * @throws core::InvalidArgumentException if confidence is outside [0, 1]
     */
    CheckResult(std::string check_name,
                bool passed,
                double confidence,
                std::string message,
                nlohmann::json details = nullptr);

    const std::string& getCheckName() const { return check_name_; }
    bool isPassed() const { return passed_; }
    double getConfidence() const { return confidence_; }
    const std::string& getMessage() const { return message_; }
    const nlohmann::json& getDetails() const { return details_; }
    bool hasDetails() const { return !details_.is_null(); }

    nlohmann::json toJson() const;

private:
    std::string check_name_;
    bool passed_;
    double confidence_;
    std::string message_;
    nlohmann::json details_;
};

/**
 * @brief A captured photo and the results of its validation pass
 *
 * The status is never set directly: it is recomputed from the result list
 * every time the list changes.
 */
class PhotoRecord {
public:
    PhotoRecord();
    explicit PhotoRecord(cv::Mat image, core::Timestamp timestamp = core::Timestamp::clock::now());

    const cv::Mat& getImage() const { return image_; }
    void setImage(cv::Mat image) { image_ = std::move(image); }

    const std::optional<std::string>& getId() const { return id_; }
    void setId(std::string id) { id_ = std::move(id); }

    core::Timestamp getTimestamp() const { return timestamp_; }

    const std::optional<std::string>& getFilePath() const { return file_path_; }
    void setFilePath(std::string path) { file_path_ = std::move(path); }

    nlohmann::json& metadata() { return metadata_; }
    const nlohmann::json& metadata() const { return metadata_; }

    PhotoStatus getStatus() const { return status_; }
    const std::vector<CheckResult>& getResults() const { return results_; }

    /**
     * @brief Append a check result and recompute the status
     */
    void addResult(CheckResult result);

    /**
     * @brief Drop all results (status returns to PENDING)
     */
    void clearResults();

    /**
     * @brief True if there is at least one result and every result passed
     */
    bool isValid() const;

    /**
     * @brief Arithmetic mean of all check confidences (0 without results)
     */
    double getOverallConfidence() const;

    std::vector<CheckResult> getFailedResults() const;

    /**
     * @brief Messages of all failing checks joined with "; "
     * @return Empty string if nothing failed
     */
    std::string getFailureFeedback() const;

private:
    void updateStatus();

    cv::Mat image_;
    std::optional<std::string> id_;
    core::Timestamp timestamp_;
    PhotoStatus status_ = PhotoStatus::PENDING;
    std::vector<CheckResult> results_;
    std::optional<std::string> file_path_;
    nlohmann::json metadata_ = nlohmann::json::object();
};

} // namespace model
} // namespace passcheck

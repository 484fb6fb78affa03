#pragma once

#include "passcheck/model/PhotoRecord.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace passcheck {
namespace validation {

/**
 * @brief One row of a validation summary
 */
struct CheckSummary {
    std::string check_name;
    bool passed = false;
    double confidence = 0.0;
    std::string message;
};

/**
 * @brief Condensed outcome of a validated photo
 */
struct ValidationSummary {
    model::PhotoStatus status = model::PhotoStatus::PENDING;
    bool is_valid = false;
    double overall_confidence = 0.0;
    size_t total_checks = 0;
    size_t passed_checks = 0;
    size_t failed_checks = 0;
    std::string feedback;               ///< Failing messages joined with "; "
    std::vector<CheckSummary> results;

    static ValidationSummary fromRecord(const model::PhotoRecord& photo);

    nlohmann::json toJson() const;
    std::string toString() const;
};

/// Feedback shown when every check passed
extern const char* const kAllChecksPassedMessage;

/// ISO-8601 UTC timestamp, e.g. "2024-05-01T12:30:00.125Z"
std::string formatTimestamp(core::Timestamp timestamp);

/**
 * @brief Document handed to the persistence layer
 *
 * Contains id, timestamp, status, file path, metadata, overall confidence
 * and every check result. Image bytes are not included.
 */
nlohmann::json photoRecordToJson(const model::PhotoRecord& photo);

} // namespace validation
} // namespace passcheck

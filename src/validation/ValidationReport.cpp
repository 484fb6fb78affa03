#include "passcheck/validation/ValidationReport.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace passcheck {
namespace validation {

const char* const kAllChecksPassedMessage = "All checks passed. The photo meets the passport requirements";

ValidationSummary ValidationSummary::fromRecord(const model::PhotoRecord& photo) {
    ValidationSummary summary;
    summary.status = photo.getStatus();
    summary.is_valid = photo.isValid();
    summary.overall_confidence = photo.getOverallConfidence();
    summary.total_checks = photo.getResults().size();

    for (const auto& result : photo.getResults()) {
        if (result.isPassed()) {
            ++summary.passed_checks;
        }
        summary.results.push_back({result.getCheckName(), result.isPassed(),
                                   result.getConfidence(), result.getMessage()});
    }
    summary.failed_checks = summary.total_checks - summary.passed_checks;

    summary.feedback = photo.getFailureFeedback();
    if (summary.feedback.empty() && summary.is_valid) {
        summary.feedback = kAllChecksPassedMessage;
    }
    return summary;
}

nlohmann::json ValidationSummary::toJson() const {
    nlohmann::json rows = nlohmann::json::array();
    for (const auto& row : results) {
        rows.push_back({
            {"check", row.check_name},
            {"passed", row.passed},
            {"confidence", row.confidence},
            {"message", row.message}
        });
    }

    return {
        {"status", model::photoStatusToString(status)},
        {"is_valid", is_valid},
        {"overall_confidence", overall_confidence},
        {"total_checks", total_checks},
        {"passed_checks", passed_checks},
        {"failed_checks", failed_checks},
        {"feedback", feedback},
        {"results", std::move(rows)}
    };
}

std::string ValidationSummary::toString() const {
    std::ostringstream oss;
    oss << "Status: " << model::photoStatusToString(status)
        << " (" << passed_checks << "/" << total_checks << " checks passed, confidence "
        << std::fixed << std::setprecision(2) << overall_confidence << ")";
    if (!feedback.empty()) {
        oss << "\n" << feedback;
    }
    return oss.str();
}

std::string formatTimestamp(core::Timestamp timestamp) {
    const auto time_t_value = std::chrono::system_clock::to_time_t(timestamp);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        timestamp.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    gmtime_r(&time_t_value, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

nlohmann::json photoRecordToJson(const model::PhotoRecord& photo) {
    nlohmann::json results = nlohmann::json::array();
    for (const auto& result : photo.getResults()) {
        results.push_back(result.toJson());
    }

    nlohmann::json doc = {
        {"id", nullptr},
        {"timestamp", formatTimestamp(photo.getTimestamp())},
        {"status", model::photoStatusToString(photo.getStatus())},
        {"file_path", nullptr},
        {"metadata", photo.metadata()},
        {"is_valid", photo.isValid()},
        {"overall_confidence", photo.getOverallConfidence()},
        {"results", std::move(results)}
    };
    if (photo.getId()) {
        doc["id"] = *photo.getId();
    }
    if (photo.getFilePath()) {
        doc["file_path"] = *photo.getFilePath();
    }
    if (photo.getImage().data != nullptr) {
        doc["image_size"] = {photo.getImage().cols, photo.getImage().rows};
    }
    return doc;
}

} // namespace validation
} // namespace passcheck

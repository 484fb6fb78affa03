#include "passcheck/model/PhotoRecord.hpp"
#include "passcheck/core/exception.h"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <sstream>

namespace passcheck {
namespace model {

std::string photoStatusToString(PhotoStatus status) {
    switch (status) {
        case PhotoStatus::PENDING:  return "pending";
        case PhotoStatus::APPROVED: return "approved";
        case PhotoStatus::REJECTED: return "rejected";
        default:                    return "unknown";
    }
}

CheckResult::CheckResult(std::string check_name,
                         bool passed,
                         double confidence,
                         std::string message,
                         nlohmann::json details)
    : check_name_(std::move(check_name))
    , passed_(passed)
    , confidence_(confidence)
    , message_(std::move(message))
    , details_(std::move(details)) {
    if (!std::isfinite(confidence) || confidence < 0.0 || confidence > 1.0) {
        PASSCHECK_THROW(core::InvalidArgumentException,
                        "Confidence must be between 0.0 and 1.0 (got " + std::to_string(confidence) + ")");
    }
}

nlohmann::json CheckResult::toJson() const {
    return {
        {"check", check_name_},
        {"passed", passed_},
        {"confidence", confidence_},
        {"message", message_},
        {"details", details_}
    };
}

PhotoRecord::PhotoRecord() : timestamp_(core::Timestamp::clock::now()) {}

PhotoRecord::PhotoRecord(cv::Mat image, core::Timestamp timestamp)
    : image_(std::move(image)), timestamp_(timestamp) {}

void PhotoRecord::addResult(CheckResult result) {
    results_.push_back(std::move(result));
    updateStatus();
}

void PhotoRecord::clearResults() {
    results_.clear();
    updateStatus();
}

bool PhotoRecord::isValid() const {
    if (results_.empty()) {
        return false;
    }
    return std::all_of(results_.begin(), results_.end(),
                       [](const CheckResult& r) { return r.isPassed(); });
}

double PhotoRecord::getOverallConfidence() const {
    if (results_.empty()) {
        return 0.0;
    }
    double sum = std::accumulate(results_.begin(), results_.end(), 0.0,
        [](double acc, const CheckResult& r) { return acc + r.getConfidence(); });
    return sum / static_cast<double>(results_.size());
}

std::vector<CheckResult> PhotoRecord::getFailedResults() const {
    std::vector<CheckResult> failed;
    std::copy_if(results_.begin(), results_.end(), std::back_inserter(failed),
                 [](const CheckResult& r) { return !r.isPassed(); });
    return failed;
}

std::string PhotoRecord::getFailureFeedback() const {
    std::ostringstream oss;
    bool first = true;
    for (const auto& result : results_) {
        if (result.isPassed()) {
            continue;
        }
        if (!first) {
            oss << "; ";
        }
        oss << result.getMessage();
        first = false;
    }
    return oss.str();
}

void PhotoRecord::updateStatus() {
    if (results_.empty()) {
        status_ = PhotoStatus::PENDING;
    } else if (isValid()) {
        status_ = PhotoStatus::APPROVED;
    } else {
        status_ = PhotoStatus::REJECTED;
    }
}

} // namespace model
} // namespace passcheck

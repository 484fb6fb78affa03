#include "passcheck/validation/ValidationPipeline.hpp"
#include "passcheck/checks/BackgroundCheck.hpp"
#include "passcheck/checks/BrightnessCheck.hpp"
#include "passcheck/checks/ExpressionCheck.hpp"
#include "passcheck/checks/EyeVisibilityCheck.hpp"
#include "passcheck/checks/FacePositionCheck.hpp"
#include "passcheck/checks/HeadwearCheck.hpp"
#include "passcheck/checks/ReflectionCheck.hpp"
#include "passcheck/checks/ShadowCheck.hpp"
#include "passcheck/checks/SharpnessCheck.hpp"
#include "passcheck/core/exception.h"
#include "passcheck/core/Logger.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace passcheck {
namespace validation {

namespace {

const char* const kComponent = "ValidationPipeline";

std::string formatConfidence(double confidence) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << confidence;
    return oss.str();
}

} // namespace

std::vector<CheckPtr> createDefaultChecks(const checks::CheckConfig& config) {
    config.validate();
    return {
        std::make_shared<checks::BrightnessCheck>(config.brightness),
        std::make_shared<checks::SharpnessCheck>(config.sharpness),
        std::make_shared<checks::FacePositionCheck>(config.face_position),
        std::make_shared<checks::ExpressionCheck>(config.expression),
        std::make_shared<checks::EyeVisibilityCheck>(config.eye_visibility),
        std::make_shared<checks::ReflectionCheck>(config.reflection),
        std::make_shared<checks::ShadowCheck>(config.shadow),
        std::make_shared<checks::HeadwearCheck>(config.headwear),
        std::make_shared<checks::BackgroundCheck>(config.background)
    };
}

ValidationPipeline::ValidationPipeline(std::shared_ptr<face::LandmarkProvider> provider,
                                       const checks::CheckConfig& config)
    : ValidationPipeline(std::move(provider), createDefaultChecks(config)) {}

ValidationPipeline::ValidationPipeline(std::shared_ptr<face::LandmarkProvider> provider,
                                       std::vector<CheckPtr> checks)
    : provider_(std::move(provider)) {
    if (!provider_) {
        PASSCHECK_THROW(core::InvalidArgumentException, "Validation pipeline requires a landmark provider");
    }
    for (auto& check : checks) {
        addCheck(std::move(check));
    }
    PASSCHECK_LOG_INFO(kComponent) << "Initialized with " << checks_.size() << " checks";
}

void ValidationPipeline::addCheck(CheckPtr check) {
    if (!check) {
        PASSCHECK_THROW(core::InvalidArgumentException, "Cannot register a null check");
    }
    const std::string name = check->name();

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(checks_.begin(), checks_.end(),
                           [&name](const CheckPtr& c) { return c->name() == name; });
    if (it != checks_.end()) {
        *it = std::move(check);
        PASSCHECK_LOG_INFO(kComponent) << "Replaced check: " << name;
    } else {
        checks_.push_back(std::move(check));
        PASSCHECK_LOG_DEBUG(kComponent) << "Added check: " << name;
    }
}

bool ValidationPipeline::removeCheck(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(checks_.begin(), checks_.end(),
                           [&name](const CheckPtr& c) { return c->name() == name; });
    if (it == checks_.end()) {
        return false;
    }
    checks_.erase(it);
    PASSCHECK_LOG_INFO(kComponent) << "Removed check: " << name;
    return true;
}

std::vector<CheckPtr> ValidationPipeline::getChecks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return checks_;
}

std::vector<std::string> ValidationPipeline::getCheckNames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(checks_.size());
    for (const auto& check : checks_) {
        names.push_back(check->name());
    }
    return names;
}

void ValidationPipeline::addObserver(std::shared_ptr<ValidationObserver> observer) {
    if (!observer) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    observers_.push_back(std::move(observer));
}

void ValidationPipeline::removeObserver(const std::shared_ptr<ValidationObserver>& observer) {
    std::lock_guard<std::mutex> lock(mutex_);
    observers_.erase(std::remove(observers_.begin(), observers_.end(), observer), observers_.end());
}

model::PhotoRecord& ValidationPipeline::run(model::PhotoRecord& photo) {
    const cv::Mat& image = photo.getImage();
    if (image.data == nullptr || image.empty()) {
        PASSCHECK_THROW(core::InvalidInputException, "Cannot validate a photo without image data");
    }

    std::vector<CheckPtr> checks;
    std::vector<std::shared_ptr<ValidationObserver>> observers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        checks = checks_;
        observers = observers_;
    }

    PASSCHECK_LOG_INFO(kComponent) << "Starting photo validation (" << image.cols << "x" << image.rows
                                   << ", " << checks.size() << " checks)";
    photo.clearResults();

    notifyProgress(observers, "Detecting face...");
    const face::FaceDetectionResult detection = detectFace(image);
    if (!detection.face_found) {
        PASSCHECK_LOG_WARNING(kComponent) << "No face detected in photo";
    }

    const size_t total = checks.size();
    for (size_t i = 0; i < total; ++i) {
        const checks::PhotoCheck& check = *checks[i];
        notifyProgress(observers, "Running " + check.name() + "... (" + std::to_string(i + 1) + "/" +
                                  std::to_string(total) + ")");

        model::CheckResult result = runCheck(check, photo, detection);
        PASSCHECK_LOG_INFO(kComponent) << result.getCheckName() << ": "
                                       << (result.isPassed() ? "PASS" : "FAIL")
                                       << " (confidence: " << formatConfidence(result.getConfidence()) << ")";
        photo.addResult(result);
        notifyCheckCompleted(observers, result);
    }

    notifyComplete(observers, photo);

    PASSCHECK_LOG_INFO(kComponent) << "Validation complete. Status: "
                                   << model::photoStatusToString(photo.getStatus())
                                   << ", overall confidence: "
                                   << formatConfidence(photo.getOverallConfidence());
    return photo;
}

face::FaceDetectionResult ValidationPipeline::detectFace(const cv::Mat& image) const {
    // A provider failure is treated as an absent face; every check still reports
    try {
        return provider_->detect(image);
    } catch (const core::Exception& e) {
        PASSCHECK_LOG_ERROR(kComponent) << "Face detection failed: " << e.what();
    } catch (const cv::Exception& e) {
        PASSCHECK_LOG_ERROR(kComponent) << "OpenCV error in face detection: " << e.what();
    } catch (const std::exception& e) {
        PASSCHECK_LOG_ERROR(kComponent) << "Face detection failed: " << e.what();
    } catch (...) {
        PASSCHECK_LOG_ERROR(kComponent) << "Face detection failed: unknown exception";
    }
    return face::FaceDetectionResult::notFound();
}

model::CheckResult ValidationPipeline::runCheck(const checks::PhotoCheck& check,
                                                const model::PhotoRecord& photo,
                                                const face::FaceDetectionResult& detection) const {
    const std::string name = check.name();
    std::string reason;
    try {
        return check.evaluate(photo, detection);
    } catch (const core::Exception& e) {
        reason = e.getMessage();
        PASSCHECK_LOG_ERROR(kComponent) << "Error in " << name << ": " << e.what();
    } catch (const cv::Exception& e) {
        reason = e.err;
        PASSCHECK_LOG_ERROR(kComponent) << "OpenCV error in " << name << ": " << e.what();
    } catch (const std::exception& e) {
        reason = e.what();
        PASSCHECK_LOG_ERROR(kComponent) << "Error in " << name << ": " << e.what();
    } catch (...) {
        reason = "unknown exception";
        PASSCHECK_LOG_ERROR(kComponent) << "Unknown exception in " << name;
    }

    return model::CheckResult(name, false, 0.0, name + " could not be completed: " + reason,
                              {{"error", "check_exception"},
                               {"code", core::resultCodeToString(core::ResultCode::ERROR_CHECK_FAILURE)},
                               {"reason", reason}});
}

void ValidationPipeline::notifyProgress(const std::vector<std::shared_ptr<ValidationObserver>>& observers,
                                        const std::string& message) const {
    for (const auto& observer : observers) {
        try {
            observer->onProgress(message);
        } catch (const std::exception& e) {
            PASSCHECK_LOG_ERROR(kComponent) << "Error notifying observer: " << e.what();
        } catch (...) {
            PASSCHECK_LOG_ERROR(kComponent) << "Unknown exception notifying observer";
        }
    }
}

void ValidationPipeline::notifyCheckCompleted(const std::vector<std::shared_ptr<ValidationObserver>>& observers,
                                              const model::CheckResult& result) const {
    for (const auto& observer : observers) {
        try {
            observer->onCheckCompleted(result.getCheckName(), result);
        } catch (const std::exception& e) {
            PASSCHECK_LOG_ERROR(kComponent) << "Error notifying observer: " << e.what();
        } catch (...) {
            PASSCHECK_LOG_ERROR(kComponent) << "Unknown exception notifying observer";
        }
    }
}

void ValidationPipeline::notifyComplete(const std::vector<std::shared_ptr<ValidationObserver>>& observers,
                                        const model::PhotoRecord& photo) const {
    const bool passed = photo.isValid();
    const double confidence = photo.getOverallConfidence();
    for (const auto& observer : observers) {
        try {
            observer->onValidationComplete(photo, passed, confidence);
        } catch (const std::exception& e) {
            PASSCHECK_LOG_ERROR(kComponent) << "Error notifying observer: " << e.what();
        } catch (...) {
            PASSCHECK_LOG_ERROR(kComponent) << "Unknown exception notifying observer";
        }
    }
}

} // namespace validation
} // namespace passcheck

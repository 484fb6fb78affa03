#pragma once

#include "passcheck/model/PhotoRecord.hpp"
#include <functional>
#include <string>

namespace passcheck {
namespace validation {

/**
 * @brief Receives notifications from a validation run
 *
 * Called synchronously on the thread running the pipeline, in
 * registration order. Exceptions thrown by an observer are logged and do
 * not reach other observers or the run.
 */
class ValidationObserver {
public:
    virtual ~ValidationObserver() = default;

    /// Free-form progress text ("Detecting face...", "Running brightness... (1/9)")
    virtual void onProgress(const std::string& message) { (void)message; }

    virtual void onCheckCompleted(const std::string& check_name, const model::CheckResult& result) {
        (void)check_name;
        (void)result;
    }

    /**
     * @brief Final event of a run
     * @param passed Combined pass/fail of all checks
     * @param confidence Mean confidence of all checks
     */
    virtual void onValidationComplete(const model::PhotoRecord& photo, bool passed, double confidence) {
        (void)photo;
        (void)passed;
        (void)confidence;
    }
};

/**
 * @brief Observer forwarding events to optional callbacks
 */
class CallbackObserver : public ValidationObserver {
public:
    using ProgressCallback = std::function<void(const std::string& message)>;
    using CheckCallback = std::function<void(const std::string& check_name, const model::CheckResult& result)>;
    using CompleteCallback = std::function<void(const model::PhotoRecord& photo, bool passed, double confidence)>;

    CallbackObserver(ProgressCallback on_progress = nullptr,
                     CheckCallback on_check = nullptr,
                     CompleteCallback on_complete = nullptr)
        : on_progress_(std::move(on_progress))
        , on_check_(std::move(on_check))
        , on_complete_(std::move(on_complete)) {}

    void onProgress(const std::string& message) override {
        if (on_progress_) on_progress_(message);
    }

    void onCheckCompleted(const std::string& check_name, const model::CheckResult& result) override {
        if (on_check_) on_check_(check_name, result);
    }

    void onValidationComplete(const model::PhotoRecord& photo, bool passed, double confidence) override {
        if (on_complete_) on_complete_(photo, passed, confidence);
    }

private:
    ProgressCallback on_progress_;
    CheckCallback on_check_;
    CompleteCallback on_complete_;
};

} // namespace validation
} // namespace passcheck

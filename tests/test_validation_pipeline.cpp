/**
 * @file test_validation_pipeline.cpp
 * @brief Unit and integration tests for ValidationPipeline and result reporting
 *
 * Validates:
 * - Default check order and single face detection per run
 * - Isolation of failing checks, observers and landmark providers
 * - Observer event order
 * - Runtime registration of checks
 * - A synthetic compliant portrait is approved end to end
 * - JSON document and summary of a validated photo
 */

#include <gtest/gtest.h>
#include <passcheck/validation/ValidationPipeline.hpp>
#include <passcheck/validation/ValidationReport.hpp>
#include <passcheck/checks/BrightnessCheck.hpp>
#include <passcheck/core/exception.h>
#include "test_helpers.hpp"

#include <chrono>
#include <memory>
#include <regex>
#include <stdexcept>
#include <string>
#include <vector>

using namespace passcheck;
using namespace passcheck::validation;
using passcheck::testing::FakeLandmarkProvider;
using passcheck::testing::detectedFace;
using passcheck::testing::solidImage;

namespace {

const std::vector<std::string> kDefaultOrder = {
    "brightness", "sharpness", "face_position", "expression", "eye_visibility",
    "reflection", "shadow", "headwear", "background"
};

/**
 * @brief Check that always throws from evaluate()
 */
class ExplodingCheck : public checks::PhotoCheck {
public:
    ExplodingCheck() : PhotoCheck(0.5) {}

    model::CheckResult evaluate(const model::PhotoRecord&, const face::FaceDetectionResult&) const override {
        throw std::runtime_error("sensor glitch");
    }

    std::string name() const override { return "exploding"; }
    std::string description() const override { return "Always throws"; }
};

/**
 * @brief Check with a fixed outcome and a configurable name
 */
class FixedCheck : public checks::PhotoCheck {
public:
    FixedCheck(std::string name, bool passed, double confidence)
        : PhotoCheck(0.5), name_(std::move(name)), passed_(passed), confidence_(confidence) {}

    model::CheckResult evaluate(const model::PhotoRecord&, const face::FaceDetectionResult&) const override {
        return model::CheckResult(name_, passed_, confidence_, passed_ ? "ok" : name_ + " failed");
    }

    std::string name() const override { return name_; }
    std::string description() const override { return "Fixed outcome"; }

private:
    std::string name_;
    bool passed_;
    double confidence_;
};

class RecordingObserver : public ValidationObserver {
public:
    void onProgress(const std::string& message) override {
        events.push_back("progress:" + message);
    }

    void onCheckCompleted(const std::string& check_name, const model::CheckResult&) override {
        events.push_back("check:" + check_name);
    }

    void onValidationComplete(const model::PhotoRecord&, bool passed, double confidence) override {
        events.push_back("complete");
        final_passed = passed;
        final_confidence = confidence;
    }

    std::vector<std::string> events;
    bool final_passed = false;
    double final_confidence = -1.0;
};

class ThrowingObserver : public ValidationObserver {
public:
    void onProgress(const std::string&) override { throw std::runtime_error("observer failure"); }
    void onCheckCompleted(const std::string&, const model::CheckResult&) override {
        throw std::runtime_error("observer failure");
    }
};

/**
 * @brief Check and observer throwing a value not derived from std::exception
 */
class IntThrowingCheck : public checks::PhotoCheck {
public:
    IntThrowingCheck() : PhotoCheck(0.5) {}

    model::CheckResult evaluate(const model::PhotoRecord&, const face::FaceDetectionResult&) const override {
        throw 42;
    }

    std::string name() const override { return "int_thrower"; }
    std::string description() const override { return "Throws an int"; }
};

class IntThrowingObserver : public ValidationObserver {
public:
    void onProgress(const std::string&) override { throw 7; }
    void onCheckCompleted(const std::string&, const model::CheckResult&) override { throw 7; }
    void onValidationComplete(const model::PhotoRecord&, bool, double) override { throw 7; }
};

/**
 * @brief Landmark provider whose detection always fails with an OpenCV error
 */
class FailingLandmarkProvider : public face::LandmarkProvider {
public:
    face::FaceDetectionResult detect(const cv::Mat&) override {
        ++calls;
        throw cv::Exception(cv::Error::StsInternal, "cascade evaluation failed", "detect", __FILE__, __LINE__);
    }

    int calls = 0;
};

/**
 * @brief Portrait that satisfies every default check
 *
 * Light uniform background, skin-toned head with forehead visible and
 * fine vertical texture on the face for the sharpness check.
 */
cv::Mat compliantPortrait() {
    const cv::Scalar skin(120, 150, 200);
    const cv::Scalar texture(60, 80, 110);

    cv::Mat image = solidImage(230);
    image(cv::Rect(100, 80, 120, 195)).setTo(skin);
    for (int x = 102; x < 220; x += 4) {
        cv::line(image, cv::Point(x, 125), cv::Point(x, 274), texture, 1);
    }
    return image;
}

} // namespace

class ValidationPipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        provider_ = std::make_shared<FakeLandmarkProvider>();
        photo_ = model::PhotoRecord(solidImage(140));
    }

    std::shared_ptr<FakeLandmarkProvider> provider_;
    model::PhotoRecord photo_;
};

/**
 * Test 1: Default checks run in fixed order, face detection once
 */
TEST_F(ValidationPipelineTest, DefaultChecksRunInOrder) {
    ValidationPipeline pipeline(provider_);
    EXPECT_EQ(pipeline.getCheckNames(), kDefaultOrder);

    pipeline.run(photo_);

    ASSERT_EQ(photo_.getResults().size(), kDefaultOrder.size());
    for (size_t i = 0; i < kDefaultOrder.size(); ++i) {
        EXPECT_EQ(photo_.getResults()[i].getCheckName(), kDefaultOrder[i]);
    }
    EXPECT_EQ(provider_->getCallCount(), 1);
}

/**
 * Test 2: Without a face the photo is rejected
 */
TEST_F(ValidationPipelineTest, NoFaceRejectsPhoto) {
    ValidationPipeline pipeline(provider_);
    pipeline.run(photo_);

    EXPECT_EQ(photo_.getStatus(), model::PhotoStatus::REJECTED);
    EXPECT_FALSE(photo_.isValid());

    for (const auto& result : photo_.getResults()) {
        if (result.getCheckName() == "face_position" || result.getCheckName() == "background") {
            EXPECT_FALSE(result.isPassed());
            EXPECT_EQ(result.getConfidence(), 0.0);
        }
    }
}

/**
 * Test 3: A throwing check becomes a failed result, later checks still run
 */
TEST_F(ValidationPipelineTest, ThrowingCheckIsIsolated) {
    ValidationPipeline pipeline(provider_, std::vector<CheckPtr>{
        std::make_shared<checks::BrightnessCheck>(),
        std::make_shared<ExplodingCheck>(),
        std::make_shared<FixedCheck>("after", true, 0.9)
    });

    pipeline.run(photo_);

    const auto& results = photo_.getResults();
    ASSERT_EQ(results.size(), 3u);
    EXPECT_TRUE(results[0].isPassed());

    const auto& placeholder = results[1];
    EXPECT_EQ(placeholder.getCheckName(), "exploding");
    EXPECT_FALSE(placeholder.isPassed());
    EXPECT_EQ(placeholder.getConfidence(), 0.0);
    EXPECT_NE(placeholder.getMessage().find("sensor glitch"), std::string::npos);
    EXPECT_EQ(placeholder.getDetails()["error"], "check_exception");

    EXPECT_EQ(results[2].getCheckName(), "after");
    EXPECT_EQ(photo_.getStatus(), model::PhotoStatus::REJECTED);
}

TEST_F(ValidationPipelineTest, NonStandardExceptionIsIsolated) {
    ValidationPipeline pipeline(provider_, std::vector<CheckPtr>{
        std::make_shared<IntThrowingCheck>(),
        std::make_shared<FixedCheck>("after", true, 0.9)
    });

    ASSERT_NO_THROW(pipeline.run(photo_));

    const auto& results = photo_.getResults();
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].getCheckName(), "int_thrower");
    EXPECT_FALSE(results[0].isPassed());
    EXPECT_EQ(results[0].getConfidence(), 0.0);
    EXPECT_EQ(results[0].getDetails()["reason"], "unknown exception");
    EXPECT_EQ(results[0].getDetails()["code"], "ERROR_CHECK_FAILURE");
    EXPECT_TRUE(results[1].isPassed());
}

TEST_F(ValidationPipelineTest, PlaceholderCarriesCheckFailureCode) {
    ValidationPipeline pipeline(provider_, std::vector<CheckPtr>{std::make_shared<ExplodingCheck>()});
    pipeline.run(photo_);

    ASSERT_EQ(photo_.getResults().size(), 1u);
    const auto details = photo_.getResults()[0].getDetails();
    EXPECT_EQ(details["code"], core::resultCodeToString(core::ResultCode::ERROR_CHECK_FAILURE));
    EXPECT_EQ(details["reason"], "sensor glitch");
}

/**
 * Test 4: A failing landmark provider counts as no face, every check still reports
 */
TEST_F(ValidationPipelineTest, FailingProviderStillRecordsEveryCheck) {
    auto failing = std::make_shared<FailingLandmarkProvider>();
    ValidationPipeline pipeline(failing);
    auto observer = std::make_shared<RecordingObserver>();
    pipeline.addObserver(observer);

    ASSERT_NO_THROW(pipeline.run(photo_));

    EXPECT_EQ(failing->calls, 1);
    const auto& results = photo_.getResults();
    ASSERT_EQ(results.size(), kDefaultOrder.size());
    for (size_t i = 0; i < results.size(); ++i) {
        EXPECT_EQ(results[i].getCheckName(), kDefaultOrder[i]);
    }
    EXPECT_FALSE(results[2].isPassed());
    EXPECT_EQ(results[2].getConfidence(), 0.0);
    EXPECT_EQ(photo_.getStatus(), model::PhotoStatus::REJECTED);
    ASSERT_FALSE(observer->events.empty());
    EXPECT_EQ(observer->events.back(), "complete");
}

/**
 * Test 5: Observers see progress, each check and completion in order
 */
TEST_F(ValidationPipelineTest, ObserverReceivesEventsInOrder) {
    ValidationPipeline pipeline(provider_, std::vector<CheckPtr>{
        std::make_shared<FixedCheck>("first", true, 0.8),
        std::make_shared<FixedCheck>("second", false, 0.2)
    });
    auto observer = std::make_shared<RecordingObserver>();
    pipeline.addObserver(observer);

    pipeline.run(photo_);

    const std::vector<std::string> expected = {
        "progress:Detecting face...",
        "progress:Running first... (1/2)",
        "check:first",
        "progress:Running second... (2/2)",
        "check:second",
        "complete"
    };
    EXPECT_EQ(observer->events, expected);
    EXPECT_FALSE(observer->final_passed);
    EXPECT_NEAR(observer->final_confidence, 0.5, 1e-9);
}

TEST_F(ValidationPipelineTest, ThrowingObserverDoesNotStopValidation) {
    ValidationPipeline pipeline(provider_, std::vector<CheckPtr>{
        std::make_shared<FixedCheck>("only", true, 1.0)
    });
    auto recorder = std::make_shared<RecordingObserver>();
    pipeline.addObserver(std::make_shared<ThrowingObserver>());
    pipeline.addObserver(recorder);

    EXPECT_NO_THROW(pipeline.run(photo_));
    EXPECT_EQ(photo_.getStatus(), model::PhotoStatus::APPROVED);
    ASSERT_FALSE(recorder->events.empty());
    EXPECT_EQ(recorder->events.back(), "complete");
}

TEST_F(ValidationPipelineTest, NonStandardObserverExceptionIsIsolated) {
    ValidationPipeline pipeline(provider_, std::vector<CheckPtr>{
        std::make_shared<FixedCheck>("only", true, 1.0)
    });
    auto recorder = std::make_shared<RecordingObserver>();
    pipeline.addObserver(std::make_shared<IntThrowingObserver>());
    pipeline.addObserver(recorder);

    EXPECT_NO_THROW(pipeline.run(photo_));
    ASSERT_EQ(photo_.getResults().size(), 1u);
    EXPECT_EQ(recorder->events.back(), "complete");
    EXPECT_TRUE(recorder->final_passed);
}

TEST_F(ValidationPipelineTest, RemovedObserverIsNotNotified) {
    ValidationPipeline pipeline(provider_, std::vector<CheckPtr>{
        std::make_shared<FixedCheck>("only", true, 1.0)
    });
    auto observer = std::make_shared<RecordingObserver>();
    pipeline.addObserver(observer);
    pipeline.addObserver(nullptr);
    pipeline.removeObserver(observer);

    pipeline.run(photo_);
    EXPECT_TRUE(observer->events.empty());
}

TEST_F(ValidationPipelineTest, CallbackObserverForwardsEvents) {
    ValidationPipeline pipeline(provider_, std::vector<CheckPtr>{
        std::make_shared<FixedCheck>("only", true, 1.0)
    });

    int progress = 0;
    std::vector<std::string> completed;
    bool done = false;
    pipeline.addObserver(std::make_shared<CallbackObserver>(
        [&progress](const std::string&) { ++progress; },
        [&completed](const std::string& name, const model::CheckResult&) { completed.push_back(name); },
        [&done](const model::PhotoRecord&, bool passed, double) { done = passed; }));

    pipeline.run(photo_);
    EXPECT_EQ(progress, 2);
    EXPECT_EQ(completed, std::vector<std::string>{"only"});
    EXPECT_TRUE(done);
}

/**
 * Test 6: Runtime registration
 */
TEST_F(ValidationPipelineTest, AddAndRemoveChecks) {
    ValidationPipeline pipeline(provider_, std::vector<CheckPtr>{});
    EXPECT_TRUE(pipeline.getChecks().empty());

    pipeline.addCheck(std::make_shared<FixedCheck>("a", true, 1.0));
    pipeline.addCheck(std::make_shared<FixedCheck>("b", true, 1.0));
    EXPECT_EQ(pipeline.getCheckNames(), (std::vector<std::string>{"a", "b"}));

    EXPECT_TRUE(pipeline.removeCheck("a"));
    EXPECT_FALSE(pipeline.removeCheck("a"));
    EXPECT_EQ(pipeline.getCheckNames(), std::vector<std::string>{"b"});

    EXPECT_THROW(pipeline.addCheck(nullptr), core::InvalidArgumentException);
}

TEST_F(ValidationPipelineTest, AddingExistingNameReplacesInPlace) {
    ValidationPipeline pipeline(provider_, std::vector<CheckPtr>{
        std::make_shared<FixedCheck>("a", true, 1.0),
        std::make_shared<FixedCheck>("b", true, 1.0),
        std::make_shared<FixedCheck>("c", true, 1.0)
    });

    pipeline.addCheck(std::make_shared<FixedCheck>("b", false, 0.1));
    EXPECT_EQ(pipeline.getCheckNames(), (std::vector<std::string>{"a", "b", "c"}));

    pipeline.run(photo_);
    EXPECT_FALSE(photo_.getResults()[1].isPassed());
}

TEST_F(ValidationPipelineTest, GetChecksReturnsCopy) {
    ValidationPipeline pipeline(provider_);
    auto snapshot = pipeline.getChecks();
    snapshot.clear();
    EXPECT_EQ(pipeline.getChecks().size(), kDefaultOrder.size());
}

TEST_F(ValidationPipelineTest, ThresholdChangeAppliesToNextRun) {
    ValidationPipeline pipeline(provider_, std::vector<CheckPtr>{
        std::make_shared<checks::BrightnessCheck>()
    });

    // Mean 40 is 10 levels under the limit: confidence 0.7 * (2 / 3) + 0.3
    model::PhotoRecord dim(solidImage(40));
    pipeline.run(dim);
    EXPECT_TRUE(dim.isValid());

    for (const auto& check : pipeline.getChecks()) {
        check->setThreshold(0.9);
    }
    pipeline.run(dim);
    EXPECT_FALSE(dim.isValid());
    EXPECT_NEAR(dim.getResults()[0].getConfidence(), 0.7 * 2.0 / 3.0 + 0.3, 1e-9);
}

/**
 * Test 7: Input validation
 */
TEST_F(ValidationPipelineTest, EmptyImageThrowsBeforeDetection) {
    ValidationPipeline pipeline(provider_);
    model::PhotoRecord empty;

    EXPECT_THROW(pipeline.run(empty), core::InvalidInputException);
    EXPECT_EQ(provider_->getCallCount(), 0);
    EXPECT_TRUE(empty.getResults().empty());
}

TEST(ValidationPipelineConstructionTest, NullProviderThrows) {
    EXPECT_THROW(ValidationPipeline pipeline(nullptr), core::InvalidArgumentException);
}

TEST(ValidationPipelineConstructionTest, InvalidConfigThrows) {
    checks::CheckConfig config;
    config.shadow.threshold = 2.0;
    EXPECT_THROW(ValidationPipeline pipeline(std::make_shared<FakeLandmarkProvider>(), config),
                 core::InvalidArgumentException);
}

/**
 * Test 8: Re-running replaces the previous results and is deterministic
 */
TEST_F(ValidationPipelineTest, RerunReplacesResults) {
    provider_->setResult(detectedFace(cv::Rect(100, 125, 120, 150)));
    ValidationPipeline pipeline(provider_);

    pipeline.run(photo_);
    const nlohmann::json first = photoRecordToJson(photo_)["results"];

    pipeline.run(photo_);
    ASSERT_EQ(photo_.getResults().size(), kDefaultOrder.size());
    EXPECT_EQ(photoRecordToJson(photo_)["results"], first);
    EXPECT_EQ(provider_->getCallCount(), 2);
}

/**
 * Test 9: A compliant synthetic portrait passes every default check
 */
TEST_F(ValidationPipelineTest, CompliantPortraitIsApproved) {
    provider_->setResult(detectedFace(cv::Rect(100, 125, 120, 150)));
    ValidationPipeline pipeline(provider_);

    model::PhotoRecord photo(compliantPortrait());
    pipeline.run(photo);

    for (const auto& result : photo.getResults()) {
        EXPECT_TRUE(result.isPassed()) << result.getCheckName() << ": " << result.getMessage();
    }
    EXPECT_EQ(photo.getStatus(), model::PhotoStatus::APPROVED);
    EXPECT_GT(photo.getOverallConfidence(), 0.8);

    const auto summary = ValidationSummary::fromRecord(photo);
    EXPECT_TRUE(summary.is_valid);
    EXPECT_EQ(summary.passed_checks, kDefaultOrder.size());
    EXPECT_EQ(summary.failed_checks, 0u);
    EXPECT_EQ(summary.feedback, kAllChecksPassedMessage);
}

/**
 * Test 10: Result documents
 */
TEST_F(ValidationPipelineTest, SummaryCollectsFailures) {
    ValidationPipeline pipeline(provider_, std::vector<CheckPtr>{
        std::make_shared<FixedCheck>("a", true, 1.0),
        std::make_shared<FixedCheck>("b", false, 0.2),
        std::make_shared<FixedCheck>("c", false, 0.3)
    });
    pipeline.run(photo_);

    const auto summary = ValidationSummary::fromRecord(photo_);
    EXPECT_EQ(summary.status, model::PhotoStatus::REJECTED);
    EXPECT_EQ(summary.total_checks, 3u);
    EXPECT_EQ(summary.passed_checks, 1u);
    EXPECT_EQ(summary.failed_checks, 2u);
    EXPECT_EQ(summary.feedback, "b failed; c failed");
    ASSERT_EQ(summary.results.size(), 3u);
    EXPECT_EQ(summary.results[2].check_name, "c");

    const auto json = summary.toJson();
    EXPECT_EQ(json["status"], "rejected");
    EXPECT_EQ(json["failed_checks"], 2);
}

TEST_F(ValidationPipelineTest, PhotoRecordDocument) {
    ValidationPipeline pipeline(provider_, std::vector<CheckPtr>{
        std::make_shared<checks::BrightnessCheck>()
    });
    photo_.setFilePath("/tmp/portrait.jpg");
    photo_.metadata()["source"] = "unit-test";
    pipeline.run(photo_);

    const nlohmann::json doc = photoRecordToJson(photo_);
    EXPECT_TRUE(doc["id"].is_null());
    EXPECT_EQ(doc["status"], "approved");
    EXPECT_EQ(doc["file_path"], "/tmp/portrait.jpg");
    EXPECT_EQ(doc["metadata"]["source"], "unit-test");
    EXPECT_EQ(doc["image_size"], nlohmann::json({320, 400}));
    ASSERT_EQ(doc["results"].size(), 1u);
    EXPECT_EQ(doc["results"][0]["check"], "brightness");
    EXPECT_TRUE(doc["results"][0]["details"].contains("mean_brightness"));

    const std::regex iso(R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{3}Z)");
    EXPECT_TRUE(std::regex_match(doc["timestamp"].get<std::string>(), iso)) << doc["timestamp"];

    photo_.setId("photo-42");
    EXPECT_EQ(photoRecordToJson(photo_)["id"], "photo-42");
}

TEST(ValidationReportTest, FormatsEpochTimestamp) {
    const core::Timestamp epoch{};
    EXPECT_EQ(formatTimestamp(epoch + std::chrono::milliseconds(1500)), "1970-01-01T00:00:01.500Z");
}

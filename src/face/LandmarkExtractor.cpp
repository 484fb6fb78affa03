#include "passcheck/face/LandmarkExtractor.hpp"
#include "passcheck/core/exception.h"
#include "passcheck/core/Logger.hpp"
#include <opencv2/objdetect.hpp>
#include <opencv2/imgproc.hpp>
#include <opencv2/face.hpp>
#include <algorithm>
#include <mutex>
#include <sstream>
#include <vector>

namespace passcheck {
namespace face {

namespace {

const char* const kComponent = "LandmarkExtractor";

const std::vector<std::string> kDefaultCascadePaths = {
    "/usr/share/opencv4/haarcascades/haarcascade_frontalface_alt.xml",
    "/usr/local/share/opencv4/haarcascades/haarcascade_frontalface_alt.xml",
    "/usr/share/opencv/haarcascades/haarcascade_frontalface_alt.xml"
};

} // namespace

void LandmarkExtractionConfig::validate() const {
    if (model_path.empty()) {
        PASSCHECK_THROW(core::InvalidArgumentException, "Landmark model path must be set");
    }
    if (scale_factor <= 1.0) {
        PASSCHECK_THROW(core::InvalidArgumentException, "Cascade scale factor must be greater than 1.0");
    }
    if (min_neighbors < 0 || min_face_size <= 0) {
        PASSCHECK_THROW(core::InvalidArgumentException, "Cascade neighbour count and face size must be positive");
    }
    if (expected_points == 0) {
        PASSCHECK_THROW(core::InvalidArgumentException, "Expected landmark count must be positive");
    }
    if (bbox_padding < 0.0f || bbox_padding > 1.0f) {
        PASSCHECK_THROW(core::InvalidArgumentException, "Bounding box padding must be between 0.0 and 1.0");
    }
    if (indices.maxIndex() >= static_cast<int>(expected_points)) {
        PASSCHECK_THROW(core::InvalidArgumentException, "Landmark index map exceeds the model point count");
    }
}

std::string LandmarkExtractionConfig::toString() const {
    std::ostringstream oss;
    oss << "LandmarkExtractionConfig{cascade=" << (cascade_path.empty() ? "<default>" : cascade_path)
        << ", model=" << model_path
        << ", scale=" << scale_factor
        << ", neighbors=" << min_neighbors
        << ", min_face=" << min_face_size
        << ", points=" << expected_points
        << ", padding=" << bbox_padding << "}";
    return oss.str();
}

/**
 * @brief Private implementation class for LandmarkExtractor
 */
class LandmarkExtractor::Impl {
public:
    explicit Impl(const LandmarkExtractionConfig& config) : config_(config) {}

    void loadModels() {
        loadCascade();

        face_mark_ = cv::face::FacemarkLBF::create();
        try {
            face_mark_->loadModel(config_.model_path);
        } catch (const cv::Exception& e) {
            face_mark_.release();
            PASSCHECK_THROW_CODE(core::ModelException, core::ResultCode::ERROR_MODEL_LOAD,
                                 "Failed to load 68-point landmark model " + config_.model_path +
                                 ": " + e.what());
        }

        loaded_ = true;
    }

    FaceDetectionResult detect(const cv::Mat& image) {
        std::lock_guard<std::mutex> lock(mutex_);

        if (!loaded_) {
            PASSCHECK_THROW_CODE(core::ModelException, core::ResultCode::ERROR_NOT_INITIALIZED,
                                 "Landmark models have been released");
        }

        try {
            cv::Mat gray;
            if (image.channels() == 3) {
                cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
            } else if (image.channels() == 4) {
                cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
            } else {
                gray = image;
            }

            // Enhance contrast for the cascade only; landmarks are fitted on the raw gray image
            cv::Mat equalized;
            cv::equalizeHist(gray, equalized);

            std::vector<cv::Rect> faces;
            face_cascade_.detectMultiScale(equalized, faces, config_.scale_factor, config_.min_neighbors,
                                           0, cv::Size(config_.min_face_size, config_.min_face_size));
            if (faces.empty()) {
                PASSCHECK_LOG_DEBUG(kComponent) << "No face found by cascade";
                return FaceDetectionResult::notFound();
            }

            // Single-face photos: keep the largest candidate
            auto largest = std::max_element(faces.begin(), faces.end(),
                [](const cv::Rect& a, const cv::Rect& b) { return a.area() < b.area(); });
            std::vector<cv::Rect> selected = {*largest};

            std::vector<std::vector<cv::Point2f>> landmarks;
            bool fitted = face_mark_->fit(gray, selected, landmarks);
            if (!fitted || landmarks.empty() || landmarks[0].empty()) {
                PASSCHECK_LOG_DEBUG(kComponent) << "Landmark fitting failed for face at "
                                                << selected[0].x << "," << selected[0].y;
                return FaceDetectionResult::notFound();
            }

            const auto& points = landmarks[0];
            const cv::Size image_size = image.size();

            FaceDetectionResult result;
            result.face_found = true;
            result.confidence = landmarkConfidence(countResolvedPoints(points, image_size),
                                                   config_.expected_points);
            result.face_bbox = computeFaceBoundingBox(points, image_size, config_.bbox_padding);
            result.features = extractFeatures(points, config_.indices, image_size);

            PASSCHECK_LOG_DEBUG(kComponent) << "Detected face with " << points.size()
                                            << " landmarks, confidence " << result.confidence;
            return result;
        } catch (const cv::Exception& e) {
            PASSCHECK_LOG_ERROR(kComponent) << "OpenCV error during landmark detection: " << e.what();
            return FaceDetectionResult::notFound();
        }
    }

    void release() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!loaded_) {
            return;
        }
        face_mark_.release();
        face_cascade_ = cv::CascadeClassifier();
        loaded_ = false;
        PASSCHECK_LOG_INFO(kComponent) << "Landmark models released";
    }

    bool isLoaded() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return loaded_;
    }

    LandmarkExtractionConfig config_;

private:
    void loadCascade() {
        std::vector<std::string> candidates;
        if (!config_.cascade_path.empty()) {
            candidates.push_back(config_.cascade_path);
        } else {
            candidates = kDefaultCascadePaths;
        }

        for (const auto& path : candidates) {
            if (face_cascade_.load(path)) {
                PASSCHECK_LOG_INFO(kComponent) << "Loaded face cascade " << path;
                return;
            }
        }

        PASSCHECK_THROW_CODE(core::ModelException, core::ResultCode::ERROR_MODEL_LOAD,
                             "Failed to load face detection cascade");
    }

    cv::CascadeClassifier face_cascade_;
    cv::Ptr<cv::face::Facemark> face_mark_;
    bool loaded_ = false;
    mutable std::mutex mutex_;
};

LandmarkExtractor::LandmarkExtractor(const LandmarkExtractionConfig& config)
    : pImpl(std::make_unique<Impl>(config)) {
    config.validate();
    pImpl->loadModels();
    PASSCHECK_LOG_INFO(kComponent) << "Initialized: " << config.toString();
}

LandmarkExtractor::~LandmarkExtractor() {
    release();
}

FaceDetectionResult LandmarkExtractor::detect(const cv::Mat& image) {
    if (image.empty() || image.data == nullptr) {
        PASSCHECK_THROW(core::InvalidInputException, "Image for landmark detection is empty");
    }
    if (image.depth() != CV_8U || (image.channels() != 1 && image.channels() != 3 && image.channels() != 4)) {
        PASSCHECK_THROW(core::InvalidInputException, "Landmark detection requires an 8-bit gray, BGR or BGRA image");
    }
    return pImpl->detect(image);
}

void LandmarkExtractor::release() {
    pImpl->release();
}

bool LandmarkExtractor::isLoaded() const {
    return pImpl->isLoaded();
}

const LandmarkExtractionConfig& LandmarkExtractor::getConfig() const {
    return pImpl->config_;
}

} // namespace face
} // namespace passcheck

#pragma once

#include "passcheck/face/LandmarkProvider.hpp"
#include "passcheck/face/LandmarkGeometry.hpp"
#include <opencv2/core.hpp>
#include <memory>
#include <string>

namespace passcheck {
namespace face {

/**
 * @brief Landmark extraction configuration
 */
struct LandmarkExtractionConfig {
    // Model configuration
    std::string cascade_path;               ///< Haar cascade for face detection (empty = system default)
    std::string model_path;                 ///< FacemarkLBF model (lbfmodel.yaml)

    // Face detection parameters
    double scale_factor = 1.1;              ///< Cascade pyramid scale step
    int min_neighbors = 3;                  ///< Cascade neighbour threshold
    int min_face_size = 60;                 ///< Smallest face side in pixels

    // Landmark post-processing
    size_t expected_points = 68;            ///< Points the model is expected to resolve
    float bbox_padding = 0.1f;              ///< Bounding box padding on each side
    LandmarkIndexMap indices;               ///< Semantic indices for feature extraction

    /// Throws InvalidArgumentException for unusable values
    void validate() const;
    std::string toString() const;
};

/**
 * @brief OpenCV landmark provider (Haar cascade + 68-point FacemarkLBF)
 *
 * Both models are loaded once in the constructor and held until release()
 * or destruction. detect() picks the largest face in the image, fits the
 * landmark model to it and converts the points into a FaceDetectionResult.
 *
 * detect() is serialized internally; one instance may be shared between
 * threads.
 */
class LandmarkExtractor : public LandmarkProvider {
public:
    /**
     * @brief Load detection models
     * @throws core::ModelException if a model cannot be loaded
     * @throws core::InvalidArgumentException for an invalid configuration
     */
    explicit LandmarkExtractor(const LandmarkExtractionConfig& config);

    ~LandmarkExtractor() override;

    LandmarkExtractor(const LandmarkExtractor&) = delete;
    LandmarkExtractor& operator=(const LandmarkExtractor&) = delete;

    /**
     * @brief Detect face and landmarks
     * @throws core::InvalidInputException for an empty or non 8-bit image
     * @throws core::ModelException after release()
     */
    FaceDetectionResult detect(const cv::Mat& image) override;

    /**
     * @brief Release the native model resources (idempotent)
     */
    void release();

    bool isLoaded() const;

    const LandmarkExtractionConfig& getConfig() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace face
} // namespace passcheck

/**
 * @file basic_validation_example.cpp
 * @brief Validate a synthetic photo with the brightness and sharpness checks
 *
 * Runs without any face model: the landmark provider below never finds a
 * face, which both checks handle by analysing the whole image.
 */

#include <iostream>
#include <iomanip>
#include <opencv2/imgproc.hpp>
#include "passcheck/passcheck.h"

using namespace passcheck;
using namespace std;

namespace {

class NoFaceProvider : public face::LandmarkProvider {
public:
    face::FaceDetectionResult detect(const cv::Mat&) override {
        return face::FaceDetectionResult::notFound();
    }
};

cv::Mat makeTestPhoto(int brightness) {
    // Light background with a textured block so the Laplacian has something to measure
    cv::Mat image(480, 360, CV_8UC3, cv::Scalar(brightness, brightness, brightness));
    for (int y = 120; y < 360; y += 8) {
        cv::line(image, cv::Point(90, y), cv::Point(270, y), cv::Scalar(40, 40, 40), 2);
    }
    return image;
}

} // namespace

int main() {
    cout << "=== PASSCHECK BASIC VALIDATION ===" << endl;
    initialize(core::LogLevel::WARNING);

    vector<validation::CheckPtr> selected = {
        make_shared<checks::BrightnessCheck>(),
        make_shared<checks::SharpnessCheck>()
    };
    validation::ValidationPipeline pipeline(make_shared<NoFaceProvider>(), selected);

    pipeline.addObserver(make_shared<validation::CallbackObserver>(
        [](const string& message) { cout << "  " << message << endl; }));

    for (int brightness : {170, 15}) {
        cout << "\nPhoto with background level " << brightness << ":" << endl;

        model::PhotoRecord photo(makeTestPhoto(brightness));
        pipeline.run(photo);

        cout << fixed << setprecision(2);
        for (const auto& result : photo.getResults()) {
            cout << "  " << (result.isPassed() ? "PASS" : "FAIL") << " " << result.getCheckName()
                 << " (" << result.getConfidence() << "): " << result.getMessage() << endl;
        }

        const auto summary = validation::ValidationSummary::fromRecord(photo);
        cout << summary.toString() << endl;
    }

    shutdown();
    return 0;
}

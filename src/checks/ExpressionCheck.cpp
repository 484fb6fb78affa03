#include "passcheck/checks/ExpressionCheck.hpp"
#include <algorithm>
#include <cstdlib>

namespace passcheck {
namespace checks {

ExpressionCheck::ExpressionCheck(const ExpressionParams& params)
    : PhotoCheck(params.threshold), params_(params) {
    params_.validate();
}

std::string ExpressionCheck::description() const {
    return "Checks that the expression is neutral and the mouth is closed";
}

double ExpressionCheck::mouthAspectRatio(const face::LandmarkFeatures& features) {
    if (features.mouth_width == 0) {
        return 0.0;
    }
    const int height = std::abs(features.mouth_lower - features.mouth_upper);
    return static_cast<double>(height) / features.mouth_width;
}

double ExpressionCheck::featureScore(const face::LandmarkFeatures& features) const {
    double score = 1.0;
    if (features.eyebrow_raise > params_.max_eyebrow_raise) {
        score -= params_.eyebrow_penalty;
    }
    if (features.mouth_symmetry < params_.min_mouth_symmetry) {
        score -= params_.symmetry_penalty;
    }
    return std::clamp(score, 0.0, 1.0);
}

model::CheckResult ExpressionCheck::evaluate(const model::PhotoRecord& photo,
                                             const face::FaceDetectionResult& detection) const {
    requireImage(photo);

    if (!detection.face_found) {
        return noFaceResult("No face detected", "no_face_detected");
    }
    if (!detection.features) {
        return noFaceResult("No face detected: facial features could not be located", "no_landmarks");
    }

    const face::LandmarkFeatures& features = *detection.features;
    const double mouth_ratio = mouthAspectRatio(features);

    const bool mouth_closed = mouth_ratio <= params_.mouth_open_ratio;
    double mouth_score = 1.0;
    if (!mouth_closed) {
        mouth_score = std::max(0.0, 1.0 - (mouth_ratio - params_.mouth_open_ratio) / params_.mouth_falloff);
    }

    const double expression_score = featureScore(features);

    const double confidence = std::min(1.0, mouth_score * params_.mouth_weight +
                                            expression_score * params_.feature_weight);
    const bool passed = confidence >= getThreshold();

    std::string message;
    if (passed) {
        message = "Facial expression is neutral";
    } else if (!mouth_closed) {
        message = "Close your mouth for the passport photo";
    } else if (expression_score < params_.neutral_feature_score) {
        message = "Keep a neutral facial expression";
    } else {
        message = "Facial expression is not fully neutral";
    }

    nlohmann::json details = {
        {"mouth_aspect_ratio", mouth_ratio},
        {"mouth_closed", mouth_closed},
        {"mouth_score", mouth_score},
        {"expression_score", expression_score}
    };

    return makeResult(passed, confidence, message, std::move(details));
}

} // namespace checks
} // namespace passcheck

#include "passcheck/face/FaceTypes.hpp"

namespace passcheck {
namespace face {

nlohmann::json rectToJson(const cv::Rect& rect) {
    return nlohmann::json::array({rect.x, rect.y, rect.width, rect.height});
}

nlohmann::json LandmarkFeatures::toJson() const {
    return {
        {"left_eye_ratio", left_eye_ratio},
        {"right_eye_ratio", right_eye_ratio},
        {"left_eye_width", left_eye_width},
        {"right_eye_width", right_eye_width},
        {"left_eye_region", rectToJson(left_eye_region)},
        {"right_eye_region", rectToJson(right_eye_region)},
        {"mouth_upper", mouth_upper},
        {"mouth_lower", mouth_lower},
        {"mouth_width", mouth_width},
        {"eyebrow_raise", eyebrow_raise},
        {"mouth_symmetry", mouth_symmetry}
    };
}

FaceDetectionResult FaceDetectionResult::notFound() {
    FaceDetectionResult result;
    result.face_found = false;
    result.confidence = 0.0f;
    return result;
}

std::optional<cv::Point> FaceDetectionResult::getFaceCenter() const {
    if (!face_bbox) {
        return std::nullopt;
    }
    const cv::Rect& box = *face_bbox;
    return cv::Point(box.x + box.width / 2, box.y + box.height / 2);
}

std::optional<int> FaceDetectionResult::getFaceSize() const {
    if (!face_bbox) {
        return std::nullopt;
    }
    return face_bbox->width * face_bbox->height;
}

nlohmann::json FaceDetectionResult::toJson() const {
    nlohmann::json json = {
        {"face_found", face_found},
        {"confidence", confidence}
    };
    json["face_bbox"] = face_bbox ? rectToJson(*face_bbox) : nlohmann::json(nullptr);
    json["features"] = features ? features->toJson() : nlohmann::json(nullptr);
    return json;
}

} // namespace face
} // namespace passcheck

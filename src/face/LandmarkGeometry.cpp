#include "passcheck/face/LandmarkGeometry.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <initializer_list>

namespace passcheck {
namespace face {

namespace {

cv::Point toPixel(const cv::Point2f& p) {
    return cv::Point(static_cast<int>(p.x), static_cast<int>(p.y));
}

double safeRatio(int numerator, int denominator) {
    return denominator > 0 ? static_cast<double>(numerator) / denominator : 0.0;
}

cv::Rect eyeRegion(const cv::Point& left, const cv::Point& right,
                   const cv::Point& top, const cv::Point& bottom) {
    return cv::Rect(std::min(left.x, right.x),
                    std::min(top.y, bottom.y),
                    std::abs(right.x - left.x),
                    std::abs(bottom.y - top.y));
}

} // namespace

int LandmarkIndexMap::maxIndex() const {
    return std::max({left_eye_top, left_eye_bottom, left_eye_left, left_eye_right,
                     right_eye_top, right_eye_bottom, right_eye_left, right_eye_right,
                     mouth_top, mouth_bottom, mouth_left, mouth_right,
                     left_eyebrow_inner});
}

LandmarkIndexMap LandmarkIndexMap::ibug68() {
    return LandmarkIndexMap();
}

size_t countResolvedPoints(const std::vector<cv::Point2f>& points, const cv::Size& image_size) {
    return static_cast<size_t>(std::count_if(points.begin(), points.end(),
        [&image_size](const cv::Point2f& p) {
            return std::isfinite(p.x) && std::isfinite(p.y) &&
                   p.x >= 0.0f && p.y >= 0.0f &&
                   p.x < static_cast<float>(image_size.width) &&
                   p.y < static_cast<float>(image_size.height);
        }));
}

float landmarkConfidence(size_t resolved, size_t expected) {
    if (expected == 0) {
        return 0.0f;
    }
    return std::min(1.0f, static_cast<float>(resolved) / static_cast<float>(expected));
}

cv::Rect computeFaceBoundingBox(const std::vector<cv::Point2f>& points,
                                const cv::Size& image_size,
                                float padding) {
    if (points.empty()) {
        return cv::Rect();
    }

    float min_x = points.front().x, max_x = points.front().x;
    float min_y = points.front().y, max_y = points.front().y;
    for (const auto& p : points) {
        min_x = std::min(min_x, p.x);
        max_x = std::max(max_x, p.x);
        min_y = std::min(min_y, p.y);
        max_y = std::max(max_y, p.y);
    }

    int x_min = static_cast<int>(min_x);
    int x_max = static_cast<int>(max_x);
    int y_min = static_cast<int>(min_y);
    int y_max = static_cast<int>(max_y);

    int pad_x = static_cast<int>((x_max - x_min) * padding);
    int pad_y = static_cast<int>((y_max - y_min) * padding);

    x_min = std::max(0, x_min - pad_x);
    y_min = std::max(0, y_min - pad_y);
    x_max = std::min(image_size.width, x_max + pad_x);
    y_max = std::min(image_size.height, y_max + pad_y);

    return cv::Rect(x_min, y_min, std::max(0, x_max - x_min), std::max(0, y_max - y_min));
}

std::optional<LandmarkFeatures> extractFeatures(const std::vector<cv::Point2f>& points,
                                                const LandmarkIndexMap& indices,
                                                const cv::Size& image_size) {
    if (indices.maxIndex() >= static_cast<int>(points.size()) || image_size.area() <= 0) {
        return std::nullopt;
    }

    auto at = [&points](int index) { return toPixel(points[static_cast<size_t>(index)]); };

    const cv::Point left_top = at(indices.left_eye_top);
    const cv::Point left_bottom = at(indices.left_eye_bottom);
    const cv::Point left_left = at(indices.left_eye_left);
    const cv::Point left_right = at(indices.left_eye_right);

    const cv::Point right_top = at(indices.right_eye_top);
    const cv::Point right_bottom = at(indices.right_eye_bottom);
    const cv::Point right_left = at(indices.right_eye_left);
    const cv::Point right_right = at(indices.right_eye_right);

    const cv::Point mouth_top = at(indices.mouth_top);
    const cv::Point mouth_bottom = at(indices.mouth_bottom);
    const cv::Point mouth_left = at(indices.mouth_left);
    const cv::Point mouth_right = at(indices.mouth_right);

    const cv::Point eyebrow_inner = at(indices.left_eyebrow_inner);

    LandmarkFeatures features;

    const int left_height = std::abs(left_top.y - left_bottom.y);
    const int left_width = std::abs(left_right.x - left_left.x);
    const int right_height = std::abs(right_top.y - right_bottom.y);
    const int right_width = std::abs(right_right.x - right_left.x);

    features.left_eye_ratio = safeRatio(left_height, left_width);
    features.left_eye_width = left_width;
    features.right_eye_ratio = safeRatio(right_height, right_width);
    features.right_eye_width = right_width;

    features.left_eye_region = eyeRegion(left_left, left_right, left_top, left_bottom);
    features.right_eye_region = eyeRegion(right_left, right_right, right_top, right_bottom);

    features.mouth_upper = mouth_top.y;
    features.mouth_lower = mouth_bottom.y;
    features.mouth_width = std::abs(mouth_right.x - mouth_left.x);

    // Normalised by image height, not face height
    features.eyebrow_raise = static_cast<double>(std::abs(eyebrow_inner.y - left_top.y)) /
                             image_size.height;

    const double mouth_center_x = (mouth_left.x + mouth_right.x) / 2.0;
    const double image_center_x = image_size.width / 2.0;
    const double mouth_offset = std::abs(mouth_center_x - image_center_x) / image_size.width;
    features.mouth_symmetry = 1.0 - std::min(1.0, mouth_offset * 10.0);

    return features;
}

} // namespace face
} // namespace passcheck

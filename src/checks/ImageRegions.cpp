#include "passcheck/checks/ImageRegions.hpp"
#include <algorithm>

namespace passcheck {
namespace checks {

cv::Rect padFaceRegion(const cv::Rect& face, int padding, const cv::Size& image_size) {
    const int x = std::max(0, face.x - padding);
    const int y = std::max(0, face.y - padding);
    const int width = std::min(image_size.width - x, face.width + 2 * padding);
    const int height = std::min(image_size.height - y, face.height + 2 * padding);
    return clampToImage(cv::Rect(x, y, std::max(0, width), std::max(0, height)), image_size);
}

cv::Rect clampToImage(const cv::Rect& rect, const cv::Size& image_size) {
    return rect & cv::Rect(0, 0, image_size.width, image_size.height);
}

double channelValueStdDev(const cv::Mat& region) {
    if (region.empty()) {
        return 0.0;
    }
    // Flatten channels so every value contributes to one distribution
    cv::Mat values = region.isContinuous() ? region : region.clone();
    values = values.reshape(1, 1);
    cv::Scalar mean, stddev;
    cv::meanStdDev(values, mean, stddev);
    return stddev[0];
}

double nonZeroRatio(const cv::Mat& mask) {
    if (mask.empty()) {
        return 0.0;
    }
    return static_cast<double>(cv::countNonZero(mask)) / static_cast<double>(mask.total());
}

} // namespace checks
} // namespace passcheck

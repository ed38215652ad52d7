#include "contentcropper.h"
#include <opencv2/imgproc.hpp>
#include <stdexcept>
#include <string>
#include <vector>

cv::Rect ContentCropper::contentRect(const cv::Mat& image, int threshold)
{
    if (image.empty()) {
        return cv::Rect();
    }

    cv::Mat gray;
    if (image.channels() == 3) {
        cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
    } else if (image.channels() == 4) {
        cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
    } else if (image.channels() == 1) {
        gray = image;
    } else {
        throw std::invalid_argument("ContentCropper: unsupported channel count " +
                                    std::to_string(image.channels()));
    }

    cv::Mat mask;
    cv::threshold(gray, mask, threshold, 255, cv::THRESH_BINARY);

    std::vector<cv::Point> points;
    cv::findNonZero(mask, points);

    // Uniformly dark frame: keep it whole
    if (points.empty()) {
        return cv::Rect(0, 0, image.cols, image.rows);
    }

    return cv::boundingRect(points);
}

cv::Mat ContentCropper::cropBorders(const cv::Mat& image, int threshold)
{
    if (image.empty()) {
        return image;
    }

    return image(contentRect(image, threshold));
}

cv::Rect ContentCropper::marginRect(const cv::Size& size, const CropMargins& margins)
{
    if (margins.top < 0 || margins.bottom < 0 || margins.left < 0 || margins.right < 0) {
        throw std::invalid_argument("ContentCropper: crop margins must not be negative");
    }

    int width = size.width - margins.left - margins.right;
    int height = size.height - margins.top - margins.bottom;
    if (width <= 0 || height <= 0) {
        return cv::Rect();
    }

    return cv::Rect(margins.left, margins.top, width, height);
}

#include "ssimcalculator.h"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <stdexcept>
#include <string>

namespace {

cv::Mat boxFilter(const cv::Mat& input)
{
    cv::Mat output;
    cv::blur(input, output,
             cv::Size(SSIMCalculator::WINDOW_SIZE, SSIMCalculator::WINDOW_SIZE),
             cv::Point(-1, -1), cv::BORDER_REFLECT);
    return output;
}

} // namespace

double SSIMCalculator::calculateSSIM(const cv::Mat& img1, const cv::Mat& img2) const
{
    if (img1.empty() || img2.empty()) {
        throw std::invalid_argument("SSIMCalculator: empty image");
    }
    if (img1.size() != img2.size()) {
        throw std::invalid_argument("SSIMCalculator: images have different dimensions");
    }

    cv::Mat gray1 = convertToGrayscale(img1);
    cv::Mat gray2 = convertToGrayscale(img2);

    if (gray1.rows < WINDOW_SIZE || gray1.cols < WINDOW_SIZE) {
        return calculateGlobalSSIM(gray1, gray2);
    }
    return calculateWindowedSSIM(gray1, gray2);
}

cv::Mat SSIMCalculator::convertToGrayscale(const cv::Mat& image)
{
    cv::Mat gray;
    switch (image.channels()) {
        case 1:
            gray = image;
            break;
        case 3:
            cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
            break;
        case 4:
            cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
            break;
        default:
            throw std::invalid_argument("SSIMCalculator: unsupported number of channels: " +
                                        std::to_string(image.channels()));
    }
    return gray;
}

cv::Mat SSIMCalculator::downsampleToHeight(const cv::Mat& image, int maxHeight)
{
    if (image.rows <= maxHeight) {
        return image;
    }

    double scale = static_cast<double>(maxHeight) / image.rows;
    int width = std::max(1, static_cast<int>(image.cols * scale));

    cv::Mat resized;
    cv::resize(image, resized, cv::Size(width, maxHeight), 0, 0, cv::INTER_LINEAR);
    return resized;
}

double SSIMCalculator::calculateWindowedSSIM(const cv::Mat& gray1, const cv::Mat& gray2) const
{
    cv::Mat x, y;
    gray1.convertTo(x, CV_64F);
    gray2.convertTo(y, CV_64F);

    const double windowPixels = WINDOW_SIZE * WINDOW_SIZE;
    const double covNorm = windowPixels / (windowPixels - 1.0);

    cv::Mat ux = boxFilter(x);
    cv::Mat uy = boxFilter(y);
    cv::Mat uxx = boxFilter(x.mul(x));
    cv::Mat uyy = boxFilter(y.mul(y));
    cv::Mat uxy = boxFilter(x.mul(y));

    cv::Mat vx = covNorm * (uxx - ux.mul(ux));
    cv::Mat vy = covNorm * (uyy - uy.mul(uy));
    cv::Mat vxy = covNorm * (uxy - ux.mul(uy));

    cv::Mat a1 = 2.0 * ux.mul(uy) + C1;
    cv::Mat a2 = 2.0 * vxy + C2;
    cv::Mat b1 = ux.mul(ux) + uy.mul(uy) + C1;
    cv::Mat b2 = vx + vy + C2;

    cv::Mat ssimMap;
    cv::divide(a1.mul(a2), b1.mul(b2), ssimMap);

    // Average only where the window lies fully inside the image
    const int pad = (WINDOW_SIZE - 1) / 2;
    cv::Rect interior(pad, pad, ssimMap.cols - 2 * pad, ssimMap.rows - 2 * pad);
    return cv::mean(ssimMap(interior))[0];
}

double SSIMCalculator::calculateGlobalSSIM(const cv::Mat& gray1, const cv::Mat& gray2) const
{
    cv::Mat x, y;
    gray1.convertTo(x, CV_64F);
    gray2.convertTo(y, CV_64F);

    double mean1 = cv::mean(x)[0];
    double mean2 = cv::mean(y)[0];

    cv::Mat dx = x - mean1;
    cv::Mat dy = y - mean2;
    double n = static_cast<double>(x.total());
    double norm = n > 1.0 ? 1.0 / (n - 1.0) : 1.0;

    double var1 = cv::sum(dx.mul(dx))[0] * norm;
    double var2 = cv::sum(dy.mul(dy))[0] * norm;
    double covariance = cv::sum(dx.mul(dy))[0] * norm;

    double numerator = (2 * mean1 * mean2 + C1) * (2 * covariance + C2);
    double denominator = (mean1 * mean1 + mean2 * mean2 + C1) * (var1 + var2 + C2);
    return numerator / denominator;
}

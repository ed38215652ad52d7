#ifndef SSIMCALCULATOR_H
#define SSIMCALCULATOR_H

#include <opencv2/core.hpp>

/**
 * Structural similarity between two single-channel 8-bit images.
 *
 * Local statistics are gathered over a 7x7 uniform window with sample
 * covariance, and the similarity map is averaged over the region the window
 * fully covers. Images smaller than the window fall back to a single global
 * window over the whole image.
 */
class SSIMCalculator
{
public:
    static constexpr int WINDOW_SIZE = 7;

    /**
     * Calculate SSIM between two images of identical size
     * @param img1 First image (BGR, BGRA or grayscale)
     * @param img2 Second image, same size as the first
     * @return SSIM score in [-1, 1]
     */
    double calculateSSIM(const cv::Mat& img1, const cv::Mat& img2) const;

    /**
     * Convert image to grayscale using standard luminance formula
     * @param image Input color image
     * @return Grayscale image (the input itself when already single-channel)
     */
    static cv::Mat convertToGrayscale(const cv::Mat& image);

    /**
     * Shrink an image proportionally so it is at most maxHeight rows tall
     * @param image Input image
     * @param maxHeight Maximum height in pixels
     * @return Downsampled image, or the input when it is already small enough
     */
    static cv::Mat downsampleToHeight(const cv::Mat& image, int maxHeight);

private:
    double calculateWindowedSSIM(const cv::Mat& gray1, const cv::Mat& gray2) const;
    double calculateGlobalSSIM(const cv::Mat& gray1, const cv::Mat& gray2) const;

    // SSIM constants
    static constexpr double C1 = 6.5025;   // (0.01 * 255)^2
    static constexpr double C2 = 58.5225;  // (0.03 * 255)^2
};

#endif // SSIMCALCULATOR_H

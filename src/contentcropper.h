#ifndef CONTENTCROPPER_H
#define CONTENTCROPPER_H

#include <opencv2/core.hpp>

/**
 * Per-edge pixel margins removed from every frame before layout
 */
struct CropMargins {
    int top = 0;
    int bottom = 0;
    int left = 0;
    int right = 0;

    bool isNull() const { return top == 0 && bottom == 0 && left == 0 && right == 0; }
};

/**
 * Removes letterbox and pillarbox borders from decoded frames
 */
class ContentCropper
{
public:
    static constexpr int DEFAULT_THRESHOLD = 30;

    /**
     * Crop an image to the tightest rectangle holding every pixel brighter than the threshold
     * @param image Input BGR or grayscale image
     * @param threshold Luminance threshold, pixels strictly above it count as content
     * @return Cropped image sharing data with the input, or the input itself if no pixel
     *         exceeds the threshold
     */
    static cv::Mat cropBorders(const cv::Mat& image, int threshold = DEFAULT_THRESHOLD);

    /**
     * Bounding rectangle used by cropBorders()
     * @param image Input image
     * @param threshold Luminance threshold
     * @return Content rectangle, or the full image rectangle for a uniformly dark frame
     */
    static cv::Rect contentRect(const cv::Mat& image, int threshold = DEFAULT_THRESHOLD);

    /**
     * Rectangle left after removing fixed margins from a frame of the given size
     * @param size Frame size in pixels
     * @param margins Margins to remove
     * @return Remaining rectangle, empty if the margins consume a whole dimension
     */
    static cv::Rect marginRect(const cv::Size& size, const CropMargins& margins);
};

#endif // CONTENTCROPPER_H

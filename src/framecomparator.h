#ifndef FRAMECOMPARATOR_H
#define FRAMECOMPARATOR_H

#include <opencv2/core.hpp>
#include "ssimcalculator.h"

/**
 * Decides whether two frames are visually equivalent.
 *
 * Frames of different raw dimensions are never duplicates. Otherwise both are
 * reduced to luminance, shrunk to at most COMPARE_HEIGHT rows, and compared
 * with SSIM. A score strictly above the threshold means duplicate.
 */
class FrameComparator
{
public:
    static constexpr double DEFAULT_THRESHOLD = 0.95;
    static constexpr int COMPARE_HEIGHT = 480;

    /**
     * @param threshold Similarity threshold, must lie in (0, 1)
     */
    explicit FrameComparator(double threshold = DEFAULT_THRESHOLD);

    double threshold() const { return m_threshold; }

    /**
     * Check whether two frames should be treated as duplicates
     * @param frame1 First frame
     * @param frame2 Second frame
     * @return true if the frames have identical dimensions and their SSIM exceeds the threshold
     */
    bool isDuplicate(const cv::Mat& frame1, const cv::Mat& frame2) const;

    /**
     * SSIM score used by isDuplicate() for two frames of identical dimensions
     * @param frame1 First frame
     * @param frame2 Second frame
     * @return Similarity score
     */
    double similarity(const cv::Mat& frame1, const cv::Mat& frame2) const;

private:
    double m_threshold;
    SSIMCalculator m_ssimCalculator;
};

#endif // FRAMECOMPARATOR_H

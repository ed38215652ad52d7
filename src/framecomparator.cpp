#include "framecomparator.h"
#include <stdexcept>
#include <string>

FrameComparator::FrameComparator(double threshold)
    : m_threshold(threshold)
{
    if (!(threshold > 0.0 && threshold < 1.0)) {
        throw std::invalid_argument("FrameComparator: similarity threshold must lie in (0, 1), got " +
                                    std::to_string(threshold));
    }
}

bool FrameComparator::isDuplicate(const cv::Mat& frame1, const cv::Mat& frame2) const
{
    // Raw shape mismatch is never a duplicate; no metric is computed
    if (frame1.size() != frame2.size() || frame1.channels() != frame2.channels()) {
        return false;
    }

    return similarity(frame1, frame2) > m_threshold;
}

double FrameComparator::similarity(const cv::Mat& frame1, const cv::Mat& frame2) const
{
    cv::Mat gray1 = SSIMCalculator::downsampleToHeight(SSIMCalculator::convertToGrayscale(frame1),
                                                       COMPARE_HEIGHT);
    cv::Mat gray2 = SSIMCalculator::downsampleToHeight(SSIMCalculator::convertToGrayscale(frame2),
                                                       COMPARE_HEIGHT);

    return m_ssimCalculator.calculateSSIM(gray1, gray2);
}

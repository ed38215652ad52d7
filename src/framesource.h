#ifndef FRAMESOURCE_H
#define FRAMESOURCE_H

#include <opencv2/core.hpp>

/**
 * A decoded video frame and its position in source video time
 */
struct Frame {
    cv::Mat image;          // BGR24 pixels
    int sourceIndex = -1;   // Frame number in the source video
};

/**
 * Sequential, seekable iterator over decoded video frames
 */
class FrameSource
{
public:
    virtual ~FrameSource() = default;

    /**
     * Frames per second of the source
     */
    virtual double frameRate() const = 0;

    /**
     * Total number of frames, -1 if the container does not report it
     */
    virtual int frameCount() const = 0;

    /**
     * Position the source so the next frame read is at or after frameIndex
     * @param frameIndex Target frame number
     */
    virtual void seek(int frameIndex) = 0;

    /**
     * Decode the next frame
     * @param frame Output frame
     * @return false once the source is exhausted
     * @throws DecodeError if a frame cannot be decoded
     */
    virtual bool read(Frame& frame) = 0;
};

#endif // FRAMESOURCE_H

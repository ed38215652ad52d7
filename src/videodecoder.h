#ifndef VIDEODECODER_H
#define VIDEODECODER_H

#include <string>
#include <opencv2/core.hpp>
#include "framesource.h"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
#include <libavutil/imgutils.h>
#include <libswscale/swscale.h>
}

/**
 * FFmpeg-backed frame source for a local video file.
 *
 * The decoder owns every FFmpeg object it allocates and releases them in its
 * destructor, so a pass that ends early (including by exception) never leaks
 * the video handle.
 */
class VideoDecoder : public FrameSource
{
public:
    /**
     * Video information structure
     */
    struct VideoInfo {
        double duration = 0.0;     // Duration in seconds
        double frameRate = 0.0;    // Frame rate
        int frameCount = -1;       // Frame count, -1 if unknown
        int width = 0;             // Video width
        int height = 0;            // Video height
        std::string codecName;     // Codec name
    };

    /**
     * Open a video file and prepare its best video stream for decoding
     * @param videoPath Path to video file
     * @throws AcquisitionError if the file cannot be opened or has no decodable video stream
     */
    explicit VideoDecoder(const std::string& videoPath);
    ~VideoDecoder() override;

    VideoDecoder(const VideoDecoder&) = delete;
    VideoDecoder& operator=(const VideoDecoder&) = delete;

    const VideoInfo& getVideoInfo() const { return m_videoInfo; }
    const std::string& videoPath() const { return m_videoPath; }

    double frameRate() const override { return m_videoInfo.frameRate; }
    int frameCount() const override { return m_videoInfo.frameCount; }
    void seek(int frameIndex) override;
    bool read(Frame& frame) override;

private:
    void open();
    void close();

    /**
     * Pull the next decoded frame out of the codec, feeding packets as needed
     * @return false at end of stream
     */
    bool decodeNextFrame();

    /**
     * Source frame number of the frame currently held in m_frame
     */
    int frameIndexOf(const AVFrame* frame);

    /**
     * Convert the decoded frame to a BGR24 OpenCV Mat owning its data
     */
    cv::Mat convertFrameToMat(const AVFrame* frame);

    std::string describeError(int errorCode) const;

    std::string m_videoPath;

    // FFmpeg context objects
    AVFormatContext* m_formatContext;
    AVCodecContext* m_codecContext;
    const AVCodec* m_codec;
    SwsContext* m_swsContext;
    AVFrame* m_frame;
    AVPacket* m_packet;

    // Video stream info
    int m_videoStreamIndex;
    VideoInfo m_videoInfo;

    // Decoding position
    int m_nextSequentialIndex;
    int m_discardBelow;
    bool m_flushing;
    bool m_endOfStream;
};

#endif // VIDEODECODER_H

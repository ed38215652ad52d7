#include "videodecoder.h"
#include "pipelineerrors.h"
#include <QDebug>
#include <algorithm>
#include <cmath>

VideoDecoder::VideoDecoder(const std::string& videoPath)
    : m_videoPath(videoPath)
    , m_formatContext(nullptr)
    , m_codecContext(nullptr)
    , m_codec(nullptr)
    , m_swsContext(nullptr)
    , m_frame(nullptr)
    , m_packet(nullptr)
    , m_videoStreamIndex(-1)
    , m_nextSequentialIndex(0)
    , m_discardBelow(0)
    , m_flushing(false)
    , m_endOfStream(false)
{
    try {
        open();
    } catch (const std::exception&) {
        close();
        throw;
    }
}

VideoDecoder::~VideoDecoder()
{
    close();
}

void VideoDecoder::open()
{
    // Open input file
    int ret = avformat_open_input(&m_formatContext, m_videoPath.c_str(), nullptr, nullptr);
    if (ret < 0) {
        throw AcquisitionError("Could not open video file: " + m_videoPath + " (" + describeError(ret) + ")");
    }

    // Retrieve stream information
    ret = avformat_find_stream_info(m_formatContext, nullptr);
    if (ret < 0) {
        throw AcquisitionError("Could not find stream information in " + m_videoPath);
    }

    // Find video stream
    for (unsigned int i = 0; i < m_formatContext->nb_streams; i++) {
        if (m_formatContext->streams[i]->codecpar->codec_type == AVMEDIA_TYPE_VIDEO) {
            m_videoStreamIndex = static_cast<int>(i);
            break;
        }
    }

    if (m_videoStreamIndex == -1) {
        throw AcquisitionError("Could not find video stream in " + m_videoPath);
    }

    AVStream* stream = m_formatContext->streams[m_videoStreamIndex];
    AVCodecParameters* codecParams = stream->codecpar;

    // Find decoder
    m_codec = avcodec_find_decoder(codecParams->codec_id);
    if (!m_codec) {
        throw AcquisitionError("Unsupported codec in " + m_videoPath);
    }

    m_codecContext = avcodec_alloc_context3(m_codec);
    if (!m_codecContext) {
        throw AcquisitionError("Could not allocate codec context");
    }

    if (avcodec_parameters_to_context(m_codecContext, codecParams) < 0) {
        throw AcquisitionError("Could not copy codec parameters");
    }

    ret = avcodec_open2(m_codecContext, m_codec, nullptr);
    if (ret < 0) {
        throw AcquisitionError("Could not open decoder for " + m_videoPath + " (" + describeError(ret) + ")");
    }

    // Fill video info
    m_videoInfo.width = codecParams->width;
    m_videoInfo.height = codecParams->height;
    m_videoInfo.codecName = m_codec->name;

    if (m_formatContext->duration != AV_NOPTS_VALUE) {
        m_videoInfo.duration = static_cast<double>(m_formatContext->duration) / AV_TIME_BASE;
    }

    AVRational frameRate = stream->avg_frame_rate;
    if (frameRate.num == 0 || frameRate.den == 0) {
        frameRate = stream->r_frame_rate;
    }
    if (frameRate.num != 0 && frameRate.den != 0) {
        m_videoInfo.frameRate = av_q2d(frameRate);
    } else {
        m_videoInfo.frameRate = 25.0; // Default fallback
    }

    if (stream->nb_frames > 0) {
        m_videoInfo.frameCount = static_cast<int>(stream->nb_frames);
    } else if (m_videoInfo.duration > 0.0) {
        m_videoInfo.frameCount = static_cast<int>(std::llround(m_videoInfo.duration * m_videoInfo.frameRate));
    }

    m_frame = av_frame_alloc();
    m_packet = av_packet_alloc();
    if (!m_frame || !m_packet) {
        throw AcquisitionError("Could not allocate frame or packet");
    }
}

void VideoDecoder::close()
{
    if (m_frame) {
        av_frame_free(&m_frame);
    }
    if (m_packet) {
        av_packet_free(&m_packet);
    }
    if (m_swsContext) {
        sws_freeContext(m_swsContext);
        m_swsContext = nullptr;
    }
    if (m_codecContext) {
        avcodec_free_context(&m_codecContext);
    }
    if (m_formatContext) {
        avformat_close_input(&m_formatContext);
    }

    m_videoStreamIndex = -1;
}

void VideoDecoder::seek(int frameIndex)
{
    m_discardBelow = std::max(0, frameIndex);
    if (frameIndex <= 0) {
        return;
    }

    AVStream* stream = m_formatContext->streams[m_videoStreamIndex];
    int64_t streamStart = stream->start_time != AV_NOPTS_VALUE ? stream->start_time : 0;
    double seconds = frameIndex / m_videoInfo.frameRate;
    int64_t target = streamStart + static_cast<int64_t>(seconds / av_q2d(stream->time_base));

    int ret = av_seek_frame(m_formatContext, m_videoStreamIndex, target, AVSEEK_FLAG_BACKWARD);
    if (ret < 0) {
        // Fall back to decoding and discarding from the current position
        qWarning() << "VideoDecoder: seek to frame" << frameIndex << "failed ("
                   << describeError(ret).c_str() << "), decoding from current position";
        return;
    }

    avcodec_flush_buffers(m_codecContext);
    m_flushing = false;
    m_endOfStream = false;
    // Position after a timestamp seek is only known once a timestamped frame arrives
    m_nextSequentialIndex = -1;
}

bool VideoDecoder::read(Frame& frame)
{
    while (!m_endOfStream) {
        if (!decodeNextFrame()) {
            return false;
        }

        int index = frameIndexOf(m_frame);
        if (index < m_discardBelow) {
            av_frame_unref(m_frame);
            continue;
        }

        frame.image = convertFrameToMat(m_frame);
        frame.sourceIndex = index;
        av_frame_unref(m_frame);
        return true;
    }

    return false;
}

bool VideoDecoder::decodeNextFrame()
{
    while (true) {
        int ret = avcodec_receive_frame(m_codecContext, m_frame);
        if (ret >= 0) {
            return true;
        }
        if (ret == AVERROR_EOF) {
            m_endOfStream = true;
            return false;
        }
        if (ret != AVERROR(EAGAIN)) {
            throw DecodeError("Error decoding frame: " + describeError(ret), m_nextSequentialIndex);
        }
        if (m_flushing) {
            m_endOfStream = true;
            return false;
        }

        ret = av_read_frame(m_formatContext, m_packet);
        if (ret == AVERROR_EOF) {
            // Drain frames still buffered inside the decoder
            m_flushing = true;
            ret = avcodec_send_packet(m_codecContext, nullptr);
            if (ret < 0 && ret != AVERROR_EOF) {
                throw DecodeError("Error flushing decoder: " + describeError(ret), m_nextSequentialIndex);
            }
            continue;
        }
        if (ret < 0) {
            throw DecodeError("Error reading packet: " + describeError(ret), m_nextSequentialIndex);
        }

        if (m_packet->stream_index != m_videoStreamIndex) {
            av_packet_unref(m_packet);
            continue;
        }

        ret = avcodec_send_packet(m_codecContext, m_packet);
        av_packet_unref(m_packet);
        if (ret < 0) {
            throw DecodeError("Error sending packet to decoder: " + describeError(ret), m_nextSequentialIndex);
        }
    }
}

int VideoDecoder::frameIndexOf(const AVFrame* frame)
{
    int index;
    if (frame->best_effort_timestamp != AV_NOPTS_VALUE) {
        AVStream* stream = m_formatContext->streams[m_videoStreamIndex];
        int64_t streamStart = stream->start_time != AV_NOPTS_VALUE ? stream->start_time : 0;
        double seconds = (frame->best_effort_timestamp - streamStart) * av_q2d(stream->time_base);
        index = static_cast<int>(std::llround(seconds * m_videoInfo.frameRate));
        // Keep indices strictly increasing when timestamps round onto the same frame
        index = std::max(index, m_nextSequentialIndex);
    } else if (m_nextSequentialIndex >= 0) {
        index = m_nextSequentialIndex;
    } else {
        throw DecodeError("Frame without timestamp after seek in " + m_videoPath);
    }

    m_nextSequentialIndex = index + 1;
    return index;
}

cv::Mat VideoDecoder::convertFrameToMat(const AVFrame* frame)
{
    m_swsContext = sws_getCachedContext(
        m_swsContext,
        frame->width, frame->height, static_cast<AVPixelFormat>(frame->format),
        frame->width, frame->height, AV_PIX_FMT_BGR24,
        SWS_BILINEAR, nullptr, nullptr, nullptr
    );
    if (!m_swsContext) {
        throw DecodeError("Could not create colour conversion context", m_nextSequentialIndex - 1);
    }

    // Convert straight into Mat-owned storage so the result outlives the AVFrame
    cv::Mat mat(frame->height, frame->width, CV_8UC3);
    uint8_t* destination[4] = {mat.data, nullptr, nullptr, nullptr};
    int destinationStride[4] = {static_cast<int>(mat.step[0]), 0, 0, 0};

    sws_scale(m_swsContext, frame->data, frame->linesize, 0, frame->height,
              destination, destinationStride);

    return mat;
}

std::string VideoDecoder::describeError(int errorCode) const
{
    char buffer[AV_ERROR_MAX_STRING_SIZE] = {0};
    av_strerror(errorCode, buffer, sizeof(buffer));
    return std::string(buffer);
}

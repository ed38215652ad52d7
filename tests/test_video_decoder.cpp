// Unit tests for VideoDecoder against clips encoded on the fly with libavcodec.

#include "videodecoder.h"
#include "framededuplicator.h"
#include "pipelineerrors.h"
#include "fakes/TestImages.h"

#include <QDataStream>
#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

using namespace test_images;

namespace {

constexpr int kWidth = 160;
constexpr int kHeight = 120;
constexpr int kFps = 25;
constexpr int kFrameCount = 30;

// Writes BGR images to an AVI file as intra-only MPEG-4 at a fixed quantiser,
// so identical inputs decode to identical frames and every frame is a keyframe.
class ClipWriter
{
public:
  explicit ClipWriter(const std::string& path)
  {
    check(avformat_alloc_output_context2(&m_format, nullptr, "avi", path.c_str()), "allocate output");

    const AVCodec* codec = avcodec_find_encoder(AV_CODEC_ID_MPEG4);
    if (!codec) {
      throw std::runtime_error("MPEG-4 encoder unavailable");
    }
    m_stream = avformat_new_stream(m_format, nullptr);
    m_codec = avcodec_alloc_context3(codec);
    if (!m_stream || !m_codec) {
      throw std::runtime_error("allocate stream");
    }

    m_codec->width = kWidth;
    m_codec->height = kHeight;
    m_codec->pix_fmt = AV_PIX_FMT_YUV420P;
    m_codec->time_base = AVRational{1, kFps};
    m_codec->framerate = AVRational{kFps, 1};
    m_codec->gop_size = 1;
    m_codec->max_b_frames = 0;
    m_codec->flags |= AV_CODEC_FLAG_QSCALE;
    m_codec->global_quality = FF_QP2LAMBDA * 2;
    if (m_format->oformat->flags & AVFMT_GLOBALHEADER) {
      m_codec->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
    }
    check(avcodec_open2(m_codec, codec, nullptr), "open encoder");
    check(avcodec_parameters_from_context(m_stream->codecpar, m_codec), "copy parameters");
    m_stream->time_base = m_codec->time_base;

    check(avio_open(&m_format->pb, path.c_str(), AVIO_FLAG_WRITE), "open file");
    check(avformat_write_header(m_format, nullptr), "write header");

    m_frame = av_frame_alloc();
    m_packet = av_packet_alloc();
    if (!m_frame || !m_packet) {
      throw std::runtime_error("allocate frame");
    }
    m_frame->format = m_codec->pix_fmt;
    m_frame->width = kWidth;
    m_frame->height = kHeight;
    check(av_frame_get_buffer(m_frame, 0), "allocate frame buffer");

    m_sws = sws_getContext(kWidth, kHeight, AV_PIX_FMT_BGR24, kWidth, kHeight, AV_PIX_FMT_YUV420P,
                          SWS_BILINEAR, nullptr, nullptr, nullptr);
    if (!m_sws) {
      throw std::runtime_error("create colour conversion");
    }
  }

  ~ClipWriter()
  {
    sws_freeContext(m_sws);
    av_packet_free(&m_packet);
    av_frame_free(&m_frame);
    avcodec_free_context(&m_codec);
    if (m_format) {
      if (m_format->pb) {
        avio_closep(&m_format->pb);
      }
      avformat_free_context(m_format);
    }
  }

  ClipWriter(const ClipWriter&) = delete;
  ClipWriter& operator=(const ClipWriter&) = delete;

  void write(const cv::Mat& image)
  {
    check(av_frame_make_writable(m_frame), "make frame writable");
    const uint8_t* source[1] = {image.data};
    int sourceStride[1] = {static_cast<int>(image.step[0])};
    sws_scale(m_sws, source, sourceStride, 0, kHeight, m_frame->data, m_frame->linesize);
    m_frame->pts = m_nextPts++;
    m_frame->quality = m_codec->global_quality;
    encode(m_frame);
  }

  void finish()
  {
    encode(nullptr);
    check(av_write_trailer(m_format), "write trailer");
  }

private:
  void encode(AVFrame* frame)
  {
    check(avcodec_send_frame(m_codec, frame), "send frame");
    while (true) {
      int ret = avcodec_receive_packet(m_codec, m_packet);
      if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) {
        return;
      }
      check(ret, "receive packet");
      av_packet_rescale_ts(m_packet, m_codec->time_base, m_stream->time_base);
      m_packet->stream_index = m_stream->index;
      check(av_interleaved_write_frame(m_format, m_packet), "write packet");
    }
  }

  static void check(int ret, const char* what)
  {
    if (ret < 0) {
      throw std::runtime_error(std::string("ClipWriter: ") + what + " failed");
    }
  }

  AVFormatContext* m_format = nullptr;
  AVStream* m_stream = nullptr;
  AVCodecContext* m_codec = nullptr;
  AVFrame* m_frame = nullptr;
  AVPacket* m_packet = nullptr;
  SwsContext* m_sws = nullptr;
  int64_t m_nextPts = 0;
};

// Three scenes: frames 0-9, 10-19 and 20-29.
std::string writeThreeSceneClip(const QTemporaryDir& dir)
{
  std::string path = QDir(dir.path()).filePath("scenes.avi").toStdString();
  cv::Mat scenes[3] = {noise(kWidth, kHeight, 11), noise(kWidth, kHeight, 22), noise(kWidth, kHeight, 33)};

  ClipWriter writer(path);
  for (int i = 0; i < kFrameCount; ++i) {
    writer.write(scenes[i / 10]);
  }
  writer.finish();
  return path;
}

// One second of silent 8 kHz mono PCM.
QString writeSilentWav(const QTemporaryDir& dir)
{
  const quint32 sampleRate = 8000;
  const quint32 dataSize = sampleRate * 2;

  QString path = QDir(dir.path()).filePath("silence.wav");
  QFile file(path);
  if (!file.open(QIODevice::WriteOnly)) {
    throw std::runtime_error("cannot create " + path.toStdString());
  }
  QDataStream out(&file);
  out.setByteOrder(QDataStream::LittleEndian);
  out.writeRawData("RIFF", 4);
  out << quint32(36 + dataSize);
  out.writeRawData("WAVEfmt ", 8);
  out << quint32(16) << quint16(1) << quint16(1) << sampleRate << quint32(sampleRate * 2)
      << quint16(2) << quint16(16);
  out.writeRawData("data", 4);
  out << dataSize;
  QByteArray silence(static_cast<int>(dataSize), '\0');
  out.writeRawData(silence.constData(), silence.size());
  return path;
}

std::vector<int> keptSources(FrameDeduplicator& deduplicator, VideoDecoder& decoder,
                             const QString& outputDir)
{
  std::vector<int> sources;
  QObject::connect(&deduplicator, &FrameDeduplicator::frameKept,
                   [&sources](int, int sourceIndex) { sources.push_back(sourceIndex); });
  deduplicator.run(decoder, outputDir);
  return sources;
}

class VideoDecoderTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    ASSERT_TRUE(m_dir.isValid());
    ASSERT_NO_THROW(m_clip = writeThreeSceneClip(m_dir));
  }

  QTemporaryDir m_dir;
  std::string m_clip;
};

} // namespace

TEST_F(VideoDecoderTest, ReportsStreamPropertiesAndContiguousIndices)
{
  VideoDecoder decoder(m_clip);

  EXPECT_NEAR(decoder.frameRate(), kFps, 1e-6);
  EXPECT_EQ(decoder.frameCount(), kFrameCount);
  EXPECT_EQ(decoder.getVideoInfo().width, kWidth);
  EXPECT_EQ(decoder.getVideoInfo().height, kHeight);

  std::vector<int> indices;
  Frame frame;
  while (decoder.read(frame)) {
    EXPECT_EQ(frame.image.type(), CV_8UC3);
    EXPECT_EQ(frame.image.cols, kWidth);
    EXPECT_EQ(frame.image.rows, kHeight);
    indices.push_back(frame.sourceIndex);
  }

  ASSERT_EQ(indices.size(), static_cast<size_t>(kFrameCount));
  for (int i = 0; i < kFrameCount; ++i) {
    EXPECT_EQ(indices[i], i);
  }
  EXPECT_FALSE(decoder.read(frame));
}

TEST_F(VideoDecoderTest, SeekStartsAtRequestedFrame)
{
  VideoDecoder decoder(m_clip);
  Frame frame;

  decoder.seek(12);
  ASSERT_TRUE(decoder.read(frame));
  EXPECT_EQ(frame.sourceIndex, 12);
  ASSERT_TRUE(decoder.read(frame));
  EXPECT_EQ(frame.sourceIndex, 13);

  // Seeking backwards after reading restarts from the earlier frame
  for (int i = 0; i < 10; ++i) {
    ASSERT_TRUE(decoder.read(frame));
  }
  decoder.seek(5);
  ASSERT_TRUE(decoder.read(frame));
  EXPECT_EQ(frame.sourceIndex, 5);
}

TEST_F(VideoDecoderTest, FramesOfOneSceneDecodeIdentically)
{
  VideoDecoder decoder(m_clip);
  std::vector<cv::Mat> images;
  Frame frame;
  while (decoder.read(frame)) {
    images.push_back(frame.image);
  }
  ASSERT_EQ(images.size(), static_cast<size_t>(kFrameCount));

  EXPECT_TRUE(sameImage(images[0], images[9]));
  EXPECT_TRUE(sameImage(images[10], images[19]));
  EXPECT_FALSE(sameImage(images[9], images[10]));
}

TEST_F(VideoDecoderTest, DeduplicatorKeepsSceneChanges)
{
  VideoDecoder decoder(m_clip);
  FrameDeduplicator deduplicator(DedupConfig{});
  QString outputDir = QDir(m_dir.path()).filePath("frames");

  std::vector<int> sources = keptSources(deduplicator, decoder, outputDir);

  EXPECT_EQ(sources, (std::vector<int>{0, 10, 20}));
  EXPECT_EQ(QDir(outputDir).entryList(QStringList() << "m_frame*.png", QDir::Files).size(), 3);
}

TEST_F(VideoDecoderTest, DeduplicatorSeeksToStartTime)
{
  VideoDecoder decoder(m_clip);
  DedupConfig config;
  config.startTime = 0.5;   // frame 12
  FrameDeduplicator deduplicator(config);

  std::vector<int> sources = keptSources(deduplicator, decoder, QDir(m_dir.path()).filePath("frames"));

  EXPECT_EQ(sources, (std::vector<int>{12, 20}));
}

TEST_F(VideoDecoderTest, PipelinedPassMatchesSequentialPass)
{
  VideoDecoder decoder(m_clip);
  DedupConfig config;
  config.pipelined = true;
  config.queueCapacity = 2;
  FrameDeduplicator deduplicator(config);

  std::vector<int> sources = keptSources(deduplicator, decoder, QDir(m_dir.path()).filePath("frames"));

  EXPECT_EQ(sources, (std::vector<int>{0, 10, 20}));
}

TEST(VideoDecoderOpenTest, MissingFileIsAcquisitionError)
{
  QTemporaryDir dir;
  ASSERT_TRUE(dir.isValid());
  std::string path = QDir(dir.path()).filePath("absent.avi").toStdString();

  EXPECT_THROW(VideoDecoder decoder(path), AcquisitionError);
}

TEST(VideoDecoderOpenTest, AudioOnlyFileIsAcquisitionError)
{
  QTemporaryDir dir;
  ASSERT_TRUE(dir.isValid());
  QString path;
  ASSERT_NO_THROW(path = writeSilentWav(dir));

  EXPECT_THROW(VideoDecoder decoder(path.toStdString()), AcquisitionError);
}

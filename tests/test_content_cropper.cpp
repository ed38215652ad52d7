// Unit tests for ContentCropper: border removal and fixed crop margins.

#include "contentcropper.h"
#include "fakes/TestImages.h"

#include <gtest/gtest.h>
#include <stdexcept>

using namespace test_images;

TEST(ContentCropperTest, RemovesLetterboxBorders)
{
  cv::Rect content(20, 10, 40, 30);
  cv::Mat frame = letterboxed(100, 80, content, 7);

  cv::Mat cropped = ContentCropper::cropBorders(frame);

  EXPECT_EQ(ContentCropper::contentRect(frame), content);
  EXPECT_EQ(cropped.cols, content.width);
  EXPECT_EQ(cropped.rows, content.height);
  EXPECT_TRUE(sameImage(cropped, frame(content)));
}

TEST(ContentCropperTest, UniformlyDarkFrameIsReturnedWhole)
{
  cv::Mat frame = solid(64, 48, cv::Scalar::all(12));

  cv::Mat cropped = ContentCropper::cropBorders(frame);

  EXPECT_EQ(cropped.size(), frame.size());
  EXPECT_FALSE(cropped.empty());
  EXPECT_TRUE(sameImage(cropped, frame));
}

TEST(ContentCropperTest, ThresholdIsStrict)
{
  // A pixel exactly at the threshold is not content
  cv::Mat frame = solid(50, 50, cv::Scalar::all(0));
  frame.at<cv::Vec3b>(5, 5) = cv::Vec3b(30, 30, 30);
  frame.at<cv::Vec3b>(20, 30) = cv::Vec3b(31, 31, 31);

  cv::Rect rect = ContentCropper::contentRect(frame, 30);

  EXPECT_EQ(rect, cv::Rect(30, 20, 1, 1));
}

TEST(ContentCropperTest, CroppingIsIdempotent)
{
  for (uint64_t seed = 1; seed <= 5; ++seed) {
    cv::Rect content(static_cast<int>(seed * 3), static_cast<int>(seed * 2), 30, 25);
    cv::Mat frame = letterboxed(90, 70, content, seed);

    cv::Mat once = ContentCropper::cropBorders(frame);
    cv::Mat twice = ContentCropper::cropBorders(once);

    EXPECT_LE(once.cols, frame.cols);
    EXPECT_LE(once.rows, frame.rows);
    EXPECT_TRUE(sameImage(once, twice)) << "seed " << seed;
  }
}

TEST(ContentCropperTest, AcceptsGrayscaleAndBgra)
{
  cv::Mat gray(40, 60, CV_8UC1, cv::Scalar(0));
  gray(cv::Rect(10, 5, 20, 10)).setTo(cv::Scalar(255));
  EXPECT_EQ(ContentCropper::contentRect(gray), cv::Rect(10, 5, 20, 10));

  cv::Mat bgra(40, 60, CV_8UC4, cv::Scalar(0, 0, 0, 255));
  bgra(cv::Rect(1, 2, 3, 4)).setTo(cv::Scalar(255, 255, 255, 255));
  EXPECT_EQ(ContentCropper::contentRect(bgra), cv::Rect(1, 2, 3, 4));
}

TEST(ContentCropperTest, RejectsUnsupportedChannelCount)
{
  cv::Mat twoChannel(10, 10, CV_8UC2, cv::Scalar::all(100));
  EXPECT_THROW(ContentCropper::contentRect(twoChannel), std::invalid_argument);
}

TEST(ContentCropperTest, MarginRectRemovesEachEdge)
{
  CropMargins margins;
  margins.top = 5;
  margins.bottom = 10;
  margins.left = 3;
  margins.right = 7;

  cv::Rect rect = ContentCropper::marginRect(cv::Size(100, 50), margins);

  EXPECT_EQ(rect, cv::Rect(3, 5, 90, 35));
}

TEST(ContentCropperTest, MarginRectIsEmptyWhenMarginsConsumeFrame)
{
  CropMargins margins;
  margins.left = 60;
  margins.right = 40;

  EXPECT_TRUE(ContentCropper::marginRect(cv::Size(100, 50), margins).empty());
}

TEST(ContentCropperTest, MarginRectRejectsNegativeMargins)
{
  CropMargins margins;
  margins.bottom = -1;

  EXPECT_THROW(ContentCropper::marginRect(cv::Size(100, 50), margins), std::invalid_argument);
}

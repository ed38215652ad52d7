// Unit tests for ConfigManager: defaults, INI round-trip and validation.

#include "configmanager.h"

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include <gtest/gtest.h>
#include <stdexcept>

namespace {

class ConfigManagerTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    ASSERT_TRUE(m_dir.isValid());
    m_iniPath = QDir(m_dir.path()).filePath("framescraper.ini");
  }

  void writeIni(const QByteArray& content)
  {
    QFile file(m_iniPath);
    ASSERT_TRUE(file.open(QIODevice::WriteOnly | QIODevice::Text));
    file.write(content);
  }

  QTemporaryDir m_dir;
  QString m_iniPath;
};

} // namespace

TEST_F(ConfigManagerTest, MissingFileGivesDefaults)
{
  ConfigManager manager(m_iniPath);
  AppConfig config = manager.loadConfig();

  EXPECT_EQ(config.outputDirectory, QString("frames"));
  EXPECT_EQ(config.pdfPath, QString("output.pdf"));
  EXPECT_DOUBLE_EQ(config.similarityThreshold, 0.95);
  EXPECT_DOUBLE_EQ(config.sampleInterval, 1.5);
  EXPECT_LT(config.startTime, 0.0);
  EXPECT_LT(config.endTime, 0.0);
  EXPECT_EQ(config.orientation, PageOrientation::Portrait);
  EXPECT_TRUE(config.pageBreaks.empty());
  EXPECT_TRUE(config.cropMargins.isNull());
  EXPECT_FALSE(config.pipelined);
  EXPECT_EQ(config.queueCapacity, 8);
  EXPECT_TRUE(ConfigManager::validate(config).isEmpty());
}

TEST_F(ConfigManagerTest, SavedConfigLoadsBack)
{
  AppConfig saved;
  saved.outputDirectory = "/tmp/lecture";
  saved.pdfPath = "/tmp/lecture.pdf";
  saved.similarityThreshold = 0.9;
  saved.sampleInterval = 0.0;
  saved.startTime = 12.5;
  saved.endTime = 90.0;
  saved.orientation = PageOrientation::Landscape;
  saved.pageBreaks = {4, 9, 15};
  saved.cropMargins.top = 8;
  saved.cropMargins.bottom = 6;
  saved.cropMargins.left = 2;
  saved.cropMargins.right = 1;
  saved.pipelined = true;
  saved.queueCapacity = 3;

  {
    ConfigManager writer(m_iniPath);
    writer.saveConfig(saved);
  }

  ConfigManager reader(m_iniPath);
  AppConfig loaded = reader.loadConfig();

  EXPECT_EQ(loaded.outputDirectory, saved.outputDirectory);
  EXPECT_EQ(loaded.pdfPath, saved.pdfPath);
  EXPECT_DOUBLE_EQ(loaded.similarityThreshold, 0.9);
  EXPECT_DOUBLE_EQ(loaded.sampleInterval, 0.0);
  EXPECT_DOUBLE_EQ(loaded.startTime, 12.5);
  EXPECT_DOUBLE_EQ(loaded.endTime, 90.0);
  EXPECT_EQ(loaded.orientation, PageOrientation::Landscape);
  EXPECT_EQ(loaded.pageBreaks, saved.pageBreaks);
  EXPECT_EQ(loaded.cropMargins.top, 8);
  EXPECT_EQ(loaded.cropMargins.bottom, 6);
  EXPECT_EQ(loaded.cropMargins.left, 2);
  EXPECT_EQ(loaded.cropMargins.right, 1);
  EXPECT_TRUE(loaded.pipelined);
  EXPECT_EQ(loaded.queueCapacity, 3);
  EXPECT_EQ(reader.settingsPath(), m_iniPath);
}

TEST_F(ConfigManagerTest, ReadsHandWrittenIni)
{
  writeIni("[extraction]\n"
           "similarityThreshold=0.8\n"
           "sampleInterval=2\n"
           "[layout]\n"
           "orientation=Landscape\n"
           "pageBreaks=3, 7\n");

  ConfigManager manager(m_iniPath);
  AppConfig config = manager.loadConfig();

  EXPECT_DOUBLE_EQ(config.similarityThreshold, 0.8);
  EXPECT_DOUBLE_EQ(config.sampleInterval, 2.0);
  EXPECT_EQ(config.orientation, PageOrientation::Landscape);
  EXPECT_EQ(config.pageBreaks, (std::vector<int>{3, 7}));
}

TEST_F(ConfigManagerTest, MalformedPageBreaksAreRejected)
{
  writeIni("[layout]\npageBreaks=\"3,x\"\n");

  ConfigManager manager(m_iniPath);
  EXPECT_THROW(manager.loadConfig(), std::invalid_argument);
}

TEST(ConfigManagerStaticTest, ParsesAndFormatsPageBreaks)
{
  EXPECT_EQ(ConfigManager::parsePageBreaks(" 1, 5,,9 "), (std::vector<int>{1, 5, 9}));
  EXPECT_TRUE(ConfigManager::parsePageBreaks("").empty());
  EXPECT_EQ(ConfigManager::formatPageBreaks({2, 11}), QString("2,11"));
  EXPECT_THROW(ConfigManager::parsePageBreaks("4;5"), std::invalid_argument);
}

TEST(ConfigManagerStaticTest, OrientationNames)
{
  bool ok = false;
  EXPECT_EQ(ConfigManager::getOrientationFromName("LANDSCAPE", &ok), PageOrientation::Landscape);
  EXPECT_TRUE(ok);
  EXPECT_EQ(ConfigManager::getOrientationFromName("sideways", &ok), PageOrientation::Portrait);
  EXPECT_FALSE(ok);
  EXPECT_EQ(ConfigManager::getOrientationName(PageOrientation::Landscape), QString("landscape"));
}

TEST(ConfigManagerStaticTest, ValidateNamesFirstInvalidField)
{
  AppConfig threshold;
  threshold.similarityThreshold = 1.0;
  EXPECT_TRUE(ConfigManager::validate(threshold).contains("Similarity threshold"));

  AppConfig interval;
  interval.sampleInterval = -2.0;
  EXPECT_TRUE(ConfigManager::validate(interval).contains("Sample interval"));

  AppConfig window;
  window.startTime = 30.0;
  window.endTime = 10.0;
  EXPECT_TRUE(ConfigManager::validate(window).contains("End time"));

  AppConfig margins;
  margins.cropMargins.left = -4;
  EXPECT_TRUE(ConfigManager::validate(margins).contains("Crop margins"));

  AppConfig breaks;
  breaks.pageBreaks = {2, -1};
  EXPECT_TRUE(ConfigManager::validate(breaks).contains("Page break"));

  AppConfig queue;
  queue.queueCapacity = 0;
  EXPECT_TRUE(ConfigManager::validate(queue).contains("Queue capacity"));
}

TEST(ConfigManagerStaticTest, MapsToComponentOptions)
{
  AppConfig config;
  config.similarityThreshold = 0.88;
  config.sampleInterval = 0.5;
  config.startTime = 1.0;
  config.endTime = 2.0;
  config.pipelined = true;
  config.queueCapacity = 5;
  config.orientation = PageOrientation::Landscape;
  config.pageBreaks = {1};
  config.cropMargins.top = 3;

  DedupConfig dedup = ConfigManager::toDedupConfig(config);
  EXPECT_DOUBLE_EQ(dedup.similarityThreshold, 0.88);
  EXPECT_DOUBLE_EQ(dedup.sampleInterval, 0.5);
  EXPECT_DOUBLE_EQ(dedup.startTime, 1.0);
  EXPECT_DOUBLE_EQ(dedup.endTime, 2.0);
  EXPECT_TRUE(dedup.pipelined);
  EXPECT_EQ(dedup.queueCapacity, 5);

  PdfOptions options = ConfigManager::toPdfOptions(config);
  EXPECT_EQ(options.orientation, PageOrientation::Landscape);
  EXPECT_EQ(options.pageBreaks, (std::vector<int>{1}));
  EXPECT_EQ(options.cropMargins.top, 3);
}

#include "configmanager.h"
#include <QDebug>
#include <QStringList>
#include <stdexcept>

// Configuration keys
const QString ConfigManager::KEY_OUTPUT_DIR = "output/directory";
const QString ConfigManager::KEY_PDF_PATH = "output/pdfPath";
const QString ConfigManager::KEY_SIMILARITY_THRESHOLD = "extraction/similarityThreshold";
const QString ConfigManager::KEY_SAMPLE_INTERVAL = "extraction/sampleInterval";
const QString ConfigManager::KEY_START_TIME = "extraction/startTime";
const QString ConfigManager::KEY_END_TIME = "extraction/endTime";
const QString ConfigManager::KEY_ORIENTATION = "layout/orientation";
const QString ConfigManager::KEY_PAGE_BREAKS = "layout/pageBreaks";
const QString ConfigManager::KEY_CROP_TOP = "layout/cropTop";
const QString ConfigManager::KEY_CROP_BOTTOM = "layout/cropBottom";
const QString ConfigManager::KEY_CROP_LEFT = "layout/cropLeft";
const QString ConfigManager::KEY_CROP_RIGHT = "layout/cropRight";
const QString ConfigManager::KEY_PIPELINED = "extraction/pipelined";
const QString ConfigManager::KEY_QUEUE_CAPACITY = "extraction/queueCapacity";

ConfigManager::ConfigManager(QObject *parent)
    : QObject(parent)
{
    m_settings = new QSettings("FrameScraper", "FrameScraper", this);
}

ConfigManager::ConfigManager(const QString& iniPath, QObject *parent)
    : QObject(parent)
{
    m_settings = new QSettings(iniPath, QSettings::IniFormat, this);
}

AppConfig ConfigManager::loadConfig()
{
    AppConfig config;

    config.outputDirectory = m_settings->value(KEY_OUTPUT_DIR, config.outputDirectory).toString();
    config.pdfPath = m_settings->value(KEY_PDF_PATH, config.pdfPath).toString();
    config.similarityThreshold = m_settings->value(KEY_SIMILARITY_THRESHOLD, config.similarityThreshold).toDouble();
    config.sampleInterval = m_settings->value(KEY_SAMPLE_INTERVAL, config.sampleInterval).toDouble();
    config.startTime = m_settings->value(KEY_START_TIME, config.startTime).toDouble();
    config.endTime = m_settings->value(KEY_END_TIME, config.endTime).toDouble();

    bool ok = true;
    QString orientationName = m_settings->value(KEY_ORIENTATION, "portrait").toString();
    config.orientation = getOrientationFromName(orientationName, &ok);
    if (!ok) {
        qWarning() << "ConfigManager: unknown orientation" << orientationName << "- using portrait";
    }

    // An unquoted list in a hand-written INI file comes back as a QStringList
    QString breaks = m_settings->value(KEY_PAGE_BREAKS).toStringList().join(',');
    config.pageBreaks = parsePageBreaks(breaks);

    config.cropMargins.top = m_settings->value(KEY_CROP_TOP, 0).toInt();
    config.cropMargins.bottom = m_settings->value(KEY_CROP_BOTTOM, 0).toInt();
    config.cropMargins.left = m_settings->value(KEY_CROP_LEFT, 0).toInt();
    config.cropMargins.right = m_settings->value(KEY_CROP_RIGHT, 0).toInt();

    config.pipelined = m_settings->value(KEY_PIPELINED, config.pipelined).toBool();
    config.queueCapacity = m_settings->value(KEY_QUEUE_CAPACITY, config.queueCapacity).toInt();

    return config;
}

void ConfigManager::saveConfig(const AppConfig& config)
{
    m_settings->setValue(KEY_OUTPUT_DIR, config.outputDirectory);
    m_settings->setValue(KEY_PDF_PATH, config.pdfPath);
    m_settings->setValue(KEY_SIMILARITY_THRESHOLD, config.similarityThreshold);
    m_settings->setValue(KEY_SAMPLE_INTERVAL, config.sampleInterval);
    m_settings->setValue(KEY_START_TIME, config.startTime);
    m_settings->setValue(KEY_END_TIME, config.endTime);
    m_settings->setValue(KEY_ORIENTATION, getOrientationName(config.orientation));
    m_settings->setValue(KEY_PAGE_BREAKS, formatPageBreaks(config.pageBreaks));
    m_settings->setValue(KEY_CROP_TOP, config.cropMargins.top);
    m_settings->setValue(KEY_CROP_BOTTOM, config.cropMargins.bottom);
    m_settings->setValue(KEY_CROP_LEFT, config.cropMargins.left);
    m_settings->setValue(KEY_CROP_RIGHT, config.cropMargins.right);
    m_settings->setValue(KEY_PIPELINED, config.pipelined);
    m_settings->setValue(KEY_QUEUE_CAPACITY, config.queueCapacity);

    m_settings->sync();
    if (m_settings->status() != QSettings::NoError) {
        qWarning() << "ConfigManager: failed to write settings to" << m_settings->fileName();
    }
}

QString ConfigManager::settingsPath() const
{
    return m_settings->fileName();
}

QString ConfigManager::validate(const AppConfig& config)
{
    if (config.outputDirectory.isEmpty()) {
        return "Output directory must not be empty";
    }
    if (config.pdfPath.isEmpty()) {
        return "PDF path must not be empty";
    }
    if (!(config.similarityThreshold > 0.0 && config.similarityThreshold < 1.0)) {
        return QString("Similarity threshold %1 must lie in (0, 1)").arg(config.similarityThreshold);
    }
    if (!(config.sampleInterval >= 0.0)) {
        return QString("Sample interval %1 must not be negative").arg(config.sampleInterval);
    }
    if (config.startTime >= 0.0 && config.endTime >= 0.0 && config.endTime <= config.startTime) {
        return QString("End time %1 must be after start time %2").arg(config.endTime).arg(config.startTime);
    }
    for (int b : config.pageBreaks) {
        if (b < 0) {
            return QString("Page break %1 must not be negative").arg(b);
        }
    }
    const CropMargins& m = config.cropMargins;
    if (m.top < 0 || m.bottom < 0 || m.left < 0 || m.right < 0) {
        return "Crop margins must not be negative";
    }
    if (config.queueCapacity < 1) {
        return QString("Queue capacity %1 must be at least 1").arg(config.queueCapacity);
    }
    return QString();
}

QString ConfigManager::getOrientationName(PageOrientation orientation)
{
    switch (orientation) {
        case PageOrientation::Landscape:
            return "landscape";
        case PageOrientation::Portrait:
        default:
            return "portrait";
    }
}

PageOrientation ConfigManager::getOrientationFromName(const QString& name, bool* ok)
{
    QString normalized = name.trimmed().toLower();
    if (ok) {
        *ok = (normalized == "portrait" || normalized == "landscape");
    }
    return normalized == "landscape" ? PageOrientation::Landscape : PageOrientation::Portrait;
}

QString ConfigManager::formatPageBreaks(const std::vector<int>& breaks)
{
    QStringList parts;
    for (int b : breaks) {
        parts.append(QString::number(b));
    }
    return parts.join(',');
}

std::vector<int> ConfigManager::parsePageBreaks(const QString& text)
{
    std::vector<int> breaks;
    const QStringList parts = text.split(',');
    for (const QString& part : parts) {
        QString entry = part.trimmed();
        if (entry.isEmpty()) {
            continue;
        }

        bool ok = false;
        int value = entry.toInt(&ok);
        if (!ok) {
            throw std::invalid_argument("Page break \"" + entry.toStdString() + "\" is not an integer");
        }
        breaks.push_back(value);
    }
    return breaks;
}

DedupConfig ConfigManager::toDedupConfig(const AppConfig& config)
{
    DedupConfig dedup;
    dedup.similarityThreshold = config.similarityThreshold;
    dedup.sampleInterval = config.sampleInterval;
    dedup.startTime = config.startTime;
    dedup.endTime = config.endTime;
    dedup.pipelined = config.pipelined;
    dedup.queueCapacity = config.queueCapacity;
    return dedup;
}

PdfOptions ConfigManager::toPdfOptions(const AppConfig& config)
{
    PdfOptions options;
    options.orientation = config.orientation;
    options.pageBreaks = config.pageBreaks;
    options.cropMargins = config.cropMargins;
    return options;
}

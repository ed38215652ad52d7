#ifndef CONFIGMANAGER_H
#define CONFIGMANAGER_H

#include <QObject>
#include <QSettings>
#include <QString>
#include <vector>
#include "contentcropper.h"
#include "framededuplicator.h"
#include "pdfmaker.h"

struct AppConfig {
    QString outputDirectory;
    QString pdfPath;
    double similarityThreshold;
    double sampleInterval;          // Seconds, 0 = every frame
    double startTime;               // Seconds, negative = unset
    double endTime;                 // Seconds, negative = unset
    PageOrientation orientation;
    std::vector<int> pageBreaks;
    CropMargins cropMargins;

    // Two-stage extraction
    bool pipelined;
    int queueCapacity;

    // Default values
    AppConfig() :
        outputDirectory("frames"),
        pdfPath("output.pdf"),
        similarityThreshold(0.95),
        sampleInterval(1.5),
        startTime(-1.0),
        endTime(-1.0),
        orientation(PageOrientation::Portrait),
        pipelined(false),
        queueCapacity(8)
    {}
};

class ConfigManager : public QObject
{
    Q_OBJECT

public:
    /**
     * Use the native per-user settings store
     */
    explicit ConfigManager(QObject *parent = nullptr);

    /**
     * Use an explicit INI file
     * @param iniPath Path of the INI file, created on first save
     */
    explicit ConfigManager(const QString& iniPath, QObject *parent = nullptr);

    /**
     * Load configuration from persistent storage
     * @return AppConfig structure with loaded settings, defaults for missing keys
     * @throws std::invalid_argument if a stored page break list is malformed
     */
    AppConfig loadConfig();

    /**
     * Save configuration to persistent storage
     * @param config Configuration to save
     */
    void saveConfig(const AppConfig& config);

    /**
     * Location of the backing store
     */
    QString settingsPath() const;

    /**
     * Check every field of a configuration
     * @return Empty string if valid, otherwise a message naming the first invalid field
     */
    static QString validate(const AppConfig& config);

    /**
     * Get orientation name as string
     */
    static QString getOrientationName(PageOrientation orientation);

    /**
     * Get orientation from string name, case-insensitive
     * @param name "portrait" or "landscape"
     * @param ok Set to false for an unknown name
     */
    static PageOrientation getOrientationFromName(const QString& name, bool* ok = nullptr);

    /**
     * Comma-separated page break list, e.g. "4,9"
     */
    static QString formatPageBreaks(const std::vector<int>& breaks);

    /**
     * Parse a comma-separated page break list; blanks are ignored
     * @throws std::invalid_argument if an entry is not an integer
     */
    static std::vector<int> parsePageBreaks(const QString& text);

    static DedupConfig toDedupConfig(const AppConfig& config);
    static PdfOptions toPdfOptions(const AppConfig& config);

private:
    QSettings* m_settings;

    // Configuration keys
    static const QString KEY_OUTPUT_DIR;
    static const QString KEY_PDF_PATH;
    static const QString KEY_SIMILARITY_THRESHOLD;
    static const QString KEY_SAMPLE_INTERVAL;
    static const QString KEY_START_TIME;
    static const QString KEY_END_TIME;
    static const QString KEY_ORIENTATION;
    static const QString KEY_PAGE_BREAKS;
    static const QString KEY_CROP_TOP;
    static const QString KEY_CROP_BOTTOM;
    static const QString KEY_CROP_LEFT;
    static const QString KEY_CROP_RIGHT;
    static const QString KEY_PIPELINED;
    static const QString KEY_QUEUE_CAPACITY;
};

#endif // CONFIGMANAGER_H

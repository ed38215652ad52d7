#include <QCommandLineParser>
#include <QDebug>
#include <QDir>
#include <QGuiApplication>
#include <exception>
#include <memory>
#include "configmanager.h"
#include "framededuplicator.h"
#include "framesequence.h"
#include "pdfmaker.h"
#include "pipelineerrors.h"
#include "videodecoder.h"

namespace {

bool parseDouble(const QCommandLineParser& parser, const QString& name, double& value)
{
    if (!parser.isSet(name)) {
        return true;
    }
    bool ok = false;
    double parsed = parser.value(name).toDouble(&ok);
    if (!ok) {
        qCritical().noquote() << "Invalid value for --" + name + ":" << parser.value(name);
        return false;
    }
    value = parsed;
    return true;
}

bool parseCropMargins(const QString& text, CropMargins& margins)
{
    const QStringList parts = text.split(',');
    if (parts.size() != 4) {
        return false;
    }
    int values[4];
    for (int i = 0; i < 4; ++i) {
        bool ok = false;
        values[i] = parts[i].trimmed().toInt(&ok);
        if (!ok) {
            return false;
        }
    }
    margins.top = values[0];
    margins.bottom = values[1];
    margins.left = values[2];
    margins.right = values[3];
    return true;
}

QList<int> parsePositions(const QString& text)
{
    QList<int> positions;
    for (int value : ConfigManager::parsePageBreaks(text)) {
        positions.append(value);
    }
    return positions;
}

void logProgress(const char* stage, int current, int total, int& lastPercent)
{
    if (total <= 0) {
        return;
    }
    int percent = qBound(0, current * 100 / total, 100);
    if (percent >= lastPercent + 10 || percent == 100) {
        lastPercent = percent;
        qInfo().noquote() << QString("%1: %2%").arg(stage).arg(percent);
    }
}

} // namespace

int main(int argc, char *argv[])
{
    // Only images are painted; no display is needed
    if (qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM")) {
        qputenv("QT_QPA_PLATFORM", "offscreen");
    }

    QGuiApplication app(argc, argv);
    app.setApplicationName("FrameScraper");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("FrameScraper");

    QCommandLineParser parser;
    parser.setApplicationDescription("Extract unique frames from a video and lay them out as a PDF");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("video", "Local video file to extract frames from (omit with --layout-only)");

    parser.addOptions({
        {{"o", "output"}, "Output directory for frames.", "dir"},
        {"threshold", "SSIM similarity threshold in (0, 1); higher requires more similarity.", "value"},
        {"sample-interval", "Seconds between candidate frames, 0 for every frame.", "seconds"},
        {"start-time", "Start time in seconds.", "seconds"},
        {"end-time", "End time in seconds.", "seconds"},
        {"pipelined", "Decode on a separate thread feeding the comparison stage."},
        {"pdf", "Create a PDF from the extracted frames."},
        {"pdf-output", "PDF output path.", "file"},
        {"orientation", "PDF page orientation: portrait or landscape.", "name"},
        {"breaks", "Comma-separated frame indices followed by a page break.", "list"},
        {"crop", "Margins removed from every frame before layout: top,bottom,left,right.", "pixels"},
        {"reorder", "Keep only these frame positions, in this order, and renumber the frames.", "list"},
        {"layout-only", "Skip extraction and lay out the frames already in the output directory."},
        {"config", "Read settings from this INI file instead of the user settings.", "file"},
        {"save-config", "Store the effective settings before running."},
    });

    parser.process(app);

    try {
        std::unique_ptr<ConfigManager> configManager = parser.isSet("config")
            ? std::make_unique<ConfigManager>(parser.value("config"))
            : std::make_unique<ConfigManager>();
        AppConfig config = configManager->loadConfig();

        if (parser.isSet("output")) {
            config.outputDirectory = parser.value("output");
        }
        if (parser.isSet("pdf-output")) {
            config.pdfPath = parser.value("pdf-output");
        }
        if (!parseDouble(parser, "threshold", config.similarityThreshold) ||
            !parseDouble(parser, "sample-interval", config.sampleInterval) ||
            !parseDouble(parser, "start-time", config.startTime) ||
            !parseDouble(parser, "end-time", config.endTime)) {
            return 2;
        }
        if (parser.isSet("pipelined")) {
            config.pipelined = true;
        }
        if (parser.isSet("orientation")) {
            bool ok = false;
            config.orientation = ConfigManager::getOrientationFromName(parser.value("orientation"), &ok);
            if (!ok) {
                qCritical().noquote() << "Unknown orientation:" << parser.value("orientation");
                return 2;
            }
        }
        if (parser.isSet("breaks")) {
            config.pageBreaks = ConfigManager::parsePageBreaks(parser.value("breaks"));
        }
        if (parser.isSet("crop") && !parseCropMargins(parser.value("crop"), config.cropMargins)) {
            qCritical().noquote() << "Invalid crop margins:" << parser.value("crop");
            return 2;
        }

        QString problem = ConfigManager::validate(config);
        if (!problem.isEmpty()) {
            qCritical().noquote() << problem;
            return 2;
        }
        if (parser.isSet("save-config")) {
            configManager->saveConfig(config);
            qInfo().noquote() << "Settings saved to" << configManager->settingsPath();
        }

        const bool layoutOnly = parser.isSet("layout-only");
        const QStringList positional = parser.positionalArguments();
        if (!layoutOnly && positional.size() != 1) {
            parser.showHelp(2);
        }

        if (!layoutOnly) {
            FrameDeduplicator deduplicator(ConfigManager::toDedupConfig(config));
            int lastPercent = -10;
            QObject::connect(&deduplicator, &FrameDeduplicator::progressUpdated,
                             [&lastPercent](int current, int total) {
                logProgress("Extracting", current, total, lastPercent);
            });

            VideoDecoder decoder(positional.first().toStdString());
            qInfo().noquote() << "Extracting unique frames to:" << QDir(config.outputDirectory).absolutePath();
            DedupResult result = deduplicator.run(decoder, config.outputDirectory);
            qInfo().noquote() << QString("Done! Saved %1 unique frames out of %2 candidates")
                                     .arg(result.framesKept).arg(result.candidatesSeen);
        }

        FrameSequence sequence = FrameSequence::fromDirectory(config.outputDirectory);
        if (parser.isSet("reorder")) {
            sequence.reorder(parsePositions(parser.value("reorder")));
            sequence.persist(config.outputDirectory);
        }

        if (parser.isSet("pdf") || layoutOnly) {
            PdfMaker pdfMaker(ConfigManager::toPdfOptions(config));
            int lastPercent = -10;
            QObject::connect(&pdfMaker, &PdfMaker::progressUpdated,
                             [&lastPercent](int current, int total) {
                logProgress("Rendering", current, total, lastPercent);
            });

            PdfResult result = pdfMaker.makePdf(sequence, config.pdfPath);
            qInfo().noquote() << QString("PDF created: %1 (%2 pages)").arg(config.pdfPath).arg(result.pageCount);
        }
    } catch (const InvalidBreakError& e) {
        qCritical().noquote() << "Invalid page break:" << e.what();
        return 1;
    } catch (const PipelineError& e) {
        if (e.frameIndex() >= 0) {
            qCritical().noquote() << QString("Error at frame %1:").arg(e.frameIndex()) << e.what();
        } else {
            qCritical().noquote() << "Error:" << e.what();
        }
        return 1;
    } catch (const std::exception& e) {
        qCritical().noquote() << "Error:" << e.what();
        return 1;
    }

    return 0;
}

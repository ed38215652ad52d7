#include "framestore.h"
#include "imageiohelper.h"
#include "pipelineerrors.h"
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMap>
#include <QRegularExpression>
#include <stdexcept>

namespace {

QString siblingTemplate(const QString& outputDir, const QString& purpose)
{
    QDir dir;
    if (!dir.mkpath(outputDir)) {
        throw std::runtime_error("Failed to create output directory: " + outputDir.toStdString());
    }

    QFileInfo outputInfo(QDir(outputDir).absolutePath());
    return outputInfo.absolutePath() + "/." + outputInfo.fileName() + "-" + purpose + "-XXXXXX";
}

/**
 * Move the named files from one directory to another
 * @return Names that could not be moved
 */
QStringList moveFiles(const QStringList& names, const QDir& from, const QDir& to)
{
    QStringList failed;
    for (const QString& name : names) {
        if (!QFile::rename(from.filePath(name), to.filePath(name))) {
            failed << name;
        }
    }
    return failed;
}

} // namespace

QString FrameStore::frameFileName(int index)
{
    return QString("frame_%1.png").arg(index, INDEX_WIDTH, 10, QChar('0'));
}

int FrameStore::parseFrameIndex(const QString& fileName)
{
    static const QRegularExpression pattern("^frame_(\\d+)\\.png$");

    QRegularExpressionMatch match = pattern.match(fileName);
    if (!match.hasMatch()) {
        return -1;
    }

    bool ok = false;
    int index = match.captured(1).toInt(&ok);
    // Only the canonical zero-padded spelling counts, so each index maps to one name
    if (!ok || frameFileName(index) != fileName) {
        return -1;
    }
    return index;
}

QStringList FrameStore::listFrameFiles(const QString& directory)
{
    QDir dir(directory);
    if (!dir.exists()) {
        return QStringList();
    }

    QMap<int, QString> ordered;
    const QStringList entries = dir.entryList(QStringList() << "frame_*.png", QDir::Files);
    for (const QString& entry : entries) {
        int index = parseFrameIndex(entry);
        if (index < 0) {
            qWarning() << "FrameStore: ignoring non-conforming file name" << entry;
            continue;
        }
        ordered.insert(index, dir.absoluteFilePath(entry));
    }

    return ordered.values();
}

std::vector<cv::Mat> FrameStore::loadFrames(const QString& directory)
{
    std::vector<cv::Mat> frames;
    const QStringList paths = listFrameFiles(directory);
    frames.reserve(paths.size());

    for (int i = 0; i < paths.size(); ++i) {
        cv::Mat image = ImageIOHelper::readImage(paths[i], cv::IMREAD_UNCHANGED);
        if (image.empty()) {
            throw AcquisitionError("Failed to read frame image: " + paths[i].toStdString(), i);
        }
        frames.push_back(image);
    }

    return frames;
}

StagingArea::StagingArea(const QString& outputDir)
    : m_outputDir(QDir(outputDir).absolutePath()),
      m_tempDir(siblingTemplate(m_outputDir, "staging")),
      m_count(0),
      m_committed(false)
{
    if (!m_tempDir.isValid()) {
        throw std::runtime_error("Failed to create staging directory next to " + m_outputDir.toStdString() +
                                 ": " + m_tempDir.errorString().toStdString());
    }
}

int StagingArea::append(const cv::Mat& image)
{
    if (m_committed) {
        throw std::logic_error("StagingArea: append after commit");
    }

    QString path = QDir(m_tempDir.path()).filePath(FrameStore::frameFileName(m_count));
    ImageIOHelper::writeImage(path, image);
    return m_count++;
}

int StagingArea::appendFile(const QString& sourcePath)
{
    if (m_committed) {
        throw std::logic_error("StagingArea: append after commit");
    }

    QString path = QDir(m_tempDir.path()).filePath(FrameStore::frameFileName(m_count));
    if (!QFile::copy(sourcePath, path)) {
        throw AcquisitionError("Failed to copy frame " + sourcePath.toStdString(), m_count);
    }
    return m_count++;
}

void StagingArea::commit()
{
    if (m_committed) {
        return;
    }

    QDir output(m_outputDir);
    if (!output.exists() && !QDir().mkpath(m_outputDir)) {
        throw std::runtime_error("Failed to create output directory: " + m_outputDir.toStdString());
    }

    // Park the previous frames next to the output so a failed move can put them back
    QTemporaryDir backup(siblingTemplate(m_outputDir, "backup"));
    if (!backup.isValid()) {
        throw std::runtime_error("Failed to create backup directory next to " + m_outputDir.toStdString() +
                                 ": " + backup.errorString().toStdString());
    }
    QDir backupDir(backup.path());

    QStringList previous;
    for (const QString& path : FrameStore::listFrameFiles(m_outputDir)) {
        previous << QFileInfo(path).fileName();
    }

    QStringList parkFailures = moveFiles(previous, output, backupDir);
    if (!parkFailures.isEmpty()) {
        QStringList parked = previous;
        for (const QString& name : parkFailures) {
            parked.removeAll(name);
        }
        restore(parked, backup);
        throw std::runtime_error("Failed to move old frame out of the way: " +
                                 output.filePath(parkFailures.first()).toStdString());
    }

    QDir staging(m_tempDir.path());
    QStringList moved;
    for (int i = 0; i < m_count; ++i) {
        QString name = FrameStore::frameFileName(i);
        if (!QFile::rename(staging.filePath(name), output.filePath(name))) {
            // Return the new frames to staging, then bring the old ones back
            QStringList stranded = moveFiles(moved, output, staging);
            if (!stranded.isEmpty()) {
                qWarning() << "StagingArea: could not withdraw" << stranded.size() << "new frame(s) from" << m_outputDir;
            }
            restore(previous, backup);
            throw std::runtime_error("Failed to move staged frame into " + output.filePath(name).toStdString());
        }
        moved << name;
    }

    m_committed = true;
    qInfo() << "StagingArea: committed" << m_count << "frames to" << m_outputDir
            << "(replaced" << previous.size() << ")";
}

void StagingArea::restore(const QStringList& names, QTemporaryDir& backup)
{
    QStringList failed = moveFiles(names, QDir(backup.path()), QDir(m_outputDir));
    if (!failed.isEmpty()) {
        // Keep the backup on disk rather than lose the frames with it
        backup.setAutoRemove(false);
        qWarning() << "StagingArea: could not restore" << failed.size()
                   << "previous frame(s); they remain in" << backup.path();
    }
}

#ifndef FRAMESTORE_H
#define FRAMESTORE_H

#include <QString>
#include <QStringList>
#include <QTemporaryDir>
#include <opencv2/core.hpp>
#include <vector>

/**
 * Naming convention and directory access for persisted kept frames.
 *
 * Frames are stored as frame_000000.png, frame_000001.png, ... so that a
 * lexical sort of the names equals their numeric order.
 */
class FrameStore
{
public:
    static const int INDEX_WIDTH = 6;

    /**
     * File name for the frame at the given position, e.g. frame_000042.png
     */
    static QString frameFileName(int index);

    /**
     * Inverse of frameFileName()
     * @param fileName Bare file name
     * @return Parsed index, -1 if the name does not follow the convention
     */
    static int parseFrameIndex(const QString& fileName);

    /**
     * Absolute paths of all frames in a directory, ordered by parsed index
     * @param directory Frames directory
     * @return Ordered list of paths (empty if the directory is missing or holds no frames)
     */
    static QStringList listFrameFiles(const QString& directory);

    /**
     * Read every frame of a directory back into memory
     * @param directory Frames directory
     * @return Images in index order
     * @throws AcquisitionError if a frame file cannot be decoded
     */
    static std::vector<cv::Mat> loadFrames(const QString& directory);
};

/**
 * Temporary directory that collects a densely numbered frame sequence and
 * replaces the frames of an output directory only on commit().
 *
 * The directory is created next to the output directory so the final move is
 * a rename. An uncommitted staging area is deleted with all its contents when
 * it goes out of scope, leaving the output directory untouched.
 */
class StagingArea
{
public:
    /**
     * @param outputDir Directory that commit() will populate
     * @throws std::runtime_error if the staging directory cannot be created
     */
    explicit StagingArea(const QString& outputDir);

    StagingArea(const StagingArea&) = delete;
    StagingArea& operator=(const StagingArea&) = delete;

    /**
     * Encode and stage an image as the next frame
     * @return Index assigned to the frame
     */
    int append(const cv::Mat& image);

    /**
     * Stage a copy of an existing image file as the next frame
     * @return Index assigned to the frame
     */
    int appendFile(const QString& sourcePath);

    /**
     * Replace the frames of the output directory with the staged ones.
     * The previous frames are parked in a sibling backup directory first and
     * put back if any staged frame cannot be moved in.
     * @throws std::runtime_error if a frame cannot be moved; the output directory keeps its previous frames
     */
    void commit();

    int count() const { return m_count; }
    bool isCommitted() const { return m_committed; }
    QString stagingPath() const { return m_tempDir.path(); }
    QString outputDirectory() const { return m_outputDir; }

private:
    void restore(const QStringList& names, QTemporaryDir& backup);

    QString m_outputDir;
    QTemporaryDir m_tempDir;
    int m_count;
    bool m_committed;
};

#endif // FRAMESTORE_H

#ifndef PDFMAKER_H
#define PDFMAKER_H

#include <QObject>
#include <QString>
#include <QStringList>
#include <vector>
#include "contentcropper.h"
#include "pagepacker.h"

class FrameSequence;

enum class PageOrientation {
    Portrait,
    Landscape
};

/**
 * Layout settings of a document
 */
struct PdfOptions {
    PageOrientation orientation = PageOrientation::Portrait;
    std::vector<int> pageBreaks;   // Frame positions followed by a manual break
    CropMargins cropMargins;       // Removed from every frame before layout
};

/**
 * Summary of a written document
 */
struct PdfResult {
    int frameCount = 0;
    int sectionCount = 0;
    int pageCount = 0;
    int oversizedPages = 0;
};

/**
 * Turns a kept-frame sequence into an A4 PDF.
 *
 * Frames are measured without decoding pixels, the sequence is split at
 * manual page breaks, each section is packed onto pages, and the pages are
 * drawn by DocumentRenderer. Breaks are validated before anything is read.
 */
class PdfMaker : public QObject
{
    Q_OBJECT

public:
    static constexpr double A4_WIDTH_PT = 595.28;
    static constexpr double A4_HEIGHT_PT = 841.89;
    static constexpr double IMAGE_SPACING_PT = 10.0;

    /**
     * @param options Layout settings
     * @throws std::invalid_argument if a crop margin is negative
     */
    explicit PdfMaker(const PdfOptions& options, QObject *parent = nullptr);

    /**
     * A4 page geometry in points for the given orientation
     */
    static PageGeometry pageGeometry(PageOrientation orientation);

    /**
     * Lay out every frame of a frames directory
     * @param framesDir Directory of frame_NNNNNN.png files
     * @param outputPath Destination PDF
     * @throws EmptyInputError if the directory holds no frames
     * @throws InvalidBreakError if a configured break is out of range
     * @throws AcquisitionError if a frame is unreadable or consumed by the crop margins
     */
    PdfResult makePdf(const QString& framesDir, const QString& outputPath);

    /**
     * Lay out an edited sequence; its page break flags are added to the configured breaks
     */
    PdfResult makePdf(const FrameSequence& sequence, const QString& outputPath);

    /**
     * Lay out an explicit list of frame images
     * @param framePaths Frame paths in output order
     * @param pageBreaks Manual breaks, replacing the configured ones
     * @param outputPath Destination PDF
     */
    PdfResult makePdf(const QStringList& framePaths,
                      const std::vector<int>& pageBreaks,
                      const QString& outputPath);

    /**
     * Drawn size of each frame: intrinsic image size minus crop margins
     * @throws AcquisitionError with the frame index of an unreadable or fully cropped frame
     */
    std::vector<FrameExtent> measureFrames(const QStringList& framePaths) const;

    /**
     * Section planning and packing without rendering
     */
    std::vector<Page> planPages(const std::vector<FrameExtent>& frames,
                                const std::vector<int>& pageBreaks) const;

    const PdfOptions& options() const { return m_options; }

signals:
    void progressUpdated(int current, int total);

private:
    PdfOptions m_options;
};

#endif // PDFMAKER_H

#include "pdfmaker.h"
#include "documentrenderer.h"
#include "framesequence.h"
#include "framestore.h"
#include "pipelineerrors.h"
#include "sectionplanner.h"
#include <QDebug>
#include <QImageReader>
#include <stdexcept>

PdfMaker::PdfMaker(const PdfOptions& options, QObject *parent)
    : QObject(parent),
      m_options(options)
{
    const CropMargins& m = m_options.cropMargins;
    if (m.top < 0 || m.bottom < 0 || m.left < 0 || m.right < 0) {
        throw std::invalid_argument("Crop margins must not be negative");
    }
}

PageGeometry PdfMaker::pageGeometry(PageOrientation orientation)
{
    PageGeometry geometry;
    if (orientation == PageOrientation::Landscape) {
        geometry.width = A4_HEIGHT_PT;
        geometry.height = A4_WIDTH_PT;
    } else {
        geometry.width = A4_WIDTH_PT;
        geometry.height = A4_HEIGHT_PT;
    }
    geometry.spacing = IMAGE_SPACING_PT;
    return geometry;
}

PdfResult PdfMaker::makePdf(const QString& framesDir, const QString& outputPath)
{
    QStringList framePaths = FrameStore::listFrameFiles(framesDir);
    if (framePaths.isEmpty()) {
        throw EmptyInputError("Nothing to lay out: no frames found in " + framesDir.toStdString());
    }
    return makePdf(framePaths, m_options.pageBreaks, outputPath);
}

PdfResult PdfMaker::makePdf(const FrameSequence& sequence, const QString& outputPath)
{
    if (sequence.isEmpty()) {
        throw EmptyInputError("Nothing to lay out: the frame sequence is empty");
    }

    std::vector<int> breaks = m_options.pageBreaks;
    std::vector<int> flagged = sequence.pageBreakIndices();
    breaks.insert(breaks.end(), flagged.begin(), flagged.end());

    return makePdf(sequence.paths(), breaks, outputPath);
}

PdfResult PdfMaker::makePdf(const QStringList& framePaths,
                            const std::vector<int>& pageBreaks,
                            const QString& outputPath)
{
    if (framePaths.isEmpty()) {
        throw EmptyInputError("Nothing to lay out: no frames given");
    }

    // Reject bad breaks before touching any image
    SectionPlanner::normalizeBreaks(framePaths.size(), pageBreaks);

    std::vector<FrameExtent> extents = measureFrames(framePaths);
    std::vector<Page> pages = planPages(extents, pageBreaks);

    PdfResult result;
    result.frameCount = framePaths.size();
    result.sectionCount = pages.empty() ? 0 : pages.back().sectionIndex + 1;
    result.pageCount = static_cast<int>(pages.size());
    for (const Page& page : pages) {
        if (page.oversized) {
            ++result.oversizedPages;
            qDebug() << "PdfMaker: frame" << page.placements.front().frameIndex
                     << "is taller than a page and was scaled to fit";
        }
    }

    DocumentRenderer renderer(pageGeometry(m_options.orientation), m_options.cropMargins);
    renderer.render(pages, framePaths, outputPath, [this](int current, int total) {
        emit progressUpdated(current, total);
    });

    qInfo() << "PdfMaker: laid out" << result.frameCount << "frames in"
            << result.sectionCount << "section(s) on" << result.pageCount << "page(s):" << outputPath;
    return result;
}

std::vector<FrameExtent> PdfMaker::measureFrames(const QStringList& framePaths) const
{
    std::vector<FrameExtent> extents;
    extents.reserve(framePaths.size());

    for (int i = 0; i < framePaths.size(); ++i) {
        QImageReader reader(framePaths.at(i));
        QSize size = reader.size();
        if (!size.isValid()) {
            throw AcquisitionError("Cannot read frame image " + framePaths.at(i).toStdString() +
                                   ": " + reader.errorString().toStdString(), i);
        }

        cv::Rect kept = ContentCropper::marginRect(cv::Size(size.width(), size.height()),
                                                   m_options.cropMargins);
        if (kept.empty()) {
            throw AcquisitionError("Crop margins remove all of frame " +
                                   framePaths.at(i).toStdString(), i);
        }

        extents.push_back(FrameExtent{kept.width, kept.height});
    }

    return extents;
}

std::vector<Page> PdfMaker::planPages(const std::vector<FrameExtent>& frames,
                                      const std::vector<int>& pageBreaks) const
{
    std::vector<Section> sections = SectionPlanner::plan(static_cast<int>(frames.size()), pageBreaks);
    PagePacker packer(pageGeometry(m_options.orientation));
    return packer.packDocument(frames, sections);
}

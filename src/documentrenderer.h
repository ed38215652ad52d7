#ifndef DOCUMENTRENDERER_H
#define DOCUMENTRENDERER_H

#include <QImage>
#include <QPageLayout>
#include <QString>
#include <QStringList>
#include <functional>
#include <vector>
#include "contentcropper.h"
#include "pagepacker.h"

/**
 * Draws packed pages into a PDF file, one output page per Page, in order.
 *
 * The document uses 72 dpi so that one device unit is one PDF point and
 * placements can be drawn at their computed coordinates unchanged. The file
 * is written through QSaveFile and only appears at the output path once
 * every page has been drawn.
 */
class DocumentRenderer
{
public:
    static const int RESOLUTION_DPI = 72;

    /**
     * Progress callback: (pages rendered, total pages)
     */
    using ProgressCallback = std::function<void(int, int)>;

    /**
     * @param geometry Page size in points
     * @param margins Crop margins removed from every frame before drawing
     */
    explicit DocumentRenderer(const PageGeometry& geometry, const CropMargins& margins = CropMargins());

    /**
     * Render pages to a PDF file
     * @param pages Packed pages in output order
     * @param framePaths Frame image paths indexed by Placement::frameIndex
     * @param outputPath Destination PDF path
     * @param progress Optional progress callback
     * @throws EmptyInputError if there are no pages
     * @throws AcquisitionError if a frame image cannot be loaded
     * @throws std::runtime_error if the PDF cannot be written
     */
    void render(const std::vector<Page>& pages,
                const QStringList& framePaths,
                const QString& outputPath,
                const ProgressCallback& progress = ProgressCallback()) const;

    /**
     * Load a frame image and remove the crop margins
     * @param path Image path
     * @param frameIndex Frame position, reported in errors
     * @param sectionIndex Section of the frame, reported in errors
     * @throws AcquisitionError if the image is unreadable or the margins consume it
     */
    QImage loadFrame(const QString& path, int frameIndex, int sectionIndex = -1) const;

    /**
     * Page layout with zero margins matching the geometry; landscape when wider than tall
     */
    static QPageLayout pageLayout(const PageGeometry& geometry);

private:
    PageGeometry m_geometry;
    CropMargins m_margins;
};

#endif // DOCUMENTRENDERER_H

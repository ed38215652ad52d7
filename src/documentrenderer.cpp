#include "documentrenderer.h"
#include "pipelineerrors.h"
#include <QDebug>
#include <QPageSize>
#include <QPainter>
#include <QPdfWriter>
#include <QRectF>
#include <QSaveFile>
#include <stdexcept>
#include <string>

DocumentRenderer::DocumentRenderer(const PageGeometry& geometry, const CropMargins& margins)
    : m_geometry(geometry),
      m_margins(margins)
{
}

QPageLayout DocumentRenderer::pageLayout(const PageGeometry& geometry)
{
    const bool landscape = geometry.width > geometry.height;
    QSizeF portraitSize = landscape ? QSizeF(geometry.height, geometry.width)
                                    : QSizeF(geometry.width, geometry.height);

    return QPageLayout(QPageSize(portraitSize, QPageSize::Point, QString(), QPageSize::FuzzyMatch),
                       landscape ? QPageLayout::Landscape : QPageLayout::Portrait,
                       QMarginsF(0, 0, 0, 0));
}

QImage DocumentRenderer::loadFrame(const QString& path, int frameIndex, int sectionIndex) const
{
    QImage image(path);
    if (image.isNull()) {
        throw AcquisitionError("Cannot load frame image " + path.toStdString(),
                               frameIndex, sectionIndex);
    }

    if (m_margins.isNull()) {
        return image;
    }

    cv::Rect kept = ContentCropper::marginRect(cv::Size(image.width(), image.height()), m_margins);
    if (kept.empty()) {
        throw AcquisitionError("Crop margins remove all of frame " + path.toStdString(),
                               frameIndex, sectionIndex);
    }
    return image.copy(kept.x, kept.y, kept.width, kept.height);
}

void DocumentRenderer::render(const std::vector<Page>& pages,
                              const QStringList& framePaths,
                              const QString& outputPath,
                              const ProgressCallback& progress) const
{
    if (pages.empty()) {
        throw EmptyInputError("Nothing to lay out: no pages to render");
    }

    QSaveFile file(outputPath);
    if (!file.open(QIODevice::WriteOnly)) {
        throw std::runtime_error("Cannot open " + outputPath.toStdString() + " for writing: " +
                                 file.errorString().toStdString());
    }

    {
        QPdfWriter writer(&file);
        writer.setResolution(RESOLUTION_DPI);
        writer.setPageLayout(pageLayout(m_geometry));
        writer.setCreator("FrameScraper");

        QPainter painter;
        if (!painter.begin(&writer)) {
            throw std::runtime_error("Cannot start PDF painter for " + outputPath.toStdString());
        }
        painter.setRenderHint(QPainter::SmoothPixmapTransform);

        const int total = static_cast<int>(pages.size());
        for (int p = 0; p < total; ++p) {
            const Page& page = pages[p];
            if (p > 0) {
                writer.newPage();
            }

            for (const Placement& placement : page.placements) {
                if (placement.frameIndex < 0 || placement.frameIndex >= framePaths.size()) {
                    throw std::out_of_range("DocumentRenderer: placement refers to frame " +
                                            std::to_string(placement.frameIndex));
                }

                QImage image = loadFrame(framePaths.at(placement.frameIndex),
                                         placement.frameIndex, page.sectionIndex);
                painter.drawImage(QRectF(placement.x, placement.y, placement.width, placement.height),
                                  image);
            }

            if (progress) {
                progress(p + 1, total);
            }
        }

        painter.end();
    }

    if (!file.commit()) {
        throw std::runtime_error("Cannot write " + outputPath.toStdString() + ": " +
                                 file.errorString().toStdString());
    }

    qDebug() << "DocumentRenderer: wrote" << pages.size() << "pages to" << outputPath;
}

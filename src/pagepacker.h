#ifndef PAGEPACKER_H
#define PAGEPACKER_H

#include <vector>
#include "sectionplanner.h"

/**
 * Output page size and inter-image spacing, in the document's drawing units
 */
struct PageGeometry {
    double width = 0.0;
    double height = 0.0;
    double spacing = 10.0;
};

/**
 * Intrinsic pixel size of a frame as it will be drawn
 */
struct FrameExtent {
    int width = 0;
    int height = 0;
};

/**
 * Where one frame is drawn on a page (top-left origin)
 */
struct Placement {
    int frameIndex = -1;
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;
};

/**
 * Frames stacked onto one output page
 */
struct Page {
    int sectionIndex = -1;
    std::vector<Placement> placements;
    double contentHeight = 0.0;  // Sum of image heights plus spacing between them
    bool oversized = false;      // Single frame forced onto its own page and scaled to fit by height
};

/**
 * Greedy, balance-biased distribution of frames onto fixed-size pages.
 *
 * Every frame is first scaled to at most 90% of the page width. A page is
 * closed when the next frame would overflow 90% of the page height, or early
 * when the page has passed 70% of the section's per-page target height and
 * the next frame would overshoot that target, provided enough content is
 * left for a reasonable following page. A frame taller than the usable
 * height on its own gets a page to itself, scaled down to fit both
 * dimensions. Sections never share a page.
 */
class PagePacker
{
public:
    static constexpr double USABLE_FRACTION = 0.9;
    static constexpr double BALANCE_START_FRACTION = 0.7;
    static constexpr double BALANCE_REMAINDER_FRACTION = 0.3;

    /**
     * @param geometry Page size and spacing, width and height must be positive
     */
    explicit PagePacker(const PageGeometry& geometry);

    const PageGeometry& geometry() const { return m_geometry; }
    double usableWidth() const { return m_geometry.width * USABLE_FRACTION; }
    double usableHeight() const { return m_geometry.height * USABLE_FRACTION; }

    /**
     * Pack every section in order and concatenate the pages
     * @param frames Extents of all frames, indexed by frame position
     * @param sections Partition of the frame positions
     */
    std::vector<Page> packDocument(const std::vector<FrameExtent>& frames,
                                   const std::vector<Section>& sections) const;

    /**
     * Pack the frames of one section
     * @param frames Extents of all frames, indexed by frame position
     * @param section Range of positions to pack
     * @param sectionIndex Recorded on every produced page
     */
    std::vector<Page> packSection(const std::vector<FrameExtent>& frames,
                                  const Section& section,
                                  int sectionIndex = 0) const;

    /**
     * Width-capped uniform scale factor: min(1, usable width / frame width)
     */
    double naturalScale(const FrameExtent& frame) const;

    /**
     * Balancing target for a section: total natural height divided by the
     * estimated page count
     */
    double targetHeight(const std::vector<FrameExtent>& frames, const Section& section) const;

private:
    Page forcedPage(const std::vector<FrameExtent>& frames, int position, int sectionIndex) const;
    void centerOnPage(Page& page) const;

    PageGeometry m_geometry;
};

#endif // PAGEPACKER_H

#include "pagepacker.h"
#include <algorithm>
#include <cmath>
#include <iterator>
#include <stdexcept>
#include <string>

PagePacker::PagePacker(const PageGeometry& geometry)
    : m_geometry(geometry)
{
    if (!(m_geometry.width > 0.0) || !(m_geometry.height > 0.0)) {
        throw std::invalid_argument("PagePacker: page width and height must be positive");
    }
    if (m_geometry.spacing < 0.0) {
        throw std::invalid_argument("PagePacker: spacing must not be negative");
    }
}

double PagePacker::naturalScale(const FrameExtent& frame) const
{
    if (frame.width <= 0 || frame.height <= 0) {
        throw std::invalid_argument("PagePacker: frame extent must be positive, got " +
                                    std::to_string(frame.width) + "x" +
                                    std::to_string(frame.height));
    }
    return std::min(1.0, usableWidth() / frame.width);
}

double PagePacker::targetHeight(const std::vector<FrameExtent>& frames, const Section& section) const
{
    double total = 0.0;
    for (int i = section.start; i < section.end; ++i) {
        total += frames.at(i).height * naturalScale(frames.at(i));
    }
    if (total <= 0.0) {
        return 0.0;
    }

    double pageCount = std::max(1.0, std::ceil(total / usableHeight()));
    return total / pageCount;
}

std::vector<Page> PagePacker::packDocument(const std::vector<FrameExtent>& frames,
                                           const std::vector<Section>& sections) const
{
    std::vector<Page> pages;
    for (size_t s = 0; s < sections.size(); ++s) {
        std::vector<Page> sectionPages = packSection(frames, sections[s], static_cast<int>(s));
        pages.insert(pages.end(),
                     std::make_move_iterator(sectionPages.begin()),
                     std::make_move_iterator(sectionPages.end()));
    }
    return pages;
}

std::vector<Page> PagePacker::packSection(const std::vector<FrameExtent>& frames,
                                          const Section& section,
                                          int sectionIndex) const
{
    std::vector<Page> pages;
    if (section.size() <= 0) {
        return pages;
    }
    if (section.start < 0 || section.end > static_cast<int>(frames.size())) {
        throw std::out_of_range("PagePacker: section [" + std::to_string(section.start) + ", " +
                                std::to_string(section.end) + ") exceeds " +
                                std::to_string(frames.size()) + " frames");
    }

    const double hardLimit = usableHeight();
    const double target = targetHeight(frames, section);

    // Natural sizes, plus the natural height still unplaced from each position on
    std::vector<double> widths(section.size());
    std::vector<double> heights(section.size());
    std::vector<double> remaining(section.size() + 1, 0.0);
    for (int k = 0; k < section.size(); ++k) {
        const FrameExtent& extent = frames[section.start + k];
        double scale = naturalScale(extent);
        widths[k] = extent.width * scale;
        heights[k] = extent.height * scale;
    }
    for (int k = section.size() - 1; k >= 0; --k) {
        remaining[k] = remaining[k + 1] + heights[k];
    }

    Page current;
    current.sectionIndex = sectionIndex;

    auto closeCurrent = [&]() {
        if (!current.placements.empty()) {
            centerOnPage(current);
            pages.push_back(std::move(current));
        }
        current = Page();
        current.sectionIndex = sectionIndex;
    };

    for (int k = 0; k < section.size(); ++k) {
        const int position = section.start + k;

        if (heights[k] > hardLimit) {
            closeCurrent();
            pages.push_back(forcedPage(frames, position, sectionIndex));
            continue;
        }

        const bool empty = current.placements.empty();
        const double withNext = empty ? heights[k]
                                      : current.contentHeight + m_geometry.spacing + heights[k];

        if (!empty) {
            bool overflows = withNext > hardLimit;
            bool framesAfter = section.end - position - 1 > 0;
            bool balanceBreak = current.contentHeight > BALANCE_START_FRACTION * target &&
                                withNext > target &&
                                framesAfter &&
                                remaining[k] > BALANCE_REMAINDER_FRACTION * hardLimit;
            if (overflows || balanceBreak) {
                closeCurrent();
            }
        }

        Placement placement;
        placement.frameIndex = position;
        placement.width = widths[k];
        placement.height = heights[k];
        if (!current.placements.empty()) {
            current.contentHeight += m_geometry.spacing;
        }
        current.contentHeight += heights[k];
        current.placements.push_back(placement);
    }
    closeCurrent();

    return pages;
}

Page PagePacker::forcedPage(const std::vector<FrameExtent>& frames, int position, int sectionIndex) const
{
    const FrameExtent& extent = frames[position];
    double scale = std::min(usableWidth() / extent.width, usableHeight() / extent.height);

    Page page;
    page.sectionIndex = sectionIndex;
    page.oversized = true;

    Placement placement;
    placement.frameIndex = position;
    placement.width = extent.width * scale;
    placement.height = extent.height * scale;
    page.placements.push_back(placement);
    page.contentHeight = placement.height;

    centerOnPage(page);
    return page;
}

void PagePacker::centerOnPage(Page& page) const
{
    double y = (m_geometry.height - page.contentHeight) / 2.0;
    for (Placement& placement : page.placements) {
        placement.x = (m_geometry.width - placement.width) / 2.0;
        placement.y = y;
        y += placement.height + m_geometry.spacing;
    }
}

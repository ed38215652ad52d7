#include "sectionplanner.h"
#include "pipelineerrors.h"
#include <algorithm>
#include <string>

std::vector<int> SectionPlanner::normalizeBreaks(int frameCount, const std::vector<int>& breaks)
{
    for (int b : breaks) {
        // A break after the last frame would open an empty trailing section
        if (b < 0 || b >= frameCount - 1) {
            throw InvalidBreakError("Page break after frame " + std::to_string(b) +
                                    " is outside the valid range [0, " +
                                    std::to_string(frameCount - 1) + ")",
                                    b, frameCount);
        }
    }

    std::vector<int> sorted = breaks;
    std::sort(sorted.begin(), sorted.end());
    sorted.erase(std::unique(sorted.begin(), sorted.end()), sorted.end());
    return sorted;
}

std::vector<Section> SectionPlanner::plan(int frameCount, const std::vector<int>& breaks)
{
    std::vector<Section> sections;
    if (frameCount <= 0) {
        return sections;
    }

    int start = 0;
    for (int b : normalizeBreaks(frameCount, breaks)) {
        sections.push_back(Section{start, b + 1});
        start = b + 1;
    }
    sections.push_back(Section{start, frameCount});

    return sections;
}

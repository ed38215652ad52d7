#ifndef SECTIONPLANNER_H
#define SECTIONPLANNER_H

#include <vector>

/**
 * Half-open range [start, end) of frame positions laid out independently
 */
struct Section {
    int start = 0;
    int end = 0;

    int size() const { return end - start; }
    bool contains(int position) const { return position >= start && position < end; }
};

/**
 * Splits a frame sequence into sections at manual page breaks.
 *
 * A break b means frame b is the last frame of its section, so breaks
 * b1 < ... < bn yield [0, b1+1), [b1+1, b2+1), ..., [bn+1, N).
 */
class SectionPlanner
{
public:
    /**
     * @param frameCount Number of kept frames N
     * @param breaks Manual break indices, any order, duplicates allowed
     * @return Sections covering [0, N) in order; empty when N is 0
     * @throws InvalidBreakError if a break lies outside [0, N-1)
     */
    static std::vector<Section> plan(int frameCount, const std::vector<int>& breaks);

    /**
     * Sorted, deduplicated, validated copy of the break list
     * @throws InvalidBreakError if a break lies outside [0, N-1)
     */
    static std::vector<int> normalizeBreaks(int frameCount, const std::vector<int>& breaks);
};

#endif // SECTIONPLANNER_H

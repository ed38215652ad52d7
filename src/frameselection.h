#ifndef FRAMESELECTION_H
#define FRAMESELECTION_H

#include <QList>
#include <set>

/**
 * Set of selected positions in a frame sequence, plus the anchor that range
 * extension starts from.
 *
 * Combination rules:
 * - replace(i): selection becomes {i}, anchor becomes i
 * - toggle(i): i is added if absent and removed if present, anchor becomes i
 * - extendTo(i): selection becomes every position between anchor and i
 *   inclusive; the anchor is kept. Without an anchor this is replace(i)
 * - clear(): empty selection, no anchor
 */
class FrameSelection
{
public:
    void replace(int position);
    void toggle(int position);
    void extendTo(int position);
    void clear();

    bool contains(int position) const { return m_positions.count(position) > 0; }
    bool isEmpty() const { return m_positions.empty(); }
    bool isSingle() const { return m_positions.size() == 1; }
    int count() const { return static_cast<int>(m_positions.size()); }
    int anchor() const { return m_anchor; }

    /**
     * Selected positions in ascending order
     */
    QList<int> indices() const;

    /**
     * Drop positions at or beyond size, e.g. after frames were deleted
     */
    void clampTo(int size);

private:
    std::set<int> m_positions;
    int m_anchor = -1;
};

#endif // FRAMESELECTION_H

#include "frameselection.h"
#include <algorithm>

void FrameSelection::replace(int position)
{
    m_positions.clear();
    m_positions.insert(position);
    m_anchor = position;
}

void FrameSelection::toggle(int position)
{
    if (!m_positions.erase(position)) {
        m_positions.insert(position);
    }
    m_anchor = position;
}

void FrameSelection::extendTo(int position)
{
    if (m_anchor < 0) {
        replace(position);
        return;
    }

    m_positions.clear();
    int first = std::min(m_anchor, position);
    int last = std::max(m_anchor, position);
    for (int i = first; i <= last; ++i) {
        m_positions.insert(i);
    }
}

void FrameSelection::clear()
{
    m_positions.clear();
    m_anchor = -1;
}

QList<int> FrameSelection::indices() const
{
    QList<int> result;
    for (int position : m_positions) {
        result.append(position);
    }
    return result;
}

void FrameSelection::clampTo(int size)
{
    m_positions.erase(m_positions.lower_bound(size), m_positions.end());
    if (m_anchor >= size) {
        m_anchor = -1;
    }
}

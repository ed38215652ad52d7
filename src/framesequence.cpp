#include "framesequence.h"
#include "framestore.h"
#include <QDebug>
#include <QDir>
#include <QSet>
#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

FrameSequence::FrameSequence(const QStringList& paths)
{
    m_entries.reserve(paths.size());
    for (const QString& path : paths) {
        FrameEntry entry;
        entry.path = path;
        m_entries.push_back(entry);
    }
}

FrameSequence FrameSequence::fromDirectory(const QString& directory)
{
    return FrameSequence(FrameStore::listFrameFiles(directory));
}

const FrameEntry& FrameSequence::at(int position) const
{
    checkPosition(position);
    return m_entries[position];
}

QStringList FrameSequence::paths() const
{
    QStringList result;
    for (const FrameEntry& entry : m_entries) {
        result.append(entry.path);
    }
    return result;
}

bool FrameSequence::moveUp(int position)
{
    if (position <= 0 || position >= size()) {
        return false;
    }
    std::swap(m_entries[position], m_entries[position - 1]);
    return true;
}

bool FrameSequence::moveDown(int position)
{
    if (position < 0 || position >= size() - 1) {
        return false;
    }
    std::swap(m_entries[position], m_entries[position + 1]);
    return true;
}

void FrameSequence::remove(const QList<int>& positions)
{
    QList<int> sorted = positions;
    std::sort(sorted.begin(), sorted.end());
    sorted.erase(std::unique(sorted.begin(), sorted.end()), sorted.end());

    for (int position : sorted) {
        checkPosition(position);
    }

    // Delete from the back so earlier positions stay valid
    for (auto it = sorted.rbegin(); it != sorted.rend(); ++it) {
        m_entries.erase(m_entries.begin() + *it);
    }
}

void FrameSequence::reorder(const QList<int>& order)
{
    QSet<int> seen;
    std::vector<FrameEntry> reordered;
    reordered.reserve(order.size());

    for (int position : order) {
        if (position < 0 || position >= size()) {
            throw std::invalid_argument("FrameSequence: reorder position " + std::to_string(position) +
                                        " out of range");
        }
        if (seen.contains(position)) {
            throw std::invalid_argument("FrameSequence: reorder position " + std::to_string(position) +
                                        " listed twice");
        }
        seen.insert(position);
        reordered.push_back(m_entries[position]);
    }

    m_entries = std::move(reordered);
}

void FrameSequence::togglePageBreak(const QList<int>& positions)
{
    for (int position : positions) {
        checkPosition(position);
        m_entries[position].pageBreakAfter = !m_entries[position].pageBreakAfter;
    }
}

std::vector<int> FrameSequence::pageBreakIndices() const
{
    std::vector<int> breaks;
    for (int i = 0; i < size(); ++i) {
        if (m_entries[i].pageBreakAfter) {
            breaks.push_back(i);
        }
    }
    return breaks;
}

void FrameSequence::persist(const QString& directory)
{
    // Copy everything aside first: sources may live in the target directory
    StagingArea staging(directory);
    for (const FrameEntry& entry : m_entries) {
        staging.appendFile(entry.path);
    }
    staging.commit();

    QDir target(staging.outputDirectory());
    for (int i = 0; i < size(); ++i) {
        m_entries[i].path = target.absoluteFilePath(FrameStore::frameFileName(i));
    }

    qInfo() << "FrameSequence: persisted" << size() << "frames to" << target.absolutePath();
}

void FrameSequence::checkPosition(int position) const
{
    if (position < 0 || position >= size()) {
        throw std::out_of_range("FrameSequence: position " + std::to_string(position) +
                                " outside sequence of " + std::to_string(size()));
    }
}

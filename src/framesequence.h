#ifndef FRAMESEQUENCE_H
#define FRAMESEQUENCE_H

#include <QList>
#include <QString>
#include <QStringList>
#include <vector>

/**
 * One kept frame as seen by the editing and layout stages
 */
struct FrameEntry {
    QString path;                // Image file backing this frame
    bool pageBreakAfter = false; // Start a new section after this frame
};

/**
 * Owned, ordered sequence of kept frames.
 *
 * Order lives in memory, never in directory listings. Edits (move, delete,
 * reorder, page break toggles) only touch this list; files are renumbered
 * once, by persist().
 */
class FrameSequence
{
public:
    FrameSequence() = default;
    explicit FrameSequence(const QStringList& paths);

    /**
     * Build a sequence from a frames directory, ordered by parsed frame index
     * @param directory Directory of frame_NNNNNN.png files
     */
    static FrameSequence fromDirectory(const QString& directory);

    int size() const { return static_cast<int>(m_entries.size()); }
    bool isEmpty() const { return m_entries.empty(); }
    const FrameEntry& at(int position) const;
    QStringList paths() const;

    /**
     * Swap the frame at position with its predecessor
     * @return false if position is 0 or out of range
     */
    bool moveUp(int position);

    /**
     * Swap the frame at position with its successor
     * @return false if position is the last one or out of range
     */
    bool moveDown(int position);

    /**
     * Delete the frames at the given positions
     * @throws std::out_of_range for a position outside the sequence
     */
    void remove(const QList<int>& positions);

    /**
     * Keep only the listed positions, in the listed order
     * @param order Possibly shorter permutation of existing positions
     * @throws std::invalid_argument on duplicate or out-of-range positions
     */
    void reorder(const QList<int>& order);

    /**
     * Flip the page-break-after flag of each listed position
     */
    void togglePageBreak(const QList<int>& positions);

    /**
     * Positions whose frame is followed by a manual page break, ascending
     */
    std::vector<int> pageBreakIndices() const;

    /**
     * Write the sequence to a directory with contiguous zero-based names,
     * replacing the frames previously stored there
     * @param directory Target frames directory (may be the source directory)
     */
    void persist(const QString& directory);

private:
    void checkPosition(int position) const;

    std::vector<FrameEntry> m_entries;
};

#endif // FRAMESEQUENCE_H

#ifndef FRAMEDEDUPLICATOR_H
#define FRAMEDEDUPLICATOR_H

#include <QObject>
#include <QString>
#include <opencv2/core.hpp>
#include "contentcropper.h"
#include "framecomparator.h"
#include "framesource.h"

class StagingArea;

/**
 * Parameters of one deduplication pass
 */
struct DedupConfig {
    double similarityThreshold = FrameComparator::DEFAULT_THRESHOLD;
    double sampleInterval = 0.0;   // Seconds between candidates, 0 = every frame
    double startTime = -1.0;       // Seconds, negative = from the first frame
    double endTime = -1.0;         // Seconds, negative = to the end of the video
    int cropThreshold = ContentCropper::DEFAULT_THRESHOLD;
    bool pipelined = false;        // Decode on a second thread feeding a bounded queue
    int queueCapacity = 8;
};

/**
 * Statistics of a finished pass
 */
struct DedupResult {
    int candidatesSeen = 0;
    int framesKept = 0;
    int startFrame = 0;
    int endFrame = -1;             // Exclusive, -1 when the pass ran to the end of the source
    int sampleStep = 1;
    double processingTimeSeconds = 0.0;
};

/**
 * Reduces a video to the sequence of frames that differ from their
 * predecessor.
 *
 * A single forward pass moves through Seeking (position the source at the
 * start frame), Streaming (sample, compare, persist) and Done. Each
 * candidate is compared uncropped against the previous kept frame, also
 * uncropped; a kept candidate is cropped to its content and staged. The
 * output directory receives the kept frames only after the pass succeeds,
 * so any exception leaves it untouched.
 */
class FrameDeduplicator : public QObject
{
    Q_OBJECT

public:
    enum class State {
        Idle,
        Seeking,
        Streaming,
        Done
    };
    Q_ENUM(State)

    /**
     * @param config Pass parameters
     * @throws std::invalid_argument if the configuration is invalid
     */
    explicit FrameDeduplicator(const DedupConfig& config, QObject *parent = nullptr);

    /**
     * Check a configuration without running it
     * @throws std::invalid_argument describing the first invalid field
     */
    static void validate(const DedupConfig& config);

    /**
     * Number of source frames between consecutive candidates
     * @param frameRate Frames per second of the source
     * @param sampleInterval Seconds between candidates, 0 for every frame
     */
    static int sampleStep(double frameRate, double sampleInterval);

    /**
     * Frame number corresponding to a time, truncated toward zero
     */
    static int timeToFrame(double seconds, double frameRate);

    /**
     * Run one pass over a source and persist the kept frames
     * @param source Frame source, positioned anywhere
     * @param outputDir Directory that receives frame_000000.png, ...
     * @return Pass statistics
     * @throws AcquisitionError if the source frame rate is unusable
     * @throws DecodeError if a frame fails to decode
     * @throws std::runtime_error if a kept frame cannot be written
     */
    DedupResult run(FrameSource& source, const QString& outputDir);

    const DedupConfig& config() const { return m_config; }
    State state() const { return m_state; }

signals:
    void progressUpdated(int current, int total);
    void stateChanged(FrameDeduplicator::State state);
    void frameKept(int outputIndex, int sourceIndex);

private:
    struct Candidate {
        Frame frame;
        cv::Mat cropped;
    };

    /**
     * Where the pass starts and stops, and how the source advances
     */
    struct Window {
        int start = 0;
        int end = -1;   // Exclusive, -1 = unbounded
        int step = 1;
        int total = 0;  // Expected number of positions, 0 if unknown
    };

    Window planWindow(const FrameSource& source) const;

    /**
     * Read frames until the next candidate inside the window
     * @return false once the window or the source is exhausted
     */
    bool nextCandidate(FrameSource& source, const Window& window, Frame& frame) const;

    void runSequential(FrameSource& source, const Window& window,
                       StagingArea& staging, DedupResult& result);
    void runPipelined(FrameSource& source, const Window& window,
                      StagingArea& staging, DedupResult& result);

    /**
     * Keep-or-drop decision for one candidate, in decode order
     * @param candidate Raw candidate; cropped is filled lazily if empty
     */
    void consider(Candidate& candidate, const Window& window,
                  StagingArea& staging, DedupResult& result);

    void setState(State state);

    DedupConfig m_config;
    FrameComparator m_comparator;
    State m_state;
    cv::Mat m_previousKept;
};

#endif // FRAMEDEDUPLICATOR_H

#include "framededuplicator.h"
#include "boundedqueue.h"
#include "framestore.h"
#include "pipelineerrors.h"
#include <QDebug>
#include <QElapsedTimer>
#include <algorithm>
#include <cmath>
#include <exception>
#include <stdexcept>
#include <thread>

FrameDeduplicator::FrameDeduplicator(const DedupConfig& config, QObject *parent)
    : QObject(parent),
      m_config(config),
      m_comparator(config.similarityThreshold),
      m_state(State::Idle)
{
    validate(m_config);
}

void FrameDeduplicator::validate(const DedupConfig& config)
{
    if (!(config.similarityThreshold > 0.0 && config.similarityThreshold < 1.0)) {
        throw std::invalid_argument("Similarity threshold must lie in (0, 1)");
    }
    if (!(config.sampleInterval >= 0.0) || std::isinf(config.sampleInterval)) {
        throw std::invalid_argument("Sample interval must be a non-negative number of seconds");
    }
    if (config.startTime >= 0.0 && config.endTime >= 0.0 && config.endTime <= config.startTime) {
        throw std::invalid_argument("End time must be after start time");
    }
    if (config.cropThreshold < 0 || config.cropThreshold > 255) {
        throw std::invalid_argument("Crop threshold must lie in [0, 255]");
    }
    if (config.queueCapacity < 1) {
        throw std::invalid_argument("Queue capacity must be at least 1");
    }
}

int FrameDeduplicator::sampleStep(double frameRate, double sampleInterval)
{
    if (sampleInterval <= 0.0) {
        return 1;
    }
    long step = std::lround(frameRate * sampleInterval);
    return static_cast<int>(std::max(1L, step));
}

int FrameDeduplicator::timeToFrame(double seconds, double frameRate)
{
    return static_cast<int>(seconds * frameRate);
}

DedupResult FrameDeduplicator::run(FrameSource& source, const QString& outputDir)
{
    QElapsedTimer timer;
    timer.start();

    m_previousKept.release();
    const Window window = planWindow(source);

    DedupResult result;
    result.startFrame = window.start;
    result.endFrame = window.end;
    result.sampleStep = window.step;

    qDebug() << "FrameDeduplicator: frames" << window.start << "to"
             << (window.end < 0 ? QString("end") : QString::number(window.end))
             << "every" << window.step << "frame(s), threshold" << m_config.similarityThreshold
             << (m_config.pipelined ? "(pipelined)" : "");

    try {
        StagingArea staging(outputDir);

        setState(State::Seeking);
        source.seek(window.start);

        setState(State::Streaming);
        if (m_config.pipelined) {
            runPipelined(source, window, staging, result);
        } else {
            runSequential(source, window, staging, result);
        }

        staging.commit();
    } catch (const std::exception& e) {
        qWarning() << "FrameDeduplicator: pass aborted:" << e.what();
        m_previousKept.release();
        setState(State::Done);
        throw;
    }

    m_previousKept.release();
    setState(State::Done);

    result.processingTimeSeconds = timer.elapsed() / 1000.0;
    qInfo() << "FrameDeduplicator: kept" << result.framesKept << "of"
            << result.candidatesSeen << "candidates in"
            << result.processingTimeSeconds << "s";
    return result;
}

FrameDeduplicator::Window FrameDeduplicator::planWindow(const FrameSource& source) const
{
    const double fps = source.frameRate();
    const bool needsRate = m_config.sampleInterval > 0.0 ||
                           m_config.startTime > 0.0 ||
                           m_config.endTime >= 0.0;
    if (needsRate && !(fps > 0.0)) {
        throw AcquisitionError("Source reports no usable frame rate");
    }

    Window window;
    window.step = sampleStep(fps, m_config.sampleInterval);
    if (m_config.startTime > 0.0) {
        window.start = timeToFrame(m_config.startTime, fps);
    }
    if (m_config.endTime >= 0.0) {
        window.end = timeToFrame(m_config.endTime, fps);
    }

    int limit = source.frameCount();
    if (window.end >= 0 && (limit < 0 || window.end < limit)) {
        limit = window.end;
    }
    window.total = limit >= 0 ? std::max(0, limit - window.start) : 0;
    return window;
}

bool FrameDeduplicator::nextCandidate(FrameSource& source, const Window& window, Frame& frame) const
{
    while (source.read(frame)) {
        const int position = frame.sourceIndex;
        if (window.end >= 0 && position >= window.end) {
            return false;
        }
        // Sources without exact seeking may hand back frames before the start
        if (position < window.start) {
            continue;
        }
        if ((position - window.start) % window.step == 0) {
            return true;
        }
    }
    return false;
}

void FrameDeduplicator::runSequential(FrameSource& source, const Window& window,
                                      StagingArea& staging, DedupResult& result)
{
    Candidate candidate;
    while (nextCandidate(source, window, candidate.frame)) {
        candidate.cropped.release();
        consider(candidate, window, staging, result);
    }
}

void FrameDeduplicator::runPipelined(FrameSource& source, const Window& window,
                                     StagingArea& staging, DedupResult& result)
{
    BoundedQueue<Candidate> queue(m_config.queueCapacity);
    std::exception_ptr decodeError;

    // Decode stage: decode, sample and crop, in source order
    std::thread producer([&]() {
        try {
            Candidate candidate;
            while (nextCandidate(source, window, candidate.frame)) {
                candidate.cropped = ContentCropper::cropBorders(candidate.frame.image,
                                                                m_config.cropThreshold);
                if (!queue.push(std::move(candidate))) {
                    return;
                }
                candidate = Candidate();
            }
            queue.close();
        } catch (...) {
            decodeError = std::current_exception();
            queue.abort();
        }
    });

    // Compare-and-persist stage runs on the calling thread
    try {
        Candidate candidate;
        while (queue.pop(candidate)) {
            consider(candidate, window, staging, result);
        }
    } catch (...) {
        queue.abort();
        producer.join();
        throw;
    }

    producer.join();
    if (decodeError) {
        std::rethrow_exception(decodeError);
    }
}

void FrameDeduplicator::consider(Candidate& candidate, const Window& window,
                                 StagingArea& staging, DedupResult& result)
{
    ++result.candidatesSeen;

    const cv::Mat& image = candidate.frame.image;
    bool keep = m_previousKept.empty() || !m_comparator.isDuplicate(image, m_previousKept);

    if (keep) {
        if (candidate.cropped.empty()) {
            candidate.cropped = ContentCropper::cropBorders(image, m_config.cropThreshold);
        }
        int outputIndex = staging.append(candidate.cropped);
        m_previousKept = image;
        ++result.framesKept;
        emit frameKept(outputIndex, candidate.frame.sourceIndex);
    }

    emit progressUpdated(candidate.frame.sourceIndex - window.start + 1, window.total);
}

void FrameDeduplicator::setState(State state)
{
    if (m_state != state) {
        m_state = state;
        emit stateChanged(state);
    }
}

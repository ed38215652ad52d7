#ifndef PIPELINEERRORS_H
#define PIPELINEERRORS_H

#include <stdexcept>
#include <string>

/**
 * Base class for every fatal condition raised by the extraction and layout
 * pipeline. Carries the frame index (and section index for layout errors)
 * the failure relates to, or -1 when the failure is not tied to one.
 */
class PipelineError : public std::runtime_error
{
public:
    explicit PipelineError(const std::string& message,
                           int frameIndex = -1,
                           int sectionIndex = -1)
        : std::runtime_error(message),
          m_frameIndex(frameIndex),
          m_sectionIndex(sectionIndex)
    {}

    int frameIndex() const { return m_frameIndex; }
    int sectionIndex() const { return m_sectionIndex; }

private:
    int m_frameIndex;
    int m_sectionIndex;
};

/**
 * Source video or frame image is missing or unreadable. No output is produced.
 */
class AcquisitionError : public PipelineError
{
public:
    using PipelineError::PipelineError;
};

/**
 * A frame could not be decoded mid-stream. Fatal for the whole pass.
 */
class DecodeError : public PipelineError
{
public:
    using PipelineError::PipelineError;
};

/**
 * No frames were found when building a document.
 */
class EmptyInputError : public PipelineError
{
public:
    using PipelineError::PipelineError;
};

/**
 * A manual page break index lies outside [0, N-1).
 */
class InvalidBreakError : public PipelineError
{
public:
    InvalidBreakError(const std::string& message, int breakIndex, int frameCount)
        : PipelineError(message, breakIndex),
          m_frameCount(frameCount)
    {}

    int breakIndex() const { return frameIndex(); }
    int frameCount() const { return m_frameCount; }

private:
    int m_frameCount;
};

#endif // PIPELINEERRORS_H

#include "stream_aggregator.h"

// ---------------------------------------------------------------------------
// Convenience batch API
// ---------------------------------------------------------------------------

Result<SemanticResponse> StreamAggregator::aggregate(const QList<StreamFrame>& frames)
{
    reset();
    for (const StreamFrame& frame : frames) {
        addFrame(frame);
    }
    return finalize();
}

// ---------------------------------------------------------------------------
// Incremental frame ingestion
// ---------------------------------------------------------------------------

void StreamAggregator::addFrame(const StreamFrame& frame)
{
    if (m_hasFailed)
        return;

    if (frame.type != FrameType::Ignored)
        m_sawFrame = true;
    if (!frame.responseId.isEmpty() && m_responseId.isEmpty())
        m_responseId = frame.responseId;
    if (!frame.model.isEmpty() && m_modelUsed.isEmpty())
        m_modelUsed = frame.model;

    switch (frame.type) {
    case FrameType::Started:
    case FrameType::Ignored:
        break;

    case FrameType::Delta:
        m_deltaText += frame.text();
        break;

    case FrameType::ItemCompleted:
        // Only used when the stream never carried deltas.
        m_itemText += frame.text();
        break;

    case FrameType::Finished:
        m_stopCause = frame.stopCause;
        if (frame.usage)
            m_usage = frame.usage;
        break;

    case FrameType::Failed:
        m_hasFailed = true;
        m_lastFailure = frame.failure;
        break;
    }
}

// ---------------------------------------------------------------------------
// Finalize: build the SemanticResponse from accumulated state
// ---------------------------------------------------------------------------

Result<SemanticResponse> StreamAggregator::finalize()
{
    if (m_hasFailed) {
        DomainFailure failure = m_lastFailure;
        reset();
        return std::unexpected(failure);
    }

    if (!m_sawFrame) {
        reset();
        return std::unexpected(DomainFailure::malformedUpstream(
            QStringLiteral("Backend event stream contained no recognizable events")));
    }

    Candidate candidate;
    candidate.index = 0;
    candidate.role = QStringLiteral("assistant");
    candidate.stopCause = m_stopCause;
    candidate.output.append(Segment::fromText(m_deltaText.isEmpty() ? m_itemText : m_deltaText));

    SemanticResponse response;
    response.responseId = m_responseId;
    response.modelUsed = m_modelUsed;
    response.usage = m_usage;
    response.candidates.append(candidate);

    reset();
    return response;
}

// ---------------------------------------------------------------------------
// Reset all accumulated state
// ---------------------------------------------------------------------------

void StreamAggregator::reset()
{
    m_responseId.clear();
    m_modelUsed.clear();
    m_deltaText.clear();
    m_itemText.clear();
    m_sawFrame = false;
    m_stopCause = StopCause::Completed;
    m_usage.reset();
    m_lastFailure = DomainFailure{};
    m_hasFailed = false;
}

#include "stream_state.h"
#include "core/log_manager.h"

ChatStreamState::ChatStreamState(const QString& responseId, const QString& clientModel)
    : m_responseId(responseId)
    , m_clientModel(clientModel)
{
}

QList<StreamFrame> ChatStreamState::apply(const StreamFrame& upstream)
{
    QList<StreamFrame> out;
    if (m_terminated)
        return out;

    if (upstream.type == FrameType::Failed)
        return fail(upstream.failure);

    openRole(out);

    switch (upstream.type) {
    case FrameType::Delta: {
        const QString text = upstream.text();
        if (text.isEmpty())
            break;
        m_accumulatedText += text;
        StreamFrame frame = makeFrame(FrameType::Delta);
        frame.deltaSegments.append(Segment::fromText(text));
        out.append(frame);
        break;
    }
    case FrameType::ItemCompleted:
        m_fallbackText += upstream.text();
        break;
    case FrameType::Finished:
        complete(upstream.stopCause, upstream.usage, out);
        break;
    case FrameType::Started:
    case FrameType::Ignored:
    case FrameType::Failed:
        break;
    }

    return out;
}

QList<StreamFrame> ChatStreamState::finishUpstream()
{
    QList<StreamFrame> out;
    if (m_terminated)
        return out;

    if (m_phase == Phase::Started) {
        return fail(DomainFailure::malformedUpstream(
            QStringLiteral("Backend closed the event stream without sending any events")));
    }

    LOG_WARNING(QStringLiteral("Stream %1: upstream ended without a terminal event")
                    .arg(m_responseId));
    complete(StopCause::Completed, std::nullopt, out);
    return out;
}

QList<StreamFrame> ChatStreamState::fail(const DomainFailure& failure)
{
    QList<StreamFrame> out;
    if (m_terminated)
        return out;

    m_phase = Phase::Failed;
    m_finishReason = FinishReason::Error;
    m_terminated = true;

    StreamFrame frame = makeFrame(FrameType::Failed);
    frame.failure = failure;
    frame.isFinal = true;
    out.append(frame);
    return out;
}

StreamFrame ChatStreamState::makeFrame(FrameType type) const
{
    StreamFrame frame;
    frame.type = type;
    frame.responseId = m_responseId;
    frame.model = m_clientModel;
    return frame;
}

void ChatStreamState::openRole(QList<StreamFrame>& out)
{
    if (m_phase != Phase::Started)
        return;
    m_phase = Phase::Streaming;
    out.append(makeFrame(FrameType::Started));
}

void ChatStreamState::complete(StopCause cause, const std::optional<UsageEntry>& usage,
                               QList<StreamFrame>& out)
{
    if (m_accumulatedText.isEmpty() && !m_fallbackText.isEmpty()) {
        m_accumulatedText = m_fallbackText;
        StreamFrame frame = makeFrame(FrameType::Delta);
        frame.deltaSegments.append(Segment::fromText(m_fallbackText));
        out.append(frame);
    }

    m_phase = Phase::Completed;
    m_finishReason = cause == StopCause::Length ? FinishReason::Length : FinishReason::Stop;
    m_terminated = true;

    StreamFrame frame = makeFrame(FrameType::Finished);
    frame.stopCause = cause;
    frame.usage = usage;
    frame.isFinal = true;
    out.append(frame);
}

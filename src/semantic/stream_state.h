#pragma once
#include "frame.h"
#include "failure.h"
#include "types.h"
#include <QList>
#include <QString>

// Per-request streaming state machine:
//   Started -> Streaming -> Completed | Failed
// Consumes decoded backend frames in arrival order and produces the
// client-facing frames to encode. Owned by exactly one request.
class ChatStreamState {
public:
    enum class Phase { Started, Streaming, Completed, Failed };

    ChatStreamState(const QString& responseId, const QString& clientModel);

    QList<StreamFrame> apply(const StreamFrame& upstream);

    // The upstream byte stream ended. Completes a stream that already
    // produced output, fails one that produced nothing.
    QList<StreamFrame> finishUpstream();

    QList<StreamFrame> fail(const DomainFailure& failure);

    Phase phase() const { return m_phase; }
    bool isTerminated() const { return m_terminated; }
    const QString& accumulatedText() const { return m_accumulatedText; }
    FinishReason finishReason() const { return m_finishReason; }
    const QString& responseId() const { return m_responseId; }

private:
    QString m_responseId;
    QString m_clientModel;
    QString m_accumulatedText;
    QString m_fallbackText;
    Phase m_phase = Phase::Started;
    FinishReason m_finishReason = FinishReason::Unset;
    bool m_terminated = false;

    StreamFrame makeFrame(FrameType type) const;
    void openRole(QList<StreamFrame>& out);
    void complete(StopCause cause, const std::optional<UsageEntry>& usage,
                  QList<StreamFrame>& out);
};

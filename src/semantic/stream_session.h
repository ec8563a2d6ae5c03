#pragma once
#include "ports.h"
#include "features/sse_parser.h"
#include <QObject>
#include <QNetworkReply>
#include <QPointer>

// Binds one upstream event stream to the SSE parser and the outbound chunk
// decoder. The session owns the upstream device.
class StreamSession : public QObject {
    Q_OBJECT
public:
    explicit StreamSession(QIODevice* upstream,
                           IOutboundAdapter* outbound,
                           QObject* parent = nullptr);
    ~StreamSession() override;

    void abort();

    // Stop draining the upstream device; unread bytes stay in its buffer
    // and TCP flow control slows the backend down.
    void pause();
    void resume();
    bool isPaused() const { return m_paused; }

signals:
    void frameReady(const StreamFrame& frame);
    void finished();
    void error(const DomainFailure& failure);

private slots:
    void onReadyRead();
    void onUpstreamFinished();
    void onMetaDataChanged();
    void onReplyError(QNetworkReply::NetworkError code);

private:
    QPointer<QIODevice> m_upstream;
    QNetworkReply* m_reply = nullptr;
    IOutboundAdapter* m_outbound;
    SseParser m_parser;
    QByteArray m_rejectedBody;
    int m_rejectedStatus = 0;
    bool m_htmlBody = false;
    bool m_done = false;
    bool m_aborted = false;
    bool m_paused = false;
    bool m_finishPending = false;

    void dispatch(const QList<SseEvent>& events, bool trailing = false);
    void finishOk();
    void failWith(const DomainFailure& failure);
};

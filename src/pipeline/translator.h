#pragma once
#include "middleware.h"
#include "semantic/ports.h"
#include "semantic/stream_state.h"
#include <QObject>
#include <QList>
#include <QPointer>
#include <functional>
#include <memory>
#include <vector>

class StreamSession;

// Client side of one streamed request: runs backend frames through the
// state machine, the middlewares and the inbound encoder.
class TranslatorStreamSession : public QObject {
    Q_OBJECT
public:
    TranslatorStreamSession(StreamSession* upstream,
                            IInboundAdapter* inbound,
                            const QList<IPipelineMiddleware*>& middlewares,
                            const QString& responseId,
                            const QString& clientModel,
                            QObject* parent = nullptr);

    void abort();
    void pause();
    void resume();

    const ChatStreamState& state() const { return m_state; }

signals:
    void encodedFrameReady(const QByteArray& chunk);
    // Terminal success; the caller writes the [DONE] sentinel.
    void completed();
    // Terminal failure. When `chunkSent` is false nothing reached the
    // client yet and a plain error response can still be written.
    void failed(const DomainFailure& failure, bool chunkSent);

private slots:
    void onUpstreamFrame(const StreamFrame& frame);
    void onUpstreamFinished();
    void onUpstreamError(const DomainFailure& failure);

private:
    QPointer<StreamSession> m_upstream;
    IInboundAdapter* m_inbound;
    QList<IPipelineMiddleware*> m_middlewares;
    ChatStreamState m_state;
    bool m_sentAny = false;
    bool m_closed = false;

    void deliver(const QList<StreamFrame>& frames);
    void failWith(const DomainFailure& failure);
    void stopUpstream();
};

class Translator : public QObject {
    Q_OBJECT
public:
    using EncodedHandler = std::function<void(Result<QByteArray>)>;

    Translator(IInboundAdapter* inbound,
               IOutboundAdapter* outbound,
               IExecutor* executor,
               QObject* parent = nullptr);

    void addMiddleware(std::unique_ptr<IPipelineMiddleware> mw);

    // Decodes the client body and runs the request middlewares (model
    // routing among them). Rejections surface here, before any backend call.
    Result<SemanticRequest> prepare(const QByteArray& requestBody,
                                    const QMap<QString, QString>& metadata);

    // Single-shot translation; `done` receives the encoded client response.
    void process(SemanticRequest request, EncodedHandler done);

    // The returned session is parented to the translator; callers
    // deleteLater() it once it reports a terminal signal.
    Result<TranslatorStreamSession*> processStream(SemanticRequest request);

    QByteArray encodeFailure(const DomainFailure& failure) const;

    static QString newResponseId();

private:
    IInboundAdapter* m_inbound;
    IOutboundAdapter* m_outbound;
    IExecutor* m_executor;
    std::vector<std::unique_ptr<IPipelineMiddleware>> m_middlewares;

    QList<IPipelineMiddleware*> reversedMiddlewares() const;
};

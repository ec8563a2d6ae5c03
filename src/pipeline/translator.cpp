#include "translator.h"
#include "semantic/stream_session.h"
#include "core/log_manager.h"
#include <QUuid>

// ========== TranslatorStreamSession ==========

TranslatorStreamSession::TranslatorStreamSession(
        StreamSession* upstream,
        IInboundAdapter* inbound,
        const QList<IPipelineMiddleware*>& middlewares,
        const QString& responseId,
        const QString& clientModel,
        QObject* parent)
    : QObject(parent)
    , m_upstream(upstream)
    , m_inbound(inbound)
    , m_middlewares(middlewares)
    , m_state(responseId, clientModel)
{
    m_upstream->setParent(this);

    connect(m_upstream, &StreamSession::frameReady,
            this, &TranslatorStreamSession::onUpstreamFrame);
    connect(m_upstream, &StreamSession::finished,
            this, &TranslatorStreamSession::onUpstreamFinished);
    connect(m_upstream, &StreamSession::error,
            this, &TranslatorStreamSession::onUpstreamError);
}

void TranslatorStreamSession::abort() {
    m_closed = true;
    stopUpstream();
}

void TranslatorStreamSession::pause() {
    if (m_upstream) m_upstream->pause();
}

void TranslatorStreamSession::resume() {
    if (m_upstream) m_upstream->resume();
}

void TranslatorStreamSession::onUpstreamFrame(const StreamFrame& frame) {
    deliver(m_state.apply(frame));
}

void TranslatorStreamSession::onUpstreamFinished() {
    deliver(m_state.finishUpstream());
}

void TranslatorStreamSession::onUpstreamError(const DomainFailure& failure) {
    deliver(m_state.fail(failure));
}

void TranslatorStreamSession::deliver(const QList<StreamFrame>& frames) {
    if (m_closed)
        return;

    for (StreamFrame f : frames) {
        for (auto* mw : m_middlewares) {
            auto r = mw->onFrame(std::move(f));
            if (!r) {
                failWith(r.error());
                return;
            }
            f = *r;
        }

        if (f.type == FrameType::Failed) {
            m_closed = true;
            stopUpstream();
            if (m_sentAny) {
                auto encoded = m_inbound->encodeStreamFrame(f);
                if (encoded)
                    emit encodedFrameReady(*encoded);
                else
                    LOG_ERROR(QStringLiteral("Failed to encode error chunk: %1")
                                  .arg(encoded.error().message));
            }
            emit failed(f.failure, m_sentAny);
            return;
        }

        auto encoded = m_inbound->encodeStreamFrame(f);
        if (!encoded) {
            failWith(encoded.error());
            return;
        }
        m_sentAny = true;
        emit encodedFrameReady(*encoded);

        if (f.isFinal) {
            m_closed = true;
            stopUpstream();
            emit completed();
            return;
        }
    }
}

void TranslatorStreamSession::failWith(const DomainFailure& failure) {
    const QList<StreamFrame> frames = m_state.fail(failure);
    if (!frames.isEmpty()) {
        deliver(frames);
        return;
    }
    // The state machine already terminated; close without another chunk.
    m_closed = true;
    stopUpstream();
    emit failed(failure, m_sentAny);
}

void TranslatorStreamSession::stopUpstream() {
    if (m_upstream) {
        disconnect(m_upstream, nullptr, this, nullptr);
        m_upstream->abort();
    }
}

// ========== Translator ==========

Translator::Translator(IInboundAdapter* inbound,
                       IOutboundAdapter* outbound,
                       IExecutor* executor,
                       QObject* parent)
    : QObject(parent)
    , m_inbound(inbound)
    , m_outbound(outbound)
    , m_executor(executor)
{
}

void Translator::addMiddleware(std::unique_ptr<IPipelineMiddleware> mw) {
    m_middlewares.push_back(std::move(mw));
}

QString Translator::newResponseId() {
    return QStringLiteral("chatcmpl-") + QUuid::createUuid().toString(QUuid::WithoutBraces);
}

Result<SemanticRequest> Translator::prepare(const QByteArray& requestBody,
                                            const QMap<QString, QString>& metadata) {
    auto decoded = m_inbound->decodeRequest(requestBody, metadata);
    if (!decoded) return std::unexpected(decoded.error());

    SemanticRequest req = *decoded;

    // Forward through middlewares in order
    for (auto& mw : m_middlewares) {
        auto r = mw->onRequest(std::move(req));
        if (!r) return std::unexpected(r.error());
        req = *r;
    }
    return req;
}

void Translator::process(SemanticRequest request, EncodedHandler done) {
    auto built = m_outbound->buildRequest(request);
    if (!built) {
        done(std::unexpected(built.error()));
        return;
    }

    const QString clientModel = request.target.logicalModel;
    QPointer<Translator> self(this);

    m_executor->execute(*built, [self, clientModel, done](Result<ProviderResponse> reply) {
        if (!self) return;
        if (!reply) {
            done(std::unexpected(reply.error()));
            return;
        }

        auto parsed = self->m_outbound->parseResponse(*reply);
        if (!parsed) {
            done(std::unexpected(parsed.error()));
            return;
        }

        SemanticResponse response = *parsed;
        response.responseId = newResponseId();
        response.modelUsed = clientModel;

        // Reverse through middlewares
        for (auto* mw : self->reversedMiddlewares()) {
            auto r = mw->onResponse(std::move(response));
            if (!r) {
                done(std::unexpected(r.error()));
                return;
            }
            response = *r;
        }

        done(self->m_inbound->encodeResponse(response));
    });
}

Result<TranslatorStreamSession*> Translator::processStream(SemanticRequest request) {
    request.stream = true;
    auto built = m_outbound->buildRequest(request);
    if (!built) return std::unexpected(built.error());

    auto device = m_executor->connectStream(*built);
    if (!device) return std::unexpected(device.error());

    auto* upstream = new StreamSession(*device, m_outbound);
    return new TranslatorStreamSession(upstream, m_inbound, reversedMiddlewares(),
                                       newResponseId(), request.target.logicalModel, this);
}

QByteArray Translator::encodeFailure(const DomainFailure& failure) const {
    auto encoded = m_inbound->encodeFailure(failure);
    if (encoded) return *encoded;
    LOG_ERROR(QStringLiteral("Failed to encode error body: %1").arg(encoded.error().message));
    return QByteArrayLiteral("{\"error\":{\"message\":\"internal error\",\"type\":\"proxy_error\",\"code\":\"internal_error\"}}");
}

QList<IPipelineMiddleware*> Translator::reversedMiddlewares() const {
    QList<IPipelineMiddleware*> list;
    list.reserve(m_middlewares.size());
    for (int i = static_cast<int>(m_middlewares.size()) - 1; i >= 0; --i)
        list.append(m_middlewares[i].get());
    return list;
}

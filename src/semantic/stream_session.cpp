#include "stream_session.h"
#include "core/log_manager.h"

StreamSession::StreamSession(QIODevice* upstream,
                             IOutboundAdapter* outbound,
                             QObject* parent)
    : QObject(parent)
    , m_upstream(upstream)
    , m_outbound(outbound)
{
    Q_ASSERT(m_upstream);
    Q_ASSERT(m_outbound);

    // Take ownership of the device so it is cleaned up with this session
    m_upstream->setParent(this);

    connect(m_upstream, &QIODevice::readyRead,
            this, &StreamSession::onReadyRead);

    m_reply = qobject_cast<QNetworkReply*>(upstream);
    if (m_reply) {
        connect(m_reply, &QNetworkReply::metaDataChanged,
                this, &StreamSession::onMetaDataChanged);
        connect(m_reply, &QNetworkReply::errorOccurred,
                this, &StreamSession::onReplyError);
        connect(m_reply, &QNetworkReply::finished,
                this, &StreamSession::onUpstreamFinished);
    } else {
        connect(m_upstream, &QIODevice::readChannelFinished,
                this, &StreamSession::onUpstreamFinished);
    }
}

StreamSession::~StreamSession()
{
    if (m_reply && m_reply->isRunning()) {
        disconnect(m_reply, nullptr, this, nullptr);
        m_reply->abort();
    }
}

void StreamSession::abort()
{
    if (m_done)
        return;
    m_aborted = true;
    m_done = true;
    if (m_reply) {
        m_reply->abort();
    } else if (m_upstream) {
        m_upstream->close();
    }
    LOG_DEBUG(QStringLiteral("StreamSession: upstream aborted"));
}

void StreamSession::pause()
{
    m_paused = true;
}

void StreamSession::resume()
{
    if (!m_paused)
        return;
    m_paused = false;

    if (m_upstream && m_upstream->bytesAvailable() > 0)
        onReadyRead();
    if (m_finishPending) {
        m_finishPending = false;
        onUpstreamFinished();
    }
}

void StreamSession::onMetaDataChanged()
{
    if (!m_reply)
        return;

    const int status = m_reply->attribute(
        QNetworkRequest::HttpStatusCodeAttribute).toInt();
    if (status >= 400)
        m_rejectedStatus = status;

    const QString contentType = m_reply->header(
        QNetworkRequest::ContentTypeHeader).toString();
    if (contentType.contains(QStringLiteral("text/html"), Qt::CaseInsensitive))
        m_htmlBody = true;
}

void StreamSession::onReadyRead()
{
    if (m_done || m_paused || !m_upstream)
        return;

    const QByteArray bytes = m_upstream->readAll();
    if (m_rejectedStatus > 0 || m_htmlBody) {
        // Collected whole and classified once the reply finishes.
        m_rejectedBody.append(bytes);
        return;
    }

    dispatch(m_parser.feed(bytes));
}

void StreamSession::onUpstreamFinished()
{
    if (m_done)
        return;
    if (m_paused) {
        m_finishPending = true;
        return;
    }

    const QByteArray rest = m_upstream ? m_upstream->readAll() : QByteArray();

    if (m_rejectedStatus > 0) {
        m_rejectedBody.append(rest);
        failWith(m_outbound->mapFailure(m_rejectedStatus, m_rejectedBody));
        return;
    }
    if (m_htmlBody) {
        failWith(DomainFailure::malformedUpstream(
            QStringLiteral("Backend returned an HTML page instead of an event stream")));
        return;
    }

    dispatch(m_parser.feed(rest));
    if (!m_done)
        dispatch(m_parser.flush(), true);
    if (!m_done)
        finishOk();
}

void StreamSession::onReplyError(QNetworkReply::NetworkError code)
{
    if (m_done || m_aborted)
        return;

    // HTTP-level errors still deliver a body; classify it on finish.
    const int status = m_reply->attribute(
        QNetworkRequest::HttpStatusCodeAttribute).toInt();
    if (status >= 400) {
        m_rejectedStatus = status;
        return;
    }

    DomainFailure failure;

    switch (code) {
    case QNetworkReply::NoError:
        return;

    case QNetworkReply::OperationCanceledError:
    case QNetworkReply::TimeoutError:
        failure = DomainFailure::timeout(
            QStringLiteral("Backend stream timed out"));
        break;

    case QNetworkReply::ConnectionRefusedError:
    case QNetworkReply::RemoteHostClosedError:
    case QNetworkReply::HostNotFoundError:
    case QNetworkReply::UnknownNetworkError:
    case QNetworkReply::TemporaryNetworkFailureError:
    case QNetworkReply::NetworkSessionFailedError:
        failure = DomainFailure::unavailable(
            QStringLiteral("Network error: %1").arg(m_reply->errorString()));
        break;

    default:
        failure = DomainFailure::unavailable(
            QStringLiteral("Stream network error (%1): %2")
                .arg(static_cast<int>(code))
                .arg(m_reply->errorString()));
        break;
    }

    failWith(failure);
}

void StreamSession::dispatch(const QList<SseEvent>& events, bool trailing)
{
    for (const SseEvent& event : events) {
        if (m_done)
            return;

        if (event.foreign) {
            failWith(DomainFailure::malformedUpstream(
                QStringLiteral("Backend sent a non-SSE payload: %1")
                    .arg(QString::fromUtf8(event.data.left(120)))));
            return;
        }

        if (event.data == "[DONE]") {
            finishOk();
            return;
        }

        if (event.data.isEmpty())
            continue;

        ProviderChunk chunk;
        chunk.type = event.type;
        chunk.data = event.data;

        Result<StreamFrame> result = m_outbound->parseChunk(chunk);
        if (!result && trailing) {
            // Unterminated record cut off by the connection closing.
            LOG_WARNING(QStringLiteral("StreamSession: dropping truncated trailing record: %1")
                            .arg(result.error().message));
            continue;
        }
        if (!result) {
            failWith(result.error());
            return;
        }
        emit frameReady(*result);
    }
}

void StreamSession::finishOk()
{
    m_done = true;
    emit finished();
}

void StreamSession::failWith(const DomainFailure& failure)
{
    LOG_ERROR(QStringLiteral("StreamSession error [%1]: %2")
                  .arg(failure.code, failure.message));
    m_done = true;
    emit error(failure);
}

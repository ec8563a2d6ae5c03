#include "proxy_server.h"
#include "core/log_manager.h"
#include "pipeline/translator.h"
#include "routing/model_router.h"

#include <QDateTime>
#include <QHostAddress>
#include <QJsonDocument>
#include <QJsonObject>
#include <QPointer>

// ========================================================================
// Construction / destruction
// ========================================================================

ProxyServer::ProxyServer(const BridgeConfig& config, Translator* translator, QObject* parent)
    : QObject(parent)
    , m_config(config)
    , m_translator(translator)
{
    m_router.registerDefaults();
}

ProxyServer::~ProxyServer()
{
    stop();
}

// ========================================================================
// start / stop
// ========================================================================

bool ProxyServer::start()
{
    if (m_server) {
        stop();
    }

    QHostAddress address;
    if (!address.setAddress(m_config.runtime.listenAddress)) {
        LOG_ERROR(QStringLiteral("ProxyServer: invalid listen address '%1'")
                      .arg(m_config.runtime.listenAddress));
        return false;
    }

    m_server = new QTcpServer(this);
    connect(m_server, &QTcpServer::newConnection,
            this, &ProxyServer::onNewConnection);

    const quint16 port = static_cast<quint16>(m_config.runtime.port);
    if (!m_server->listen(address, port)) {
        LOG_ERROR(QStringLiteral("ProxyServer: failed to listen on %1:%2 - %3")
                      .arg(m_config.runtime.listenAddress)
                      .arg(port)
                      .arg(m_server->errorString()));
        delete m_server;
        m_server = nullptr;
        return false;
    }

    LOG_INFO(QStringLiteral("ProxyServer: listening on %1:%2")
                 .arg(m_config.runtime.listenAddress)
                 .arg(m_server->serverPort()));
    return true;
}

void ProxyServer::stop()
{
    if (!m_server) {
        return;
    }

    // Abort all active streaming sessions
    for (auto it = m_activeStreams.begin(); it != m_activeStreams.end(); ++it) {
        if (it.value().session) {
            it.value().session->abort();
            it.value().session->deleteLater();
        }
    }
    m_activeStreams.clear();

    const QList<QTcpSocket*> sockets = m_pendingData.keys();
    m_pendingData.clear();
    m_busy.clear();
    for (QTcpSocket* socket : sockets)
        socket->disconnectFromHost();

    m_server->close();
    delete m_server;
    m_server = nullptr;

    LOG_INFO(QStringLiteral("ProxyServer: stopped"));
}

bool ProxyServer::isRunning() const
{
    return m_server && m_server->isListening();
}

quint16 ProxyServer::serverPort() const
{
    return m_server ? m_server->serverPort() : 0;
}

// ========================================================================
// Socket events
// ========================================================================

void ProxyServer::onNewConnection()
{
    while (m_server->hasPendingConnections()) {
        QTcpSocket* socket = m_server->nextPendingConnection();
        if (!socket) {
            continue;
        }

        m_pendingData.insert(socket, QByteArray());
        connect(socket, &QTcpSocket::readyRead,
                this, &ProxyServer::onSocketReadyRead);
        connect(socket, &QTcpSocket::disconnected,
                this, &ProxyServer::onSocketDisconnected);
        connect(socket, &QTcpSocket::bytesWritten,
                this, &ProxyServer::onSocketBytesWritten);

        LOG_DEBUG(QStringLiteral("ProxyServer: new connection from %1:%2")
                      .arg(socket->peerAddress().toString())
                      .arg(socket->peerPort()));
    }
}

void ProxyServer::onSocketReadyRead()
{
    auto* socket = qobject_cast<QTcpSocket*>(sender());
    if (!socket) {
        return;
    }

    m_pendingData[socket] += socket->readAll();
    drainBuffer(socket);
}

void ProxyServer::onSocketDisconnected()
{
    auto* socket = qobject_cast<QTcpSocket*>(sender());
    if (!socket) {
        return;
    }

    m_pendingData.remove(socket);
    m_busy.remove(socket);

    // Client went away mid-stream: stop reading from the backend
    const StreamBinding binding = m_activeStreams.take(socket);
    if (binding.session) {
        LOG_INFO(QStringLiteral("ProxyServer: client disconnected mid-stream, aborting backend"));
        binding.session->abort();
        binding.session->deleteLater();
    }

    socket->deleteLater();
    LOG_DEBUG(QStringLiteral("ProxyServer: client disconnected"));
}

void ProxyServer::onSocketBytesWritten()
{
    auto* socket = qobject_cast<QTcpSocket*>(sender());
    if (!socket) {
        return;
    }

    auto it = m_activeStreams.find(socket);
    if (it == m_activeStreams.end() || !it->paused) {
        return;
    }
    if (socket->bytesToWrite() <= kLowWatermark) {
        it->paused = false;
        LOG_DEBUG(QStringLiteral("ProxyServer: client caught up, resuming backend reads"));
        // resume() can finish the stream and erase the binding
        it->session->resume();
    }
}

// ========================================================================
// HTTP framing
// ========================================================================

void ProxyServer::drainBuffer(QTcpSocket* socket)
{
    while (!m_busy.contains(socket) && m_pendingData.contains(socket)) {
        QByteArray& buffer = m_pendingData[socket];
        const int headerEnd = buffer.indexOf("\r\n\r\n");
        if (headerEnd < 0) {
            if (buffer.size() > kMaxRequestBytes) {
                sendHttpResponse(socket, 413, QByteArray());
                socket->disconnectFromHost();
            }
            return;
        }

        int contentLength = 0;
        bool hasChunkedTransfer = false;
        const QString headerBlock = QString::fromUtf8(buffer.left(headerEnd));
        const QStringList headerLines = headerBlock.split(QStringLiteral("\r\n"));
        for (const QString& line : headerLines) {
            if (line.startsWith(QStringLiteral("Content-Length:"), Qt::CaseInsensitive)) {
                contentLength = line.mid(15).trimmed().toInt();
            }
            if (line.startsWith(QStringLiteral("Transfer-Encoding:"), Qt::CaseInsensitive)
                && line.contains(QStringLiteral("chunked"), Qt::CaseInsensitive)) {
                hasChunkedTransfer = true;
            }
        }

        if (hasChunkedTransfer) {
            sendFailure(socket, DomainFailure::invalidInput(
                QStringLiteral("unsupported_transfer_encoding"),
                QStringLiteral("chunked request bodies are not supported")));
            buffer.clear();
            return;
        }
        if (contentLength < 0 || contentLength > kMaxRequestBytes) {
            sendHttpResponse(socket, 413, QByteArray());
            buffer.clear();
            socket->disconnectFromHost();
            return;
        }

        const int bodyStart = headerEnd + 4;
        const int totalRequired = bodyStart + contentLength;
        if (buffer.size() < totalRequired) {
            return;
        }

        const QByteArray requestData = buffer.left(totalRequired);
        buffer.remove(0, totalRequired);

        const HttpRequest req = parseHttpRequest(requestData);
        handleRequest(socket, req);

        if (socket->state() != QAbstractSocket::ConnectedState) {
            return;
        }
    }
}

ProxyServer::HttpRequest ProxyServer::parseHttpRequest(const QByteArray& data)
{
    HttpRequest req;

    int headerEnd = data.indexOf("\r\n\r\n");
    if (headerEnd < 0) {
        return req;
    }

    QString headerBlock = QString::fromUtf8(data.left(headerEnd));
    QStringList lines = headerBlock.split(QStringLiteral("\r\n"));

    // Parse the request line: "METHOD PATH HTTP/1.1"
    if (!lines.isEmpty()) {
        QStringList parts = lines[0].split(QLatin1Char(' '));
        if (parts.size() >= 3) {
            req.method      = parts[0].trimmed().toUpper();
            req.path        = parts[1];
            req.httpVersion = parts[2];
        }
    }

    // Parse headers
    for (int i = 1; i < lines.size(); ++i) {
        int colon = lines[i].indexOf(QLatin1Char(':'));
        if (colon > 0) {
            QString key   = lines[i].left(colon).trimmed().toLower();
            QString value = lines[i].mid(colon + 1).trimmed();
            req.headers[key] = value;
        }
    }

    // Extract body
    req.body = data.mid(headerEnd + 4);
    req.contentLength = req.body.size();
    req.complete = true;

    return req;
}

// ========================================================================
// Dispatch
// ========================================================================

void ProxyServer::handleRequest(QTcpSocket* socket, const HttpRequest& request)
{
    LOG_INFO(QStringLiteral("ProxyServer: %1 %2").arg(request.method, request.path));

    auto routeOpt = m_router.match(request.method, request.path);
    if (!routeOpt) {
        QJsonObject errObj;
        errObj[QStringLiteral("message")] =
            QStringLiteral("No route for %1 %2").arg(request.method, request.path);
        errObj[QStringLiteral("type")] = QStringLiteral("invalid_request_error");
        errObj[QStringLiteral("code")] = QStringLiteral("not_found");
        QJsonObject root;
        root[QStringLiteral("error")] = errObj;
        sendHttpResponse(socket, 404, QJsonDocument(root).toJson(QJsonDocument::Compact));
        return;
    }

    switch (routeOpt->kind) {
    case RouteKind::Health: {
        QJsonObject health;
        health[QStringLiteral("status")] = QStringLiteral("ok");
        health[QStringLiteral("service")] = QStringLiteral("codex-bridge");
        sendHttpResponse(socket, 200, QJsonDocument(health).toJson(QJsonDocument::Compact));
        return;
    }
    case RouteKind::Models: {
        const QJsonObject list = model_router::buildModelList(
            m_config.allowedModels, QDateTime::currentSecsSinceEpoch());
        sendHttpResponse(socket, 200, QJsonDocument(list).toJson(QJsonDocument::Compact));
        return;
    }
    case RouteKind::Preflight:
        sendPreflight(socket);
        return;
    case RouteKind::ChatCompletions:
        handleChatCompletions(socket, request);
        return;
    }
}

void ProxyServer::handleChatCompletions(QTcpSocket* socket, const HttpRequest& request)
{
    auto prepared = m_translator->prepare(request.body, buildMetadata());
    if (!prepared) {
        sendFailure(socket, prepared.error());
        return;
    }

    m_busy.insert(socket);

    if (prepared->stream) {
        auto session = m_translator->processStream(std::move(*prepared));
        if (!session) {
            sendFailure(socket, session.error());
            requestDone(socket);
            return;
        }
        sendStreamResponse(socket, *session);
        return;
    }

    QPointer<QTcpSocket> guard(socket);
    m_translator->process(std::move(*prepared), [this, guard](Result<QByteArray> result) {
        if (!guard) {
            LOG_DEBUG(QStringLiteral("ProxyServer: client left before the response was ready"));
            return;
        }
        if (result)
            sendHttpResponse(guard, 200, *result);
        else
            sendFailure(guard, result.error());
        requestDone(guard);
    });
}

// ========================================================================
// Responses
// ========================================================================

void ProxyServer::sendHttpResponse(QTcpSocket* socket, int status,
                                   const QByteArray& body,
                                   const QString& contentType)
{
    if (!socket || socket->state() != QAbstractSocket::ConnectedState) {
        return;
    }

    static const QMap<int, QString> statusTexts = {
        {200, QStringLiteral("OK")},
        {204, QStringLiteral("No Content")},
        {400, QStringLiteral("Bad Request")},
        {401, QStringLiteral("Unauthorized")},
        {403, QStringLiteral("Forbidden")},
        {404, QStringLiteral("Not Found")},
        {413, QStringLiteral("Payload Too Large")},
        {429, QStringLiteral("Too Many Requests")},
        {500, QStringLiteral("Internal Server Error")},
        {502, QStringLiteral("Bad Gateway")},
        {503, QStringLiteral("Service Unavailable")},
        {504, QStringLiteral("Gateway Timeout")}
    };

    QString statusText = statusTexts.value(status, QStringLiteral("Unknown"));

    QByteArray response;
    response.append(QStringLiteral("HTTP/1.1 %1 %2\r\n")
                        .arg(status)
                        .arg(statusText)
                        .toUtf8());
    response.append(QStringLiteral("Content-Type: %1\r\n")
                        .arg(contentType)
                        .toUtf8());
    response.append(QStringLiteral("Content-Length: %1\r\n")
                        .arg(body.size())
                        .toUtf8());
    response.append("Access-Control-Allow-Origin: *\r\n");
    response.append("Connection: keep-alive\r\n");
    response.append("\r\n");
    response.append(body);

    socket->write(response);
    socket->flush();
}

void ProxyServer::sendFailure(QTcpSocket* socket, const DomainFailure& failure)
{
    LOG_WARNING(QStringLiteral("ProxyServer: %1 %2: %3")
                    .arg(failure.httpStatus())
                    .arg(failure.code, failure.message));
    sendHttpResponse(socket, failure.httpStatus(), m_translator->encodeFailure(failure));
}

void ProxyServer::sendPreflight(QTcpSocket* socket)
{
    if (!socket || socket->state() != QAbstractSocket::ConnectedState) {
        return;
    }

    const QByteArray response =
        "HTTP/1.1 204 No Content\r\n"
        "Access-Control-Allow-Origin: *\r\n"
        "Access-Control-Allow-Methods: GET, POST, OPTIONS\r\n"
        "Access-Control-Allow-Headers: Content-Type, Authorization\r\n"
        "Access-Control-Max-Age: 86400\r\n"
        "Content-Length: 0\r\n"
        "Connection: keep-alive\r\n"
        "\r\n";
    socket->write(response);
    socket->flush();
}

void ProxyServer::sendStreamResponse(QTcpSocket* socket,
                                     TranslatorStreamSession* session)
{
    StreamBinding binding;
    binding.session = session;
    binding.writer = SseWriter(socket);
    m_activeStreams.insert(socket, binding);

    connect(session, &TranslatorStreamSession::encodedFrameReady,
            this, [this, socket](const QByteArray& data) {
                auto it = m_activeStreams.find(socket);
                if (it == m_activeStreams.end()) {
                    return;
                }
                it->writer.writeEvent(data);

                if (!it->paused && socket->bytesToWrite() > kHighWatermark) {
                    it->paused = true;
                    LOG_DEBUG(QStringLiteral("ProxyServer: slow client, pausing backend reads"));
                    it->session->pause();
                }
            });

    connect(session, &TranslatorStreamSession::completed,
            this, [this, socket, session]() {
                auto it = m_activeStreams.find(socket);
                if (it != m_activeStreams.end()) {
                    it->writer.close(true);
                }
                finishStream(socket, session);
            });

    connect(session, &TranslatorStreamSession::failed,
            this, [this, socket, session](const DomainFailure& failure, bool chunkSent) {
                auto it = m_activeStreams.find(socket);
                if (chunkSent && it != m_activeStreams.end() && it->writer.started()) {
                    // The error chunk was the last event.
                    it->writer.close(false);
                } else {
                    sendFailure(socket, failure);
                }
                finishStream(socket, session);
            });
}

void ProxyServer::finishStream(QTcpSocket* socket, TranslatorStreamSession* session)
{
    auto it = m_activeStreams.find(socket);
    if (it != m_activeStreams.end() && it->session == session) {
        m_activeStreams.erase(it);
    }
    session->deleteLater();
    requestDone(socket);
}

void ProxyServer::requestDone(QTcpSocket* socket)
{
    m_busy.remove(socket);
    if (m_pendingData.contains(socket) && !m_pendingData.value(socket).isEmpty()) {
        drainBuffer(socket);
    }
}

QMap<QString, QString> ProxyServer::buildMetadata() const
{
    QMap<QString, QString> meta;
    meta[QStringLiteral("backend_url")] = m_config.backend.url;
    return meta;
}

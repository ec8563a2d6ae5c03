#pragma once
#include "request_router.h"
#include "sse_writer.h"
#include "config/config_types.h"
#include "semantic/failure.h"
#include <QObject>
#include <QTcpServer>
#include <QTcpSocket>
#include <QMap>
#include <QSet>

class Translator;
class TranslatorStreamSession;

class ProxyServer : public QObject {
    Q_OBJECT
public:
    ProxyServer(const BridgeConfig& config, Translator* translator,
                QObject* parent = nullptr);
    ~ProxyServer() override;

    bool start();
    void stop();
    bool isRunning() const;
    quint16 serverPort() const;

    // Client socket back-pressure thresholds, in pending bytes.
    static constexpr qint64 kHighWatermark = 1024 * 1024;
    static constexpr qint64 kLowWatermark = 256 * 1024;
    static constexpr int kMaxRequestBytes = 32 * 1024 * 1024;

private slots:
    void onNewConnection();
    void onSocketReadyRead();
    void onSocketDisconnected();
    void onSocketBytesWritten();

private:
    struct HttpRequest {
        QString method, path, httpVersion;
        QMap<QString, QString> headers;
        QByteArray body;
        bool complete = false;
        int contentLength = 0;
    };

    struct StreamBinding {
        TranslatorStreamSession* session = nullptr;
        SseWriter writer;
        bool paused = false;
    };

    HttpRequest parseHttpRequest(const QByteArray& data);
    void drainBuffer(QTcpSocket* socket);
    void handleRequest(QTcpSocket* socket, const HttpRequest& request);
    void handleChatCompletions(QTcpSocket* socket, const HttpRequest& request);
    void sendHttpResponse(QTcpSocket* socket, int status,
                          const QByteArray& body,
                          const QString& contentType = QStringLiteral("application/json"));
    void sendFailure(QTcpSocket* socket, const DomainFailure& failure);
    void sendPreflight(QTcpSocket* socket);
    void sendStreamResponse(QTcpSocket* socket, TranslatorStreamSession* session);
    void finishStream(QTcpSocket* socket, TranslatorStreamSession* session);
    void requestDone(QTcpSocket* socket);
    QMap<QString, QString> buildMetadata() const;

    const BridgeConfig& m_config;
    Translator* m_translator;
    QTcpServer* m_server = nullptr;
    RequestRouter m_router;
    QMap<QTcpSocket*, QByteArray> m_pendingData;
    QMap<QTcpSocket*, StreamBinding> m_activeStreams;
    QSet<QTcpSocket*> m_busy;
};

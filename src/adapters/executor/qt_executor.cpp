#include "qt_executor.h"
#include "core/log_manager.h"
#include <QUrl>

QtExecutor::QtExecutor(const BackendCredentials& credentials, const BackendOptions& options)
    : m_credentials(credentials)
    , m_options(options)
{
}

QtExecutor::~QtExecutor() = default;

QNetworkRequest QtExecutor::buildQtRequest(const ProviderRequest& request) const {
    QNetworkRequest req{QUrl{request.url}};

    for (auto it = request.headers.constBegin(); it != request.headers.constEnd(); ++it)
        req.setRawHeader(it.key().toUtf8(), it.value().toUtf8());

    const QMap<QString, QString> auth = m_credentials.authHeaders();
    for (auto it = auth.constBegin(); it != auth.constEnd(); ++it)
        req.setRawHeader(it.key().toUtf8(), it.value().toUtf8());

    if (!req.hasRawHeader("Content-Type"))
        req.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");

    // Idle timeout: aborts when no bytes move for this long.
    req.setTransferTimeout(m_options.requestTimeout);
    return req;
}

QNetworkReply* QtExecutor::send(const ProviderRequest& request) {
    const QNetworkRequest req = buildQtRequest(request);
    const QString method = request.method.trimmed().toUpper();

    LOG_DEBUG(QStringLiteral("Executor: %1 %2 (%3 bytes, stream=%4)")
                  .arg(method, request.url)
                  .arg(request.body.size())
                  .arg(request.stream ? QStringLiteral("true") : QStringLiteral("false")));

    if (method == "POST")
        return m_nam.post(req, request.body);
    if (method == "GET")
        return m_nam.get(req);
    return m_nam.sendCustomRequest(req, method.toUtf8(), request.body);
}

std::optional<DomainFailure> QtExecutor::checkConnectionError(QNetworkReply* reply) const {
    if (!reply) return DomainFailure::internal("null reply");
    if (reply->error() == QNetworkReply::NoError) return std::nullopt;

    // A status line means the backend answered; the body is classified by
    // the outbound adapter.
    const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    if (status > 0)
        return std::nullopt;

    if (reply->error() == QNetworkReply::OperationCanceledError
        || reply->error() == QNetworkReply::TimeoutError)
        return DomainFailure::timeout(QStringLiteral("Backend request timed out"));

    return DomainFailure::unavailable(reply->errorString());
}

void QtExecutor::execute(const ProviderRequest& request, ResponseHandler done) {
    QNetworkReply* reply = send(request);

    QObject::connect(reply, &QNetworkReply::finished, reply,
                     [this, reply, done = std::move(done)]() {
        reply->deleteLater();

        if (auto err = checkConnectionError(reply)) {
            LOG_WARNING(QStringLiteral("Executor: transport failure: %1").arg(err->message));
            done(std::unexpected(*err));
            return;
        }

        ProviderResponse resp;
        resp.statusCode = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
        resp.body = reply->readAll();
        for (const auto& header : reply->rawHeaderList())
            resp.headers[QString::fromUtf8(header)] = QString::fromUtf8(reply->rawHeader(header));
        done(std::move(resp));
    });
}

Result<QIODevice*> QtExecutor::connectStream(const ProviderRequest& request) {
    QNetworkReply* reply = send(request);
    if (!reply)
        return std::unexpected(DomainFailure::internal("network manager returned no reply"));

    // Bounded: unread bytes stay in the socket and throttle the backend.
    reply->setReadBufferSize(m_options.streamReadBufferSize);
    return reply;
}

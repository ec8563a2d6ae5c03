#include "credential_store.h"
#include "core/log_manager.h"
#include <QFile>
#include <QJsonDocument>

QMap<QString, QString> BackendCredentials::authHeaders() const
{
    QMap<QString, QString> headers;
    if (usesAccessToken()) {
        headers[QStringLiteral("Authorization")] = QStringLiteral("Bearer ") + accessToken;
        if (!accountId.isEmpty())
            headers[QStringLiteral("chatgpt-account-id")] = accountId;
    } else if (!apiKey.isEmpty()) {
        headers[QStringLiteral("Authorization")] = QStringLiteral("Bearer ") + apiKey;
    }
    return headers;
}

namespace CredentialStore {

Result<BackendCredentials> load(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return std::unexpected(DomainFailure{
            ErrorKind::Unauthorized, QStringLiteral("credentials_unreadable"),
            QStringLiteral("Cannot read credentials from %1: %2").arg(path, file.errorString()),
            QString()});
    }

    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        return std::unexpected(DomainFailure{
            ErrorKind::Unauthorized, QStringLiteral("credentials_invalid"),
            QStringLiteral("%1 is not a JSON object: %2").arg(path, err.errorString()),
            QString()});
    }

    auto creds = parse(doc.object());
    if (creds) {
        LOG_INFO(QStringLiteral("Loaded %1 credentials from %2")
                     .arg(creds->usesAccessToken() ? QStringLiteral("ChatGPT token")
                                                   : QStringLiteral("API key"),
                          path));
    }
    return creds;
}

Result<BackendCredentials> parse(const QJsonObject& root)
{
    BackendCredentials creds;

    const QJsonObject tokens = root.value(QStringLiteral("tokens")).toObject();
    creds.accessToken = tokens.value(QStringLiteral("access_token")).toString();
    creds.accountId = tokens.value(QStringLiteral("account_id")).toString();
    creds.refreshToken = tokens.value(QStringLiteral("refresh_token")).toString();

    // Flat layout: {access_token, account_id, api_key}
    if (creds.accessToken.isEmpty())
        creds.accessToken = root.value(QStringLiteral("access_token")).toString();
    if (creds.accountId.isEmpty())
        creds.accountId = root.value(QStringLiteral("account_id")).toString();

    creds.apiKey = root.value(QStringLiteral("OPENAI_API_KEY")).toString();
    if (creds.apiKey.isEmpty())
        creds.apiKey = root.value(QStringLiteral("api_key")).toString();

    if (creds.accessToken.isEmpty() && creds.apiKey.isEmpty()) {
        return std::unexpected(DomainFailure{
            ErrorKind::Unauthorized, QStringLiteral("credentials_missing"),
            QStringLiteral("auth.json holds neither tokens.access_token nor OPENAI_API_KEY"),
            QString()});
    }
    if (creds.usesAccessToken() && creds.accountId.isEmpty())
        LOG_WARNING(QStringLiteral("Access token present without account_id; "
                                   "the backend may reject requests"));

    return creds;
}

QString redact(const QString& secret)
{
    if (secret.size() <= 8)
        return QStringLiteral("***");
    return secret.left(4) + QStringLiteral("...") + secret.right(4);
}

}

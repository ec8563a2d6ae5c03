#pragma once
#include "semantic/ports.h"
#include <QJsonObject>
#include <QMap>
#include <QString>

// Tokens read from the Codex CLI auth file. Either a ChatGPT access token
// with its account id, or a plain API key.
struct BackendCredentials {
    QString accessToken;
    QString accountId;
    QString apiKey;
    QString refreshToken;

    bool usesAccessToken() const { return !accessToken.isEmpty(); }

    // Authorization (and chatgpt-account-id in token mode).
    QMap<QString, QString> authHeaders() const;
};

namespace CredentialStore {
    Result<BackendCredentials> load(const QString& path);
    Result<BackendCredentials> parse(const QJsonObject& root);
    QString redact(const QString& secret);
}

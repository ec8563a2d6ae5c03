#pragma once
#include <QString>
#include <QStringList>

struct BackendOptions {
    QString url = QStringLiteral("https://chatgpt.com/backend-api/codex/responses");
    int requestTimeout = 300000;
    qint64 streamReadBufferSize = 256 * 1024;
};

struct RuntimeOptions {
    bool debugMode = false;
    int port = 8080;
    QString listenAddress = QStringLiteral("0.0.0.0");
    QString logDir;
    QString authPath = QStringLiteral("~/.codex/auth.json");
    QString configPath;
};

// Immutable after startup; handed to components by const reference.
struct BridgeConfig {
    QStringList allowedModels;
    BackendOptions backend;
    RuntimeOptions runtime;

    static QStringList defaultAllowedModels() {
        return {QStringLiteral("gpt-5"), QStringLiteral("gpt-5.2"),
                QStringLiteral("gpt-5.3-codex"), QStringLiteral("gpt-5.2-codex")};
    }
};

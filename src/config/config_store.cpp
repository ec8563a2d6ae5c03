#include "config_store.h"
#include "core/log_manager.h"
#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>

namespace {

QJsonValue jsonValueEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey)
{
    const QString snake = QString::fromUtf8(snakeKey);
    if (obj.contains(snake))
        return obj.value(snake);
    return obj.value(QString::fromUtf8(camelKey));
}

QString jsonStringEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey,
                         const QString& fallback)
{
    const QJsonValue value = jsonValueEither(obj, snakeKey, camelKey);
    return value.isString() ? value.toString() : fallback;
}

int jsonIntEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey, int fallback)
{
    const QJsonValue value = jsonValueEither(obj, snakeKey, camelKey);
    return value.isUndefined() ? fallback : value.toInt(fallback);
}

bool jsonBoolEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey, bool fallback)
{
    const QJsonValue value = jsonValueEither(obj, snakeKey, camelKey);
    return value.isUndefined() ? fallback : value.toBool(fallback);
}

int clampInt(int value, int minValue, int maxValue)
{
    return qBound(minValue, value, maxValue);
}

const QString kOptPort = QStringLiteral("port");
const QString kOptAuthPath = QStringLiteral("auth-path");
const QString kOptConfig = QStringLiteral("config");
const QString kOptLogDir = QStringLiteral("log-dir");
const QString kOptDebug = QStringLiteral("debug");

// An allowlist that parses to nothing keeps the built-in models.
QStringList orDefaultModels(const QStringList& models, const QString& source)
{
    if (!models.isEmpty())
        return models;
    LOG_WARNING(QStringLiteral("ConfigStore: %1 lists no models, using the defaults")
                    .arg(source));
    return BridgeConfig::defaultAllowedModels();
}

}

ConfigStore::ConfigStore()
{
    m_config.allowedModels = BridgeConfig::defaultAllowedModels();
}

VoidResult ConfigStore::loadFile(const QString& path)
{
    const QString resolved = expandHome(path);
    QFile file(resolved);
    if (!file.open(QIODevice::ReadOnly)) {
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("config_unreadable"),
            QStringLiteral("Cannot open config file %1: %2").arg(resolved, file.errorString())));
    }

    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("config_invalid"),
            QStringLiteral("Config file %1 is not a JSON object: %2")
                .arg(resolved, err.errorString())));
    }

    m_config.runtime.configPath = resolved;
    return applyJson(doc.object());
}

VoidResult ConfigStore::applyJson(const QJsonObject& root)
{
    const QJsonValue models = jsonValueEither(root, "allowed_models", "allowedModels");
    if (models.isArray()) {
        QStringList list;
        for (const QJsonValue& m : models.toArray())
            list.append(m.toString().trimmed());
        list.removeAll(QString());
        m_config.allowedModels = orDefaultModels(dedupe(list), QStringLiteral("allowed_models"));
    } else if (models.isString()) {
        m_config.allowedModels = orDefaultModels(parseModelList(models.toString()),
                                                 QStringLiteral("allowed_models"));
    }

    // backend
    const QJsonObject be = root.value(QStringLiteral("backend")).toObject();
    m_config.backend.url = jsonStringEither(be, "url", "url", m_config.backend.url);
    m_config.backend.requestTimeout = clampInt(
        jsonIntEither(be, "request_timeout", "requestTimeout", m_config.backend.requestTimeout),
        1000, 3600000);

    // runtime
    const QJsonObject rt = root.value(QStringLiteral("runtime")).toObject();
    m_config.runtime.debugMode = jsonBoolEither(rt, "debug_mode", "debugMode",
                                                m_config.runtime.debugMode);
    const int port = jsonIntEither(rt, "port", "port", m_config.runtime.port);
    if (port < 1 || port > 65535) {
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("config_invalid"),
            QStringLiteral("runtime.port %1 is out of range").arg(port)));
    }
    m_config.runtime.port = port;
    m_config.runtime.listenAddress = jsonStringEither(rt, "listen_address", "listenAddress",
                                                      m_config.runtime.listenAddress);
    m_config.runtime.logDir = jsonStringEither(rt, "log_dir", "logDir", m_config.runtime.logDir);
    m_config.runtime.authPath = jsonStringEither(rt, "auth_path", "authPath",
                                                 m_config.runtime.authPath);
    return {};
}

VoidResult ConfigStore::applyEnvironment(const QProcessEnvironment& env)
{
    if (env.contains(QStringLiteral("ALLOWED_MODELS")))
        m_config.allowedModels = orDefaultModels(
            parseModelList(env.value(QStringLiteral("ALLOWED_MODELS"))),
            QStringLiteral("ALLOWED_MODELS"));

    if (env.contains(QStringLiteral("CODEX_BRIDGE_PORT"))) {
        auto port = parsePort(env.value(QStringLiteral("CODEX_BRIDGE_PORT")),
                              QStringLiteral("CODEX_BRIDGE_PORT"));
        if (!port)
            return std::unexpected(port.error());
        m_config.runtime.port = *port;
    }

    const QString authPath = env.value(QStringLiteral("CODEX_AUTH_PATH"));
    if (!authPath.isEmpty())
        m_config.runtime.authPath = authPath;

    const QString backendUrl = env.value(QStringLiteral("CODEX_BACKEND_URL"));
    if (!backendUrl.isEmpty())
        m_config.backend.url = backendUrl;

    return {};
}

void ConfigStore::addCommandLineOptions(QCommandLineParser& parser)
{
    parser.addOption(QCommandLineOption(
        {QStringLiteral("p"), kOptPort},
        QStringLiteral("Port to listen on (default 8080)."), QStringLiteral("port")));
    parser.addOption(QCommandLineOption(
        kOptAuthPath,
        QStringLiteral("Path to the Codex auth.json (default ~/.codex/auth.json)."),
        QStringLiteral("path")));
    parser.addOption(QCommandLineOption(
        {QStringLiteral("c"), kOptConfig},
        QStringLiteral("Optional JSON configuration file."), QStringLiteral("file")));
    parser.addOption(QCommandLineOption(
        kOptLogDir, QStringLiteral("Directory for codex-bridge.log."), QStringLiteral("dir")));
    parser.addOption(QCommandLineOption(
        {QStringLiteral("d"), kOptDebug}, QStringLiteral("Enable debug logging.")));
}

VoidResult ConfigStore::applyCommandLine(const QCommandLineParser& parser)
{
    if (parser.isSet(kOptPort)) {
        auto port = parsePort(parser.value(kOptPort), QStringLiteral("--port"));
        if (!port)
            return std::unexpected(port.error());
        m_config.runtime.port = *port;
    }
    if (parser.isSet(kOptAuthPath))
        m_config.runtime.authPath = parser.value(kOptAuthPath);
    if (parser.isSet(kOptLogDir))
        m_config.runtime.logDir = parser.value(kOptLogDir);
    if (parser.isSet(kOptDebug))
        m_config.runtime.debugMode = true;
    return {};
}

BridgeConfig ConfigStore::finalize() const
{
    BridgeConfig config = m_config;
    config.runtime.authPath = expandHome(config.runtime.authPath);
    if (!config.runtime.logDir.isEmpty())
        config.runtime.logDir = expandHome(config.runtime.logDir);
    return config;
}

QStringList ConfigStore::parseModelList(const QString& raw)
{
    QStringList models;
    const QStringList parts = raw.split(QLatin1Char(','));
    for (const QString& part : parts) {
        const QString trimmed = part.trimmed();
        if (!trimmed.isEmpty())
            models.append(trimmed);
    }
    return dedupe(models);
}

QStringList ConfigStore::dedupe(const QStringList& models)
{
    QStringList unique;
    for (const QString& model : models) {
        if (!unique.contains(model))
            unique.append(model);
    }
    return unique;
}

QString ConfigStore::expandHome(const QString& path)
{
    if (path == QStringLiteral("~"))
        return QDir::homePath();
    if (path.startsWith(QStringLiteral("~/")))
        return QDir::homePath() + path.mid(1);
    return path;
}

Result<int> ConfigStore::parsePort(const QString& raw, const QString& source)
{
    bool ok = false;
    const int port = raw.trimmed().toInt(&ok);
    if (!ok || port < 1 || port > 65535) {
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("config_invalid"),
            QStringLiteral("%1: '%2' is not a valid port").arg(source, raw)));
    }
    return port;
}

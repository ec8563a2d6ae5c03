#pragma once
#include "config_types.h"
#include "semantic/ports.h"
#include <QCommandLineParser>
#include <QJsonObject>
#include <QProcessEnvironment>

// Layers configuration sources onto the built-in defaults. Apply them
// lowest precedence first: file, environment, command line.
class ConfigStore {
public:
    ConfigStore();

    VoidResult loadFile(const QString& path);
    VoidResult applyJson(const QJsonObject& root);
    VoidResult applyEnvironment(const QProcessEnvironment& env);

    static void addCommandLineOptions(QCommandLineParser& parser);
    VoidResult applyCommandLine(const QCommandLineParser& parser);

    // Snapshot with `~/` paths expanded.
    BridgeConfig finalize() const;

    static QStringList parseModelList(const QString& raw);
    static QStringList dedupe(const QStringList& models);
    static QString expandHome(const QString& path);

private:
    BridgeConfig m_config;

    static Result<int> parsePort(const QString& raw, const QString& source);
};

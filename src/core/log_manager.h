#pragma once
#include <QObject>
#include <QFile>
#include <QMutex>

class LogManager : public QObject {
    Q_OBJECT

public:
    static LogManager& instance();

    enum Level { Debug, Info, Warning, Error };
    Q_ENUM(Level)

    // Opens <logDir>/codex-bridge.log in append mode. Without a call, or
    // with an empty directory, output goes to stderr only.
    bool initialize(const QString& logDir);

    void setMinimumLevel(Level level) { m_minLevel = level; }

    void log(Level level, const QString& category, const QString& message);
    void debug(const QString& msg)   { log(Debug, "app", msg); }
    void info(const QString& msg)    { log(Info, "app", msg); }
    void warning(const QString& msg) { log(Warning, "app", msg); }
    void error(const QString& msg)   { log(Error, "app", msg); }

private:
    ~LogManager() override;
    LogManager() = default;
    QFile m_logFile;
    QMutex m_mutex;
    Level m_minLevel = Info;
};

#define LOG_DEBUG(msg) LogManager::instance().debug(msg)
#define LOG_INFO(msg) LogManager::instance().info(msg)
#define LOG_WARNING(msg) LogManager::instance().warning(msg)
#define LOG_ERROR(msg) LogManager::instance().error(msg)

#pragma once
#include <QFile>
#include <QMutex>
#include <QString>

class LogManager {
public:
    static LogManager& instance();

    // Empty path: stderr only.
    void initialize(const QString& logFilePath);

    enum Level { Debug, Info, Warning, Error };

    void setMinimumLevel(Level level) { m_minLevel = level; }
    Level minimumLevel() const { return m_minLevel; }
    bool isEnabled(Level level) const { return level >= m_minLevel; }

    void log(Level level, const QString& category, const QString& message);
    void debug(const QString& msg)   { log(Debug, "proxy", msg); }
    void info(const QString& msg)    { log(Info, "proxy", msg); }
    void warning(const QString& msg) { log(Warning, "proxy", msg); }
    void error(const QString& msg)   { log(Error, "proxy", msg); }

    static QString formatMessage(Level level, const QString& category, const QString& message);

private:
    LogManager() = default;
    ~LogManager();
    LogManager(const LogManager&) = delete;
    LogManager& operator=(const LogManager&) = delete;

    QFile m_logFile;
    QMutex m_mutex;
    Level m_minLevel = Info;
};

#define LOG_DEBUG(msg) LogManager::instance().debug(msg)
#define LOG_INFO(msg) LogManager::instance().info(msg)
#define LOG_WARNING(msg) LogManager::instance().warning(msg)
#define LOG_ERROR(msg) LogManager::instance().error(msg)

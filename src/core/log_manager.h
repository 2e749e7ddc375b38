#pragma once
#include <QObject>
#include <QFile>
#include <QMutex>

class LogManager : public QObject {
    Q_OBJECT

public:
    static LogManager& instance();

    // Opens <logDir>/specbridge.log for appending. An empty dir disables file output.
    void initialize(const QString& logDir);

    enum Level { Debug, Info, Warning, Error };
    Q_ENUM(Level)

    void setMinimumLevel(Level level);
    Level minimumLevel() const;

    // Mirrors accepted entries to stderr. stdout stays reserved for results.
    void setConsoleEcho(bool enabled);

    void log(Level level, const QString& category, const QString& message);

    QString logFilePath() const;

    static QString formatMessage(Level level, const QString& category, const QString& message);
    static Level levelFromName(const QString& name, Level fallback = Info);

private:
    ~LogManager() override;
    LogManager() = default;

    mutable QMutex m_mutex;
    QFile m_logFile;
    Level m_minLevel = Info;
    bool m_consoleEcho = false;
};

#include "log_manager.h"
#include <QDateTime>
#include <QDir>
#include <QMutexLocker>
#include <QTextStream>
#include <QDebug>
#include <cstdio>

static const char* levelNames[] = {"DEBUG", "INFO", "WARN", "ERROR"};

LogManager& LogManager::instance() {
    static LogManager s_instance;
    return s_instance;
}

LogManager::~LogManager()
{
    if (m_logFile.isOpen()) {
        m_logFile.flush();
        m_logFile.close();
    }
}

void LogManager::initialize(const QString& logDir) {
    QMutexLocker locker(&m_mutex);
    if (m_logFile.isOpen())
        m_logFile.close();
    if (logDir.isEmpty())
        return;

    QDir().mkpath(logDir);
    QString logPath = logDir + "/specbridge.log";
    m_logFile.setFileName(logPath);
    if (!m_logFile.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        qWarning() << "LogManager: failed to open log file:" << logPath;
        m_logFile.close();
    }
}

void LogManager::setMinimumLevel(Level level) {
    QMutexLocker locker(&m_mutex);
    m_minLevel = level;
}

LogManager::Level LogManager::minimumLevel() const {
    QMutexLocker locker(&m_mutex);
    return m_minLevel;
}

void LogManager::setConsoleEcho(bool enabled) {
    QMutexLocker locker(&m_mutex);
    m_consoleEcho = enabled;
}

QString LogManager::logFilePath() const {
    QMutexLocker locker(&m_mutex);
    return m_logFile.isOpen() ? m_logFile.fileName() : QString();
}

void LogManager::log(Level level, const QString& category, const QString& message) {
    if (level < Debug || level > Error) {
        level = Error;
    }

    QMutexLocker locker(&m_mutex);
    if (level < m_minLevel)
        return;
    if (!m_logFile.isOpen() && !m_consoleEcho)
        return;

    const QString formatted = formatMessage(level, category, message);
    if (m_logFile.isOpen()) {
        QTextStream stream(&m_logFile);
        stream << formatted << "\n";
        stream.flush();
    }
    if (m_consoleEcho) {
        std::fputs(formatted.toLocal8Bit().constData(), stderr);
        std::fputc('\n', stderr);
    }
}

QString LogManager::formatMessage(Level level, const QString& category, const QString& message) {
    QString timestamp = QDateTime::currentDateTime().toString("yyyy-MM-dd hh:mm:ss.zzz");
    return QString("[%1] [%2] [%3] %4")
        .arg(timestamp, levelNames[level], category, message);
}

LogManager::Level LogManager::levelFromName(const QString& name, Level fallback) {
    const QString n = name.trimmed().toLower();
    if (n == "debug") return Debug;
    if (n == "info") return Info;
    if (n == "warn" || n == "warning") return Warning;
    if (n == "error") return Error;
    return fallback;
}

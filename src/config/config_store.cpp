#include "config_store.h"
#include "core/log_manager.h"
#include <QFile>
#include <QJsonDocument>
#include <QSaveFile>

namespace {

constexpr int kMinTimeoutMs = 100;
constexpr int kMaxTimeoutMs = 600000;
constexpr qint64 kMinResponseBytes = 1024;
constexpr qint64 kMaxResponseBytes = 1024LL * 1024 * 1024;

QJsonValue jsonValueEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey)
{
    const QString snake = QString::fromUtf8(snakeKey);
    if (obj.contains(snake))
        return obj.value(snake);
    return obj.value(QString::fromUtf8(camelKey));
}

QString jsonStringEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey, const QString& fallback)
{
    const QJsonValue value = jsonValueEither(obj, snakeKey, camelKey);
    return value.isString() ? value.toString() : fallback;
}

qint64 jsonIntEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey, qint64 fallback)
{
    const QJsonValue value = jsonValueEither(obj, snakeKey, camelKey);
    return value.isDouble() ? value.toInteger(fallback) : fallback;
}

bool jsonBoolEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey, bool fallback)
{
    const QJsonValue value = jsonValueEither(obj, snakeKey, camelKey);
    return value.isUndefined() ? fallback : value.toBool(fallback);
}

bool mapContainsEither(const QVariantMap& map, const char* snakeKey, const char* camelKey)
{
    return map.contains(QString::fromUtf8(snakeKey)) || map.contains(QString::fromUtf8(camelKey));
}

QVariant mapValueEither(const QVariantMap& map, const char* snakeKey, const char* camelKey)
{
    const QString snake = QString::fromUtf8(snakeKey);
    if (map.contains(snake))
        return map.value(snake);
    return map.value(QString::fromUtf8(camelKey));
}

qint64 clampInt(qint64 value, qint64 minValue, qint64 maxValue)
{
    return qBound(minValue, value, maxValue);
}

}

ConfigStore::ConfigStore(QObject* parent)
    : QObject(parent)
{
}

EngineConfig ConfigStore::fromJson(const QJsonObject& root, const EngineConfig& base)
{
    EngineConfig c = base;

    const QJsonObject spec = root.value(QStringLiteral("spec")).toObject();
    c.minSpecVersion = jsonStringEither(spec, "min_version", "minVersion", c.minSpecVersion);
    c.maxSpecVersion = jsonStringEither(spec, "max_version", "maxVersion", c.maxSpecVersion);
    if (!SemVer::parse(c.minSpecVersion))
        c.minSpecVersion = base.minSpecVersion;
    if (!SemVer::parse(c.maxSpecVersion))
        c.maxSpecVersion = base.maxSpecVersion;

    const QJsonObject exec = root.value(QStringLiteral("execution")).toObject();
    c.defaultTimeoutMs = static_cast<int>(clampInt(
        jsonIntEither(exec, "default_timeout_ms", "defaultTimeoutMs", c.defaultTimeoutMs),
        kMinTimeoutMs, kMaxTimeoutMs));
    c.maxResponseBytes = clampInt(
        jsonIntEither(exec, "max_response_bytes", "maxResponseBytes", c.maxResponseBytes),
        kMinResponseBytes, kMaxResponseBytes);
    c.userAgent = jsonStringEither(exec, "user_agent", "userAgent", c.userAgent);

    const QJsonObject log = root.value(QStringLiteral("logging")).toObject();
    c.logDir = jsonStringEither(log, "log_dir", "logDir", c.logDir);
    c.logLevel = jsonStringEither(log, "level", "logLevel", c.logLevel);
    c.debugMode = jsonBoolEither(log, "debug_mode", "debugMode", c.debugMode);
    return c;
}

QJsonObject ConfigStore::toJson(const EngineConfig& config)
{
    QJsonObject root;
    root["version"] = 1;

    QJsonObject spec;
    spec["min_version"] = config.minSpecVersion;
    spec["max_version"] = config.maxSpecVersion;
    root["spec"] = spec;

    QJsonObject exec;
    exec["default_timeout_ms"] = config.defaultTimeoutMs;
    exec["max_response_bytes"] = config.maxResponseBytes;
    exec["user_agent"] = config.userAgent;
    root["execution"] = exec;

    QJsonObject log;
    log["log_dir"] = config.logDir;
    log["level"] = config.logLevel;
    log["debug_mode"] = config.debugMode;
    root["logging"] = log;
    return root;
}

void ConfigStore::applyEnvironment(EngineConfig& config)
{
    const QByteArray logDir = qgetenv("SPECBRIDGE_LOG_DIR");
    if (!logDir.isEmpty())
        config.logDir = QString::fromLocal8Bit(logDir);

    bool ok = false;
    const int timeout = qEnvironmentVariableIntValue("SPECBRIDGE_TIMEOUT_MS", &ok);
    if (ok)
        config.defaultTimeoutMs = static_cast<int>(clampInt(timeout, kMinTimeoutMs, kMaxTimeoutMs));
}

bool ConfigStore::load(const QString& path) {
    m_filePath = path;
    bool loaded = false;

    QFile file(m_filePath);
    if (!m_filePath.isEmpty() && file.open(QIODevice::ReadOnly)) {
        QJsonParseError err;
        const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &err);
        if (doc.isObject()) {
            m_config = fromJson(doc.object(), m_config);
            loaded = true;
        } else {
            LogManager::instance().log(LogManager::Warning, "config",
                QStringLiteral("ignoring %1: %2").arg(m_filePath, err.errorString()));
        }
    }

    applyEnvironment(m_config);
    emit configChanged();
    return loaded;
}

bool ConfigStore::save() {
    if (m_filePath.isEmpty())
        return false;

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly))
        return false;
    file.write(QJsonDocument(toJson(m_config)).toJson(QJsonDocument::Indented));
    return file.commit();
}

QVariantMap ConfigStore::engineOptions() const {
    QVariantMap map;
    map["min_spec_version"] = m_config.minSpecVersion;
    map["max_spec_version"] = m_config.maxSpecVersion;
    map["default_timeout_ms"] = m_config.defaultTimeoutMs;
    map["max_response_bytes"] = m_config.maxResponseBytes;
    map["user_agent"] = m_config.userAgent;
    map["log_dir"] = m_config.logDir;
    map["log_level"] = m_config.logLevel;
    map["debug_mode"] = m_config.debugMode;
    return map;
}

void ConfigStore::setEngineOptions(const QVariantMap& opts) {
    if (mapContainsEither(opts, "min_spec_version", "minSpecVersion")) {
        const QString v = mapValueEither(opts, "min_spec_version", "minSpecVersion").toString();
        if (SemVer::parse(v))
            m_config.minSpecVersion = v;
    }
    if (mapContainsEither(opts, "max_spec_version", "maxSpecVersion")) {
        const QString v = mapValueEither(opts, "max_spec_version", "maxSpecVersion").toString();
        if (SemVer::parse(v))
            m_config.maxSpecVersion = v;
    }
    if (mapContainsEither(opts, "default_timeout_ms", "defaultTimeoutMs"))
        m_config.defaultTimeoutMs = static_cast<int>(clampInt(
            mapValueEither(opts, "default_timeout_ms", "defaultTimeoutMs").toLongLong(), kMinTimeoutMs, kMaxTimeoutMs));
    if (mapContainsEither(opts, "max_response_bytes", "maxResponseBytes"))
        m_config.maxResponseBytes = clampInt(
            mapValueEither(opts, "max_response_bytes", "maxResponseBytes").toLongLong(), kMinResponseBytes, kMaxResponseBytes);
    if (mapContainsEither(opts, "user_agent", "userAgent"))
        m_config.userAgent = mapValueEither(opts, "user_agent", "userAgent").toString();
    if (mapContainsEither(opts, "log_dir", "logDir"))
        m_config.logDir = mapValueEither(opts, "log_dir", "logDir").toString();
    if (mapContainsEither(opts, "log_level", "logLevel"))
        m_config.logLevel = mapValueEither(opts, "log_level", "logLevel").toString();
    if (mapContainsEither(opts, "debug_mode", "debugMode"))
        m_config.debugMode = mapValueEither(opts, "debug_mode", "debugMode").toBool();
    if (!m_filePath.isEmpty() && !save())
        LogManager::instance().log(LogManager::Warning, "config",
            QStringLiteral("could not write %1").arg(m_filePath));
    emit configChanged();
}

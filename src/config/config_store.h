#pragma once
#include "config_types.h"
#include <QJsonObject>
#include <QObject>
#include <QVariantMap>

class ConfigStore : public QObject {
    Q_OBJECT

public:
    explicit ConfigStore(QObject* parent = nullptr);

    // Reads a JSON config file. A missing or unreadable file keeps the current
    // values and returns false. Environment overrides apply in both cases.
    bool load(const QString& path);
    bool save();

    QString filePath() const { return m_filePath; }

    QVariantMap engineOptions() const;
    void setEngineOptions(const QVariantMap& opts);

    EngineConfig engineConfig() const { return m_config; }

    static EngineConfig fromJson(const QJsonObject& root, const EngineConfig& base = {});
    static QJsonObject toJson(const EngineConfig& config);
    static void applyEnvironment(EngineConfig& config);

signals:
    void configChanged();

private:
    EngineConfig m_config;
    QString m_filePath;
};

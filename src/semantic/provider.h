#pragma once
#include "types.h"
#include <QList>
#include <QMap>
#include <QString>
#include <QStringList>
#include <optional>

struct EndpointDescriptor {
    QString method = QStringLiteral("POST");
    QString path;
    QString protocol = QStringLiteral("http");
    QMap<QString, QString> headers;
    QMap<QString, QString> query;

    bool isStreaming() const { return protocol == QStringLiteral("sse"); }
};

struct ToolingConfig {
    bool toolsSupported = false;
    bool parallelToolCallsDefault = false;
};

struct JsonOutputConfig {
    bool nativeParam = false;
    QString strategy;   // "system_prompt" enables emulation
};

struct ParameterRange {
    std::optional<double> min;
    std::optional<double> max;

    bool contains(double value) const {
        if (min && value < *min) return false;
        if (max && value > *max) return false;
        return true;
    }
    double clamp(double value) const {
        if (min && value < *min) return *min;
        if (max && value > *max) return *max;
        return value;
    }
};

enum class SystemPromptLocation : quint8 {
    MessageRole, TopLevel, None
};

struct ModelConstraints {
    SystemPromptLocation systemPromptLocation = SystemPromptLocation::MessageRole;
    bool maxOutputTokensRequired = false;
    // Groups of canonical sampling fields the model rejects when sent together,
    // e.g. {"temperature", "top_p"}. The first preference present wins.
    QList<QStringList> mutuallyExclusive;
    QStringList resolutionPreferences;
    std::optional<int> maxToolSchemaBytes;
    std::optional<int> maxSystemPromptBytes;
};

struct ModelSpec {
    QString id;
    QStringList aliases;
    QString family;
    QMap<Capability, EndpointDescriptor> endpoints;
    QMap<InputMode, bool> inputModes;
    ToolingConfig tooling;
    JsonOutputConfig jsonOutput;
    QMap<QString, ParameterRange> parameters;
    ModelConstraints constraints;
    QMap<QString, QString> mappings;   // canonical field -> provider field (dotted)
};

struct ProviderInfo {
    QString name;
    QString baseUrl;
    QMap<QString, QString> headers;
};

struct ProviderSpec {
    QString specVersion;
    ProviderInfo provider;
    QList<ModelSpec> models;
};

#pragma once
#include <QJsonObject>
#include <QString>
#include <optional>

struct UsageEntry {
    std::optional<int> promptTokens;
    std::optional<int> completionTokens;
    std::optional<int> totalTokens;
};

// Provider-neutral view of a completion response. Fields the provider did not
// report stay empty and render as null.
struct NormalizedResponse {
    QString id;
    QString model;
    QString role = QStringLiteral("assistant");
    std::optional<QString> content;
    std::optional<QString> finishReason;
    std::optional<UsageEntry> usage;

    QJsonObject toJson() const;
};

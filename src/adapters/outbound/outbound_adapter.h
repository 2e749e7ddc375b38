#pragma once
#include "semantic/ports.h"
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

// Helpers shared by the payload dialects.
namespace Outbound {

inline QString systemText(const QList<InteractionItem>& items) {
    QString out;
    for (const auto& item : items) {
        if (item.role != MessageRole::System)
            continue;
        const QString text = item.joinedText();
        if (text.isEmpty())
            continue;
        if (!out.isEmpty())
            out += QLatin1Char('\n');
        out += text;
    }
    return out;
}

inline QString dataUri(const MediaRef& media) {
    return QStringLiteral("data:%1;base64,%2").arg(media.mimeType, media.inlineData);
}

inline QJsonArray stringArray(const QStringList& values) {
    QJsonArray arr;
    for (const auto& v : values)
        arr.append(v);
    return arr;
}

inline Diagnostic droppedField(const QString& feature, const QString& path, const QString& adapter) {
    Diagnostic d;
    d.code = LossinessCode::Drop;
    d.severity = Severity::Warning;
    d.feature = feature;
    d.path = path;
    d.message = QStringLiteral("%1 has no %2 request field; dropped").arg(feature, adapter);
    return d;
}

inline Result<QJsonObject> parseJsonBody(const QByteArray& body, const QString& adapter) {
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject())
        return std::unexpected(DomainFailure::jsonError(
            QStringLiteral("Failed to parse %1 response JSON: %2").arg(adapter, err.errorString())));
    return doc.object();
}

}

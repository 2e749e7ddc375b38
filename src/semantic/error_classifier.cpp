#include "error_classifier.h"
#include <QDateTime>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSet>
#include <climits>

namespace ErrorClassifier {

ProviderError extractProviderError(const QByteArray& body) {
    ProviderError pe;
    const QJsonDocument doc = QJsonDocument::fromJson(body);
    if (!doc.isObject()) {
        pe.message = QString::fromUtf8(body.left(512)).trimmed();
        return pe;
    }

    const QJsonObject root = doc.object();
    const QJsonValue errorVal = root.value(QStringLiteral("error"));
    if (errorVal.isObject()) {
        // OpenAI {"error":{"type","code","message"}}, Anthropic {"type":"error","error":{"type","message"}},
        // Gemini {"error":{"code":429,"status":"RESOURCE_EXHAUSTED","message"}}
        const QJsonObject err = errorVal.toObject();
        pe.message = err.value(QStringLiteral("message")).toString();
        const QString type = err.value(QStringLiteral("type")).toString();
        const QString code = err.value(QStringLiteral("code")).isString()
                                 ? err.value(QStringLiteral("code")).toString() : QString();
        const QString status = err.value(QStringLiteral("status")).toString();
        if (isAuthenticationType(code) || isRateLimitType(code))
            pe.type = code;
        else if (!type.isEmpty())
            pe.type = type;
        else if (!status.isEmpty())
            pe.type = status;
        else
            pe.type = code;
    } else if (errorVal.isString()) {
        pe.message = errorVal.toString();
        pe.type = root.value(QStringLiteral("type")).toString();
    } else {
        pe.message = root.value(QStringLiteral("message")).toString();
    }
    return pe;
}

std::optional<int> parseRetryAfter(const QString& value) {
    const QString v = value.trimmed();
    if (v.isEmpty())
        return std::nullopt;
    bool ok = false;
    const int seconds = v.toInt(&ok);
    if (ok)
        return qMax(0, seconds);
    const QDateTime when = QDateTime::fromString(v, Qt::RFC2822Date);
    if (!when.isValid())
        return std::nullopt;
    return static_cast<int>(qBound<qint64>(0, QDateTime::currentDateTimeUtc().secsTo(when), INT_MAX));
}

bool isAuthenticationType(const QString& type) {
    static const QSet<QString> types = {
        QStringLiteral("authentication_error"),
        QStringLiteral("permission_error"),
        QStringLiteral("invalid_api_key"),
        QStringLiteral("UNAUTHENTICATED"),
        QStringLiteral("PERMISSION_DENIED")
    };
    return types.contains(type);
}

bool isRateLimitType(const QString& type) {
    static const QSet<QString> types = {
        QStringLiteral("rate_limit_error"),
        QStringLiteral("rate_limit_exceeded"),
        QStringLiteral("insufficient_quota"),
        QStringLiteral("overloaded_error"),
        QStringLiteral("RESOURCE_EXHAUSTED")
    };
    return types.contains(type);
}

DomainFailure fromHttpStatus(int status,
                             const QByteArray& body,
                             const QMap<QString, QString>& headers) {
    const ProviderError pe = extractProviderError(body);
    const QString detail = pe.message.isEmpty()
        ? QStringLiteral("HTTP %1").arg(status)
        : QStringLiteral("HTTP %1: %2").arg(QString::number(status), pe.message);

    std::optional<int> retryAfter;
    for (auto it = headers.constBegin(); it != headers.constEnd(); ++it) {
        if (it.key().compare(QStringLiteral("Retry-After"), Qt::CaseInsensitive) == 0) {
            retryAfter = parseRetryAfter(it.value());
            break;
        }
    }

    if (status == 401 || status == 403)
        return DomainFailure::authentication(
            pe.type.isEmpty() ? QStringLiteral("http_%1").arg(status) : pe.type, detail);
    if (status == 429 || status == 529)
        return DomainFailure::rateLimited(detail, retryAfter);
    if (isAuthenticationType(pe.type))
        return DomainFailure::authentication(pe.type, detail);
    if (isRateLimitType(pe.type))
        return DomainFailure::rateLimited(detail, retryAfter);

    return DomainFailure::network(QStringLiteral("http_%1").arg(status), detail);
}

}

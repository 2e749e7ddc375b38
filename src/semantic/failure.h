#pragma once
#include "types.h"
#include <QString>
#include <QJsonObject>
#include <optional>

QString errorKindName(ErrorKind kind);

struct DomainFailure {
    ErrorKind          kind = ErrorKind::InternalError;
    QString            code;
    QString            message;
    bool               retryable = false;
    std::optional<int> retryAfterSeconds;

    int wireValue() const { return static_cast<int>(kind); }
    QString kindName() const { return errorKindName(kind); }
    QJsonObject toJson() const;

    static DomainFailure invalidInput(const QString& code, const QString& msg);
    static DomainFailure jsonError(const QString& msg);
    static DomainFailure utf8Error(const QString& msg);
    static DomainFailure providerNotFound(const QString& msg);
    static DomainFailure modelNotFound(const QString& code, const QString& msg);
    static DomainFailure network(const QString& code, const QString& msg);
    static DomainFailure authentication(const QString& code, const QString& msg);
    static DomainFailure rateLimited(const QString& msg, std::optional<int> retryAfter = std::nullopt);
    static DomainFailure timeout(const QString& msg);
    static DomainFailure cancelled(const QString& msg);
    static DomainFailure notImplemented(const QString& code, const QString& msg);
    static DomainFailure internal(const QString& msg);
};

#include "failure.h"

QString errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Success:             return QStringLiteral("Success");
    case ErrorKind::InvalidInput:        return QStringLiteral("InvalidInput");
    case ErrorKind::JsonError:           return QStringLiteral("JsonError");
    case ErrorKind::ProviderNotFound:    return QStringLiteral("ProviderNotFound");
    case ErrorKind::ModelNotFound:       return QStringLiteral("ModelNotFound");
    case ErrorKind::NetworkError:        return QStringLiteral("NetworkError");
    case ErrorKind::AuthenticationError: return QStringLiteral("AuthenticationError");
    case ErrorKind::RateLimitError:      return QStringLiteral("RateLimitError");
    case ErrorKind::TimeoutError:        return QStringLiteral("TimeoutError");
    case ErrorKind::InternalError:       return QStringLiteral("InternalError");
    case ErrorKind::MemoryError:         return QStringLiteral("MemoryError");
    case ErrorKind::Utf8Error:           return QStringLiteral("Utf8Error");
    case ErrorKind::NullPointer:         return QStringLiteral("NullPointer");
    case ErrorKind::Cancelled:           return QStringLiteral("Cancelled");
    case ErrorKind::NotImplemented:      return QStringLiteral("NotImplemented");
    case ErrorKind::Unknown:
    default:                             return QStringLiteral("Unknown");
    }
}

QJsonObject DomainFailure::toJson() const {
    QJsonObject err;
    err["kind"] = wireValue();
    err["kind_name"] = kindName();
    err["code"] = code;
    err["message"] = message;
    err["retryable"] = retryable;
    if (retryAfterSeconds)
        err["retry_after"] = *retryAfterSeconds;
    QJsonObject root;
    root["error"] = err;
    return root;
}

DomainFailure DomainFailure::invalidInput(const QString& code, const QString& msg) {
    return {ErrorKind::InvalidInput, code, msg, false, std::nullopt};
}

DomainFailure DomainFailure::jsonError(const QString& msg) {
    return {ErrorKind::JsonError, "malformed_json", msg, false, std::nullopt};
}

DomainFailure DomainFailure::utf8Error(const QString& msg) {
    return {ErrorKind::Utf8Error, "invalid_utf8", msg, false, std::nullopt};
}

DomainFailure DomainFailure::providerNotFound(const QString& msg) {
    return {ErrorKind::ProviderNotFound, "no_models", msg, false, std::nullopt};
}

DomainFailure DomainFailure::modelNotFound(const QString& code, const QString& msg) {
    return {ErrorKind::ModelNotFound, code, msg, false, std::nullopt};
}

DomainFailure DomainFailure::network(const QString& code, const QString& msg) {
    return {ErrorKind::NetworkError, code, msg, true, std::nullopt};
}

DomainFailure DomainFailure::authentication(const QString& code, const QString& msg) {
    return {ErrorKind::AuthenticationError, code, msg, false, std::nullopt};
}

DomainFailure DomainFailure::rateLimited(const QString& msg, std::optional<int> retryAfter) {
    return {ErrorKind::RateLimitError, "rate_limited", msg, true, retryAfter};
}

DomainFailure DomainFailure::timeout(const QString& msg) {
    return {ErrorKind::TimeoutError, "timeout", msg, true, std::nullopt};
}

DomainFailure DomainFailure::cancelled(const QString& msg) {
    return {ErrorKind::Cancelled, "cancelled", msg, false, std::nullopt};
}

DomainFailure DomainFailure::notImplemented(const QString& code, const QString& msg) {
    return {ErrorKind::NotImplemented, code, msg, false, std::nullopt};
}

DomainFailure DomainFailure::internal(const QString& msg) {
    return {ErrorKind::InternalError, "internal", msg, false, std::nullopt};
}

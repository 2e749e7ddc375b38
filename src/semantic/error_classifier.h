#pragma once
#include "failure.h"
#include <QByteArray>
#include <QMap>
#include <QString>
#include <optional>

// Normalizes provider failure conventions into the shared taxonomy.
namespace ErrorClassifier {

struct ProviderError {
    QString type;       // error.type, error.code or error.status, whichever the provider sets
    QString message;
};

ProviderError extractProviderError(const QByteArray& body);

std::optional<int> parseRetryAfter(const QString& value);

DomainFailure fromHttpStatus(int status,
                             const QByteArray& body,
                             const QMap<QString, QString>& headers = {});

bool isAuthenticationType(const QString& type);
bool isRateLimitType(const QString& type);

}

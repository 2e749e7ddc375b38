#pragma once
#include "semantic/ports.h"
#include "cancel_token.h"
#include <QNetworkReply>
#include <QNetworkRequest>

struct ExecutorOptions {
    int defaultTimeoutMs = 30000;
    qint64 maxResponseBytes = 32LL * 1024 * 1024;
    QString userAgent = QStringLiteral("specbridge");
};

// Blocking HTTP execution on the calling thread. Each call owns its own
// QNetworkAccessManager, so one executor serves concurrent callers.
class QtExecutor : public IExecutor {
public:
    explicit QtExecutor(const ExecutorOptions& options = {});

    Result<ExecutionOutcome> execute(const ProviderRequest& request,
                                     int timeoutMs,
                                     const CancelToken* cancel = nullptr) const override;

    // Replaces every ${ENV:NAME}; an unset or empty variable is a credentials failure.
    static Result<QString> expandEnv(const QString& value);
    static Result<QMap<QString, QString>> expandHeaders(const QMap<QString, QString>& headers);

    const ExecutorOptions& options() const { return m_options; }

private:
    ExecutorOptions m_options;

    QNetworkRequest buildQtRequest(const QUrl& url,
                                   const QMap<QString, QString>& headers) const;
    static DomainFailure classifyTransportError(QNetworkReply::NetworkError code,
                                                const QString& detail);
};

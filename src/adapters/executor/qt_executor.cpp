#include "qt_executor.h"
#include "sse_parser.h"
#include "core/log_manager.h"
#include "semantic/error_classifier.h"
#include <QElapsedTimer>
#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QRegularExpression>
#include <QTimer>
#include <QUrl>

QtExecutor::QtExecutor(const ExecutorOptions& options)
    : m_options(options)
{
}

Result<QString> QtExecutor::expandEnv(const QString& value)
{
    static const QRegularExpression ref(QStringLiteral("\\$\\{ENV:([A-Za-z_][A-Za-z0-9_]*)\\}"));
    QString out;
    qsizetype last = 0;
    auto matches = ref.globalMatch(value);
    while (matches.hasNext()) {
        const QRegularExpressionMatch m = matches.next();
        const QString name = m.captured(1);
        const QByteArray env = qgetenv(name.toUtf8().constData());
        if (env.isEmpty())
            return std::unexpected(DomainFailure::authentication(
                QStringLiteral("missing_credentials"),
                QStringLiteral("environment variable %1 is not set").arg(name)));
        out += value.mid(last, m.capturedStart() - last);
        out += QString::fromUtf8(env);
        last = m.capturedEnd();
    }
    out += value.mid(last);
    return out;
}

Result<QMap<QString, QString>> QtExecutor::expandHeaders(const QMap<QString, QString>& headers)
{
    QMap<QString, QString> out;
    for (auto it = headers.constBegin(); it != headers.constEnd(); ++it) {
        auto value = expandEnv(it.value());
        if (!value)
            return std::unexpected(value.error());
        out.insert(it.key(), *value);
    }
    return out;
}

QNetworkRequest QtExecutor::buildQtRequest(const QUrl& url,
                                           const QMap<QString, QString>& headers) const
{
    QNetworkRequest req{url};
    for (auto it = headers.constBegin(); it != headers.constEnd(); ++it)
        req.setRawHeader(it.key().toUtf8(), it.value().toUtf8());

    if (!req.hasRawHeader("Content-Type"))
        req.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");
    if (!req.hasRawHeader("User-Agent") && !m_options.userAgent.isEmpty())
        req.setHeader(QNetworkRequest::UserAgentHeader, m_options.userAgent);

    // The deadline is enforced by execute(); Qt's own transfer timeout stays off.
    req.setTransferTimeout(0);
    return req;
}

DomainFailure QtExecutor::classifyTransportError(QNetworkReply::NetworkError code,
                                                 const QString& detail)
{
    switch (code) {
    case QNetworkReply::ConnectionRefusedError:
        return DomainFailure::network(QStringLiteral("connection_refused"), detail);
    case QNetworkReply::HostNotFoundError:
        return DomainFailure::network(QStringLiteral("host_not_found"), detail);
    case QNetworkReply::RemoteHostClosedError:
        return DomainFailure::network(QStringLiteral("remote_closed"), detail);
    case QNetworkReply::SslHandshakeFailedError:
        return DomainFailure::network(QStringLiteral("tls_error"), detail);
    case QNetworkReply::ProxyConnectionRefusedError:
    case QNetworkReply::ProxyConnectionClosedError:
    case QNetworkReply::ProxyNotFoundError:
    case QNetworkReply::ProxyTimeoutError:
    case QNetworkReply::ProxyAuthenticationRequiredError:
    case QNetworkReply::UnknownProxyError:
        return DomainFailure::network(QStringLiteral("proxy_error"), detail);
    case QNetworkReply::TemporaryNetworkFailureError:
    case QNetworkReply::NetworkSessionFailedError:
    case QNetworkReply::BackgroundRequestNotAllowedError:
        return DomainFailure::network(QStringLiteral("temporary_failure"), detail);
    case QNetworkReply::TimeoutError:
        return DomainFailure::timeout(detail);
    default:
        return DomainFailure::network(QStringLiteral("network_error"), detail);
    }
}

Result<ExecutionOutcome> QtExecutor::execute(const ProviderRequest& request,
                                             int timeoutMs,
                                             const CancelToken* cancel) const
{
    if (cancel && cancel->isCancelled())
        return std::unexpected(DomainFailure::cancelled(QStringLiteral("cancelled before send")));

    const QString protocol = request.protocol.trimmed().toLower();
    if (protocol == QStringLiteral("ws") || protocol == QStringLiteral("wss"))
        return std::unexpected(DomainFailure::notImplemented(
            QStringLiteral("unsupported_protocol"),
            QStringLiteral("protocol '%1' is not supported by the HTTP executor").arg(protocol)));

    auto headers = expandHeaders(request.headers);
    if (!headers)
        return std::unexpected(headers.error());
    auto rawUrl = expandEnv(request.url);
    if (!rawUrl)
        return std::unexpected(rawUrl.error());

    const QUrl url(*rawUrl);
    if (!url.isValid() || (url.scheme() != QStringLiteral("http") && url.scheme() != QStringLiteral("https")))
        return std::unexpected(DomainFailure::invalidInput(
            QStringLiteral("invalid_url"),
            QStringLiteral("'%1' is not an http(s) URL").arg(request.url)));

    const int deadline = timeoutMs > 0 ? timeoutMs : m_options.defaultTimeoutMs;

    QNetworkAccessManager nam;
    QNetworkRequest req = buildQtRequest(url, *headers);

    const QString method = request.method.trimmed().toUpper();
    QNetworkReply* reply = nullptr;
    if (method == "POST")
        reply = nam.post(req, request.body);
    else if (method == "GET")
        reply = nam.get(req);
    else if (method == "PUT")
        reply = nam.put(req, request.body);
    else if (method == "DELETE")
        reply = nam.deleteResource(req);
    else
        reply = nam.sendCustomRequest(req, method.toUtf8(), request.body);

    QElapsedTimer elapsed;
    elapsed.start();

    bool cancelled = false;
    bool tooLarge = false;

    QEventLoop loop;
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QObject::connect(reply, &QNetworkReply::downloadProgress, &loop, [&](qint64 received, qint64) {
        if (received > m_options.maxResponseBytes) {
            tooLarge = true;
            loop.quit();
        }
    });

    QTimer timeoutTimer;
    timeoutTimer.setSingleShot(true);
    QObject::connect(&timeoutTimer, &QTimer::timeout, &loop, &QEventLoop::quit);
    timeoutTimer.start(deadline);

    QTimer cancelPoll;
    if (cancel) {
        QObject::connect(&cancelPoll, &QTimer::timeout, &loop, [&]() {
            if (cancel->isCancelled()) {
                cancelled = true;
                loop.quit();
            }
        });
        cancelPoll.start(20);
    }

    if (!reply->isFinished())
        loop.exec();

    const qint64 elapsedMs = elapsed.elapsed();

    if (reply->isRunning()) {
        reply->abort();
        reply->deleteLater();
        if (cancelled)
            return std::unexpected(DomainFailure::cancelled(
                QStringLiteral("request cancelled after %1 ms").arg(elapsedMs)));
        if (tooLarge)
            return std::unexpected(DomainFailure::network(
                QStringLiteral("response_too_large"),
                QStringLiteral("response exceeded %1 bytes").arg(m_options.maxResponseBytes)));
        LogManager::instance().log(LogManager::Warning, "execute",
            QStringLiteral("%1 %2 timed out after %3 ms").arg(method, url.toString(QUrl::RemoveQuery)).arg(elapsedMs));
        return std::unexpected(DomainFailure::timeout(
            QStringLiteral("request exceeded the %1 ms deadline").arg(deadline)));
    }

    const QVariant statusAttr = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    if (!statusAttr.isValid()) {
        const DomainFailure failure = classifyTransportError(reply->error(), reply->errorString());
        reply->deleteLater();
        LogManager::instance().log(LogManager::Warning, "execute",
            QStringLiteral("%1 %2 failed [%3]: %4").arg(method, url.toString(QUrl::RemoveQuery), failure.code, failure.message));
        return std::unexpected(failure);
    }

    ProviderResponse resp;
    resp.statusCode = statusAttr.toInt();
    resp.body = reply->readAll();
    resp.adapterHint = request.adapterHint;
    const QString contentType = reply->header(QNetworkRequest::ContentTypeHeader).toString();
    for (const auto& header : reply->rawHeaderList())
        resp.headers[QString::fromUtf8(header)] = QString::fromUtf8(reply->rawHeader(header));
    reply->deleteLater();

    if (resp.statusCode < 200 || resp.statusCode >= 300) {
        const DomainFailure failure = ErrorClassifier::fromHttpStatus(resp.statusCode, resp.body, resp.headers);
        LogManager::instance().log(LogManager::Warning, "execute",
            QStringLiteral("%1 %2 -> HTTP %3 (%4)").arg(method, url.toString(QUrl::RemoveQuery))
                .arg(resp.statusCode).arg(failure.kindName()));
        return std::unexpected(failure);
    }

    ExecutionOutcome outcome;
    outcome.response = resp;
    outcome.elapsedMs = elapsedMs;
    outcome.request = request;

    if (protocol == QStringLiteral("sse") || contentType.startsWith(QStringLiteral("text/event-stream"))) {
        for (const SseEvent& event : SseParser::parseAll(resp.body)) {
            ProviderChunk chunk;
            chunk.type = event.type;
            chunk.data = event.data;
            chunk.adapterHint = request.adapterHint;
            outcome.events.append(chunk);
        }
    }

    LogManager::instance().log(LogManager::Debug, "execute",
        QStringLiteral("%1 %2 -> HTTP %3 in %4 ms").arg(method, url.toString(QUrl::RemoveQuery))
            .arg(resp.statusCode).arg(elapsedMs));
    return outcome;
}

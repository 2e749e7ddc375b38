#include <QTest>
#include <QElapsedTimer>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTcpServer>
#include <QTcpSocket>
#include <QTimer>
#include "adapters/executor/qt_executor.h"
#include "core/engine.h"

namespace {

// One-shot HTTP responder. An empty reply keeps the connection open and silent.
class CannedServer : public QTcpServer {
public:
    explicit CannedServer(const QByteArray& reply)
        : m_reply(reply)
    {
        connect(this, &QTcpServer::newConnection, this, [this]() {
            while (QTcpSocket* socket = nextPendingConnection()) {
                connect(socket, &QTcpSocket::readyRead, socket, [this, socket]() {
                    m_received += socket->readAll();
                    if (!m_reply.isEmpty() && requestComplete()) {
                        socket->write(m_reply);
                        socket->disconnectFromHost();
                    }
                });
            }
        });
        listen(QHostAddress::LocalHost);
    }

    QString url(const QString& path = QStringLiteral("/v1/chat")) const {
        return QStringLiteral("http://127.0.0.1:%1%2").arg(serverPort()).arg(path);
    }

    QByteArray received() const { return m_received; }

private:
    QByteArray m_reply;
    QByteArray m_received;

    bool requestComplete() const {
        const qsizetype headerEnd = m_received.indexOf("\r\n\r\n");
        if (headerEnd < 0)
            return false;
        qsizetype contentLength = 0;
        for (const QByteArray& line : m_received.left(headerEnd).split('\n')) {
            if (line.toLower().startsWith("content-length:"))
                contentLength = line.mid(15).trimmed().toLongLong();
        }
        return m_received.size() - (headerEnd + 4) >= contentLength;
    }
};

QByteArray httpReply(int status, const QByteArray& reason, const QByteArray& body,
                     const QByteArray& contentType = "application/json",
                     const QByteArray& extraHeaders = QByteArray())
{
    return "HTTP/1.1 " + QByteArray::number(status) + ' ' + reason + "\r\n"
         + "Content-Type: " + contentType + "\r\n"
         + "Content-Length: " + QByteArray::number(body.size()) + "\r\n"
         + extraHeaders
         + "Connection: close\r\n\r\n" + body;
}

ProviderRequest post(const QString& url)
{
    ProviderRequest req;
    req.url = url;
    req.method = QStringLiteral("POST");
    req.protocol = QStringLiteral("http");
    req.body = R"({"model":"m"})";
    req.adapterHint = QStringLiteral("openai");
    return req;
}

}

class TestExecutor : public QObject {
    Q_OBJECT

private slots:
    void testSuccessfulPost() {
        CannedServer server(httpReply(200, "OK", R"({"id":"r1"})"));
        QVERIFY(server.isListening());

        qputenv("SPECBRIDGE_TEST_KEY", "sk-local");
        ProviderRequest req = post(server.url());
        req.headers[QStringLiteral("Authorization")] = QStringLiteral("Bearer ${ENV:SPECBRIDGE_TEST_KEY}");

        QtExecutor executor;
        auto outcome = executor.execute(req, 5000);
        QVERIFY2(outcome.has_value(), outcome ? "" : qPrintable(outcome.error().message));
        QCOMPARE(outcome->response.statusCode, 200);
        QCOMPARE(outcome->response.body, QByteArray(R"({"id":"r1"})"));
        QCOMPARE(outcome->response.adapterHint, QStringLiteral("openai"));
        QVERIFY(outcome->events.isEmpty());

        const QByteArray sent = server.received();
        QVERIFY(sent.startsWith("POST /v1/chat HTTP/1.1"));
        QVERIFY(sent.contains("Authorization: Bearer sk-local"));
        QVERIFY(sent.contains("User-Agent: specbridge"));
        QVERIFY(sent.endsWith(R"({"model":"m"})"));
    }

    void testHttpFailuresClassified() {
        CannedServer unauthorized(httpReply(401, "Unauthorized",
            R"({"error":{"code":"invalid_api_key","message":"bad key"}})"));
        auto auth = QtExecutor().execute(post(unauthorized.url()), 5000);
        QVERIFY(!auth.has_value());
        QCOMPARE(auth.error().kind, ErrorKind::AuthenticationError);
        QCOMPARE(auth.error().code, QStringLiteral("invalid_api_key"));

        CannedServer limited(httpReply(429, "Too Many Requests", R"({"error":{"message":"slow down"}})",
                                       "application/json", "Retry-After: 7\r\n"));
        auto rate = QtExecutor().execute(post(limited.url()), 5000);
        QVERIFY(!rate.has_value());
        QCOMPARE(rate.error().kind, ErrorKind::RateLimitError);
        QVERIFY(rate.error().retryable);
        QCOMPARE(rate.error().retryAfterSeconds.value_or(-1), 7);

        CannedServer broken(httpReply(502, "Bad Gateway", "upstream down", "text/plain"));
        auto network = QtExecutor().execute(post(broken.url()), 5000);
        QVERIFY(!network.has_value());
        QCOMPARE(network.error().kind, ErrorKind::NetworkError);
    }

    void testEventStreamCollected() {
        const QByteArray body =
            "data: {\"choices\":[{\"delta\":{\"content\":\"He\"}}]}\n\n"
            "data: {\"choices\":[{\"delta\":{\"content\":\"y\"}}]}\n\n"
            "data: [DONE]\n\n";
        CannedServer server(httpReply(200, "OK", body, "text/event-stream"));

        auto outcome = QtExecutor().execute(post(server.url()), 5000);
        QVERIFY(outcome.has_value());
        QCOMPARE(outcome->events.size(), 2);
        QCOMPARE(outcome->events[1].data, QByteArray("{\"choices\":[{\"delta\":{\"content\":\"y\"}}]}"));
        QCOMPARE(outcome->events[0].adapterHint, QStringLiteral("openai"));
    }

    void testSilentServerTimesOut() {
        CannedServer server{QByteArray()};
        QElapsedTimer timer;
        timer.start();
        auto outcome = QtExecutor().execute(post(server.url()), 200);
        const qint64 elapsed = timer.elapsed();
        QVERIFY(!outcome.has_value());
        QCOMPARE(outcome.error().kind, ErrorKind::TimeoutError);
        QVERIFY(outcome.error().retryable);
        QVERIFY2(elapsed >= 150, qPrintable(QString::number(elapsed)));
        QVERIFY2(elapsed < 200 + 1500, qPrintable(QString::number(elapsed)));
    }

    void testEngineRunHonoursSecondsDeadline() {
        CannedServer server{QByteArray()};
        QJsonObject endpoint;
        endpoint[QStringLiteral("url")] = server.url();
        endpoint[QStringLiteral("method")] = QStringLiteral("POST");
        endpoint[QStringLiteral("protocol")] = QStringLiteral("http");
        QJsonObject doc;
        doc[QStringLiteral("provider_request_json")] = QJsonObject{{QStringLiteral("model"), QStringLiteral("m")}};
        doc[QStringLiteral("endpoint")] = endpoint;

        const Engine engine;
        QElapsedTimer timer;
        timer.start();
        auto outcome = engine.run(QJsonDocument(doc).toJson(), 1);
        const qint64 elapsed = timer.elapsed();
        QVERIFY(!outcome.has_value());
        QCOMPARE(outcome.error().kind, ErrorKind::TimeoutError);
        QVERIFY2(elapsed >= 900, qPrintable(QString::number(elapsed)));
        QVERIFY2(elapsed < 1000 + 1500, qPrintable(QString::number(elapsed)));
    }

    void testConnectionRefused() {
        quint16 port = 0;
        {
            QTcpServer scratch;
            QVERIFY(scratch.listen(QHostAddress::LocalHost));
            port = scratch.serverPort();
        }
        auto outcome = QtExecutor().execute(post(QStringLiteral("http://127.0.0.1:%1/x").arg(port)), 2000);
        QVERIFY(!outcome.has_value());
        QCOMPARE(outcome.error().kind, ErrorKind::NetworkError);
        QCOMPARE(outcome.error().code, QStringLiteral("connection_refused"));
    }

    void testCancellation() {
        CancelToken early;
        early.cancel();
        auto before = QtExecutor().execute(post(QStringLiteral("http://127.0.0.1:1/")), 1000, &early);
        QVERIFY(!before.has_value());
        QCOMPARE(before.error().kind, ErrorKind::Cancelled);

        CannedServer server{QByteArray()};
        CancelToken token;
        QTimer::singleShot(50, [&token]() { token.cancel(); });
        auto during = QtExecutor().execute(post(server.url()), 5000, &token);
        QVERIFY(!during.has_value());
        QCOMPARE(during.error().kind, ErrorKind::Cancelled);
    }

    void testRejectedBeforeSend() {
        qunsetenv("SPECBRIDGE_MISSING_KEY");
        ProviderRequest req = post(QStringLiteral("http://127.0.0.1:1/"));
        req.headers[QStringLiteral("x-api-key")] = QStringLiteral("${ENV:SPECBRIDGE_MISSING_KEY}");
        auto missing = QtExecutor().execute(req, 1000);
        QVERIFY(!missing.has_value());
        QCOMPARE(missing.error().kind, ErrorKind::AuthenticationError);
        QCOMPARE(missing.error().code, QStringLiteral("missing_credentials"));

        auto badUrl = QtExecutor().execute(post(QStringLiteral("ftp://example.test/x")), 1000);
        QVERIFY(!badUrl.has_value());
        QCOMPARE(badUrl.error().kind, ErrorKind::InvalidInput);
        QCOMPARE(badUrl.error().code, QStringLiteral("invalid_url"));

        ProviderRequest socket = post(QStringLiteral("wss://example.test/realtime"));
        socket.protocol = QStringLiteral("wss");
        auto ws = QtExecutor().execute(socket, 1000);
        QVERIFY(!ws.has_value());
        QCOMPARE(ws.error().kind, ErrorKind::NotImplemented);
    }

    void testExpandEnv() {
        qputenv("SPECBRIDGE_A", "alpha");
        qputenv("SPECBRIDGE_B", "beta");
        auto value = QtExecutor::expandEnv(QStringLiteral("${ENV:SPECBRIDGE_A}-${ENV:SPECBRIDGE_B}?k=1"));
        QVERIFY(value.has_value());
        QCOMPARE(*value, QStringLiteral("alpha-beta?k=1"));
        QCOMPARE(*QtExecutor::expandEnv(QStringLiteral("no refs")), QStringLiteral("no refs"));
    }
};

QTEST_MAIN(TestExecutor)
#include "tst_executor.moc"

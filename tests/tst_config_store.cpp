#include <QTest>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include "config/config_store.h"
#include "config/config_types.h"

namespace {

QString writeFile(const QTemporaryDir& dir, const QByteArray& contents)
{
    const QString path = dir.path() + QStringLiteral("/config.json");
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly))
        qFatal("cannot write %s", qPrintable(path));
    file.write(contents);
    return path;
}

}

class TestConfigStore : public QObject {
    Q_OBJECT

private slots:
    void init() {
        qunsetenv("SPECBRIDGE_LOG_DIR");
        qunsetenv("SPECBRIDGE_TIMEOUT_MS");
    }

    void testMissingFileKeepsDefaults() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());

        ConfigStore store;
        QSignalSpy spy(&store, &ConfigStore::configChanged);
        QVERIFY(!store.load(dir.path() + QStringLiteral("/absent.json")));
        QCOMPARE(spy.count(), 1);

        const EngineConfig c = store.engineConfig();
        QCOMPARE(c.defaultTimeoutMs, 30000);
        QCOMPARE(c.maxResponseBytes, 32LL * 1024 * 1024);
        QCOMPARE(c.minSpecVersion, QStringLiteral("1.0.0"));
        QCOMPARE(c.maxSpecVersion, QStringLiteral("2.0.0"));
        QCOMPARE(c.logLevel, QStringLiteral("info"));
        QVERIFY(!c.debugMode);
    }

    void testMalformedFileRejected() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        ConfigStore store;
        QVERIFY(!store.load(writeFile(dir, "{ not json")));
        QCOMPARE(store.engineConfig().defaultTimeoutMs, 30000);
    }

    void testSnakeAndCamelKeys() {
        const QJsonObject snake = QJsonDocument::fromJson(R"({
            "spec": {"min_version": "1.2.0", "max_version": "3.0.0"},
            "execution": {"default_timeout_ms": 5000, "max_response_bytes": 4096, "user_agent": "tuned/2"},
            "logging": {"log_dir": "/tmp/sb", "level": "warning", "debug_mode": true}
        })").object();
        const EngineConfig a = ConfigStore::fromJson(snake);
        QCOMPARE(a.minSpecVersion, QStringLiteral("1.2.0"));
        QCOMPARE(a.maxSpecVersion, QStringLiteral("3.0.0"));
        QCOMPARE(a.defaultTimeoutMs, 5000);
        QCOMPARE(a.maxResponseBytes, 4096LL);
        QCOMPARE(a.userAgent, QStringLiteral("tuned/2"));
        QCOMPARE(a.logDir, QStringLiteral("/tmp/sb"));
        QCOMPARE(a.logLevel, QStringLiteral("warning"));
        QVERIFY(a.debugMode);

        const QJsonObject camel = QJsonDocument::fromJson(R"({
            "execution": {"defaultTimeoutMs": 7000, "userAgent": "camel"},
            "logging": {"logLevel": "debug", "debugMode": true}
        })").object();
        const EngineConfig b = ConfigStore::fromJson(camel);
        QCOMPARE(b.defaultTimeoutMs, 7000);
        QCOMPARE(b.userAgent, QStringLiteral("camel"));
        QCOMPARE(b.logLevel, QStringLiteral("debug"));
        QVERIFY(b.debugMode);
    }

    void testValuesClampedAndVersionsChecked() {
        const QJsonObject root = QJsonDocument::fromJson(R"({
            "spec": {"min_version": "one", "max_version": "2.5.0"},
            "execution": {"default_timeout_ms": 5, "max_response_bytes": 99999999999999}
        })").object();
        const EngineConfig c = ConfigStore::fromJson(root);
        QCOMPARE(c.defaultTimeoutMs, 100);
        QCOMPARE(c.maxResponseBytes, 1024LL * 1024 * 1024);
        QCOMPARE(c.minSpecVersion, QStringLiteral("1.0.0"));
        QCOMPARE(c.maxSpecVersion, QStringLiteral("2.5.0"));

        const VersionRange range = c.versionRange();
        QVERIFY(range.contains(*SemVer::parse(QStringLiteral("2.4.9"))));
        QVERIFY(!range.contains(*SemVer::parse(QStringLiteral("2.5.0"))));
    }

    void testEnvironmentOverrides() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString path = writeFile(dir, R"({"execution": {"default_timeout_ms": 5000}})");

        qputenv("SPECBRIDGE_TIMEOUT_MS", "1200");
        qputenv("SPECBRIDGE_LOG_DIR", "/var/tmp/specbridge");
        ConfigStore store;
        QVERIFY(store.load(path));
        QCOMPARE(store.engineConfig().defaultTimeoutMs, 1200);
        QCOMPARE(store.engineConfig().logDir, QStringLiteral("/var/tmp/specbridge"));

        ConfigStore noFile;
        QVERIFY(!noFile.load(QString()));
        QCOMPARE(noFile.engineConfig().defaultTimeoutMs, 1200);
    }

    void testSaveAndReload() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString path = dir.path() + QStringLiteral("/saved.json");

        ConfigStore store;
        store.load(path);
        QVariantMap opts;
        opts[QStringLiteral("defaultTimeoutMs")] = 4500;
        opts[QStringLiteral("user_agent")] = QStringLiteral("saved/1");
        opts[QStringLiteral("max_spec_version")] = QStringLiteral("not-a-version");
        store.setEngineOptions(opts);
        QVERIFY(QFile::exists(path));

        ConfigStore reloaded;
        QVERIFY(reloaded.load(path));
        QCOMPARE(reloaded.engineConfig().defaultTimeoutMs, 4500);
        QCOMPARE(reloaded.engineConfig().userAgent, QStringLiteral("saved/1"));
        QCOMPARE(reloaded.engineConfig().maxSpecVersion, QStringLiteral("2.0.0"));
        QCOMPARE(reloaded.engineOptions().value(QStringLiteral("default_timeout_ms")).toInt(), 4500);
    }

    void testSaveWithoutPathFails() {
        ConfigStore store;
        QVERIFY(!store.save());
    }
};

QTEST_MAIN(TestConfigStore)
#include "tst_config_store.moc"

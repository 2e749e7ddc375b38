#include <QTest>
#include "semantic/version.h"

class TestVersion : public QObject {
    Q_OBJECT

private slots:
    void testParse_data() {
        QTest::addColumn<QString>("text");
        QTest::addColumn<bool>("valid");

        QTest::newRow("plain") << "1.2.3" << true;
        QTest::newRow("zeros") << "0.0.0" << true;
        QTest::newRow("prerelease") << "1.0.0-beta.1" << true;
        QTest::newRow("build-meta") << "1.0.0+sha.abc" << true;
        QTest::newRow("two fields") << "1.0" << false;
        QTest::newRow("four fields") << "1.0.0.0" << false;
        QTest::newRow("leading zero") << "01.0.0" << false;
        QTest::newRow("letters") << "1.x.0" << false;
        QTest::newRow("empty") << "" << false;
    }

    void testParse() {
        QFETCH(QString, text);
        QFETCH(bool, valid);
        QCOMPARE(SemVer::parse(text).has_value(), valid);
    }

    void testNumericOrdering() {
        auto a = SemVer::parse(QStringLiteral("1.9.0"));
        auto b = SemVer::parse(QStringLiteral("1.10.0"));
        QVERIFY(a && b);
        QVERIFY(*a < *b);
        QVERIFY(!(*b < *a));
    }

    void testMetadataIgnored() {
        auto a = SemVer::parse(QStringLiteral("1.2.3+build.7"));
        auto b = SemVer::parse(QStringLiteral("1.2.3"));
        QVERIFY(a && b);
        QVERIFY(*a == *b);
        QCOMPARE(a->toString(), QStringLiteral("1.2.3"));
    }

    void testRangeIsHalfOpen() {
        VersionRange range;
        QVERIFY(range.contains(*SemVer::parse(QStringLiteral("1.0.0"))));
        QVERIFY(range.contains(*SemVer::parse(QStringLiteral("1.99.99"))));
        QVERIFY(!range.contains(*SemVer::parse(QStringLiteral("2.0.0"))));
        QVERIFY(!range.contains(*SemVer::parse(QStringLiteral("0.9.9"))));
        QCOMPARE(range.toString(), QStringLiteral("[1.0.0, 2.0.0)"));
    }
};

QTEST_MAIN(TestVersion)
#include "tst_version.moc"

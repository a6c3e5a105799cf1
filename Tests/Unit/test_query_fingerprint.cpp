#include <QtTest/QtTest>
#include "core/query/query_fingerprint.h"

class TestQueryFingerprint : public QObject {
    Q_OBJECT

private slots:
    void testNormalizationCollapsesCaseAndWhitespace()
    {
        QCOMPARE(dr::normalizeQueryText(QStringLiteral("  Novel\tResearch   METHODS \n")),
                 QStringLiteral("novel research methods"));
        QCOMPARE(dr::normalizeQueryText(QString()), QString());
    }

    void testEquivalentQueriesShareFingerprint()
    {
        const QString a = dr::queryFingerprint(QStringLiteral("Simple  Explanation"), 1);
        const QString b = dr::queryFingerprint(QStringLiteral("simple explanation"), 1);
        QCOMPARE(a, b);
        QCOMPARE(a.size(), 64);
    }

    void testDifferentTextDiffers()
    {
        QVERIFY(dr::queryFingerprint(QStringLiteral("simple explanation"), 1)
                != dr::queryFingerprint(QStringLiteral("complex explanation"), 1));
    }

    void testRegistryGenerationChangesFingerprint()
    {
        QVERIFY(dr::queryFingerprint(QStringLiteral("market growth"), 1)
                != dr::queryFingerprint(QStringLiteral("market growth"), 2));
    }
};

QTEST_MAIN(TestQueryFingerprint)
#include "test_query_fingerprint.moc"

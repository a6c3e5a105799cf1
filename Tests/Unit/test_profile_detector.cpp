#include <QtTest/QtTest>
#include "core/profiles/profile_registry.h"
#include "core/query/profile_detector.h"

class TestProfileDetector : public QObject {
    Q_OBJECT

private:
    std::shared_ptr<const dr::ProfileRegistry> m_registry;

private slots:
    void initTestCase()
    {
        QString error;
        m_registry = dr::ProfileRegistry::create(dr::RankingConfig::defaults().profiles, &error);
        QVERIFY2(m_registry, qPrintable(error));
    }

    void testDetectsResearcherQuery()
    {
        dr::ProfileDetector detector(true, 0.7);
        const auto detection = detector.detect(
            QStringLiteral("novel research methodology from a peer-reviewed journal"),
            *m_registry);
        QCOMPARE(detection.profileId, QStringLiteral("researcher"));
        QCOMPARE(detection.confidence, 1.0);
        QVERIFY(detection.detected);
    }

    void testPatternsMatchCaseInsensitively()
    {
        dr::ProfileDetector detector(true, 0.7);
        const auto detection = detector.detect(
            QStringLiteral("MARKET STRATEGY, BUDGET AND A VIABLE PLAN"), *m_registry);
        QCOMPARE(detection.profileId, QStringLiteral("business"));
        QVERIFY(detection.detected);
    }

    void testBelowThresholdFallsBackToDefault()
    {
        dr::ProfileDetector detector(true, 0.7);
        const auto detection = detector.detect(QStringLiteral("a study of rivers"), *m_registry);
        QCOMPARE(detection.profileId, QStringLiteral("general"));
        QVERIFY(!detection.detected);
        QCOMPARE(detection.confidence, 0.25);
    }

    void testConfidenceIsFractionOfPatterns()
    {
        // research + novel + algorithm: three of the four researcher patterns
        const double coverage = dr::ProfileDetector::patternCoverage(
            QStringLiteral("novel research on a sorting algorithm"), *m_registry,
            QStringLiteral("researcher"));
        QCOMPARE(coverage, 0.75);

        QCOMPARE(dr::ProfileDetector::patternCoverage(QStringLiteral("anything"), *m_registry,
                                                      QStringLiteral("general")),
                 0.0);
        QCOMPARE(dr::ProfileDetector::patternCoverage(QStringLiteral("anything"), *m_registry,
                                                      QStringLiteral("nobody")),
                 0.0);
    }

    void testRepeatedPatternCountsOnce()
    {
        std::vector<dr::ProfileDefinition> defs(2);
        defs[0].id = QStringLiteral("general");
        defs[1].id = QStringLiteral("ops");
        defs[1].patterns << QStringLiteral("\\bdeploy\\b") << QStringLiteral("\\bdeploy\\b")
                         << QStringLiteral("\\brollback\\b");
        auto registry = dr::ProfileRegistry::create(defs);
        QVERIFY(registry);

        // One of two distinct patterns, not two of three
        QCOMPARE(dr::ProfileDetector::patternCoverage(QStringLiteral("deploy the service"),
                                                      *registry, QStringLiteral("ops")),
                 0.5);

        dr::ProfileDetector detector(true, 0.6);
        const auto detection = detector.detect(QStringLiteral("deploy the service"), *registry);
        QCOMPARE(detection.profileId, QStringLiteral("general"));
        QVERIFY(!detection.detected);
    }

    void testTieGoesToFirstDeclaredProfile()
    {
        std::vector<dr::ProfileDefinition> defs(3);
        defs[0].id = QStringLiteral("general");
        defs[1].id = QStringLiteral("first");
        defs[1].patterns << QStringLiteral("\\bshared\\b");
        defs[2].id = QStringLiteral("second");
        defs[2].patterns << QStringLiteral("\\bshared\\b");
        auto registry = dr::ProfileRegistry::create(defs);
        QVERIFY(registry);

        dr::ProfileDetector detector(true, 0.5);
        const auto detection = detector.detect(QStringLiteral("shared term"), *registry);
        QCOMPARE(detection.profileId, QStringLiteral("first"));
        QCOMPARE(detection.confidence, 1.0);
    }

    void testDisabledDetectionUsesDefault()
    {
        dr::ProfileDetector detector(false, 0.7);
        const auto detection = detector.detect(
            QStringLiteral("court ruling on contract liability and ITAR export"), *m_registry);
        QCOMPARE(detection.profileId, QStringLiteral("general"));
        QVERIFY(!detection.detected);
    }

    void testDetectionIsIdempotent()
    {
        dr::ProfileDetector detector(true, 0.7);
        const QString query = QStringLiteral("court ruling on contract liability and ITAR export");
        const auto first = detector.detect(query, *m_registry);
        const auto second = detector.detect(query, *m_registry);
        QCOMPARE(first.profileId, QStringLiteral("legal"));
        QCOMPARE(second.profileId, first.profileId);
        QCOMPARE(second.confidence, first.confidence);
    }

    void testEmptyQueryUsesDefault()
    {
        dr::ProfileDetector detector(true, 0.0);
        const auto detection = detector.detect(QStringLiteral("   "), *m_registry);
        QCOMPARE(detection.profileId, QStringLiteral("general"));
        QVERIFY(!detection.detected);
    }
};

QTEST_MAIN(TestProfileDetector)
#include "test_profile_detector.moc"

#include <QtTest/QtTest>
#include "core/profiles/profile_registry.h"
#include "core/shared/ranking_config.h"

#include <limits>

class TestProfileRegistry : public QObject {
    Q_OBJECT

private:
    static dr::ProfileDefinition makeDefinition(const QString& id,
                                                dr::FactorWeights weights = {})
    {
        dr::ProfileDefinition def;
        def.id = id;
        def.weights = weights;
        return def;
    }

private slots:
    void testDefaultsLoadInDeclarationOrder()
    {
        QString error;
        auto registry = dr::ProfileRegistry::create(dr::RankingConfig::defaults().profiles, &error);
        QVERIFY2(registry, qPrintable(error));

        QCOMPARE(static_cast<int>(registry->profiles().size()), 4);
        QCOMPARE(registry->profiles()[0].id, QStringLiteral("general"));
        QCOMPARE(registry->profiles()[1].id, QStringLiteral("researcher"));
        QCOMPARE(registry->profiles()[2].id, QStringLiteral("business"));
        QCOMPARE(registry->profiles()[3].id, QStringLiteral("legal"));
        QCOMPARE(registry->defaultProfile().id, QStringLiteral("general"));
    }

    void testFindAndContains()
    {
        auto registry = dr::ProfileRegistry::create(dr::RankingConfig::defaults().profiles);
        QVERIFY(registry);

        const dr::Profile* researcher = registry->find(QStringLiteral("researcher"));
        QVERIFY(researcher != nullptr);
        QCOMPARE(researcher->multiplier(QStringLiteral("novelty")), 1.5);
        QVERIFY(registry->contains(QStringLiteral("legal")));

        QVERIFY(registry->find(QStringLiteral("astronaut")) == nullptr);
        QVERIFY(!registry->contains(QStringLiteral("astronaut")));
    }

    void testAbsentDimensionHasUnitMultiplier()
    {
        auto registry = dr::ProfileRegistry::create(dr::RankingConfig::defaults().profiles);
        QVERIFY(registry);
        const dr::Profile& general = registry->defaultProfile();
        QVERIFY(!general.hasDimension(QStringLiteral("novelty")));
        QCOMPARE(general.multiplier(QStringLiteral("novelty")), 1.0);
    }

    void testWeightSumViolationFailsWholeLoad()
    {
        std::vector<dr::ProfileDefinition> defs = dr::RankingConfig::defaults().profiles;
        defs[2].weights.recencyScore += 0.01;

        QString error;
        auto registry = dr::ProfileRegistry::create(defs, &error);
        QVERIFY(!registry);
        QVERIFY(error.contains(QStringLiteral("business")));
        QVERIFY(error.contains(QStringLiteral("sum")));
    }

    void testWeightSumWithinToleranceAccepted()
    {
        dr::FactorWeights weights;
        weights.semanticSimilarity = 0.4 + 5e-7;
        auto registry = dr::ProfileRegistry::create({makeDefinition(QStringLiteral("general"),
                                                                    weights)});
        QVERIFY(registry);
    }

    void testNonPositiveMultiplierRejected()
    {
        dr::ProfileDefinition def = makeDefinition(QStringLiteral("general"));
        def.dimensions[QStringLiteral("novelty")] = 0.0;

        QString error;
        QVERIFY(!dr::ProfileRegistry::create({def}, &error));
        QVERIFY(error.contains(QStringLiteral("novelty")));

        def.dimensions[QStringLiteral("novelty")] = std::numeric_limits<double>::infinity();
        QVERIFY(!dr::ProfileRegistry::create({def}, &error));
    }

    void testDuplicateIdRejected()
    {
        QString error;
        auto registry = dr::ProfileRegistry::create(
            {makeDefinition(QStringLiteral("general")), makeDefinition(QStringLiteral("general"))},
            &error);
        QVERIFY(!registry);
        QVERIFY(error.contains(QStringLiteral("duplicate")));
    }

    void testEmptyIdRejected()
    {
        QString error;
        QVERIFY(!dr::ProfileRegistry::create(
            {makeDefinition(QStringLiteral("general")), makeDefinition(QStringLiteral("  "))},
            &error));
        QVERIFY(!error.isEmpty());
    }

    void testGeneralProfileRequired()
    {
        QString error;
        QVERIFY(!dr::ProfileRegistry::create({makeDefinition(QStringLiteral("researcher"))},
                                             &error));
        QVERIFY(error.contains(QStringLiteral("general")));
    }

    void testInvalidPatternRejected()
    {
        dr::ProfileDefinition def = makeDefinition(QStringLiteral("general"));
        def.patterns << QStringLiteral("\\b(?:unclosed");

        QString error;
        QVERIFY(!dr::ProfileRegistry::create({def}, &error));
        QVERIFY(error.contains(QStringLiteral("invalid pattern")));
    }

    void testPatternsCompiledCaseInsensitive()
    {
        auto registry = dr::ProfileRegistry::create(dr::RankingConfig::defaults().profiles);
        QVERIFY(registry);
        const dr::Profile* business = registry->find(QStringLiteral("business"));
        QVERIFY(business != nullptr);
        QCOMPARE(static_cast<int>(business->patterns.size()), 4);
        QCOMPARE(static_cast<int>(business->patternSources.size()), 4);
        QVERIFY(business->patterns[0].match(QStringLiteral("MARKET outlook")).hasMatch());
        QVERIFY(business->patterns[1].match(QStringLiteral("roi of the plan")).hasMatch());
    }

    void testRepeatedPatternsCompiledOnce()
    {
        auto defs = dr::RankingConfig::defaults().profiles;
        defs[1].patterns << defs[1].patterns.first();
        auto registry = dr::ProfileRegistry::create(defs);
        QVERIFY(registry);

        const dr::Profile* researcher = registry->find(QStringLiteral("researcher"));
        QVERIFY(researcher);
        QCOMPARE(static_cast<int>(researcher->patterns.size()), 4);
        QCOMPARE(static_cast<int>(researcher->patternSources.size()), 4);
    }

    void testGenerationUniquePerSnapshot()
    {
        const auto defs = dr::RankingConfig::defaults().profiles;
        auto first = dr::ProfileRegistry::create(defs);
        auto second = dr::ProfileRegistry::create(defs);
        QVERIFY(first && second);
        QVERIFY(first->generation() != second->generation());
        QVERIFY(second->generation() > first->generation());
    }
};

QTEST_MAIN(TestProfileRegistry)
#include "test_profile_registry.moc"

#include <QtTest/QtTest>
#include "core/shared/config_loader.h"

#include <QJsonArray>
#include <QFile>
#include <QJsonDocument>
#include <QTemporaryDir>

#include <algorithm>

class TestConfigLoader : public QObject {
    Q_OBJECT

private:
    static QString shippedConfigPath()
    {
        return QStringLiteral(DIMRANK_SOURCE_DIR "/config/dimension_ranking.json");
    }

    static QJsonObject parse(const char* json)
    {
        return QJsonDocument::fromJson(QByteArray(json)).object();
    }

private slots:
    // ── Shipped file and defaults ─────────────────────────────────

    void testShippedConfigMatchesDefaults()
    {
        QString error;
        const auto loaded = dr::ConfigLoader::loadFromFile(shippedConfigPath(), &error);
        QVERIFY2(loaded.has_value(), qPrintable(error));

        const dr::RankingConfig defaults = dr::RankingConfig::defaults();
        QCOMPARE(loaded->profiles.size(), defaults.profiles.size());
        for (size_t i = 0; i < defaults.profiles.size(); ++i) {
            QCOMPARE(loaded->profiles[i].id, defaults.profiles[i].id);
            QCOMPARE(loaded->profiles[i].patterns, defaults.profiles[i].patterns);
            QVERIFY(loaded->profiles[i].dimensions == defaults.profiles[i].dimensions);
            QCOMPARE(loaded->profiles[i].weights.sum(), 1.0);
        }
        QCOMPARE(loaded->filters.mappings.size(), defaults.filters.mappings.size());
        QCOMPARE(loaded->retrieval.minCandidates, 20);
        QCOMPARE(loaded->retrieval.maxCandidatesMultiplier, 4);
        QCOMPARE(loaded->retrieval.maxProcessingTimeMs, 200);
        QVERIFY(loaded->retrieval.defaultStrategy == dr::RankingStrategy::Hybrid);
        QVERIFY(loaded->alignment.method == dr::AlignmentMethod::Min);
        QVERIFY(loaded->alignment.normalization == dr::NormalizationMode::TotalWeight);
        QCOMPARE(loaded->cache.cacheSize, 1000);
        QCOMPARE(loaded->cache.queryCacheSize, 100);
        QCOMPARE(loaded->logging.level, QStringLiteral("INFO"));
    }

    void testDefaultsAreValid()
    {
        QString error;
        QVERIFY2(dr::validateRankingConfig(dr::RankingConfig::defaults(), &error),
                 qPrintable(error));
        QCOMPARE(static_cast<int>(dr::RankingConfig::defaults().filters.mappings.size()), 12);
    }

    void testEmptyObjectYieldsDefaults()
    {
        const auto config = dr::ConfigLoader::fromJson(QJsonObject());
        QVERIFY(config.has_value());
        QCOMPARE(static_cast<int>(config->profiles.size()), 4);
        QCOMPARE(config->filters.filterStrength, 0.5);
        QCOMPARE(config->detection.confidenceThreshold, 0.7);
    }

    void testPartialOverrideKeepsOtherDefaults()
    {
        const auto config = dr::ConfigLoader::fromJson(parse(R"({
            "retrieval": { "max_processing_time_ms": 50, "default_strategy": "adaptive" },
            "caching": { "cache_ttl": 10 }
        })"));
        QVERIFY(config.has_value());
        QCOMPARE(config->retrieval.maxProcessingTimeMs, 50);
        QVERIFY(config->retrieval.defaultStrategy == dr::RankingStrategy::Adaptive);
        QCOMPARE(config->retrieval.minCandidates, 20);
        QCOMPARE(config->cache.cacheTtlSeconds, 10);
        QCOMPARE(config->cache.cacheSize, 1000);
    }

    // ── Rejections ────────────────────────────────────────────────

    void testUnknownEnumRejected()
    {
        QString error;
        const auto config = dr::ConfigLoader::fromJson(
            parse(R"({ "retrieval": { "default_strategy": "telepathic" } })"), &error);
        QVERIFY(!config.has_value());
        QVERIFY(error.contains(QStringLiteral("default_strategy")));
    }

    void testWrongTypeRejected()
    {
        QString error;
        QVERIFY(!dr::ConfigLoader::fromJson(
                     parse(R"({ "retrieval": { "enable_fallback": "yes" } })"), &error)
                     .has_value());
        QVERIFY(error.contains(QStringLiteral("enable_fallback")));

        QVERIFY(!dr::ConfigLoader::fromJson(
                     parse(R"({ "retrieval": { "min_candidates": 2.5 } })"), &error)
                     .has_value());
        QVERIFY(error.contains(QStringLiteral("min_candidates")));
    }

    void testBadWeightSumRejectsWholeConfig()
    {
        QString error;
        const auto config = dr::ConfigLoader::fromJson(parse(R"({
            "profiles": [
                { "id": "general",
                  "weights": { "semantic_similarity": 0.4, "dimension_alignment": 0.3,
                               "recency_score": 0.2, "confidence_score": 0.2 } }
            ]
        })"), &error);
        QVERIFY(!config.has_value());
        QVERIFY(error.contains(QStringLiteral("sum")));
    }

    void testMissingWeightRejected()
    {
        QString error;
        const auto config = dr::ConfigLoader::fromJson(parse(R"({
            "profiles": [
                { "id": "general",
                  "weights": { "semantic_similarity": 0.5, "dimension_alignment": 0.5 } }
            ]
        })"), &error);
        QVERIFY(!config.has_value());
        QVERIFY(error.contains(QStringLiteral("recency_score")));
    }

    void testProfilesWithoutGeneralRejected()
    {
        QString error;
        const auto config = dr::ConfigLoader::fromJson(parse(R"({
            "profiles": [
                { "id": "researcher",
                  "weights": { "semantic_similarity": 0.3, "dimension_alignment": 0.4,
                               "recency_score": 0.2, "confidence_score": 0.1 } }
            ]
        })"), &error);
        QVERIFY(!config.has_value());
        QVERIFY(error.contains(QStringLiteral("general")));
    }

    void testAdaptiveFallbackStrategyRejected()
    {
        QString error;
        QVERIFY(!dr::ConfigLoader::fromJson(
                     parse(R"({ "retrieval": { "fallback_strategy": "adaptive" } })"), &error)
                     .has_value());
        QVERIFY(error.contains(QStringLiteral("fallback_strategy")));
    }

    void testUnknownLoggingLevelRejected()
    {
        QString error;
        QVERIFY(!dr::ConfigLoader::fromJson(parse(R"({ "logging": { "level": "CHATTY" } })"),
                                            &error)
                     .has_value());
        QVERIFY(error.contains(QStringLiteral("CHATTY")));
    }

    void testMissingFileReported()
    {
        QString error;
        QVERIFY(!dr::ConfigLoader::loadFromFile(QStringLiteral("/nonexistent/dimrank.json"),
                                                &error)
                     .has_value());
        QVERIFY(error.contains(QStringLiteral("cannot open")));
    }

    void testMalformedJsonReported()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString path = dir.filePath(QStringLiteral("broken.json"));
        QFile file(path);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write("{ \"retrieval\": ");
        file.close();

        QString error;
        QVERIFY(!dr::ConfigLoader::loadFromFile(path, &error).has_value());
        QVERIFY(error.startsWith(path));
    }

    // ── Section details ───────────────────────────────────────────

    void testFilterMappingsPreserveOrderAndLevels()
    {
        const auto config = dr::ConfigLoader::fromJson(parse(R"({
            "natural_language_filters": {
                "filter_strength": 0.25,
                "filter_mappings": [
                    { "phrase": "trustworthy", "constraints": { "credibility": 0.8 } },
                    { "phrase": "quick read", "constraints": { "complexity": "low" },
                      "confidence": 0.9 }
                ]
            }
        })"));
        QVERIFY(config.has_value());
        QCOMPARE(config->filters.filterStrength, 0.25);
        QCOMPARE(static_cast<int>(config->filters.mappings.size()), 2);

        const dr::FilterMapping& first = config->filters.mappings[0];
        QCOMPARE(first.phrase, QStringLiteral("trustworthy"));
        QVERIFY(first.constraints[0].level == dr::ConstraintLevel::Threshold);
        QCOMPARE(first.constraints[0].threshold, 0.8);
        QVERIFY(!first.confidence.has_value());

        const dr::FilterMapping& second = config->filters.mappings[1];
        QVERIFY(second.constraints[0].level == dr::ConstraintLevel::Low);
        QVERIFY(second.confidence.has_value());
        QCOMPARE(*second.confidence, 0.9);
    }

    void testBadConstraintValueRejected()
    {
        QString error;
        const auto config = dr::ConfigLoader::fromJson(parse(R"({
            "natural_language_filters": {
                "filter_mappings": [
                    { "phrase": "odd", "constraints": { "novelty": "medium" } }
                ]
            }
        })"), &error);
        QVERIFY(!config.has_value());
        QVERIFY(error.contains(QStringLiteral("novelty")));
    }

    void testDetectionPatternsOverrideProfilePatterns()
    {
        const auto config = dr::ConfigLoader::fromJson(parse(R"({
            "auto_profile_detection": {
                "confidence_threshold": 0.5,
                "patterns": { "legal": ["\\bstatute\\b"] }
            }
        })"));
        QVERIFY(config.has_value());
        QCOMPARE(config->detection.confidenceThreshold, 0.5);
        const auto legal = std::find_if(config->profiles.begin(), config->profiles.end(),
                                        [](const dr::ProfileDefinition& p) {
                                            return p.id == QStringLiteral("legal");
                                        });
        QVERIFY(legal != config->profiles.end());
        QCOMPARE(legal->patterns, QStringList{QStringLiteral("\\bstatute\\b")});
    }

    void testDetectionPatternsForUnknownProfileRejected()
    {
        QString error;
        QVERIFY(!dr::ConfigLoader::fromJson(parse(R"({
            "auto_profile_detection": { "patterns": { "pirate": ["arr"] } }
        })"), &error).has_value());
        QVERIFY(error.contains(QStringLiteral("pirate")));
    }

    void testToJsonReloadsToSameConfig()
    {
        dr::RankingConfig original = dr::RankingConfig::defaults();
        original.retrieval.scoringThreads = 3;
        original.alignment.method = dr::AlignmentMethod::WeightedAverage;
        original.cache.shardCount = 2;

        QString error;
        const auto reloaded = dr::ConfigLoader::fromJson(dr::ConfigLoader::toJson(original),
                                                         &error);
        QVERIFY2(reloaded.has_value(), qPrintable(error));
        QCOMPARE(reloaded->retrieval.scoringThreads, 3);
        QVERIFY(reloaded->alignment.method == dr::AlignmentMethod::WeightedAverage);
        QCOMPARE(reloaded->cache.shardCount, 2);
        QCOMPARE(reloaded->profiles.size(), original.profiles.size());
        QCOMPARE(reloaded->filters.mappings.size(), original.filters.mappings.size());
    }
};

QTEST_MAIN(TestConfigLoader)
#include "test_config_loader.moc"

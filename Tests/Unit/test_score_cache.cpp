#include <QtTest/QtTest>
#include "core/cache/expiring_cache.h"
#include "core/cache/score_cache.h"

#include <chrono>
#include <memory>
#include <thread>

class TestScoreCache : public QObject {
    Q_OBJECT

private:
    using Cache = dr::ExpiringCache<QString, int, dr::QStringHash>;
    using Clock = Cache::Clock;

    // Manually advanced clock shared with the cache under test
    struct FakeClock {
        Clock::time_point now = Clock::time_point(std::chrono::hours(1));
        void advance(std::chrono::milliseconds delta) { now += delta; }
    };

    static Cache::ClockFn clockFn(const std::shared_ptr<FakeClock>& clock)
    {
        return [clock]() { return clock->now; };
    }

    static dr::ExpiringCacheConfig config(int maxEntries, int ttlSeconds, int shardCount)
    {
        dr::ExpiringCacheConfig c;
        c.maxEntries = maxEntries;
        c.ttlSeconds = ttlSeconds;
        c.shardCount = shardCount;
        return c;
    }

private slots:
    // ── ExpiringCache ─────────────────────────────────────────────

    void testHitAndMiss()
    {
        Cache cache;
        cache.put(QStringLiteral("a"), 1);
        auto hit = cache.get(QStringLiteral("a"));
        QVERIFY(hit.has_value());
        QCOMPARE(*hit, 1);
        QVERIFY(!cache.get(QStringLiteral("b")).has_value());

        const auto stats = cache.stats();
        QCOMPARE(stats.hits, uint64_t(1));
        QCOMPARE(stats.misses, uint64_t(1));
        QCOMPARE(stats.currentSize, 1);
    }

    void testTtlBoundary()
    {
        auto clock = std::make_shared<FakeClock>();
        Cache cache(config(10, 60, 4), clockFn(clock));
        cache.put(QStringLiteral("key"), 42);

        clock->advance(std::chrono::seconds(60) - std::chrono::milliseconds(1));
        QVERIFY(cache.get(QStringLiteral("key")).has_value());

        clock->advance(std::chrono::milliseconds(2));
        QVERIFY(!cache.get(QStringLiteral("key")).has_value());

        const auto stats = cache.stats();
        QCOMPARE(stats.expirations, uint64_t(1));
        QCOMPARE(stats.currentSize, 0);
    }

    void testReadDoesNotExtendLifetime()
    {
        auto clock = std::make_shared<FakeClock>();
        Cache cache(config(10, 10, 1), clockFn(clock));
        cache.put(QStringLiteral("key"), 1);

        for (int i = 0; i < 9; ++i) {
            clock->advance(std::chrono::seconds(1));
            QVERIFY(cache.get(QStringLiteral("key")).has_value());
        }
        clock->advance(std::chrono::seconds(1));
        QVERIFY(!cache.get(QStringLiteral("key")).has_value());
    }

    void testReinsertRefreshesTimestamp()
    {
        auto clock = std::make_shared<FakeClock>();
        Cache cache(config(10, 10, 1), clockFn(clock));
        cache.put(QStringLiteral("key"), 1);
        clock->advance(std::chrono::seconds(8));
        cache.put(QStringLiteral("key"), 2);
        clock->advance(std::chrono::seconds(8));

        auto value = cache.get(QStringLiteral("key"));
        QVERIFY(value.has_value());
        QCOMPARE(*value, 2);
        QCOMPARE(cache.stats().currentSize, 1);
    }

    void testFifoEvictionWithSingleShard()
    {
        Cache cache(config(3, 3600, 1));
        cache.put(QStringLiteral("a"), 1);
        cache.put(QStringLiteral("b"), 2);
        cache.put(QStringLiteral("c"), 3);

        // Reading "a" does not protect it: eviction is by insertion order
        QVERIFY(cache.get(QStringLiteral("a")).has_value());
        cache.put(QStringLiteral("d"), 4);

        QVERIFY(!cache.get(QStringLiteral("a")).has_value());
        QVERIFY(cache.get(QStringLiteral("b")).has_value());
        QVERIFY(cache.get(QStringLiteral("c")).has_value());
        QVERIFY(cache.get(QStringLiteral("d")).has_value());
        QCOMPARE(cache.stats().evictions, uint64_t(1));
    }

    void testExpiredEntriesGoBeforeLiveOnes()
    {
        auto clock = std::make_shared<FakeClock>();
        Cache cache(config(2, 10, 1), clockFn(clock));
        cache.put(QStringLiteral("old"), 1);
        clock->advance(std::chrono::seconds(11));
        cache.put(QStringLiteral("fresh"), 2);
        cache.put(QStringLiteral("newer"), 3);

        const auto stats = cache.stats();
        QCOMPARE(stats.expirations, uint64_t(1));
        QCOMPARE(stats.evictions, uint64_t(0));
        QVERIFY(cache.get(QStringLiteral("fresh")).has_value());
        QVERIFY(cache.get(QStringLiteral("newer")).has_value());
    }

    void testSizeBoundAcrossShards()
    {
        Cache cache(config(16, 3600, 4));
        QCOMPARE(cache.shardCount(), 4);
        for (int i = 0; i < 200; ++i) {
            cache.put(QStringLiteral("key-%1").arg(i), i);
        }
        const auto stats = cache.stats();
        QCOMPARE(stats.currentSize, 16);
        QCOMPARE(stats.evictions, uint64_t(184));
    }

    void testNoEvictionBelowCapacityAcrossShards()
    {
        Cache cache(config(8, 3600, 8));
        QCOMPARE(cache.shardCount(), 8);
        for (int i = 0; i < 8; ++i) {
            cache.put(QStringLiteral("key-%1").arg(i), i);
        }

        const auto stats = cache.stats();
        QCOMPARE(stats.evictions, uint64_t(0));
        QCOMPARE(stats.currentSize, 8);
        for (int i = 0; i < 8; ++i) {
            QVERIFY2(cache.get(QStringLiteral("key-%1").arg(i)).has_value(),
                     qPrintable(QStringLiteral("key-%1 missing").arg(i)));
        }
    }

    void testEvictsOldestInsertionAcrossShards()
    {
        Cache cache(config(8, 3600, 4));
        for (int i = 0; i < 8; ++i) {
            cache.put(QStringLiteral("key-%1").arg(i), i);
        }
        cache.put(QStringLiteral("key-8"), 8);
        cache.put(QStringLiteral("key-9"), 9);

        const auto stats = cache.stats();
        QCOMPARE(stats.evictions, uint64_t(2));
        QCOMPARE(stats.currentSize, 8);
        QVERIFY(!cache.get(QStringLiteral("key-0")).has_value());
        QVERIFY(!cache.get(QStringLiteral("key-1")).has_value());
        for (int i = 2; i < 10; ++i) {
            QVERIFY(cache.get(QStringLiteral("key-%1").arg(i)).has_value());
        }
    }

    void testShardCountClampedToCapacity()
    {
        Cache small(config(2, 3600, 8));
        QCOMPARE(small.shardCount(), 2);

        Cache zero(config(10, 3600, 0));
        QCOMPARE(zero.shardCount(), 1);
    }

    void testClear()
    {
        Cache cache;
        cache.put(QStringLiteral("a"), 1);
        cache.put(QStringLiteral("b"), 2);
        cache.clear();
        QVERIFY(!cache.get(QStringLiteral("a")).has_value());
        QCOMPARE(cache.stats().currentSize, 0);
    }

    void testConcurrentAccess()
    {
        Cache cache(config(64, 3600, 8));
        std::vector<std::thread> threads;
        for (int t = 0; t < 4; ++t) {
            threads.emplace_back([&cache, t]() {
                for (int i = 0; i < 500; ++i) {
                    const QString key = QStringLiteral("k%1").arg((i * 7 + t) % 100);
                    cache.put(key, i);
                    cache.get(key);
                }
            });
        }
        for (std::thread& thread : threads) {
            thread.join();
        }

        const auto stats = cache.stats();
        QVERIFY(stats.currentSize <= 64);
        QCOMPARE(stats.hits + stats.misses, uint64_t(2000));
    }

    // ── ScoreCache ────────────────────────────────────────────────

    void testAlignmentKeyIncludesProfile()
    {
        dr::ScoreCache cache;
        const dr::AlignmentCacheKey researcher{QStringLiteral("fp"), QStringLiteral("c1"),
                                               QStringLiteral("researcher")};
        const dr::AlignmentCacheKey business{QStringLiteral("fp"), QStringLiteral("c1"),
                                             QStringLiteral("business")};

        QVERIFY(cache.lookupAlignment(researcher).status == dr::CacheStatus::Miss);
        QVERIFY(cache.storeAlignment(researcher, 0.42));

        const auto hit = cache.lookupAlignment(researcher);
        QVERIFY(hit.status == dr::CacheStatus::Hit);
        QCOMPARE(hit.alignment, 0.42);
        QVERIFY(cache.lookupAlignment(business).status == dr::CacheStatus::Miss);
    }

    void testEmbeddingCacheIndependentOfAlignmentCache()
    {
        dr::CacheConfig cacheConfig;
        cacheConfig.cacheSize = 1;
        cacheConfig.queryCacheSize = 4;
        cacheConfig.shardCount = 1;
        dr::ScoreCache cache(cacheConfig);

        QVERIFY(cache.storeEmbedding(QStringLiteral("query"), {0.5f, 0.25f}));
        cache.storeAlignment({QStringLiteral("fp"), QStringLiteral("a"), QStringLiteral("p")}, 0.1);
        cache.storeAlignment({QStringLiteral("fp"), QStringLiteral("b"), QStringLiteral("p")}, 0.2);

        const auto embedding = cache.lookupEmbedding(QStringLiteral("query"));
        QVERIFY(embedding.status == dr::CacheStatus::Hit);
        QCOMPARE(static_cast<int>(embedding.embedding.size()), 2);
        QCOMPARE(embedding.embedding[1], 0.25f);

        QCOMPARE(cache.alignmentStats().currentSize, 1);
        QCOMPARE(cache.alignmentStats().evictions, uint64_t(1));
        QCOMPARE(cache.embeddingStats().currentSize, 1);
    }

    void testScoreCacheTtlUsesInjectedClock()
    {
        auto clock = std::make_shared<FakeClock>();
        dr::CacheConfig cacheConfig;
        cacheConfig.cacheTtlSeconds = 5;
        cacheConfig.queryCacheTtlSeconds = 20;
        dr::ScoreCache cache(cacheConfig, clockFn(clock));

        const dr::AlignmentCacheKey key{QStringLiteral("fp"), QStringLiteral("c"),
                                        QStringLiteral("general")};
        cache.storeAlignment(key, 0.3);
        cache.storeEmbedding(QStringLiteral("q"), {1.0f});

        clock->advance(std::chrono::seconds(6));
        QVERIFY(cache.lookupAlignment(key).status == dr::CacheStatus::Miss);
        QVERIFY(cache.lookupEmbedding(QStringLiteral("q")).status == dr::CacheStatus::Hit);

        cache.clear();
        QVERIFY(cache.lookupEmbedding(QStringLiteral("q")).status == dr::CacheStatus::Miss);
    }
};

QTEST_MAIN(TestScoreCache)
#include "test_score_cache.moc"

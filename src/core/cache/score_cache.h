#pragma once

#include "core/cache/expiring_cache.h"
#include "core/shared/ranking_config.h"

#include <QHash>
#include <QString>

#include <vector>

namespace dr {

struct AlignmentCacheKey {
    QString queryFingerprint;
    QString chunkId;
    QString profileId;

    bool operator==(const AlignmentCacheKey& other) const
    {
        return queryFingerprint == other.queryFingerprint
               && chunkId == other.chunkId
               && profileId == other.profileId;
    }
};

struct AlignmentCacheKeyHash {
    size_t operator()(const AlignmentCacheKey& key) const
    {
        return qHashMulti(0, key.queryFingerprint, key.chunkId, key.profileId);
    }
};

struct QStringHash {
    size_t operator()(const QString& s) const { return qHash(s); }
};

enum class CacheStatus {
    Hit,
    Miss,
    Unavailable,   // Backend failed; the caller recomputes without caching
};

struct AlignmentLookup {
    CacheStatus status = CacheStatus::Miss;
    double alignment = 0.0;
};

struct EmbeddingLookup {
    CacheStatus status = CacheStatus::Miss;
    std::vector<float> embedding;
};

// ScoreCacheBackend -- what the ranker needs from a score cache. Store
// methods return false when the backend is unavailable.
class ScoreCacheBackend {
public:
    virtual ~ScoreCacheBackend() = default;

    virtual AlignmentLookup lookupAlignment(const AlignmentCacheKey& key) = 0;
    virtual bool storeAlignment(const AlignmentCacheKey& key, double alignment) = 0;

    // Keyed by the normalized query text
    virtual EmbeddingLookup lookupEmbedding(const QString& queryKey) = 0;
    virtual bool storeEmbedding(const QString& queryKey, const std::vector<float>& embedding) = 0;
};

// ScoreCache -- in-process backend: one ExpiringCache for alignment results
// (cache_size / cache_ttl) and one for query embeddings (query_cache_size /
// query_cache_ttl). Safe to share between concurrent queries.
class ScoreCache : public ScoreCacheBackend {
public:
    using ClockFn = ExpiringCache<QString, double, QStringHash>::ClockFn;

    explicit ScoreCache(const CacheConfig& config = {}, ClockFn clock = {});

    AlignmentLookup lookupAlignment(const AlignmentCacheKey& key) override;
    bool storeAlignment(const AlignmentCacheKey& key, double alignment) override;
    EmbeddingLookup lookupEmbedding(const QString& queryKey) override;
    bool storeEmbedding(const QString& queryKey, const std::vector<float>& embedding) override;

    void clear();
    ExpiringCacheStats alignmentStats() const { return m_alignments.stats(); }
    ExpiringCacheStats embeddingStats() const { return m_embeddings.stats(); }

private:
    ExpiringCache<AlignmentCacheKey, double, AlignmentCacheKeyHash> m_alignments;
    ExpiringCache<QString, std::vector<float>, QStringHash> m_embeddings;
};

} // namespace dr

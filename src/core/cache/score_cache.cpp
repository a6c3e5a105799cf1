#include "core/cache/score_cache.h"
#include "core/shared/logging.h"

namespace dr {

namespace {

ExpiringCacheConfig alignmentCacheConfig(const CacheConfig& config)
{
    ExpiringCacheConfig out;
    out.maxEntries = config.cacheSize;
    out.ttlSeconds = config.cacheTtlSeconds;
    out.shardCount = config.shardCount;
    return out;
}

ExpiringCacheConfig embeddingCacheConfig(const CacheConfig& config)
{
    ExpiringCacheConfig out;
    out.maxEntries = config.queryCacheSize;
    out.ttlSeconds = config.queryCacheTtlSeconds;
    out.shardCount = config.shardCount;
    return out;
}

} // namespace

ScoreCache::ScoreCache(const CacheConfig& config, ClockFn clock)
    : m_alignments(alignmentCacheConfig(config), clock)
    , m_embeddings(embeddingCacheConfig(config), clock)
{
    LOG_DEBUG(drCache, "ScoreCache: alignment=%d entries/%ds, embedding=%d entries/%ds, %d shards",
              config.cacheSize, config.cacheTtlSeconds,
              config.queryCacheSize, config.queryCacheTtlSeconds,
              m_alignments.shardCount());
}

AlignmentLookup ScoreCache::lookupAlignment(const AlignmentCacheKey& key)
{
    AlignmentLookup lookup;
    const std::optional<double> cached = m_alignments.get(key);
    if (cached.has_value()) {
        lookup.status = CacheStatus::Hit;
        lookup.alignment = *cached;
    }
    return lookup;
}

bool ScoreCache::storeAlignment(const AlignmentCacheKey& key, double alignment)
{
    m_alignments.put(key, alignment);
    return true;
}

EmbeddingLookup ScoreCache::lookupEmbedding(const QString& queryKey)
{
    EmbeddingLookup lookup;
    std::optional<std::vector<float>> cached = m_embeddings.get(queryKey);
    if (cached.has_value()) {
        lookup.status = CacheStatus::Hit;
        lookup.embedding = std::move(*cached);
    }
    return lookup;
}

bool ScoreCache::storeEmbedding(const QString& queryKey, const std::vector<float>& embedding)
{
    m_embeddings.put(queryKey, embedding);
    return true;
}

void ScoreCache::clear()
{
    m_alignments.clear();
    m_embeddings.clear();
}

} // namespace dr

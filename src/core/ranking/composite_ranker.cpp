#include "core/ranking/composite_ranker.h"
#include "core/cache/score_cache.h"
#include "core/index/chunk_sources.h"
#include "core/profiles/profile_registry.h"
#include "core/query/query_fingerprint.h"
#include "core/shared/logging.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <exception>
#include <limits>
#include <mutex>
#include <thread>

namespace dr {

namespace {

double clampUnit(double value)
{
    if (std::isnan(value)) {
        return 0.0;
    }
    return std::clamp(value, 0.0, 1.0);
}

} // anonymous namespace

int CompositeRanker::candidatePoolSize(int resultCount) const
{
    // Widened so a large resultCount cannot overflow; the pool saturates at INT_MAX.
    const int64_t scaled = static_cast<int64_t>(resultCount)
                           * static_cast<int64_t>(m_config.retrieval.maxCandidatesMultiplier);
    const int64_t pool = std::max<int64_t>(m_config.retrieval.minCandidates, scaled);
    return static_cast<int>(std::min<int64_t>(pool, std::numeric_limits<int>::max()));
}

std::unique_ptr<CompositeRanker> CompositeRanker::create(const RankingConfig& config,
                                                         SimilarityIndex* index,
                                                         ChunkMetadataStore* store,
                                                         ScoreCacheBackend* cache,
                                                         QString* errorOut)
{
    if (!index || !store) {
        if (errorOut) {
            *errorOut = QStringLiteral("similarity index and metadata store are required");
        }
        return nullptr;
    }

    QString error;
    if (!validateRankingConfig(config, &error)) {
        LOG_ERROR(drConfig, "Rejected ranking config: %s", qUtf8Printable(error));
        if (errorOut) {
            *errorOut = error;
        }
        return nullptr;
    }

    std::shared_ptr<const ProfileRegistry> registry =
        ProfileRegistry::create(config.profiles, &error);
    if (!registry) {
        LOG_ERROR(drConfig, "Rejected profiles: %s", qUtf8Printable(error));
        if (errorOut) {
            *errorOut = error;
        }
        return nullptr;
    }

    LOG_INFO(drRanking, "Ranker ready: strategy=%s, %d profiles, budget=%d ms, threads=%d",
             qUtf8Printable(rankingStrategyToString(config.retrieval.defaultStrategy)),
             static_cast<int>(registry->profiles().size()),
             config.retrieval.maxProcessingTimeMs,
             config.retrieval.scoringThreads);

    return std::unique_ptr<CompositeRanker>(
        new CompositeRanker(config, std::move(registry), index, store, cache));
}

CompositeRanker::CompositeRanker(const RankingConfig& config,
                                 std::shared_ptr<const ProfileRegistry> registry,
                                 SimilarityIndex* index,
                                 ChunkMetadataStore* store,
                                 ScoreCacheBackend* cache)
    : m_config(config)
    , m_filterParser(config.filters)
    , m_detector(config.detection.enabled, config.detection.confidenceThreshold)
    , m_alignment(config.alignment, config.filters)
    , m_fallback(config.retrieval)
    , m_index(index)
    , m_store(store)
    , m_cache(cache)
    , m_registry(std::move(registry))
{
}

std::shared_ptr<const ProfileRegistry> CompositeRanker::registry() const
{
    std::shared_lock<std::shared_mutex> lock(m_registryMutex);
    return m_registry;
}

bool CompositeRanker::reloadProfiles(const std::vector<ProfileDefinition>& definitions,
                                     QString* errorOut)
{
    QString error;
    std::shared_ptr<const ProfileRegistry> registry = ProfileRegistry::create(definitions, &error);
    if (!registry) {
        LOG_WARN(drConfig, "Profile reload rejected, keeping current profiles: %s",
                 qUtf8Printable(error));
        if (errorOut) {
            *errorOut = error;
        }
        return false;
    }
    reloadProfiles(std::move(registry));
    return true;
}

void CompositeRanker::reloadProfiles(std::shared_ptr<const ProfileRegistry> registry)
{
    if (!registry) {
        return;
    }
    const int count = static_cast<int>(registry->profiles().size());
    const auto generation = static_cast<qulonglong>(registry->generation());
    {
        std::unique_lock<std::shared_mutex> lock(m_registryMutex);
        m_registry = std::move(registry);
    }
    LOG_INFO(drConfig, "Profiles reloaded: %d profiles, generation %llu", count, generation);
}

// ── rank ────────────────────────────────────────────────────────

RankResponse CompositeRanker::rank(const RankRequest& request)
{
    QElapsedTimer totalTimer;
    totalTimer.start();

    RankResponse response;
    response.stats.stages.push_back(RankStage::Init);

    // One snapshot for the whole query; a concurrent reload never changes
    // profiles mid-ranking.
    const std::shared_ptr<const ProfileRegistry> registry = this->registry();

    if (request.resultCount <= 0) {
        response.profileUsed = registry->defaultProfile().id;
        finish(response, totalTimer);
        return response;
    }

    const RankingDecision decision = m_fallback.decide();
    response.mode = decision.mode;
    if (decision.mode == RankingMode::VectorOnly) {
        rankFallback(request, decision, response);
        finish(response, totalTimer);
        return response;
    }
    response.degraded = decision.degraded;
    response.fallbackReason = decision.reason;

    // ProfileResolved
    const Profile* profile = nullptr;
    if (request.profileOverride.has_value()) {
        profile = registry->find(*request.profileOverride);
        if (profile) {
            response.profileConfidence = 1.0;
        } else {
            LOG_WARN(drRanking, "Unknown profile override '%s', using '%s'",
                     qUtf8Printable(*request.profileOverride),
                     ProfileRegistry::kDefaultProfileId);
            response.profileOverrideRejected = true;
            profile = &registry->defaultProfile();
        }
    } else {
        const ProfileDetection detection = m_detector.detect(request.queryText, *registry);
        profile = registry->find(detection.profileId);
        if (!profile) {
            profile = &registry->defaultProfile();
        }
        response.profileConfidence = detection.confidence;
        response.profileDetected = detection.detected;
    }
    response.profileUsed = profile->id;

    response.constraints = m_filterParser.parse(request.queryText);
    if (!response.constraints.empty()) {
        LOG_DEBUG(drFilters, "Query filters: %s -> %d constraints",
                  qUtf8Printable(m_filterParser.matchedPhrases(request.queryText).join(
                      QStringLiteral(", "))),
                  static_cast<int>(response.constraints.size()));
    }
    response.stats.stages.push_back(RankStage::ProfileResolved);

    // CandidatesFetched
    std::vector<float> embedding;
    if (!resolveEmbedding(request.queryText, response, embedding)) {
        abandonTrial(decision);
        finish(response, totalTimer);
        return response;
    }

    const int candidateCount = candidatePoolSize(request.resultCount);
    std::vector<ScoredCandidate> candidates;
    if (!fetchCandidates(embedding, candidateCount, response, candidates)) {
        abandonTrial(decision);
        finish(response, totalTimer);
        return response;
    }
    response.stats.stages.push_back(RankStage::CandidatesFetched);

    if (candidates.empty()) {
        abandonTrial(decision);
        response.stats.stages.push_back(RankStage::Ranked);
        finish(response, totalTimer);
        return response;
    }

    // Scored
    ScoringContext ctx;
    ctx.registry = registry.get();
    ctx.profile = profile;
    ctx.constraints = &response.constraints;
    ctx.fingerprint = queryFingerprint(request.queryText, registry->generation());
    ctx.mode = decision.mode;
    ctx.budgetMs = m_config.retrieval.maxProcessingTimeMs;
    ctx.timer.start();

    runScoring(ctx, candidates);

    response.stats.scoringMs = ctx.timer.elapsed();
    response.stats.cacheHits = ctx.cacheHits.load();
    response.stats.cacheMisses = ctx.cacheMisses.load();
    response.stats.cacheUnavailable = response.stats.cacheUnavailable || ctx.cacheUnavailable.load();

    for (ScoredCandidate& candidate : candidates) {
        candidate.profileId = profile->id;
        if (candidate.scored) {
            ++response.stats.candidatesScored;
        } else {
            ++response.stats.candidatesSkipped;
        }
        blend(candidate, profile->weights, decision.mode);
    }

    const bool timedOut = ctx.timedOut.load();
    if (timedOut) {
        response.stats.stages.push_back(RankStage::Timeout);
        response.timedOut = true;
        response.degraded = true;
        if (response.fallbackReason.isEmpty()) {
            response.fallbackReason = QStringLiteral("timeout");
        }
        LOG_WARN(drRanking, "Scoring budget of %d ms exhausted: %d of %d candidates scored",
                 ctx.budgetMs, response.stats.candidatesScored,
                 static_cast<int>(candidates.size()));
    } else {
        response.stats.stages.push_back(RankStage::Scored);
    }
    // Downgraded queries say nothing about whether the full path recovered
    if (!decision.degraded) {
        m_fallback.recordOutcome(timedOut);
    }

    // Ranked
    sortAndTruncate(candidates, request.resultCount);
    response.results = std::move(candidates);
    response.stats.stages.push_back(RankStage::Ranked);

    if (drScoring().isDebugEnabled()) {
        for (const ScoredCandidate& candidate : response.results) {
            LOG_DEBUG(drScoring, "%s: score=%.4f sim=%.4f align=%.4f rec=%.4f conf=%.4f%s",
                      qUtf8Printable(candidate.chunkId), candidate.compositeScore,
                      candidate.semanticSimilarity, candidate.dimensionAlignment,
                      candidate.recencyScore, candidate.confidenceScore,
                      candidate.alignmentCached ? " (cached)" : "");
        }
    }

    finish(response, totalTimer);
    return response;
}

void CompositeRanker::abandonTrial(const RankingDecision& decision)
{
    if (decision.trial) {
        m_fallback.releaseTrial();
    }
}

void CompositeRanker::rankFallback(const RankRequest& request, const RankingDecision& decision,
                                   RankResponse& response)
{
    response.stats.stages.push_back(RankStage::Fallback);
    response.degraded = true;
    response.fallbackReason = decision.reason;

    std::vector<float> embedding;
    if (!resolveEmbedding(request.queryText, response, embedding)) {
        return;
    }

    std::vector<ScoredCandidate> candidates;
    if (!fetchCandidates(embedding, request.resultCount, response, candidates)) {
        return;
    }

    for (ScoredCandidate& candidate : candidates) {
        candidate.compositeScore = candidate.semanticSimilarity;
        candidate.breakdown.semanticContribution = candidate.semanticSimilarity;
    }
    response.stats.candidatesSkipped = static_cast<int>(candidates.size());

    // Index order already is similarity order; the sort keeps it stable and
    // enforces it for indexes that return ties out of order.
    sortAndTruncate(candidates, request.resultCount);
    response.results = std::move(candidates);

    LOG_DEBUG(drRanking, "Fallback ranking (%s): %d results",
              qUtf8Printable(decision.reason), static_cast<int>(response.results.size()));
}

void CompositeRanker::finish(RankResponse& response, const QElapsedTimer& totalTimer) const
{
    if (response.ok()) {
        response.stats.stages.push_back(RankStage::Done);
    }
    response.stats.totalMs = totalTimer.elapsed();

    LOG_INFO(drPerf, "rank: mode=%s profile=%s fetched=%d scored=%d skipped=%d "
                     "cache=%d/%d embed=%lldms fetch=%lldms scoring=%lldms total=%lldms%s",
             qUtf8Printable(rankingModeToString(response.mode)),
             qUtf8Printable(response.profileUsed),
             response.stats.candidatesFetched,
             response.stats.candidatesScored,
             response.stats.candidatesSkipped,
             response.stats.cacheHits,
             response.stats.cacheHits + response.stats.cacheMisses,
             static_cast<long long>(response.stats.embedMs),
             static_cast<long long>(response.stats.fetchMs),
             static_cast<long long>(response.stats.scoringMs),
             static_cast<long long>(response.stats.totalMs),
             response.degraded ? " degraded" : "");
}

// ── Candidate retrieval ─────────────────────────────────────────

bool CompositeRanker::resolveEmbedding(const QString& queryText, RankResponse& response,
                                       std::vector<float>& embedding)
{
    QElapsedTimer timer;
    timer.start();

    const QString queryKey = normalizeQueryText(queryText);
    const bool useCache = m_cache && m_config.cache.enableQueryCache;

    if (useCache) {
        EmbeddingLookup lookup = m_cache->lookupEmbedding(queryKey);
        if (lookup.status == CacheStatus::Hit) {
            embedding = std::move(lookup.embedding);
            response.stats.embeddingCacheHit = true;
            response.stats.embedMs = timer.elapsed();
            return true;
        }
        if (lookup.status == CacheStatus::Unavailable) {
            response.stats.cacheUnavailable = true;
        }
    }

    EmbeddingResult result;
    try {
        result = m_index->embed(queryText);
    } catch (const std::exception& e) {
        result.status = EmbeddingResult::Status::Failed;
        result.errorMessage = QStringLiteral("embedding threw: %1").arg(QString::fromUtf8(e.what()));
    }
    response.stats.embedMs = timer.elapsed();

    if (result.status != EmbeddingResult::Status::Success) {
        response.status = RankResponse::Status::EmbeddingFailed;
        response.errorMessage = result.errorMessage.value_or(
            QStringLiteral("query embedding failed"));
        LOG_ERROR(drRanking, "Query embedding failed: %s", qUtf8Printable(*response.errorMessage));
        return false;
    }

    embedding = std::move(result.embedding);
    if (useCache && !response.stats.cacheUnavailable
        && !m_cache->storeEmbedding(queryKey, embedding)) {
        response.stats.cacheUnavailable = true;
    }
    return true;
}

bool CompositeRanker::fetchCandidates(const std::vector<float>& embedding, int count,
                                      RankResponse& response,
                                      std::vector<ScoredCandidate>& candidates)
{
    QElapsedTimer timer;
    timer.start();
    response.stats.candidatesRequested = count;

    CandidateFetchResult result;
    try {
        result = m_index->fetchCandidates(embedding, count);
    } catch (const std::exception& e) {
        result.status = CandidateFetchResult::Status::Failed;
        result.errorMessage = QStringLiteral("candidate fetch threw: %1")
                                  .arg(QString::fromUtf8(e.what()));
    }
    response.stats.fetchMs = timer.elapsed();

    if (result.status != CandidateFetchResult::Status::Success) {
        response.status = RankResponse::Status::CandidateFetchFailed;
        response.errorMessage = result.errorMessage.value_or(
            QStringLiteral("candidate fetch failed"));
        LOG_ERROR(drRanking, "Candidate fetch failed: %s", qUtf8Printable(*response.errorMessage));
        return false;
    }

    if (static_cast<int>(result.candidates.size()) > count) {
        result.candidates.resize(static_cast<size_t>(count));
    }

    candidates.reserve(result.candidates.size());
    int rank = 1;
    for (const CandidateHit& hit : result.candidates) {
        ScoredCandidate candidate;
        candidate.chunkId = hit.chunkId;
        candidate.similarityRank = rank++;
        candidate.semanticSimilarity = std::isnan(hit.similarity) ? 0.0 : hit.similarity;
        candidates.push_back(std::move(candidate));
    }
    response.stats.candidatesFetched = static_cast<int>(candidates.size());
    return true;
}

// ── Scoring ─────────────────────────────────────────────────────

void CompositeRanker::runScoring(ScoringContext& ctx, std::vector<ScoredCandidate>& candidates)
{
    const int threadCount = std::min(std::max(1, m_config.retrieval.scoringThreads),
                                     static_cast<int>(candidates.size()));
    if (threadCount <= 1) {
        scoreWorker(ctx, candidates);
        return;
    }

    std::vector<std::thread> workers;
    workers.reserve(static_cast<size_t>(threadCount - 1));
    for (int i = 0; i < threadCount - 1; ++i) {
        workers.emplace_back([this, &ctx, &candidates]() { scoreWorker(ctx, candidates); });
    }
    scoreWorker(ctx, candidates);
    for (std::thread& worker : workers) {
        worker.join();
    }
}

void CompositeRanker::scoreWorker(ScoringContext& ctx, std::vector<ScoredCandidate>& candidates)
{
    // Each slot is claimed by exactly one worker, so candidates are written
    // without locking.
    while (!ctx.timedOut.load(std::memory_order_relaxed)) {
        const size_t index = ctx.next.fetch_add(1);
        if (index >= candidates.size()) {
            return;
        }
        if (ctx.timer.elapsed() >= ctx.budgetMs) {
            ctx.timedOut.store(true);
            return;
        }
        scoreCandidate(ctx, candidates[index]);
    }
}

void CompositeRanker::scoreCandidate(ScoringContext& ctx, ScoredCandidate& candidate)
{
    candidate.dimensionAlignment = lookupOrComputeAlignment(ctx, candidate);
    candidate.recencyScore = readRecency(candidate.chunkId);
    candidate.confidenceScore = readConfidence(candidate.chunkId);
    candidate.scored = true;
}

double CompositeRanker::lookupOrComputeAlignment(ScoringContext& ctx, ScoredCandidate& candidate)
{
    const bool useCache = m_cache && m_config.cache.enableDimensionCache
                          && !ctx.cacheUnavailable.load(std::memory_order_relaxed);
    const AlignmentCacheKey key{ctx.fingerprint, candidate.chunkId, ctx.profile->id};

    if (useCache) {
        const AlignmentLookup lookup = m_cache->lookupAlignment(key);
        if (lookup.status == CacheStatus::Hit) {
            ctx.cacheHits.fetch_add(1);
            candidate.alignmentCached = true;
            candidate.breakdown.alignment.normalized = lookup.alignment;
            return clampUnit(lookup.alignment);
        }
        if (lookup.status == CacheStatus::Unavailable) {
            if (!ctx.cacheUnavailable.exchange(true)) {
                LOG_WARN(drCache, "Score cache unavailable, scoring without cache");
            }
        } else {
            ctx.cacheMisses.fetch_add(1);
        }
    }

    const DimensionScoreMap scores = readDimensionScores(candidate.chunkId).value_or(
        DimensionScoreMap{});
    const AlignmentResult result = m_alignment.compute(scores, *ctx.profile, *ctx.constraints,
                                                       *ctx.registry);
    candidate.breakdown.alignment = result.breakdown;

    if (useCache && !ctx.cacheUnavailable.load(std::memory_order_relaxed)
        && !m_cache->storeAlignment(key, result.score)) {
        if (!ctx.cacheUnavailable.exchange(true)) {
            LOG_WARN(drCache, "Score cache rejected a store, scoring without cache");
        }
    }
    return result.score;
}

std::optional<DimensionScoreMap> CompositeRanker::readDimensionScores(const QString& chunkId)
{
    try {
        return m_store->dimensionScores(chunkId);
    } catch (const std::exception& e) {
        LOG_WARN(drStore, "Dimension scores unavailable for %s: %s",
                 qUtf8Printable(chunkId), e.what());
        return std::nullopt;
    }
}

double CompositeRanker::readRecency(const QString& chunkId)
{
    try {
        return clampUnit(m_store->recencyScore(chunkId).value_or(0.0));
    } catch (const std::exception& e) {
        LOG_WARN(drStore, "Recency unavailable for %s: %s", qUtf8Printable(chunkId), e.what());
        return 0.0;
    }
}

double CompositeRanker::readConfidence(const QString& chunkId)
{
    try {
        return clampUnit(m_store->confidenceScore(chunkId).value_or(0.0));
    } catch (const std::exception& e) {
        LOG_WARN(drStore, "Confidence unavailable for %s: %s", qUtf8Printable(chunkId), e.what());
        return 0.0;
    }
}

// ── Blending and ordering ───────────────────────────────────────

void CompositeRanker::blend(ScoredCandidate& candidate, const FactorWeights& weights,
                            RankingMode mode)
{
    ScoreBreakdown& breakdown = candidate.breakdown;
    if (mode == RankingMode::DimensionOnly) {
        breakdown.semanticContribution = 0.0;
        breakdown.alignmentContribution = candidate.dimensionAlignment;
        breakdown.recencyContribution = 0.0;
        breakdown.confidenceContribution = 0.0;
    } else {
        breakdown.semanticContribution =
            weights.semanticSimilarity * candidate.semanticSimilarity;
        breakdown.alignmentContribution =
            weights.dimensionAlignment * candidate.dimensionAlignment;
        breakdown.recencyContribution = weights.recencyScore * candidate.recencyScore;
        breakdown.confidenceContribution = weights.confidenceScore * candidate.confidenceScore;
    }
    candidate.compositeScore = breakdown.semanticContribution
                               + breakdown.alignmentContribution
                               + breakdown.recencyContribution
                               + breakdown.confidenceContribution;
}

void CompositeRanker::sortAndTruncate(std::vector<ScoredCandidate>& candidates, int resultCount)
{
    // Stable sort with an explicit tie-break on the original similarity rank
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const ScoredCandidate& a, const ScoredCandidate& b) {
                         if (a.compositeScore != b.compositeScore) {
                             return a.compositeScore > b.compositeScore;
                         }
                         return a.similarityRank < b.similarityRank;
                     });

    if (resultCount >= 0 && static_cast<int>(candidates.size()) > resultCount) {
        candidates.resize(static_cast<size_t>(resultCount));
    }
}

} // namespace dr

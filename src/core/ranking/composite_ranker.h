#pragma once

#include "core/query/filter_parser.h"
#include "core/query/profile_detector.h"
#include "core/ranking/alignment_calculator.h"
#include "core/ranking/fallback_controller.h"
#include "core/ranking/rank_response.h"
#include "core/shared/ranking_config.h"

#include <QElapsedTimer>
#include <QString>

#include <atomic>
#include <memory>
#include <shared_mutex>
#include <vector>

namespace dr {

class ChunkMetadataStore;
class ProfileRegistry;
class ScoreCacheBackend;
class SimilarityIndex;
struct Profile;

// CompositeRanker -- re-ranks similarity-search candidates by blending
// semantic similarity with profile-weighted dimension alignment, recency and
// confidence, under a per-query time budget.
//
// rank() walks Init -> ProfileResolved -> CandidatesFetched -> Scored ->
// Ranked -> Done. The fallback controller can route a query straight to the
// similarity-only path, and an exhausted budget diverts scoring into Timeout;
// both still return results, flagged degraded. Only a failing embed or fetch
// produces a non-Ok response.
//
// The collaborators are not owned and must outlive the ranker. `cache` may be
// null, which disables both caches. rank() is safe to call concurrently.
class CompositeRanker {
public:
    // Validates the config and builds the profile registry. Returns nullptr
    // and fills errorOut on any configuration error.
    static std::unique_ptr<CompositeRanker> create(const RankingConfig& config,
                                                   SimilarityIndex* index,
                                                   ChunkMetadataStore* store,
                                                   ScoreCacheBackend* cache,
                                                   QString* errorOut = nullptr);

    RankResponse rank(const RankRequest& request);

    // Build a new registry from definitions and swap it in. On failure the
    // current registry stays active.
    bool reloadProfiles(const std::vector<ProfileDefinition>& definitions,
                        QString* errorOut = nullptr);
    void reloadProfiles(std::shared_ptr<const ProfileRegistry> registry);

    std::shared_ptr<const ProfileRegistry> registry() const;
    const RankingConfig& config() const { return m_config; }

    // Expose for testing
    FallbackController& fallbackController() { return m_fallback; }

private:
    CompositeRanker(const RankingConfig& config,
                    std::shared_ptr<const ProfileRegistry> registry,
                    SimilarityIndex* index,
                    ChunkMetadataStore* store,
                    ScoreCacheBackend* cache);

    // Per-query state shared by the scoring workers
    struct ScoringContext {
        const ProfileRegistry* registry = nullptr;
        const Profile* profile = nullptr;
        const std::vector<FilterConstraint>* constraints = nullptr;
        QString fingerprint;
        RankingMode mode = RankingMode::Hybrid;
        QElapsedTimer timer;
        int budgetMs = 0;

        std::atomic<size_t> next{0};
        std::atomic<bool> timedOut{false};
        std::atomic<int> cacheHits{0};
        std::atomic<int> cacheMisses{0};
        std::atomic<bool> cacheUnavailable{false};
    };

    // max(min_candidates, resultCount * multiplier), saturating at INT_MAX
    int candidatePoolSize(int resultCount) const;

    bool resolveEmbedding(const QString& queryText, RankResponse& response,
                          std::vector<float>& embedding);
    bool fetchCandidates(const std::vector<float>& embedding, int count,
                         RankResponse& response, std::vector<ScoredCandidate>& candidates);

    void runScoring(ScoringContext& ctx, std::vector<ScoredCandidate>& candidates);
    void scoreWorker(ScoringContext& ctx, std::vector<ScoredCandidate>& candidates);
    void scoreCandidate(ScoringContext& ctx, ScoredCandidate& candidate);

    double lookupOrComputeAlignment(ScoringContext& ctx, ScoredCandidate& candidate);
    std::optional<DimensionScoreMap> readDimensionScores(const QString& chunkId);
    double readRecency(const QString& chunkId);
    double readConfidence(const QString& chunkId);

    static void blend(ScoredCandidate& candidate, const FactorWeights& weights, RankingMode mode);
    static void sortAndTruncate(std::vector<ScoredCandidate>& candidates, int resultCount);

    void abandonTrial(const RankingDecision& decision);
    void rankFallback(const RankRequest& request, const RankingDecision& decision,
                      RankResponse& response);
    void finish(RankResponse& response, const QElapsedTimer& totalTimer) const;

    RankingConfig m_config;
    FilterParser m_filterParser;
    ProfileDetector m_detector;
    AlignmentCalculator m_alignment;
    FallbackController m_fallback;

    SimilarityIndex* m_index = nullptr;
    ChunkMetadataStore* m_store = nullptr;
    ScoreCacheBackend* m_cache = nullptr;

    mutable std::shared_mutex m_registryMutex;
    std::shared_ptr<const ProfileRegistry> m_registry;
};

} // namespace dr

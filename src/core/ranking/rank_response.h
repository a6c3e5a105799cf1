#pragma once

#include "core/query/filter_parser.h"
#include "core/shared/ranking_config.h"
#include "core/shared/scoring_types.h"

#include <QJsonObject>
#include <QString>

#include <cstdint>
#include <optional>
#include <vector>

namespace dr {

// A candidate after scoring. Created and discarded per query.
struct ScoredCandidate {
    QString chunkId;
    int similarityRank = 0;          // 1-based position in the index's ordering
    double semanticSimilarity = 0.0;
    double dimensionAlignment = 0.0;
    double recencyScore = 0.0;
    double confidenceScore = 0.0;
    QString profileId;
    double compositeScore = 0.0;
    bool scored = false;             // False when skipped by fallback or timeout
    bool alignmentCached = false;
    ScoreBreakdown breakdown;

    QJsonObject toJson() const;
};

// Ranking state machine (Init -> ProfileResolved -> CandidatesFetched ->
// Scored -> Ranked -> Done, with Fallback and Timeout detours)
enum class RankStage {
    Init,
    ProfileResolved,
    CandidatesFetched,
    Scored,
    Timeout,
    Fallback,
    Ranked,
    Done,
};

QString rankStageToString(RankStage stage);

struct RankRequest {
    QString queryText;
    int resultCount = 10;
    std::optional<QString> profileOverride;
};

struct RankStats {
    std::vector<RankStage> stages;
    int candidatesRequested = 0;
    int candidatesFetched = 0;
    int candidatesScored = 0;
    int candidatesSkipped = 0;
    int cacheHits = 0;
    int cacheMisses = 0;
    bool embeddingCacheHit = false;
    bool cacheUnavailable = false;
    int64_t embedMs = 0;
    int64_t fetchMs = 0;
    int64_t scoringMs = 0;
    int64_t totalMs = 0;

    bool passedThrough(RankStage stage) const;
};

// Outcome of CompositeRanker::rank(). A non-Ok status is a hard failure;
// Ok with `degraded` means results came back through a fallback or timeout;
// Ok with an empty list means there was nothing to rank.
struct RankResponse {
    enum class Status {
        Ok,
        EmbeddingFailed,
        CandidateFetchFailed,
    };

    Status status = Status::Ok;
    std::optional<QString> errorMessage;

    std::vector<ScoredCandidate> results;
    QString profileUsed;
    double profileConfidence = 0.0;
    bool profileDetected = false;
    bool profileOverrideRejected = false;
    RankingMode mode = RankingMode::Hybrid;
    bool degraded = false;
    bool timedOut = false;
    QString fallbackReason;
    std::vector<FilterConstraint> constraints;
    RankStats stats;

    bool ok() const { return status == Status::Ok; }
    QJsonObject toJson() const;
};

QString rankStatusToString(RankResponse::Status status);

} // namespace dr

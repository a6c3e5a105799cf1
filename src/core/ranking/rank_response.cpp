#include "core/ranking/rank_response.h"

#include <QJsonArray>

#include <algorithm>

namespace dr {

QString rankStageToString(RankStage stage)
{
    switch (stage) {
    case RankStage::Init:              return QStringLiteral("init");
    case RankStage::ProfileResolved:   return QStringLiteral("profile_resolved");
    case RankStage::CandidatesFetched: return QStringLiteral("candidates_fetched");
    case RankStage::Scored:            return QStringLiteral("scored");
    case RankStage::Timeout:           return QStringLiteral("timeout");
    case RankStage::Fallback:          return QStringLiteral("fallback");
    case RankStage::Ranked:            return QStringLiteral("ranked");
    case RankStage::Done:              return QStringLiteral("done");
    }
    return QStringLiteral("unknown");
}

QString rankStatusToString(RankResponse::Status status)
{
    switch (status) {
    case RankResponse::Status::Ok:                   return QStringLiteral("ok");
    case RankResponse::Status::EmbeddingFailed:      return QStringLiteral("embedding_failed");
    case RankResponse::Status::CandidateFetchFailed: return QStringLiteral("candidate_fetch_failed");
    }
    return QStringLiteral("unknown");
}

bool RankStats::passedThrough(RankStage stage) const
{
    return std::find(stages.begin(), stages.end(), stage) != stages.end();
}

QJsonObject ScoredCandidate::toJson() const
{
    QJsonObject alignment;
    alignment[QStringLiteral("matchedDimensions")] = breakdown.alignment.matchedDimensions;
    alignment[QStringLiteral("penalizedDimensions")] = breakdown.alignment.penalizedDimensions;
    alignment[QStringLiteral("aggregate")] = breakdown.alignment.aggregate;
    alignment[QStringLiteral("normalized")] = breakdown.alignment.normalized;
    alignment[QStringLiteral("confidenceBoost")] = breakdown.alignment.confidenceBoost;
    alignment[QStringLiteral("profileAdjustment")] = breakdown.alignment.profileAdjustment;
    alignment[QStringLiteral("bestMatchingProfile")] = breakdown.alignment.bestMatchingProfile;

    QJsonObject contributions;
    contributions[scoringFactorToString(ScoringFactor::SemanticSimilarity)] =
        breakdown.semanticContribution;
    contributions[scoringFactorToString(ScoringFactor::DimensionAlignment)] =
        breakdown.alignmentContribution;
    contributions[scoringFactorToString(ScoringFactor::RecencyScore)] =
        breakdown.recencyContribution;
    contributions[scoringFactorToString(ScoringFactor::ConfidenceScore)] =
        breakdown.confidenceContribution;

    QJsonObject json;
    json[QStringLiteral("chunkId")] = chunkId;
    json[QStringLiteral("similarityRank")] = similarityRank;
    json[QStringLiteral("semanticSimilarity")] = semanticSimilarity;
    json[QStringLiteral("dimensionAlignment")] = dimensionAlignment;
    json[QStringLiteral("recencyScore")] = recencyScore;
    json[QStringLiteral("confidenceScore")] = confidenceScore;
    json[QStringLiteral("profile")] = profileId;
    json[QStringLiteral("score")] = compositeScore;
    json[QStringLiteral("scored")] = scored;
    json[QStringLiteral("alignmentCached")] = alignmentCached;
    json[QStringLiteral("contributions")] = contributions;
    json[QStringLiteral("alignment")] = alignment;
    return json;
}

QJsonObject RankResponse::toJson() const
{
    QJsonArray resultArray;
    for (const ScoredCandidate& candidate : results) {
        resultArray.append(candidate.toJson());
    }

    QJsonArray constraintArray;
    for (const FilterConstraint& constraint : constraints) {
        QJsonObject obj;
        obj[QStringLiteral("dimension")] = constraint.dimension;
        obj[QStringLiteral("level")] = constraintLevelToString(constraint.level);
        if (constraint.level == ConstraintLevel::Threshold) {
            obj[QStringLiteral("threshold")] = constraint.threshold;
        }
        obj[QStringLiteral("phrase")] = constraint.phrase;
        obj[QStringLiteral("confidence")] = constraint.confidence;
        constraintArray.append(obj);
    }

    QJsonArray stageArray;
    for (RankStage stage : stats.stages) {
        stageArray.append(rankStageToString(stage));
    }

    QJsonObject statsJson;
    statsJson[QStringLiteral("stages")] = stageArray;
    statsJson[QStringLiteral("candidatesRequested")] = stats.candidatesRequested;
    statsJson[QStringLiteral("candidatesFetched")] = stats.candidatesFetched;
    statsJson[QStringLiteral("candidatesScored")] = stats.candidatesScored;
    statsJson[QStringLiteral("candidatesSkipped")] = stats.candidatesSkipped;
    statsJson[QStringLiteral("cacheHits")] = stats.cacheHits;
    statsJson[QStringLiteral("cacheMisses")] = stats.cacheMisses;
    statsJson[QStringLiteral("embeddingCacheHit")] = stats.embeddingCacheHit;
    statsJson[QStringLiteral("cacheUnavailable")] = stats.cacheUnavailable;
    statsJson[QStringLiteral("embedMs")] = static_cast<qint64>(stats.embedMs);
    statsJson[QStringLiteral("fetchMs")] = static_cast<qint64>(stats.fetchMs);
    statsJson[QStringLiteral("scoringMs")] = static_cast<qint64>(stats.scoringMs);
    statsJson[QStringLiteral("totalMs")] = static_cast<qint64>(stats.totalMs);

    QJsonObject json;
    json[QStringLiteral("status")] = rankStatusToString(status);
    if (errorMessage.has_value()) {
        json[QStringLiteral("error")] = *errorMessage;
    }
    json[QStringLiteral("results")] = resultArray;
    json[QStringLiteral("profileUsed")] = profileUsed;
    json[QStringLiteral("profileConfidence")] = profileConfidence;
    json[QStringLiteral("profileDetected")] = profileDetected;
    json[QStringLiteral("profileOverrideRejected")] = profileOverrideRejected;
    json[QStringLiteral("mode")] = rankingModeToString(mode);
    json[QStringLiteral("degraded")] = degraded;
    json[QStringLiteral("timedOut")] = timedOut;
    if (!fallbackReason.isEmpty()) {
        json[QStringLiteral("fallbackReason")] = fallbackReason;
    }
    json[QStringLiteral("constraints")] = constraintArray;
    json[QStringLiteral("stats")] = statsJson;
    return json;
}

} // namespace dr

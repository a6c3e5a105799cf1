#include "core/shared/scoring_types.h"

namespace dr {

QString scoringFactorToString(ScoringFactor factor)
{
    switch (factor) {
    case ScoringFactor::SemanticSimilarity: return QStringLiteral("semantic_similarity");
    case ScoringFactor::DimensionAlignment: return QStringLiteral("dimension_alignment");
    case ScoringFactor::RecencyScore:       return QStringLiteral("recency_score");
    case ScoringFactor::ConfidenceScore:    return QStringLiteral("confidence_score");
    }
    return QStringLiteral("unknown");
}

double FactorWeights::weight(ScoringFactor factor) const
{
    switch (factor) {
    case ScoringFactor::SemanticSimilarity: return semanticSimilarity;
    case ScoringFactor::DimensionAlignment: return dimensionAlignment;
    case ScoringFactor::RecencyScore:       return recencyScore;
    case ScoringFactor::ConfidenceScore:    return confidenceScore;
    }
    return 0.0;
}

double FactorWeights::sum() const
{
    return semanticSimilarity + dimensionAlignment + recencyScore + confidenceScore;
}

} // namespace dr

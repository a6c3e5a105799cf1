#pragma once

#include <QString>

namespace dr {

// The four factors every profile weighs. Their weights must sum to 1.0.
enum class ScoringFactor {
    SemanticSimilarity,
    DimensionAlignment,
    RecencyScore,
    ConfidenceScore,
};

QString scoringFactorToString(ScoringFactor factor);

struct FactorWeights {
    double semanticSimilarity = 0.4;
    double dimensionAlignment = 0.3;
    double recencyScore = 0.2;
    double confidenceScore = 0.1;

    double weight(ScoringFactor factor) const;
    double sum() const;
};

// Tolerance used when checking that factor weights sum to 1.0
constexpr double kWeightSumTolerance = 1e-6;

// Alignment internals, kept for explanations (steps 1-5 of the calculation)
struct AlignmentBreakdown {
    int matchedDimensions = 0;
    int penalizedDimensions = 0;
    double aggregate = 0.0;        // After the alignment method
    double normalized = 0.0;       // After normalization, clamped
    double confidenceBoost = 0.0;
    double profileAdjustment = 0.0; // Bonus (+) or penalty (-)
    QString bestMatchingProfile;
};

// Weighted contribution of each factor to the composite score
struct ScoreBreakdown {
    double semanticContribution = 0.0;
    double alignmentContribution = 0.0;
    double recencyContribution = 0.0;
    double confidenceContribution = 0.0;
    AlignmentBreakdown alignment;
};

} // namespace dr

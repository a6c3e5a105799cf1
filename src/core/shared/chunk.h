#pragma once

#include <QString>

#include <map>
#include <optional>

namespace dr {

// One conceptual-dimension score attached to a chunk by the extraction
// pipeline. Confidence is optional and lies in [0,1] when present.
struct DimensionScore {
    double value = 0.0;
    std::optional<double> confidence;
};

using DimensionScoreMap = std::map<QString, DimensionScore>;

// Read-only view of a content chunk as the ranker sees it. Owned by the
// storage collaborator; the engine never writes it back.
struct Chunk {
    QString chunkId;
    DimensionScoreMap dimensionScores;
    double recencyScore = 0.0;
    double confidenceScore = 0.0;
    double similarity = 0.0;   // Set by the similarity index
};

// Average of the confidences carried by the given scores. Returns nullopt
// when none of them carries a confidence.
std::optional<double> averageConfidence(const DimensionScoreMap& scores);

} // namespace dr

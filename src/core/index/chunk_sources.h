#pragma once

#include "core/shared/chunk.h"

#include <QString>

#include <optional>
#include <vector>

namespace dr {

struct CandidateHit {
    QString chunkId;
    double similarity = 0.0;
};

struct CandidateFetchResult {
    enum class Status {
        Success,
        Failed,
    };

    Status status = Status::Failed;
    std::vector<CandidateHit> candidates;   // Ordered by similarity, best first
    std::optional<QString> errorMessage;
};

struct EmbeddingResult {
    enum class Status {
        Success,
        Failed,
    };

    Status status = Status::Failed;
    std::vector<float> embedding;
    std::optional<QString> errorMessage;
};

// SimilarityIndex -- the vector-search collaborator. Implementations bound
// their own latency; the ranker never waits on them indefinitely.
class SimilarityIndex {
public:
    virtual ~SimilarityIndex() = default;

    virtual EmbeddingResult embed(const QString& queryText) = 0;

    // Up to `count` candidates ranked by similarity alone
    virtual CandidateFetchResult fetchCandidates(const std::vector<float>& queryEmbedding,
                                                 int count) = 0;
};

// ChunkMetadataStore -- read access to the precomputed per-chunk metadata.
// nullopt means the store has nothing for the chunk; the ranker zeroes the
// factor instead of failing.
class ChunkMetadataStore {
public:
    virtual ~ChunkMetadataStore() = default;

    virtual std::optional<DimensionScoreMap> dimensionScores(const QString& chunkId) = 0;
    virtual std::optional<double> recencyScore(const QString& chunkId) = 0;
    virtual std::optional<double> confidenceScore(const QString& chunkId) = 0;
};

} // namespace dr

#pragma once

namespace dr {

// Per-connection pragmas, safe on every open. The ranker only reads, so a
// writer process may hold the WAL write lock while queries run.
constexpr const char* kConnectionPragmas = R"(
PRAGMA busy_timeout = 5000;
PRAGMA foreign_keys = ON;
PRAGMA cache_size = -16384;
)";

// Chunk metadata written by the extraction pipeline.
constexpr const char* kChunkMetadataSchema = R"(
CREATE TABLE IF NOT EXISTS chunk_metadata (
    chunk_id TEXT PRIMARY KEY,
    recency_score REAL NOT NULL DEFAULT 0.0,
    confidence_score REAL NOT NULL DEFAULT 0.0
);

CREATE TABLE IF NOT EXISTS chunk_dimension_scores (
    chunk_id TEXT NOT NULL REFERENCES chunk_metadata(chunk_id) ON DELETE CASCADE,
    dimension TEXT NOT NULL,
    value REAL NOT NULL,
    confidence REAL,
    PRIMARY KEY (chunk_id, dimension)
);

CREATE INDEX IF NOT EXISTS idx_dimension_scores_chunk ON chunk_dimension_scores(chunk_id);
)";

} // namespace dr

#pragma once

#include <QString>

#include <cstdint>

namespace dr {

// Normalized form used for fingerprints and the embedding cache key:
// lowercase with whitespace collapsed.
QString normalizeQueryText(const QString& queryText);

// Stable cache key component for a query: SHA-256 of the normalized text and
// the registry generation the query was ranked against.
QString queryFingerprint(const QString& queryText, uint64_t registryGeneration);

} // namespace dr

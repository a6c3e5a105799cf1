#pragma once

#include "core/index/chunk_sources.h"

#include <QString>

#include <memory>
#include <mutex>

#include <sqlite3.h>

namespace dr {

// SQLiteChunkStore -- ChunkMetadataStore over the extraction pipeline's
// SQLite database.
//
// Read-only from the ranker's side: open() creates the schema when the file
// is new but nothing here inserts or updates chunk rows. Statements are
// prepared once; a connection mutex serializes them so one store can serve
// concurrent queries.
class SQLiteChunkStore : public ChunkMetadataStore {
public:
    ~SQLiteChunkStore() override;

    SQLiteChunkStore(const SQLiteChunkStore&) = delete;
    SQLiteChunkStore& operator=(const SQLiteChunkStore&) = delete;

    // nullptr when the database cannot be opened or prepared
    static std::unique_ptr<SQLiteChunkStore> open(const QString& dbPath);

    std::optional<DimensionScoreMap> dimensionScores(const QString& chunkId) override;
    std::optional<double> recencyScore(const QString& chunkId) override;
    std::optional<double> confidenceScore(const QString& chunkId) override;

    int chunkCount();

private:
    SQLiteChunkStore() = default;

    bool init(const QString& dbPath);
    bool execSql(const char* sql);
    bool prepare(const char* sql, sqlite3_stmt** stmt);
    std::optional<double> readMetadataColumn(sqlite3_stmt* stmt, const QString& chunkId);

    sqlite3* m_db = nullptr;
    sqlite3_stmt* m_dimensionStmt = nullptr;
    sqlite3_stmt* m_recencyStmt = nullptr;
    sqlite3_stmt* m_confidenceStmt = nullptr;
    std::mutex m_mutex;
};

} // namespace dr

#include "core/index/sqlite_chunk_store.h"
#include "core/index/schema.h"
#include "core/shared/logging.h"

namespace dr {

SQLiteChunkStore::~SQLiteChunkStore()
{
    sqlite3_finalize(m_dimensionStmt);
    sqlite3_finalize(m_recencyStmt);
    sqlite3_finalize(m_confidenceStmt);
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

std::unique_ptr<SQLiteChunkStore> SQLiteChunkStore::open(const QString& dbPath)
{
    std::unique_ptr<SQLiteChunkStore> store(new SQLiteChunkStore());
    if (!store->init(dbPath)) {
        return nullptr;
    }
    return store;
}

bool SQLiteChunkStore::init(const QString& dbPath)
{
    int rc = sqlite3_open_v2(dbPath.toUtf8().constData(), &m_db,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE
                                 | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR(drStore, "Failed to open chunk database %s: %s",
                  qUtf8Printable(dbPath), m_db ? sqlite3_errmsg(m_db) : "out of memory");
        return false;
    }

    sqlite3_busy_timeout(m_db, 5000);

    if (!execSql(kConnectionPragmas)) {
        LOG_ERROR(drStore, "Failed to set connection pragmas");
        return false;
    }
    if (!execSql(kChunkMetadataSchema)) {
        LOG_ERROR(drStore, "Failed to create chunk metadata schema");
        return false;
    }

    if (!prepare("SELECT dimension, value, confidence FROM chunk_dimension_scores "
                 "WHERE chunk_id = ?1",
                 &m_dimensionStmt)
        || !prepare("SELECT recency_score FROM chunk_metadata WHERE chunk_id = ?1",
                    &m_recencyStmt)
        || !prepare("SELECT confidence_score FROM chunk_metadata WHERE chunk_id = ?1",
                    &m_confidenceStmt)) {
        return false;
    }

    LOG_INFO(drStore, "Chunk metadata store opened: %s", qUtf8Printable(dbPath));
    return true;
}

bool SQLiteChunkStore::execSql(const char* sql)
{
    char* errMsg = nullptr;
    const int rc = sqlite3_exec(m_db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LOG_ERROR(drStore, "SQL error: %s", errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

bool SQLiteChunkStore::prepare(const char* sql, sqlite3_stmt** stmt)
{
    if (sqlite3_prepare_v2(m_db, sql, -1, stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR(drStore, "prepare failed: %s", sqlite3_errmsg(m_db));
        return false;
    }
    return true;
}

std::optional<DimensionScoreMap> SQLiteChunkStore::dimensionScores(const QString& chunkId)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    const QByteArray idUtf8 = chunkId.toUtf8();
    sqlite3_reset(m_dimensionStmt);
    sqlite3_bind_text(m_dimensionStmt, 1, idUtf8.constData(), -1, SQLITE_STATIC);

    DimensionScoreMap scores;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(m_dimensionStmt)) == SQLITE_ROW) {
        const char* dimension =
            reinterpret_cast<const char*>(sqlite3_column_text(m_dimensionStmt, 0));
        if (!dimension) {
            continue;
        }
        DimensionScore score;
        score.value = sqlite3_column_double(m_dimensionStmt, 1);
        if (sqlite3_column_type(m_dimensionStmt, 2) != SQLITE_NULL) {
            score.confidence = sqlite3_column_double(m_dimensionStmt, 2);
        }
        scores[QString::fromUtf8(dimension)] = score;
    }
    if (rc != SQLITE_DONE) {
        LOG_WARN(drStore, "dimensionScores(%s) failed: %s",
                 qUtf8Printable(chunkId), sqlite3_errmsg(m_db));
    }
    sqlite3_reset(m_dimensionStmt);
    sqlite3_clear_bindings(m_dimensionStmt);

    if (rc != SQLITE_DONE || scores.empty()) {
        return std::nullopt;
    }
    return scores;
}

std::optional<double> SQLiteChunkStore::readMetadataColumn(sqlite3_stmt* stmt,
                                                           const QString& chunkId)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    const QByteArray idUtf8 = chunkId.toUtf8();
    sqlite3_reset(stmt);
    sqlite3_bind_text(stmt, 1, idUtf8.constData(), -1, SQLITE_STATIC);

    std::optional<double> value;
    const int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        value = sqlite3_column_double(stmt, 0);
    } else if (rc != SQLITE_DONE) {
        LOG_WARN(drStore, "metadata lookup for %s failed: %s",
                 qUtf8Printable(chunkId), sqlite3_errmsg(m_db));
    }
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    return value;
}

std::optional<double> SQLiteChunkStore::recencyScore(const QString& chunkId)
{
    return readMetadataColumn(m_recencyStmt, chunkId);
}

std::optional<double> SQLiteChunkStore::confidenceScore(const QString& chunkId)
{
    return readMetadataColumn(m_confidenceStmt, chunkId);
}

int SQLiteChunkStore::chunkCount()
{
    std::lock_guard<std::mutex> lock(m_mutex);

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "SELECT count(*) FROM chunk_metadata", -1, &stmt, nullptr)
        != SQLITE_OK) {
        LOG_WARN(drStore, "chunkCount prepare failed: %s", sqlite3_errmsg(m_db));
        return 0;
    }
    int count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return count;
}

} // namespace dr

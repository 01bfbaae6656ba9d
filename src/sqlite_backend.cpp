#include "sqlite_backend.hpp"
#include "cache_logger.hpp"

#include <sqlite3.h>

namespace voicecache {

namespace {

const char* SCHEMA = R"(
CREATE TABLE IF NOT EXISTS speaker_embeddings (
    user_key   TEXT PRIMARY KEY,
    payload    BLOB NOT NULL,
    created_at INTEGER NOT NULL,
    expires_at INTEGER NOT NULL,
    CHECK (expires_at > created_at)
);
CREATE INDEX IF NOT EXISTS idx_speaker_embeddings_expires_at ON speaker_embeddings(expires_at);
)";

int sql_exec(sqlite3* db, const char* sql, std::string& error) {
    char* err = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        error = err ? err : sqlite3_errstr(rc);
    }
    if (err) sqlite3_free(err);
    return rc;
}

// Resets a shared prepared statement when the call that borrowed it returns.
struct StatementScope {
    sqlite3_stmt* stmt;
    explicit StatementScope(sqlite3_stmt* s) : stmt(s) {}
    ~StatementScope() {
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
    }
};

}

SqliteBackend::SqliteBackend(const CacheConfig& config)
    : path_(config.sqlite_path)
    , busy_timeout_ms_(config.sqlite_busy_timeout_ms)
    , codec_(config.embedding_dim) {}

SqliteBackend::~SqliteBackend() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    close_locked();
}

void SqliteBackend::close_locked() {
    if (stmt_upsert_) sqlite3_finalize(stmt_upsert_);
    if (stmt_select_) sqlite3_finalize(stmt_select_);
    if (stmt_select_expiry_) sqlite3_finalize(stmt_select_expiry_);
    if (stmt_delete_) sqlite3_finalize(stmt_delete_);
    if (stmt_delete_expired_) sqlite3_finalize(stmt_delete_expired_);
    if (stmt_delete_payload_) sqlite3_finalize(stmt_delete_payload_);
    if (stmt_sweep_) sqlite3_finalize(stmt_sweep_);
    stmt_upsert_ = stmt_select_ = stmt_select_expiry_ = stmt_delete_ = nullptr;
    stmt_delete_expired_ = stmt_delete_payload_ = stmt_sweep_ = nullptr;

    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool SqliteBackend::open_locked() {
    // FULLMUTEX keeps the connection itself safe; db_mutex_ protects the shared statements.
    int rc = sqlite3_open_v2(path_.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string reason = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        CacheLogger::log(CacheLogger::Level::WARNING, CacheLogger::EventType::BACKEND_UNREACHABLE, "-",
                         "SQLite open failed (" + path_ + "): " + reason);
        close_locked();
        return false;
    }

    sqlite3_busy_timeout(db_, busy_timeout_ms_);

    std::string error;
    // WAL lets readers proceed while a writer holds the database.
    if (sql_exec(db_, "PRAGMA journal_mode=WAL", error) != SQLITE_OK ||
        sql_exec(db_, "PRAGMA synchronous=NORMAL", error) != SQLITE_OK ||
        sql_exec(db_, SCHEMA, error) != SQLITE_OK) {
        CacheLogger::log(CacheLogger::Level::WARNING, CacheLogger::EventType::BACKEND_UNREACHABLE, "-",
                         "SQLite schema setup failed (" + path_ + "): " + error);
        close_locked();
        return false;
    }

    struct { sqlite3_stmt** target; const char* sql; } statements[] = {
        {&stmt_upsert_,
         "INSERT OR REPLACE INTO speaker_embeddings (user_key, payload, created_at, expires_at) "
         "VALUES (?1, ?2, ?3, ?4)"},
        {&stmt_select_,
         "SELECT payload, expires_at FROM speaker_embeddings WHERE user_key = ?1"},
        {&stmt_select_expiry_,
         "SELECT expires_at FROM speaker_embeddings WHERE user_key = ?1"},
        {&stmt_delete_,
         "DELETE FROM speaker_embeddings WHERE user_key = ?1"},
        {&stmt_delete_expired_,
         "DELETE FROM speaker_embeddings WHERE user_key = ?1 AND expires_at = ?2 AND expires_at < ?3"},
        {&stmt_delete_payload_,
         "DELETE FROM speaker_embeddings WHERE user_key = ?1 AND CAST(payload AS BLOB) = ?2"},
        {&stmt_sweep_,
         "DELETE FROM speaker_embeddings WHERE expires_at < ?1"},
    };
    for (auto& s : statements) {
        rc = sqlite3_prepare_v2(db_, s.sql, -1, s.target, nullptr);
        if (rc != SQLITE_OK) {
            CacheLogger::log(CacheLogger::Level::ERROR, CacheLogger::EventType::BACKEND_UNREACHABLE, "-",
                             std::string("SQLite prepare failed: ") + sqlite3_errmsg(db_));
            close_locked();
            return false;
        }
    }
    return true;
}

bool SqliteBackend::connect() {
    std::lock_guard<std::mutex> lock(db_mutex_);

    if (db_) {
        std::string error;
        if (sql_exec(db_, "SELECT 1 FROM speaker_embeddings LIMIT 1", error) != SQLITE_OK) {
            CacheLogger::log(CacheLogger::Level::WARNING, CacheLogger::EventType::BACKEND_UNREACHABLE, "-",
                             "SQLite probe failed (" + path_ + "): " + error);
            connected_ = false;
            return false;
        }
        connected_ = true;
        return true;
    }

    if (!open_locked()) {
        connected_ = false;
        return false;
    }

    connected_ = true;
    CacheLogger::log(CacheLogger::Level::INFO, CacheLogger::EventType::BACKEND_CONNECTED, "-",
                     "SQLite opened: " + path_);
    return true;
}

BackendError SqliteBackend::on_sqlite_error(const char* op, const std::string& user_key, int rc) {
    BackendError error;
    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            error = BackendError::Timeout;
            break;
        case SQLITE_CONSTRAINT:
        case SQLITE_TOOBIG:
        case SQLITE_MISMATCH:
        case SQLITE_RANGE:
            error = BackendError::Rejected;
            break;
        default:
            error = BackendError::Unreachable;
            break;
    }

    if (error != BackendError::Rejected) {
        connected_ = false;
    }

    CacheLogger::log(CacheLogger::Level::WARNING,
                     error == BackendError::Rejected ? CacheLogger::EventType::INVALID_INPUT
                                                     : CacheLogger::EventType::BACKEND_UNREACHABLE,
                     user_key,
                     std::string("SQLite ") + op + " failed (" + backend_error_name(error) + "): " + sqlite3_errstr(rc));
    return error;
}

BackendResult<bool> SqliteBackend::set(const std::string& user_key, const Embedding& embedding,
                                       long long ttl_seconds) {
    if (!connected_) return BackendResult<bool>::failure(BackendError::Unreachable);
    if (!ttl_in_range(ttl_seconds)) return BackendResult<bool>::failure(BackendError::Rejected);

    std::string payload;
    try {
        payload = codec_.encode(embedding);
    } catch (const std::invalid_argument& e) {
        CacheLogger::log(CacheLogger::Level::WARNING, CacheLogger::EventType::INVALID_INPUT, user_key,
                         std::string("SQLite set rejected: ") + e.what());
        return BackendResult<bool>::failure(BackendError::Rejected);
    }

    int64_t created_at = now_epoch_ms();
    int64_t expires_at = expiry_from(created_at, ttl_seconds);

    int rc;
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (!db_) return BackendResult<bool>::failure(BackendError::Unreachable);

        StatementScope scope(stmt_upsert_);
        sqlite3_bind_text(stmt_upsert_, 1, user_key.c_str(), static_cast<int>(user_key.size()), SQLITE_TRANSIENT);
        sqlite3_bind_blob(stmt_upsert_, 2, payload.data(), static_cast<int>(payload.size()), SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt_upsert_, 3, created_at);
        sqlite3_bind_int64(stmt_upsert_, 4, expires_at);
        rc = sqlite3_step(stmt_upsert_);
    }

    if (rc != SQLITE_DONE) {
        return BackendResult<bool>::failure(on_sqlite_error("set", user_key, rc));
    }
    return BackendResult<bool>::success(true);
}

BackendResult<std::optional<Embedding>> SqliteBackend::get(const std::string& user_key) {
    using Result = BackendResult<std::optional<Embedding>>;
    if (!connected_) return Result::failure(BackendError::Unreachable);

    int rc;
    std::string payload;
    int64_t expires_at = 0;
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (!db_) return Result::failure(BackendError::Unreachable);

        StatementScope scope(stmt_select_);
        sqlite3_bind_text(stmt_select_, 1, user_key.c_str(), static_cast<int>(user_key.size()), SQLITE_TRANSIENT);
        rc = sqlite3_step(stmt_select_);
        if (rc == SQLITE_ROW) {
            const void* blob = sqlite3_column_blob(stmt_select_, 0);
            int size = sqlite3_column_bytes(stmt_select_, 0);
            if (blob && size > 0) {
                payload.assign(static_cast<const char*>(blob), static_cast<size_t>(size));
            }
            expires_at = sqlite3_column_int64(stmt_select_, 1);
        }
    }

    if (rc == SQLITE_DONE) {
        return Result::success(std::nullopt);
    }
    if (rc != SQLITE_ROW) {
        return Result::failure(on_sqlite_error("get", user_key, rc));
    }

    if (is_expired(expires_at, now_epoch_ms())) {
        purge_expired(user_key, expires_at, "expired on read");
        return Result::success(std::nullopt);
    }

    try {
        return Result::success(codec_.decode(payload));
    } catch (const CorruptPayload& e) {
        CacheLogger::log(CacheLogger::Level::ERROR, CacheLogger::EventType::CORRUPT_PAYLOAD, user_key,
                         std::string("SQLite entry undecodable: ") + e.what());
        purge_corrupt(user_key, payload);
        return Result::failure(BackendError::Corrupt);
    }
}

BackendResult<bool> SqliteBackend::remove(const std::string& user_key) {
    if (!connected_) return BackendResult<bool>::failure(BackendError::Unreachable);

    int rc;
    int changes = 0;
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (!db_) return BackendResult<bool>::failure(BackendError::Unreachable);

        StatementScope scope(stmt_delete_);
        sqlite3_bind_text(stmt_delete_, 1, user_key.c_str(), static_cast<int>(user_key.size()), SQLITE_TRANSIENT);
        rc = sqlite3_step(stmt_delete_);
        if (rc == SQLITE_DONE) {
            changes = sqlite3_changes(db_);
        }
    }

    if (rc != SQLITE_DONE) {
        return BackendResult<bool>::failure(on_sqlite_error("delete", user_key, rc));
    }
    return BackendResult<bool>::success(changes > 0);
}

BackendResult<bool> SqliteBackend::exists(const std::string& user_key) {
    if (!connected_) return BackendResult<bool>::failure(BackendError::Unreachable);

    int rc;
    int64_t expires_at = 0;
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (!db_) return BackendResult<bool>::failure(BackendError::Unreachable);

        StatementScope scope(stmt_select_expiry_);
        sqlite3_bind_text(stmt_select_expiry_, 1, user_key.c_str(), static_cast<int>(user_key.size()), SQLITE_TRANSIENT);
        rc = sqlite3_step(stmt_select_expiry_);
        if (rc == SQLITE_ROW) {
            expires_at = sqlite3_column_int64(stmt_select_expiry_, 0);
        }
    }

    if (rc == SQLITE_DONE) {
        return BackendResult<bool>::success(false);
    }
    if (rc != SQLITE_ROW) {
        return BackendResult<bool>::failure(on_sqlite_error("exists", user_key, rc));
    }

    if (is_expired(expires_at, now_epoch_ms())) {
        purge_expired(user_key, expires_at, "expired on exists");
        return BackendResult<bool>::success(false);
    }
    return BackendResult<bool>::success(true);
}

BackendResult<size_t> SqliteBackend::sweep_expired() {
    if (!connected_) return BackendResult<size_t>::failure(BackendError::Unreachable);

    int rc;
    int changes = 0;
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (!db_) return BackendResult<size_t>::failure(BackendError::Unreachable);

        StatementScope scope(stmt_sweep_);
        sqlite3_bind_int64(stmt_sweep_, 1, now_epoch_ms());
        rc = sqlite3_step(stmt_sweep_);
        if (rc == SQLITE_DONE) {
            changes = sqlite3_changes(db_);
        }
    }

    if (rc != SQLITE_DONE) {
        return BackendResult<size_t>::failure(on_sqlite_error("sweep", "-", rc));
    }
    if (changes > 0) {
        CacheLogger::log(CacheLogger::Level::INFO, CacheLogger::EventType::EXPIRED_PURGED, "-",
                         "SQLite sweep removed " + std::to_string(changes) + " expired entries");
    }
    return BackendResult<size_t>::success(static_cast<size_t>(changes));
}

void SqliteBackend::purge_expired(const std::string& user_key, int64_t expires_at, const std::string& reason) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return;

    StatementScope scope(stmt_delete_expired_);
    sqlite3_bind_text(stmt_delete_expired_, 1, user_key.c_str(), static_cast<int>(user_key.size()), SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt_delete_expired_, 2, expires_at);
    sqlite3_bind_int64(stmt_delete_expired_, 3, now_epoch_ms());
    purge_matching(stmt_delete_expired_, user_key, reason);
}

void SqliteBackend::purge_corrupt(const std::string& user_key, const std::string& payload) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return;

    StatementScope scope(stmt_delete_payload_);
    sqlite3_bind_text(stmt_delete_payload_, 1, user_key.c_str(), static_cast<int>(user_key.size()), SQLITE_TRANSIENT);
    sqlite3_bind_blob(stmt_delete_payload_, 2, payload.data(), static_cast<int>(payload.size()), SQLITE_TRANSIENT);
    purge_matching(stmt_delete_payload_, user_key, "corrupt payload");
}

// Caller holds db_mutex_ and has bound the statement.
void SqliteBackend::purge_matching(sqlite3_stmt* stmt, const std::string& user_key, const std::string& reason) {
    int rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        on_sqlite_error("purge", user_key, rc);
        return;
    }
    if (sqlite3_changes(db_) > 0) {
        CacheLogger::log(CacheLogger::Level::DEBUG, CacheLogger::EventType::EXPIRED_PURGED, user_key,
                         "SQLite entry purged: " + reason);
    } else {
        CacheLogger::log(CacheLogger::Level::DEBUG, CacheLogger::EventType::EXPIRED_PURGED, user_key,
                         "SQLite purge skipped, entry rewritten: " + reason);
    }
}

}

#pragma once

#include <atomic>
#include <mutex>
#include <string>

#include "cache_backend.hpp"
#include "cache_config.hpp"
#include "embedding_codec.hpp"

struct sqlite3;
struct sqlite3_stmt;

namespace voicecache {

// Backend B: a local SQLite database.
// SQLite has no native expiry, so TTL is enforced lazily on get/exists and
// eagerly by sweep_expired(). user_key is the PRIMARY KEY, which gives upsert
// semantics through INSERT OR REPLACE.
class SqliteBackend : public CacheBackend {
public:
    explicit SqliteBackend(const CacheConfig& config);
    ~SqliteBackend() override;

    SqliteBackend(const SqliteBackend&) = delete;
    SqliteBackend& operator=(const SqliteBackend&) = delete;

    std::string type_name() const override { return "sqlite"; }

    // Opens the database and creates the table and expires_at index on first
    // call; later calls only re-probe the open handle.
    bool connect() override;
    bool is_healthy() const override { return connected_; }

    BackendResult<bool> set(const std::string& user_key, const Embedding& embedding,
                            long long ttl_seconds) override;
    BackendResult<std::optional<Embedding>> get(const std::string& user_key) override;
    BackendResult<bool> remove(const std::string& user_key) override;
    BackendResult<bool> exists(const std::string& user_key) override;
    BackendResult<size_t> sweep_expired() override;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    int busy_timeout_ms_;
    EmbeddingCodec codec_;

    // Guards the handle and every prepared statement below.
    mutable std::mutex db_mutex_;
    sqlite3* db_ = nullptr;
    sqlite3_stmt* stmt_upsert_ = nullptr;
    sqlite3_stmt* stmt_select_ = nullptr;
    sqlite3_stmt* stmt_select_expiry_ = nullptr;
    sqlite3_stmt* stmt_delete_ = nullptr;
    sqlite3_stmt* stmt_delete_expired_ = nullptr;
    sqlite3_stmt* stmt_delete_payload_ = nullptr;
    sqlite3_stmt* stmt_sweep_ = nullptr;

    std::atomic<bool> connected_{false};

    // Caller holds db_mutex_.
    bool open_locked();
    void close_locked();

    // Deletes the row only while it still holds the expires_at (or payload) that was
    // read, so a write landing after the read survives.
    void purge_expired(const std::string& user_key, int64_t expires_at, const std::string& reason);
    void purge_corrupt(const std::string& user_key, const std::string& payload);
    void purge_matching(sqlite3_stmt* stmt, const std::string& user_key, const std::string& reason);

    // Maps a SQLite result code to a BackendError and drops the health flag on connectivity errors.
    BackendError on_sqlite_error(const char* op, const std::string& user_key, int rc);
};

}

#pragma once

#include <string>
#include <cstdint>

namespace voicecache {

// Which durable backend the manager tries first.
enum class BackendKind {
    Redis,   // backend_a
    Sqlite   // backend_b
};

// Core cache configuration. Read once when the manager is constructed.
struct CacheConfig {
    // --- Backend Selection ---
    BackendKind backend = BackendKind::Redis;

    // --- Entry Policy ---
    long long default_ttl_sec = 2592000;  // 30 days
    size_t embedding_dim = 0;             // 0 accepts any length

    // --- Backend A (Redis) ---
    std::string redis_host = "127.0.0.1";
    int redis_port = 6379;
    int redis_db = 0;
    std::string redis_password = "";
    std::string redis_username = "";
    std::string redis_key_prefix = "speaker_embedding:";
    int redis_timeout_ms = 500;
    size_t redis_pool_size = 4;

    // --- Backend B (SQLite) ---
    std::string sqlite_path = "voicecache.db";
    int sqlite_busy_timeout_ms = 500;

    // --- Maintenance ---
    int sweep_interval_sec = 300;    // 0 disables the periodic sweep
    int reprobe_interval_sec = 60;   // 0 disables re-promotion
    int promote_after_successes = 3;

    /**
     * Applies VOICECACHE_* environment overrides on top of the defaults.
     * Throws std::invalid_argument when a numeric variable does not parse.
     */
    static CacheConfig from_env();

    // Returns an empty string when the configuration is usable, otherwise the first problem found.
    std::string validate() const;

    // "redis" or "sqlite".
    std::string backend_name() const;
};

// Accepts "backend_a", "redis", "backend_b", "sqlite" (case-insensitive).
// Returns false for anything else and leaves `out` untouched.
bool parse_backend_kind(const std::string& text, BackendKind& out);

std::string backend_kind_name(BackendKind kind);

// Whole-string integer parse. Throws std::invalid_argument naming `name` on failure.
long long parse_integer(const std::string& name, const std::string& text);

}

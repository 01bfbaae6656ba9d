#include "cache_config.hpp"
#include "cache_backend.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace voicecache {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

}

// std::stoll accepts trailing garbage ("12abc"); configuration must not.
long long parse_integer(const std::string& name, const std::string& text) {
    size_t consumed = 0;
    long long parsed = 0;
    try {
        parsed = std::stoll(text, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument(name + " is not an integer: " + text);
    }
    if (consumed != text.size()) {
        throw std::invalid_argument(name + " is not an integer: " + text);
    }
    return parsed;
}

bool parse_backend_kind(const std::string& text, BackendKind& out) {
    std::string lowered = to_lower(text);
    if (lowered == "backend_a" || lowered == "redis") {
        out = BackendKind::Redis;
        return true;
    }
    if (lowered == "backend_b" || lowered == "sqlite") {
        out = BackendKind::Sqlite;
        return true;
    }
    return false;
}

std::string backend_kind_name(BackendKind kind) {
    switch (kind) {
        case BackendKind::Redis: return "redis";
        case BackendKind::Sqlite: return "sqlite";
        default: return "unknown";
    }
}

std::string CacheConfig::backend_name() const {
    return backend_kind_name(backend);
}

CacheConfig CacheConfig::from_env() {
    CacheConfig config;

    if (const char* e = std::getenv("VOICECACHE_BACKEND")) {
        if (!parse_backend_kind(e, config.backend)) {
            throw std::invalid_argument(std::string("VOICECACHE_BACKEND must be backend_a|redis|backend_b|sqlite, got: ") + e);
        }
    }
    if (const char* e = std::getenv("VOICECACHE_DEFAULT_TTL")) {
        config.default_ttl_sec = parse_integer("VOICECACHE_DEFAULT_TTL", e);
    }
    if (const char* e = std::getenv("VOICECACHE_EMBEDDING_DIM")) {
        long long dim = parse_integer("VOICECACHE_EMBEDDING_DIM", e);
        if (dim < 0) {
            throw std::invalid_argument("VOICECACHE_EMBEDDING_DIM must not be negative");
        }
        config.embedding_dim = static_cast<size_t>(dim);
    }

    // Backend A
    if (const char* e = std::getenv("VOICECACHE_REDIS_HOST")) config.redis_host = e;
    if (const char* e = std::getenv("VOICECACHE_REDIS_PORT")) config.redis_port = static_cast<int>(parse_integer("VOICECACHE_REDIS_PORT", e));
    if (const char* e = std::getenv("VOICECACHE_REDIS_DB")) config.redis_db = static_cast<int>(parse_integer("VOICECACHE_REDIS_DB", e));
    if (const char* e = std::getenv("VOICECACHE_REDIS_PASSWORD")) config.redis_password = e;
    if (const char* e = std::getenv("VOICECACHE_REDIS_USER")) config.redis_username = e;
    if (const char* e = std::getenv("VOICECACHE_REDIS_PREFIX")) config.redis_key_prefix = e;
    if (const char* e = std::getenv("VOICECACHE_REDIS_TIMEOUT_MS")) config.redis_timeout_ms = static_cast<int>(parse_integer("VOICECACHE_REDIS_TIMEOUT_MS", e));

    // Backend B
    if (const char* e = std::getenv("VOICECACHE_SQLITE_PATH")) config.sqlite_path = e;
    if (const char* e = std::getenv("VOICECACHE_SQLITE_BUSY_MS")) config.sqlite_busy_timeout_ms = static_cast<int>(parse_integer("VOICECACHE_SQLITE_BUSY_MS", e));

    // Maintenance
    if (const char* e = std::getenv("VOICECACHE_SWEEP_INTERVAL")) config.sweep_interval_sec = static_cast<int>(parse_integer("VOICECACHE_SWEEP_INTERVAL", e));
    if (const char* e = std::getenv("VOICECACHE_REPROBE_INTERVAL")) config.reprobe_interval_sec = static_cast<int>(parse_integer("VOICECACHE_REPROBE_INTERVAL", e));
    if (const char* e = std::getenv("VOICECACHE_PROMOTE_AFTER")) config.promote_after_successes = static_cast<int>(parse_integer("VOICECACHE_PROMOTE_AFTER", e));

    return config;
}

std::string CacheConfig::validate() const {
    if (default_ttl_sec <= 0) return "default TTL must be positive";
    if (default_ttl_sec > kMaxTtlSeconds) return "default TTL exceeds " + std::to_string(kMaxTtlSeconds) + " seconds";
    if (redis_port <= 0 || redis_port > 65535) return "redis port out of range: " + std::to_string(redis_port);
    if (redis_db < 0) return "redis db must not be negative";
    if (redis_timeout_ms <= 0) return "redis timeout must be positive";
    if (redis_pool_size == 0) return "redis pool size must be at least 1";
    if (sqlite_path.empty()) return "sqlite path is required";
    if (sqlite_busy_timeout_ms < 0) return "sqlite busy timeout must not be negative";
    if (sweep_interval_sec < 0) return "sweep interval must not be negative";
    if (reprobe_interval_sec < 0) return "reprobe interval must not be negative";
    if (promote_after_successes < 1) return "promote-after count must be at least 1";
    return {};
}

}

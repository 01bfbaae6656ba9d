#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>

#include "cache_backend.hpp"
#include "cache_config.hpp"
#include "embedding_codec.hpp"
#include "volatile_store.hpp"

namespace voicecache {

// The storage path currently serving requests. Lower value = preferred.
enum class CacheTier {
    Primary = 0,
    Secondary = 1,
    Volatile = 2
};

std::string cache_tier_name(CacheTier tier);

// Diagnostic snapshot; not a consistency guarantee.
struct CacheInfo {
    std::string configured_backend;   // "redis" / "sqlite"
    std::string active_backend;       // "redis" / "sqlite" / "volatile"
    CacheTier active_tier = CacheTier::Volatile;
    std::string status;               // "connected" / "fallback_only"
    size_t volatile_entries = 0;
};

// Raised only by get_cached_embedding_or_fail().
class EmbeddingNotFound : public std::runtime_error {
public:
    explicit EmbeddingNotFound(const std::string& user_key)
        : std::runtime_error("Speaker embedding not found for user " + user_key +
                             ". Populate the cache first via cache_voice.")
        , user_key_(user_key) {}

    const std::string& user_key() const { return user_key_; }
    const char* remediation() const { return "call cache_voice for this user before generating audio"; }

private:
    std::string user_key_;
};

/**
 * Routes embedding reads and writes through Primary -> Secondary -> Volatile.
 *
 * Built once per process and handed to consumers by reference. Backend failures
 * never escape as exceptions: a connectivity error or timeout demotes the active
 * tier and the call continues on the next one. Writes always land somewhere.
 * reprobe() promotes a higher tier back after promote_after_successes
 * consecutive healthy probes.
 *
 * Writes and deletes served below the primary are journaled per key and
 * replayed onto a tier before it is promoted, so a recovered backend never
 * answers with a value that was overwritten or deleted during the outage.
 */
class TieredCacheManager {
public:
    // Primary is config.backend, Secondary the other durable backend.
    explicit TieredCacheManager(const CacheConfig& config);

    // Either backend may be null (that tier is skipped).
    TieredCacheManager(const CacheConfig& config,
                       std::unique_ptr<CacheBackend> primary,
                       std::unique_ptr<CacheBackend> secondary);

    TieredCacheManager(const TieredCacheManager&) = delete;
    TieredCacheManager& operator=(const TieredCacheManager&) = delete;

    // Stores with the configured default TTL. Returns false only for rejected input
    // (empty key, wrong dimension); backend trouble falls back to the volatile store.
    bool set_embedding(const std::string& user_key, const Embedding& embedding);
    bool set_embedding(const std::string& user_key, const Embedding& embedding, long long ttl_seconds);

    std::optional<Embedding> get_embedding(const std::string& user_key);

    // true if either the durable tier or the volatile store held the key.
    bool delete_embedding(const std::string& user_key);

    bool exists_embedding(const std::string& user_key);

    CacheInfo get_cache_info() const;

    // Durable sweep (when a durable tier is active) plus the volatile purge.
    size_t cleanup_expired();

    // Throws EmbeddingNotFound when nothing is cached for the user.
    Embedding get_cached_embedding_or_fail(const std::string& user_key);

    // Probes every tier above the active one; returns the active tier afterwards.
    CacheTier reprobe();

    CacheTier active_tier() const { return static_cast<CacheTier>(active_.load()); }

    const CacheConfig& config() const { return config_; }

private:
    CacheConfig config_;
    std::unique_ptr<CacheBackend> primary_;
    std::unique_ptr<CacheBackend> secondary_;
    VolatileStore volatile_;

    std::atomic<int> active_{static_cast<int>(CacheTier::Volatile)};

    // Serializes connect() calls and tier transitions. Never taken on the
    // normal read/write path.
    std::mutex transition_mutex_;
    int probe_successes_[2] = {0, 0};

    // Latest write per key that landed below the primary. No embedding = delete.
    struct PendingWrite {
        std::optional<Embedding> embedding;
        int64_t expires_at = 0;
    };

    // Guards pending_. Taken after transition_mutex_ when both are held.
    std::mutex pending_mutex_;
    std::unordered_map<std::string, PendingWrite> pending_;

    CacheBackend* backend_for(CacheTier tier) const;

    // Moves the active tier below `from` after a connectivity failure, unless
    // another caller already did.
    void demote_from(CacheTier from, BackendError reason);

    // Records a write served by `served`. Returns false when a tier above it was
    // promoted meanwhile; the caller must redo the write against the new tier.
    bool journal(const std::string& user_key, PendingWrite write, CacheTier served);

    // Applies every journaled write to `backend`. false on a connectivity failure.
    bool replay_pending(CacheBackend& backend);

    void publish_tier_gauge() const;
    void publish_volatile_gauge() const;

    /**
     * Runs `op` against the active durable backend, demoting and retrying on
     * connectivity failures. Returns nullopt once the volatile tier is reached.
     * `served`, when given, receives the tier that produced the result.
     */
    template <typename T, typename Op>
    std::optional<BackendResult<T>> with_durable(Op op, CacheTier* served = nullptr) {
        for (;;) {
            CacheTier tier = active_tier();
            if (served) *served = tier;
            CacheBackend* backend = backend_for(tier);
            if (backend == nullptr) {
                if (served) *served = CacheTier::Volatile;
                return std::nullopt;
            }
            if (!backend->is_healthy()) {
                demote_from(tier, BackendError::Unreachable);
                continue;
            }
            BackendResult<T> result = op(*backend);
            if (result.connectivity_failure()) {
                demote_from(tier, result.error);
                continue;
            }
            return result;
        }
    }
};

}

#include "tiered_cache_manager.hpp"
#include "cache_logger.hpp"
#include "metrics.hpp"
#include "redis_backend.hpp"
#include "sqlite_backend.hpp"

namespace voicecache {

namespace {

std::unique_ptr<CacheBackend> make_backend(BackendKind kind, const CacheConfig& config) {
    switch (kind) {
        case BackendKind::Redis: return std::make_unique<RedisBackend>(config);
        case BackendKind::Sqlite: return std::make_unique<SqliteBackend>(config);
        default: return nullptr;
    }
}

BackendKind other_backend(BackendKind kind) {
    return kind == BackendKind::Redis ? BackendKind::Sqlite : BackendKind::Redis;
}

}

std::string cache_tier_name(CacheTier tier) {
    switch (tier) {
        case CacheTier::Primary: return "primary";
        case CacheTier::Secondary: return "secondary";
        case CacheTier::Volatile: return "volatile";
        default: return "unknown";
    }
}

TieredCacheManager::TieredCacheManager(const CacheConfig& config)
    : TieredCacheManager(config,
                         make_backend(config.backend, config),
                         make_backend(other_backend(config.backend), config)) {}

TieredCacheManager::TieredCacheManager(const CacheConfig& config,
                                       std::unique_ptr<CacheBackend> primary,
                                       std::unique_ptr<CacheBackend> secondary)
    : config_(config)
    , primary_(std::move(primary))
    , secondary_(std::move(secondary)) {
    std::lock_guard<std::mutex> lock(transition_mutex_);

    CacheTier selected = CacheTier::Volatile;
    if (primary_ && primary_->connect()) {
        selected = CacheTier::Primary;
    } else {
        CacheLogger::log(CacheLogger::Level::WARNING, CacheLogger::EventType::TIER_DEMOTED, "-",
                         config_.backend_name() + " unavailable at startup, trying alternative");
        if (secondary_ && secondary_->connect()) {
            selected = CacheTier::Secondary;
            CacheLogger::log(CacheLogger::Level::INFO, CacheLogger::EventType::TIER_DEMOTED, "-",
                             "Using alternative cache: " + secondary_->type_name());
        } else {
            CacheLogger::log(CacheLogger::Level::ERROR, CacheLogger::EventType::TIER_DEMOTED, "-",
                             "All durable backends failed, using in-memory cache");
        }
    }

    active_ = static_cast<int>(selected);
    publish_tier_gauge();
    publish_volatile_gauge();
}

CacheBackend* TieredCacheManager::backend_for(CacheTier tier) const {
    switch (tier) {
        case CacheTier::Primary: return primary_.get();
        case CacheTier::Secondary: return secondary_.get();
        default: return nullptr;
    }
}

void TieredCacheManager::demote_from(CacheTier from, BackendError reason) {
    std::lock_guard<std::mutex> lock(transition_mutex_);
    if (active_tier() != from) {
        return;
    }

    CacheTier next = CacheTier::Volatile;
    if (from == CacheTier::Primary && secondary_) {
        // The secondary is connected lazily; it may never have been needed before.
        if (secondary_->is_healthy() || secondary_->connect()) {
            next = CacheTier::Secondary;
        }
    }

    active_ = static_cast<int>(next);
    probe_successes_[0] = probe_successes_[1] = 0;

    CacheBackend* failed = backend_for(from);
    CacheLogger::log(CacheLogger::Level::WARNING, CacheLogger::EventType::TIER_DEMOTED, "-",
                     (failed ? failed->type_name() : cache_tier_name(from)) + " " + backend_error_name(reason) +
                     ", demoted " + cache_tier_name(from) + " -> " + cache_tier_name(next));
    MetricsRegistry::instance().increment_counter(metric::kDemotions);
    publish_tier_gauge();
}

CacheTier TieredCacheManager::reprobe() {
    std::lock_guard<std::mutex> lock(transition_mutex_);
    CacheTier current = active_tier();

    for (int t = 0; t < static_cast<int>(current); ++t) {
        CacheTier tier = static_cast<CacheTier>(t);
        CacheBackend* backend = backend_for(tier);
        if (backend == nullptr) {
            continue;
        }

        if (!backend->connect()) {
            probe_successes_[t] = 0;
            continue;
        }

        // Promote only after a run of good probes so a flapping backend stays demoted.
        if (++probe_successes_[t] >= config_.promote_after_successes) {
            std::lock_guard<std::mutex> pending_lock(pending_mutex_);
            if (!replay_pending(*backend)) {
                probe_successes_[t] = 0;
                continue;
            }
            // The secondary still lacks what the primary missed; keep the journal
            // until the primary itself has caught up.
            if (tier == CacheTier::Primary) {
                pending_.clear();
            }
            active_ = t;
            probe_successes_[0] = probe_successes_[1] = 0;
            CacheLogger::log(CacheLogger::Level::INFO, CacheLogger::EventType::TIER_PROMOTED, "-",
                             backend->type_name() + " healthy, promoted " + cache_tier_name(current) +
                             " -> " + cache_tier_name(tier));
            MetricsRegistry::instance().increment_counter(metric::kPromotions);
            publish_tier_gauge();
            break;
        }
    }
    return active_tier();
}

bool TieredCacheManager::replay_pending(CacheBackend& backend) {
    size_t applied = 0;
    for (const auto& [user_key, write] : pending_) {
        int64_t remaining_ms = write.embedding ? write.expires_at - now_epoch_ms() : 0;
        BackendResult<bool> result = remaining_ms > 0
            ? backend.set(user_key, *write.embedding, (remaining_ms + 999) / 1000)
            : backend.remove(user_key);

        if (result.connectivity_failure()) {
            CacheLogger::log(CacheLogger::Level::WARNING, CacheLogger::EventType::TIER_PROMOTED, user_key,
                             backend.type_name() + " " + backend_error_name(result.error) +
                             " while catching up, promotion postponed");
            return false;
        }
        if (!result.ok()) {
            CacheLogger::log(CacheLogger::Level::ERROR, CacheLogger::EventType::TIER_PROMOTED, user_key,
                             "Catch-up write to " + backend.type_name() + " failed: " +
                             backend_error_name(result.error));
            continue;
        }
        ++applied;
    }

    bool erased = false;
    for (const auto& entry : pending_) {
        erased = volatile_.erase(entry.first) || erased;
    }
    if (erased) {
        publish_volatile_gauge();
    }
    if (!pending_.empty()) {
        CacheLogger::log(CacheLogger::Level::INFO, CacheLogger::EventType::TIER_PROMOTED, "-",
                         "Replayed " + std::to_string(applied) + " of " + std::to_string(pending_.size()) +
                         " outage writes onto " + backend.type_name());
    }
    return true;
}

bool TieredCacheManager::journal(const std::string& user_key, PendingWrite write, CacheTier served) {
    if (served == CacheTier::Primary) {
        return true;
    }
    bool tier_above = false;
    for (int t = 0; t < static_cast<int>(served); ++t) {
        tier_above = tier_above || backend_for(static_cast<CacheTier>(t)) != nullptr;
    }
    if (!tier_above) {
        return true;
    }

    std::lock_guard<std::mutex> lock(pending_mutex_);
    if (active_tier() < served) {
        return false;
    }
    pending_[user_key] = std::move(write);
    return true;
}

bool TieredCacheManager::set_embedding(const std::string& user_key, const Embedding& embedding) {
    return set_embedding(user_key, embedding, config_.default_ttl_sec);
}

bool TieredCacheManager::set_embedding(const std::string& user_key, const Embedding& embedding,
                                       long long ttl_seconds) {
    if (user_key.empty()) {
        CacheLogger::log(CacheLogger::Level::WARNING, CacheLogger::EventType::INVALID_INPUT, "-",
                         "Rejected embedding with empty user key");
        return false;
    }
    if (config_.embedding_dim != 0 && embedding.size() != config_.embedding_dim) {
        CacheLogger::log(CacheLogger::Level::WARNING, CacheLogger::EventType::INVALID_INPUT, user_key,
                         "Rejected embedding of dimension " + std::to_string(embedding.size()) +
                         ", expected " + std::to_string(config_.embedding_dim));
        return false;
    }
    if (ttl_seconds <= 0) {
        CacheLogger::log(CacheLogger::Level::WARNING, CacheLogger::EventType::INVALID_INPUT, user_key,
                         "Non-positive TTL " + std::to_string(ttl_seconds) + ", using default");
        ttl_seconds = config_.default_ttl_sec;
    }
    if (ttl_seconds > kMaxTtlSeconds) {
        CacheLogger::log(CacheLogger::Level::WARNING, CacheLogger::EventType::INVALID_INPUT, user_key,
                         "TTL " + std::to_string(ttl_seconds) + " clamped to " + std::to_string(kMaxTtlSeconds));
        ttl_seconds = kMaxTtlSeconds;
    }

    for (;;) {
        CacheTier served = CacheTier::Volatile;
        auto durable = with_durable<bool>([&](CacheBackend& backend) {
            return backend.set(user_key, embedding, ttl_seconds);
        }, &served);

        if (durable && durable->ok() && durable->value) {
            // A copy left over from an earlier fallback write would otherwise shadow
            // this value once the durable entry expires.
            if (volatile_.erase(user_key)) {
                publish_volatile_gauge();
            }
        } else {
            served = CacheTier::Volatile;
            volatile_.put(user_key, embedding, ttl_seconds);
            CacheLogger::log(CacheLogger::Level::INFO, CacheLogger::EventType::FALLBACK_WRITE, user_key,
                             durable ? "Durable write failed (" + backend_error_name(durable->error) +
                                       "), stored in memory"
                                     : std::string("No durable tier, stored in memory"));
            MetricsRegistry::instance().increment_counter(metric::kFallbackWrites);
            publish_volatile_gauge();
        }

        if (journal(user_key, PendingWrite{embedding, expiry_from(now_epoch_ms(), ttl_seconds)}, served)) {
            return true;
        }
    }
}

std::optional<Embedding> TieredCacheManager::get_embedding(const std::string& user_key) {
    auto durable = with_durable<std::optional<Embedding>>([&](CacheBackend& backend) {
        return backend.get(user_key);
    });

    if (durable) {
        if (durable->ok() && durable->value) {
            MetricsRegistry::instance().increment_counter(metric::kHits);
            return std::move(durable->value);
        }
        if (durable->error == BackendError::Corrupt) {
            MetricsRegistry::instance().increment_counter(metric::kCorruptPayloads);
        }
    }

    auto fallback = volatile_.get(user_key);
    MetricsRegistry::instance().increment_counter(fallback ? metric::kHits : metric::kMisses);
    return fallback;
}

bool TieredCacheManager::delete_embedding(const std::string& user_key) {
    bool deleted = false;
    for (;;) {
        CacheTier served = CacheTier::Volatile;
        auto durable = with_durable<bool>([&](CacheBackend& backend) {
            return backend.remove(user_key);
        }, &served);
        deleted = deleted || (durable && durable->ok() && durable->value);

        if (volatile_.erase(user_key)) {
            deleted = true;
            publish_volatile_gauge();
        }
        if (journal(user_key, PendingWrite{}, served)) {
            return deleted;
        }
    }
}

bool TieredCacheManager::exists_embedding(const std::string& user_key) {
    auto durable = with_durable<bool>([&](CacheBackend& backend) {
        return backend.exists(user_key);
    });
    if (durable && durable->ok() && durable->value) {
        return true;
    }
    return volatile_.contains(user_key);
}

CacheInfo TieredCacheManager::get_cache_info() const {
    CacheInfo info;
    info.configured_backend = config_.backend_name();
    info.active_tier = active_tier();

    CacheBackend* backend = backend_for(info.active_tier);
    info.active_backend = backend ? backend->type_name() : "volatile";
    info.status = (backend && backend->is_healthy()) ? "connected" : "fallback_only";
    info.volatile_entries = volatile_.size();
    return info;
}

size_t TieredCacheManager::cleanup_expired() {
    auto durable = with_durable<size_t>([](CacheBackend& backend) {
        return backend.sweep_expired();
    });

    size_t removed = (durable && durable->ok()) ? durable->value : 0;
    size_t volatile_removed = volatile_.purge_expired();
    removed += volatile_removed;

    if (volatile_removed > 0) {
        publish_volatile_gauge();
    }
    if (removed > 0) {
        MetricsRegistry::instance().increment_counter(metric::kExpiredPurged, static_cast<double>(removed));
    }
    CacheLogger::log(CacheLogger::Level::INFO, CacheLogger::EventType::MAINTENANCE, "-",
                     "Cleaned up " + std::to_string(removed) + " expired entries");
    return removed;
}

Embedding TieredCacheManager::get_cached_embedding_or_fail(const std::string& user_key) {
    auto embedding = get_embedding(user_key);
    if (!embedding) {
        throw EmbeddingNotFound(user_key);
    }
    return std::move(*embedding);
}

void TieredCacheManager::publish_tier_gauge() const {
    MetricsRegistry::instance().set_gauge(metric::kActiveTier, static_cast<double>(active_.load()));
}

void TieredCacheManager::publish_volatile_gauge() const {
    MetricsRegistry::instance().set_gauge(metric::kVolatileEntries, static_cast<double>(volatile_.size()));
}

}

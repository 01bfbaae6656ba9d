#include "volatile_store.hpp"
#include "cache_backend.hpp"

#include <mutex>

namespace voicecache {

void VolatileStore::put(const std::string& user_key, const Embedding& embedding, long long ttl_seconds) {
    int64_t created_at = now_epoch_ms();
    Entry entry{embedding, created_at, expiry_from(created_at, ttl_seconds)};

    std::unique_lock lock(mutex_);
    entries_[user_key] = std::move(entry);
}

std::optional<Embedding> VolatileStore::get(const std::string& user_key) {
    int64_t now = now_epoch_ms();
    {
        std::shared_lock lock(mutex_);
        auto it = entries_.find(user_key);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        if (!is_expired(it->second.expires_at, now)) {
            return it->second.embedding;
        }
    }

    // Re-check under the write lock: a concurrent put may have refreshed the entry.
    std::unique_lock lock(mutex_);
    auto it = entries_.find(user_key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    if (is_expired(it->second.expires_at, now)) {
        entries_.erase(it);
        return std::nullopt;
    }
    return it->second.embedding;
}

bool VolatileStore::contains(const std::string& user_key) {
    int64_t now = now_epoch_ms();
    std::shared_lock lock(mutex_);
    auto it = entries_.find(user_key);
    return it != entries_.end() && !is_expired(it->second.expires_at, now);
}

bool VolatileStore::erase(const std::string& user_key) {
    std::unique_lock lock(mutex_);
    return entries_.erase(user_key) > 0;
}

size_t VolatileStore::purge_expired() {
    int64_t now = now_epoch_ms();
    size_t removed = 0;

    std::unique_lock lock(mutex_);
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (is_expired(it->second.expires_at, now)) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t VolatileStore::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

}

#pragma once

#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "embedding_codec.hpp"

namespace voicecache {

// In-process fallback used while no durable backend is reachable.
// Holds raw embeddings (no serialization) with the same TTL rules as the durable
// stores. Contents die with the process.
class VolatileStore {
public:
    VolatileStore() = default;

    // Upserts; ttl_seconds must lie in [1, kMaxTtlSeconds].
    void put(const std::string& user_key, const Embedding& embedding, long long ttl_seconds);

    // Absent when missing or expired. Expired entries are erased.
    std::optional<Embedding> get(const std::string& user_key);

    bool contains(const std::string& user_key);

    // true iff an entry (expired or not) was removed.
    bool erase(const std::string& user_key);

    // Removes every expired entry and returns how many were dropped.
    size_t purge_expired();

    // Physical count, including expired entries not yet purged.
    size_t size() const;

private:
    struct Entry {
        Embedding embedding;
        int64_t created_at;
        int64_t expires_at;
    };

    // Guards entries_ only; never held across anything but map access.
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
};

}

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include "embedding_codec.hpp"

namespace voicecache {

// Why a backend call failed. Only the manager's tier selection looks at this.
enum class BackendError {
    None,
    Unreachable,  // connection refused, closed, I/O error
    Timeout,      // call exceeded the configured bound
    Corrupt,      // stored bytes did not decode; the entry has been removed
    Rejected      // the backend refused the request (bad input, server error reply)
};

std::string backend_error_name(BackendError error);

// A value or a typed failure, returned across the adapter boundary instead of an exception.
template <typename T>
struct BackendResult {
    T value{};
    BackendError error = BackendError::None;

    bool ok() const { return error == BackendError::None; }

    // Unreachable and Timeout mean the backend itself is in trouble, not the entry.
    bool connectivity_failure() const {
        return error == BackendError::Unreachable || error == BackendError::Timeout;
    }

    static BackendResult success(T v) { return BackendResult{std::move(v), BackendError::None}; }
    static BackendResult failure(BackendError e) { return BackendResult{T{}, e}; }
};

// Milliseconds since the Unix epoch. created_at / expires_at use this scale.
inline int64_t now_epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// An entry is logically absent once the current time passes expires_at.
inline bool is_expired(int64_t expires_at_ms, int64_t now_ms) {
    return now_ms > expires_at_ms;
}

// Upper bound for any TTL (100 years). Keeps created_at + ttl * 1000 far from int64 overflow.
constexpr long long kMaxTtlSeconds = 100LL * 365 * 24 * 3600;

// ttl_seconds must lie in [1, kMaxTtlSeconds].
inline int64_t expiry_from(int64_t created_at_ms, long long ttl_seconds) {
    return created_at_ms + static_cast<int64_t>(ttl_seconds) * 1000;
}

inline bool ttl_in_range(long long ttl_seconds) {
    return ttl_seconds > 0 && ttl_seconds <= kMaxTtlSeconds;
}

// Abstract interface for a durable embedding store.
// One record per user key; writes replace, never append. Implementations never
// throw: every library error is mapped to a BackendError at this boundary.
class CacheBackend {
public:
    virtual ~CacheBackend() = default;

    // Backend label reported by get_cache_info ("redis", "sqlite").
    virtual std::string type_name() const = 0;

    /**
     * Establishes connectivity and creates any index or schema the backend needs.
     * @return true if the backend is usable. Logs and returns false otherwise.
     */
    virtual bool connect() = 0;

    // Last-known connectivity state. Does not touch the network.
    virtual bool is_healthy() const = 0;

    /**
     * Serializes and upserts the embedding for a user.
     * @param ttl_seconds Must be positive; the entry expires ttl_seconds after the write.
     */
    virtual BackendResult<bool> set(const std::string& user_key, const Embedding& embedding,
                                    long long ttl_seconds) = 0;

    // Absent (not an error) when missing or expired. Expired entries are deleted.
    virtual BackendResult<std::optional<Embedding>> get(const std::string& user_key) = 0;

    // true iff an entry existed and was removed.
    virtual BackendResult<bool> remove(const std::string& user_key) = 0;

    // true iff present and not expired.
    virtual BackendResult<bool> exists(const std::string& user_key) = 0;

    // Eagerly deletes expired entries; backends with native expiry return 0.
    virtual BackendResult<size_t> sweep_expired() = 0;
};

}

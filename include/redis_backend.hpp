#pragma once

#include <string>
#include <memory>
#include <atomic>
#include <sw/redis++/redis++.h>

#include "cache_backend.hpp"
#include "cache_config.hpp"
#include "embedding_codec.hpp"

namespace voicecache {

// Backend A: Redis.
// Each user is a hash <prefix><user_key> {payload, created_at, expires_at} with a
// native EXPIRE, so Redis purges expired entries on its own. expires_at is still
// checked on read so an entry is never served past its TTL.
class RedisBackend : public CacheBackend {
public:
    explicit RedisBackend(const CacheConfig& config);
    ~RedisBackend() override = default;

    std::string type_name() const override { return "redis"; }

    bool connect() override;
    bool is_healthy() const override { return connected_; }

    BackendResult<bool> set(const std::string& user_key, const Embedding& embedding,
                            long long ttl_seconds) override;
    BackendResult<std::optional<Embedding>> get(const std::string& user_key) override;
    BackendResult<bool> remove(const std::string& user_key) override;
    BackendResult<bool> exists(const std::string& user_key) override;

    // Native TTL does the work; always 0.
    BackendResult<size_t> sweep_expired() override;

private:
    sw::redis::ConnectionOptions connection_options_;
    sw::redis::ConnectionPoolOptions pool_options_;
    std::string key_prefix_;
    EmbeddingCodec codec_;

    std::unique_ptr<sw::redis::Redis> redis_;
    std::atomic<bool> connected_{false};

    std::string record_key(const std::string& user_key) const { return key_prefix_ + user_key; }

    // Deletes an expired or undecodable record only while `field` still holds the value
    // that was read, so a write landing after the read survives. Logs either outcome.
    void purge_if(const std::string& user_key, const std::string& field, const std::string& expected,
                  const std::string& reason);

    // Maps a redis++ exception to a BackendError and drops the health flag on connectivity errors.
    BackendError on_redis_error(const char* op, const std::string& user_key, const sw::redis::Error& e);
};

}

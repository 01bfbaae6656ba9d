#include "redis_backend.hpp"
#include "cache_logger.hpp"

#include <chrono>
#include <iterator>
#include <unordered_map>
#include <utility>
#include <vector>

namespace voicecache {

namespace {

constexpr const char* kPayloadField = "payload";
constexpr const char* kCreatedField = "created_at";
constexpr const char* kExpiresField = "expires_at";

// Compare-and-delete: DEL only if the hash field still has the value the caller saw.
constexpr const char* kPurgeIfScript =
    "if redis.call('HGET', KEYS[1], ARGV[1]) == ARGV[2] then "
    "return redis.call('DEL', KEYS[1]) end "
    "return 0";

bool parse_timestamp(const std::string& text, int64_t& out) {
    try {
        size_t consumed = 0;
        out = std::stoll(text, &consumed);
        return consumed == text.size();
    } catch (const std::exception&) {
        return false;
    }
}

}

RedisBackend::RedisBackend(const CacheConfig& config)
    : key_prefix_(config.redis_key_prefix)
    , codec_(config.embedding_dim) {
    connection_options_.host = config.redis_host;
    connection_options_.port = config.redis_port;
    connection_options_.db = config.redis_db;
    if (!config.redis_password.empty()) {
        connection_options_.password = config.redis_password;
    }
    if (!config.redis_username.empty()) {
        connection_options_.user = config.redis_username;
    }
    // Every call is bounded; a stuck server surfaces as TimeoutError.
    connection_options_.connect_timeout = std::chrono::milliseconds(config.redis_timeout_ms);
    connection_options_.socket_timeout = std::chrono::milliseconds(config.redis_timeout_ms);

    pool_options_.size = config.redis_pool_size;
    pool_options_.wait_timeout = std::chrono::milliseconds(config.redis_timeout_ms);
}

bool RedisBackend::connect() {
    try {
        // The client is created once and kept; its pool reconnects by itself, so a
        // re-probe only needs another PING. redis++ connects lazily, PING forces a round trip.
        if (!redis_) {
            redis_ = std::make_unique<sw::redis::Redis>(connection_options_, pool_options_);
        }
        redis_->ping();
        connected_ = true;

        CacheLogger::log(CacheLogger::Level::INFO, CacheLogger::EventType::BACKEND_CONNECTED, "-",
                         "Redis connected: " + connection_options_.host + ":" + std::to_string(connection_options_.port));
        return true;
    } catch (const sw::redis::Error& e) {
        CacheLogger::log(CacheLogger::Level::WARNING, CacheLogger::EventType::BACKEND_UNREACHABLE, "-",
                         std::string("Redis connection failed: ") + e.what());
    } catch (const std::exception& e) {
        CacheLogger::log(CacheLogger::Level::ERROR, CacheLogger::EventType::BACKEND_UNREACHABLE, "-",
                         std::string("Redis client setup failed: ") + e.what());
    }
    connected_ = false;
    return false;
}

BackendError RedisBackend::on_redis_error(const char* op, const std::string& user_key, const sw::redis::Error& e) {
    BackendError error = BackendError::Unreachable;
    if (dynamic_cast<const sw::redis::TimeoutError*>(&e) != nullptr) {
        error = BackendError::Timeout;
    } else if (dynamic_cast<const sw::redis::ReplyError*>(&e) != nullptr) {
        // The server answered; it just refused this command (e.g. WRONGTYPE).
        error = BackendError::Rejected;
    }

    if (error != BackendError::Rejected) {
        connected_ = false;
    }

    CacheLogger::log(CacheLogger::Level::WARNING,
                     error == BackendError::Rejected ? CacheLogger::EventType::INVALID_INPUT
                                                     : CacheLogger::EventType::BACKEND_UNREACHABLE,
                     user_key,
                     std::string("Redis ") + op + " failed (" + backend_error_name(error) + "): " + e.what());
    return error;
}

// Replaces the whole record in one MULTI/EXEC so a reader never sees a payload
// without its timestamps or a record without its EXPIRE.
BackendResult<bool> RedisBackend::set(const std::string& user_key, const Embedding& embedding,
                                      long long ttl_seconds) {
    if (!connected_ || !redis_) return BackendResult<bool>::failure(BackendError::Unreachable);
    if (!ttl_in_range(ttl_seconds)) return BackendResult<bool>::failure(BackendError::Rejected);

    std::string payload;
    try {
        payload = codec_.encode(embedding);
    } catch (const std::invalid_argument& e) {
        CacheLogger::log(CacheLogger::Level::WARNING, CacheLogger::EventType::INVALID_INPUT, user_key,
                         std::string("Redis set rejected: ") + e.what());
        return BackendResult<bool>::failure(BackendError::Rejected);
    }

    int64_t created_at = now_epoch_ms();
    int64_t expires_at = expiry_from(created_at, ttl_seconds);
    std::vector<std::pair<std::string, std::string>> fields = {
        {kPayloadField, std::move(payload)},
        {kCreatedField, std::to_string(created_at)},
        {kExpiresField, std::to_string(expires_at)}
    };

    try {
        std::string key = record_key(user_key);
        auto tx = redis_->transaction(true, false);
        tx.del(key)
          .hmset(key, fields.begin(), fields.end())
          .expire(key, std::chrono::seconds(ttl_seconds))
          .exec();
        return BackendResult<bool>::success(true);
    } catch (const sw::redis::Error& e) {
        return BackendResult<bool>::failure(on_redis_error("set", user_key, e));
    }
}

BackendResult<std::optional<Embedding>> RedisBackend::get(const std::string& user_key) {
    using Result = BackendResult<std::optional<Embedding>>;
    if (!connected_ || !redis_) return Result::failure(BackendError::Unreachable);

    std::string key = record_key(user_key);
    std::unordered_map<std::string, std::string> record;
    try {
        redis_->hgetall(key, std::inserter(record, record.begin()));
    } catch (const sw::redis::Error& e) {
        return Result::failure(on_redis_error("get", user_key, e));
    }

    if (record.empty()) {
        return Result::success(std::nullopt);
    }

    int64_t expires_at = 0;
    auto exp_it = record.find(kExpiresField);
    auto payload_it = record.find(kPayloadField);
    bool well_formed = exp_it != record.end() && payload_it != record.end() &&
                       parse_timestamp(exp_it->second, expires_at);

    if (well_formed && is_expired(expires_at, now_epoch_ms())) {
        purge_if(user_key, kExpiresField, exp_it->second, "expired on read");
        return Result::success(std::nullopt);
    }

    try {
        if (!well_formed) {
            throw CorruptPayload("record is missing payload or expires_at");
        }
        return Result::success(codec_.decode(payload_it->second));
    } catch (const CorruptPayload& e) {
        CacheLogger::log(CacheLogger::Level::ERROR, CacheLogger::EventType::CORRUPT_PAYLOAD, user_key,
                         std::string("Redis entry undecodable: ") + e.what());
        // Key the delete on whichever field the damaged record still has.
        auto match = payload_it != record.end() ? payload_it
                   : exp_it != record.end() ? exp_it
                   : record.begin();
        purge_if(user_key, match->first, match->second, "corrupt payload");
        return Result::failure(BackendError::Corrupt);
    }
}

BackendResult<bool> RedisBackend::remove(const std::string& user_key) {
    if (!connected_ || !redis_) return BackendResult<bool>::failure(BackendError::Unreachable);
    try {
        return BackendResult<bool>::success(redis_->del(record_key(user_key)) > 0);
    } catch (const sw::redis::Error& e) {
        return BackendResult<bool>::failure(on_redis_error("delete", user_key, e));
    }
}

BackendResult<bool> RedisBackend::exists(const std::string& user_key) {
    if (!connected_ || !redis_) return BackendResult<bool>::failure(BackendError::Unreachable);

    sw::redis::OptionalString expires_text;
    try {
        expires_text = redis_->hget(record_key(user_key), kExpiresField);
    } catch (const sw::redis::Error& e) {
        return BackendResult<bool>::failure(on_redis_error("exists", user_key, e));
    }

    if (!expires_text) {
        return BackendResult<bool>::success(false);
    }

    int64_t expires_at = 0;
    if (parse_timestamp(*expires_text, expires_at) && is_expired(expires_at, now_epoch_ms())) {
        purge_if(user_key, kExpiresField, *expires_text, "expired on exists");
        return BackendResult<bool>::success(false);
    }
    return BackendResult<bool>::success(true);
}

void RedisBackend::purge_if(const std::string& user_key, const std::string& field,
                            const std::string& expected, const std::string& reason) {
    if (!connected_ || !redis_) return;
    try {
        auto removed = redis_->eval<long long>(kPurgeIfScript, {record_key(user_key)}, {field, expected});
        CacheLogger::log(CacheLogger::Level::DEBUG, CacheLogger::EventType::EXPIRED_PURGED, user_key,
                         removed > 0 ? "Redis entry purged: " + reason
                                     : "Redis purge skipped, entry rewritten: " + reason);
    } catch (const sw::redis::Error& e) {
        on_redis_error("purge", user_key, e);
    }
}

BackendResult<size_t> RedisBackend::sweep_expired() {
    if (!connected_ || !redis_) return BackendResult<size_t>::failure(BackendError::Unreachable);
    return BackendResult<size_t>::success(0);
}

}

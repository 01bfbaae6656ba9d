#pragma once

#include <string>
#include <boost/json.hpp>

#include "embedding_codec.hpp"
#include "tiered_cache_manager.hpp"

namespace json = boost::json;

namespace voicecache {

struct CacheVoiceResult {
    bool success = false;
    std::string user_id;
    std::string cache_backend;

    json::object to_json() const;
};

struct CacheStatusResult {
    std::string user_id;
    bool cached = false;
    CacheInfo info;

    json::object to_json() const;
};

struct ClearResult {
    std::string user_id;
    bool deleted = false;

    json::object to_json() const;
};

struct CleanupResult {
    size_t cleaned_entries = 0;

    json::object to_json() const;
};

json::object cache_info_to_json(const CacheInfo& info);

// The operations audio-generation workflows call. Computing the embedding from
// a voice sample happens before cache_voice; this layer only stores and serves it.
class VoiceCacheService {
public:
    explicit VoiceCacheService(TieredCacheManager& manager) : manager_(manager) {}

    // Never fails because of backend trouble; success is false only for rejected input.
    CacheVoiceResult cache_voice(const std::string& user_id, const Embedding& embedding);
    CacheVoiceResult cache_voice(const std::string& user_id, const Embedding& embedding, long long ttl_seconds);

    CacheStatusResult check_status(const std::string& user_id);

    ClearResult clear(const std::string& user_id);

    CleanupResult cleanup();

    // Throws EmbeddingNotFound.
    Embedding fetch_or_fail(const std::string& user_id);

private:
    TieredCacheManager& manager_;
};

}

#include "voice_cache_service.hpp"

namespace voicecache {

json::object cache_info_to_json(const CacheInfo& info) {
    json::object obj;
    obj["configured_backend"] = info.configured_backend;
    obj["active_backend"] = info.active_backend;
    obj["active_tier"] = cache_tier_name(info.active_tier);
    obj["status"] = info.status;
    obj["fallback_entries"] = static_cast<int64_t>(info.volatile_entries);
    return obj;
}

json::object CacheVoiceResult::to_json() const {
    json::object obj;
    obj["success"] = success;
    obj["status"] = success ? "success" : "rejected";
    obj["message"] = success ? "Speaker embedding cached for user " + user_id
                             : "Speaker embedding rejected for user " + user_id;
    obj["cache_backend"] = cache_backend;
    return obj;
}

json::object CacheStatusResult::to_json() const {
    json::object obj = cache_info_to_json(info);
    obj["user_id"] = user_id;
    obj["cached"] = cached;
    obj["message"] = cached ? "Speaker embedding found"
                            : "Speaker embedding not found. Call cache_voice first.";
    return obj;
}

json::object ClearResult::to_json() const {
    json::object obj;
    obj["status"] = deleted ? "success" : "not_found";
    obj["deleted"] = deleted;
    obj["message"] = std::string("Speaker embedding ") + (deleted ? "cleared" : "not found") + " for user " + user_id;
    return obj;
}

json::object CleanupResult::to_json() const {
    json::object obj;
    obj["status"] = "success";
    obj["cleaned_entries"] = static_cast<int64_t>(cleaned_entries);
    obj["message"] = "Cleaned up " + std::to_string(cleaned_entries) + " expired entries";
    return obj;
}

CacheVoiceResult VoiceCacheService::cache_voice(const std::string& user_id, const Embedding& embedding) {
    CacheVoiceResult result;
    result.user_id = user_id;
    result.success = manager_.set_embedding(user_id, embedding);
    result.cache_backend = manager_.get_cache_info().active_backend;
    return result;
}

CacheVoiceResult VoiceCacheService::cache_voice(const std::string& user_id, const Embedding& embedding,
                                                long long ttl_seconds) {
    CacheVoiceResult result;
    result.user_id = user_id;
    result.success = manager_.set_embedding(user_id, embedding, ttl_seconds);
    result.cache_backend = manager_.get_cache_info().active_backend;
    return result;
}

CacheStatusResult VoiceCacheService::check_status(const std::string& user_id) {
    CacheStatusResult result;
    result.user_id = user_id;
    result.cached = manager_.exists_embedding(user_id);
    result.info = manager_.get_cache_info();
    return result;
}

ClearResult VoiceCacheService::clear(const std::string& user_id) {
    ClearResult result;
    result.user_id = user_id;
    result.deleted = manager_.delete_embedding(user_id);
    return result;
}

CleanupResult VoiceCacheService::cleanup() {
    CleanupResult result;
    result.cleaned_entries = manager_.cleanup_expired();
    return result;
}

Embedding VoiceCacheService::fetch_or_fail(const std::string& user_id) {
    return manager_.get_cached_embedding_or_fail(user_id);
}

}

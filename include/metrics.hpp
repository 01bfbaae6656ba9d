#pragma once

#include <string>
#include <map>
#include <mutex>
#include <sstream>

namespace voicecache {

// Metric names recorded by the cache.
namespace metric {
    inline constexpr const char* kHits = "voicecache_hits_total";
    inline constexpr const char* kMisses = "voicecache_misses_total";
    inline constexpr const char* kFallbackWrites = "voicecache_fallback_writes_total";
    inline constexpr const char* kDemotions = "voicecache_demotions_total";
    inline constexpr const char* kPromotions = "voicecache_promotions_total";
    inline constexpr const char* kCorruptPayloads = "voicecache_corrupt_payloads_total";
    inline constexpr const char* kExpiredPurged = "voicecache_expired_purged_total";
    inline constexpr const char* kVolatileEntries = "voicecache_volatile_entries";
    inline constexpr const char* kActiveTier = "voicecache_active_tier";
}

// Process-wide counters and gauges, exported in Prometheus text format.
class MetricsRegistry {
public:
    static MetricsRegistry& instance() {
        static MetricsRegistry instance;
        return instance;
    }

    // Counters only increase.
    void increment_counter(const std::string& name, double value = 1.0) {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_[name] += value;
    }

    double get_counter(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counters_.find(name);
        return (it != counters_.end()) ? it->second : 0.0;
    }

    void set_gauge(const std::string& name, double value) {
        std::lock_guard<std::mutex> lock(mutex_);
        gauges_[name] = value;
    }

    double get_gauge(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = gauges_.find(name);
        return (it != gauges_.end()) ? it->second : 0.0;
    }

    // Drops every recorded value.
    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_.clear();
        gauges_.clear();
    }

    /**
     * Serializes all recorded metrics into Prometheus exposition format (text version 0.0.4).
     */
    std::string collect_prometheus() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::stringstream ss;

        for (const auto& [name, val] : counters_) {
            ss << "# TYPE " << name << " counter\n";
            ss << name << " " << val << "\n";
        }

        for (const auto& [name, val] : gauges_) {
            ss << "# TYPE " << name << " gauge\n";
            ss << name << " " << val << "\n";
        }

        return ss.str();
    }

private:
    MetricsRegistry() = default;

    std::map<std::string, double> counters_;
    std::map<std::string, double> gauges_;
    std::mutex mutex_;
};

}

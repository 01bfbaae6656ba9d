#pragma once

#include <string>
#include <iostream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <mutex>
#include <atomic>
#include <cctype>
#include <openssl/sha.h>
#include <openssl/rand.h>

namespace voicecache {

// Logs cache events with blinded user keys (salted hash), never the key itself.
class CacheLogger {
public:
    enum class Level {
        DEBUG,
        INFO,
        WARNING,
        ERROR,
        CRITICAL
    };

    enum class EventType {
        BACKEND_CONNECTED,
        BACKEND_UNREACHABLE,
        TIER_DEMOTED,
        TIER_PROMOTED,
        CORRUPT_PAYLOAD,
        EXPIRED_PURGED,
        FALLBACK_WRITE,
        INVALID_INPUT,
        MAINTENANCE
    };

    /**
     * Records a cache event.
     * @param level Severity level of the event.
     * @param event The specific type of cache event.
     * @param user_key The affected user key (blinded before logging). Use "-" for process-wide events.
     * @param message Optional descriptive message (will be sanitized).
     */
    static void log(Level level, EventType event, const std::string& user_key,
                   const std::string& message = "") {
        if (static_cast<int>(level) < min_level_.load()) {
            return;
        }

        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);

        struct tm gmt;
        gmtime_r(&time_t, &gmt);

        std::stringstream ss;
        ss << "[" << std::put_time(&gmt, "%Y-%m-%d %H:%M:%S") << " UTC] "
           << "[" << level_to_string(level) << "] "
           << "[" << event_to_string(event) << "] ";

        ss << "user=" << blind_key(user_key);

        if (!message.empty()) {
            ss << " msg=\"" << sanitize_log_message(message) << "\"";
        }

        std::lock_guard<std::mutex> lock(output_mutex());
        if (level == Level::ERROR || level == Level::CRITICAL) {
            std::cerr << ss.str() << "\n";
        } else {
            std::cout << ss.str() << "\n";
        }
    }

    // Events below this level are dropped. Tests raise it to keep output quiet.
    static void set_min_level(Level level) {
        min_level_.store(static_cast<int>(level));
    }

    // Salted, truncated SHA-256 of a user key. "-" and "" pass through unchanged.
    // The salt is random and rotates every 6 hours, so log lines cannot be joined
    // back to users across rotations.
    static std::string blind_key(const std::string& user_key) {
        if (user_key.empty() || user_key == "-") {
            return "-";
        }

        std::string salt = current_salt();
        std::string data = user_key + salt;
        unsigned char hash[SHA256_DIGEST_LENGTH];
        SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);

        std::stringstream hs;
        for (int i = 0; i < 6; i++) hs << std::hex << std::setw(2) << std::setfill('0') << (int)hash[i];
        return "anon_" + hs.str();
    }

private:
    static inline std::atomic<int> min_level_{static_cast<int>(Level::INFO)};

    static std::mutex& output_mutex() {
        static std::mutex m;
        return m;
    }

    static std::string current_salt() {
        static std::mutex salt_mutex;
        static std::string log_salt;
        static std::chrono::steady_clock::time_point last_rotation;

        std::lock_guard<std::mutex> lock(salt_mutex);
        auto now_steady = std::chrono::steady_clock::now();
        if (log_salt.empty() || std::chrono::duration_cast<std::chrono::hours>(now_steady - last_rotation).count() >= 6) {
            unsigned char b[32];
            if (RAND_bytes(b, 32) != 1) {
                std::cerr << "[CRITICAL] CSPRNG failure in CacheLogger. Terminating instance.\n";
                std::terminate();
            }
            std::stringstream salt_ss;
            for (int i = 0; i < 32; i++) salt_ss << std::hex << std::setw(2) << std::setfill('0') << (int)b[i];
            log_salt = salt_ss.str();
            last_rotation = now_steady;
        }
        return log_salt;
    }

    static std::string level_to_string(Level level) {
        switch (level) {
            case Level::DEBUG: return "DEBUG";
            case Level::INFO: return "INFO";
            case Level::WARNING: return "WARN";
            case Level::ERROR: return "ERROR";
            case Level::CRITICAL: return "CRIT";
            default: return "UNKNOWN";
        }
    }

    static std::string event_to_string(EventType event) {
        switch (event) {
            case EventType::BACKEND_CONNECTED: return "BACKEND_CONNECTED";
            case EventType::BACKEND_UNREACHABLE: return "BACKEND_UNREACHABLE";
            case EventType::TIER_DEMOTED: return "TIER_DEMOTED";
            case EventType::TIER_PROMOTED: return "TIER_PROMOTED";
            case EventType::CORRUPT_PAYLOAD: return "CORRUPT_PAYLOAD";
            case EventType::EXPIRED_PURGED: return "EXPIRED_PURGED";
            case EventType::FALLBACK_WRITE: return "FALLBACK_WRITE";
            case EventType::INVALID_INPUT: return "INVALID_INPUT";
            case EventType::MAINTENANCE: return "MAINTENANCE";
            default: return "UNKNOWN_EVENT";
        }
    }

public:
    // Replaces quotes, backslashes and line breaks with spaces and drops other non-printables.
    static std::string sanitize_log_message(const std::string& msg) {
        std::string result;
        result.reserve(msg.size());
        for (char c : msg) {
            if (c == '"' || c == '\\' || c == '\n' || c == '\r') {
                result += ' ';
            } else if (std::isprint(static_cast<unsigned char>(c))) {
                result += c;
            }
        }
        return result;
    }
};

}

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/json.hpp>

#include <chrono>
#include <csignal>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "cache_config.hpp"
#include "cache_logger.hpp"
#include "maintenance_loop.hpp"
#include "metrics.hpp"
#include "tiered_cache_manager.hpp"
#include "voice_cache_service.hpp"

namespace net = boost::asio;
namespace json = boost::json;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitNotFound = 2;

void print_usage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " <command> [args]\n"
              << "Commands:\n"
              << "  info                         Show configured and active backend\n"
              << "  put <user> <v1,v2,...> [ttl] Cache a speaker embedding\n"
              << "  get <user>                   Fetch an embedding, exit 2 if missing\n"
              << "  status <user>                Report whether an embedding is cached\n"
              << "  clear <user>                 Remove a cached embedding\n"
              << "  cleanup                      Purge expired entries\n"
              << "  metrics                      Print counters in Prometheus format\n"
              << "  serve                        Run periodic sweep and re-probe until SIGINT/SIGTERM\n"
              << "Configuration is read from VOICECACHE_* environment variables.\n";
}

int print_error(const std::string& message) {
    json::object obj;
    obj["status"] = "error";
    obj["message"] = message;
    std::cout << json::serialize(obj) << "\n";
    return kExitError;
}

// "0.1,0.2,-3" -> {0.1f, 0.2f, -3.0f}. Throws std::invalid_argument on a bad element.
voicecache::Embedding parse_embedding(const std::string& text) {
    voicecache::Embedding embedding;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (item.empty()) {
            throw std::invalid_argument("empty element in embedding list");
        }
        size_t consumed = 0;
        float value = std::stof(item, &consumed);
        if (consumed != item.size()) {
            throw std::invalid_argument("bad embedding element: " + item);
        }
        embedding.push_back(value);
    }
    if (embedding.empty()) {
        throw std::invalid_argument("embedding list is empty");
    }
    return embedding;
}

int run_serve(voicecache::TieredCacheManager& manager, const voicecache::CacheConfig& config) {
    using voicecache::CacheLogger;

    net::io_context ioc;
    voicecache::MaintenanceLoop loop(ioc, manager,
                                     std::chrono::seconds(config.sweep_interval_sec),
                                     std::chrono::seconds(config.reprobe_interval_sec));
    loop.start();

    net::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&loop](const boost::system::error_code&, int) {
        CacheLogger::log(CacheLogger::Level::INFO, CacheLogger::EventType::MAINTENANCE, "-",
                         "Initiating graceful shutdown");
        loop.stop();
    });

    ioc.run();

    CacheLogger::log(CacheLogger::Level::INFO, CacheLogger::EventType::MAINTENANCE, "-",
                     "Stopped after " + std::to_string(loop.sweeps_run()) + " sweeps");
    return kExitOk;
}

}

int main(int argc, char* argv[]) {
    using voicecache::CacheLogger;

    if (argc < 2) {
        print_usage(argv[0]);
        return kExitError;
    }

    std::string command = argv[1];
    if (command == "--help" || command == "-h" || command == "help") {
        print_usage(argv[0]);
        return kExitOk;
    }

    std::vector<std::string> args(argv + 2, argv + argc);
    auto need_args = [&](size_t n) { return args.size() >= n; };

    try {
        voicecache::CacheConfig config = voicecache::CacheConfig::from_env();
        std::string problem = config.validate();
        if (!problem.empty()) {
            return print_error("Invalid configuration: " + problem);
        }

        // Keep stdout parseable for the one-shot commands.
        if (command != "serve") {
            CacheLogger::set_min_level(CacheLogger::Level::ERROR);
        }

        if (command == "metrics") {
            std::cout << voicecache::MetricsRegistry::instance().collect_prometheus();
            return kExitOk;
        }

        voicecache::TieredCacheManager manager(config);
        voicecache::VoiceCacheService service(manager);

        if (command == "info") {
            std::cout << json::serialize(voicecache::cache_info_to_json(manager.get_cache_info())) << "\n";
            return kExitOk;
        }

        if (command == "put") {
            if (!need_args(2)) {
                return print_error("put requires <user> <v1,v2,...> [ttl]");
            }
            voicecache::Embedding embedding = parse_embedding(args[1]);

            voicecache::CacheVoiceResult result = args.size() >= 3
                ? service.cache_voice(args[0], embedding, voicecache::parse_integer("ttl", args[2]))
                : service.cache_voice(args[0], embedding);
            std::cout << json::serialize(result.to_json()) << "\n";
            return result.success ? kExitOk : kExitError;
        }

        if (command == "get") {
            if (!need_args(1)) {
                return print_error("get requires <user>");
            }
            try {
                voicecache::Embedding embedding = service.fetch_or_fail(args[0]);
                json::array values;
                for (float v : embedding) {
                    values.emplace_back(static_cast<double>(v));
                }
                json::object obj;
                obj["user_id"] = args[0];
                obj["dimension"] = static_cast<int64_t>(embedding.size());
                obj["embedding"] = std::move(values);
                std::cout << json::serialize(obj) << "\n";
                return kExitOk;
            } catch (const voicecache::EmbeddingNotFound& e) {
                json::object obj;
                obj["status"] = "not_found";
                obj["user_id"] = e.user_key();
                obj["message"] = e.what();
                obj["remediation"] = e.remediation();
                std::cout << json::serialize(obj) << "\n";
                return kExitNotFound;
            }
        }

        if (command == "status") {
            if (!need_args(1)) {
                return print_error("status requires <user>");
            }
            std::cout << json::serialize(service.check_status(args[0]).to_json()) << "\n";
            return kExitOk;
        }

        if (command == "clear") {
            if (!need_args(1)) {
                return print_error("clear requires <user>");
            }
            std::cout << json::serialize(service.clear(args[0]).to_json()) << "\n";
            return kExitOk;
        }

        if (command == "cleanup") {
            std::cout << json::serialize(service.cleanup().to_json()) << "\n";
            return kExitOk;
        }

        if (command == "serve") {
            return run_serve(manager, config);
        }

        print_usage(argv[0]);
        return kExitError;

    } catch (const std::exception& e) {
        return print_error(std::string("Fatal error: ") + e.what());
    }
}

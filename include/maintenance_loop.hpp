#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/system/error_code.hpp>
#include <atomic>
#include <chrono>

#include "tiered_cache_manager.hpp"

namespace net = boost::asio;

namespace voicecache {

// Periodic background work for a long-running process: the expired-entry sweep
// and the health re-probe that can promote a demoted tier back.
// All work runs on the io_context's threads; the manager itself is thread-safe.
class MaintenanceLoop {
public:
    MaintenanceLoop(net::io_context& ioc, TieredCacheManager& manager,
                    std::chrono::seconds sweep_interval, std::chrono::seconds reprobe_interval);

    // A zero interval leaves that timer unarmed.
    void start();

    // Cancels both timers; pending handlers complete with operation_aborted.
    void stop();

    size_t sweeps_run() const { return sweeps_run_; }
    size_t probes_run() const { return probes_run_; }

private:
    TieredCacheManager& manager_;
    net::steady_timer sweep_timer_;
    net::steady_timer reprobe_timer_;
    std::chrono::seconds sweep_interval_;
    std::chrono::seconds reprobe_interval_;
    std::atomic<bool> running_{false};
    std::atomic<size_t> sweeps_run_{0};
    std::atomic<size_t> probes_run_{0};

    void schedule_sweep();
    void schedule_reprobe();
    void on_sweep(const boost::system::error_code& ec);
    void on_reprobe(const boost::system::error_code& ec);
};

}

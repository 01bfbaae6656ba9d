#include "maintenance_loop.hpp"
#include "cache_logger.hpp"

#include <boost/asio/error.hpp>

namespace voicecache {

MaintenanceLoop::MaintenanceLoop(net::io_context& ioc, TieredCacheManager& manager,
                                 std::chrono::seconds sweep_interval, std::chrono::seconds reprobe_interval)
    : manager_(manager)
    , sweep_timer_(ioc)
    , reprobe_timer_(ioc)
    , sweep_interval_(sweep_interval)
    , reprobe_interval_(reprobe_interval) {}

void MaintenanceLoop::start() {
    running_ = true;
    if (sweep_interval_.count() > 0) {
        schedule_sweep();
    }
    if (reprobe_interval_.count() > 0) {
        schedule_reprobe();
    }
    CacheLogger::log(CacheLogger::Level::INFO, CacheLogger::EventType::MAINTENANCE, "-",
                     "Maintenance started: sweep every " + std::to_string(sweep_interval_.count()) +
                     "s, reprobe every " + std::to_string(reprobe_interval_.count()) + "s");
}

void MaintenanceLoop::stop() {
    running_ = false;
    sweep_timer_.cancel();
    reprobe_timer_.cancel();
}

void MaintenanceLoop::schedule_sweep() {
    sweep_timer_.expires_after(sweep_interval_);
    sweep_timer_.async_wait([this](const boost::system::error_code& ec) { on_sweep(ec); });
}

void MaintenanceLoop::schedule_reprobe() {
    reprobe_timer_.expires_after(reprobe_interval_);
    reprobe_timer_.async_wait([this](const boost::system::error_code& ec) { on_reprobe(ec); });
}

void MaintenanceLoop::on_sweep(const boost::system::error_code& ec) {
    if (ec == net::error::operation_aborted || !running_) {
        return;
    }
    if (ec) {
        CacheLogger::log(CacheLogger::Level::ERROR, CacheLogger::EventType::MAINTENANCE, "-",
                         "Sweep timer error: " + ec.message());
        return;
    }

    manager_.cleanup_expired();
    ++sweeps_run_;
    schedule_sweep();
}

void MaintenanceLoop::on_reprobe(const boost::system::error_code& ec) {
    if (ec == net::error::operation_aborted || !running_) {
        return;
    }
    if (ec) {
        CacheLogger::log(CacheLogger::Level::ERROR, CacheLogger::EventType::MAINTENANCE, "-",
                         "Reprobe timer error: " + ec.message());
        return;
    }

    // Nothing above the primary; skip the probe entirely.
    if (manager_.active_tier() != CacheTier::Primary) {
        manager_.reprobe();
    }
    ++probes_run_;
    schedule_reprobe();
}

}

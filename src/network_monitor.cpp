#include "network_monitor.hpp"
#include <chrono>
#include <cpr/cpr.h>
#include <spdlog/spdlog.h>

namespace context_engine {

std::string to_string(NetworkState state) {
    switch (state) {
        case NetworkState::Online: return "online";
        case NetworkState::Offline: return "offline";
        case NetworkState::Unreliable: return "unreliable";
        case NetworkState::Unknown: return "unknown";
    }
    return "unknown";
}

NetworkMonitor::NetworkMonitor(NetworkConfig config) : config_(std::move(config)) {}

NetworkMonitor::~NetworkMonitor() {
    stop();
}

void NetworkMonitor::start() {
    if (monitor_thread_.joinable()) return;
    stop_thread_ = false;
    monitor_thread_ = std::thread(&NetworkMonitor::poll_routine, this);
    spdlog::info("📡 Network monitor started ({} every {} ms)", config_.probe_url, config_.check_interval_ms);
}

void NetworkMonitor::stop() {
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        stop_thread_ = true;
    }
    wait_cv_.notify_all();
    if (monitor_thread_.joinable()) {
        monitor_thread_.join();
        spdlog::info("📡 Network monitor stopped");
    }
}

bool NetworkMonitor::check_now() {
    auto r = cpr::Head(cpr::Url{config_.probe_url},
                       cpr::Timeout{config_.timeout_ms});
    bool ok = r.error.code == cpr::ErrorCode::OK && r.status_code >= 200 && r.status_code < 300;
    if (!ok) {
        spdlog::debug("Network probe failed: status {} {}", r.status_code, r.error.message);
    }
    record_probe(ok);
    return ok;
}

void NetworkMonitor::record_probe(bool success) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    NetworkState previous = state_.load();

    if (success) {
        consecutive_successes_++;
        consecutive_failures_ = 0;
        if (consecutive_successes_ >= config_.reliability_threshold) {
            state_ = NetworkState::Online;
        }
    } else {
        consecutive_failures_++;
        consecutive_successes_ = 0;
        if (consecutive_failures_ >= config_.unreliable_threshold) {
            state_ = NetworkState::Offline;
        } else if (previous == NetworkState::Online) {
            state_ = NetworkState::Unreliable;
        }
    }

    if (state_.load() != previous) {
        spdlog::info("📡 Network state {} -> {}", to_string(previous), to_string(state_.load()));
    }
}

void NetworkMonitor::poll_routine() {
    while (!stop_thread_) {
        check_now();

        std::unique_lock<std::mutex> lock(wait_mutex_);
        wait_cv_.wait_for(lock, std::chrono::milliseconds(config_.check_interval_ms),
                          [this] { return stop_thread_.load(); });
    }
}

} // namespace context_engine

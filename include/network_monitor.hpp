#pragma once
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include "config.hpp"

namespace context_engine {

enum class NetworkState { Unknown, Online, Offline, Unreliable };

std::string to_string(NetworkState state);

// Oracle consulted before any network-bound call.
class NetworkStatus {
public:
    virtual ~NetworkStatus() = default;
    virtual bool is_online() const = 0;
};

// Fixed answer, settable at runtime. Used offline and in tests.
class StaticNetworkStatus : public NetworkStatus {
public:
    explicit StaticNetworkStatus(bool online = false) : online_(online) {}
    bool is_online() const override { return online_.load(); }
    void set_online(bool online) { online_.store(online); }

private:
    std::atomic<bool> online_;
};

// Polls a connectivity endpoint on a background thread. Consecutive
// successes/failures past the configured thresholds flip the state; a single
// failure while online downgrades to Unreliable.
class NetworkMonitor : public NetworkStatus {
public:
    explicit NetworkMonitor(NetworkConfig config);
    ~NetworkMonitor() override;

    void start();
    void stop();

    bool is_online() const override { return state_.load() == NetworkState::Online; }
    NetworkState state() const { return state_.load(); }

    // Runs one probe synchronously and returns whether it succeeded.
    bool check_now();

    // Feeds one probe outcome into the state machine.
    void record_probe(bool success);

private:
    void poll_routine();

    NetworkConfig config_;
    std::atomic<NetworkState> state_{NetworkState::Unknown};
    int consecutive_successes_ = 0;
    int consecutive_failures_ = 0;
    std::mutex state_mutex_;

    std::thread monitor_thread_;
    std::atomic<bool> stop_thread_{false};
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
};

} // namespace context_engine

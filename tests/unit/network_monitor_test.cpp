#include "network_monitor.hpp"

#include "../test_logger.hpp"

#include <cstdlib>

using context_engine::tests::Require;
using context_engine::NetworkState;

namespace {

context_engine::NetworkConfig thresholds(int reliability, int unreliable) {
    context_engine::NetworkConfig config;
    config.reliability_threshold = reliability;
    config.unreliable_threshold = unreliable;
    config.probe_url = "http://127.0.0.1:9/unused";
    return config;
}

void ScenarioOnlineNeedsConsecutiveSuccesses() {
    context_engine::tests::log("scenario: online after consecutive successes");
    context_engine::NetworkMonitor monitor(thresholds(2, 2));
    Require(monitor.state() == NetworkState::Unknown, "monitor starts unknown");
    Require(!monitor.is_online(), "unknown is not online");

    monitor.record_probe(true);
    Require(monitor.state() == NetworkState::Unknown, "one success is not enough");
    monitor.record_probe(true);
    Require(monitor.state() == NetworkState::Online && monitor.is_online(), "two successes mean online");
}

void ScenarioSingleFailureDegrades() {
    context_engine::tests::log("scenario: single failure degrades to unreliable");
    context_engine::NetworkMonitor monitor(thresholds(2, 2));
    monitor.record_probe(true);
    monitor.record_probe(true);

    monitor.record_probe(false);
    Require(monitor.state() == NetworkState::Unreliable, "one failure while online is unreliable");
    Require(!monitor.is_online(), "unreliable is not online");

    monitor.record_probe(true);
    Require(monitor.state() == NetworkState::Unreliable, "recovery needs the full success streak");
    monitor.record_probe(true);
    Require(monitor.state() == NetworkState::Online, "streak restores online");
}

void ScenarioRepeatedFailuresGoOffline() {
    context_engine::tests::log("scenario: repeated failures go offline");
    context_engine::NetworkMonitor monitor(thresholds(2, 2));
    monitor.record_probe(false);
    Require(monitor.state() == NetworkState::Unknown, "one failure from unknown stays unknown");
    monitor.record_probe(false);
    Require(monitor.state() == NetworkState::Offline, "two failures mean offline");

    monitor.record_probe(true);
    monitor.record_probe(false);
    Require(monitor.state() == NetworkState::Offline, "an interrupted streak does not flip the state");

    context_engine::NetworkMonitor eager(thresholds(1, 1));
    eager.record_probe(true);
    Require(eager.is_online(), "threshold of one flips on the first success");
    eager.record_probe(false);
    Require(eager.state() == NetworkState::Offline, "threshold of one goes straight offline");
}

void ScenarioStaticStatus() {
    context_engine::tests::log("scenario: static status");
    context_engine::StaticNetworkStatus status;
    Require(!status.is_online(), "static status defaults to offline");
    status.set_online(true);
    Require(status.is_online(), "static status follows set_online");
    Require(context_engine::to_string(NetworkState::Unreliable) == "unreliable", "state names");
}

} // namespace

int main() {
    context_engine::tests::init_logging();
    try {
        context_engine::tests::log("network_monitor_test: start");
        ScenarioOnlineNeedsConsecutiveSuccesses();
        ScenarioSingleFailureDegrades();
        ScenarioRepeatedFailuresGoOffline();
        ScenarioStaticStatus();
        context_engine::tests::log("network_monitor_test: finished");
        return EXIT_SUCCESS;
    } catch (const std::exception& ex) {
        context_engine::tests::log_error(ex.what());
        return EXIT_FAILURE;
    }
}

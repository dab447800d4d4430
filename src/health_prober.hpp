#pragma once
#include "registry.hpp"
#include "router.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace llmgw {

struct ProbeResult {
    std::string provider_id;
    HealthStatus status = HealthStatus::Healthy;
    std::chrono::milliseconds latency{0};
    CircuitState state_after = CircuitState::Closed;
};

// Calls health_check() on every enabled provider and feeds the result to
// Router::record_health, once or periodically on a background thread.
class HealthProber {
public:
    HealthProber(ProviderRegistry& registry, Router& router);
    ~HealthProber();

    HealthProber(const HealthProber&) = delete;
    HealthProber& operator=(const HealthProber&) = delete;

    // Probe sequentially on the calling thread.
    std::vector<ProbeResult> probe_once();

    // Start the background loop; probes immediately, then every interval.
    // Returns false if already running.
    bool start(std::chrono::milliseconds interval);

    // Signal the loop to stop and join it.
    void stop();

    bool running() const { return running_.load(); }
    uint64_t rounds() const { return rounds_.load(); }

private:
    void loop(std::chrono::milliseconds interval);

    ProviderRegistry& registry_;
    Router& router_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> rounds_{0};
    std::mutex mutex_;
    std::condition_variable cv_;
    std::thread thread_;
};

} // namespace llmgw

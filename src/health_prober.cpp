#include "health_prober.hpp"
#include <iostream>

namespace llmgw {

HealthProber::HealthProber(ProviderRegistry& registry, Router& router)
    : registry_(registry), router_(router) {}

HealthProber::~HealthProber() {
    stop();
}

std::vector<ProbeResult> HealthProber::probe_once() {
    std::vector<ProbeResult> results;
    for (const auto& provider : registry_.all()) {
        if (!provider->spec.enabled) continue;

        ProbeResult r;
        r.provider_id = provider->id();
        auto start = SteadyClock::now();
        try {
            r.status = provider->adapter->health_check();
        } catch (const std::exception& e) {
            std::cerr << "[health] " << provider->id() << ": health check threw: "
                      << e.what() << '\n';
            r.status = HealthStatus::Unhealthy;
        }
        r.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
            SteadyClock::now() - start);
        r.state_after = router_.record_health(provider, r.status, r.latency);
        results.push_back(std::move(r));
    }
    rounds_.fetch_add(1);
    return results;
}

bool HealthProber::start(std::chrono::milliseconds interval) {
    if (running_.exchange(true)) return false;
    if (thread_.joinable()) thread_.join();
    thread_ = std::thread([this, interval]() { loop(interval); });
    return true;
}

void HealthProber::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_.store(false);
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();
}

void HealthProber::loop(std::chrono::milliseconds interval) {
    while (running_.load()) {
        probe_once();
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, interval, [this] { return !running_.load(); });
    }
}

} // namespace llmgw

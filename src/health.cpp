#include "health.hpp"

namespace llmgw {

namespace {

constexpr uint64_t kStateMask = 0x3;

CircuitState unpack_state(uint64_t word) {
    return static_cast<CircuitState>(word & kStateMask);
}

TimePoint unpack_time(uint64_t word) {
    return TimePoint(std::chrono::duration_cast<SteadyClock::duration>(
        std::chrono::nanoseconds(static_cast<int64_t>(word >> 2))));
}

} // namespace

ProviderHealthState::ProviderHealthState(std::string provider_id,
                                         CircuitBreakerConfig config,
                                         TimePoint now)
    : provider_id_(std::move(provider_id)),
      config_(config),
      circuit_(pack(CircuitState::Closed, now)) {}

uint64_t ProviderHealthState::pack(CircuitState state, TimePoint at) {
    auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
        at.time_since_epoch()).count();
    if (ns < 0) ns = 0;
    return (static_cast<uint64_t>(ns) << 2) | static_cast<uint64_t>(state);
}

CircuitState ProviderHealthState::state() const {
    return unpack_state(circuit_.load(std::memory_order_acquire));
}

TimePoint ProviderHealthState::last_transition() const {
    return unpack_time(circuit_.load(std::memory_order_acquire));
}

bool ProviderHealthState::transition(CircuitState from, CircuitState to, TimePoint at) {
    uint64_t current = circuit_.load(std::memory_order_acquire);
    if (unpack_state(current) != from) return false;
    return circuit_.compare_exchange_strong(current, pack(to, at),
                                            std::memory_order_acq_rel,
                                            std::memory_order_acquire);
}

bool ProviderHealthState::blocking(TimePoint now) const {
    uint64_t word = circuit_.load(std::memory_order_acquire);
    if (unpack_state(word) != CircuitState::Open) return false;
    return now - unpack_time(word) < config_.open_timeout;
}

bool ProviderHealthState::try_claim_probe() {
    bool expected = false;
    return probe_in_flight_.compare_exchange_strong(expected, true,
                                                    std::memory_order_acq_rel,
                                                    std::memory_order_acquire);
}

void ProviderHealthState::record_latency(std::chrono::milliseconds sample) {
    double value = static_cast<double>(sample.count());
    double current = latency_ms_.load(std::memory_order_acquire);
    double next;
    do {
        next = current == 0.0
            ? value
            : kLatencyAlpha * value + (1.0 - kLatencyAlpha) * current;
    } while (!latency_ms_.compare_exchange_weak(current, next,
                                                std::memory_order_acq_rel,
                                                std::memory_order_acquire));
}

void ProviderHealthState::record_call(const CallOutcome& outcome) {
    total_calls_.fetch_add(1, std::memory_order_acq_rel);
    if (outcome.provider_attributable()) total_failures_.fetch_add(1, std::memory_order_acq_rel);
}

double ProviderHealthState::failure_rate() const {
    uint64_t calls = total_calls();
    if (calls == 0) return 0.0;
    return static_cast<double>(total_failures()) / static_cast<double>(calls);
}

} // namespace llmgw

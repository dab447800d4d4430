#pragma once
#include "policy.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace llmgw {

using SteadyClock = std::chrono::steady_clock;
using TimePoint = SteadyClock::time_point;

enum class CircuitState : uint8_t { Closed = 0, Open = 1, HalfOpen = 2 };

inline const char* circuit_state_to_string(CircuitState state) {
    switch (state) {
        case CircuitState::Closed: return "closed";
        case CircuitState::Open: return "open";
        case CircuitState::HalfOpen: return "half_open";
    }
    return "closed";
}

enum class OutcomeKind {
    Success,
    Timeout,        // provider-attributable
    ServerError,    // provider-attributable: connection failure, 5xx, throttling
    ClientError,    // request-attributable: bad request, auth
    Cancelled       // overall deadline hit; attributed to nobody
};

inline const char* outcome_kind_to_string(OutcomeKind kind) {
    switch (kind) {
        case OutcomeKind::Success: return "success";
        case OutcomeKind::Timeout: return "timeout";
        case OutcomeKind::ServerError: return "server_error";
        case OutcomeKind::ClientError: return "client_error";
        case OutcomeKind::Cancelled: return "cancelled";
    }
    return "server_error";
}

struct CallOutcome {
    OutcomeKind kind = OutcomeKind::Success;
    std::chrono::milliseconds latency{0};
    std::optional<uint32_t> tokens;
    std::string detail;

    bool ok() const { return kind == OutcomeKind::Success; }
    bool provider_attributable() const {
        return kind == OutcomeKind::Timeout || kind == OutcomeKind::ServerError;
    }
};

// Mutable per-provider record shared by the circuit breaker and the load
// balancers. One instance per registered provider, never copied.
//
// Circuit state and the time of the last transition live in one atomic word
// so a transition is a single compare-and-set and readers always see a state
// together with the timestamp it was entered at.
class ProviderHealthState {
public:
    static constexpr double kLatencyAlpha = 0.3;

    ProviderHealthState(std::string provider_id, CircuitBreakerConfig config,
                        TimePoint now = SteadyClock::now());

    ProviderHealthState(const ProviderHealthState&) = delete;
    ProviderHealthState& operator=(const ProviderHealthState&) = delete;

    const std::string& provider_id() const { return provider_id_; }
    const CircuitBreakerConfig& config() const { return config_; }

    CircuitState state() const;
    TimePoint last_transition() const;

    // CAS from -> to, stamped with `at`. False if the state moved first.
    bool transition(CircuitState from, CircuitState to, TimePoint at);

    // Open and still inside open_timeout: no call may be attempted.
    bool blocking(TimePoint now) const;

    uint32_t consecutive_failures() const { return failures_.load(std::memory_order_acquire); }
    uint32_t add_failure() { return failures_.fetch_add(1, std::memory_order_acq_rel) + 1; }
    void reset_failures() { failures_.store(0, std::memory_order_release); }

    uint32_t consecutive_successes() const { return successes_.load(std::memory_order_acquire); }
    uint32_t add_success() { return successes_.fetch_add(1, std::memory_order_acq_rel) + 1; }
    void reset_successes() { successes_.store(0, std::memory_order_release); }

    bool try_claim_probe();
    void release_probe() { probe_in_flight_.store(false, std::memory_order_release); }
    bool probe_in_flight() const { return probe_in_flight_.load(std::memory_order_acquire); }

    int64_t in_flight() const { return in_flight_.load(std::memory_order_acquire); }
    void begin_call() { in_flight_.fetch_add(1, std::memory_order_acq_rel); }
    void end_call() { in_flight_.fetch_sub(1, std::memory_order_acq_rel); }

    // Exponentially weighted moving average; 0 until the first sample.
    double latency_ms() const { return latency_ms_.load(std::memory_order_acquire); }
    void record_latency(std::chrono::milliseconds sample);

    // Lifetime totals of dispatched calls. Only provider-attributable
    // outcomes count as failures; health checks are not calls.
    void record_call(const CallOutcome& outcome);
    uint64_t total_calls() const { return total_calls_.load(std::memory_order_acquire); }
    uint64_t total_failures() const { return total_failures_.load(std::memory_order_acquire); }
    double failure_rate() const;

private:
    static uint64_t pack(CircuitState state, TimePoint at);

    const std::string provider_id_;
    const CircuitBreakerConfig config_;

    std::atomic<uint64_t> circuit_;     // (nanoseconds since clock epoch << 2) | state
    std::atomic<uint32_t> failures_{0};
    std::atomic<uint32_t> successes_{0};
    std::atomic<bool> probe_in_flight_{false};
    std::atomic<int64_t> in_flight_{0};
    std::atomic<double> latency_ms_{0.0};
    std::atomic<uint64_t> total_calls_{0};
    std::atomic<uint64_t> total_failures_{0};
};

// Counts a dispatched call for the lifetime of the guard.
class InFlightGuard {
public:
    explicit InFlightGuard(ProviderHealthState& state) : state_(state) { state_.begin_call(); }
    ~InFlightGuard() { state_.end_call(); }

    InFlightGuard(const InFlightGuard&) = delete;
    InFlightGuard& operator=(const InFlightGuard&) = delete;

private:
    ProviderHealthState& state_;
};

} // namespace llmgw

#pragma once
#include "health.hpp"
#include <string>

namespace llmgw {

class EventBus; // forward declaration

enum class Permit { Allow, Deny };

// Result of CircuitBreaker::permit. Holds the HalfOpen probe slot when one was
// claimed and gives it back on destruction, so every exit path (success,
// failure, timeout, exception) reopens the slot.
class PermitGuard {
public:
    PermitGuard(ProviderHealthState& state, Permit decision, bool probe)
        : state_(&state), decision_(decision), probe_(probe) {}
    ~PermitGuard() { release(); }

    PermitGuard(PermitGuard&& other) noexcept
        : state_(other.state_), decision_(other.decision_), probe_(other.probe_) {
        other.probe_ = false;
    }
    PermitGuard& operator=(PermitGuard&&) = delete;
    PermitGuard(const PermitGuard&) = delete;
    PermitGuard& operator=(const PermitGuard&) = delete;

    Permit decision() const { return decision_; }
    bool allowed() const { return decision_ == Permit::Allow; }
    bool is_probe() const { return probe_; }

    void release() {
        if (probe_) {
            state_->release_probe();
            probe_ = false;
        }
    }

private:
    ProviderHealthState* state_;
    Permit decision_;
    bool probe_;
};

// Per-provider state machine over ProviderHealthState:
//
//   Closed --(failure_threshold consecutive failures)--> Open
//   Open --(open_timeout elapsed, checked lazily on permit)--> HalfOpen
//   HalfOpen --(success_threshold consecutive successes)--> Closed
//   HalfOpen --(any provider failure)--> Open
//
// Holds no per-provider data itself; one instance serves every provider.
class CircuitBreaker {
public:
    explicit CircuitBreaker(EventBus* bus = nullptr) : bus_(bus) {}

    PermitGuard permit(ProviderHealthState& state, TimePoint now = SteadyClock::now()) const;

    // Client errors and cancellations never move the breaker.
    void record_outcome(ProviderHealthState& state, const CallOutcome& outcome,
                        TimePoint now = SteadyClock::now()) const;

    // Admin overrides; recorded as ordinary transitions.
    void force_open(ProviderHealthState& state, TimePoint now = SteadyClock::now()) const;
    void reset(ProviderHealthState& state, TimePoint now = SteadyClock::now()) const;

private:
    // CAS wrapper; the winning thread logs and publishes the transition.
    bool transition(ProviderHealthState& state, CircuitState from, CircuitState to,
                    TimePoint now, const std::string& reason) const;

    EventBus* bus_;
};

} // namespace llmgw

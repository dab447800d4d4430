#include "circuit_breaker.hpp"
#include "event_bus.hpp"
#include <iostream>

namespace llmgw {

PermitGuard CircuitBreaker::permit(ProviderHealthState& state, TimePoint now) const {
    for (;;) {
        CircuitState current = state.state();
        switch (current) {
            case CircuitState::Closed:
                return PermitGuard(state, Permit::Allow, false);

            case CircuitState::Open:
                if (now - state.last_transition() < state.config().open_timeout) {
                    return PermitGuard(state, Permit::Deny, false);
                }
                // Losing the race is fine: re-read and act on the new state.
                transition(state, CircuitState::Open, CircuitState::HalfOpen, now,
                           "open timeout elapsed");
                continue;

            case CircuitState::HalfOpen:
                if (!state.try_claim_probe()) {
                    return PermitGuard(state, Permit::Deny, false);
                }
                if (state.state() != CircuitState::HalfOpen) {
                    // A concurrent probe already resolved; the slot is not ours to use.
                    state.release_probe();
                    return PermitGuard(state, Permit::Deny, false);
                }
                return PermitGuard(state, Permit::Allow, true);
        }
        return PermitGuard(state, Permit::Deny, false);
    }
}

void CircuitBreaker::record_outcome(ProviderHealthState& state, const CallOutcome& outcome,
                                    TimePoint now) const {
    if (outcome.kind == OutcomeKind::Cancelled || outcome.kind == OutcomeKind::ClientError) {
        return;
    }

    const auto& cfg = state.config();
    CircuitState current = state.state();

    if (outcome.ok()) {
        if (current == CircuitState::Closed) {
            state.reset_failures();
        } else if (current == CircuitState::HalfOpen) {
            uint32_t streak = state.add_success();
            if (streak >= cfg.success_threshold &&
                transition(state, CircuitState::HalfOpen, CircuitState::Closed, now,
                           std::to_string(streak) + " consecutive probe successes")) {
                state.reset_failures();
                state.reset_successes();
            }
        }
        // Open: a call admitted before the breaker tripped; ignore.
        return;
    }

    if (current == CircuitState::Closed) {
        uint32_t streak = state.add_failure();
        if (streak >= cfg.failure_threshold &&
            transition(state, CircuitState::Closed, CircuitState::Open, now,
                       std::to_string(streak) + " consecutive failures: " + outcome.detail)) {
            state.reset_successes();
        }
    } else if (current == CircuitState::HalfOpen) {
        if (transition(state, CircuitState::HalfOpen, CircuitState::Open, now,
                       "probe failed: " + outcome.detail)) {
            state.reset_successes();
        }
    }
}

void CircuitBreaker::force_open(ProviderHealthState& state, TimePoint now) const {
    for (;;) {
        CircuitState current = state.state();
        if (current == CircuitState::Open) return;
        if (transition(state, current, CircuitState::Open, now, "forced open")) {
            state.reset_successes();
            return;
        }
    }
}

void CircuitBreaker::reset(ProviderHealthState& state, TimePoint now) const {
    for (;;) {
        CircuitState current = state.state();
        if (current == CircuitState::Closed) break;
        if (transition(state, current, CircuitState::Closed, now, "reset")) break;
    }
    state.reset_failures();
    state.reset_successes();
}

bool CircuitBreaker::transition(ProviderHealthState& state, CircuitState from, CircuitState to,
                                TimePoint now, const std::string& reason) const {
    if (!state.transition(from, to, now)) return false;

    if (to == CircuitState::Open) {
        std::cerr << "[breaker] " << state.provider_id() << ": "
                  << circuit_state_to_string(from) << " -> " << circuit_state_to_string(to)
                  << " (" << reason << ")\n";
    }

    if (bus_) {
        BreakerTransitionEvent ev;
        ev.provider_id = state.provider_id();
        ev.old_state = from;
        ev.new_state = to;
        ev.reason = reason;
        bus_->publish(ev);
    }
    return true;
}

} // namespace llmgw

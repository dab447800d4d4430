#include <catch2/catch.hpp>
#include "health.hpp"
#include <atomic>
#include <thread>
#include <vector>

using namespace llmgw;
using std::chrono::milliseconds;

static CircuitBreakerConfig breaker_config(uint32_t failures = 3, uint32_t successes = 2,
                                           milliseconds open_timeout = milliseconds(1000)) {
    CircuitBreakerConfig c;
    c.failure_threshold = failures;
    c.success_threshold = successes;
    c.open_timeout = open_timeout;
    return c;
}

// ── Circuit word ────────────────────────────────────────────────

TEST_CASE("ProviderHealthState: starts closed at construction time", "[health]") {
    auto t0 = SteadyClock::now();
    ProviderHealthState state("p1", breaker_config(), t0);
    REQUIRE(state.provider_id() == "p1");
    REQUIRE(state.state() == CircuitState::Closed);
    REQUIRE(state.consecutive_failures() == 0);
    REQUIRE(state.in_flight() == 0);
    REQUIRE(state.latency_ms() == 0.0);
    auto drift = state.last_transition() - t0;
    REQUIRE(drift < milliseconds(1));
    REQUIRE(drift > -milliseconds(1));
}

TEST_CASE("ProviderHealthState: transition requires the expected state", "[health]") {
    auto t0 = SteadyClock::now();
    ProviderHealthState state("p1", breaker_config(), t0);

    REQUIRE_FALSE(state.transition(CircuitState::Open, CircuitState::HalfOpen, t0));
    REQUIRE(state.state() == CircuitState::Closed);

    auto t1 = t0 + milliseconds(50);
    REQUIRE(state.transition(CircuitState::Closed, CircuitState::Open, t1));
    REQUIRE(state.state() == CircuitState::Open);
    REQUIRE(std::chrono::duration_cast<milliseconds>(state.last_transition() - t0).count() == 50);
}

TEST_CASE("ProviderHealthState: blocking only while open within timeout", "[health]") {
    auto t0 = SteadyClock::now();
    ProviderHealthState state("p1", breaker_config(3, 2, milliseconds(100)), t0);
    REQUIRE_FALSE(state.blocking(t0));

    REQUIRE(state.transition(CircuitState::Closed, CircuitState::Open, t0));
    REQUIRE(state.blocking(t0 + milliseconds(99)));
    REQUIRE_FALSE(state.blocking(t0 + milliseconds(100)));

    REQUIRE(state.transition(CircuitState::Open, CircuitState::HalfOpen, t0 + milliseconds(100)));
    REQUIRE_FALSE(state.blocking(t0 + milliseconds(100)));
}

TEST_CASE("ProviderHealthState: concurrent transitions have one winner", "[health]") {
    ProviderHealthState state("p1", breaker_config());
    std::atomic<int> winners{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; i++) {
        threads.emplace_back([&] {
            if (state.transition(CircuitState::Closed, CircuitState::Open, SteadyClock::now()))
                winners++;
        });
    }
    for (auto& t : threads) t.join();
    REQUIRE(winners.load() == 1);
    REQUIRE(state.state() == CircuitState::Open);
}

// ── Counters and probe slot ─────────────────────────────────────

TEST_CASE("ProviderHealthState: failure and success counters", "[health]") {
    ProviderHealthState state("p1", breaker_config());
    REQUIRE(state.add_failure() == 1);
    REQUIRE(state.add_failure() == 2);
    state.reset_failures();
    REQUIRE(state.consecutive_failures() == 0);

    REQUIRE(state.add_success() == 1);
    state.reset_successes();
    REQUIRE(state.consecutive_successes() == 0);
}

TEST_CASE("ProviderHealthState: probe slot is exclusive", "[health]") {
    ProviderHealthState state("p1", breaker_config());
    REQUIRE(state.try_claim_probe());
    REQUIRE(state.probe_in_flight());
    REQUIRE_FALSE(state.try_claim_probe());
    state.release_probe();
    REQUIRE(state.try_claim_probe());
}

TEST_CASE("InFlightGuard: counts for its lifetime", "[health]") {
    ProviderHealthState state("p1", breaker_config());
    {
        InFlightGuard a(state);
        InFlightGuard b(state);
        REQUIRE(state.in_flight() == 2);
    }
    REQUIRE(state.in_flight() == 0);
}

// ── Latency EWMA ────────────────────────────────────────────────

TEST_CASE("ProviderHealthState: first latency sample is taken as is", "[health]") {
    ProviderHealthState state("p1", breaker_config());
    state.record_latency(milliseconds(200));
    REQUIRE(state.latency_ms() == Catch::Detail::Approx(200.0));
}

TEST_CASE("ProviderHealthState: latency is smoothed with alpha 0.3", "[health]") {
    ProviderHealthState state("p1", breaker_config());
    state.record_latency(milliseconds(100));
    state.record_latency(milliseconds(200));
    REQUIRE(state.latency_ms() == Catch::Detail::Approx(130.0));
    state.record_latency(milliseconds(0));
    REQUIRE(state.latency_ms() == Catch::Detail::Approx(91.0));
}

// ── Call totals ─────────────────────────────────────────────────

TEST_CASE("ProviderHealthState: failure rate counts provider-attributable failures", "[health]") {
    ProviderHealthState state("p", CircuitBreakerConfig{});
    REQUIRE(state.failure_rate() == 0.0);

    CallOutcome ok;
    CallOutcome timeout;
    timeout.kind = OutcomeKind::Timeout;
    CallOutcome client;
    client.kind = OutcomeKind::ClientError;
    CallOutcome cancelled;
    cancelled.kind = OutcomeKind::Cancelled;

    state.record_call(ok);
    state.record_call(timeout);
    state.record_call(client);
    state.record_call(cancelled);

    REQUIRE(state.total_calls() == 4);
    REQUIRE(state.total_failures() == 1);
    REQUIRE(state.failure_rate() == Catch::Detail::Approx(0.25));
    // Totals are independent of the breaker's streak counters.
    REQUIRE(state.consecutive_failures() == 0);
}

// ── Outcome classification ──────────────────────────────────────

TEST_CASE("CallOutcome: only timeouts and server errors are provider-attributable", "[health]") {
    CallOutcome o;
    REQUIRE(o.ok());
    REQUIRE_FALSE(o.provider_attributable());

    o.kind = OutcomeKind::Timeout;
    REQUIRE(o.provider_attributable());
    o.kind = OutcomeKind::ServerError;
    REQUIRE(o.provider_attributable());
    o.kind = OutcomeKind::ClientError;
    REQUIRE_FALSE(o.provider_attributable());
    o.kind = OutcomeKind::Cancelled;
    REQUIRE_FALSE(o.provider_attributable());
    REQUIRE_FALSE(o.ok());
}

TEST_CASE("circuit_state_to_string: names", "[health]") {
    REQUIRE(std::string(circuit_state_to_string(CircuitState::Closed)) == "closed");
    REQUIRE(std::string(circuit_state_to_string(CircuitState::Open)) == "open");
    REQUIRE(std::string(circuit_state_to_string(CircuitState::HalfOpen)) == "half_open");
}

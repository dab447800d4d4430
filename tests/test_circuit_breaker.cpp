#include <catch2/catch.hpp>
#include "circuit_breaker.hpp"
#include "event_bus.hpp"
#include <atomic>
#include <mutex>
#include <thread>
#include <vector>

using namespace llmgw;
using std::chrono::milliseconds;

namespace {

CircuitBreakerConfig config(uint32_t failures, uint32_t successes, milliseconds open_timeout) {
    CircuitBreakerConfig c;
    c.failure_threshold = failures;
    c.success_threshold = successes;
    c.open_timeout = open_timeout;
    return c;
}

CallOutcome outcome(OutcomeKind kind) {
    CallOutcome o;
    o.kind = kind;
    o.detail = outcome_kind_to_string(kind);
    return o;
}

} // namespace

// ── Closed ──────────────────────────────────────────────────────

TEST_CASE("CircuitBreaker: closed allows and is not a probe", "[breaker]") {
    CircuitBreaker breaker;
    ProviderHealthState state("p1", config(3, 1, milliseconds(1000)));
    auto guard = breaker.permit(state);
    REQUIRE(guard.allowed());
    REQUIRE_FALSE(guard.is_probe());
}

TEST_CASE("CircuitBreaker: opens after threshold consecutive failures", "[breaker]") {
    CircuitBreaker breaker;
    auto t0 = SteadyClock::now();
    ProviderHealthState state("p1", config(3, 1, milliseconds(1000)), t0);

    breaker.record_outcome(state, outcome(OutcomeKind::ServerError), t0);
    breaker.record_outcome(state, outcome(OutcomeKind::Timeout), t0);
    REQUIRE(state.state() == CircuitState::Closed);
    breaker.record_outcome(state, outcome(OutcomeKind::ServerError), t0);
    REQUIRE(state.state() == CircuitState::Open);
    REQUIRE(breaker.permit(state, t0 + milliseconds(10)).decision() == Permit::Deny);
}

TEST_CASE("CircuitBreaker: success in closed resets the failure streak", "[breaker]") {
    CircuitBreaker breaker;
    ProviderHealthState state("p1", config(3, 1, milliseconds(1000)));

    breaker.record_outcome(state, outcome(OutcomeKind::ServerError));
    breaker.record_outcome(state, outcome(OutcomeKind::ServerError));
    breaker.record_outcome(state, outcome(OutcomeKind::Success));
    REQUIRE(state.consecutive_failures() == 0);
    breaker.record_outcome(state, outcome(OutcomeKind::ServerError));
    breaker.record_outcome(state, outcome(OutcomeKind::ServerError));
    REQUIRE(state.state() == CircuitState::Closed);
}

TEST_CASE("CircuitBreaker: client errors and cancellations never count", "[breaker]") {
    CircuitBreaker breaker;
    ProviderHealthState state("p1", config(1, 1, milliseconds(1000)));

    for (int i = 0; i < 5; i++) {
        breaker.record_outcome(state, outcome(OutcomeKind::ClientError));
        breaker.record_outcome(state, outcome(OutcomeKind::Cancelled));
    }
    REQUIRE(state.state() == CircuitState::Closed);
    REQUIRE(state.consecutive_failures() == 0);
}

// ── Open -> HalfOpen -> Closed/Open ──────────────────────────────

TEST_CASE("CircuitBreaker: open timeout admits exactly one probe", "[breaker]") {
    CircuitBreaker breaker;
    auto t0 = SteadyClock::now();
    ProviderHealthState state("p1", config(1, 1, milliseconds(100)), t0);
    breaker.record_outcome(state, outcome(OutcomeKind::ServerError), t0);
    REQUIRE(state.state() == CircuitState::Open);

    REQUIRE_FALSE(breaker.permit(state, t0 + milliseconds(50)).allowed());

    auto probe = breaker.permit(state, t0 + milliseconds(150));
    REQUIRE(probe.allowed());
    REQUIRE(probe.is_probe());
    REQUIRE(state.state() == CircuitState::HalfOpen);

    auto second = breaker.permit(state, t0 + milliseconds(151));
    REQUIRE_FALSE(second.allowed());

    probe.release();
    auto third = breaker.permit(state, t0 + milliseconds(152));
    REQUIRE(third.allowed());
    REQUIRE(third.is_probe());
}

TEST_CASE("CircuitBreaker: probe slot freed when guard is destroyed", "[breaker]") {
    CircuitBreaker breaker;
    auto t0 = SteadyClock::now();
    ProviderHealthState state("p1", config(1, 1, milliseconds(10)), t0);
    breaker.record_outcome(state, outcome(OutcomeKind::ServerError), t0);

    {
        auto probe = breaker.permit(state, t0 + milliseconds(20));
        REQUIRE(probe.is_probe());
        REQUIRE(state.probe_in_flight());
    }
    REQUIRE_FALSE(state.probe_in_flight());
}

TEST_CASE("CircuitBreaker: half-open closes after success threshold", "[breaker]") {
    CircuitBreaker breaker;
    auto t0 = SteadyClock::now();
    ProviderHealthState state("p1", config(1, 2, milliseconds(10)), t0);
    breaker.record_outcome(state, outcome(OutcomeKind::ServerError), t0);

    auto t1 = t0 + milliseconds(20);
    {
        auto probe = breaker.permit(state, t1);
        REQUIRE(probe.allowed());
        breaker.record_outcome(state, outcome(OutcomeKind::Success), t1);
    }
    REQUIRE(state.state() == CircuitState::HalfOpen);
    {
        auto probe = breaker.permit(state, t1);
        REQUIRE(probe.allowed());
        breaker.record_outcome(state, outcome(OutcomeKind::Success), t1);
    }
    REQUIRE(state.state() == CircuitState::Closed);
    REQUIRE(state.consecutive_failures() == 0);
    REQUIRE(state.consecutive_successes() == 0);
}

TEST_CASE("CircuitBreaker: half-open failure reopens with fresh timestamp", "[breaker]") {
    CircuitBreaker breaker;
    auto t0 = SteadyClock::now();
    ProviderHealthState state("p1", config(1, 2, milliseconds(100)), t0);
    breaker.record_outcome(state, outcome(OutcomeKind::ServerError), t0);

    auto t1 = t0 + milliseconds(150);
    {
        auto probe = breaker.permit(state, t1);
        REQUIRE(probe.allowed());
        breaker.record_outcome(state, outcome(OutcomeKind::Timeout), t1);
    }
    REQUIRE(state.state() == CircuitState::Open);
    // Timeout counted again from the reopen, not from the first trip
    REQUIRE_FALSE(breaker.permit(state, t1 + milliseconds(50)).allowed());
    REQUIRE(breaker.permit(state, t1 + milliseconds(100)).allowed());
}

TEST_CASE("CircuitBreaker: concurrent permits claim a single probe", "[breaker]") {
    CircuitBreaker breaker;
    auto t0 = SteadyClock::now();
    ProviderHealthState state("p1", config(1, 1, milliseconds(10)), t0);
    breaker.record_outcome(state, outcome(OutcomeKind::ServerError), t0);

    std::atomic<int> allowed{0};
    std::atomic<bool> go{false};
    std::vector<std::thread> threads;
    std::vector<PermitGuard> guards;
    std::mutex guards_mutex;
    for (int i = 0; i < 16; i++) {
        threads.emplace_back([&] {
            while (!go.load()) std::this_thread::yield();
            auto g = breaker.permit(state, t0 + milliseconds(20));
            if (g.allowed()) allowed++;
            std::lock_guard<std::mutex> lock(guards_mutex);
            guards.push_back(std::move(g));
        });
    }
    go.store(true);
    for (auto& t : threads) t.join();
    REQUIRE(allowed.load() == 1);
}

// ── Admin and events ────────────────────────────────────────────

TEST_CASE("CircuitBreaker: force_open and reset", "[breaker]") {
    CircuitBreaker breaker;
    ProviderHealthState state("p1", config(5, 1, milliseconds(60000)));

    breaker.force_open(state);
    REQUIRE(state.state() == CircuitState::Open);
    REQUIRE_FALSE(breaker.permit(state).allowed());

    breaker.reset(state);
    REQUIRE(state.state() == CircuitState::Closed);
    REQUIRE(breaker.permit(state).allowed());
}

TEST_CASE("CircuitBreaker: publishes one event per transition", "[breaker]") {
    EventBus bus;
    std::vector<BreakerTransitionEvent> seen;
    subscribe<BreakerTransitionEvent>(bus, [&](const BreakerTransitionEvent& ev) {
        seen.push_back(ev);
    });

    CircuitBreaker breaker(&bus);
    auto t0 = SteadyClock::now();
    ProviderHealthState state("p1", config(2, 1, milliseconds(10)), t0);

    breaker.record_outcome(state, outcome(OutcomeKind::ServerError), t0);
    REQUIRE(seen.empty());
    breaker.record_outcome(state, outcome(OutcomeKind::ServerError), t0);
    REQUIRE(seen.size() == 1);
    REQUIRE(seen[0].provider_id == "p1");
    REQUIRE(seen[0].old_state == CircuitState::Closed);
    REQUIRE(seen[0].new_state == CircuitState::Open);

    {
        auto probe = breaker.permit(state, t0 + milliseconds(20));
        breaker.record_outcome(state, outcome(OutcomeKind::Success), t0 + milliseconds(20));
    }
    REQUIRE(seen.size() == 3);
    REQUIRE(seen[1].new_state == CircuitState::HalfOpen);
    REQUIRE(seen[2].old_state == CircuitState::HalfOpen);
    REQUIRE(seen[2].new_state == CircuitState::Closed);
}

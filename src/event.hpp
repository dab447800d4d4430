#pragma once
#include "error.hpp"
#include "health.hpp"
#include "provider.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace llmgw {

// Tag-based event dispatch without RTTI or dynamic_cast.
// Events are stack-allocated structs; never deleted through base pointer.

struct Event {
    const char* type_tag;
};

// ── Event tags ──────────────────────────────────────────────────

namespace event_tags {
    constexpr const char* AttemptCompleted  = "AttemptCompleted";
    constexpr const char* BreakerTransition = "BreakerTransition";
    constexpr const char* RouteCompleted    = "RouteCompleted";
    constexpr const char* HealthChecked     = "HealthChecked";
    constexpr const char* ConfigApplied     = "ConfigApplied";
} // namespace event_tags

// ── Event structs ───────────────────────────────────────────────

// One provider call inside RetryExecutor.
struct AttemptCompletedEvent : Event {
    static constexpr const char* TAG = event_tags::AttemptCompleted;
    std::string request_id;
    std::string provider_id;
    OutcomeKind outcome = OutcomeKind::Success;
    std::chrono::milliseconds latency{0};
    uint32_t attempt_number = 0;
    CircuitState breaker_state_after = CircuitState::Closed;
    std::string detail;

    AttemptCompletedEvent() { type_tag = TAG; }
};

struct BreakerTransitionEvent : Event {
    static constexpr const char* TAG = event_tags::BreakerTransition;
    std::string provider_id;
    CircuitState old_state = CircuitState::Closed;
    CircuitState new_state = CircuitState::Closed;
    std::string reason;

    BreakerTransitionEvent() { type_tag = TAG; }
};

struct RouteCompletedEvent : Event {
    static constexpr const char* TAG = event_tags::RouteCompleted;
    std::string request_id;
    std::string model;
    std::string provider_id;                 // serving provider on success
    std::vector<std::string> attempted;
    std::optional<ErrorKind> error;
    uint32_t attempts = 0;
    std::chrono::milliseconds latency{0};

    RouteCompletedEvent() { type_tag = TAG; }
};

struct HealthCheckedEvent : Event {
    static constexpr const char* TAG = event_tags::HealthChecked;
    std::string provider_id;
    HealthStatus status = HealthStatus::Healthy;
    std::chrono::milliseconds latency{0};
    CircuitState breaker_state_after = CircuitState::Closed;

    HealthCheckedEvent() { type_tag = TAG; }
};

struct ConfigAppliedEvent : Event {
    static constexpr const char* TAG = event_tags::ConfigApplied;
    size_t provider_count = 0;
    size_t rule_count = 0;
    std::string default_strategy;

    ConfigAppliedEvent() { type_tag = TAG; }
};

// Flat JSON rendering for log sinks; {"event": tag, ...fields}.
nlohmann::json event_to_json(const Event& event);

} // namespace llmgw

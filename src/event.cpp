#include "event.hpp"
#include <cstring>

namespace llmgw {

static bool is(const Event& event, const char* tag) {
    return std::strcmp(event.type_tag, tag) == 0;
}

nlohmann::json event_to_json(const Event& event) {
    nlohmann::json j;
    j["event"] = event.type_tag;

    if (is(event, AttemptCompletedEvent::TAG)) {
        const auto& e = static_cast<const AttemptCompletedEvent&>(event);
        j["request_id"] = e.request_id;
        j["provider_id"] = e.provider_id;
        j["outcome"] = outcome_kind_to_string(e.outcome);
        j["latency_ms"] = e.latency.count();
        j["attempt_number"] = e.attempt_number;
        j["breaker_state_after"] = circuit_state_to_string(e.breaker_state_after);
        if (!e.detail.empty()) j["detail"] = e.detail;
    } else if (is(event, BreakerTransitionEvent::TAG)) {
        const auto& e = static_cast<const BreakerTransitionEvent&>(event);
        j["provider_id"] = e.provider_id;
        j["old_state"] = circuit_state_to_string(e.old_state);
        j["new_state"] = circuit_state_to_string(e.new_state);
        j["reason"] = e.reason;
    } else if (is(event, RouteCompletedEvent::TAG)) {
        const auto& e = static_cast<const RouteCompletedEvent&>(event);
        j["request_id"] = e.request_id;
        j["model"] = e.model;
        j["provider_id"] = e.provider_id;
        j["attempted"] = e.attempted;
        j["attempts"] = e.attempts;
        j["latency_ms"] = e.latency.count();
        if (e.error) j["error"] = error_kind_to_string(*e.error);
    } else if (is(event, HealthCheckedEvent::TAG)) {
        const auto& e = static_cast<const HealthCheckedEvent&>(event);
        j["provider_id"] = e.provider_id;
        j["status"] = health_status_to_string(e.status);
        j["latency_ms"] = e.latency.count();
        j["breaker_state_after"] = circuit_state_to_string(e.breaker_state_after);
    } else if (is(event, ConfigAppliedEvent::TAG)) {
        const auto& e = static_cast<const ConfigAppliedEvent&>(event);
        j["provider_count"] = e.provider_count;
        j["rule_count"] = e.rule_count;
        j["default_strategy"] = e.default_strategy;
    }
    return j;
}

} // namespace llmgw

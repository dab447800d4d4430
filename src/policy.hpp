#pragma once
#include <chrono>
#include <cstdint>

namespace llmgw {

// Bounded retry with exponential backoff for one provider within one request.
struct RetryPolicy {
    uint32_t max_attempts = 3;
    std::chrono::milliseconds base_delay{100};
    std::chrono::milliseconds max_delay{10000};
    double backoff_multiplier = 2.0;
    double jitter_fraction = 0.25;              // +/- fraction of the computed delay
    std::chrono::milliseconds attempt_timeout{30000};
};

struct CircuitBreakerConfig {
    uint32_t failure_threshold = 5;             // consecutive failures while Closed
    uint32_t success_threshold = 3;             // consecutive probe successes while HalfOpen
    std::chrono::milliseconds open_timeout{30000};
};

inline bool operator==(const RetryPolicy& a, const RetryPolicy& b) {
    return a.max_attempts == b.max_attempts &&
           a.base_delay == b.base_delay &&
           a.max_delay == b.max_delay &&
           a.backoff_multiplier == b.backoff_multiplier &&
           a.jitter_fraction == b.jitter_fraction &&
           a.attempt_timeout == b.attempt_timeout;
}

inline bool operator!=(const RetryPolicy& a, const RetryPolicy& b) { return !(a == b); }

inline bool operator==(const CircuitBreakerConfig& a, const CircuitBreakerConfig& b) {
    return a.failure_threshold == b.failure_threshold &&
           a.success_threshold == b.success_threshold &&
           a.open_timeout == b.open_timeout;
}

inline bool operator!=(const CircuitBreakerConfig& a, const CircuitBreakerConfig& b) {
    return !(a == b);
}

} // namespace llmgw

#pragma once
#include "circuit_breaker.hpp"
#include "provider.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace llmgw {

class EventBus; // forward declaration

// min(base * multiplier^(attempt-1), max), then scaled by
// (1 + jitter_sample * jitter_fraction) and clamped to [0, max].
// jitter_sample is in [-1, 1]; attempt is 1-based.
std::chrono::milliseconds backoff_delay(const RetryPolicy& policy, uint32_t attempt,
                                        double jitter_sample);

// Same, with a uniformly random jitter sample.
std::chrono::milliseconds backoff_delay(const RetryPolicy& policy, uint32_t attempt);

enum class ExecuteStatus {
    Success,
    CircuitOpen,        // breaker denied; no call was made for this attempt
    RetriesExhausted,   // attempts failed retryably and none remain before the deadline
    NonRetryable,       // request-specific failure; do not fail over
    DeadlineExceeded    // overall request deadline reached
};

inline const char* execute_status_to_string(ExecuteStatus status) {
    switch (status) {
        case ExecuteStatus::Success: return "success";
        case ExecuteStatus::CircuitOpen: return "circuit_open";
        case ExecuteStatus::RetriesExhausted: return "retries_exhausted";
        case ExecuteStatus::NonRetryable: return "non_retryable";
        case ExecuteStatus::DeadlineExceeded: return "deadline_exceeded";
    }
    return "retries_exhausted";
}

struct ExecuteResult {
    ExecuteStatus status = ExecuteStatus::RetriesExhausted;
    std::optional<CanonicalResponse> response;
    std::string last_error;
    uint32_t attempts = 0;                      // calls actually made
    std::optional<CallOutcome> last_outcome;

    bool ok() const { return status == ExecuteStatus::Success; }
};

// Waits out a backoff delay. Replaced in tests to record delays without sleeping.
using Sleeper = std::function<void(std::chrono::milliseconds)>;

// Runs one provider call with bounded retries. Each attempt asks the breaker
// for permission, runs on its own thread and is abandoned (abort flag raised)
// once min(attempt timeout, deadline) passes.
class RetryExecutor {
public:
    explicit RetryExecutor(const CircuitBreaker& breaker, EventBus* bus = nullptr);

    ExecuteResult execute(const ProviderRef& provider,
                          const CanonicalRequest& request,
                          const RetryPolicy& policy,
                          TimePoint deadline);

    void set_sleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }

    // Attempt threads still running in this process, abandoned ones included.
    // Process-wide teardown (http_cleanup) must wait for them.
    static size_t live_attempts();
    static bool wait_for_attempts(std::chrono::milliseconds timeout);

private:
    struct AttemptResult;

    AttemptResult run_attempt(const ProviderRef& provider,
                              const CanonicalRequest& request,
                              TimePoint attempt_deadline,
                              bool overall_deadline,
                              uint32_t attempt);

    void emit_attempt(const CanonicalRequest& request, const ProviderEntry& provider,
                      const CallOutcome& outcome, uint32_t attempt) const;

    const CircuitBreaker& breaker_;
    EventBus* bus_;
    Sleeper sleeper_;
};

} // namespace llmgw

#include "retry.hpp"
#include "event_bus.hpp"
#include <algorithm>
#include <cmath>
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <random>
#include <thread>

namespace llmgw {

using std::chrono::milliseconds;

std::chrono::milliseconds backoff_delay(const RetryPolicy& policy, uint32_t attempt,
                                        double jitter_sample) {
    if (attempt == 0) attempt = 1;
    double max_ms = static_cast<double>(policy.max_delay.count());
    double raw = static_cast<double>(policy.base_delay.count()) *
                 std::pow(policy.backoff_multiplier, static_cast<double>(attempt - 1));
    double capped = std::min(raw, max_ms);

    jitter_sample = std::max(-1.0, std::min(1.0, jitter_sample));
    double jittered = capped * (1.0 + jitter_sample * policy.jitter_fraction);
    jittered = std::max(0.0, std::min(jittered, max_ms));
    return milliseconds(static_cast<int64_t>(std::llround(jittered)));
}

std::chrono::milliseconds backoff_delay(const RetryPolicy& policy, uint32_t attempt) {
    thread_local std::mt19937_64 rng(std::random_device{}());
    std::uniform_real_distribution<double> dist(-1.0, 1.0);
    return backoff_delay(policy, attempt, dist(rng));
}

// ── Attempt thread ──────────────────────────────────────────────

namespace {

// Shared between the caller and the attempt thread; whichever finishes last
// frees it.
struct AttemptShared {
    std::mutex mutex;
    std::condition_variable cv;
    bool done = false;
    std::optional<CanonicalResponse> response;
    std::optional<CallErrorKind> error_kind;
    std::string error;
    std::atomic<bool> abort{false};
};

// Attempt threads still running, including abandoned ones.
std::mutex g_live_mutex;
std::condition_variable g_live_cv;
size_t g_live_attempts = 0;

milliseconds elapsed_since(TimePoint start) {
    return std::chrono::duration_cast<milliseconds>(SteadyClock::now() - start);
}

} // namespace

struct RetryExecutor::AttemptResult {
    CallOutcome outcome;
    std::optional<CanonicalResponse> response;
    bool retryable = false;
    bool deadline_exceeded = false;
};

size_t RetryExecutor::live_attempts() {
    std::lock_guard<std::mutex> lock(g_live_mutex);
    return g_live_attempts;
}

bool RetryExecutor::wait_for_attempts(milliseconds timeout) {
    std::unique_lock<std::mutex> lock(g_live_mutex);
    return g_live_cv.wait_for(lock, timeout, [] { return g_live_attempts == 0; });
}

RetryExecutor::RetryExecutor(const CircuitBreaker& breaker, EventBus* bus)
    : breaker_(breaker), bus_(bus),
      sleeper_([](milliseconds d) { std::this_thread::sleep_for(d); }) {}

RetryExecutor::AttemptResult RetryExecutor::run_attempt(const ProviderRef& provider,
                                                        const CanonicalRequest& request,
                                                        TimePoint attempt_deadline,
                                                        bool overall_deadline,
                                                        uint32_t attempt) {
    auto shared = std::make_shared<AttemptShared>();
    auto start = SteadyClock::now();

    {
        std::lock_guard<std::mutex> lock(g_live_mutex);
        ++g_live_attempts;
    }
    std::thread([shared, provider, request, attempt_deadline, attempt]() {
        CallContext ctx;
        ctx.deadline = attempt_deadline;
        ctx.abort = &shared->abort;
        ctx.attempt = attempt;

        std::optional<CanonicalResponse> response;
        std::optional<CallErrorKind> kind;
        std::string error;
        try {
            response = provider->adapter->invoke(request, ctx);
        } catch (const ProviderCallError& e) {
            kind = e.kind();
            error = e.what();
        } catch (const std::exception& e) {
            kind = CallErrorKind::Retryable;
            error = e.what();
        }

        {
            std::lock_guard<std::mutex> lock(shared->mutex);
            shared->response = std::move(response);
            shared->error_kind = kind;
            shared->error = std::move(error);
            shared->done = true;
            shared->cv.notify_all();
        }

        std::lock_guard<std::mutex> lock(g_live_mutex);
        --g_live_attempts;
        g_live_cv.notify_all();
    }).detach();

    AttemptResult result;
    std::unique_lock<std::mutex> lock(shared->mutex);
    bool finished = shared->cv.wait_until(lock, attempt_deadline, [&] { return shared->done; });
    result.outcome.latency = elapsed_since(start);

    if (!finished) {
        shared->abort.store(true, std::memory_order_relaxed);
        if (overall_deadline) {
            result.outcome.kind = OutcomeKind::Cancelled;
            result.outcome.detail = "request deadline exceeded";
            result.deadline_exceeded = true;
        } else {
            result.outcome.kind = OutcomeKind::Timeout;
            result.outcome.detail = "attempt timed out";
            result.retryable = true;
        }
        return result;
    }

    if (shared->response) {
        result.outcome.kind = OutcomeKind::Success;
        if (shared->response->usage.total_tokens > 0) {
            result.outcome.tokens = shared->response->usage.total_tokens;
        }
        result.response = std::move(shared->response);
        return result;
    }

    result.outcome.detail = shared->error;
    switch (*shared->error_kind) {
        case CallErrorKind::Timeout:
            result.outcome.kind = OutcomeKind::Timeout;
            result.retryable = true;
            break;
        case CallErrorKind::Retryable:
            result.outcome.kind = OutcomeKind::ServerError;
            result.retryable = true;
            break;
        case CallErrorKind::NonRetryable:
            result.outcome.kind = OutcomeKind::ClientError;
            break;
    }
    return result;
}

void RetryExecutor::emit_attempt(const CanonicalRequest& request, const ProviderEntry& provider,
                                 const CallOutcome& outcome, uint32_t attempt) const {
    if (!bus_) return;
    AttemptCompletedEvent ev;
    ev.request_id = request.id;
    ev.provider_id = provider.id();
    ev.outcome = outcome.kind;
    ev.latency = outcome.latency;
    ev.attempt_number = attempt;
    ev.breaker_state_after = provider.health->state();
    ev.detail = outcome.detail;
    bus_->publish(ev);
}

// ── Retry loop ──────────────────────────────────────────────────

ExecuteResult RetryExecutor::execute(const ProviderRef& provider,
                                     const CanonicalRequest& request,
                                     const RetryPolicy& policy,
                                     TimePoint deadline) {
    ExecuteResult result;
    ProviderHealthState& health = *provider->health;
    uint32_t max_attempts = std::max<uint32_t>(policy.max_attempts, 1);

    for (uint32_t attempt = 1; attempt <= max_attempts; ++attempt) {
        auto now = SteadyClock::now();
        if (now >= deadline) {
            result.status = ExecuteStatus::DeadlineExceeded;
            if (result.last_error.empty()) result.last_error = "request deadline exceeded";
            return result;
        }

        AttemptResult attempt_result;
        {
            PermitGuard permit = breaker_.permit(health, now);
            if (!permit.allowed()) {
                result.status = ExecuteStatus::CircuitOpen;
                // A denial after real attempts keeps the provider's own error.
                if (result.attempts == 0) result.last_error = "circuit open";
                return result;
            }

            TimePoint attempt_deadline = now + policy.attempt_timeout;
            bool overall = deadline <= attempt_deadline;
            if (overall) attempt_deadline = deadline;

            InFlightGuard in_flight(health);
            attempt_result = run_attempt(provider, request, attempt_deadline, overall, attempt);
            ++result.attempts;

            const CallOutcome& outcome = attempt_result.outcome;
            health.record_call(outcome);
            if (outcome.ok() || outcome.provider_attributable()) {
                health.record_latency(outcome.latency);
            }
            // Record before the guard releases the probe slot.
            breaker_.record_outcome(health, outcome);
        }

        const CallOutcome& outcome = attempt_result.outcome;
        emit_attempt(request, *provider, outcome, attempt);
        result.last_outcome = outcome;

        if (outcome.ok()) {
            result.status = ExecuteStatus::Success;
            result.response = std::move(attempt_result.response);
            result.last_error.clear();
            return result;
        }

        result.last_error = outcome.detail;
        std::cerr << "[retry] Provider " << provider->id()
                  << " attempt " << attempt << "/" << max_attempts
                  << " failed: " << outcome.detail << '\n';

        if (attempt_result.deadline_exceeded) {
            result.status = ExecuteStatus::DeadlineExceeded;
            return result;
        }
        if (!attempt_result.retryable) {
            result.status = ExecuteStatus::NonRetryable;
            return result;
        }

        if (attempt < max_attempts) {
            milliseconds delay = backoff_delay(policy, attempt);
            // No time for another attempt here; give the remainder to the
            // next candidate instead of sleeping into the deadline.
            if (SteadyClock::now() + delay >= deadline) {
                std::cerr << "[retry] Provider " << provider->id() << ": backoff of "
                          << delay.count() << " ms would pass the deadline, giving up\n";
                result.status = ExecuteStatus::RetriesExhausted;
                return result;
            }
            sleeper_(delay);
        }
    }

    result.status = ExecuteStatus::RetriesExhausted;
    return result;
}

} // namespace llmgw

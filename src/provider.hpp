#pragma once
#include "health.hpp"
#include "policy.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace llmgw {

struct TokenUsage {
    uint32_t prompt_tokens = 0;
    uint32_t completion_tokens = 0;
    uint32_t total_tokens = 0;
};

struct RoutingHints {
    std::optional<std::string> preferred_provider;
    std::optional<std::string> strategy;                  // overrides rule/default strategy
    std::optional<std::chrono::milliseconds> max_latency; // floor for cost_optimized
    std::vector<std::string> tags;
    std::unordered_map<std::string, std::string> headers; // lower-cased names
};

struct CanonicalRequest {
    std::string id;
    std::string model;
    std::shared_ptr<const std::string> payload;   // opaque; forwarded verbatim
    std::optional<TimePoint> deadline;            // unset: gateway default applies
    RoutingHints hints;
    uint32_t context_tokens = 0;                  // capability floor, 0 = any
};

struct CanonicalResponse {
    std::string provider_id;
    std::string model;
    std::string body;
    TokenUsage usage;
};

// Adapter-side classification so the core never parses provider error bodies.
enum class CallErrorKind { Retryable, NonRetryable, Timeout };

inline const char* call_error_kind_to_string(CallErrorKind kind) {
    switch (kind) {
        case CallErrorKind::Retryable: return "retryable";
        case CallErrorKind::NonRetryable: return "non_retryable";
        case CallErrorKind::Timeout: return "timeout";
    }
    return "retryable";
}

class ProviderCallError : public std::runtime_error {
public:
    ProviderCallError(CallErrorKind kind, const std::string& message, long status_code = 0)
        : std::runtime_error(message), kind_(kind), status_code_(status_code) {}

    CallErrorKind kind() const { return kind_; }
    long status_code() const { return status_code_; }

private:
    CallErrorKind kind_;
    long status_code_;
};

// 408, 429, 500, 502, 503 and 504.
const std::vector<long>& default_retry_on_status();

// Transport failures (status 0) and the listed statuses are worth retrying
// elsewhere or later; anything else describes a request to give up on.
CallErrorKind classify_http_status(long status, const std::vector<long>& retry_on_status);
CallErrorKind classify_http_status(long status);

struct CallContext {
    TimePoint deadline;                         // min(attempt timeout, request deadline)
    const std::atomic<bool>* abort = nullptr;   // raised when the caller stops waiting
    uint32_t attempt = 1;

    std::chrono::milliseconds remaining(TimePoint now = SteadyClock::now()) const;
    bool aborted() const { return abort && abort->load(std::memory_order_relaxed); }
};

enum class HealthStatus { Healthy, Degraded, Unhealthy };

inline const char* health_status_to_string(HealthStatus status) {
    switch (status) {
        case HealthStatus::Healthy: return "healthy";
        case HealthStatus::Degraded: return "degraded";
        case HealthStatus::Unhealthy: return "unhealthy";
    }
    return "unhealthy";
}

struct ProviderLimits {
    uint32_t max_context_tokens = 0;   // 0 = unknown / unlimited
    uint32_t max_output_tokens = 0;
    bool supports_streaming = false;
    bool supports_tools = false;
};

struct Endpoint {
    std::string base_url;
    std::string path = "/v1/chat/completions";
    std::string health_path = "/v1/models";
    std::string api_key;
    std::chrono::milliseconds degraded_latency{2000};  // slower health probes report Degraded
    std::vector<long> retry_on_status = default_retry_on_status();
};

// Immutable description of one backend. Replaced wholesale on reload.
struct ProviderSpec {
    std::string id;
    std::string type = "compatible";        // adapter factory name
    std::vector<std::string> models;
    ProviderLimits limits;
    Endpoint endpoint;
    uint32_t weight = 1;
    double cost = 0.0;                       // relative cost per 1k tokens
    bool enabled = true;
    std::optional<RetryPolicy> retry;
    std::optional<CircuitBreakerConfig> circuit_breaker;

    bool serves(const std::string& model) const;
    bool fits(uint32_t context_tokens) const;
};

bool operator==(const ProviderSpec& a, const ProviderSpec& b);
inline bool operator!=(const ProviderSpec& a, const ProviderSpec& b) { return !(a == b); }

// Polymorphic backend capability set. Implementations must be safe to call
// from several threads at once.
class Provider {
public:
    virtual ~Provider() = default;

    // Forward one request. Throws ProviderCallError (or any std::exception,
    // treated as retryable) on failure. Should return promptly once
    // ctx.aborted() or ctx.deadline passes.
    virtual CanonicalResponse invoke(const CanonicalRequest& request,
                                     const CallContext& ctx) = 0;

    virtual HealthStatus health_check() = 0;

    virtual std::string provider_name() const = 0;
};

// A registered provider: spec, adapter, resolved policies and its one
// health record. Shared read-only; only the health record mutates.
struct ProviderEntry {
    ProviderSpec spec;
    std::shared_ptr<Provider> adapter;
    std::shared_ptr<ProviderHealthState> health;
    RetryPolicy retry;

    const std::string& id() const { return spec.id; }
};

using ProviderRef = std::shared_ptr<const ProviderEntry>;

// Resolve per-provider overrides against the defaults. `carried` keeps the
// health record of a provider that survives a reload unchanged.
ProviderRef make_provider_entry(ProviderSpec spec,
                                std::shared_ptr<Provider> adapter,
                                const RetryPolicy& default_retry,
                                const CircuitBreakerConfig& default_breaker,
                                std::shared_ptr<ProviderHealthState> carried = nullptr);

class HttpClient; // forward declaration

// Factory: create the adapter named by spec.type
std::unique_ptr<Provider> create_provider(const ProviderSpec& spec,
                                          std::shared_ptr<HttpClient> http);

} // namespace llmgw

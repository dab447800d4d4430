#pragma once
#include "circuit_breaker.hpp"
#include "error.hpp"
#include "load_balancer.hpp"
#include "registry.hpp"
#include "retry.hpp"
#include "rules.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace llmgw {

class EventBus; // forward declaration

// Routing half of a configuration snapshot. Immutable once published.
struct RoutingConfig {
    std::vector<RoutingRule> rules;             // sorted by priority
    std::string default_strategy = "round_robin";
    std::chrono::milliseconds request_timeout{30000};
};

struct RouteResult {
    std::optional<CanonicalResponse> response;
    std::optional<GatewayError> error;
    std::vector<std::string> attempted;
    uint32_t attempts = 0;                      // provider calls across all candidates

    bool ok() const { return response.has_value(); }
};

// Ordered candidates for one request and the strategy that picks among them.
struct Resolution {
    std::vector<ProviderRef> candidates;
    std::string strategy;
    std::string rule;                           // matched rule name, if any
};

// Per-request entry point: candidates from rules and registry, selection by
// load balancer, calls through RetryExecutor, fail-over across candidates.
// Safe to call route() from many threads at once.
class Router {
public:
    explicit Router(ProviderRegistry& registry, EventBus* bus = nullptr);

    RouteResult route(const CanonicalRequest& request);

    // Candidate resolution only; no breaker filtering, no calls.
    Resolution resolve_candidates(const CanonicalRequest& request,
                                  const RoutingConfig& config) const;

    // Feed a proactive health check result into the breaker. Returns the
    // breaker state afterwards.
    CircuitState record_health(const ProviderRef& provider, HealthStatus status,
                               std::chrono::milliseconds latency,
                               TimePoint now = SteadyClock::now());

    // Requests already in route() keep the snapshot they started with.
    void set_config(RoutingConfig config);
    std::shared_ptr<const RoutingConfig> config() const { return std::atomic_load(&config_); }

    // Replace a strategy implementation. Call before routing begins.
    void set_balancer(const std::string& name, std::unique_ptr<LoadBalancer> balancer);
    LoadBalancer& balancer(const std::string& name);

    const CircuitBreaker& breaker() const { return breaker_; }
    RetryExecutor& executor() { return executor_; }

private:
    RouteResult finish(const CanonicalRequest& request, RouteResult result,
                       TimePoint start) const;

    ProviderRegistry& registry_;
    EventBus* bus_;
    CircuitBreaker breaker_;
    RetryExecutor executor_;
    std::unordered_map<std::string, std::unique_ptr<LoadBalancer>> balancers_;
    std::shared_ptr<const RoutingConfig> config_;
};

} // namespace llmgw

#include "router.hpp"
#include "event_bus.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace llmgw {

using std::chrono::milliseconds;

Router::Router(ProviderRegistry& registry, EventBus* bus)
    : registry_(registry),
      bus_(bus),
      breaker_(bus),
      executor_(breaker_, bus),
      config_(std::make_shared<RoutingConfig>()) {
    for (const auto& name : load_balancer_names()) {
        balancers_[name] = create_load_balancer(name);
    }
}

void Router::set_config(RoutingConfig config) {
    sort_rules(config.rules);
    std::atomic_store(&config_, std::shared_ptr<const RoutingConfig>(
        std::make_shared<RoutingConfig>(std::move(config))));
}

void Router::set_balancer(const std::string& name, std::unique_ptr<LoadBalancer> balancer) {
    if (!balancer) throw std::invalid_argument("Load balancer must not be null");
    balancers_[name] = std::move(balancer);
}

LoadBalancer& Router::balancer(const std::string& name) {
    auto it = balancers_.find(name);
    if (it == balancers_.end()) {
        throw std::invalid_argument("Unknown load balancing strategy: " + name);
    }
    return *it->second;
}

// ── Candidate resolution ────────────────────────────────────────

Resolution Router::resolve_candidates(const CanonicalRequest& request,
                                      const RoutingConfig& config) const {
    Resolution res;
    res.strategy = config.default_strategy;

    const auto& hints = request.hints;
    const RoutingRule* rule = nullptr;

    if (hints.preferred_provider) {
        auto preferred = registry_.get(*hints.preferred_provider);
        if (preferred && preferred->spec.enabled && preferred->spec.serves(request.model)) {
            res.candidates.push_back(preferred);
            for (auto& p : registry_.providers_for_model(request.model)) {
                if (p != preferred) res.candidates.push_back(std::move(p));
            }
            res.strategy = "priority";
        }
    }

    if (res.candidates.empty()) {
        rule = match_rule(config.rules, request);
        if (rule && rule->is_explicit()) {
            for (const auto& id : rule->chain()) {
                auto p = registry_.get(id);
                if (p && p->spec.enabled) res.candidates.push_back(std::move(p));
            }
            res.strategy = "priority";
        } else {
            res.candidates = registry_.providers_for_model(request.model);
            if (rule && !rule->strategy.empty()) res.strategy = rule->strategy;
        }
        if (rule) res.rule = rule->name;
    }

    // An explicit chain's order is the route; a strategy hint cannot reorder it.
    if (hints.strategy && res.strategy != "priority" && is_known_strategy(*hints.strategy)) {
        res.strategy = *hints.strategy;
    }

    if (request.context_tokens > 0) {
        res.candidates.erase(
            std::remove_if(res.candidates.begin(), res.candidates.end(),
                           [&](const ProviderRef& p) { return !p->spec.fits(request.context_tokens); }),
            res.candidates.end());
    }
    return res;
}

// ── Routing ─────────────────────────────────────────────────────

RouteResult Router::finish(const CanonicalRequest& request, RouteResult result,
                           TimePoint start) const {
    if (result.error) result.error->attempted = result.attempted;

    if (bus_) {
        RouteCompletedEvent ev;
        ev.request_id = request.id;
        ev.model = request.model;
        if (result.response) ev.provider_id = result.response->provider_id;
        ev.attempted = result.attempted;
        if (result.error) ev.error = result.error->kind;
        ev.attempts = result.attempts;
        ev.latency = std::chrono::duration_cast<milliseconds>(SteadyClock::now() - start);
        bus_->publish(ev);
    }
    return result;
}

RouteResult Router::route(const CanonicalRequest& request) {
    auto start = SteadyClock::now();
    auto cfg = config();
    TimePoint deadline = request.deadline.value_or(start + cfg->request_timeout);

    RouteResult result;
    Resolution res = resolve_candidates(request, *cfg);
    if (res.candidates.empty()) {
        result.error = GatewayError::model_not_found(request.model);
        return finish(request, std::move(result), start);
    }

    std::vector<ProviderRef> remaining;
    for (const auto& c : res.candidates) {
        if (!c->health->blocking(start)) remaining.push_back(c);
    }
    if (remaining.empty()) {
        result.error = GatewayError::no_healthy_providers(request.model, {});
        return finish(request, std::move(result), start);
    }

    auto bal = balancers_.find(res.strategy);
    LoadBalancer& balancer = bal != balancers_.end() ? *bal->second : *balancers_.at("round_robin");

    bool reached = false;    // at least one provider call was made
    std::optional<GatewayError> last_error;

    while (!remaining.empty()) {
        auto now = SteadyClock::now();
        if (now >= deadline) {
            result.error = GatewayError::timeout("request deadline exceeded before fail-over");
            return finish(request, std::move(result), start);
        }

        SelectionContext ctx;
        ctx.model = request.model;
        ctx.context_tokens = request.context_tokens;
        ctx.max_latency = request.hints.max_latency;
        ctx.now = now;

        auto pick = balancer.select(remaining, ctx);
        if (!pick) break;
        ProviderRef provider = *pick;
        remaining.erase(std::remove(remaining.begin(), remaining.end(), provider), remaining.end());
        result.attempted.push_back(provider->id());

        ExecuteResult exec = executor_.execute(provider, request, provider->retry, deadline);
        result.attempts += exec.attempts;
        if (exec.last_outcome) balancer.record_result(provider, *exec.last_outcome);

        switch (exec.status) {
            case ExecuteStatus::Success:
                result.response = std::move(exec.response);
                if (result.response->provider_id.empty()) result.response->provider_id = provider->id();
                return finish(request, std::move(result), start);

            case ExecuteStatus::NonRetryable:
                result.error = GatewayError::provider_error(provider->id(), exec.last_error);
                return finish(request, std::move(result), start);

            case ExecuteStatus::DeadlineExceeded:
                result.error = GatewayError::timeout("request deadline exceeded at " + provider->id());
                return finish(request, std::move(result), start);

            case ExecuteStatus::CircuitOpen:
                if (exec.attempts > 0) {
                    reached = true;
                    last_error = GatewayError::retries_exhausted(provider->id(), exec.last_error);
                } else if (!last_error) {
                    last_error = GatewayError::circuit_open(provider->id());
                }
                break;

            case ExecuteStatus::RetriesExhausted:
                reached = true;
                last_error = GatewayError::retries_exhausted(provider->id(), exec.last_error);
                break;
        }

        if (!remaining.empty()) {
            std::cerr << "[router] " << request.model << ": failing over from "
                      << provider->id() << " (" << execute_status_to_string(exec.status)
                      << ": " << exec.last_error << ")\n";
        }
    }

    if (!reached || !last_error) {
        result.error = GatewayError::no_healthy_providers(request.model, {});
    } else {
        result.error = std::move(last_error);
    }
    return finish(request, std::move(result), start);
}

// ── Health feedback ─────────────────────────────────────────────

CircuitState Router::record_health(const ProviderRef& provider, HealthStatus status,
                                   milliseconds latency, TimePoint now) {
    ProviderHealthState& health = *provider->health;

    if (status != HealthStatus::Unhealthy) health.record_latency(latency);

    if (status != HealthStatus::Degraded) {
        // Health results take the same path as calls: an Open breaker still
        // inside its timeout ignores them, a HalfOpen one treats them as its probe.
        PermitGuard permit = breaker_.permit(health, now);
        if (permit.allowed()) {
            CallOutcome outcome;
            outcome.latency = latency;
            if (status == HealthStatus::Healthy) {
                outcome.kind = OutcomeKind::Success;
            } else {
                outcome.kind = OutcomeKind::ServerError;
                outcome.detail = "health check failed";
            }
            breaker_.record_outcome(health, outcome, now);
        }
    }

    CircuitState after = health.state();
    if (bus_) {
        HealthCheckedEvent ev;
        ev.provider_id = provider->id();
        ev.status = status;
        ev.latency = latency;
        ev.breaker_state_after = after;
        bus_->publish(ev);
    }
    return after;
}

} // namespace llmgw

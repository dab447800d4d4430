#pragma once
#include "config.hpp"
#include "event_bus.hpp"
#include "http.hpp"
#include "registry.hpp"
#include "router.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace llmgw {

// One independent gateway instance: owns its event bus, provider registry
// and router. Several instances can coexist (tests do this).
class Gateway {
public:
    // Builds the adapter for a provider spec. Defaults to the plugin registry.
    using AdapterFactory = std::function<std::shared_ptr<Provider>(const ProviderSpec&)>;

    explicit Gateway(std::shared_ptr<HttpClient> http);

    Gateway(const Gateway&) = delete;
    Gateway& operator=(const Gateway&) = delete;

    void set_adapter_factory(AdapterFactory factory);

    // Validate and activate a snapshot. Throws ConfigError (nothing changes)
    // when the snapshot is invalid or an adapter cannot be built. Providers
    // whose spec is unchanged keep their adapter and health state.
    void apply_config(const GatewayConfig& config);

    RouteResult route(const CanonicalRequest& request) { return router_.route(request); }

    std::shared_ptr<const GatewayConfig> config() const { return std::atomic_load(&config_); }

    EventBus& events() { return events_; }
    ProviderRegistry& registry() { return registry_; }
    Router& router() { return router_; }

    struct ProviderStatus {
        std::string id;
        CircuitState state = CircuitState::Closed;
        uint32_t consecutive_failures = 0;
        int64_t in_flight = 0;
        double latency_ms = 0.0;
        uint64_t total_calls = 0;
        uint64_t total_failures = 0;
        double failure_rate = 0.0;
    };

    std::vector<ProviderStatus> status() const;
    nlohmann::json status_json() const;

private:
    std::shared_ptr<HttpClient> http_;
    EventBus events_;
    ProviderRegistry registry_;
    Router router_;
    AdapterFactory factory_;

    std::mutex apply_mutex_;
    std::shared_ptr<const GatewayConfig> config_;
};

} // namespace llmgw

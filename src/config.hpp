#pragma once
#include "policy.hpp"
#include "provider.hpp"
#include "router.hpp"
#include "rules.hpp"
#include <chrono>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace llmgw {

// Ceiling for every configured duration. Deadlines are computed as
// steady_clock time points, so larger values would overflow.
constexpr std::chrono::milliseconds kMaxConfiguredDuration{24 * 60 * 60 * 1000};

struct HealthCheckConfig {
    std::chrono::milliseconds interval{30000};
    std::chrono::milliseconds degraded_latency{2000};
};

// One complete configuration snapshot. Built from JSON, validated, then
// handed to Gateway::apply_config; never mutated once applied.
struct GatewayConfig {
    std::string default_strategy = "round_robin";
    std::chrono::milliseconds request_timeout{30000};
    RetryPolicy retry;
    CircuitBreakerConfig circuit_breaker;
    HealthCheckConfig health_check;

    std::vector<ProviderSpec> providers;
    std::vector<RoutingRule> rules;

    std::string source_path;   // file the snapshot came from, if any

    // Load from path (empty: default_path()), merging defaults into the file
    // and applying env overrides. Throws ConfigError when the file cannot be
    // parsed; does not validate.
    static GatewayConfig load(const std::string& path = "");

    // $LLMGW_CONFIG, else ~/.llmgw/config.json
    static std::string default_path();

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Missing keys take their defaults. Wrongly typed values are reported
    // by problems() rather than thrown.
    static GatewayConfig from_json(const nlohmann::json& j);

    // LLMGW_DEFAULT_STRATEGY, LLMGW_REQUEST_TIMEOUT_MS, LLMGW_API_KEY_<ID>
    void apply_env_overrides();

    // Every problem found; empty when the snapshot may be activated.
    std::vector<std::string> problems() const;

    // Throws ConfigError listing problems().
    void validate() const;

    const ProviderSpec* find_provider(const std::string& id) const;

    RoutingConfig routing() const;

private:
    std::vector<std::string> parse_problems_;
};

} // namespace llmgw

#include "gateway.hpp"
#include "error.hpp"
#include <iostream>

namespace llmgw {

Gateway::Gateway(std::shared_ptr<HttpClient> http)
    : http_(std::move(http)),
      router_(registry_, &events_),
      config_(std::make_shared<GatewayConfig>()) {
    factory_ = [this](const ProviderSpec& spec) -> std::shared_ptr<Provider> {
        return create_provider(spec, http_);
    };
}

void Gateway::set_adapter_factory(AdapterFactory factory) {
    std::lock_guard<std::mutex> lock(apply_mutex_);
    factory_ = std::move(factory);
}

void Gateway::apply_config(const GatewayConfig& config) {
    config.validate();

    std::lock_guard<std::mutex> lock(apply_mutex_);

    std::vector<ProviderRef> entries;
    std::vector<std::string> problems;
    size_t carried = 0;
    for (const auto& spec : config.providers) {
        auto existing = registry_.get(spec.id);
        if (existing && existing->spec == spec) {
            entries.push_back(make_provider_entry(spec, existing->adapter, config.retry,
                                                  config.circuit_breaker, existing->health));
            ++carried;
            continue;
        }
        try {
            auto adapter = factory_(spec);
            if (!adapter) {
                problems.push_back("provider '" + spec.id + "': adapter factory returned nothing");
                continue;
            }
            entries.push_back(make_provider_entry(spec, std::move(adapter), config.retry,
                                                  config.circuit_breaker));
        } catch (const std::exception& e) {
            problems.push_back("provider '" + spec.id + "': " + e.what());
        }
    }
    if (!problems.empty()) throw ConfigError(std::move(problems));

    registry_.replace_all(std::move(entries));
    router_.set_config(config.routing());
    std::atomic_store(&config_, std::shared_ptr<const GatewayConfig>(
        std::make_shared<GatewayConfig>(config)));

    std::cerr << "[config] Applied " << config.providers.size() << " providers ("
              << carried << " unchanged), " << config.rules.size() << " rules\n";

    ConfigAppliedEvent ev;
    ev.provider_count = config.providers.size();
    ev.rule_count = config.rules.size();
    ev.default_strategy = config.default_strategy;
    events_.publish(ev);
}

std::vector<Gateway::ProviderStatus> Gateway::status() const {
    std::vector<ProviderStatus> out;
    for (const auto& p : registry_.all()) {
        ProviderStatus s;
        s.id = p->id();
        s.state = p->health->state();
        s.consecutive_failures = p->health->consecutive_failures();
        s.in_flight = p->health->in_flight();
        s.latency_ms = p->health->latency_ms();
        s.total_calls = p->health->total_calls();
        s.total_failures = p->health->total_failures();
        s.failure_rate = p->health->failure_rate();
        out.push_back(std::move(s));
    }
    return out;
}

nlohmann::json Gateway::status_json() const {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& s : status()) {
        arr.push_back({
            {"id", s.id},
            {"state", circuit_state_to_string(s.state)},
            {"consecutive_failures", s.consecutive_failures},
            {"in_flight", s.in_flight},
            {"latency_ms", s.latency_ms},
            {"total_calls", s.total_calls},
            {"total_failures", s.total_failures},
            {"failure_rate", s.failure_rate}
        });
    }
    return arr;
}

} // namespace llmgw

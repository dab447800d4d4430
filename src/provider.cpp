#include "provider.hpp"
#include "plugin.hpp"
#include <algorithm>

namespace llmgw {

const std::vector<long>& default_retry_on_status() {
    static const std::vector<long> statuses = {408, 429, 500, 502, 503, 504};
    return statuses;
}

CallErrorKind classify_http_status(long status, const std::vector<long>& retry_on_status) {
    if (status == 0) return CallErrorKind::Retryable;
    if (std::find(retry_on_status.begin(), retry_on_status.end(), status) != retry_on_status.end()) {
        return CallErrorKind::Retryable;
    }
    return CallErrorKind::NonRetryable;
}

CallErrorKind classify_http_status(long status) {
    return classify_http_status(status, default_retry_on_status());
}

std::chrono::milliseconds CallContext::remaining(TimePoint now) const {
    if (now >= deadline) return std::chrono::milliseconds(0);
    return std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
}

bool ProviderSpec::serves(const std::string& model) const {
    return std::find(models.begin(), models.end(), model) != models.end();
}

bool ProviderSpec::fits(uint32_t context_tokens) const {
    return limits.max_context_tokens == 0 || context_tokens <= limits.max_context_tokens;
}

bool operator==(const ProviderSpec& a, const ProviderSpec& b) {
    return a.id == b.id &&
           a.type == b.type &&
           a.models == b.models &&
           a.limits.max_context_tokens == b.limits.max_context_tokens &&
           a.limits.max_output_tokens == b.limits.max_output_tokens &&
           a.limits.supports_streaming == b.limits.supports_streaming &&
           a.limits.supports_tools == b.limits.supports_tools &&
           a.endpoint.base_url == b.endpoint.base_url &&
           a.endpoint.path == b.endpoint.path &&
           a.endpoint.health_path == b.endpoint.health_path &&
           a.endpoint.api_key == b.endpoint.api_key &&
           a.endpoint.degraded_latency == b.endpoint.degraded_latency &&
           a.endpoint.retry_on_status == b.endpoint.retry_on_status &&
           a.weight == b.weight &&
           a.cost == b.cost &&
           a.enabled == b.enabled &&
           a.retry == b.retry &&
           a.circuit_breaker == b.circuit_breaker;
}

ProviderRef make_provider_entry(ProviderSpec spec,
                                std::shared_ptr<Provider> adapter,
                                const RetryPolicy& default_retry,
                                const CircuitBreakerConfig& default_breaker,
                                std::shared_ptr<ProviderHealthState> carried) {
    auto entry = std::make_shared<ProviderEntry>();
    entry->retry = spec.retry.value_or(default_retry);
    CircuitBreakerConfig breaker = spec.circuit_breaker.value_or(default_breaker);
    if (carried && carried->provider_id() == spec.id && carried->config() == breaker) {
        entry->health = std::move(carried);
    } else {
        entry->health = std::make_shared<ProviderHealthState>(spec.id, breaker);
    }
    entry->adapter = std::move(adapter);
    entry->spec = std::move(spec);
    return entry;
}

std::unique_ptr<Provider> create_provider(const ProviderSpec& spec,
                                          std::shared_ptr<HttpClient> http) {
    return PluginRegistry::instance().create_provider(spec.type, spec, std::move(http));
}

} // namespace llmgw

#include "compatible.hpp"
#include "../plugin.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <iostream>

static llmgw::ProviderRegistrar reg_compatible("compatible",
    [](const llmgw::ProviderSpec& spec, std::shared_ptr<llmgw::HttpClient> http) {
        return std::make_unique<llmgw::CompatibleProvider>(spec, std::move(http));
    });

using json = nlohmann::json;

namespace llmgw {

static std::string join_url(const std::string& base, const std::string& path) {
    if (path.empty()) return base;
    if (!base.empty() && base.back() == '/' && path.front() == '/') {
        return base + path.substr(1);
    }
    if (!base.empty() && base.back() != '/' && path.front() != '/') {
        return base + "/" + path;
    }
    return base + path;
}

// Usage counters are informational; a malformed one never fails the call.
static uint32_t token_count(const json& usage, const char* key, uint32_t fallback) {
    auto it = usage.find(key);
    if (it == usage.end() || !it->is_number_unsigned()) return fallback;
    auto value = it->get<uint64_t>();
    return value > UINT32_MAX ? fallback : static_cast<uint32_t>(value);
}

static std::string snippet(const std::string& body) {
    constexpr size_t kMax = 200;
    if (body.size() <= kMax) return body;
    return body.substr(0, kMax) + "...";
}

CompatibleProvider::CompatibleProvider(ProviderSpec spec, std::shared_ptr<HttpClient> http)
    : spec_(std::move(spec)), http_(std::move(http)) {
    if (!http_) throw std::invalid_argument("CompatibleProvider requires an HTTP client");
    if (spec_.endpoint.base_url.empty()) {
        throw std::invalid_argument("Provider " + spec_.id + " has no base_url");
    }
}

std::vector<Header> CompatibleProvider::build_headers() const {
    std::vector<Header> headers = {{"Content-Type", "application/json"}};
    if (!spec_.endpoint.api_key.empty()) {
        headers.emplace_back("Authorization", "Bearer " + spec_.endpoint.api_key);
    }
    return headers;
}

CanonicalResponse CompatibleProvider::invoke(const CanonicalRequest& request,
                                             const CallContext& ctx) {
    auto remaining = ctx.remaining();
    if (remaining.count() <= 0 || ctx.aborted()) {
        throw ProviderCallError(CallErrorKind::Timeout, spec_.id + ": no time left for call");
    }

    HttpRequestOptions options;
    options.timeout = remaining;
    options.abort = ctx.abort;

    static const std::string kEmpty;
    const std::string& body = request.payload ? *request.payload : kEmpty;
    auto resp = http_->post(join_url(spec_.endpoint.base_url, spec_.endpoint.path),
                            body, build_headers(), options);

    if (resp.timed_out) {
        throw ProviderCallError(CallErrorKind::Timeout, spec_.id + ": request timed out");
    }
    if (resp.status_code == 0) {
        throw ProviderCallError(CallErrorKind::Retryable,
                                spec_.id + ": connection failed: " + resp.error);
    }
    if (resp.status_code < 200 || resp.status_code >= 300) {
        throw ProviderCallError(classify_http_status(resp.status_code,
                                                     spec_.endpoint.retry_on_status),
                                spec_.id + ": HTTP " + std::to_string(resp.status_code) +
                                    ": " + snippet(resp.body),
                                resp.status_code);
    }

    CanonicalResponse out;
    out.provider_id = spec_.id;
    out.model = request.model;

    // Payloads are opaque; pick out model and usage only when the body is JSON.
    auto parsed = json::parse(resp.body, nullptr, false);
    if (!parsed.is_discarded() && parsed.is_object()) {
        if (parsed.contains("model") && parsed["model"].is_string()) {
            out.model = parsed["model"].get<std::string>();
        }
        if (parsed.contains("usage") && parsed["usage"].is_object()) {
            const auto& usage = parsed["usage"];
            out.usage.prompt_tokens = token_count(usage, "prompt_tokens", 0);
            out.usage.completion_tokens = token_count(usage, "completion_tokens", 0);
            out.usage.total_tokens = token_count(usage, "total_tokens",
                out.usage.prompt_tokens + out.usage.completion_tokens);
        }
    }
    out.body = std::move(resp.body);
    return out;
}

HealthStatus CompatibleProvider::health_check() {
    HttpRequestOptions options;
    options.timeout = kHealthTimeout;

    auto start = SteadyClock::now();
    auto resp = http_->get(join_url(spec_.endpoint.base_url, spec_.endpoint.health_path),
                           build_headers(), options);
    auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(
        SteadyClock::now() - start);

    if (resp.status_code >= 200 && resp.status_code < 300) {
        return latency <= spec_.endpoint.degraded_latency ? HealthStatus::Healthy
                                                          : HealthStatus::Degraded;
    }
    if (resp.status_code == 429) return HealthStatus::Degraded;

    std::cerr << "[health] " << spec_.id << ": "
              << (resp.status_code == 0 ? resp.error : "HTTP " + std::to_string(resp.status_code))
              << '\n';
    return HealthStatus::Unhealthy;
}

} // namespace llmgw

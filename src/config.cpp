#include "config.hpp"
#include "error.hpp"
#include "load_balancer.hpp"
#include "util.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <unordered_set>

namespace llmgw {

using json = nlohmann::json;
using std::chrono::milliseconds;

json GatewayConfig::defaults_json() {
    return {
        {"default_strategy", "round_robin"},
        {"request_timeout_ms", 30000},
        {"retry", {
            {"max_attempts", 3},
            {"base_delay_ms", 100},
            {"max_delay_ms", 10000},
            {"multiplier", 2.0},
            {"jitter", 0.25},
            {"attempt_timeout_ms", 30000},
            {"retry_on_status", default_retry_on_status()}
        }},
        {"circuit_breaker", {
            {"failure_threshold", 5},
            {"success_threshold", 3},
            {"open_timeout_ms", 30000}
        }},
        {"health_check", {
            {"interval_ms", 30000},
            {"degraded_latency_ms", 2000}
        }},
        {"providers", json::array()},
        {"rules", json::array()}
    };
}

static json merge_defaults(const json& existing, const json& defaults) {
    json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

std::string GatewayConfig::default_path() {
    if (const char* v = std::getenv("LLMGW_CONFIG")) {
        if (*v) return expand_home(v);
    }
    return expand_home("~/.llmgw/config.json");
}

GatewayConfig GatewayConfig::load(const std::string& path) {
    std::string config_path = path.empty() ? default_path() : expand_home(path);
    json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        json original;
        try {
            original = json::parse(file);
        } catch (const json::parse_error& e) {
            throw ConfigError({config_path + ": " + e.what()});
        }
        file.close();
        if (!original.is_object()) {
            throw ConfigError({config_path + ": top level must be a JSON object"});
        }
        j = merge_defaults(original, defaults_json());
        if (j != original) {
            if (atomic_write_file(config_path, j.dump(4) + "\n")) {
                std::cerr << "[config] Migrated config with new defaults: "
                          << config_path << "\n";
            }
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        }
    }

    GatewayConfig cfg = from_json(j);
    cfg.source_path = config_path;
    cfg.apply_env_overrides();
    return cfg;
}

// ── JSON field readers ──────────────────────────────────────────
// Each reader leaves `out` untouched when the key is absent and records a
// problem when it is present with the wrong type.

namespace {

struct Reader {
    const json& obj;
    std::string where;
    std::vector<std::string>& problems;

    bool has(const char* key) const { return obj.contains(key) && !obj[key].is_null(); }

    void bad(const char* key, const char* expected) {
        problems.push_back(where + "." + key + " must be " + expected);
    }

    void str(const char* key, std::string& out) {
        if (!has(key)) return;
        if (obj[key].is_string()) out = obj[key].get<std::string>();
        else bad(key, "a string");
    }

    void boolean(const char* key, bool& out) {
        if (!has(key)) return;
        if (obj[key].is_boolean()) out = obj[key].get<bool>();
        else bad(key, "a boolean");
    }

    void u32(const char* key, uint32_t& out) {
        if (!has(key)) return;
        if (obj[key].is_number_unsigned()) out = obj[key].get<uint32_t>();
        else bad(key, "a non-negative integer");
    }

    void i32(const char* key, int32_t& out) {
        if (!has(key)) return;
        if (obj[key].is_number_integer()) out = obj[key].get<int32_t>();
        else bad(key, "an integer");
    }

    void number(const char* key, double& out) {
        if (!has(key)) return;
        if (obj[key].is_number()) out = obj[key].get<double>();
        else bad(key, "a number");
    }

    void ms(const char* key, milliseconds& out) {
        if (!has(key)) return;
        if (!obj[key].is_number_unsigned()) {
            bad(key, "a non-negative integer (milliseconds)");
            return;
        }
        auto value = obj[key].get<uint64_t>();
        if (value > static_cast<uint64_t>(kMaxConfiguredDuration.count())) {
            bad(key, "at most 86400000 (24 hours)");
            return;
        }
        out = milliseconds(static_cast<int64_t>(value));
    }

    void strings(const char* key, std::vector<std::string>& out) {
        if (!has(key)) return;
        const auto& arr = obj[key];
        if (!arr.is_array()) { bad(key, "an array of strings"); return; }
        out.clear();
        for (const auto& v : arr) {
            if (v.is_string()) out.push_back(v.get<std::string>());
            else { bad(key, "an array of strings"); return; }
        }
    }

    void statuses(const char* key, std::vector<long>& out) {
        if (!has(key)) return;
        const auto& arr = obj[key];
        std::vector<long> parsed;
        if (arr.is_array()) {
            for (const auto& v : arr) {
                if (!v.is_number_unsigned() || v.get<uint64_t>() < 100 || v.get<uint64_t>() > 599) {
                    bad(key, "an array of HTTP status codes (100-599)");
                    return;
                }
                parsed.push_back(static_cast<long>(v.get<uint64_t>()));
            }
            out = std::move(parsed);
        } else {
            bad(key, "an array of HTTP status codes (100-599)");
        }
    }

    // Nested object reader; nullopt (plus a problem) when not an object.
    std::optional<Reader> object(const char* key) {
        if (!has(key)) return std::nullopt;
        if (!obj[key].is_object()) { bad(key, "an object"); return std::nullopt; }
        return Reader{obj[key], where + "." + key, problems};
    }
};

void read_retry(Reader r, RetryPolicy& p) {
    r.u32("max_attempts", p.max_attempts);
    r.ms("base_delay_ms", p.base_delay);
    r.ms("max_delay_ms", p.max_delay);
    r.number("multiplier", p.backoff_multiplier);
    r.number("jitter", p.jitter_fraction);
    r.ms("attempt_timeout_ms", p.attempt_timeout);
}

void read_breaker(Reader r, CircuitBreakerConfig& c) {
    r.u32("failure_threshold", c.failure_threshold);
    r.u32("success_threshold", c.success_threshold);
    r.ms("open_timeout_ms", c.open_timeout);
}

} // namespace

GatewayConfig GatewayConfig::from_json(const json& j) {
    GatewayConfig cfg;
    auto& problems = cfg.parse_problems_;
    if (!j.is_object()) {
        problems.push_back("configuration must be a JSON object");
        return cfg;
    }

    Reader root{j, "config", problems};
    root.str("default_strategy", cfg.default_strategy);
    root.ms("request_timeout_ms", cfg.request_timeout);
    // Statuses are an adapter concern, so they land on each endpoint rather
    // than in the executor's RetryPolicy.
    std::vector<long> retry_on_status = default_retry_on_status();
    if (auto r = root.object("retry")) {
        read_retry(*r, cfg.retry);
        r->statuses("retry_on_status", retry_on_status);
    }
    if (auto r = root.object("circuit_breaker")) read_breaker(*r, cfg.circuit_breaker);
    if (auto r = root.object("health_check")) {
        r->ms("interval_ms", cfg.health_check.interval);
        r->ms("degraded_latency_ms", cfg.health_check.degraded_latency);
    }

    if (j.contains("providers")) {
        const auto& arr = j["providers"];
        if (!arr.is_array()) {
            problems.push_back("config.providers must be an array");
        } else {
            for (size_t i = 0; i < arr.size(); ++i) {
                std::string where = "providers[" + std::to_string(i) + "]";
                if (!arr[i].is_object()) {
                    problems.push_back(where + " must be an object");
                    continue;
                }
                Reader r{arr[i], where, problems};
                ProviderSpec spec;
                r.str("id", spec.id);
                r.str("type", spec.type);
                r.str("base_url", spec.endpoint.base_url);
                r.str("path", spec.endpoint.path);
                r.str("health_path", spec.endpoint.health_path);
                r.str("api_key", spec.endpoint.api_key);
                r.strings("models", spec.models);
                r.u32("weight", spec.weight);
                r.number("cost", spec.cost);
                r.u32("max_context_tokens", spec.limits.max_context_tokens);
                r.u32("max_output_tokens", spec.limits.max_output_tokens);
                r.boolean("supports_streaming", spec.limits.supports_streaming);
                r.boolean("supports_tools", spec.limits.supports_tools);
                r.boolean("enabled", spec.enabled);
                spec.endpoint.retry_on_status = retry_on_status;
                if (auto sub = r.object("retry")) {
                    RetryPolicy p = cfg.retry;
                    read_retry(*sub, p);
                    spec.retry = p;
                    sub->statuses("retry_on_status", spec.endpoint.retry_on_status);
                }
                if (auto sub = r.object("circuit_breaker")) {
                    CircuitBreakerConfig c = cfg.circuit_breaker;
                    read_breaker(*sub, c);
                    spec.circuit_breaker = c;
                }
                spec.endpoint.degraded_latency = cfg.health_check.degraded_latency;
                cfg.providers.push_back(std::move(spec));
            }
        }
    }

    if (j.contains("rules")) {
        const auto& arr = j["rules"];
        if (!arr.is_array()) {
            problems.push_back("config.rules must be an array");
        } else {
            for (size_t i = 0; i < arr.size(); ++i) {
                std::string where = "rules[" + std::to_string(i) + "]";
                if (!arr[i].is_object()) {
                    problems.push_back(where + " must be an object");
                    continue;
                }
                Reader r{arr[i], where, problems};
                RoutingRule rule;
                r.str("name", rule.name);
                r.i32("priority", rule.priority);
                r.boolean("enabled", rule.enabled);
                r.str("model", rule.model_pattern);
                r.str("tag", rule.tag);
                if (auto h = r.object("header")) {
                    h->str("name", rule.header_name);
                    h->str("value", rule.header_value);
                }
                r.str("provider", rule.provider);
                r.strings("fallback", rule.fallback);
                r.str("strategy", rule.strategy);
                cfg.rules.push_back(std::move(rule));
            }
        }
    }
    return cfg;
}

void GatewayConfig::apply_env_overrides() {
    // Environment variables always override config file
    if (const char* v = std::getenv("LLMGW_DEFAULT_STRATEGY")) {
        std::string strategy = trim(v);
        if (!strategy.empty()) default_strategy = strategy;
    }
    if (const char* v = std::getenv("LLMGW_REQUEST_TIMEOUT_MS")) {
        char* end = nullptr;
        unsigned long long ms = std::strtoull(v, &end, 10);
        if (*v && end && *end == '\0' &&
            ms <= static_cast<unsigned long long>(kMaxConfiguredDuration.count())) {
            request_timeout = milliseconds(static_cast<int64_t>(ms));
        } else if (*v && end && *end == '\0') {
            parse_problems_.push_back(std::string("LLMGW_REQUEST_TIMEOUT_MS exceeds 24 hours: ") + v);
        } else {
            parse_problems_.push_back(std::string("LLMGW_REQUEST_TIMEOUT_MS is not a number: ") + v);
        }
    }
    for (auto& spec : providers) {
        std::string var = "LLMGW_API_KEY_" + env_key(spec.id);
        if (const char* v = std::getenv(var.c_str())) spec.endpoint.api_key = v;
    }
}

// ── Validation ──────────────────────────────────────────────────

static void check_duration(milliseconds d, const std::string& what, bool positive,
                           std::vector<std::string>& out) {
    if (positive && d.count() <= 0) out.push_back(what + " must be positive");
    else if (d.count() < 0 || d > kMaxConfiguredDuration)
        out.push_back(what + " must be between 0 and 86400000 ms");
}

static void check_retry(const RetryPolicy& p, const std::string& where,
                        std::vector<std::string>& out) {
    if (p.max_attempts < 1) out.push_back(where + ".max_attempts must be at least 1");
    if (p.backoff_multiplier < 1.0) out.push_back(where + ".multiplier must be at least 1");
    if (p.jitter_fraction < 0.0 || p.jitter_fraction > 1.0)
        out.push_back(where + ".jitter must be between 0 and 1");
    if (p.base_delay > p.max_delay)
        out.push_back(where + ".base_delay_ms must not exceed max_delay_ms");
    check_duration(p.base_delay, where + ".base_delay_ms", false, out);
    check_duration(p.max_delay, where + ".max_delay_ms", false, out);
    check_duration(p.attempt_timeout, where + ".attempt_timeout_ms", true, out);
}

static void check_breaker(const CircuitBreakerConfig& c, const std::string& where,
                          std::vector<std::string>& out) {
    if (c.failure_threshold < 1) out.push_back(where + ".failure_threshold must be at least 1");
    if (c.success_threshold < 1) out.push_back(where + ".success_threshold must be at least 1");
    check_duration(c.open_timeout, where + ".open_timeout_ms", true, out);
}

std::vector<std::string> GatewayConfig::problems() const {
    std::vector<std::string> out = parse_problems_;

    if (!is_known_strategy(default_strategy))
        out.push_back("unknown default_strategy '" + default_strategy + "'");
    check_duration(request_timeout, "request_timeout_ms", true, out);
    check_retry(retry, "retry", out);
    check_breaker(circuit_breaker, "circuit_breaker", out);
    check_duration(health_check.interval, "health_check.interval_ms", true, out);
    check_duration(health_check.degraded_latency, "health_check.degraded_latency_ms", false, out);

    std::unordered_set<std::string> ids;
    for (const auto& p : providers) {
        std::string where = "provider '" + p.id + "'";
        if (p.id.empty()) {
            out.push_back("provider with empty id");
            continue;
        }
        if (!ids.insert(p.id).second) out.push_back("duplicate provider id '" + p.id + "'");
        if (p.enabled && p.models.empty()) out.push_back(where + " lists no models");
        if (p.cost < 0.0) out.push_back(where + " has negative cost");
        if (p.type == "compatible" && p.endpoint.base_url.empty())
            out.push_back(where + " has no base_url");
        if (p.retry) check_retry(*p.retry, where + " retry", out);
        if (p.circuit_breaker) check_breaker(*p.circuit_breaker, where + " circuit_breaker", out);
    }

    for (const auto& rule : rules) {
        std::string where = "rule '" + rule.name + "'";
        if (rule.name.empty()) out.push_back("rule with empty name");
        if (!rule.has_predicate()) out.push_back(where + " has no model, tag or header predicate");
        if (rule.provider.empty() == rule.strategy.empty())
            out.push_back(where + " must name exactly one of provider or strategy");
        if (!rule.strategy.empty() && !is_known_strategy(rule.strategy))
            out.push_back(where + " uses unknown strategy '" + rule.strategy + "'");
        if (rule.provider.empty() && !rule.fallback.empty())
            out.push_back(where + " has a fallback chain without a provider");

        for (const auto& id : rule.chain()) {
            const ProviderSpec* p = find_provider(id);
            if (!p) out.push_back(where + " references unknown provider '" + id + "'");
            else if (!p->enabled) out.push_back(where + " references disabled provider '" + id + "'");
        }
    }
    return out;
}

void GatewayConfig::validate() const {
    auto found = problems();
    if (!found.empty()) throw ConfigError(std::move(found));
}

const ProviderSpec* GatewayConfig::find_provider(const std::string& id) const {
    auto it = std::find_if(providers.begin(), providers.end(),
                           [&](const ProviderSpec& p) { return p.id == id; });
    return it == providers.end() ? nullptr : &*it;
}

RoutingConfig GatewayConfig::routing() const {
    RoutingConfig rc;
    rc.rules = rules;
    sort_rules(rc.rules);
    rc.default_strategy = default_strategy;
    rc.request_timeout = request_timeout;
    return rc;
}

} // namespace llmgw

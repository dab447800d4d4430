#include <catch2/catch.hpp>
#include "config.hpp"
#include "error.hpp"
#include <fstream>
#include <filesystem>
#include <cstdlib>
#include <sstream>
#include <unistd.h>
#include <nlohmann/json.hpp>

using namespace llmgw;
using json = nlohmann::json;
using std::chrono::milliseconds;

// ── Helpers ──────────────────────────────────────────────────────

static bool has_problem(const GatewayConfig& cfg, const std::string& fragment) {
    for (const auto& p : cfg.problems()) {
        if (p.find(fragment) != std::string::npos) return true;
    }
    return false;
}

static json two_provider_config() {
    return json::parse(R"({
        "default_strategy": "least_latency",
        "request_timeout_ms": 5000,
        "retry": {"max_attempts": 4, "base_delay_ms": 50},
        "circuit_breaker": {"failure_threshold": 2, "open_timeout_ms": 1000},
        "providers": [
            {"id": "openai", "base_url": "https://api.openai.com", "models": ["gpt-4o"],
             "weight": 3, "cost": 1.5, "max_context_tokens": 128000},
            {"id": "local", "base_url": "http://localhost:8080", "models": ["gpt-4o", "llama3"],
             "retry": {"max_attempts": 1}, "circuit_breaker": {"failure_threshold": 10}}
        ],
        "rules": [
            {"name": "pin-llama", "priority": 10, "model": "llama*", "provider": "local"},
            {"name": "batch", "priority": 20, "tag": "batch", "strategy": "cost_optimized"}
        ]
    })");
}

// ── Default values ───────────────────────────────────────────────

TEST_CASE("GatewayConfig: default values are sensible", "[config]") {
    GatewayConfig cfg;
    REQUIRE(cfg.default_strategy == "round_robin");
    REQUIRE(cfg.request_timeout == milliseconds(30000));
    REQUIRE(cfg.retry.max_attempts == 3);
    REQUIRE(cfg.circuit_breaker.failure_threshold == 5);
    REQUIRE(cfg.providers.empty());
    REQUIRE(cfg.problems().empty());
}

TEST_CASE("GatewayConfig: defaults_json round-trips to default values", "[config]") {
    auto cfg = GatewayConfig::from_json(GatewayConfig::defaults_json());
    GatewayConfig plain;
    REQUIRE(cfg.default_strategy == plain.default_strategy);
    REQUIRE(cfg.retry == plain.retry);
    REQUIRE(cfg.circuit_breaker == plain.circuit_breaker);
    REQUIRE(cfg.health_check.interval == plain.health_check.interval);
}

// ── from_json ────────────────────────────────────────────────────

TEST_CASE("GatewayConfig::from_json: reads providers, policies and rules", "[config]") {
    auto cfg = GatewayConfig::from_json(two_provider_config());
    REQUIRE(cfg.problems().empty());

    REQUIRE(cfg.default_strategy == "least_latency");
    REQUIRE(cfg.request_timeout == milliseconds(5000));
    REQUIRE(cfg.retry.max_attempts == 4);
    REQUIRE(cfg.retry.base_delay == milliseconds(50));
    REQUIRE(cfg.retry.max_delay == milliseconds(10000));
    REQUIRE(cfg.circuit_breaker.failure_threshold == 2);

    REQUIRE(cfg.providers.size() == 2);
    const auto* openai = cfg.find_provider("openai");
    REQUIRE(openai != nullptr);
    REQUIRE(openai->type == "compatible");
    REQUIRE(openai->weight == 3);
    REQUIRE(openai->cost == 1.5);
    REQUIRE(openai->limits.max_context_tokens == 128000);
    REQUIRE_FALSE(openai->retry.has_value());

    const auto* local = cfg.find_provider("local");
    REQUIRE(local->retry->max_attempts == 1);
    REQUIRE(local->retry->base_delay == milliseconds(50));   // inherits the global policy
    REQUIRE(local->circuit_breaker->failure_threshold == 10);
    REQUIRE(local->circuit_breaker->open_timeout == milliseconds(1000));

    REQUIRE(cfg.rules.size() == 2);
    REQUIRE(cfg.rules[0].model_pattern == "llama*");
    REQUIRE(cfg.rules[1].tag == "batch");
    REQUIRE(cfg.find_provider("missing") == nullptr);
}

TEST_CASE("GatewayConfig::from_json: header rule", "[config]") {
    auto cfg = GatewayConfig::from_json(json::parse(R"({
        "providers": [{"id": "a", "base_url": "http://a", "models": ["m"]}],
        "rules": [{"name": "tenant", "header": {"name": "X-Tenant", "value": "acme"},
                   "provider": "a"}]
    })"));
    REQUIRE(cfg.problems().empty());
    REQUIRE(cfg.rules[0].header_name == "X-Tenant");
    REQUIRE(cfg.rules[0].header_value == "acme");
}

TEST_CASE("GatewayConfig::from_json: degraded latency reaches every endpoint", "[config]") {
    auto j = two_provider_config();
    j["health_check"] = {{"degraded_latency_ms", 750}};
    auto cfg = GatewayConfig::from_json(j);
    for (const auto& p : cfg.providers) {
        REQUIRE(p.endpoint.degraded_latency == milliseconds(750));
    }
}

TEST_CASE("GatewayConfig::from_json: retry_on_status global and per provider", "[config]") {
    auto j = two_provider_config();
    j["retry"]["retry_on_status"] = {429, 503};
    j["providers"][1]["retry"]["retry_on_status"] = {500, 501};
    auto cfg = GatewayConfig::from_json(j);
    REQUIRE(cfg.problems().empty());
    REQUIRE(cfg.find_provider("openai")->endpoint.retry_on_status == std::vector<long>{429, 503});
    REQUIRE(cfg.find_provider("local")->endpoint.retry_on_status == std::vector<long>{500, 501});
}

TEST_CASE("GatewayConfig::from_json: retry_on_status defaults", "[config]") {
    auto cfg = GatewayConfig::from_json(two_provider_config());
    for (const auto& p : cfg.providers) {
        REQUIRE(p.endpoint.retry_on_status == default_retry_on_status());
    }
}

TEST_CASE("GatewayConfig::from_json: retry_on_status must hold status codes", "[config]") {
    auto j = two_provider_config();
    j["retry"]["retry_on_status"] = {503, 42};
    j["providers"][1]["retry"]["retry_on_status"] = "503";
    auto cfg = GatewayConfig::from_json(j);
    REQUIRE(has_problem(cfg, "config.retry.retry_on_status must be an array of HTTP status codes"));
    REQUIRE(has_problem(cfg, "providers[1].retry.retry_on_status"));
    REQUIRE(cfg.find_provider("openai")->endpoint.retry_on_status == default_retry_on_status());
}

TEST_CASE("GatewayConfig::from_json: wrong types become problems", "[config]") {
    auto cfg = GatewayConfig::from_json(json::parse(R"({
        "request_timeout_ms": "soon",
        "retry": {"max_attempts": -1},
        "providers": [{"id": "a", "base_url": "http://a", "models": "m"}, 7]
    })"));
    REQUIRE(has_problem(cfg, "request_timeout_ms"));
    REQUIRE(has_problem(cfg, "retry.max_attempts"));
    REQUIRE(has_problem(cfg, "providers[0].models"));
    REQUIRE(has_problem(cfg, "providers[1] must be an object"));
}

TEST_CASE("GatewayConfig::from_json: non-object is a problem", "[config]") {
    auto cfg = GatewayConfig::from_json(json::array());
    REQUIRE(has_problem(cfg, "must be a JSON object"));
}

// ── Validation ───────────────────────────────────────────────────

TEST_CASE("GatewayConfig::validate: unknown rule provider blocks activation", "[config]") {
    auto j = two_provider_config();
    j["rules"][0]["provider"] = "ghost";
    auto cfg = GatewayConfig::from_json(j);
    REQUIRE(has_problem(cfg, "unknown provider 'ghost'"));
    try {
        cfg.validate();
        FAIL("expected ConfigError");
    } catch (const ConfigError& e) {
        REQUIRE_FALSE(e.problems().empty());
    }
}

TEST_CASE("GatewayConfig::validate: fallback to a disabled provider", "[config]") {
    auto j = two_provider_config();
    j["providers"][1]["enabled"] = false;
    auto cfg = GatewayConfig::from_json(j);
    REQUIRE(has_problem(cfg, "disabled provider 'local'"));
}

TEST_CASE("GatewayConfig::validate: structural problems", "[config]") {
    auto j = two_provider_config();
    j["default_strategy"] = "fastest";
    j["providers"].push_back({{"id", "openai"}, {"base_url", "http://dup"}, {"models", {"m"}}});
    j["providers"].push_back({{"id", "nomodels"}, {"base_url", "http://x"}});
    j["providers"].push_back({{"id", "nourl"}, {"models", {"m"}}});
    j["rules"].push_back({{"name", "both"}, {"model", "*"}, {"provider", "openai"},
                          {"strategy", "weighted"}});
    j["rules"].push_back({{"name", "nopred"}, {"strategy", "weighted"}});
    j["rules"].push_back({{"name", "badstrat"}, {"model", "*"}, {"strategy", "random"}});
    j["retry"]["multiplier"] = 0.5;
    j["circuit_breaker"]["success_threshold"] = 0;

    auto cfg = GatewayConfig::from_json(j);
    REQUIRE(has_problem(cfg, "unknown default_strategy 'fastest'"));
    REQUIRE(has_problem(cfg, "duplicate provider id 'openai'"));
    REQUIRE(has_problem(cfg, "'nomodels' lists no models"));
    REQUIRE(has_problem(cfg, "'nourl' has no base_url"));
    REQUIRE(has_problem(cfg, "'both' must name exactly one"));
    REQUIRE(has_problem(cfg, "'nopred' has no model, tag or header predicate"));
    REQUIRE(has_problem(cfg, "unknown strategy 'random'"));
    REQUIRE(has_problem(cfg, "retry.multiplier"));
    REQUIRE(has_problem(cfg, "success_threshold"));
    REQUIRE_THROWS_AS(cfg.validate(), ConfigError);
}

TEST_CASE("GatewayConfig::from_json: durations above 24 hours are rejected", "[config]") {
    auto cfg = GatewayConfig::from_json(json::parse(R"({
        "request_timeout_ms": 10000000000000,
        "retry": {"attempt_timeout_ms": 86400001},
        "circuit_breaker": {"open_timeout_ms": 18446744073709551615}
    })"));
    REQUIRE(has_problem(cfg, "request_timeout_ms must be at most 86400000"));
    REQUIRE(has_problem(cfg, "retry.attempt_timeout_ms must be at most 86400000"));
    REQUIRE(has_problem(cfg, "circuit_breaker.open_timeout_ms must be at most 86400000"));
    // Rejected values never reach the snapshot.
    REQUIRE(cfg.request_timeout == GatewayConfig{}.request_timeout);
    REQUIRE_THROWS_AS(cfg.validate(), ConfigError);
}

TEST_CASE("GatewayConfig::from_json: 24 hours exactly is accepted", "[config]") {
    auto cfg = GatewayConfig::from_json(json::parse(R"({"request_timeout_ms": 86400000})"));
    REQUIRE(cfg.request_timeout == std::chrono::hours(24));
    REQUIRE(cfg.problems().empty());
}

TEST_CASE("GatewayConfig::validate: out-of-range durations set in code", "[config]") {
    GatewayConfig cfg;
    cfg.request_timeout = std::chrono::hours(25);
    cfg.retry.max_delay = std::chrono::hours(48);
    cfg.circuit_breaker.open_timeout = milliseconds(0);
    cfg.health_check.degraded_latency = std::chrono::hours(30);
    REQUIRE(has_problem(cfg, "request_timeout_ms must be between 0 and 86400000"));
    REQUIRE(has_problem(cfg, "retry.max_delay_ms must be between"));
    REQUIRE(has_problem(cfg, "circuit_breaker.open_timeout_ms must be positive"));
    REQUIRE(has_problem(cfg, "health_check.degraded_latency_ms must be between"));
}

TEST_CASE("GatewayConfig::validate: base_url only required for compatible adapters", "[config]") {
    GatewayConfig cfg;
    ProviderSpec spec;
    spec.id = "custom";
    spec.type = "in_process";
    spec.models = {"m"};
    cfg.providers.push_back(spec);
    REQUIRE(cfg.problems().empty());
}

// ── routing() ────────────────────────────────────────────────────

TEST_CASE("GatewayConfig::routing: rules sorted by priority", "[config]") {
    auto j = two_provider_config();
    j["rules"][0]["priority"] = 50;
    auto rc = GatewayConfig::from_json(j).routing();
    REQUIRE(rc.rules[0].name == "batch");
    REQUIRE(rc.rules[1].name == "pin-llama");
    REQUIRE(rc.default_strategy == "least_latency");
    REQUIRE(rc.request_timeout == milliseconds(5000));
}

// ── Config::load ────────────────────────────────────────────────

// Helper: create a temp directory
static std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "llmgw_cfg_XXXXXX";
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    return result ? std::string(result) : "";
}

// RAII guard: redirects HOME to a temp dir, clears env vars, restores on destruction
struct ConfigTestGuard {
    std::string dir;
    std::string old_home;

    ConfigTestGuard() {
        dir = make_temp_dir();
        old_home = std::getenv("HOME") ? std::getenv("HOME") : "";
        setenv("HOME", dir.c_str(), 1);
        unsetenv("LLMGW_CONFIG");
        unsetenv("LLMGW_DEFAULT_STRATEGY");
        unsetenv("LLMGW_REQUEST_TIMEOUT_MS");
        unsetenv("LLMGW_API_KEY_OPENAI");
    }

    ~ConfigTestGuard() {
        setenv("HOME", old_home.c_str(), 1);
        unsetenv("LLMGW_CONFIG");
        std::filesystem::remove_all(dir);
    }

    ConfigTestGuard(const ConfigTestGuard&) = delete;
    ConfigTestGuard& operator=(const ConfigTestGuard&) = delete;

    std::string config_path() const { return dir + "/.llmgw/config.json"; }

    void write_config(const std::string& content) {
        std::filesystem::create_directories(dir + "/.llmgw");
        std::ofstream f(config_path());
        f << content;
    }

    json read_config() const {
        std::ifstream f(config_path());
        return json::parse(f);
    }
};

TEST_CASE("GatewayConfig::load: reads the default path", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());
    g.write_config(two_provider_config().dump());

    auto cfg = GatewayConfig::load();
    REQUIRE(cfg.source_path == g.config_path());
    REQUIRE(cfg.providers.size() == 2);
    REQUIRE(cfg.default_strategy == "least_latency");
}

TEST_CASE("GatewayConfig::load: LLMGW_CONFIG selects the file", "[config]") {
    ConfigTestGuard g;
    auto path = g.dir + "/elsewhere.json";
    {
        std::ofstream f(path);
        f << R"({"default_strategy": "weighted"})";
    }
    setenv("LLMGW_CONFIG", path.c_str(), 1);
    REQUIRE(GatewayConfig::default_path() == path);
    REQUIRE(GatewayConfig::load().default_strategy == "weighted");
}

TEST_CASE("GatewayConfig::load: missing file is created with defaults", "[config]") {
    ConfigTestGuard g;
    auto cfg = GatewayConfig::load();
    REQUIRE(cfg.default_strategy == "round_robin");
    REQUIRE(std::filesystem::exists(g.config_path()));
    REQUIRE(g.read_config() == GatewayConfig::defaults_json());
}

TEST_CASE("GatewayConfig::load: merges new defaults into an existing file", "[config]") {
    ConfigTestGuard g;
    g.write_config(R"({"default_strategy": "priority", "retry": {"max_attempts": 7}})");

    auto cfg = GatewayConfig::load();
    REQUIRE(cfg.default_strategy == "priority");
    REQUIRE(cfg.retry.max_attempts == 7);

    auto on_disk = g.read_config();
    REQUIRE(on_disk["default_strategy"] == "priority");
    REQUIRE(on_disk["retry"]["max_attempts"] == 7);
    REQUIRE(on_disk["retry"]["base_delay_ms"] == 100);
    REQUIRE(on_disk.contains("circuit_breaker"));
}

TEST_CASE("GatewayConfig::load: malformed JSON is a ConfigError", "[config]") {
    ConfigTestGuard g;
    g.write_config("not valid json {{{");
    REQUIRE_THROWS_AS(GatewayConfig::load(), ConfigError);
}

TEST_CASE("GatewayConfig::load: non-object top level is a ConfigError", "[config]") {
    ConfigTestGuard g;
    g.write_config("[1, 2, 3]");
    REQUIRE_THROWS_AS(GatewayConfig::load(), ConfigError);
}

TEST_CASE("GatewayConfig::load: env vars override config file", "[config]") {
    ConfigTestGuard g;
    g.write_config(two_provider_config().dump());
    setenv("LLMGW_DEFAULT_STRATEGY", " weighted ", 1);
    setenv("LLMGW_REQUEST_TIMEOUT_MS", "1234", 1);
    setenv("LLMGW_API_KEY_OPENAI", "sk-from-env", 1);

    auto cfg = GatewayConfig::load();
    REQUIRE(cfg.default_strategy == "weighted");
    REQUIRE(cfg.request_timeout == milliseconds(1234));
    REQUIRE(cfg.find_provider("openai")->endpoint.api_key == "sk-from-env");
    REQUIRE(cfg.find_provider("local")->endpoint.api_key.empty());

    unsetenv("LLMGW_DEFAULT_STRATEGY");
    unsetenv("LLMGW_REQUEST_TIMEOUT_MS");
    unsetenv("LLMGW_API_KEY_OPENAI");
}

TEST_CASE("GatewayConfig::load: oversized timeout env var is reported", "[config]") {
    ConfigTestGuard g;
    setenv("LLMGW_REQUEST_TIMEOUT_MS", "99999999999999", 1);
    auto cfg = GatewayConfig::load();
    REQUIRE(has_problem(cfg, "LLMGW_REQUEST_TIMEOUT_MS exceeds 24 hours"));
    REQUIRE(cfg.request_timeout == GatewayConfig{}.request_timeout);
    unsetenv("LLMGW_REQUEST_TIMEOUT_MS");
}

TEST_CASE("GatewayConfig::load: bad timeout env var is reported", "[config]") {
    ConfigTestGuard g;
    setenv("LLMGW_REQUEST_TIMEOUT_MS", "soon", 1);
    auto cfg = GatewayConfig::load();
    REQUIRE(has_problem(cfg, "LLMGW_REQUEST_TIMEOUT_MS"));
    unsetenv("LLMGW_REQUEST_TIMEOUT_MS");
}

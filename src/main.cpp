#include "config.hpp"
#include "error.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include "gateway.hpp"
#include "health_prober.hpp"
#include "http.hpp"
#include "retry.hpp"
#include "util.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

static std::atomic<bool> g_shutdown{false};
static std::atomic<bool> g_reload{false};

static void signal_handler(int sig) {
    if (sig == SIGHUP) g_reload.store(true);
    else g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: llmgw [options]\n"
              << "\n"
              << "Options:\n"
              << "  --config PATH        Config file (default: $LLMGW_CONFIG or ~/.llmgw/config.json)\n"
              << "  --validate           Load and validate the config, print a summary and exit\n"
              << "  --model NAME         Route one request for model NAME\n"
              << "  --payload JSON       Request body forwarded to the provider (with --model)\n"
              << "  --timeout-ms N       Overall deadline for the request (with --model)\n"
              << "  --provider ID        Preferred provider for the request (with --model)\n"
              << "  --tag TAG            Routing tag for the request; may repeat (with --model)\n"
              << "  --health             Probe every provider once and print breaker states\n"
              << "  --watch              Probe periodically; SIGHUP reloads config, SIGINT exits\n"
              << "  --events             Print telemetry events as JSON lines on stderr\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  LLMGW_CONFIG              Config file path\n"
              << "  LLMGW_DEFAULT_STRATEGY    Override default_strategy\n"
              << "  LLMGW_REQUEST_TIMEOUT_MS  Override request_timeout_ms\n"
              << "  LLMGW_API_KEY_<ID>        API key for provider <ID> (upper-cased, '-' -> '_')\n";
}

static void print_summary(const llmgw::GatewayConfig& cfg) {
    std::cout << "Config: " << cfg.source_path << "\n"
              << "Default strategy: " << cfg.default_strategy << "\n"
              << "Request timeout: " << cfg.request_timeout.count() << " ms\n"
              << "Providers: " << cfg.providers.size() << "\n";
    for (const auto& p : cfg.providers) {
        std::cout << "  " << p.id << " (" << p.type << (p.enabled ? "" : ", disabled")
                  << ") models: " << llmgw::join(p.models, ", ") << "\n";
    }
    std::cout << "Rules: " << cfg.rules.size() << "\n";
    for (const auto& r : cfg.routing().rules) {
        std::cout << "  [" << r.priority << "] " << r.name
                  << (r.is_explicit() ? " -> " + llmgw::join(r.chain(), " -> ")
                                      : " strategy " + r.strategy)
                  << (r.enabled ? "" : " (disabled)") << "\n";
    }
}

static void print_probe(const std::vector<llmgw::ProbeResult>& results) {
    for (const auto& r : results) {
        std::cout << r.provider_id << ": " << llmgw::health_status_to_string(r.status)
                  << " (" << r.latency.count() << " ms), breaker "
                  << llmgw::circuit_state_to_string(r.state_after) << "\n";
    }
}

static int run_watch(llmgw::Gateway& gateway, const std::string& config_path) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGHUP, signal_handler);

    auto interval = gateway.config()->health_check.interval;
    llmgw::HealthProber prober(gateway.registry(), gateway.router());
    prober.start(interval);
    std::cerr << "[health] Probing every " << interval.count() << " ms. SIGHUP reloads, SIGINT exits.\n";

    while (!g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        if (!g_reload.exchange(false)) continue;

        try {
            auto cfg = llmgw::GatewayConfig::load(config_path);
            gateway.apply_config(cfg);
            if (cfg.health_check.interval != interval) {
                interval = cfg.health_check.interval;
                prober.stop();
                prober.start(interval);
            }
        } catch (const llmgw::ConfigError& e) {
            std::cerr << "[config] Reload rejected, keeping current config: " << e.what() << "\n";
        }
    }

    prober.stop();
    std::cerr << "[health] Shutting down.\n";
    return 0;
}

int main(int argc, char* argv[]) try {
    std::string config_path;
    std::string model;
    std::string payload;
    std::string preferred;
    std::vector<std::string> tags;
    long timeout_ms = 0;
    bool validate_only = false;
    bool health = false;
    bool watch = false;
    bool events = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--validate") == 0) {
            validate_only = true;
        } else if (std::strcmp(argv[i], "--model") == 0 && i + 1 < argc) {
            model = argv[++i];
        } else if (std::strcmp(argv[i], "--payload") == 0 && i + 1 < argc) {
            payload = argv[++i];
        } else if (std::strcmp(argv[i], "--timeout-ms") == 0 && i + 1 < argc) {
            timeout_ms = std::strtol(argv[++i], nullptr, 10);
        } else if (std::strcmp(argv[i], "--provider") == 0 && i + 1 < argc) {
            preferred = argv[++i];
        } else if (std::strcmp(argv[i], "--tag") == 0 && i + 1 < argc) {
            tags.emplace_back(argv[++i]);
        } else if (std::strcmp(argv[i], "--health") == 0) {
            health = true;
        } else if (std::strcmp(argv[i], "--watch") == 0) {
            watch = true;
        } else if (std::strcmp(argv[i], "--events") == 0) {
            events = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    auto cfg = llmgw::GatewayConfig::load(config_path);

    if (validate_only) {
        auto problems = cfg.problems();
        print_summary(cfg);
        if (!problems.empty()) {
            std::cout << "\nInvalid configuration:\n";
            for (const auto& p : problems) std::cout << "  - " << p << "\n";
            return 1;
        }
        std::cout << "\nConfiguration is valid.\n";
        return 0;
    }

    llmgw::http_init();
    auto http = std::make_shared<llmgw::PlatformHttpClient>();
    llmgw::Gateway gateway(http);

    if (events) {
        gateway.events().subscribe(llmgw::kAllEvents, [](const llmgw::Event& ev) {
            std::cerr << llmgw::event_to_json(ev).dump() << '\n';
        });
    }

    gateway.apply_config(cfg);

    int rc = 0;
    if (!model.empty()) {
        llmgw::CanonicalRequest req;
        req.id = llmgw::generate_id();
        req.model = model;
        req.payload = std::make_shared<const std::string>(payload);
        if (timeout_ms > 0) {
            req.deadline = llmgw::SteadyClock::now() + std::chrono::milliseconds(timeout_ms);
        }
        if (!preferred.empty()) req.hints.preferred_provider = preferred;
        req.hints.tags = tags;

        auto result = gateway.route(req);
        if (result.ok()) {
            std::cerr << "[router] served by " << result.response->provider_id
                      << " after " << result.attempts << " attempt(s)\n";
            std::cout << result.response->body << '\n';
        } else {
            std::cerr << "Error: " << result.error->to_string() << '\n';
            rc = 1;
        }
    } else if (health) {
        llmgw::HealthProber prober(gateway.registry(), gateway.router());
        print_probe(prober.probe_once());
    } else if (watch) {
        rc = run_watch(gateway, cfg.source_path);
    } else {
        print_usage();
    }

    // A timed-out route can leave abandoned attempts inside the HTTP client.
    if (llmgw::RetryExecutor::wait_for_attempts(std::chrono::seconds(2))) {
        llmgw::http_cleanup();
    } else {
        std::cerr << "[retry] " << llmgw::RetryExecutor::live_attempts()
                  << " attempt(s) still running, skipping HTTP cleanup\n";
    }
    return rc;
} catch (const llmgw::ConfigError& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return 2;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}

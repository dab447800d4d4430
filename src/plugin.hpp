#pragma once
#include "provider.hpp"
#include "http.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace llmgw {

// Builds an adapter for one configured provider.
using ProviderFactory = std::function<std::unique_ptr<Provider>(
    const ProviderSpec& spec, std::shared_ptr<HttpClient> http)>;

// Table of adapter types ("compatible", ...) filled by self-registering
// adapters at static-init time. Holds factories only; configured providers
// live in a ProviderRegistry owned by each Gateway.
// All methods are thread-safe.
class PluginRegistry {
public:
    static PluginRegistry& instance();

    void register_provider(const std::string& type, ProviderFactory factory);

    std::unique_ptr<Provider> create_provider(const std::string& type,
                                              const ProviderSpec& spec,
                                              std::shared_ptr<HttpClient> http) const;

    std::vector<std::string> provider_names() const;
    bool has_provider(const std::string& type) const;

    // Testing support
    void unregister_provider(const std::string& type);

private:
    PluginRegistry() = default;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ProviderFactory> providers_;
};

// ── Self-registrar helper (used at file scope in each adapter .cpp) ──

struct ProviderRegistrar {
    ProviderRegistrar(const std::string& type, ProviderFactory factory) {
        PluginRegistry::instance().register_provider(type, std::move(factory));
    }
};

} // namespace llmgw

#include "plugin.hpp"
#include <algorithm>
#include <stdexcept>

namespace llmgw {

PluginRegistry& PluginRegistry::instance() {
    static PluginRegistry registry;
    return registry;
}

void PluginRegistry::register_provider(const std::string& type, ProviderFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    providers_[type] = std::move(factory);
}

std::unique_ptr<Provider> PluginRegistry::create_provider(const std::string& type,
                                                          const ProviderSpec& spec,
                                                          std::shared_ptr<HttpClient> http) const {
    ProviderFactory factory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = providers_.find(type);
        if (it == providers_.end()) {
            throw std::invalid_argument("Unknown provider type: " + type);
        }
        factory = it->second;
    }
    return factory(spec, std::move(http));
}

std::vector<std::string> PluginRegistry::provider_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(providers_.size());
    for (const auto& [name, _] : providers_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

bool PluginRegistry::has_provider(const std::string& type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return providers_.count(type) > 0;
}

void PluginRegistry::unregister_provider(const std::string& type) {
    std::lock_guard<std::mutex> lock(mutex_);
    providers_.erase(type);
}

} // namespace llmgw

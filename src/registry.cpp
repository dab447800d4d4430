#include "registry.hpp"
#include <algorithm>
#include <stdexcept>
#include <unordered_set>

namespace llmgw {

ProviderRegistry::ProviderRegistry() : index_(build({})) {}

std::shared_ptr<const ProviderRegistry::Index>
ProviderRegistry::build(std::vector<ProviderRef> providers) {
    auto next = std::make_shared<Index>();
    for (auto& p : providers) {
        next->by_id[p->id()] = p;
        if (p->spec.enabled) {
            for (const auto& model : p->spec.models) {
                auto& list = next->by_model[model];
                if (std::find(list.begin(), list.end(), p) == list.end()) list.push_back(p);
            }
        }
    }
    next->ordered = std::move(providers);
    return next;
}

void ProviderRegistry::register_provider(ProviderRef provider) {
    if (!provider || provider->id().empty()) {
        throw std::invalid_argument("Provider id must not be empty");
    }
    std::lock_guard<std::mutex> lock(write_mutex_);
    auto current = index();
    if (current->by_id.count(provider->id())) {
        throw std::invalid_argument("Provider already registered: " + provider->id());
    }
    auto providers = current->ordered;
    providers.push_back(std::move(provider));
    publish(build(std::move(providers)));
}

bool ProviderRegistry::deregister_provider(const std::string& id) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    auto current = index();
    if (!current->by_id.count(id)) return false;
    std::vector<ProviderRef> providers;
    providers.reserve(current->ordered.size());
    for (const auto& p : current->ordered) {
        if (p->id() != id) providers.push_back(p);
    }
    publish(build(std::move(providers)));
    return true;
}

void ProviderRegistry::replace_all(std::vector<ProviderRef> providers) {
    std::unordered_set<std::string> seen;
    for (const auto& p : providers) {
        if (!p || p->id().empty()) {
            throw std::invalid_argument("Provider id must not be empty");
        }
        if (!seen.insert(p->id()).second) {
            throw std::invalid_argument("Provider already registered: " + p->id());
        }
    }
    std::lock_guard<std::mutex> lock(write_mutex_);
    publish(build(std::move(providers)));
}

ProviderRef ProviderRegistry::get(const std::string& id) const {
    auto current = index();
    auto it = current->by_id.find(id);
    if (it == current->by_id.end()) return nullptr;
    return it->second;
}

std::vector<ProviderRef> ProviderRegistry::providers_for_model(const std::string& model) const {
    auto current = index();
    auto it = current->by_model.find(model);
    if (it == current->by_model.end()) return {};
    return it->second;
}

std::vector<ProviderRef> ProviderRegistry::healthy_providers_for_model(const std::string& model,
                                                                       TimePoint now) const {
    std::vector<ProviderRef> out;
    for (auto& p : providers_for_model(model)) {
        if (!p->health->blocking(now)) out.push_back(std::move(p));
    }
    return out;
}

std::vector<ProviderRef> ProviderRegistry::all() const {
    return index()->ordered;
}

std::vector<std::string> ProviderRegistry::models() const {
    auto current = index();
    std::vector<std::string> names;
    names.reserve(current->by_model.size());
    for (const auto& [model, _] : current->by_model) names.push_back(model);
    std::sort(names.begin(), names.end());
    return names;
}

size_t ProviderRegistry::size() const {
    return index()->ordered.size();
}

} // namespace llmgw

#pragma once
#include "provider.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace llmgw {

// Configured providers of one gateway instance, indexed by id and by model.
// Lookups read an immutable index snapshot and never block; writers
// serialize on a mutex, build a fresh index and publish it atomically.
class ProviderRegistry {
public:
    ProviderRegistry();

    // Throws std::invalid_argument on an empty or duplicate id.
    void register_provider(ProviderRef provider);

    // Returns false if no provider had that id.
    bool deregister_provider(const std::string& id);

    // Replace every registration at once (config reload).
    void replace_all(std::vector<ProviderRef> providers);

    ProviderRef get(const std::string& id) const;

    // Enabled providers serving the model, in registration order.
    std::vector<ProviderRef> providers_for_model(const std::string& model) const;

    // Same, minus providers whose breaker blocks at `now`.
    std::vector<ProviderRef> healthy_providers_for_model(const std::string& model,
                                                         TimePoint now = SteadyClock::now()) const;

    std::vector<ProviderRef> all() const;
    std::vector<std::string> models() const;
    size_t size() const;

private:
    struct Index {
        std::vector<ProviderRef> ordered;
        std::unordered_map<std::string, ProviderRef> by_id;
        std::unordered_map<std::string, std::vector<ProviderRef>> by_model;
    };

    static std::shared_ptr<const Index> build(std::vector<ProviderRef> providers);
    std::shared_ptr<const Index> index() const { return std::atomic_load(&index_); }
    void publish(std::shared_ptr<const Index> next) { std::atomic_store(&index_, std::move(next)); }

    std::mutex write_mutex_;
    std::shared_ptr<const Index> index_;
};

} // namespace llmgw

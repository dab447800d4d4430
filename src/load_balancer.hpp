#pragma once
#include "provider.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

namespace llmgw {

struct SelectionContext {
    std::string model;
    uint32_t context_tokens = 0;
    std::optional<std::chrono::milliseconds> max_latency;
    TimePoint now = SteadyClock::now();
};

// Picks one provider among candidates. Implementations must be thread-safe;
// one instance is shared by every request that uses the strategy.
class LoadBalancer {
public:
    virtual ~LoadBalancer() = default;

    // Never returns a candidate whose breaker is blocking at ctx.now.
    virtual std::optional<ProviderRef> select(const std::vector<ProviderRef>& candidates,
                                              const SelectionContext& ctx) = 0;

    // Feedback after a provider's calls for one request finished.
    virtual void record_result(const ProviderRef& /*provider*/,
                               const CallOutcome& /*outcome*/) {}

    virtual std::string name() const = 0;
};

// Round-robin cursors keyed by the candidate set (ids joined in order), so
// rotation over [a,b,c] is independent of rotation over [a,b].
class CursorTable {
public:
    // Returns the current cursor for the key and advances it.
    uint64_t next(const std::vector<ProviderRef>& candidates);

private:
    std::atomic<uint64_t>& cursor_for(const std::string& key);

    std::mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<std::atomic<uint64_t>>> cursors_;
};

class RoundRobinBalancer : public LoadBalancer {
public:
    std::optional<ProviderRef> select(const std::vector<ProviderRef>& candidates,
                                      const SelectionContext& ctx) override;
    std::string name() const override { return "round_robin"; }

private:
    CursorTable cursors_;
};

class LeastLatencyBalancer : public LoadBalancer {
public:
    std::optional<ProviderRef> select(const std::vector<ProviderRef>& candidates,
                                      const SelectionContext& ctx) override;
    std::string name() const override { return "least_latency"; }

private:
    CursorTable cursors_;
};

class LeastConnectionsBalancer : public LoadBalancer {
public:
    std::optional<ProviderRef> select(const std::vector<ProviderRef>& candidates,
                                      const SelectionContext& ctx) override;
    std::string name() const override { return "least_connections"; }

private:
    CursorTable cursors_;
};

// Cheapest candidate meeting the context-size and latency floor; when no
// candidate meets it, the cheapest overall. Ties go to the lowest latency.
class CostOptimizedBalancer : public LoadBalancer {
public:
    std::optional<ProviderRef> select(const std::vector<ProviderRef>& candidates,
                                      const SelectionContext& ctx) override;
    std::string name() const override { return "cost_optimized"; }

private:
    CursorTable cursors_;
};

class WeightedBalancer : public LoadBalancer {
public:
    WeightedBalancer();
    explicit WeightedBalancer(uint64_t seed);

    std::optional<ProviderRef> select(const std::vector<ProviderRef>& candidates,
                                      const SelectionContext& ctx) override;
    std::string name() const override { return "weighted"; }

private:
    double sample();  // uniform in [0, 1)

    std::mutex rng_mutex_;
    std::mt19937_64 rng_;
};

// First eligible candidate in the given order.
class PriorityBalancer : public LoadBalancer {
public:
    std::optional<ProviderRef> select(const std::vector<ProviderRef>& candidates,
                                      const SelectionContext& ctx) override;
    std::string name() const override { return "priority"; }
};

// Throws std::invalid_argument for unknown names.
std::unique_ptr<LoadBalancer> create_load_balancer(const std::string& name);

std::vector<std::string> load_balancer_names();
bool is_known_strategy(const std::string& name);

} // namespace llmgw

#include "load_balancer.hpp"
#include <algorithm>
#include <stdexcept>

namespace llmgw {

namespace {

std::vector<ProviderRef> eligible(const std::vector<ProviderRef>& candidates, TimePoint now) {
    std::vector<ProviderRef> out;
    out.reserve(candidates.size());
    for (const auto& c : candidates) {
        if (c && !c->health->blocking(now)) out.push_back(c);
    }
    return out;
}

// Keep the candidates minimising key(); the result preserves input order.
template<typename Key>
std::vector<ProviderRef> minimal_by(const std::vector<ProviderRef>& candidates, Key key) {
    std::vector<ProviderRef> best;
    for (const auto& c : candidates) {
        if (best.empty()) {
            best.push_back(c);
            continue;
        }
        auto k = key(*c);
        auto b = key(*best.front());
        if (k < b) {
            best.clear();
            best.push_back(c);
        } else if (!(b < k)) {
            best.push_back(c);
        }
    }
    return best;
}

ProviderRef rotate(CursorTable& cursors, const std::vector<ProviderRef>& tied) {
    if (tied.size() == 1) return tied.front();
    return tied[cursors.next(tied) % tied.size()];
}

} // namespace

// ── CursorTable ─────────────────────────────────────────────────

std::atomic<uint64_t>& CursorTable::cursor_for(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = cursors_[key];
    if (!slot) slot = std::make_unique<std::atomic<uint64_t>>(0);
    return *slot;
}

uint64_t CursorTable::next(const std::vector<ProviderRef>& candidates) {
    std::string key;
    for (const auto& c : candidates) {
        key += c->id();
        key += '\x1f';
    }
    return cursor_for(key).fetch_add(1, std::memory_order_relaxed);
}

// ── RoundRobin ──────────────────────────────────────────────────

std::optional<ProviderRef> RoundRobinBalancer::select(const std::vector<ProviderRef>& candidates,
                                                      const SelectionContext& ctx) {
    auto pool = eligible(candidates, ctx.now);
    if (pool.empty()) return std::nullopt;
    // Cursor follows the configured set so a blocked member does not reset rotation.
    return pool[cursors_.next(candidates) % pool.size()];
}

// ── LeastLatency ────────────────────────────────────────────────

std::optional<ProviderRef> LeastLatencyBalancer::select(const std::vector<ProviderRef>& candidates,
                                                        const SelectionContext& ctx) {
    auto pool = eligible(candidates, ctx.now);
    if (pool.empty()) return std::nullopt;
    auto tied = minimal_by(pool, [](const ProviderEntry& p) { return p.health->latency_ms(); });
    return rotate(cursors_, tied);
}

// ── LeastConnections ────────────────────────────────────────────

std::optional<ProviderRef> LeastConnectionsBalancer::select(
        const std::vector<ProviderRef>& candidates, const SelectionContext& ctx) {
    auto pool = eligible(candidates, ctx.now);
    if (pool.empty()) return std::nullopt;
    auto tied = minimal_by(pool, [](const ProviderEntry& p) { return p.health->in_flight(); });
    return rotate(cursors_, tied);
}

// ── CostOptimized ───────────────────────────────────────────────

std::optional<ProviderRef> CostOptimizedBalancer::select(const std::vector<ProviderRef>& candidates,
                                                         const SelectionContext& ctx) {
    auto pool = eligible(candidates, ctx.now);
    if (pool.empty()) return std::nullopt;

    std::vector<ProviderRef> floor;
    for (const auto& p : pool) {
        if (!p->spec.fits(ctx.context_tokens)) continue;
        if (ctx.max_latency) {
            double latency = p->health->latency_ms();
            if (latency > static_cast<double>(ctx.max_latency->count())) continue;
        }
        floor.push_back(p);
    }
    if (floor.empty()) floor = pool;

    auto cheapest = minimal_by(floor, [](const ProviderEntry& p) { return p.spec.cost; });
    auto tied = minimal_by(cheapest, [](const ProviderEntry& p) { return p.health->latency_ms(); });
    return rotate(cursors_, tied);
}

// ── Weighted ────────────────────────────────────────────────────

WeightedBalancer::WeightedBalancer() : rng_(std::random_device{}()) {}

WeightedBalancer::WeightedBalancer(uint64_t seed) : rng_(seed) {}

double WeightedBalancer::sample() {
    std::lock_guard<std::mutex> lock(rng_mutex_);
    return std::uniform_real_distribution<double>(0.0, 1.0)(rng_);
}

std::optional<ProviderRef> WeightedBalancer::select(const std::vector<ProviderRef>& candidates,
                                                    const SelectionContext& ctx) {
    auto pool = eligible(candidates, ctx.now);
    if (pool.empty()) return std::nullopt;

    uint64_t total = 0;
    for (const auto& p : pool) total += p->spec.weight;

    double r = sample();
    if (total == 0) {
        // All weights zero: uniform.
        size_t idx = std::min(pool.size() - 1, static_cast<size_t>(r * pool.size()));
        return pool[idx];
    }

    double target = r * static_cast<double>(total);
    double acc = 0.0;
    for (const auto& p : pool) {
        if (p->spec.weight == 0) continue;
        acc += static_cast<double>(p->spec.weight);
        if (target < acc) return p;
    }
    // Rounding at the upper edge: last weighted candidate.
    for (auto it = pool.rbegin(); it != pool.rend(); ++it) {
        if ((*it)->spec.weight > 0) return *it;
    }
    return pool.back();
}

// ── Priority ────────────────────────────────────────────────────

std::optional<ProviderRef> PriorityBalancer::select(const std::vector<ProviderRef>& candidates,
                                                    const SelectionContext& ctx) {
    for (const auto& c : candidates) {
        if (c && !c->health->blocking(ctx.now)) return c;
    }
    return std::nullopt;
}

// ── Factory ─────────────────────────────────────────────────────

std::unique_ptr<LoadBalancer> create_load_balancer(const std::string& name) {
    if (name == "round_robin") return std::make_unique<RoundRobinBalancer>();
    if (name == "least_latency") return std::make_unique<LeastLatencyBalancer>();
    if (name == "least_connections") return std::make_unique<LeastConnectionsBalancer>();
    if (name == "cost_optimized") return std::make_unique<CostOptimizedBalancer>();
    if (name == "weighted") return std::make_unique<WeightedBalancer>();
    if (name == "priority") return std::make_unique<PriorityBalancer>();
    throw std::invalid_argument("Unknown load balancing strategy: " + name);
}

std::vector<std::string> load_balancer_names() {
    return {"round_robin", "least_latency", "least_connections",
            "cost_optimized", "weighted", "priority"};
}

bool is_known_strategy(const std::string& name) {
    auto names = load_balancer_names();
    return std::find(names.begin(), names.end(), name) != names.end();
}

} // namespace llmgw

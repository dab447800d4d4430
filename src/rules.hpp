#pragma once
#include "provider.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace llmgw {

// Predicate + action. Every predicate that is set must match; empty fields
// match anything. Lower priority values are evaluated first.
struct RoutingRule {
    std::string name;
    int32_t priority = 100;
    bool enabled = true;

    // Predicates
    std::string model_pattern;     // glob over the requested model
    std::string tag;               // must appear in the request's tags
    std::string header_name;       // case-insensitive
    std::string header_value;      // glob; empty = header merely present

    // Action: an explicit chain, or a strategy over the model's providers.
    std::string provider;
    std::vector<std::string> fallback;
    std::string strategy;

    bool has_predicate() const;
    bool matches(const CanonicalRequest& request) const;
    bool is_explicit() const { return !provider.empty(); }

    // provider followed by fallback, duplicates dropped.
    std::vector<std::string> chain() const;
};

// Stable sort by ascending priority; equal priorities keep config order.
void sort_rules(std::vector<RoutingRule>& rules);

// First enabled matching rule of a sorted list, or nullptr.
const RoutingRule* match_rule(const std::vector<RoutingRule>& rules,
                              const CanonicalRequest& request);

} // namespace llmgw

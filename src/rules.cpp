#include "rules.hpp"
#include "util.hpp"
#include <algorithm>
#include <cctype>

namespace llmgw {

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool RoutingRule::has_predicate() const {
    return !model_pattern.empty() || !tag.empty() || !header_name.empty();
}

bool RoutingRule::matches(const CanonicalRequest& request) const {
    if (!enabled) return false;

    if (!model_pattern.empty() && !glob_match(model_pattern, request.model)) {
        return false;
    }

    if (!tag.empty()) {
        const auto& tags = request.hints.tags;
        if (std::find(tags.begin(), tags.end(), tag) == tags.end()) return false;
    }

    if (!header_name.empty()) {
        auto it = request.hints.headers.find(to_lower(header_name));
        if (it == request.hints.headers.end()) return false;
        if (!header_value.empty() && !glob_match(header_value, it->second)) return false;
    }

    return true;
}

std::vector<std::string> RoutingRule::chain() const {
    std::vector<std::string> ids;
    if (!provider.empty()) ids.push_back(provider);
    for (const auto& f : fallback) {
        if (f.empty()) continue;
        if (std::find(ids.begin(), ids.end(), f) == ids.end()) ids.push_back(f);
    }
    return ids;
}

void sort_rules(std::vector<RoutingRule>& rules) {
    std::stable_sort(rules.begin(), rules.end(),
                     [](const RoutingRule& a, const RoutingRule& b) {
                         return a.priority < b.priority;
                     });
}

const RoutingRule* match_rule(const std::vector<RoutingRule>& rules,
                              const CanonicalRequest& request) {
    for (const auto& rule : rules) {
        if (rule.matches(request)) return &rule;
    }
    return nullptr;
}

} // namespace llmgw

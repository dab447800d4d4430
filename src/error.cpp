#include "error.hpp"
#include "util.hpp"

namespace llmgw {

std::string GatewayError::to_string() const {
    std::string msg = error_kind_to_string(kind);
    if (!provider.empty()) msg += " [" + provider + "]";
    if (!detail.empty()) msg += ": " + detail;
    if (!attempted.empty()) msg += " (attempted: " + join(attempted, ", ") + ")";
    return msg;
}

GatewayError GatewayError::model_not_found(const std::string& model) {
    return GatewayError{ErrorKind::ModelNotFound, {},
                        "no provider serves model '" + model + "'", {}};
}

GatewayError GatewayError::no_healthy_providers(const std::string& model,
                                                std::vector<std::string> attempted) {
    return GatewayError{ErrorKind::NoHealthyProviders, {},
                        "no reachable provider for model '" + model + "'",
                        std::move(attempted)};
}

GatewayError GatewayError::circuit_open(const std::string& provider) {
    return GatewayError{ErrorKind::CircuitOpen, provider, "circuit open", {}};
}

GatewayError GatewayError::retries_exhausted(const std::string& provider,
                                             const std::string& last_error) {
    return GatewayError{ErrorKind::RetriesExhausted, provider, last_error, {}};
}

GatewayError GatewayError::provider_error(const std::string& provider,
                                          const std::string& detail) {
    return GatewayError{ErrorKind::ProviderError, provider, detail, {}};
}

GatewayError GatewayError::timeout(const std::string& detail) {
    return GatewayError{ErrorKind::Timeout, {}, detail, {}};
}

static std::string format_problems(const std::vector<std::string>& problems) {
    std::string msg = "invalid configuration";
    for (const auto& p : problems) msg += "\n  - " + p;
    return msg;
}

ConfigError::ConfigError(std::vector<std::string> problems)
    : std::runtime_error(format_problems(problems)), problems_(std::move(problems)) {}

} // namespace llmgw

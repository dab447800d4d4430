#pragma once
#include <stdexcept>
#include <string>
#include <vector>

namespace llmgw {

enum class ErrorKind {
    ModelNotFound,        // no provider serves the model; terminal
    NoHealthyProviders,   // every candidate circuit-open or unreachable; terminal
    CircuitOpen,          // fail-over trigger, surfaced only from the last candidate
    RetriesExhausted,     // fail-over trigger
    ProviderError,        // non-retryable, request-specific; no fail-over
    Timeout               // overall deadline exceeded; terminal
};

inline const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ModelNotFound: return "model_not_found";
        case ErrorKind::NoHealthyProviders: return "no_healthy_providers";
        case ErrorKind::CircuitOpen: return "circuit_open";
        case ErrorKind::RetriesExhausted: return "retries_exhausted";
        case ErrorKind::ProviderError: return "provider_error";
        case ErrorKind::Timeout: return "timeout";
    }
    return "provider_error";
}

// Terminal error handed to the caller of Router::route.
struct GatewayError {
    ErrorKind kind = ErrorKind::ProviderError;
    std::string provider;                 // offending provider, when there is one
    std::string detail;
    std::vector<std::string> attempted;   // every provider a call was routed to

    std::string to_string() const;

    static GatewayError model_not_found(const std::string& model);
    static GatewayError no_healthy_providers(const std::string& model,
                                             std::vector<std::string> attempted);
    static GatewayError circuit_open(const std::string& provider);
    static GatewayError retries_exhausted(const std::string& provider,
                                          const std::string& last_error);
    static GatewayError provider_error(const std::string& provider,
                                       const std::string& detail);
    static GatewayError timeout(const std::string& detail);
};

// A configuration snapshot failed validation and must not be activated.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(std::vector<std::string> problems);

    const std::vector<std::string>& problems() const { return problems_; }

private:
    std::vector<std::string> problems_;
};

} // namespace llmgw

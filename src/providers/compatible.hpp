#pragma once
#include "../provider.hpp"
#include "../http.hpp"
#include <memory>
#include <string>
#include <vector>

namespace llmgw {

// Any backend speaking the OpenAI-style HTTP API: the payload is POSTed
// verbatim to base_url + path, health is a GET of base_url + health_path.
class CompatibleProvider : public Provider {
public:
    CompatibleProvider(ProviderSpec spec, std::shared_ptr<HttpClient> http);

    CanonicalResponse invoke(const CanonicalRequest& request,
                             const CallContext& ctx) override;

    HealthStatus health_check() override;

    std::string provider_name() const override { return "compatible"; }

    static constexpr std::chrono::milliseconds kHealthTimeout{10000};

protected:
    virtual std::vector<Header> build_headers() const;

private:
    ProviderSpec spec_;
    std::shared_ptr<HttpClient> http_;
};

} // namespace llmgw

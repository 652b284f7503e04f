#pragma once

#include "Transport.hpp"

#include <string>

namespace http
{

struct CprTransportConfig
{
    int connect_timeout_ms = 10000;
    // Client-wide ceiling; 0 disables it. Per-request deadlines are enforced through cancellation.
    int timeout_ms = 300000;
    std::string user_agent = "APIHammer/1.0";
    bool verify_tls = true;
};

// libcurl transport through cpr. Configuration is fixed at construction so one
// instance can serve concurrent exchanges; each perform() uses its own session.
class CprTransport : public ITransport
{
public:
    explicit CprTransport(CprTransportConfig config);

    TransportOutcome perform(const WireRequest& request, const TransportCallbacks& callbacks) override;

    const CprTransportConfig& config() const { return config_; }

private:
    const CprTransportConfig config_;
};

} // namespace http

#pragma once

#include "RequestSpec.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace http
{

struct WireHeader
{
    std::string name;
    std::string value;
};

// Fully resolved request, ready for the wire.
struct WireRequest
{
    Verb verb = Verb::Get;
    std::string url;
    std::vector<WireHeader> headers;
    std::optional<std::string> body;
};

struct ResponseHead
{
    int status_code = 0;
    std::string reason;
    std::vector<WireHeader> headers;

    std::string headerValue(const std::string& name) const;
};

struct TransportCallbacks
{
    // Called once, before the first onData.
    std::function<void(const ResponseHead&)> onResponseHead;
    // Return false to stop the transfer.
    std::function<bool(std::string_view)> onData;
    // Polled during the transfer; true aborts it.
    std::function<bool()> shouldAbort;
};

struct TransportOutcome
{
    bool ok = false;
    // Stopped by onData returning false or by shouldAbort.
    bool aborted = false;
    std::string error;
};

class ITransport
{
public:
    virtual ~ITransport() = default;

    virtual TransportOutcome perform(const WireRequest& request, const TransportCallbacks& callbacks) = 0;
};

} // namespace http

#pragma once

#include "RequestSpec.hpp"
#include "Transport.hpp"

#include <string>

namespace http
{

// Resolves verb, full URL, auth and headers. Content-Type defaults to application/json when a body is sent.
WireRequest buildWireRequest(const RequestSpec& spec);

struct RequestPreview
{
    std::string request_line;
    std::string headers;
    std::string authentication;
    std::string body;

    // Raw HTTP/1.1 rendering of the request
    std::string text() const;
};

// Secrets are masked in the authentication summary only.
RequestPreview buildRequestPreview(const RequestSpec& spec);

std::string base64Encode(const std::string& input);

} // namespace http

#include "RequestBuilder.hpp"

namespace
{

constexpr const char* kAuthorization = "Authorization";
constexpr const char* kContentType = "Content-Type";
constexpr const char* kDefaultContentType = "application/json";

struct AuthHeader
{
    bool present = false;
    http::WireHeader header;
};

AuthHeader resolveAuth(const http::Auth& auth)
{
    AuthHeader out;
    switch (auth.type)
    {
    case http::AuthType::Basic:
        if (!http::isBlank(auth.username))
        {
            out.present = true;
            out.header = { kAuthorization, "Basic " + http::base64Encode(auth.username + ":" + auth.password) };
        }
        break;
    case http::AuthType::Bearer:
        if (!http::isBlank(auth.token))
        {
            out.present = true;
            out.header = { kAuthorization, "Bearer " + auth.token };
        }
        break;
    case http::AuthType::ApiKey:
        if (!http::isBlank(auth.api_key_header) && !http::isBlank(auth.api_key_value))
        {
            out.present = true;
            out.header = { auth.api_key_header, auth.api_key_value };
        }
        break;
    case http::AuthType::None:
        break;
    }
    return out;
}

std::string elide(const std::string& value, std::size_t max_len)
{
    if (value.size() <= max_len)
        return value;
    return value.substr(0, max_len) + "...";
}

} // namespace

namespace http
{

std::string base64Encode(const std::string& input)
{
    static const char* table = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string out;
    out.reserve(((input.size() + 2) / 3) * 4);

    std::size_t i = 0;
    while (i + 2 < input.size())
    {
        unsigned int n = (static_cast<unsigned char>(input[i]) << 16) |
                         (static_cast<unsigned char>(input[i + 1]) << 8) | static_cast<unsigned char>(input[i + 2]);
        out.push_back(table[(n >> 18) & 0x3F]);
        out.push_back(table[(n >> 12) & 0x3F]);
        out.push_back(table[(n >> 6) & 0x3F]);
        out.push_back(table[n & 0x3F]);
        i += 3;
    }

    std::size_t rest = input.size() - i;
    if (rest == 1)
    {
        unsigned int n = static_cast<unsigned char>(input[i]) << 16;
        out.push_back(table[(n >> 18) & 0x3F]);
        out.push_back(table[(n >> 12) & 0x3F]);
        out += "==";
    }
    else if (rest == 2)
    {
        unsigned int n = (static_cast<unsigned char>(input[i]) << 16) | (static_cast<unsigned char>(input[i + 1]) << 8);
        out.push_back(table[(n >> 18) & 0x3F]);
        out.push_back(table[(n >> 12) & 0x3F]);
        out.push_back(table[(n >> 6) & 0x3F]);
        out.push_back('=');
    }
    return out;
}

WireRequest buildWireRequest(const RequestSpec& spec)
{
    WireRequest wire;
    wire.verb = parseVerb(spec.method);
    wire.url = spec.fullUrl();

    AuthHeader auth = resolveAuth(spec.auth);
    bool auth_sets_authorization = auth.present && iequals(auth.header.name, kAuthorization);
    if (auth.present)
        wire.headers.push_back(auth.header);

    bool sends_body = verbCarriesBody(wire.verb) && spec.body && !isBlank(*spec.body);

    std::string content_type = kDefaultContentType;
    for (const auto& h : spec.headers)
    {
        if (!h.enabled || isBlank(h.key))
            continue;
        if (auth_sets_authorization && iequals(h.key, kAuthorization))
            continue;
        if (iequals(h.key, kContentType))
        {
            content_type = h.value;
            continue;
        }
        wire.headers.push_back({ h.key, h.value });
    }

    if (sends_body)
    {
        wire.headers.push_back({ kContentType, content_type });
        wire.body = *spec.body;
    }

    return wire;
}

std::string RequestPreview::text() const
{
    std::string out = request_line + "\n";
    if (!headers.empty())
        out += headers + "\n";
    if (!body.empty())
        out += "\n" + body + "\n";
    return out;
}

RequestPreview buildRequestPreview(const RequestSpec& spec)
{
    WireRequest wire = buildWireRequest(spec);

    RequestPreview preview;
    preview.request_line = std::string(verbName(wire.verb)) + " " + wire.url + " HTTP/1.1";

    for (std::size_t i = 0; i < wire.headers.size(); ++i)
    {
        if (i)
            preview.headers += "\n";
        preview.headers += wire.headers[i].name + ": " + wire.headers[i].value;
    }

    const Auth& auth = spec.auth;
    switch (auth.type)
    {
    case AuthType::None:
        preview.authentication = "Type: None";
        break;
    case AuthType::Basic:
        preview.authentication = "Type: Basic Authentication\nUsername: " + auth.username +
                                 "\nPassword: [Hidden for security]";
        break;
    case AuthType::Bearer:
        preview.authentication = "Type: Bearer Token\nToken: " +
                                 (isBlank(auth.token) ? std::string("[No token configured]") : elide(auth.token, 50));
        break;
    case AuthType::ApiKey:
        preview.authentication =
            "Type: API Key\nHeader: " + auth.api_key_header + "\nValue: " +
            (isBlank(auth.api_key_value) ? std::string("[No key configured]") : elide(auth.api_key_value, 30));
        break;
    }

    if (wire.body)
        preview.body = *wire.body;

    return preview;
}

} // namespace http

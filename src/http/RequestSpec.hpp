#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace http
{

struct KeyValue
{
    std::string key;
    std::string value;
    bool enabled = true;
};

enum class AuthType
{
    None,
    Basic,
    Bearer,
    ApiKey
};

struct Auth
{
    AuthType type = AuthType::None;
    std::string username;
    std::string password;
    std::string token;
    std::string api_key_header = "X-API-Key";
    std::string api_key_value;
};

struct RequestSpec
{
    std::string name;
    std::string method = "GET";
    std::string url;
    std::vector<KeyValue> headers;
    std::vector<KeyValue> query;
    std::optional<std::string> body;
    Auth auth;

    // 0 means no per-request deadline
    int timeout_ms = 0;

    // Overrides the mode default when set
    std::optional<std::size_t> max_capture_bytes;

    bool format_json = true;

    // URL with enabled query parameters appended and percent-encoded.
    std::string fullUrl() const;
};

enum class Verb
{
    Get,
    Post,
    Put,
    Delete,
    Patch,
    Head,
    Options
};

// Unknown method strings map to GET.
Verb parseVerb(const std::string& method);
const char* verbName(Verb verb);

// Only POST, PUT and PATCH carry a body.
bool verbCarriesBody(Verb verb);

// scheme://host with scheme http or https
bool isAbsoluteHttpUrl(const std::string& url);

const char* authTypeName(AuthType type);

bool isBlank(const std::string& s);
std::string urlEscape(const std::string& s);
bool iequals(const std::string& a, const std::string& b);

} // namespace http

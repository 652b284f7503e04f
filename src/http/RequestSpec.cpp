#include "RequestSpec.hpp"

#include <algorithm>
#include <cctype>

namespace http
{

std::string RequestSpec::fullUrl() const
{
    std::string out = url;
    bool has_query = out.find('?') != std::string::npos;

    for (const auto& param : query)
    {
        if (!param.enabled || isBlank(param.key))
            continue;

        out.push_back(has_query ? '&' : '?');
        has_query = true;
        out += urlEscape(param.key);
        out.push_back('=');
        out += urlEscape(param.value);
    }
    return out;
}

Verb parseVerb(const std::string& method)
{
    std::string upper;
    upper.reserve(method.size());
    for (unsigned char c : method)
        upper.push_back(static_cast<char>(std::toupper(c)));

    if (upper == "POST")
        return Verb::Post;
    if (upper == "PUT")
        return Verb::Put;
    if (upper == "DELETE")
        return Verb::Delete;
    if (upper == "PATCH")
        return Verb::Patch;
    if (upper == "HEAD")
        return Verb::Head;
    if (upper == "OPTIONS")
        return Verb::Options;
    return Verb::Get;
}

const char* verbName(Verb verb)
{
    switch (verb)
    {
    case Verb::Get:
        return "GET";
    case Verb::Post:
        return "POST";
    case Verb::Put:
        return "PUT";
    case Verb::Delete:
        return "DELETE";
    case Verb::Patch:
        return "PATCH";
    case Verb::Head:
        return "HEAD";
    case Verb::Options:
        return "OPTIONS";
    }
    return "GET";
}

bool verbCarriesBody(Verb verb)
{
    return verb == Verb::Post || verb == Verb::Put || verb == Verb::Patch;
}

bool isAbsoluteHttpUrl(const std::string& url)
{
    auto sep = url.find("://");
    if (sep == std::string::npos)
        return false;

    std::string scheme = url.substr(0, sep);
    if (!iequals(scheme, "http") && !iequals(scheme, "https"))
        return false;

    // host must be non-empty and free of whitespace
    std::size_t host_begin = sep + 3;
    std::size_t host_end = url.find_first_of("/?#", host_begin);
    if (host_end == std::string::npos)
        host_end = url.size();
    if (host_end == host_begin)
        return false;

    return std::none_of(url.begin(), url.end(), [](unsigned char c) { return std::isspace(c) || std::iscntrl(c); });
}

const char* authTypeName(AuthType type)
{
    switch (type)
    {
    case AuthType::None:
        return "None";
    case AuthType::Basic:
        return "Basic";
    case AuthType::Bearer:
        return "Bearer";
    case AuthType::ApiKey:
        return "ApiKey";
    }
    return "None";
}

bool isBlank(const std::string& s)
{
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

std::string urlEscape(const std::string& s)
{
    std::string out;
    out.reserve(s.size() * 3);
    const char* hex = "0123456789ABCDEF";
    for (unsigned char c : s)
    {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~')
        {
            out.push_back(static_cast<char>(c));
        }
        else
        {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

bool iequals(const std::string& a, const std::string& b)
{
    if (a.size() != b.size())
        return false;
    for (std::size_t i = 0; i < a.size(); ++i)
    {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

} // namespace http

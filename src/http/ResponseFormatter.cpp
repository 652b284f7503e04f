#include "ResponseFormatter.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <cstdio>

using json = nlohmann::json;

namespace http
{

std::string formatResponseHead(const ResponseHead& head, const std::string& url, AuthType auth)
{
    std::string out;
    out += "Status: " + std::to_string(head.status_code);
    if (!head.reason.empty())
        out += " " + head.reason;
    out += "\n";
    out += "Request URL: " + url + "\n";
    if (auth != AuthType::None)
        out += std::string("Authentication: ") + authTypeName(auth) + "\n";
    out += "\nResponse Headers:\n";
    for (const auto& h : head.headers)
        out += "  " + h.name + ": " + h.value + "\n";
    out += "\nResponse Body:\n";
    return out;
}

bool isJsonContentType(const std::string& content_type)
{
    std::string lower;
    lower.reserve(content_type.size());
    for (unsigned char c : content_type)
        lower.push_back(static_cast<char>(std::tolower(c)));
    return lower.find("json") != std::string::npos;
}

bool tryPrettyPrintJson(const std::string& body, std::string& out)
{
    try
    {
        auto parsed = json::parse(body);
        out = parsed.dump(2);
        return true;
    }
    catch (const json::exception&)
    {
        return false;
    }
}

std::string truncationNotice(std::size_t cap_bytes)
{
    constexpr std::size_t kMiB = 1024 * 1024;
    if (cap_bytes >= kMiB)
        return "\n[Response truncated - exceeded " + std::to_string(cap_bytes / kMiB) + "MB limit]\n";
    return "\n[Response truncated - exceeded " + std::to_string(cap_bytes) + " byte limit]\n";
}

std::string errorText(const std::string& message, const std::string& url)
{
    return "Error: " + message + "\n\nRequest URL: " + url;
}

std::string timeoutText(int timeout_ms, const std::string& url)
{
    return errorText("Request timed out after " + std::to_string(timeout_ms) + " ms", url);
}

std::string cancelledText() { return "Request was cancelled."; }

std::string completionMessage(const std::string& method, std::chrono::milliseconds elapsed, std::size_t bytes)
{
    char size[32];
    std::snprintf(size, sizeof(size), "%.1f", static_cast<double>(bytes) / 1024.0);
    return "HTTP " + method + " completed. Time: " + std::to_string(elapsed.count()) + " ms, Size: " + size + " KB";
}

} // namespace http

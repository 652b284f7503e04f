#pragma once

#include "RequestSpec.hpp"
#include "Transport.hpp"

#include <chrono>
#include <cstddef>
#include <string>

namespace http
{

// "Status: ...", "Request URL: ...", optional "Authentication: ...", then the header block.
std::string formatResponseHead(const ResponseHead& head, const std::string& url, AuthType auth);

bool isJsonContentType(const std::string& content_type);

// Pretty-prints with two-space indentation. Leaves out untouched and returns false when body is not JSON.
bool tryPrettyPrintJson(const std::string& body, std::string& out);

std::string truncationNotice(std::size_t cap_bytes);

std::string errorText(const std::string& message, const std::string& url);
std::string timeoutText(int timeout_ms, const std::string& url);
std::string cancelledText();

// "HTTP GET completed. Time: 12 ms, Size: 1.5 KB"
std::string completionMessage(const std::string& method, std::chrono::milliseconds elapsed, std::size_t bytes);

} // namespace http

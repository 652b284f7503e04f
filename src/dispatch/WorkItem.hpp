#pragma once

#include "UiMutation.hpp"
#include "../http/RequestSpec.hpp"
#include "../http/StreamingPipeline.hpp"
#include "../utils/CancellationToken.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <variant>

namespace dispatch
{

namespace priority
{
inline constexpr int kUiMutation = 100;
// Every mutation of one exchange shares a band so arrival order decides.
inline constexpr int kStream = 60;
inline constexpr int kNotice = 50;
inline constexpr int kResponseReady = 10;
inline constexpr int kOutbound = 0;
} // namespace priority

struct ResponseReady;

using CompletionCallback = std::function<void(const ResponseReady&)>;

struct OutboundRequest
{
    http::RequestSpec spec;
    utils::CancellationToken cancel_token;
    CompletionCallback on_complete;
};

struct ResponseReady
{
    std::uint64_t original_id = 0;
    bool success = false;
    int status_code = 0;
    http::ErrorKind error_kind = http::ErrorKind::None;
    std::string error;
    std::chrono::milliseconds elapsed{ 0 };
    std::size_t byte_size = 0;
    bool truncated = false;
    std::string body;
    CompletionCallback completion;
};

struct Notice
{
    std::string title;
    std::string message;
    bool is_success = true;
};

using Payload = std::variant<OutboundRequest, ResponseReady, UiMutation, Notice>;

struct WorkItem
{
    std::uint64_t id = 0;
    std::chrono::steady_clock::time_point created_at;
    int priority = 0;
    Payload payload;
};

// Process-wide, monotonically increasing.
std::uint64_t nextWorkItemId();

WorkItem makeWorkItem(Payload payload, int priority);

// True when a must be served before b: higher priority, then older, then lower id.
struct ServedBefore
{
    bool operator()(const WorkItem& a, const WorkItem& b) const
    {
        if (a.priority != b.priority)
            return a.priority > b.priority;
        if (a.created_at != b.created_at)
            return a.created_at < b.created_at;
        return a.id < b.id;
    }
};

const char* payloadName(const Payload& payload);

} // namespace dispatch

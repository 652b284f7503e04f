#pragma once

#include "../http/StreamingPipeline.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>

namespace dispatch
{

// Response views are keyed by the id of the OutboundRequest that produced them.
using ViewId = std::uint64_t;

struct BeginExchange
{
    ViewId view_id = 0;
    std::string method;
    std::string url;
};

struct ShowResponseHead
{
    ViewId view_id = 0;
    std::string head_text;
};

struct AppendBodySlice
{
    ViewId view_id = 0;
    std::string data;
};

struct ReplaceBody
{
    ViewId view_id = 0;
    std::string text;
};

struct CompleteExchange
{
    ViewId view_id = 0;
    int status_code = 0;
    std::chrono::milliseconds elapsed{ 0 };
    std::size_t byte_size = 0;
    bool truncated = false;
};

struct FailExchange
{
    ViewId view_id = 0;
    http::ErrorKind kind = http::ErrorKind::TransportError;
    std::string message;
    std::string text;
    std::chrono::milliseconds elapsed{ 0 };
};

struct SetStatusText
{
    std::string text;
};

using UiCommand = std::variant<BeginExchange, ShowResponseHead, AppendBodySlice, ReplaceBody, CompleteExchange,
                               FailExchange, SetStatusText>;

struct UiMutation
{
    UiCommand command;
    std::string description;
};

} // namespace dispatch

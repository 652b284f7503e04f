#include "ChunkThrottle.hpp"

namespace http
{

ChunkThrottle::ChunkThrottle(std::chrono::milliseconds interval, Clock::time_point start)
    : interval_(interval)
    , last_flush_(start)
{
}

std::optional<std::string> ChunkThrottle::append(std::string_view data, Clock::time_point now)
{
    pending_.append(data.data(), data.size());

    if (now - last_flush_ < interval_ || pending_.empty())
        return std::nullopt;

    last_flush_ = now;
    std::string out;
    out.swap(pending_);
    return out;
}

std::optional<std::string> ChunkThrottle::finish()
{
    if (pending_.empty())
        return std::nullopt;

    std::string out;
    out.swap(pending_);
    return out;
}

} // namespace http

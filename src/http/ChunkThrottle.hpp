#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace http
{

// Coalesces body bytes so the UI sees at most one slice per interval, plus a final one.
class ChunkThrottle
{
public:
    using Clock = std::chrono::steady_clock;

    ChunkThrottle(std::chrono::milliseconds interval, Clock::time_point start);

    // Buffers data; returns everything pending once the interval has elapsed since the last flush.
    std::optional<std::string> append(std::string_view data, Clock::time_point now);

    // Unconditional final flush. Empty when nothing is pending.
    std::optional<std::string> finish();

    std::size_t pendingBytes() const { return pending_.size(); }

private:
    std::chrono::milliseconds interval_;
    Clock::time_point last_flush_;
    std::string pending_;
};

} // namespace http

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>

namespace utils
{

// Read-only view of a cancellation signal. A default-constructed token never fires.
class CancellationToken
{
public:
    CancellationToken() = default;

    explicit CancellationToken(std::stop_token token)
        : token_(std::move(token))
    {
    }

    bool isCancelled() const { return token_.stop_requested(); }
    bool canBeCancelled() const { return token_.stop_possible(); }
    const std::stop_token& stopToken() const { return token_; }

private:
    std::stop_token token_;
};

class CancellationSource
{
public:
    CancellationToken token() const { return CancellationToken(source_.get_token()); }
    void cancel() { source_.request_stop(); }
    bool isCancelled() const { return source_.stop_requested(); }

private:
    std::stop_source source_;
};

/**
 * @brief Cancellation scope that fires when any parent token fires,
 * when cancel() is called, or when an optional deadline passes.
 *
 * The deadline runs on its own jthread so a timeout is indistinguishable
 * from an explicit cancel to whoever observes token(); timedOut() tells
 * the two apart afterwards.
 */
class LinkedCancellation
{
public:
    explicit LinkedCancellation(std::initializer_list<CancellationToken> parents);
    ~LinkedCancellation();

    LinkedCancellation(const LinkedCancellation&) = delete;
    LinkedCancellation& operator=(const LinkedCancellation&) = delete;

    // Arms the deadline. Non-positive timeouts and repeated calls are ignored.
    void cancelAfter(std::chrono::milliseconds timeout);
    void cancel();

    CancellationToken token() const { return CancellationToken(source_.get_token()); }
    bool isCancelled() const { return source_.stop_requested(); }
    bool timedOut() const { return timed_out_.load(std::memory_order_acquire); }

private:
    struct Forward
    {
        std::stop_source target;
        void operator()() { target.request_stop(); }
    };

    std::stop_source source_;
    std::vector<std::unique_ptr<std::stop_callback<Forward>>> links_;

    std::mutex timer_mutex_;
    std::condition_variable_any timer_cv_;
    std::atomic<bool> timed_out_{ false };
    std::jthread timer_;
};

} // namespace utils

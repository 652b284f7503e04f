#pragma once

#include "WorkItem.hpp"
#include "../utils/CancellationToken.hpp"
#include "../utils/CountingSemaphore.hpp"

#include <algorithm>
#include <chrono>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <vector>

namespace dispatch
{

class QueueClosedError : public std::runtime_error
{
public:
    QueueClosedError()
        : std::runtime_error("queue is closed")
    {
    }
};

enum class PopStatus
{
    Item,
    Cancelled,
    Closed,
    TimedOut
};

template <typename T>
struct PopResult
{
    PopStatus status = PopStatus::Closed;
    std::optional<T> item;

    explicit operator bool() const { return status == PopStatus::Item; }
};

/**
 * @brief Heap-backed blocking queue. Producers push from any thread;
 * consumers sleep on a counting semaphore until an item or a signal arrives.
 *
 * Before(a, b) is true when a must be served ahead of b.
 */
template <typename T, typename Before = ServedBefore>
class PriorityQueue
{
public:
    PriorityQueue() = default;

    PriorityQueue(const PriorityQueue&) = delete;
    PriorityQueue& operator=(const PriorityQueue&) = delete;

    // Throws QueueClosedError after close().
    void push(T item)
    {
        if (!tryPush(item))
            throw QueueClosedError();
    }

    // Returns false after close(), leaving item untouched.
    bool tryPush(T& item)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_)
                return false;
            heap_.push_back(std::move(item));
            std::push_heap(heap_.begin(), heap_.end(), compare());
        }
        available_.release();
        return true;
    }

    PopResult<T> popHighest(const utils::CancellationToken& token)
    {
        for (;;)
        {
            auto status = available_.acquire(token);
            if (status != utils::CountingSemaphore::AcquireStatus::Acquired)
                return PopResult<T>{ toPopStatus(status), std::nullopt };

            if (auto item = takeTop())
                return PopResult<T>{ PopStatus::Item, std::move(item) };
        }
    }

    PopResult<T> popHighestFor(const utils::CancellationToken& token, std::chrono::milliseconds timeout)
    {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        for (;;)
        {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline -
                                                                                   std::chrono::steady_clock::now());
            if (remaining.count() < 0)
                remaining = std::chrono::milliseconds(0);

            auto status = available_.acquireFor(token, remaining);
            if (status != utils::CountingSemaphore::AcquireStatus::Acquired)
                return PopResult<T>{ toPopStatus(status), std::nullopt };

            if (auto item = takeTop())
                return PopResult<T>{ PopStatus::Item, std::move(item) };
        }
    }

    // Wakes every blocked consumer. Items still queued stay until clear() or drain().
    void close()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        available_.close();
    }

    bool isClosed() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    std::size_t size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return heap_.size();
    }

    void clear() { (void)drain(); }

    // Empties the queue and hands back what was left, in service order.
    std::vector<T> drain()
    {
        std::vector<T> left;
        std::lock_guard<std::mutex> lock(mutex_);
        left.reserve(heap_.size());
        while (!heap_.empty())
        {
            std::pop_heap(heap_.begin(), heap_.end(), compare());
            left.push_back(std::move(heap_.back()));
            heap_.pop_back();
        }
        while (available_.tryAcquire())
        {
        }
        return left;
    }

private:
    struct HeapCompare
    {
        Before before;
        bool operator()(const T& a, const T& b) const { return before(b, a); }
    };

    static HeapCompare compare() { return HeapCompare{}; }

    static PopStatus toPopStatus(utils::CountingSemaphore::AcquireStatus status)
    {
        switch (status)
        {
        case utils::CountingSemaphore::AcquireStatus::Cancelled:
            return PopStatus::Cancelled;
        case utils::CountingSemaphore::AcquireStatus::TimedOut:
            return PopStatus::TimedOut;
        case utils::CountingSemaphore::AcquireStatus::Closed:
        case utils::CountingSemaphore::AcquireStatus::Acquired:
            break;
        }
        return PopStatus::Closed;
    }

    // A permit without an item only happens after a racing clear(); the caller waits again.
    std::optional<T> takeTop()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (heap_.empty())
            return std::nullopt;
        std::pop_heap(heap_.begin(), heap_.end(), compare());
        T item = std::move(heap_.back());
        heap_.pop_back();
        return item;
    }

    mutable std::mutex mutex_;
    std::vector<T> heap_;
    utils::CountingSemaphore available_{ 0 };
    bool closed_ = false;
};

} // namespace dispatch

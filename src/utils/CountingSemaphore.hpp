#pragma once

#include "CancellationToken.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace utils
{

// Counting semaphore whose waits can be interrupted by a CancellationToken or by close().
class CountingSemaphore
{
public:
    enum class AcquireStatus
    {
        Acquired,
        Cancelled,
        Closed,
        TimedOut
    };

    explicit CountingSemaphore(std::size_t initial = 0);

    CountingSemaphore(const CountingSemaphore&) = delete;
    CountingSemaphore& operator=(const CountingSemaphore&) = delete;

    AcquireStatus acquire(const CancellationToken& token);
    AcquireStatus acquireFor(const CancellationToken& token, std::chrono::milliseconds timeout);
    bool tryAcquire();

    void release(std::size_t count = 1);

    // Wakes every waiter; later acquires return Closed.
    void close();
    bool isClosed() const;

    std::size_t available() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::size_t count_;
    bool closed_ = false;
};

// Releases one permit on scope exit.
class SemaphoreGuard
{
public:
    explicit SemaphoreGuard(CountingSemaphore& semaphore)
        : semaphore_(semaphore)
    {
    }

    ~SemaphoreGuard() { semaphore_.release(); }

    SemaphoreGuard(const SemaphoreGuard&) = delete;
    SemaphoreGuard& operator=(const SemaphoreGuard&) = delete;

private:
    CountingSemaphore& semaphore_;
};

} // namespace utils

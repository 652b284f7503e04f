#include "CountingSemaphore.hpp"

namespace utils
{

CountingSemaphore::CountingSemaphore(std::size_t initial)
    : count_(initial)
{
}

CountingSemaphore::AcquireStatus CountingSemaphore::acquire(const CancellationToken& token)
{
    if (token.isCancelled())
        return AcquireStatus::Cancelled;

    std::unique_lock<std::mutex> lock(mutex_);
    const bool ready = cv_.wait(lock, token.stopToken(), [this] { return count_ > 0 || closed_; });
    if (closed_)
        return AcquireStatus::Closed;
    // wait() re-checks the predicate after a stop request, so a free permit alone is not enough
    if (!ready || token.isCancelled())
        return AcquireStatus::Cancelled;

    --count_;
    return AcquireStatus::Acquired;
}

CountingSemaphore::AcquireStatus CountingSemaphore::acquireFor(const CancellationToken& token,
                                                               std::chrono::milliseconds timeout)
{
    if (token.isCancelled())
        return AcquireStatus::Cancelled;

    std::unique_lock<std::mutex> lock(mutex_);
    const bool ready = cv_.wait_for(lock, token.stopToken(), timeout, [this] { return count_ > 0 || closed_; });
    if (closed_)
        return AcquireStatus::Closed;
    if (token.isCancelled())
        return AcquireStatus::Cancelled;
    if (!ready)
        return AcquireStatus::TimedOut;

    --count_;
    return AcquireStatus::Acquired;
}

bool CountingSemaphore::tryAcquire()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_ || count_ == 0)
        return false;
    --count_;
    return true;
}

void CountingSemaphore::release(std::size_t count)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        count_ += count;
    }
    if (count == 1)
        cv_.notify_one();
    else
        cv_.notify_all();
}

void CountingSemaphore::close()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool CountingSemaphore::isClosed() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::size_t CountingSemaphore::available() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return count_;
}

} // namespace utils

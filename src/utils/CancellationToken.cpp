#include "CancellationToken.hpp"

namespace utils
{

LinkedCancellation::LinkedCancellation(std::initializer_list<CancellationToken> parents)
{
    links_.reserve(parents.size());
    for (const auto& parent : parents)
    {
        if (!parent.canBeCancelled())
            continue;
        links_.push_back(std::make_unique<std::stop_callback<Forward>>(parent.stopToken(), Forward{ source_ }));
    }
}

LinkedCancellation::~LinkedCancellation()
{
    if (timer_.joinable())
    {
        timer_.request_stop();
        timer_.join();
    }
    links_.clear();
}

void LinkedCancellation::cancelAfter(std::chrono::milliseconds timeout)
{
    if (timeout.count() <= 0 || timer_.joinable())
        return;

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    timer_ = std::jthread(
        [this, deadline](std::stop_token stoken)
        {
            std::unique_lock<std::mutex> lock(timer_mutex_);
            const bool already_stopped =
                timer_cv_.wait_until(lock, stoken, deadline, [this] { return source_.stop_requested(); });
            if (already_stopped || stoken.stop_requested())
                return;

            timed_out_.store(true, std::memory_order_release);
            source_.request_stop();
        });
}

void LinkedCancellation::cancel()
{
    source_.request_stop();
}

} // namespace utils

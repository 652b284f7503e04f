#pragma once

#include "PriorityQueue.hpp"
#include "UiState.hpp"
#include "WorkItem.hpp"
#include "../http/RequestSpec.hpp"
#include "../http/StreamingPipeline.hpp"
#include "../utils/CancellationToken.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>

namespace dispatch
{

struct DispatcherOptions
{
    std::chrono::milliseconds shutdown_timeout{ 5000 };
    std::chrono::milliseconds ui_flush_interval{ 300 };
};

struct QueueStats
{
    std::size_t outbound = 0;
    std::size_t ui = 0;
};

/**
 * @brief Two-queue work dispatcher.
 *
 * The outbound loop runs HTTP exchanges and completion callbacks; the UI loop
 * is the only thread that touches UiState. Entry points never block and throw
 * QueueClosedError once shutdown() has started.
 */
class Dispatcher
{
public:
    Dispatcher(http::StreamingRequestPipeline& pipeline, UiState& ui, DispatcherOptions options = {});
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    void start();

    // Returns false when a loop did not stop within the shutdown timeout. The loops are
    // joined either way. Callbacks of requests that never ran are answered with Cancelled.
    bool shutdown();

    // Returns the work item id, which also keys the response view in UiState.
    std::uint64_t queueHttpRequest(http::RequestSpec spec, utils::CancellationToken token = utils::CancellationToken(),
                                   CompletionCallback on_complete = CompletionCallback(),
                                   int prio = priority::kOutbound);
    std::uint64_t queueUiUpdate(UiMutation mutation, int prio = priority::kUiMutation);
    std::uint64_t queueNotification(Notice notice, int prio = priority::kNotice);

    QueueStats queueStats() const;
    bool isRunning() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace dispatch

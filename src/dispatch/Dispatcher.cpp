#include "Dispatcher.hpp"
#include "../http/ChunkThrottle.hpp"
#include "../http/ResponseFormatter.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <atomic>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <thread>
#include <type_traits>

namespace dispatch
{

struct Dispatcher::Impl
{
    Impl(http::StreamingRequestPipeline& p, UiState& u, DispatcherOptions o)
        : pipeline(p)
        , ui(u)
        , options(o)
    {
    }

    http::StreamingRequestPipeline& pipeline;
    UiState& ui;
    const DispatcherOptions options;

    PriorityQueue<WorkItem> outbound;
    PriorityQueue<WorkItem> ui_queue;
    utils::CancellationSource root;

    std::atomic<bool> started{ false };
    std::atomic<bool> shutdown_called{ false };

    std::mutex done_mutex;
    std::condition_variable done_cv;
    int loops_running = 0;

    std::jthread outbound_thread;
    std::jthread ui_thread;

    void runLoop(PriorityQueue<WorkItem>& queue, const char* name);
    void loopFinished();

    void handleOutbound(WorkItem& item);
    void handleUi(WorkItem& item);
    void runExchange(std::uint64_t id, OutboundRequest& request);

    // Fire-and-forget pushes from inside the loops. A closed queue means shutdown is underway.
    void post(PriorityQueue<WorkItem>& queue, Payload payload, int prio);
    void postStream(UiCommand command, const char* description);

    // Every OutboundRequest with a callback gets exactly one answer, shutdown included.
    void postCompletion(ResponseReady ready);
    void deliverCompletion(ResponseReady& ready);
    void abandon(WorkItem& item);
};

void Dispatcher::Impl::post(PriorityQueue<WorkItem>& queue, Payload payload, int prio)
{
    WorkItem item = makeWorkItem(std::move(payload), prio);
    if (!queue.tryPush(item))
        PLOG_DEBUG << "Dropped " << payloadName(item.payload) << " after queue close";
}

void Dispatcher::Impl::postCompletion(ResponseReady ready)
{
    WorkItem item = makeWorkItem(std::move(ready), priority::kResponseReady);
    if (outbound.tryPush(item))
        return;

    PLOG_DEBUG << "Outbound queue closed, completing request " << std::get<ResponseReady>(item.payload).original_id
               << " inline";
    deliverCompletion(std::get<ResponseReady>(item.payload));
}

void Dispatcher::Impl::deliverCompletion(ResponseReady& ready)
{
    if (!ready.completion)
        return;
    try
    {
        ready.completion(ready);
    }
    catch (const std::exception& ex)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Dispatch, "Completion callback failed",
                                          "request " + std::to_string(ready.original_id) + ": " + ex.what());
    }
}

void Dispatcher::Impl::abandon(WorkItem& item)
{
    if (auto* request = std::get_if<OutboundRequest>(&item.payload))
    {
        if (!request->on_complete)
            return;

        PLOG_INFO << "Request " << item.id << " cancelled before it was sent";
        ResponseReady ready;
        ready.original_id = item.id;
        ready.error_kind = http::ErrorKind::Cancelled;
        ready.error = http::cancelledText();
        ready.body = http::cancelledText();
        ready.completion = std::move(request->on_complete);
        deliverCompletion(ready);
    }
    else if (auto* ready = std::get_if<ResponseReady>(&item.payload))
    {
        deliverCompletion(*ready);
    }
}

void Dispatcher::Impl::postStream(UiCommand command, const char* description)
{
    post(ui_queue, UiMutation{ std::move(command), description }, priority::kStream);
}

void Dispatcher::Impl::runLoop(PriorityQueue<WorkItem>& queue, const char* name)
{
    PLOG_INFO << name << " loop started";
    const auto token = root.token();

    for (;;)
    {
        auto popped = queue.popHighest(token);
        if (!popped)
            break;

        WorkItem& item = *popped.item;
        try
        {
            if (&queue == &outbound)
                handleOutbound(item);
            else
                handleUi(item);
        }
        catch (const std::exception& ex)
        {
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Dispatch,
                                              std::string("Failed to process ") + payloadName(item.payload),
                                              std::string(name) + " item " + std::to_string(item.id) + ": " +
                                                  ex.what());
        }
    }

    PLOG_INFO << name << " loop stopped";
    loopFinished();
}

void Dispatcher::Impl::loopFinished()
{
    {
        std::lock_guard<std::mutex> lock(done_mutex);
        --loops_running;
    }
    done_cv.notify_all();
}

void Dispatcher::Impl::handleOutbound(WorkItem& item)
{
    if (auto* request = std::get_if<OutboundRequest>(&item.payload))
    {
        runExchange(item.id, *request);
    }
    else if (auto* ready = std::get_if<ResponseReady>(&item.payload))
    {
        if (ready->completion)
            ready->completion(*ready);
    }
    else
    {
        PLOG_WARNING << "Outbound queue received unexpected " << payloadName(item.payload);
    }
}

void Dispatcher::Impl::handleUi(WorkItem& item)
{
    if (auto* mutation = std::get_if<UiMutation>(&item.payload))
    {
        ui.apply(*mutation);
    }
    else if (auto* notice = std::get_if<Notice>(&item.payload))
    {
        ui.deliverNotice(*notice);
    }
    else
    {
        PLOG_WARNING << "UI queue received unexpected " << payloadName(item.payload);
    }
}

void Dispatcher::Impl::runExchange(std::uint64_t id, OutboundRequest& request)
{
    const http::RequestSpec& spec = request.spec;
    const std::string method = http::verbName(http::parseVerb(spec.method));

    PLOG_INFO << "Dispatching request " << id << ": " << method << " " << spec.fullUrl();
    postStream(BeginExchange{ id, method, spec.fullUrl() }, "Begin exchange");

    utils::LinkedCancellation link{ request.cancel_token, root.token() };
    http::ChunkThrottle throttle(options.ui_flush_interval, http::ChunkThrottle::Clock::now());

    auto onHeader = [this, id](const std::string& head) {
        postStream(ShowResponseHead{ id, head }, "Show response head");
    };
    auto onChunk = [this, id, &throttle](std::string_view chunk) {
        if (auto slice = throttle.append(chunk, http::ChunkThrottle::Clock::now()))
            postStream(AppendBodySlice{ id, std::move(*slice) }, "Append streaming slice");
    };

    http::ExchangeResult result =
        pipeline.run(spec, link.token(), onHeader, onChunk, http::CaptureMode::Interactive);

    if (result.success)
    {
        if (auto slice = throttle.finish())
            postStream(AppendBodySlice{ id, std::move(*slice) }, "Append final streaming slice");
        if (result.truncated)
        {
            const auto cap = pipeline.captureLimit(spec, http::CaptureMode::Interactive);
            postStream(AppendBodySlice{ id, http::truncationNotice(cap) }, "Append truncation notice");
        }
        if (result.formatted)
            postStream(ReplaceBody{ id, result.full_text }, "Show formatted body");

        postStream(CompleteExchange{ id, result.status_code, result.elapsed, result.byte_size, result.truncated },
                   "Complete exchange");
        post(ui_queue,
             Notice{ "Request Completed", http::completionMessage(method, result.elapsed, result.byte_size), true },
             priority::kNotice);
    }
    else
    {
        postStream(FailExchange{ id, result.error_kind, result.error, result.full_text, result.elapsed },
                   "Fail exchange");
        if (result.error_kind == http::ErrorKind::Cancelled)
            post(ui_queue, Notice{ "Request Cancelled", "The HTTP request was cancelled.", false }, priority::kNotice);
        else
            post(ui_queue, Notice{ "Request Failed", "HTTP request failed: " + result.error, false },
                 priority::kNotice);

        PLOG_WARNING << "Request " << id << " failed (" << http::errorKindName(result.error_kind)
                     << "): " << result.error;
    }

    if (request.on_complete)
    {
        ResponseReady ready;
        ready.original_id = id;
        ready.success = result.success;
        ready.status_code = result.status_code;
        ready.error_kind = result.error_kind;
        ready.error = result.error;
        ready.elapsed = result.elapsed;
        ready.byte_size = result.byte_size;
        ready.truncated = result.truncated;
        ready.body = std::move(result.full_text);
        ready.completion = std::move(request.on_complete);
        postCompletion(std::move(ready));
    }
}

Dispatcher::Dispatcher(http::StreamingRequestPipeline& pipeline, UiState& ui, DispatcherOptions options)
    : impl_(std::make_unique<Impl>(pipeline, ui, options))
{
}

Dispatcher::~Dispatcher() { (void)shutdown(); }

void Dispatcher::start()
{
    if (impl_->shutdown_called.load())
    {
        PLOG_WARNING << "Dispatcher::start() after shutdown ignored";
        return;
    }

    bool expected = false;
    if (!impl_->started.compare_exchange_strong(expected, true))
        return;

    {
        std::lock_guard<std::mutex> lock(impl_->done_mutex);
        impl_->loops_running = 2;
    }

    Impl* impl = impl_.get();
    impl->outbound_thread = std::jthread([impl](std::stop_token) { impl->runLoop(impl->outbound, "Outbound"); });
    impl->ui_thread = std::jthread([impl](std::stop_token) { impl->runLoop(impl->ui_queue, "UI"); });
}

bool Dispatcher::shutdown()
{
    bool expected = false;
    if (!impl_->shutdown_called.compare_exchange_strong(expected, true))
        return true;

    PLOG_INFO << "Dispatcher shutting down";

    impl_->root.cancel();
    impl_->outbound.close();
    impl_->ui_queue.close();

    bool stopped = true;
    if (impl_->started.load())
    {
        std::unique_lock<std::mutex> lock(impl_->done_mutex);
        stopped = impl_->done_cv.wait_for(lock, impl_->options.shutdown_timeout,
                                          [this] { return impl_->loops_running == 0; });
    }

    // The loops borrow the pipeline and UiState, so they are joined even past the timeout.
    if (!stopped)
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Dispatch, "Dispatcher loops did not stop in time",
                                            "Timeout " + std::to_string(impl_->options.shutdown_timeout.count()) +
                                                " ms; waiting for the current item to finish");
    }
    if (impl_->outbound_thread.joinable())
        impl_->outbound_thread.join();
    if (impl_->ui_thread.joinable())
        impl_->ui_thread.join();

    for (auto& item : impl_->outbound.drain())
        impl_->abandon(item);
    impl_->ui_queue.clear();
    return stopped;
}

std::uint64_t Dispatcher::queueHttpRequest(http::RequestSpec spec, utils::CancellationToken token,
                                           CompletionCallback on_complete, int prio)
{
    WorkItem item =
        makeWorkItem(OutboundRequest{ std::move(spec), std::move(token), std::move(on_complete) }, prio);
    const auto id = item.id;
    impl_->outbound.push(std::move(item));
    return id;
}

std::uint64_t Dispatcher::queueUiUpdate(UiMutation mutation, int prio)
{
    WorkItem item = makeWorkItem(std::move(mutation), prio);
    const auto id = item.id;
    impl_->ui_queue.push(std::move(item));
    return id;
}

std::uint64_t Dispatcher::queueNotification(Notice notice, int prio)
{
    WorkItem item = makeWorkItem(std::move(notice), prio);
    const auto id = item.id;
    impl_->ui_queue.push(std::move(item));
    return id;
}

QueueStats Dispatcher::queueStats() const { return QueueStats{ impl_->outbound.size(), impl_->ui_queue.size() }; }

bool Dispatcher::isRunning() const { return impl_->started.load() && !impl_->shutdown_called.load(); }

} // namespace dispatch

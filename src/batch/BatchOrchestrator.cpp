#include "BatchOrchestrator.hpp"
#include "../utils/CountingSemaphore.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <exception>
#include <mutex>
#include <system_error>
#include <thread>

namespace batch
{

std::string displayName(const http::RequestSpec& spec)
{
    return http::isBlank(spec.name) ? spec.url : spec.name;
}

BatchOrchestrator::BatchOrchestrator(http::StreamingRequestPipeline& pipeline)
    : pipeline_(pipeline)
{
}

std::jthread BatchOrchestrator::launch(std::function<void()> work) { return std::jthread(std::move(work)); }

BatchResult BatchOrchestrator::runAll(const std::vector<http::RequestSpec>& specs,
                                      const utils::CancellationToken& token, int maxConcurrency,
                                      const ProgressCallback& progress)
{
    const auto start = std::chrono::steady_clock::now();
    BatchResult result;

    std::vector<const http::RequestSpec*> eligible;
    for (const auto& spec : specs)
    {
        if (!http::isBlank(spec.url))
            eligible.push_back(&spec);
    }

    if (eligible.empty())
    {
        PLOG_INFO << "Batch has no requests with a URL";
        return result;
    }

    const std::size_t total = eligible.size();
    const std::size_t slots = static_cast<std::size_t>(std::max(1, maxConcurrency));
    result.total_requests = total;
    result.outcomes.resize(total);

    PLOG_INFO << "Batch starting: " << total << " requests, concurrency " << slots;

    utils::CountingSemaphore semaphore(slots);
    std::mutex progress_mutex;

    auto report = [&](std::size_t index, const std::string& name, std::string status) {
        if (!progress)
            return;
        std::lock_guard<std::mutex> lock(progress_mutex);
        try
        {
            progress(BatchProgress{ index + 1, total, name, std::move(status) });
        }
        catch (const std::exception& ex)
        {
            PLOG_WARNING << "Batch progress callback threw: " << ex.what();
        }
    };

    auto runOne = [&](std::size_t index) {
        const http::RequestSpec& spec = *eligible[index];
        RequestOutcome& outcome = result.outcomes[index];
        outcome.name = displayName(spec);

        if (semaphore.acquire(token) != utils::CountingSemaphore::AcquireStatus::Acquired)
        {
            report(index, outcome.name, "Cancelled");
            return;
        }
        utils::SemaphoreGuard slot(semaphore);

        report(index, outcome.name, "Sending...");

        http::ExchangeResult exchange;
        try
        {
            exchange = pipeline_.run(spec, token, nullptr, nullptr, http::CaptureMode::SingleShot);
        }
        catch (const std::exception& ex)
        {
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Batch, "Batch request aborted unexpectedly",
                                              outcome.name + ": " + ex.what());
            exchange = http::ExchangeResult{};
            exchange.error_kind = http::ErrorKind::TransportError;
            exchange.error = ex.what();
        }

        outcome.status_code = exchange.status_code;
        outcome.elapsed = exchange.elapsed;
        outcome.byte_size = exchange.byte_size;

        if (exchange.error_kind == http::ErrorKind::Cancelled)
        {
            report(index, outcome.name, "Cancelled");
            return;
        }

        outcome.finished = true;
        outcome.success = exchange.success;
        if (exchange.success)
        {
            report(index, outcome.name, "Completed (" + std::to_string(exchange.status_code) + ")");
        }
        else
        {
            outcome.error = exchange.error;
            report(index, outcome.name, "Failed: " + exchange.error);
        }
    };

    {
        std::vector<std::jthread> workers;
        workers.reserve(total);
        for (std::size_t i = 0; i < total; ++i)
        {
            try
            {
                workers.push_back(launch([&runOne, i] { runOne(i); }));
            }
            catch (const std::system_error& ex)
            {
                RequestOutcome& outcome = result.outcomes[i];
                outcome.name = displayName(*eligible[i]);
                outcome.finished = true;
                outcome.error = std::string("Could not start request: ") + ex.what();
                utils::ErrorReporter::ReportError(utils::ErrorCategory::Batch, "Could not start batch request",
                                                  outcome.name + ": " + ex.what());
                report(i, outcome.name, "Failed: " + outcome.error);
            }
        }
    }

    for (const auto& outcome : result.outcomes)
    {
        if (!outcome.finished)
        {
            ++result.cancelled_requests;
            continue;
        }

        ++result.completed_requests;
        if (outcome.success)
        {
            ++result.successful_requests;
        }
        else
        {
            ++result.failed_requests;
            result.errors.push_back("Request '" + outcome.name + "' failed: " + outcome.error);
        }
    }

    result.cancelled = result.cancelled_requests > 0;
    result.total_elapsed =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

    PLOG_INFO << "Batch finished in " << result.total_elapsed.count() << " ms: " << result.successful_requests
              << " ok, " << result.failed_requests << " failed, " << result.cancelled_requests << " cancelled";
    return result;
}

} // namespace batch

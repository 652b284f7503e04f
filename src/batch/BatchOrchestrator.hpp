#pragma once

#include "../http/RequestSpec.hpp"
#include "../http/StreamingPipeline.hpp"
#include "../utils/CancellationToken.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <thread>
#include <vector>

namespace batch
{

struct BatchProgress
{
    std::size_t current = 0;
    std::size_t total = 0;
    std::string request_name;
    std::string status;
};

struct RequestOutcome
{
    std::string name;
    // False when the request never got a slot or was cancelled in flight.
    bool finished = false;
    bool success = false;
    int status_code = 0;
    std::chrono::milliseconds elapsed{ 0 };
    std::size_t byte_size = 0;
    std::string error;
};

struct BatchResult
{
    std::size_t total_requests = 0;
    std::size_t completed_requests = 0;
    std::size_t successful_requests = 0;
    std::size_t failed_requests = 0;
    std::size_t cancelled_requests = 0;
    std::vector<std::string> errors;
    std::vector<RequestOutcome> outcomes;
    std::chrono::milliseconds total_elapsed{ 0 };
    bool cancelled = false;
};

using ProgressCallback = std::function<void(const BatchProgress&)>;

/**
 * @brief Fires every request of a collection at once, at most maxConcurrency in flight.
 *
 * Errors end up as strings in the result. Progress callbacks are serialized but
 * arrive on the batch worker threads.
 */
class BatchOrchestrator
{
public:
    explicit BatchOrchestrator(http::StreamingRequestPipeline& pipeline);
    virtual ~BatchOrchestrator() = default;

    BatchResult runAll(const std::vector<http::RequestSpec>& specs, const utils::CancellationToken& token,
                       int maxConcurrency = 5, const ProgressCallback& progress = ProgressCallback());

protected:
    // Starts the thread for one request. May throw std::system_error when the OS refuses.
    virtual std::jthread launch(std::function<void()> work);

private:
    http::StreamingRequestPipeline& pipeline_;
};

std::string displayName(const http::RequestSpec& spec);

} // namespace batch

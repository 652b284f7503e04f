#include "StreamingPipeline.hpp"
#include "RequestBuilder.hpp"
#include "ResponseFormatter.hpp"
#include "../utils/LogManager.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <cstring>
#include <exception>

namespace
{

using Clock = std::chrono::steady_clock;

struct StreamingState
{
    std::string head_text;
    std::string content_type;
    int status_code = 0;

    std::string captured;
    std::size_t cap = 0;
    bool truncated = false;

    http::PooledChunk chunk;
    std::size_t chunk_size = 0;
    std::size_t fill = 0;
};

std::chrono::milliseconds since(Clock::time_point start)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

} // namespace

namespace http
{

const char* errorKindName(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::None:
        return "None";
    case ErrorKind::InvalidUrl:
        return "InvalidUrl";
    case ErrorKind::TransportError:
        return "TransportError";
    case ErrorKind::Timeout:
        return "Timeout";
    case ErrorKind::Cancelled:
        return "Cancelled";
    }
    return "None";
}

StreamingRequestPipeline::StreamingRequestPipeline(ITransport& transport, PipelineOptions options,
                                                   utils::CancellationToken shutdown)
    : transport_(transport)
    , options_(options)
    , shutdown_(std::move(shutdown))
    , pool_(options.chunk_size)
{
}

std::size_t StreamingRequestPipeline::captureLimit(const RequestSpec& spec, CaptureMode mode) const
{
    if (spec.max_capture_bytes && *spec.max_capture_bytes > 0)
        return *spec.max_capture_bytes;
    return mode == CaptureMode::Interactive ? options_.streaming_capture_bytes : options_.single_shot_capture_bytes;
}

ExchangeResult StreamingRequestPipeline::run(const RequestSpec& spec, const utils::CancellationToken& token,
                                             const HeaderHandler& onHeader, const ChunkHandler& onChunk,
                                             CaptureMode mode)
{
    const auto start = Clock::now();

    ExchangeResult result;
    result.url = spec.fullUrl();
    result.method = verbName(parseVerb(spec.method));

    if (!isAbsoluteHttpUrl(result.url))
    {
        result.error_kind = ErrorKind::InvalidUrl;
        result.error = "Invalid URL: '" + result.url + "' is not an absolute http(s) URL";
        result.full_text = errorText(result.error, result.url);
        result.elapsed = since(start);
        PLOG_WARNING << result.error;
        return result;
    }

    if (token.isCancelled() || shutdown_.isCancelled())
    {
        result.error_kind = ErrorKind::Cancelled;
        result.error = cancelledText();
        result.full_text = cancelledText();
        result.elapsed = since(start);
        return result;
    }

    WireRequest wire = buildWireRequest(spec);

    utils::LinkedCancellation scope{ token, shutdown_ };
    if (spec.timeout_ms > 0)
        scope.cancelAfter(std::chrono::milliseconds(spec.timeout_ms));

    StreamingState state;
    state.cap = captureLimit(spec, mode);
    state.chunk = pool_.acquire();
    state.chunk_size = pool_.chunkSize();

    // Forwards the part of a full chunk that still fits under the cap. False once the cap is exceeded.
    auto deliver = [&state, &onChunk](const char* data, std::size_t size) -> bool {
        std::size_t room = state.cap - state.captured.size();
        std::size_t take = std::min(size, room);
        if (take > 0)
        {
            state.captured.append(data, take);
            if (onChunk)
                onChunk(std::string_view(data, take));
        }
        if (take < size)
        {
            state.truncated = true;
            return false;
        }
        return true;
    };

    TransportCallbacks callbacks;
    callbacks.onResponseHead = [&](const ResponseHead& head) {
        state.status_code = head.status_code;
        state.content_type = head.headerValue("Content-Type");
        state.head_text = formatResponseHead(head, result.url, spec.auth.type);
        if (onHeader)
            onHeader(state.head_text);
    };
    callbacks.onData = [&](std::string_view data) -> bool {
        if (state.truncated || scope.isCancelled())
            return false;

        while (!data.empty())
        {
            std::size_t n = std::min(state.chunk_size - state.fill, data.size());
            std::memcpy(state.chunk.get() + state.fill, data.data(), n);
            state.fill += n;
            data.remove_prefix(n);

            if (state.fill == state.chunk_size)
            {
                bool more = deliver(state.chunk.get(), state.fill);
                state.fill = 0;
                if (!more || scope.isCancelled())
                    return false;
            }
        }
        return true;
    };
    callbacks.shouldAbort = [&scope]() { return scope.isCancelled(); };

    TransportOutcome outcome;
    try
    {
        outcome = transport_.perform(wire, callbacks);
    }
    catch (const std::exception& ex)
    {
        outcome = TransportOutcome{};
        outcome.error = ex.what();
    }

    if (!state.truncated && (outcome.aborted || !outcome.ok) && scope.isCancelled())
    {
        bool timed_out = scope.timedOut() && !token.isCancelled() && !shutdown_.isCancelled();
        if (timed_out)
        {
            result.error_kind = ErrorKind::Timeout;
            result.error = "Request timed out after " + std::to_string(spec.timeout_ms) + " ms";
            result.full_text = timeoutText(spec.timeout_ms, result.url);
        }
        else
        {
            result.error_kind = ErrorKind::Cancelled;
            result.error = cancelledText();
            result.full_text = cancelledText();
        }
    }
    else if (!state.truncated && !outcome.ok)
    {
        result.error_kind = ErrorKind::TransportError;
        result.error = outcome.error.empty() ? std::string("transfer aborted") : outcome.error;
        result.full_text = errorText(result.error, result.url);
    }
    else
    {
        if (!state.truncated && state.fill > 0)
            deliver(state.chunk.get(), state.fill);
        state.fill = 0;

        std::string body_text;
        bool formatted = false;
        if (!state.truncated && spec.format_json && state.captured.size() < options_.format_limit_bytes &&
            isJsonContentType(state.content_type))
        {
            formatted = tryPrettyPrintJson(state.captured, body_text);
        }

        result.success = true;
        result.status_code = state.status_code;
        result.truncated = state.truncated;
        result.formatted = formatted;
        result.full_text = state.head_text;
        result.full_text += formatted ? body_text : state.captured;
        if (state.truncated)
            result.full_text += truncationNotice(state.cap);
    }

    result.byte_size = state.captured.size();
    result.elapsed = since(start);

    PLOG_INFO_(utils::kTrafficLogInstance) << result.method << " " << result.url << " -> "
                                          << (result.success ? std::to_string(result.status_code)
                                                             : std::string(errorKindName(result.error_kind)))
                                          << " " << result.elapsed.count() << "ms " << result.byte_size << "B"
                                          << (result.truncated ? " truncated" : "");
    return result;
}

} // namespace http

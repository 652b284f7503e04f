#pragma once

#include "ChunkBufferPool.hpp"
#include "RequestSpec.hpp"
#include "Transport.hpp"
#include "../utils/CancellationToken.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

namespace http
{

enum class ErrorKind
{
    None,
    InvalidUrl,
    TransportError,
    Timeout,
    Cancelled
};

const char* errorKindName(ErrorKind kind);

enum class CaptureMode
{
    // Streaming into the UI; smaller capture cap
    Interactive,
    SingleShot
};

struct PipelineOptions
{
    std::size_t chunk_size = kDefaultChunkSize;
    std::size_t streaming_capture_bytes = 10 * 1024 * 1024;
    std::size_t single_shot_capture_bytes = 100 * 1024 * 1024;
    std::size_t format_limit_bytes = 1000000;
};

struct ExchangeResult
{
    // The exchange completed. Non-2xx statuses still count as completed.
    bool success = false;
    int status_code = 0;
    std::chrono::milliseconds elapsed{ 0 };
    std::size_t byte_size = 0;
    std::string full_text;
    bool truncated = false;
    // Body was pretty-printed, so full_text differs from the streamed bytes
    bool formatted = false;
    ErrorKind error_kind = ErrorKind::None;
    std::string error;

    std::string method;
    std::string url;
};

using HeaderHandler = std::function<void(const std::string& head_text)>;
using ChunkHandler = std::function<void(std::string_view chunk)>;

// Runs one HTTP exchange with bounded memory. Safe to call from several threads at once.
class StreamingRequestPipeline
{
public:
    StreamingRequestPipeline(ITransport& transport, PipelineOptions options,
                             utils::CancellationToken shutdown = utils::CancellationToken());

    StreamingRequestPipeline(const StreamingRequestPipeline&) = delete;
    StreamingRequestPipeline& operator=(const StreamingRequestPipeline&) = delete;

    ExchangeResult run(const RequestSpec& spec, const utils::CancellationToken& token, const HeaderHandler& onHeader,
                       const ChunkHandler& onChunk, CaptureMode mode = CaptureMode::SingleShot);

    std::size_t captureLimit(const RequestSpec& spec, CaptureMode mode) const;

    const PipelineOptions& options() const { return options_; }
    ChunkBufferPool& bufferPool() { return pool_; }

private:
    ITransport& transport_;
    const PipelineOptions options_;
    utils::CancellationToken shutdown_;
    ChunkBufferPool pool_;
};

} // namespace http

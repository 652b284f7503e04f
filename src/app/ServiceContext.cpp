#include "ServiceContext.hpp"
#include "batch/BatchOrchestrator.hpp"
#include "config/HammerSettings.hpp"
#include "dispatch/Dispatcher.hpp"
#include "dispatch/UiState.hpp"
#include "http/CprTransport.hpp"
#include "http/StreamingPipeline.hpp"
#include "utils/CancellationToken.hpp"

#include <plog/Log.h>

struct ServiceContext::ShutdownSignal
{
    utils::CancellationSource source;
};

namespace
{

std::unique_ptr<http::ITransport> makeCprTransport(const HammerSettings& settings)
{
    const auto& h = settings.http();
    http::CprTransportConfig cfg;
    cfg.connect_timeout_ms = h.connect_timeout_ms;
    cfg.timeout_ms = h.default_timeout_ms;
    cfg.user_agent = h.user_agent;
    cfg.verify_tls = h.verify_tls;
    return std::make_unique<http::CprTransport>(cfg);
}

} // namespace

ServiceContext::ServiceContext(const HammerSettings& settings)
    : ServiceContext(settings, makeCprTransport(settings))
{
}

ServiceContext::ServiceContext(const HammerSettings& settings, std::unique_ptr<http::ITransport> transport)
    : shutdown_(std::make_unique<ShutdownSignal>())
    , transport_(std::move(transport))
    , default_concurrency_(settings.batch().max_concurrency)
{
    const auto& h = settings.http();
    http::PipelineOptions options;
    options.chunk_size = h.chunk_size_bytes;
    options.streaming_capture_bytes = h.streaming_capture_bytes;
    options.single_shot_capture_bytes = h.single_shot_capture_bytes;
    options.format_limit_bytes = h.format_limit_bytes;

    pipeline_ = std::make_unique<http::StreamingRequestPipeline>(*transport_, options, shutdown_->source.token());
    ui_ = std::make_unique<dispatch::UiState>(settings.dispatch().display_limit_bytes);

    dispatch::DispatcherOptions dispatcher_options;
    dispatcher_options.shutdown_timeout = std::chrono::milliseconds(settings.dispatch().shutdown_timeout_ms);
    dispatcher_options.ui_flush_interval = std::chrono::milliseconds(settings.dispatch().ui_flush_interval_ms);
    dispatcher_ = std::make_unique<dispatch::Dispatcher>(*pipeline_, *ui_, dispatcher_options);

    batch_ = std::make_unique<batch::BatchOrchestrator>(*pipeline_);
}

ServiceContext::~ServiceContext() { shutdown(); }

void ServiceContext::shutdown()
{
    if (shutdown_->source.isCancelled())
        return;

    PLOG_INFO << "Shutting down services";
    shutdown_->source.cancel();
    if (!dispatcher_->shutdown())
        PLOG_WARNING << "Dispatcher did not stop cleanly";
}

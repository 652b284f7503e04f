#pragma once

#include <memory>

class HammerSettings;

namespace http
{
class ITransport;
class StreamingRequestPipeline;
} // namespace http

namespace dispatch
{
class Dispatcher;
class UiState;
} // namespace dispatch

namespace batch
{
class BatchOrchestrator;
}

/**
 * @brief Owns the request-dispatch services for one application run.
 *
 * Built once from the loaded settings and handed around by reference.
 * Destruction cancels the shared shutdown token before tearing the services down.
 */
class ServiceContext
{
public:
    explicit ServiceContext(const HammerSettings& settings);
    ServiceContext(const HammerSettings& settings, std::unique_ptr<http::ITransport> transport);
    ~ServiceContext();

    ServiceContext(const ServiceContext&) = delete;
    ServiceContext& operator=(const ServiceContext&) = delete;

    http::ITransport& transport() { return *transport_; }
    http::StreamingRequestPipeline& pipeline() { return *pipeline_; }
    dispatch::UiState& ui() { return *ui_; }
    dispatch::Dispatcher& dispatcher() { return *dispatcher_; }
    batch::BatchOrchestrator& batch() { return *batch_; }

    int defaultConcurrency() const { return default_concurrency_; }

    // Cancels every in-flight exchange and stops the dispatcher. Idempotent.
    void shutdown();

private:
    struct ShutdownSignal;

    std::unique_ptr<ShutdownSignal> shutdown_;
    std::unique_ptr<http::ITransport> transport_;
    std::unique_ptr<http::StreamingRequestPipeline> pipeline_;
    std::unique_ptr<dispatch::UiState> ui_;
    std::unique_ptr<dispatch::Dispatcher> dispatcher_;
    std::unique_ptr<batch::BatchOrchestrator> batch_;
    int default_concurrency_ = 5;
};

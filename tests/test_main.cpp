// Catch2WithMain provides main(); this file only holds the wiring smoke test

#include <catch2/catch_test_macros.hpp>

#include "app/ServiceContext.hpp"
#include "batch/BatchOrchestrator.hpp"
#include "config/HammerSettings.hpp"
#include "dispatch/Dispatcher.hpp"
#include "utils/CancellationToken.hpp"
#include "utils/fake_transport.hpp"

#include <memory>
#include <vector>

TEST_CASE("ServiceContext - wiring smoke test", "[smoke]") {
    HammerSettings settings;
    auto transport = std::make_unique<test_utils::FakeTransport>();
    auto* fake = transport.get();
    fake->setDefaultResponse(test_utils::jsonResponse(R"({"ok":true})"));

    ServiceContext services(settings, std::move(transport));
    REQUIRE(services.defaultConcurrency() == 5);

    http::RequestSpec spec;
    spec.name = "ping";
    spec.url = "http://localhost/ping";

    utils::CancellationSource source;
    auto result = services.batch().runAll({ spec }, source.token(), services.defaultConcurrency());
    REQUIRE(result.total_requests == 1);
    REQUIRE(result.successful_requests == 1);
    REQUIRE(fake->callCount() == 1);

    services.dispatcher().start();
    REQUIRE(services.dispatcher().isRunning());

    services.shutdown();
    REQUIRE_FALSE(services.dispatcher().isRunning());
    services.shutdown();
}

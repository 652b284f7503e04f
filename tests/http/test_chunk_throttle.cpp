#include <catch2/catch_test_macros.hpp>

#include <chrono>

#include "http/ChunkThrottle.hpp"

using namespace http;
using namespace std::chrono_literals;

TEST_CASE("ChunkThrottle - flush timing", "[http][throttle]") {
    const auto t0 = ChunkThrottle::Clock::time_point{} + 1h;
    ChunkThrottle throttle(300ms, t0);

    SECTION("Bytes inside the interval are held back") {
        REQUIRE_FALSE(throttle.append("a", t0 + 10ms));
        REQUIRE_FALSE(throttle.append("b", t0 + 299ms));
        REQUIRE(throttle.pendingBytes() == 2);
    }

    SECTION("Everything pending is flushed once the interval passes") {
        REQUIRE_FALSE(throttle.append("a", t0 + 100ms));
        auto flushed = throttle.append("b", t0 + 300ms);
        REQUIRE(flushed);
        REQUIRE(*flushed == "ab");
        REQUIRE(throttle.pendingBytes() == 0);
    }

    SECTION("The interval restarts at each flush") {
        REQUIRE(throttle.append("a", t0 + 400ms));
        REQUIRE_FALSE(throttle.append("b", t0 + 600ms));
        auto flushed = throttle.append("c", t0 + 700ms);
        REQUIRE(flushed);
        REQUIRE(*flushed == "bc");
    }

    SECTION("Finish flushes the remainder unconditionally") {
        REQUIRE_FALSE(throttle.append("tail", t0 + 1ms));
        auto last = throttle.finish();
        REQUIRE(last);
        REQUIRE(*last == "tail");
        REQUIRE_FALSE(throttle.finish());
    }

    SECTION("Finish with nothing pending is empty") {
        REQUIRE_FALSE(throttle.finish());
    }
}

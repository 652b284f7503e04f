#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <thread>

#include "utils/CancellationToken.hpp"
#include "utils/CountingSemaphore.hpp"

using namespace utils;
using namespace std::chrono_literals;

TEST_CASE("Cancellation - tokens and linked scopes", "[utils][cancellation]") {

    SECTION("Default token never fires") {
        CancellationToken token;
        REQUIRE_FALSE(token.isCancelled());
        REQUIRE_FALSE(token.canBeCancelled());
    }

    SECTION("Source cancels its tokens") {
        CancellationSource source;
        auto token = source.token();
        REQUIRE_FALSE(token.isCancelled());
        source.cancel();
        REQUIRE(token.isCancelled());
        REQUIRE(source.isCancelled());
    }

    SECTION("Linked scope fires when any parent fires") {
        CancellationSource caller;
        CancellationSource shutdown;
        LinkedCancellation scope{caller.token(), shutdown.token()};

        REQUIRE_FALSE(scope.isCancelled());
        shutdown.cancel();
        REQUIRE(scope.isCancelled());
        REQUIRE(scope.token().isCancelled());
        REQUIRE_FALSE(scope.timedOut());
        REQUIRE_FALSE(caller.isCancelled());
    }

    SECTION("Cancelling the scope does not touch parents") {
        CancellationSource caller;
        LinkedCancellation scope{caller.token()};
        scope.cancel();
        REQUIRE(scope.isCancelled());
        REQUIRE_FALSE(caller.isCancelled());
    }

    SECTION("Already cancelled parent fires immediately") {
        CancellationSource caller;
        caller.cancel();
        LinkedCancellation scope{caller.token()};
        REQUIRE(scope.isCancelled());
    }

    SECTION("Deadline fires and is reported as a timeout") {
        LinkedCancellation scope{CancellationToken()};
        scope.cancelAfter(30ms);

        const auto deadline = std::chrono::steady_clock::now() + 2s;
        while (!scope.isCancelled() && std::chrono::steady_clock::now() < deadline)
            std::this_thread::sleep_for(2ms);

        REQUIRE(scope.isCancelled());
        REQUIRE(scope.timedOut());
    }

    SECTION("Explicit cancel before the deadline is not a timeout") {
        LinkedCancellation scope{CancellationToken()};
        scope.cancelAfter(5s);
        scope.cancel();
        std::this_thread::sleep_for(20ms);
        REQUIRE(scope.isCancelled());
        REQUIRE_FALSE(scope.timedOut());
    }

    SECTION("Non-positive timeout is ignored") {
        LinkedCancellation scope{CancellationToken()};
        scope.cancelAfter(0ms);
        std::this_thread::sleep_for(10ms);
        REQUIRE_FALSE(scope.isCancelled());
    }
}

TEST_CASE("CountingSemaphore - acquire and release", "[utils][semaphore]") {

    SECTION("Permits are counted") {
        CountingSemaphore sem(2);
        CancellationToken token;
        REQUIRE(sem.acquire(token) == CountingSemaphore::AcquireStatus::Acquired);
        REQUIRE(sem.tryAcquire());
        REQUIRE_FALSE(sem.tryAcquire());
        sem.release(2);
        REQUIRE(sem.available() == 2);
    }

    SECTION("Blocked acquire wakes on release") {
        CountingSemaphore sem(0);
        std::atomic<bool> acquired{false};
        std::thread waiter([&] {
            acquired = sem.acquire(CancellationToken()) == CountingSemaphore::AcquireStatus::Acquired;
        });
        std::this_thread::sleep_for(20ms);
        REQUIRE_FALSE(acquired.load());
        sem.release();
        waiter.join();
        REQUIRE(acquired.load());
    }

    SECTION("Cancellation interrupts a blocked acquire") {
        CountingSemaphore sem(0);
        CancellationSource source;
        CountingSemaphore::AcquireStatus status = CountingSemaphore::AcquireStatus::Acquired;
        std::thread waiter([&] { status = sem.acquire(source.token()); });
        std::this_thread::sleep_for(20ms);
        source.cancel();
        waiter.join();
        REQUIRE(status == CountingSemaphore::AcquireStatus::Cancelled);
        REQUIRE(sem.available() == 0);
    }

    SECTION("Close wakes every waiter") {
        CountingSemaphore sem(0);
        std::atomic<int> closed{0};
        auto waiter = [&] {
            if (sem.acquire(CancellationToken()) == CountingSemaphore::AcquireStatus::Closed)
                ++closed;
        };
        std::thread a(waiter);
        std::thread b(waiter);
        std::this_thread::sleep_for(20ms);
        sem.close();
        a.join();
        b.join();
        REQUIRE(closed.load() == 2);
        REQUIRE(sem.isClosed());
    }

    SECTION("Timed acquire gives up") {
        CountingSemaphore sem(0);
        REQUIRE(sem.acquireFor(CancellationToken(), 20ms) == CountingSemaphore::AcquireStatus::TimedOut);
    }

    SECTION("Guard releases on scope exit") {
        CountingSemaphore sem(1);
        REQUIRE(sem.tryAcquire());
        {
            SemaphoreGuard guard(sem);
            REQUIRE(sem.available() == 0);
        }
        REQUIRE(sem.available() == 1);
    }
}

#include <catch2/catch_test_macros.hpp>
#include "server/shutdown_coordinator.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

using namespace lmgate;
using namespace std::chrono_literals;

namespace {

ShutdownCoordinator make_coordinator(std::chrono::milliseconds drain_limit) {
    return ShutdownCoordinator(ShutdownCoordinator::Config{.shutdown_timeout = drain_limit});
}

} // anonymous namespace

TEST_CASE("ShutdownCoordinator: guards count chat requests in flight", "[shutdown][guard]") {
    ShutdownCoordinator sc;
    CHECK(sc.in_flight_count() == 0);

    {
        auto buffered = sc.enter();
        auto streamed = sc.enter();
        CHECK(buffered.entered());
        CHECK(streamed.entered());
        CHECK(sc.in_flight_count() == 2);
    }
    CHECK(sc.in_flight_count() == 0);

    SECTION("a guard handed to a stream relay leaves once") {
        auto handler_guard = sc.enter();
        ShutdownCoordinator::RequestGuard relay_guard = std::move(handler_guard);
        CHECK_FALSE(handler_guard.entered());
        CHECK(relay_guard.entered());
        CHECK(sc.in_flight_count() == 1);

        relay_guard = ShutdownCoordinator::RequestGuard{};
        CHECK(sc.in_flight_count() == 0);
    }
}

TEST_CASE("ShutdownCoordinator: new chat requests are refused once shutdown starts", "[shutdown]") {
    ShutdownCoordinator sc;
    auto running = sc.enter();
    REQUIRE(running.entered());

    sc.initiate_shutdown();
    sc.initiate_shutdown();
    CHECK(sc.is_shutting_down());

    auto late = sc.enter();
    CHECK_FALSE(late.entered());
    CHECK(sc.in_flight_count() == 1);
}

TEST_CASE("ShutdownCoordinator: idle gateway drains at once", "[shutdown][drain]") {
    auto sc = make_coordinator(1000ms);
    sc.initiate_shutdown();

    const auto start = std::chrono::steady_clock::now();
    CHECK(sc.wait_for_drain());
    CHECK(std::chrono::steady_clock::now() - start < 100ms);
}

TEST_CASE("ShutdownCoordinator: drain waits for a relay finishing on another thread", "[shutdown][drain]") {
    auto sc = make_coordinator(5000ms);
    auto guard = std::make_unique<ShutdownCoordinator::RequestGuard>(sc.enter());
    REQUIRE(guard->entered());

    std::atomic<bool> released{false};
    std::thread relay([&] {
        std::this_thread::sleep_for(50ms);
        released = true;
        guard.reset();
    });

    sc.initiate_shutdown();
    const bool drained = sc.wait_for_drain();
    const bool released_first = released.load();
    relay.join();

    CHECK(drained);
    CHECK(released_first);
    CHECK(sc.in_flight_count() == 0);
}

TEST_CASE("ShutdownCoordinator: drain gives up after the shutdown timeout", "[shutdown][drain]") {
    auto sc = make_coordinator(50ms);
    auto stuck = sc.enter();
    sc.initiate_shutdown();

    const auto start = std::chrono::steady_clock::now();
    CHECK_FALSE(sc.wait_for_drain());
    CHECK(std::chrono::steady_clock::now() - start >= 40ms);
    CHECK(sc.in_flight_count() == 1);
}

TEST_CASE("ShutdownCoordinator: every admitted request is drained under contention", "[shutdown][drain]") {
    auto sc = make_coordinator(2000ms);
    std::atomic<int> entered{0};
    std::atomic<int> refused{0};

    std::vector<std::thread> handlers;
    for (int i = 0; i < 16; ++i) {
        handlers.emplace_back([&] {
            auto guard = sc.enter();
            if (!guard.entered()) {
                refused.fetch_add(1);
                return;
            }
            entered.fetch_add(1);
            std::this_thread::sleep_for(10ms);
        });
    }
    std::this_thread::sleep_for(5ms);
    sc.initiate_shutdown();

    CHECK(sc.wait_for_drain());
    for (auto& t : handlers) t.join();
    CHECK(entered.load() + refused.load() == 16);
    CHECK(sc.in_flight_count() == 0);
}

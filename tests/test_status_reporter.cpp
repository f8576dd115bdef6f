#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "server/status_reporter.hpp"

#include <chrono>

using namespace lmgate;
using namespace std::chrono_literals;
using Catch::Matchers::WithinAbs;

namespace {

using Clock = std::chrono::steady_clock;

std::shared_ptr<RequestQueue> make_queue(uint32_t capacity) {
    return std::make_shared<RequestQueue>(std::make_shared<AdmissionGate>(capacity));
}

} // anonymous namespace

TEST_CASE("StatusReporter: idle gateway", "[status]") {
    auto queue = make_queue(4);
    StatusReporter reporter(queue, "http://127.0.0.1:8080");

    const auto snap = reporter.snapshot();
    CHECK(snap.capacity == 4);
    CHECK(snap.active == 0);
    CHECK(snap.queued == 0);
    CHECK(snap.oldest_wait_seconds == 0.0);

    CHECK(reporter.to_json(snap) ==
          R"({"capacity":4,"active":0,"queued":0,"oldest_wait_seconds":0.000,)"
          R"("max_concurrent":4,"available_slots":4,"backend_url":"http://127.0.0.1:8080"})");
}

TEST_CASE("StatusReporter: reflects active and queued requests", "[status]") {
    auto queue = make_queue(1);
    StatusReporter reporter(queue, "http://backend");

    auto holder = queue->acquire_blocking(Clock::now() + 10s);
    REQUIRE(holder.outcome == WaitOutcome::ADMITTED);
    auto first = queue->enqueue();
    auto second = queue->enqueue();

    const auto now = first->arrival() + 1500ms;
    const auto snap = reporter.snapshot(now);
    CHECK(snap.capacity == 1);
    CHECK(snap.active == 1);
    CHECK(snap.queued == 2);
    CHECK_THAT(snap.oldest_wait_seconds, WithinAbs(1.5, 1e-9));

    SECTION("same instant, same snapshot") {
        CHECK(reporter.snapshot(now) == snap);
    }

    SECTION("json reports no free slots") {
        const auto json = reporter.to_json(snap);
        CHECK(json.find(R"("available_slots":0)") != std::string::npos);
        CHECK(json.find(R"("oldest_wait_seconds":1.500)") != std::string::npos);
    }

    SECTION("oldest wait moves to the next waiter") {
        queue->cancel(first);
        const auto after = reporter.snapshot(second->arrival() + 250ms);
        CHECK(after.queued == 1);
        CHECK_THAT(after.oldest_wait_seconds, WithinAbs(0.25, 1e-9));
    }

    queue->cancel(first);
    queue->cancel(second);
}

TEST_CASE("StatusReporter: a clock reading before the oldest arrival clamps to zero", "[status]") {
    auto queue = make_queue(1);
    StatusReporter reporter(queue, "http://backend");

    auto holder = queue->acquire_blocking(Clock::now() + 10s);
    auto waiting = queue->enqueue();

    const auto snap = reporter.snapshot(waiting->arrival() - 1s);
    CHECK(snap.oldest_wait_seconds == 0.0);

    queue->cancel(waiting);
}

TEST_CASE("StatusReporter: core fields for the health endpoint", "[status]") {
    const StatusSnapshot snap{.capacity = 2, .active = 1, .queued = 3, .oldest_wait_seconds = 0.1234};
    CHECK(StatusReporter::core_fields_json(snap) ==
          R"({"capacity":2,"active":1,"queued":3,"oldest_wait_seconds":0.123})");
}

TEST_CASE("StatusReporter: requires a queue", "[status]") {
    CHECK_THROWS_AS(StatusReporter(nullptr, "http://backend"), std::invalid_argument);
}

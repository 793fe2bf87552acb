#include <catch2/catch_test_macros.hpp>
#include "stats.hpp"
#include "event.hpp"

using namespace tooledchat;

namespace {

void publish_turn(EventBus& bus, bool success, uint64_t ms,
                  ErrorKind kind = ErrorKind::Unknown) {
    TurnCompletedEvent ev;
    ev.success = success;
    ev.duration_ms = ms;
    ev.error_kind = kind;
    bus.publish(ev);
}

} // namespace

TEST_CASE("TurnStats: empty snapshot", "[stats]") {
    EventBus bus;
    TurnStats stats(bus);
    auto s = stats.snapshot();
    REQUIRE(s.turns == 0);
    REQUIRE(s.error_rate() == 0.0);
    REQUIRE(s.average_turn_ms() == 0.0);
    REQUIRE(s.average_model_latency_ms() == 0.0);
}

TEST_CASE("TurnStats: counts turns and failures by kind", "[stats]") {
    EventBus bus;
    TurnStats stats(bus);

    publish_turn(bus, true, 100);
    publish_turn(bus, false, 50, ErrorKind::Connection);
    publish_turn(bus, false, 30, ErrorKind::Connection);
    publish_turn(bus, false, 20, ErrorKind::IterationLimitExceeded);

    auto s = stats.snapshot();
    REQUIRE(s.turns == 4);
    REQUIRE(s.failed_turns == 3);
    REQUIRE(s.error_rate() == 0.75);
    REQUIRE(s.average_turn_ms() == 50.0);
    REQUIRE(s.failures_by_kind["connection"] == 2);
    REQUIRE(s.failures_by_kind["iteration_limit_exceeded"] == 1);
    REQUIRE(s.failures_by_kind.count("unknown") == 0);
}

TEST_CASE("TurnStats: model latency and tool calls", "[stats]") {
    EventBus bus;
    TurnStats stats(bus);

    ModelResponseEvent m1;
    m1.latency_ms = 200;
    bus.publish(m1);
    ModelResponseEvent m2;
    m2.latency_ms = 400;
    bus.publish(m2);

    ToolCallResultEvent ok;
    ok.success = true;
    bus.publish(ok);
    ToolCallResultEvent bad;
    bad.success = false;
    bad.error_kind = ErrorKind::ToolExecution;
    bus.publish(bad);

    auto s = stats.snapshot();
    REQUIRE(s.model_requests == 2);
    REQUIRE(s.average_model_latency_ms() == 300.0);
    REQUIRE(s.tool_calls == 2);
    REQUIRE(s.tool_failures == 1);
}

TEST_CASE("TurnStats: to_json and reset", "[stats]") {
    EventBus bus;
    TurnStats stats(bus);
    publish_turn(bus, false, 10, ErrorKind::Auth);

    auto j = stats.to_json();
    REQUIRE(j["turns"] == 1);
    REQUIRE(j["failed_turns"] == 1);
    REQUIRE(j["error_rate"] == 1.0);
    REQUIRE(j["failures_by_kind"]["auth"] == 1);

    stats.reset();
    REQUIRE(stats.snapshot().turns == 0);
    REQUIRE(stats.to_json()["failures_by_kind"].empty());
}

TEST_CASE("TurnStats: unsubscribes on destruction", "[stats]") {
    EventBus bus;
    {
        TurnStats stats(bus);
        REQUIRE(bus.subscriber_count(TurnCompletedEvent::TAG) == 1);
    }
    REQUIRE(bus.subscriber_count(TurnCompletedEvent::TAG) == 0);
    REQUIRE(bus.subscriber_count(ModelResponseEvent::TAG) == 0);
    publish_turn(bus, true, 1); // no dangling handler
}

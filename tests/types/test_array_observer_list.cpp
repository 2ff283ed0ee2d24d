/**
 * @file test_array_observer_list.cpp
 * @brief Unit tests for ArrayObserverList.
 *
 * Tests observer registration and range-change dispatch.
 */

#include <catch2/catch_test_macros.hpp>
#include <test_support.h>

using namespace arrayproxy;
using namespace arrayproxy::testing;

// ============================================================================
// Observer Management Tests
// ============================================================================

TEST_CASE("ArrayObserverList - default construction creates empty list", "[observer]") {
    ArrayObserverList obs_list;
    CHECK(obs_list.empty());
    CHECK(obs_list.size() == 0);
    CHECK(obs_list.is_alive());
}

TEST_CASE("ArrayObserverList - add_observer increases size", "[observer]") {
    ArrayObserverList obs_list;
    RecordingObserver obs;

    CHECK(obs_list.add_observer(&obs));

    CHECK_FALSE(obs_list.empty());
    CHECK(obs_list.size() == 1);
    CHECK(obs_list.contains(&obs));
}

TEST_CASE("ArrayObserverList - adding the same observer twice registers it once", "[observer]") {
    ArrayObserverList obs_list;
    RecordingObserver obs;

    CHECK(obs_list.add_observer(&obs));
    CHECK_FALSE(obs_list.add_observer(&obs));

    CHECK(obs_list.size() == 1);
}

TEST_CASE("ArrayObserverList - add null observer is safe", "[observer]") {
    ArrayObserverList obs_list;
    CHECK_FALSE(obs_list.add_observer(nullptr));
    CHECK(obs_list.empty());
}

TEST_CASE("ArrayObserverList - remove_observer is idempotent", "[observer]") {
    ArrayObserverList obs_list;
    RecordingObserver obs1, obs2;

    obs_list.add_observer(&obs1);
    CHECK_FALSE(obs_list.remove_observer(&obs2));  // Not in list
    CHECK(obs_list.remove_observer(&obs1));
    CHECK_FALSE(obs_list.remove_observer(&obs1));

    CHECK(obs_list.empty());
}

TEST_CASE("ArrayObserverList - clear removes all observers", "[observer]") {
    ArrayObserverList obs_list;
    RecordingObserver obs1, obs2, obs3;

    obs_list.add_observer(&obs1);
    obs_list.add_observer(&obs2);
    obs_list.add_observer(&obs3);

    obs_list.clear();

    CHECK(obs_list.empty());
}

// ============================================================================
// Notification Tests
// ============================================================================

TEST_CASE("ArrayObserverList - notifications reach every observer in registration order", "[observer]") {
    NativeArray source;
    ArrayObserverList obs_list;
    std::vector<int> order;
    RecordingObserver obs1, obs2;
    obs1.on_event = [&](const RecordedEvent&) { order.push_back(1); };
    obs2.on_event = [&](const RecordedEvent&) { order.push_back(2); };

    obs_list.add_observer(&obs1);
    obs_list.add_observer(&obs2);

    obs_list.notify_will_change(source, ArrayChange{1, 2, 3});
    obs_list.notify_did_change(source, ArrayChange{1, 2, 3});

    CHECK(order == std::vector<int>{1, 2, 1, 2});
    REQUIRE(obs1.events.size() == 2);
    CHECK(obs1.events[0] == will(&source, 1, 2, 3, 0));
    CHECK(obs1.events[1] == did(&source, 1, 2, 3, 0));
    CHECK(obs2.events == obs1.events);
}

TEST_CASE("ArrayObserverList - notify on empty list is a no-op", "[observer]") {
    NativeArray source;
    ArrayObserverList obs_list;
    CHECK_NOTHROW(obs_list.notify_will_change(source, ArrayChange{}));
    CHECK_NOTHROW(obs_list.notify_did_change(source, ArrayChange{}));
}

TEST_CASE("ArrayObserverList - observer removed during dispatch is skipped", "[observer]") {
    NativeArray source;
    ArrayObserverList obs_list;
    RecordingObserver first, second;
    first.on_event = [&](const RecordedEvent&) { obs_list.remove_observer(&second); };

    obs_list.add_observer(&first);
    obs_list.add_observer(&second);

    obs_list.notify_will_change(source, ArrayChange{0, 1, 1});

    CHECK(first.events.size() == 1);
    CHECK(second.events.empty());
}

TEST_CASE("ArrayObserverList - observer added during dispatch waits for the next event", "[observer]") {
    NativeArray source;
    ArrayObserverList obs_list;
    RecordingObserver first, late;
    first.on_event = [&](const RecordedEvent&) { obs_list.add_observer(&late); };

    obs_list.add_observer(&first);

    obs_list.notify_will_change(source, ArrayChange{0, 1, 1});
    CHECK(late.events.empty());

    obs_list.notify_did_change(source, ArrayChange{0, 1, 1});
    CHECK(late.events.size() == 1);
}

TEST_CASE("ArrayObserverList - tracing does not change dispatch", "[observer]") {
    NativeArray source;
    ArrayObserverList obs_list;
    obs_list.set_trace(true);
    RecordingObserver obs;

    obs_list.add_observer(&obs);
    obs_list.notify_did_change(source, ArrayChange{0, std::nullopt, 2});
    obs_list.remove_observer(&obs);

    CHECK(obs_list.trace());
    REQUIRE(obs.events.size() == 1);
    CHECK(obs.events[0] == did(&source, 0, std::nullopt, 2, 0));
}

TEST_CASE("ArrayChange - formats undefined counts", "[observer]") {
    CHECK(ArrayChange{0, 3, std::nullopt}.to_string() == "(0, 3, undefined)");
    CHECK(fmt::format("{}", ArrayChange{1, 1, 1}) == "(1, 1, 1)");
}

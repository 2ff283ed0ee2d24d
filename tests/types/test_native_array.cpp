/**
 * @file test_native_array.cpp
 * @brief Unit tests for NativeArray and the ObservableArray read helpers.
 */

#include <catch2/catch_test_macros.hpp>
#include <test_support.h>

#include <stdexcept>

using namespace arrayproxy;
using namespace arrayproxy::testing;

// ============================================================================
// Reads
// ============================================================================

TEST_CASE("NativeArray - reads by index", "[native_array]") {
    auto pets = make_native_array(strings({"dog", "cat", "fish"}));

    CHECK(pets->is_initialised());
    CHECK(pets->is_array());
    CHECK(pets->length() == 3);
    CHECK(pets->object_at(0) == make_value("dog"));
    CHECK(pets->object_at(2) == make_value("fish"));
}

TEST_CASE("NativeArray - reading past the end is undefined", "[native_array]") {
    auto pets = make_native_array(strings({"dog"}));
    CHECK_FALSE(pets->object_at(1).has_value());
    CHECK_FALSE(pets->object_at(100).has_value());
}

TEST_CASE("NativeArray - first and last object", "[native_array]") {
    auto pets = make_native_array(strings({"dog", "cat", "fish"}));
    CHECK(pets->first_object() == make_value("dog"));
    CHECK(pets->last_object() == make_value("fish"));

    auto empty = make_native_array();
    CHECK_FALSE(empty->first_object().has_value());
    CHECK_FALSE(empty->last_object().has_value());
}

TEST_CASE("NativeArray - index_of and includes", "[native_array]") {
    auto pets = make_native_array(strings({"dog", "cat", "dog"}));

    CHECK(pets->index_of(make_value("dog")) == 0u);
    CHECK(pets->index_of(make_value("dog"), 1) == 2u);
    CHECK(pets->last_index_of(make_value("dog")) == 2u);
    CHECK_FALSE(pets->index_of(make_value("bird")).has_value());
    CHECK(pets->includes(make_value("cat")));
    CHECK_FALSE(pets->includes(make_value("bird")));
}

TEST_CASE("NativeArray - slice clamps to the length", "[native_array]") {
    auto pets = make_native_array(strings({"dog", "cat", "fish"}));

    CHECK(as_strings(pets->slice(1)) == std::vector<std::string>{"cat", "fish"});
    CHECK(as_strings(pets->slice(0, 2)) == std::vector<std::string>{"dog", "cat"});
    CHECK(as_strings(pets->slice(1, 10)) == std::vector<std::string>{"cat", "fish"});
    CHECK(pets->slice(3).empty());
    CHECK(pets->slice(2, 1).empty());
    CHECK(as_strings(pets->objects_at({2, 0, 5})) == std::vector<std::string>{"fish", "dog", "undefined"});
}

// ============================================================================
// replace
// ============================================================================

TEST_CASE("NativeArray - replace splices and notifies around the mutation", "[native_array]") {
    auto pets = make_native_array(strings({"dog", "cat", "fish"}));
    RecordingObserver obs;
    pets->add_array_observer(&obs);

    pets->replace(1, 1, strings({"bird"}));

    CHECK(as_strings(pets->to_vector()) == std::vector<std::string>{"dog", "bird", "fish"});
    REQUIRE(obs.events.size() == 2);
    CHECK(obs.events[0] == will(pets.get(), 1, 1, 1, 3));
    CHECK(obs.events[1] == did(pets.get(), 1, 1, 1, 3));
}

TEST_CASE("NativeArray - will-change sees the contents before the mutation", "[native_array]") {
    auto pets = make_native_array(strings({"dog", "cat"}));
    RecordingObserver obs;
    std::vector<std::vector<std::string>> seen;
    obs.on_event = [&](const RecordedEvent&) { seen.push_back(as_strings(pets->to_vector())); };
    pets->add_array_observer(&obs);

    pets->replace(2, 0, strings({"fish"}));

    REQUIRE(seen.size() == 2);
    CHECK(seen[0] == std::vector<std::string>{"dog", "cat"});
    CHECK(seen[1] == std::vector<std::string>{"dog", "cat", "fish"});
    CHECK(obs.events[0].change == ArrayChange{2, 0, 1});
}

TEST_CASE("NativeArray - replace clamps the removed count", "[native_array]") {
    auto pets = make_native_array(strings({"dog", "cat", "fish"}));
    RecordingObserver obs;
    pets->add_array_observer(&obs);

    pets->replace(1, 10, {});

    CHECK(pets->length() == 1);
    CHECK(obs.events[0].change == ArrayChange{1, 2, 0});
}

TEST_CASE("NativeArray - replace past the end throws without notifying", "[native_array]") {
    auto pets = make_native_array(strings({"dog"}));
    RecordingObserver obs;
    pets->add_array_observer(&obs);

    CHECK_THROWS_AS(pets->replace(2, 0, strings({"cat"})), std::out_of_range);
    CHECK(obs.events.empty());
    CHECK(pets->length() == 1);
}

TEST_CASE("NativeArray - replace with its own values", "[native_array]") {
    auto pets = make_native_array(strings({"dog", "cat"}));
    pets->replace(0, 0, pets->values());
    CHECK(as_strings(pets->to_vector()) == std::vector<std::string>{"dog", "cat", "dog", "cat"});
}

TEST_CASE("NativeArray - removed observer no longer notified", "[native_array]") {
    auto pets = make_native_array(strings({"dog"}));
    RecordingObserver obs;
    pets->add_array_observer(&obs);
    CHECK(pets->has_array_observer(&obs));

    pets->remove_array_observer(&obs);
    pets->remove_array_observer(&obs);
    pets->replace(0, 1, {});

    CHECK_FALSE(pets->has_array_observers());
    CHECK(obs.events.empty());
}

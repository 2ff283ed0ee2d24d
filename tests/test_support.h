#pragma once

/**
 * @file test_support.h
 * @brief Shared helpers for the arrayproxy unit tests.
 */

#include <arrayproxy/arrayproxy.h>

#include <functional>
#include <initializer_list>
#include <string>
#include <vector>

namespace arrayproxy::testing {

inline std::vector<Value> strings(std::initializer_list<const char*> items) {
    std::vector<Value> result;
    for (const auto* item : items) { result.push_back(make_value(item)); }
    return result;
}

inline std::vector<std::string> as_strings(const std::vector<Value>& values) {
    std::vector<std::string> result;
    for (const auto& v : values) { result.push_back(v.to_string()); }
    return result;
}

struct RecordedEvent {
    enum class Phase { Will, Did };

    Phase phase;
    ObservableArray* source;
    ArrayChange change;
    size_t source_length;

    friend bool operator==(const RecordedEvent&, const RecordedEvent&) = default;
};

inline RecordedEvent will(ObservableArray* source, size_t start, std::optional<size_t> removed,
                          std::optional<size_t> added, size_t source_length) {
    return {RecordedEvent::Phase::Will, source, ArrayChange{start, removed, added}, source_length};
}

inline RecordedEvent did(ObservableArray* source, size_t start, std::optional<size_t> removed,
                         std::optional<size_t> added, size_t source_length) {
    return {RecordedEvent::Phase::Did, source, ArrayChange{start, removed, added}, source_length};
}

/**
 * Records every notification with the length of the source at the time it was delivered.
 */
class RecordingObserver : public ArrayObserver {
public:
    std::vector<RecordedEvent> events;
    std::function<void(const RecordedEvent&)> on_event;

    void array_will_change(ObservableArray& source, const ArrayChange& change) override {
        record({RecordedEvent::Phase::Will, &source, change, source.length()});
    }

    void array_did_change(ObservableArray& source, const ArrayChange& change) override {
        record({RecordedEvent::Phase::Did, &source, change, source.length()});
    }

    void clear() { events.clear(); }

private:
    void record(const RecordedEvent& event) {
        events.push_back(event);
        if (on_event) { on_event(event); }
    }
};

}  // namespace arrayproxy::testing

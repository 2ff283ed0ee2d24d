#pragma once

/**
 * @file observable_array.h
 * @brief ObservableArray - read-only ordered collection with range-change notifications.
 *
 * ObservableArray is the capability every collection must expose to be wrapped by an ArrayProxy: index read,
 * length and a subscribable change stream. The default helpers (first_object, index_of, slice, ...) are all
 * written against object_at and length, so an implementation only supplies those two.
 */

#include <arrayproxy/arrayproxy_export.h>
#include <arrayproxy/types/array_observer_list.h>
#include <arrayproxy/types/value.h>
#include <arrayproxy/util/lifecycle.h>

#include <optional>
#include <vector>

namespace arrayproxy {

class ARRAYPROXY_EXPORT ObservableArray : public ObjectLifeCycle {
public:
    ObservableArray() = default;

    ObservableArray(const ObservableArray&) = delete;
    ObservableArray& operator=(const ObservableArray&) = delete;

    // ========== Array Capability ==========

    [[nodiscard]] virtual size_t length() const = 0;

    /**
     * @brief Read the element at idx.
     * @return The element, or an empty Value when idx is past the end
     */
    [[nodiscard]] virtual Value object_at(size_t idx) const = 0;

    /**
     * @brief Whether this object currently behaves as an array (index read, length, observers).
     */
    [[nodiscard]] virtual bool is_array() const { return true; }

    // ========== Observers ==========

    /**
     * @brief Subscribe to range changes of this array. Registering the same observer twice is a no-op.
     */
    void add_array_observer(ArrayObserver* observer);

    /**
     * @brief Unsubscribe, safe to call for an observer that is not registered.
     */
    void remove_array_observer(ArrayObserver* observer);

    [[nodiscard]] bool has_array_observers() const { return !observers_.empty(); }

    [[nodiscard]] bool has_array_observer(const ArrayObserver* observer) const { return observers_.contains(observer); }

    [[nodiscard]] ArrayObserverList& array_observers() { return observers_; }

    /**
     * @brief Announce that [start, start + removed) is about to be replaced by `added` elements.
     *
     * Must be called before the mutation; every call must be matched by array_content_did_change with the same
     * arguments once the mutation is complete.
     */
    void array_content_will_change(size_t start, std::optional<size_t> removed, std::optional<size_t> added);

    void array_content_did_change(size_t start, std::optional<size_t> removed, std::optional<size_t> added);

    // ========== Helpers ==========

    [[nodiscard]] Value first_object() const;

    [[nodiscard]] Value last_object() const;

    [[nodiscard]] std::vector<Value> objects_at(const std::vector<size_t>& indexes) const;

    /**
     * @brief Position of the first element equal to value at or after from_index.
     */
    [[nodiscard]] std::optional<size_t> index_of(const Value& value, size_t from_index = 0) const;

    [[nodiscard]] std::optional<size_t> last_index_of(const Value& value) const;

    [[nodiscard]] bool includes(const Value& value) const { return index_of(value).has_value(); }

    /**
     * @brief Copy of [begin, end), end is clamped to the length.
     */
    [[nodiscard]] std::vector<Value> slice(size_t begin = 0, std::optional<size_t> end = std::nullopt) const;

    [[nodiscard]] std::vector<Value> to_vector() const { return slice(); }

protected:
    void init() override {}

    void will_destroy() override {}

private:
    ArrayObserverList observers_;
};

}  // namespace arrayproxy

#pragma once

/**
 * @file array_observer_list.h
 * @brief ArrayObserverList - registry of range-change observers for one array.
 *
 * Every ObservableArray owns one ArrayObserverList. Proxies subscribe to their arranged content by registering a
 * forwarder here and unsubscribe by removing it again, so the list is the single source of truth for which
 * subscriptions exist.
 */

#include <arrayproxy/arrayproxy_export.h>
#include <arrayproxy/types/array_observer.h>

#include <cstdint>
#include <vector>

namespace arrayproxy {

/**
 * @brief List of range-change observers for an array.
 *
 * Key characteristics:
 * - Maintains a list of ArrayObserver pointers (non-owning)
 * - An observer is registered at most once, adding it again is a no-op
 * - Removal is idempotent
 * - Dispatch works on a snapshot, observers removed during dispatch are skipped
 * - Safe to notify on empty list (no-op)
 */
class ARRAYPROXY_EXPORT ArrayObserverList {
public:
    static constexpr uint32_t ALIVE_SENTINEL = 0xFEED'FACE;

    ArrayObserverList();

    // Registrations are tied to the owning array and are not copied with it
    ArrayObserverList(const ArrayObserverList&) = delete;
    ArrayObserverList& operator=(const ArrayObserverList&) = delete;

    ~ArrayObserverList() { sentinel_ = 0xDEAD'0B5E; }

    [[nodiscard]] bool is_alive() const { return sentinel_ == ALIVE_SENTINEL; }

    // ========== Observer Management ==========

    /**
     * @brief Add an observer to the list.
     * @param obs The observer to add (caller retains ownership)
     * @return true if the observer was added, false if it was null or already present
     */
    bool add_observer(ArrayObserver* obs);

    /**
     * @brief Remove an observer from the list.
     * @return true if the observer was registered
     */
    bool remove_observer(ArrayObserver* obs);

    [[nodiscard]] bool contains(const ArrayObserver* obs) const;

    void set_trace(bool enable) { trace_ = enable; }

    [[nodiscard]] bool trace() const { return trace_; }

    // ========== Notification ==========

    void notify_will_change(ObservableArray& source, const ArrayChange& change);

    void notify_did_change(ObservableArray& source, const ArrayChange& change);

    // ========== Accessors ==========

    [[nodiscard]] bool empty() const { return observers_.empty(); }

    [[nodiscard]] size_t size() const { return observers_.size(); }

    void clear() { observers_.clear(); }

private:
    template <typename Fn>
    void dispatch(const char* phase, ObservableArray& source, const ArrayChange& change, Fn&& fn);

    uint32_t sentinel_ = ALIVE_SENTINEL;
    std::vector<ArrayObserver*> observers_;
    bool trace_ = false;
};

}  // namespace arrayproxy

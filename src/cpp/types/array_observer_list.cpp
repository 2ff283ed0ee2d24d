#include <arrayproxy/types/array_observer_list.h>

#include <fmt/format.h>

#include <algorithm>
#include <cstdio>
#include <cstdlib>

namespace arrayproxy {

namespace {

bool trace_enabled_by_default() { return std::getenv("ARRAYPROXY_DEBUG_OBSERVERS") != nullptr; }

}  // namespace

ArrayObserverList::ArrayObserverList() : trace_(trace_enabled_by_default()) {}

bool ArrayObserverList::add_observer(ArrayObserver* obs) {
    if (!obs) { return false; }
    if (!is_alive()) {
        fmt::print(stderr, "[OBSERVER] add_observer to DEAD ArrayObserverList {} sentinel=0x{:08X}\n",
                   static_cast<void*>(this), sentinel_);
        return false;
    }
    if (contains(obs)) { return false; }
    observers_.push_back(obs);
    if (trace_) {
        fmt::print(stderr, "[OBS_TRACE] add_observer({}) to list {} now size={}\n", static_cast<void*>(obs),
                   static_cast<void*>(this), observers_.size());
    }
    return true;
}

bool ArrayObserverList::remove_observer(ArrayObserver* obs) {
    if (!is_alive()) { return false; }
    auto it = std::find(observers_.begin(), observers_.end(), obs);
    if (it == observers_.end()) { return false; }
    observers_.erase(it);
    if (trace_) {
        fmt::print(stderr, "[OBS_TRACE] remove_observer({}) from list {} now size={}\n", static_cast<void*>(obs),
                   static_cast<void*>(this), observers_.size());
    }
    return true;
}

bool ArrayObserverList::contains(const ArrayObserver* obs) const {
    return std::find(observers_.begin(), observers_.end(), obs) != observers_.end();
}

template <typename Fn>
void ArrayObserverList::dispatch(const char* phase, ObservableArray& source, const ArrayChange& change, Fn&& fn) {
    if (observers_.empty()) { return; }
    // Observers may subscribe or unsubscribe from inside a callback
    const std::vector<ArrayObserver*> snapshot{observers_};
    for (auto* obs : snapshot) {
        if (!contains(obs)) { continue; }
        if (trace_) {
            fmt::print(stderr, "[OBS_TRACE] {}{} -> {} from {}\n", phase, change, static_cast<void*>(obs),
                       static_cast<void*>(&source));
        }
        fn(*obs);
    }
}

void ArrayObserverList::notify_will_change(ObservableArray& source, const ArrayChange& change) {
    dispatch("will", source, change, [&](ArrayObserver& obs) { obs.array_will_change(source, change); });
}

void ArrayObserverList::notify_did_change(ObservableArray& source, const ArrayChange& change) {
    dispatch("did", source, change, [&](ArrayObserver& obs) { obs.array_did_change(source, change); });
}

}  // namespace arrayproxy

#include <arrayproxy/types/observable_array.h>

#include <algorithm>

namespace arrayproxy {

void ObservableArray::add_array_observer(ArrayObserver* observer) { observers_.add_observer(observer); }

void ObservableArray::remove_array_observer(ArrayObserver* observer) { observers_.remove_observer(observer); }

void ObservableArray::array_content_will_change(size_t start, std::optional<size_t> removed,
                                                std::optional<size_t> added) {
    observers_.notify_will_change(*this, ArrayChange{start, removed, added});
}

void ObservableArray::array_content_did_change(size_t start, std::optional<size_t> removed,
                                               std::optional<size_t> added) {
    observers_.notify_did_change(*this, ArrayChange{start, removed, added});
}

Value ObservableArray::first_object() const { return object_at(0); }

Value ObservableArray::last_object() const {
    const auto len = length();
    return len == 0 ? Value{} : object_at(len - 1);
}

std::vector<Value> ObservableArray::objects_at(const std::vector<size_t>& indexes) const {
    std::vector<Value> result;
    result.reserve(indexes.size());
    for (auto idx : indexes) { result.push_back(object_at(idx)); }
    return result;
}

std::optional<size_t> ObservableArray::index_of(const Value& value, size_t from_index) const {
    const auto len = length();
    for (size_t idx = from_index; idx < len; ++idx) {
        if (object_at(idx) == value) { return idx; }
    }
    return std::nullopt;
}

std::optional<size_t> ObservableArray::last_index_of(const Value& value) const {
    for (size_t idx = length(); idx > 0; --idx) {
        if (object_at(idx - 1) == value) { return idx - 1; }
    }
    return std::nullopt;
}

std::vector<Value> ObservableArray::slice(size_t begin, std::optional<size_t> end) const {
    const auto len  = length();
    const auto last = std::min(end.value_or(len), len);
    std::vector<Value> result;
    if (begin >= last) { return result; }
    result.reserve(last - begin);
    for (size_t idx = begin; idx < last; ++idx) { result.push_back(object_at(idx)); }
    return result;
}

}  // namespace arrayproxy

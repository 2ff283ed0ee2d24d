#include <arrayproxy/types/mutable_array.h>
#include <arrayproxy/util/errors.h>

#include <algorithm>

namespace arrayproxy {

void MutableArray::clear() {
    const auto len = length();
    if (len == 0) { return; }
    replace(0, len, {});
}

void MutableArray::insert_at(size_t idx, const Value& object) {
    if (idx > length()) { throw_error<std::out_of_range>("Index {} out of range for insert, length is {}", idx, length()); }
    replace(idx, 0, {object});
}

void MutableArray::remove_at(size_t idx, size_t len) {
    if (idx >= length()) { throw_error<std::out_of_range>("Index {} out of range for remove, length is {}", idx, length()); }
    replace(idx, len, {});
}

void MutableArray::push_object(const Value& object) { insert_at(length(), object); }

void MutableArray::push_objects(const std::vector<Value>& objects) { replace(length(), 0, objects); }

Value MutableArray::pop_object() {
    const auto len = length();
    if (len == 0) { return {}; }
    auto result = object_at(len - 1);
    remove_at(len - 1);
    return result;
}

Value MutableArray::shift_object() {
    if (length() == 0) { return {}; }
    auto result = object_at(0);
    remove_at(0);
    return result;
}

void MutableArray::unshift_object(const Value& object) { insert_at(0, object); }

void MutableArray::unshift_objects(const std::vector<Value>& objects) { replace(0, 0, objects); }

void MutableArray::reverse_objects() {
    const auto len = length();
    if (len == 0) { return; }
    auto objects = to_vector();
    std::reverse(objects.begin(), objects.end());
    replace(0, len, objects);
}

void MutableArray::set_objects(const std::vector<Value>& objects) {
    if (objects.empty()) {
        clear();
        return;
    }
    replace(0, length(), objects);
}

void MutableArray::remove_object(const Value& object) {
    for (auto idx = length(); idx > 0; --idx) {
        if (object_at(idx - 1) == object) { remove_at(idx - 1); }
    }
}

void MutableArray::add_object(const Value& object) {
    if (!includes(object)) { push_object(object); }
}

}  // namespace arrayproxy

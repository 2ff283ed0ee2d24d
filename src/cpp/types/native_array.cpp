#include <arrayproxy/types/native_array.h>
#include <arrayproxy/util/errors.h>

#include <algorithm>
#include <iterator>

namespace arrayproxy {

NativeArray::NativeArray(std::vector<Value> objects) : objects_(std::move(objects)) {}

NativeArray::NativeArray(std::initializer_list<Value> objects) : objects_(objects) {}

Value NativeArray::object_at(size_t idx) const { return idx < objects_.size() ? objects_[idx] : Value{}; }

void NativeArray::replace(size_t idx, size_t amt, const std::vector<Value>& objects) {
    if (&objects == &objects_) {
        const auto copy = objects_;
        replace(idx, amt, copy);
        return;
    }
    if (idx > objects_.size()) {
        throw_error<std::out_of_range>("Index {} out of range for replace, length is {}", idx, objects_.size());
    }
    amt = std::min(amt, objects_.size() - idx);
    const auto added = objects.size();

    array_content_will_change(idx, amt, added);

    const auto first = objects_.begin() + static_cast<std::ptrdiff_t>(idx);
    const auto pos   = objects_.erase(first, first + static_cast<std::ptrdiff_t>(amt));
    objects_.insert(pos, objects.begin(), objects.end());

    array_content_did_change(idx, amt, added);
}

native_array_u_ptr make_native_array(std::vector<Value> objects) {
    return create<NativeArray>(std::move(objects));
}

}  // namespace arrayproxy

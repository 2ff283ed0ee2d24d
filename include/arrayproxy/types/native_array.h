#pragma once

/**
 * @file native_array.h
 * @brief NativeArray - MutableArray backed by a std::vector<Value>.
 */

#include <arrayproxy/arrayproxy_forward_declarations.h>
#include <arrayproxy/types/mutable_array.h>

#include <initializer_list>

namespace arrayproxy {

class ARRAYPROXY_EXPORT NativeArray : public MutableArray {
public:
    NativeArray() = default;

    explicit NativeArray(std::vector<Value> objects);

    NativeArray(std::initializer_list<Value> objects);

    [[nodiscard]] size_t length() const override { return objects_.size(); }

    [[nodiscard]] Value object_at(size_t idx) const override;

    /**
     * @brief Splice the backing vector, bracketed by will(idx, amt, n) / did(idx, amt, n).
     *
     * amt is clamped to the number of elements available after idx.
     * @throws std::out_of_range when idx > length()
     */
    void replace(size_t idx, size_t amt, const std::vector<Value>& objects) override;

    [[nodiscard]] const std::vector<Value>& values() const { return objects_; }

private:
    std::vector<Value> objects_;
};

/**
 * @brief Construct and initialise a NativeArray, the equivalent of wrapping a plain list.
 */
ARRAYPROXY_EXPORT native_array_u_ptr make_native_array(std::vector<Value> objects = {});

}  // namespace arrayproxy

#pragma once

/**
 * @file mutable_array.h
 * @brief MutableArray - ordered collection that can be spliced.
 *
 * replace is the single mutation primitive. All other mutators are helpers expressed as a replace call, so an
 * implementation that notifies correctly around replace notifies correctly for every helper.
 */

#include <arrayproxy/types/observable_array.h>

namespace arrayproxy {

class ARRAYPROXY_EXPORT MutableArray : public ObservableArray {
public:
    /**
     * @brief Remove amt elements starting at idx and insert objects in their place.
     *
     * Implementations announce the splice with array_content_will_change(idx, amt, objects.size()) before mutating
     * and array_content_did_change with the same arguments afterwards.
     */
    virtual void replace(size_t idx, size_t amt, const std::vector<Value>& objects) = 0;

    // ========== Helpers ==========

    void clear();

    /**
     * @throws std::out_of_range when idx > length()
     */
    void insert_at(size_t idx, const Value& object);

    /**
     * @throws std::out_of_range when idx >= length()
     */
    void remove_at(size_t idx, size_t len = 1);

    void push_object(const Value& object);

    void push_objects(const std::vector<Value>& objects);

    /**
     * @return The removed last element, empty when the array is empty
     */
    Value pop_object();

    /**
     * @return The removed first element, empty when the array is empty
     */
    Value shift_object();

    void unshift_object(const Value& object);

    void unshift_objects(const std::vector<Value>& objects);

    void reverse_objects();

    /**
     * @brief Replace the whole contents with objects.
     */
    void set_objects(const std::vector<Value>& objects);

    /**
     * @brief Remove every occurrence of object.
     */
    void remove_object(const Value& object);

    /**
     * @brief Append object unless it is already present.
     */
    void add_object(const Value& object);
};

}  // namespace arrayproxy

#ifndef ARRAYPROXY_FORWARD_DECLARATIONS_H
#define ARRAYPROXY_FORWARD_DECLARATIONS_H

#include <memory>

namespace arrayproxy {
    // Value - owned by value, empty means undefined
    class Value;

    struct ArrayChange;

    // ArrayObserver - registrations are non-owning raw pointers
    struct ArrayObserver;

    class ArrayObserverList;

    // Arrays are referenced through raw pointers by proxies, and owned through the unique_ptr returned by create<>
    class ObservableArray;

    class MutableArray;

    class NativeArray;
    using native_array_u_ptr = std::unique_ptr<NativeArray>;

    class ArrayProxy;

    struct ObjectLifeCycle;

    class ArrayChangeTrace;
} // namespace arrayproxy

#endif // ARRAYPROXY_FORWARD_DECLARATIONS_H

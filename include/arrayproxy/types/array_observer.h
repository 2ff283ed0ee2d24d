#pragma once

#include <arrayproxy/types/array_change.h>

namespace arrayproxy
{
    class ObservableArray;

    /**
     * Range-change capability registered with an ObservableArray. will_change is delivered before the range is
     * mutated, did_change straight after, both synchronously on the mutating thread.
     */
    struct ARRAYPROXY_EXPORT ArrayObserver {
        virtual ~ArrayObserver() = default;

        virtual void array_will_change(ObservableArray &source, const ArrayChange &change) = 0;

        virtual void array_did_change(ObservableArray &source, const ArrayChange &change) = 0;
    };
}

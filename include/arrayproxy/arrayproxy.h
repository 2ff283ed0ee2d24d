/*
 * The core imports for arrayproxy. Include this to get the arrays, the proxy and the tracing observer.
 */

#ifndef ARRAYPROXY_H
#define ARRAYPROXY_H

#include <arrayproxy/arrayproxy_export.h>
#include <arrayproxy/arrayproxy_forward_declarations.h>
#include <arrayproxy/util/errors.h>
#include <arrayproxy/util/lifecycle.h>
#include <arrayproxy/types/value.h>
#include <arrayproxy/types/array_change.h>
#include <arrayproxy/types/array_observer.h>
#include <arrayproxy/types/array_observer_list.h>
#include <arrayproxy/types/observable_array.h>
#include <arrayproxy/types/mutable_array.h>
#include <arrayproxy/types/native_array.h>
#include <arrayproxy/types/array_proxy.h>
#include <arrayproxy/runtime/observers/array_change_trace.h>

#endif // ARRAYPROXY_H

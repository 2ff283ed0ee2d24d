#include <arrayproxy/util/errors.h>
#include <arrayproxy/util/lifecycle.h>

#include <cstdio>

namespace arrayproxy {
    bool ObjectLifeCycle::is_initialised() const { return _initialised; }

    bool ObjectLifeCycle::is_destroying() const { return _destroying; }

    bool ObjectLifeCycle::is_destroyed() const { return _destroyed; }

    struct TransitionGuard {
        explicit TransitionGuard(ObjectLifeCycle &object) : _object{object} { _object._destroying = true; }
        ~TransitionGuard() { _object._destroying = false; }

    private:
        ObjectLifeCycle &_object;
    };

    /*
     * NOTE the life-cycle methods are expected to be called on a single thread, so the simple guard clauses
     * used here are sufficient to ensure we don't accidentally initialise or destroy more than once.
     */

    void initialise_object(ObjectLifeCycle &object) {
        if (object.is_initialised()) { return; }
        if (object.is_destroyed() || object.is_destroying()) {
            throw_error<PreconditionViolation>("Can't initialise an object that has been destroyed");
        }
        object.init();
        // If init throws, the object is left uninitialised and may be initialised again.
        object._initialised = true;
    }

    void destroy_object(ObjectLifeCycle &object) {
        if (object.is_destroyed() || object.is_destroying()) { return; }
        TransitionGuard guard{object};
        object.will_destroy();
        object._destroyed = true;
    }

    InitialiseDestroyContext::InitialiseDestroyContext(ObjectLifeCycle &object) : _object{object} {
        initialise_object(object);
    }

    InitialiseDestroyContext::~InitialiseDestroyContext() noexcept {
        // Destructors must not throw, report and carry on.
        try {
            destroy_object(_object);
        } catch (const std::exception &e) {
            fprintf(stderr, "Warning: exception during destroy_object: %s\n", e.what());
        }
    }
} // namespace arrayproxy

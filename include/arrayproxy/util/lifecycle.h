#ifndef ARRAYPROXY_LIFECYCLE_H
#define ARRAYPROXY_LIFECYCLE_H

#include <arrayproxy/arrayproxy_export.h>

#include <memory>
#include <utility>

namespace arrayproxy {
    struct ObjectLifeCycle;

    void ARRAYPROXY_EXPORT initialise_object(ObjectLifeCycle &object);

    void ARRAYPROXY_EXPORT destroy_object(ObjectLifeCycle &object);

    struct TransitionGuard;

    /**
     * This will initialise the object in the constructor and destroy it in the destructor.
     * The destructor never throws, failures during destroy are reported to stderr.
     */
    struct ARRAYPROXY_EXPORT InitialiseDestroyContext {
        explicit InitialiseDestroyContext(ObjectLifeCycle &object);

        ~InitialiseDestroyContext() noexcept;

    private:
        ObjectLifeCycle &_object;
    };

    /**
     * The life-cycle and associated method calls are as follows:
     *
     * * The object is constructed, properties may be set after this but before initialisation.
     *
     * * initialise_object calls init exactly once. Virtual dispatch is fully available at this point, so this is
     *   where an object binds to collaborators whose identity is decided by overridable accessors.
     *
     * * destroy_object marks the object as destroying, calls will_destroy and then marks the object as destroyed.
     *   Calling destroy_object again is a no-op, as is destroying an object that is currently being destroyed.
     *
     * NOTE: A destroyed object stays addressable until its owner releases it. Other objects may still hold a reference
     *       to it and are expected to tolerate the destroyed state while they are themselves torn down.
     */
    struct ARRAYPROXY_EXPORT ObjectLifeCycle {
        virtual ~ObjectLifeCycle() = default;

        /**
         * init has completed successfully.
         */
        [[nodiscard]] bool is_initialised() const;

        /**
         * The object is in the process of being destroyed (will_destroy is executing).
         */
        [[nodiscard]] bool is_destroying() const;

        /**
         * will_destroy has completed, the object must no longer be used except to be released.
         */
        [[nodiscard]] bool is_destroyed() const;

    protected:
        /**
         * Called once the object has been constructed and its initial properties assigned.
         */
        virtual void init() = 0;

        /**
         * Release any registrations held on other objects. Called at most once.
         */
        virtual void will_destroy() = 0;

    private:
        bool _initialised{false};
        bool _destroying{false};
        bool _destroyed{false};

        friend TransitionGuard;

        friend void initialise_object(ObjectLifeCycle &object);

        friend void destroy_object(ObjectLifeCycle &object);
    };

    /**
     * Construct and initialise an object, the equivalent of a two-phase create.
     */
    template<typename T, typename... Args>
    std::unique_ptr<T> create(Args &&... args) {
        auto object = std::make_unique<T>(std::forward<Args>(args)...);
        initialise_object(*object);
        return object;
    }
}

#endif //ARRAYPROXY_LIFECYCLE_H

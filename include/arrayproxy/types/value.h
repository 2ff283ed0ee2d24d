#ifndef ARRAYPROXY_TYPES_VALUE_H
#define ARRAYPROXY_TYPES_VALUE_H

#include <arrayproxy/arrayproxy_export.h>

#include <fmt/format.h>

#include <concepts>
#include <cstddef>
#include <cstring>
#include <functional>
#include <new>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <utility>

namespace arrayproxy
{
    // Small buffer size: a std::string fits inline, anything larger goes to the heap
    inline constexpr std::size_t ARRAYPROXY_VALUE_SBO   = sizeof(std::string);
    inline constexpr std::size_t ARRAYPROXY_VALUE_ALIGN = alignof(std::max_align_t);

    struct ARRAYPROXY_EXPORT TypeId
    {
        const std::type_info *info{};
    };

    ARRAYPROXY_EXPORT bool operator==(TypeId a, TypeId b) noexcept;

    /**
     * Type-erased element stored in the arrays. An empty Value is the "undefined" result of reading past the end of
     * an array or reading through a proxy without content.
     */
    class ARRAYPROXY_EXPORT Value
    {
    public:
        Value() noexcept : vtable_(nullptr), using_heap_(false) {}

        Value(const Value &other) : vtable_(nullptr), using_heap_(false) {
            if (other.vtable_) other.vtable_->copy(*this, other);
        }

        Value(Value &&other) noexcept : vtable_(nullptr), using_heap_(false) {
            if (other.vtable_) other.vtable_->move(*this, other);
        }

        Value &operator=(const Value &other) {
            if (this != &other) {
                Value tmp(other);
                reset();
                if (tmp.vtable_) tmp.vtable_->move(*this, tmp);
            }
            return *this;
        }

        Value &operator=(Value &&other) noexcept {
            if (this != &other) {
                reset();
                if (other.vtable_) other.vtable_->move(*this, other);
            }
            return *this;
        }

        ~Value() { reset(); }

        void reset() noexcept {
            if (vtable_) vtable_->destroy(*this);
            vtable_     = nullptr;
            using_heap_ = false;
        }

        [[nodiscard]] bool   has_value() const noexcept { return vtable_ != nullptr; }
        [[nodiscard]] TypeId type() const noexcept { return has_value() ? vtable_->type : TypeId{}; }

        explicit operator bool() const noexcept { return has_value(); }

        template <class T, class... Args>
        T &emplace(Args &&... args) {
            reset();
            constexpr std::size_t t_align = alignof(T);
            constexpr std::size_t t_size  = sizeof(T);
            if (t_size <= ARRAYPROXY_VALUE_SBO && t_align <= ARRAYPROXY_VALUE_ALIGN &&
                std::is_nothrow_move_constructible_v<T>) {
                new(storage_ptr()) T(std::forward<Args>(args)...);
                using_heap_ = false;
            } else {
                T *p = new T(std::forward<Args>(args)...);
                std::memcpy(storage_, &p, sizeof(T *));
                using_heap_ = true;
            }
            vtable_ = &vtable_for<T>();
            return *reinterpret_cast<T *>(get_ptr());
        }

        /**
         * Whether the value holds a T. Type identity is decided by TypeId equality everywhere, so a value created in
         * another shared object still matches.
         */
        template <class T>
        [[nodiscard]] bool holds() const noexcept { return vtable_ && vtable_->type == TypeId{&typeid(T)}; }

        template <class T>
        T *get_if() noexcept {
            if (!holds<T>()) return nullptr;
            return reinterpret_cast<T *>(get_ptr());
        }

        template <class T>
        const T *get_if() const noexcept {
            if (!holds<T>()) return nullptr;
            return reinterpret_cast<const T *>(get_ptr());
        }

        /**
         * Typed access, throws std::bad_cast when the value is empty or holds another type.
         */
        template <class T>
        const T &as() const {
            if (const T *p = get_if<T>()) return *p;
            throw std::bad_cast();
        }

        // Hash of the contained value (type-aware). Returns 0 if empty.
        [[nodiscard]] std::size_t hash_code() const noexcept { return vtable_ ? vtable_->hash(*this) : 0; }

        // Human readable rendering, "undefined" when empty
        [[nodiscard]] std::string to_string() const { return vtable_ ? vtable_->to_string(*this) : "undefined"; }

        [[nodiscard]] bool is_inline() const noexcept { return vtable_ && !using_heap_; }

        [[nodiscard]] bool is_heap_allocated() const noexcept { return using_heap_; }

        // Equality: type + value. Empty equals empty. Different types -> false.
        friend bool operator==(const Value &a, const Value &b) noexcept {
            if (!a.vtable_ && !b.vtable_) return true;
            if (!a.vtable_ || !b.vtable_) return false;
            if (!(a.vtable_->type == b.vtable_->type)) return false;
            return a.vtable_->equals(a, b);
        }

        friend bool operator!=(const Value &a, const Value &b) noexcept { return !(a == b); }

    private:
        struct VTable
        {
            TypeId type;
            void (*copy)(Value &, const Value &);
            void (*move)(Value &, Value &) noexcept;
            void (*destroy)(Value &) noexcept;
            std::size_t (*hash)(const Value &) noexcept;
            bool (*equals)(const Value &, const Value &) noexcept;
            std::string (*to_string)(const Value &);
        };

        template <class T>
        static const T *typed_ptr(const Value &v) noexcept {
            return v.using_heap_ ? *reinterpret_cast<T * const*>(v.storage_)
                                 : reinterpret_cast<const T *>(v.storage_ptr());
        }

        template <class T>
        static const VTable &vtable_for() {
            static const VTable vt{
                TypeId{&typeid(T)},
                // copy
                [](Value &dst, const Value &src) {
                    if (src.using_heap_) {
                        T *np = new T(*typed_ptr<T>(src));
                        std::memcpy(dst.storage_, &np, sizeof(T *));
                        dst.using_heap_ = true;
                    } else {
                        new(dst.storage_ptr()) T(*typed_ptr<T>(src));
                        dst.using_heap_ = false;
                    }
                    dst.vtable_ = &vtable_for<T>();
                },
                // move
                [](Value &dst, Value &src) noexcept {
                    if (src.using_heap_) {
                        auto *sp = *reinterpret_cast<T **>(src.storage_);
                        std::memcpy(dst.storage_, &sp, sizeof(T *));
                        dst.using_heap_ = true;
                        *reinterpret_cast<T **>(src.storage_) = nullptr;
                    } else {
                        new(dst.storage_ptr()) T(std::move(*reinterpret_cast<T *>(src.storage_ptr())));
                        dst.using_heap_ = false;
                        reinterpret_cast<T *>(src.storage_ptr())->~T();
                    }
                    dst.vtable_     = &vtable_for<T>();
                    src.vtable_     = nullptr;
                    src.using_heap_ = false;
                },
                // destroy
                [](Value &self) noexcept {
                    if (self.using_heap_) {
                        delete *reinterpret_cast<T **>(self.storage_);
                        *reinterpret_cast<T **>(self.storage_) = nullptr;
                    } else { reinterpret_cast<T *>(self.storage_ptr())->~T(); }
                },
                // hash
                [](const Value &self) noexcept -> std::size_t {
                    const T *p = typed_ptr<T>(self);
                    if constexpr (requires(const T &x) { { std::hash<T>{}(x) } -> std::convertible_to<std::size_t>; }) {
                        return std::hash<T>{}(*p);
                    } else {
                        const std::size_t th = std::hash<const void *>{}(self.vtable_->type.info);
                        const std::size_t ph = std::hash<const void *>{}(static_cast<const void *>(p));
                        return th ^ (ph + 0x9e3779b97f4a7c15ull + (th << 6) + (th >> 2));
                    }
                },
                // equals
                [](const Value &a, const Value &b) noexcept -> bool {
                    const T *ap = typed_ptr<T>(a);
                    const T *bp = typed_ptr<T>(b);
                    if constexpr (requires(const T &x, const T &y) { { x == y } -> std::convertible_to<bool>; }) {
                        return *ap == *bp;
                    } else {
                        return ap == bp; // fallback to identity
                    }
                },
                // to_string
                [](const Value &self) -> std::string {
                    if constexpr (fmt::is_formattable<T>::value) {
                        return fmt::format("{}", *typed_ptr<T>(self));
                    } else {
                        return fmt::format("<{}>", typeid(T).name());
                    }
                }
            };
            return vt;
        }

        void *storage_ptr() noexcept { return static_cast<void *>(storage_); }
        const void *storage_ptr() const noexcept { return static_cast<const void *>(storage_); }

        void *get_ptr() noexcept {
            return using_heap_ ? *reinterpret_cast<void **>(storage_) : storage_ptr();
        }

        const void *get_ptr() const noexcept {
            return using_heap_ ? *reinterpret_cast<void * const*>(storage_) : storage_ptr();
        }

        alignas(ARRAYPROXY_VALUE_ALIGN) unsigned char storage_[ARRAYPROXY_VALUE_SBO];
        const VTable *vtable_;
        bool using_heap_;
    };

    template <class T, class... Args>
    Value make_value(Args &&... args) {
        Value v;
        v.emplace<T>(std::forward<Args>(args)...);
        return v;
    }

    // Convenience for the common case of string elements
    ARRAYPROXY_EXPORT Value make_value(const char *str);

} // namespace arrayproxy

template <>
struct std::hash<arrayproxy::Value>
{
    std::size_t operator()(const arrayproxy::Value &v) const noexcept { return v.hash_code(); }
};

template <>
struct fmt::formatter<arrayproxy::Value> : fmt::formatter<std::string>
{
    auto format(const arrayproxy::Value &v, fmt::format_context &ctx) const {
        return fmt::formatter<std::string>::format(v.to_string(), ctx);
    }
};

#endif // ARRAYPROXY_TYPES_VALUE_H

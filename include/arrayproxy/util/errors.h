#ifndef ARRAYPROXY_UTIL_ERRORS
#define ARRAYPROXY_UTIL_ERRORS

#include <arrayproxy/arrayproxy_export.h>

#include <fmt/format.h>

#include <concepts>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <version>

#if defined(__cpp_lib_stacktrace)
#include <stacktrace>
#endif

namespace arrayproxy {

    /**
     * Raised when a caller breaks one of the structural invariants of an array or proxy, for example binding a proxy
     * to itself or mutating through a proxy that presents an arranged view. These are programming errors, they are
     * never recovered internally.
     */
    struct ARRAYPROXY_EXPORT PreconditionViolation : std::logic_error {
        using std::logic_error::logic_error;
    };

    inline constexpr unsigned MAX_STACKTRACE_DEPTH = 20;

    template<typename Error = std::runtime_error, typename... Ts>
        requires (!std::constructible_from<Error, std::string>)
    [[noreturn]] constexpr auto throw_error(Ts&&... args) {
        throw Error{std::forward<Ts>(args)...};
    }

#if defined(__cpp_lib_stacktrace)
    // Overload (I) - takes error msg and appends source location & stacktrace info
    template<typename Error = std::runtime_error>
        requires std::constructible_from<Error, std::string>
    [[noreturn]] constexpr auto throw_error(
        std::string_view msg,
        std::source_location loc = std::source_location::current(),
        std::stacktrace trace = std::stacktrace::current(0, MAX_STACKTRACE_DEPTH)
    ) {
        throw Error{fmt::format(
            "{}\nFile: {}({}:{}): {}\nStacktrace:\n{}", msg,
            loc.file_name(), loc.line(), loc.column(), loc.function_name(), to_string(trace)
        )};
    }

    // Overload (II) - direct formatting of error msg from args, only stacktrace is appended to the message
    template<typename Error = std::runtime_error, typename... Ts>
        requires (std::constructible_from<Error, std::string> && sizeof...(Ts) > 0)
    [[noreturn]] constexpr auto throw_error(fmt::format_string<Ts...> fmt_str, Ts&&... xs) {
        const std::stacktrace trace = std::stacktrace::current(1, MAX_STACKTRACE_DEPTH);
        throw Error{fmt::format(
            "{}\nStacktrace:\n{}", fmt::format(fmt_str, std::forward<Ts>(xs)...), to_string(trace)
        )};
    }
#else
    // Overload (I) - takes error msg and appends source location
    template<typename Error = std::runtime_error>
        requires std::constructible_from<Error, std::string>
    [[noreturn]] constexpr auto throw_error(
        std::string_view msg,
        std::source_location loc = std::source_location::current()
    ) {
        throw Error{fmt::format(
            "{}\nFile: {}({}:{}): {}", msg,
            loc.file_name(), loc.line(), loc.column(), loc.function_name()
        )};
    }

    // Overload (II) - direct formatting of error msg from args
    template<typename Error = std::runtime_error, typename... Ts>
        requires (std::constructible_from<Error, std::string> && sizeof...(Ts) > 0)
    [[noreturn]] constexpr auto throw_error(fmt::format_string<Ts...> fmt_str, Ts&&... xs) {
        throw Error{fmt::format(fmt_str, std::forward<Ts>(xs)...)};
    }
#endif

    /**
     * Fail fast with a PreconditionViolation when the condition does not hold.
     */
    inline void check_precondition(bool condition, std::string_view msg,
                                   std::source_location loc = std::source_location::current()) {
        if (!condition) { throw_error<PreconditionViolation>(msg, std::move(loc)); }
    }

} // namespace arrayproxy

#endif // ARRAYPROXY_UTIL_ERRORS

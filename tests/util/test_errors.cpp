/**
 * @file test_errors.cpp
 * @brief Unit tests for throw_error and check_precondition.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <arrayproxy/util/errors.h>

#include <stdexcept>

using namespace arrayproxy;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("throw_error - message overload appends the source location", "[errors]") {
    CHECK_THROWS_AS(throw_error<std::runtime_error>("content went missing"), std::runtime_error);
    CHECK_THROWS_WITH(throw_error<std::runtime_error>("content went missing"),
                      ContainsSubstring("content went missing") && ContainsSubstring("File: ") &&
                      ContainsSubstring("test_errors.cpp"));
}

TEST_CASE("throw_error - format overload renders its arguments", "[errors]") {
    CHECK_THROWS_AS(throw_error<std::out_of_range>("Index {} out of range, length is {}", 7, 3), std::out_of_range);
    CHECK_THROWS_WITH(throw_error<std::out_of_range>("Index {} out of range, length is {}", 7, 3),
                      ContainsSubstring("Index 7 out of range, length is 3"));
}

TEST_CASE("throw_error - non string errors are constructed from the arguments", "[errors]") {
    CHECK_THROWS_AS(throw_error<std::bad_alloc>(), std::bad_alloc);
}

#if defined(__cpp_lib_stacktrace)
TEST_CASE("throw_error - stacktrace is appended to both overloads", "[errors]") {
    CHECK_THROWS_WITH(throw_error<std::runtime_error>("no content"), ContainsSubstring("Stacktrace:"));
    CHECK_THROWS_WITH(throw_error<std::runtime_error>("length {}", 2), ContainsSubstring("Stacktrace:"));
}
#endif

TEST_CASE("check_precondition - throws PreconditionViolation only when the condition fails", "[errors]") {
    CHECK_NOTHROW(check_precondition(true, "never raised"));
    CHECK_THROWS_AS(check_precondition(false, "proxy bound to itself"), PreconditionViolation);
    CHECK_THROWS_WITH(check_precondition(false, "proxy bound to itself"),
                      ContainsSubstring("proxy bound to itself") && ContainsSubstring("File: "));

    // A precondition violation is a logic error
    CHECK_THROWS_AS(check_precondition(false, "proxy bound to itself"), std::logic_error);
}

#pragma once

/**
 * @file array_change.h
 * @brief ArrayChange - range descriptor carried by array will/did-change notifications.
 */

#include <arrayproxy/arrayproxy_export.h>

#include <fmt/format.h>

#include <cstddef>
#include <optional>
#include <string>

namespace arrayproxy {

/**
 * @brief A splice-style description of a bulk mutation.
 *
 * Elements [start, start + removed) are replaced by `added` new elements. Either count may be absent ("undefined"),
 * which is how a proxy reports a full-range swap: the will-change carries only the removed count and the did-change
 * carries only the added count.
 */
struct ARRAYPROXY_EXPORT ArrayChange {
    size_t start{0};
    std::optional<size_t> removed;
    std::optional<size_t> added;

    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const ArrayChange&, const ArrayChange&) = default;
};

}  // namespace arrayproxy

template <>
struct fmt::formatter<arrayproxy::ArrayChange> : fmt::formatter<std::string> {
    auto format(const arrayproxy::ArrayChange& change, fmt::format_context& ctx) const {
        return fmt::formatter<std::string>::format(change.to_string(), ctx);
    }
};

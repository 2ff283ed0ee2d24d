#include <arrayproxy/types/array_change.h>

namespace arrayproxy {

namespace {

std::string count_to_string(const std::optional<size_t>& count) {
    return count.has_value() ? fmt::format("{}", *count) : std::string{"undefined"};
}

}  // namespace

std::string ArrayChange::to_string() const {
    return fmt::format("({}, {}, {})", start, count_to_string(removed), count_to_string(added));
}

}  // namespace arrayproxy

#include <arrayproxy/types/value.h>

namespace arrayproxy
{
    bool operator==(TypeId a, TypeId b) noexcept {
        if (a.info == b.info) return true;
        if (a.info == nullptr || b.info == nullptr) return false;
        return *a.info == *b.info;
    }

    Value make_value(const char *str) { return make_value<std::string>(str); }
} // namespace arrayproxy

#pragma once

#include <string_view>

namespace librtboot {

/// How a registered type hands out instances.
///   singleton: built once, reused for the owner's lifetime
///   transient: a fresh instance per resolution
///   factory: every resolution delegates to a caller-supplied function
enum class lifetime_kind {
    singleton,
    transient,
    factory
};

constexpr std::string_view to_string(lifetime_kind lt) noexcept {
    constexpr std::string_view names[] = {"singleton", "transient", "factory"};
    return names[static_cast<int>(lt)];
}

} // namespace librtboot

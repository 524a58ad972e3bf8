#pragma once

#include "export.hpp"
#include "lifetime.hpp"
#include "type_traits.hpp"

#include <any>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <source_location>
#include <string>
#include <typeindex>
#include <utility>
#include <vector>

namespace librtboot {

class service_container;

// ---------------------------------------------------------------
// instance_source: what a component factory pulls its deps from
// ---------------------------------------------------------------

class LIBRTBOOT_EXPORT instance_source {
public:
    virtual ~instance_source() = default;

    /// Return the instance for `type`, creating it first if needed.
    /// Throws when it cannot be produced.
    virtual std::shared_ptr<void> require(std::type_index type) = 0;

    template <typename T>
    std::shared_ptr<T> require() {
        return std::static_pointer_cast<T>(require(std::type_index(typeid(T))));
    }
};

using component_factory = std::function<std::shared_ptr<void>(instance_source&)>;
using component_hook    = std::function<void(void*)>;

// ---------------------------------------------------------------
// component_registration: one managed component
// ---------------------------------------------------------------

struct component_registration {
    std::type_index component_type = std::type_index(typeid(void));
    std::string     name;
    int             priority = 0;
    std::vector<std::type_index> dependencies;
    lifetime_kind   lifetime = lifetime_kind::singleton;

    // Pre-built (register_instance) or produced instance.
    std::shared_ptr<void> instance;
    component_factory     factory;

    component_hook on_initialize;
    component_hook on_dependencies_resolved;
    component_hook on_dispose;
    bool dependency_aware = false;

    // Assigned by registration_store::add.
    std::chrono::steady_clock::time_point registered_at{};
    std::uint64_t sequence = 0;

    std::source_location registration_location;
    std::any             registration_stacktrace;
    std::string          api_name;
};

// ---------------------------------------------------------------
// service_entry: one service container registration
// ---------------------------------------------------------------

using service_factory = std::function<std::shared_ptr<void>(service_container&)>;

/// One way to construct an implementation: the parameter types it needs and
/// an invoker taking the resolved arguments in the same order.
struct constructor_candidate {
    std::vector<std::type_index> parameters;
    std::function<std::shared_ptr<void>(const std::vector<std::shared_ptr<void>>&)> invoke;
};

struct service_entry {
    std::type_index service_type        = std::type_index(typeid(void));
    std::type_index implementation_type = std::type_index(typeid(void));
    lifetime_kind   lifetime            = lifetime_kind::transient;
    std::shared_ptr<void> instance;
    service_factory factory;
    std::vector<constructor_candidate> constructors;
    bool cacheable = false;

    std::uint64_t sequence = 0;
    std::source_location registration_location;
    std::any             registration_stacktrace;
};

/// Order in which constructor candidates are tried: most parameters first,
/// registration order among equals.
LIBRTBOOT_EXPORT std::vector<const constructor_candidate*>
rank_constructors(const std::vector<constructor_candidate>& candidates);

namespace internal {
/// Capture the current stacktrace into a std::any (empty when stacktrace
/// support is compiled out).
LIBRTBOOT_EXPORT std::any capture_stacktrace();
} // namespace internal

// ---------------------------------------------------------------
// Helpers used by the typed registration templates
// ---------------------------------------------------------------
namespace detail {

/// Build TImpl from already-resolved arguments and return it as a void
/// pointer addressing the TInterface subobject.
template <typename TInterface, typename TImpl, typename... Deps, std::size_t... I>
std::shared_ptr<void> construct_from(
        [[maybe_unused]] const std::vector<std::shared_ptr<void>>& args,
        std::index_sequence<I...>) {
    std::shared_ptr<TInterface> obj =
        std::make_shared<TImpl>(std::static_pointer_cast<Deps>(args[I])...);
    return std::static_pointer_cast<void>(obj);
}

template <typename TInterface, typename TImpl, typename... Deps>
constructor_candidate make_candidate(deps_tag<Deps...>) {
    return constructor_candidate{
        { std::type_index(typeid(Deps))... },
        [](const std::vector<std::shared_ptr<void>>& args) -> std::shared_ptr<void> {
            return construct_from<TInterface, TImpl, Deps...>(
                args, std::index_sequence_for<Deps...>{});
        }
    };
}

/// One candidate per tag, plus a zero-argument candidate when TImpl is
/// default-constructible and none was listed.
template <typename TInterface, typename TImpl, typename... Tags>
std::vector<constructor_candidate> make_candidates(Tags... tags) {
    std::vector<constructor_candidate> out;
    (out.push_back(make_candidate<TInterface, TImpl>(tags)), ...);
    constexpr bool has_default = ((Tags::count == 0) || ... || false);
    if constexpr (!has_default && std::is_default_constructible_v<TImpl>) {
        out.push_back(make_candidate<TInterface, TImpl>(deps_tag<>{}));
    }
    return out;
}

template <typename T>
void attach_hooks(component_registration& reg) {
    if constexpr (has_initialize_hook<T>) {
        reg.on_initialize = [](void* p) { static_cast<T*>(p)->on_initialize(); };
    }
    if constexpr (dependency_aware<T>) {
        reg.dependency_aware = true;
        reg.on_dependencies_resolved = [](void* p) {
            static_cast<T*>(p)->on_dependencies_resolved();
        };
    }
    if constexpr (has_dispose_hook<T>) {
        reg.on_dispose = [](void* p) { static_cast<T*>(p)->on_dispose(); };
    }
}

} // namespace detail

} // namespace librtboot

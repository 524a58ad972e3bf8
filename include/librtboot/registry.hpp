#pragma once

#include "export.hpp"
#include "dependency_graph.hpp"
#include "exceptions.hpp"
#include "registration.hpp"
#include "scheduler.hpp"
#include "type_traits.hpp"

#include <cstddef>
#include <memory>
#include <source_location>
#include <typeindex>
#include <utility>
#include <vector>

namespace librtboot {

class service_container;

struct registry_options {
    /// Abort initialize_all() on the first construction failure.  When
    /// false, failures are logged and their dependents are skipped.
    bool strict_initialization = true;

    /// Run validate() before initialize_all() and throw on an invalid graph.
    bool validate_before_initialize = true;

    /// Register created instances in the attached container as singletons.
    bool publish_to_container = true;
};

// ---------------------------------------------------------------
// registry: prioritised components with declared dependencies
// ---------------------------------------------------------------

/// Components are registered with a priority and the types they depend on,
/// built once by initialize_all() in dependency order, and torn down in
/// reverse by dispose().  Instances are not disposed on destruction; call
/// dispose() explicitly.
///
/// The registry never calls into the attached container while holding its
/// own lock, so container factories may call get_manager().  Component
/// factories and hooks run under the registry lock and must not resolve
/// from a container that another thread is resolving back into the registry.
class LIBRTBOOT_EXPORT registry {
public:
    explicit registry(service_container* container = nullptr, registry_options options = {});
    explicit registry(registry_options options);
    ~registry();

    registry(const registry&) = delete;
    registry& operator=(const registry&) = delete;
    registry(registry&&) noexcept;
    registry& operator=(registry&&) noexcept;

    // ===============================================================
    // Registration (ignored with a warning after initialize_all())
    // ===============================================================

    /// Zero-dep component
    template <typename T>
        requires default_constructible<T>
    registry& register_component(int priority = 0,
                                 std::source_location loc = std::source_location::current()) {
        return register_component<T>(priority, deps_tag<>{}, loc);
    }

    /// Component with deps.  T is built from one std::shared_ptr per
    /// dependency when it has such a constructor, otherwise default-built
    /// after its dependencies exist.
    template <typename T, typename... Deps>
        requires constructible_from_deps<T, Deps...> || default_constructible<T>
    registry& register_component(int priority, deps_tag<Deps...>,
                                 std::source_location loc = std::source_location::current()) {
        component_registration reg;
        reg.component_type = typeid(T);
        reg.name = internal::demangle(typeid(T));
        reg.priority = priority;
        reg.dependencies = { std::type_index(typeid(Deps))... };
        reg.lifetime = lifetime_kind::singleton;
        reg.factory = [](instance_source& src) -> std::shared_ptr<void> {
            if constexpr (constructible_from_deps<T, Deps...>) {
                return std::make_shared<T>(src.require<Deps>()...);
            } else {
                return std::make_shared<T>();
            }
        };
        detail::attach_hooks<T>(reg);
        reg.api_name = "register_component";
        return add(std::move(reg), loc);
    }

    /// Already-built component; never constructed or initialized again.
    template <typename T>
    registry& register_instance(std::shared_ptr<T> instance, int priority = 0,
                                std::source_location loc = std::source_location::current()) {
        if (!instance) {
            throw bootstrap_error("register_instance: instance for "
                                  + internal::demangle(typeid(T)) + " is null", loc);
        }
        component_registration reg;
        reg.component_type = typeid(T);
        reg.name = internal::demangle(typeid(T));
        reg.priority = priority;
        reg.instance = std::static_pointer_cast<void>(std::move(instance));
        detail::attach_hooks<T>(reg);
        reg.api_name = "register_instance";
        return add(std::move(reg), loc);
    }

    // ===============================================================
    // Access
    // ===============================================================

    /// Existing or lazily built instance, falling back to the attached
    /// container.  Never throws; nullptr (logged) on failure.
    std::shared_ptr<void> get_manager(std::type_index type);

    template <typename T>
    std::shared_ptr<T> get_manager() {
        return std::static_pointer_cast<T>(get_manager(std::type_index(typeid(T))));
    }

    // ===============================================================
    // Diagnostics
    // ===============================================================

    validation_result validate_dependencies() const;
    dependency_analysis analyze_dependencies() const;

    /// Throws cyclic_dependency when no order exists.
    std::vector<std::type_index> initialization_order() const;

    dependency_graph graph() const;

    // ===============================================================
    // Lifecycle
    // ===============================================================

    /// Build every registered component.  A second call only warns.
    void initialize_all();

    /// Run on_dispose() in reverse creation order and forget everything.
    void dispose();

    bool is_registered(std::type_index type) const;

    template <typename T>
    bool is_registered() const { return is_registered(typeid(T)); }

    std::size_t registered_count() const;
    bool is_initialized() const;
    initialization_report last_report() const;

    service_container* container() const noexcept;

private:
    registry& add(component_registration reg, std::source_location loc);

    struct impl;
    std::unique_ptr<impl> impl_;
};

} // namespace librtboot

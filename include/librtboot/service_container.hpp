#pragma once

#include "export.hpp"
#include "dependency_graph.hpp"
#include "discovery.hpp"
#include "exceptions.hpp"
#include "lifetime.hpp"
#include "registration.hpp"
#include "resolution_cache.hpp"
#include "type_traits.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <source_location>
#include <string>
#include <type_traits>
#include <typeindex>
#include <utility>
#include <vector>

namespace librtboot {

// ---------------------------------------------------------------
// Options and results
// ---------------------------------------------------------------

struct container_options {
    bool enable_cache = true;
    std::chrono::milliseconds cache_ttl = resolution_cache::default_ttl;
    bool enable_discovery = true;
    /// Keep per-type resolution counts.
    bool enable_metrics = false;
};

/// Outcome of one resolution: the instance, or the error that stopped it.
struct resolution {
    std::shared_ptr<void> instance;
    std::exception_ptr    error;
    std::string           message;

    explicit operator bool() const noexcept { return instance != nullptr; }
};

struct container_statistics {
    std::size_t services   = 0;
    std::size_t singletons = 0;   // stored singleton instances
    std::size_t transients = 0;
    std::size_t factories  = 0;

    std::uint64_t total_resolutions      = 0;
    std::uint64_t successful_resolutions = 0;
    std::uint64_t failed_resolutions     = 0;

    std::uint64_t cache_hits    = 0;
    std::uint64_t cache_misses  = 0;
    std::size_t   cached_entries = 0;
    std::size_t   discovered     = 0;

    /// Filled only when container_options::enable_metrics is set.
    std::map<std::string, std::uint64_t> resolutions_by_type;

    double success_rate() const noexcept;

    /// Multi-line human-readable summary.
    std::string report() const;
};

// ---------------------------------------------------------------
// service_container
// ---------------------------------------------------------------

class LIBRTBOOT_EXPORT service_container {
public:
    explicit service_container(container_options options = {},
                               implementation_catalog catalog = {});
    ~service_container();

    service_container(const service_container&) = delete;
    service_container& operator=(const service_container&) = delete;
    service_container(service_container&&) noexcept;
    service_container& operator=(service_container&&) noexcept;

    // ===============================================================
    // Singleton registration
    // ===============================================================

    /// Zero-dep singleton
    template <typename TInterface, typename TImpl = TInterface>
        requires derived_from_base<TImpl, TInterface>
              && default_constructible<TImpl>
    service_container& register_singleton(std::source_location loc = std::source_location::current()) {
        return register_typed<TInterface, TImpl>(
            lifetime_kind::singleton, false,
            detail::make_candidates<TInterface, TImpl>(deps_tag<>{}), loc);
    }

    /// Singleton with deps
    template <typename TInterface, typename TImpl = TInterface, typename... Deps>
        requires derived_from_base<TImpl, TInterface>
              && constructible_from_deps<TImpl, Deps...>
    service_container& register_singleton(deps_tag<Deps...> tag,
                                          std::source_location loc = std::source_location::current()) {
        return register_typed<TInterface, TImpl>(
            lifetime_kind::singleton, false,
            detail::make_candidates<TInterface, TImpl>(tag), loc);
    }

    /// Singleton with alternative constructors
    template <typename TInterface, typename TImpl = TInterface, typename... Tags>
        requires derived_from_base<TImpl, TInterface>
              && constructible_from_tags<TImpl, Tags...>
    service_container& register_singleton(ctor_list<Tags...>,
                                          std::source_location loc = std::source_location::current()) {
        return register_typed<TInterface, TImpl>(
            lifetime_kind::singleton, false,
            detail::make_candidates<TInterface, TImpl>(Tags{}...), loc);
    }

    /// Pre-built singleton; stored immediately.
    template <typename TInterface>
    service_container& register_singleton(std::shared_ptr<TInterface> instance,
                                          std::source_location loc = std::source_location::current()) {
        if (!instance) {
            throw bootstrap_error("register_singleton: instance for "
                                  + internal::demangle(typeid(TInterface)) + " is null", loc);
        }
        service_entry entry;
        entry.service_type = typeid(TInterface);
        entry.implementation_type = typeid(*instance);
        entry.lifetime = lifetime_kind::singleton;
        entry.instance = std::static_pointer_cast<void>(std::move(instance));
        return add_entry(std::move(entry), loc);
    }

    // ===============================================================
    // Transient registration
    // ===============================================================

    template <typename TInterface, typename TImpl = TInterface>
        requires derived_from_base<TImpl, TInterface>
              && default_constructible<TImpl>
    service_container& register_transient(std::source_location loc = std::source_location::current()) {
        return register_typed<TInterface, TImpl>(
            lifetime_kind::transient, false,
            detail::make_candidates<TInterface, TImpl>(deps_tag<>{}), loc);
    }

    template <typename TInterface, typename TImpl = TInterface, typename... Deps>
        requires derived_from_base<TImpl, TInterface>
              && constructible_from_deps<TImpl, Deps...>
    service_container& register_transient(deps_tag<Deps...> tag,
                                          std::source_location loc = std::source_location::current()) {
        return register_typed<TInterface, TImpl>(
            lifetime_kind::transient, false,
            detail::make_candidates<TInterface, TImpl>(tag), loc);
    }

    template <typename TInterface, typename TImpl = TInterface, typename... Tags>
        requires derived_from_base<TImpl, TInterface>
              && constructible_from_tags<TImpl, Tags...>
    service_container& register_transient(ctor_list<Tags...>,
                                          std::source_location loc = std::source_location::current()) {
        return register_typed<TInterface, TImpl>(
            lifetime_kind::transient, false,
            detail::make_candidates<TInterface, TImpl>(Tags{}...), loc);
    }

    // ===============================================================
    // Cached registration: transient, but results are kept in the
    // resolution cache until the TTL runs out.
    // ===============================================================

    template <typename TInterface, typename TImpl = TInterface>
        requires derived_from_base<TImpl, TInterface>
              && default_constructible<TImpl>
    service_container& register_cached(std::source_location loc = std::source_location::current()) {
        return register_typed<TInterface, TImpl>(
            lifetime_kind::transient, true,
            detail::make_candidates<TInterface, TImpl>(deps_tag<>{}), loc);
    }

    template <typename TInterface, typename TImpl = TInterface, typename... Deps>
        requires derived_from_base<TImpl, TInterface>
              && constructible_from_deps<TImpl, Deps...>
    service_container& register_cached(deps_tag<Deps...> tag,
                                       std::source_location loc = std::source_location::current()) {
        return register_typed<TInterface, TImpl>(
            lifetime_kind::transient, true,
            detail::make_candidates<TInterface, TImpl>(tag), loc);
    }

    // ===============================================================
    // Factory registration
    // ===============================================================

    /// `fn` is called as `fn(container)` on every resolution and must
    /// return something convertible to std::shared_ptr<TInterface>.
    template <typename TInterface, typename Fn>
        requires std::is_invocable_r_v<std::shared_ptr<TInterface>, Fn&, service_container&>
    service_container& register_factory(Fn fn, std::source_location loc = std::source_location::current()) {
        return register_typed_factory<TInterface>(std::move(fn), false, loc);
    }

    template <typename TInterface, typename Fn>
        requires std::is_invocable_r_v<std::shared_ptr<TInterface>, Fn&, service_container&>
    service_container& register_cached_factory(Fn fn, std::source_location loc = std::source_location::current()) {
        return register_typed_factory<TInterface>(std::move(fn), true, loc);
    }

    // ===============================================================
    // Type-erased registration
    // ===============================================================

    service_container& register_service(service_entry entry,
                                        std::source_location loc = std::source_location::current());

    service_container& register_service(std::type_index service_type,
                                        std::type_index implementation_type,
                                        lifetime_kind lifetime,
                                        std::shared_ptr<void> instance = nullptr,
                                        service_factory factory = {},
                                        std::source_location loc = std::source_location::current());

    /// Remove a registration with its singleton and cache entry.
    bool unregister(std::type_index type);

    template <typename T>
    bool unregister() { return unregister(typeid(T)); }

    // ===============================================================
    // Resolution
    // ===============================================================

    /// Core: never throws for resolution failures.
    resolution resolve_result(std::type_index type);

    /// Throws unregistered_service, cyclic_dependency or
    /// instance_creation_error.
    std::shared_ptr<void> resolve(std::type_index type);

    /// nullptr on any failure.
    std::shared_ptr<void> try_resolve(std::type_index type);

    template <typename T>
    std::shared_ptr<T> resolve() {
        return std::static_pointer_cast<T>(resolve(std::type_index(typeid(T))));
    }

    template <typename T>
    std::shared_ptr<T> try_resolve() {
        return std::static_pointer_cast<T>(try_resolve(std::type_index(typeid(T))));
    }

    // ===============================================================
    // Introspection
    // ===============================================================

    bool is_registered(std::type_index type) const;

    template <typename T>
    bool is_registered() const { return is_registered(typeid(T)); }

    /// Registration order.
    std::vector<std::type_index> registered_types() const;

    std::size_t service_count() const;
    std::size_t singleton_count() const;

    /// Drop every registration, singleton and cache entry.
    void clear();

    container_statistics statistics() const;

    /// Check the declared constructor dependencies of every registration.
    /// Factory registrations contribute a node without edges.
    validation_result verify() const;

    // ===============================================================
    // Cache and discovery control
    // ===============================================================

    void set_caching(bool enabled);
    void set_discovery(bool enabled);
    void clear_cache();

    /// Drop expired cache entries; returns how many were dropped.
    std::size_t sweep_cache();

    /// Make TImpl discoverable for TInterface.  An earlier failed discovery
    /// of TInterface is forgotten so the next resolution tries again.
    template <typename TInterface, typename TImpl>
        requires derived_from_base<TImpl, TInterface> && default_constructible<TImpl>
    service_container& add_discoverable() {
        implementation_catalog extra;
        extra.add<TInterface, TImpl>();
        return add_discoverable(std::move(extra));
    }

    service_container& add_discoverable(implementation_catalog extra);

    const resolution_cache& cache() const;
    const implementation_catalog& catalog() const;

    // ===============================================================
    // Notifications
    // ===============================================================

    using instance_listener = std::function<void(std::type_index, const std::shared_ptr<void>&)>;
    using failure_listener  = std::function<void(std::type_index, const std::exception_ptr&)>;

    /// Listeners run in subscription order once the container lock is
    /// released.  A throwing listener is logged and skipped.
    /// on_registered receives the pre-built instance, or nullptr.
    void on_registered(instance_listener listener);
    void on_resolved(instance_listener listener);
    void on_resolution_failed(failure_listener listener);

private:
    template <typename TInterface, typename TImpl>
    service_container& register_typed(lifetime_kind lifetime, bool cacheable,
                                      std::vector<constructor_candidate> constructors,
                                      std::source_location loc) {
        static_assert(std::is_same_v<TInterface, TImpl>
                   || std::has_virtual_destructor_v<TInterface>,
            "service_container: I must have a virtual destructor when I != T");
        service_entry entry;
        entry.service_type = typeid(TInterface);
        entry.implementation_type = typeid(TImpl);
        entry.lifetime = lifetime;
        entry.cacheable = cacheable;
        entry.constructors = std::move(constructors);
        return add_entry(std::move(entry), loc);
    }

    template <typename TInterface, typename Fn>
    service_container& register_typed_factory(Fn fn, bool cacheable, std::source_location loc) {
        service_entry entry;
        entry.service_type = typeid(TInterface);
        entry.implementation_type = typeid(TInterface);
        entry.lifetime = lifetime_kind::factory;
        entry.cacheable = cacheable;
        entry.factory = [fn = std::move(fn)](service_container& c) mutable -> std::shared_ptr<void> {
            std::shared_ptr<TInterface> obj = fn(c);
            return std::static_pointer_cast<void>(std::move(obj));
        };
        return add_entry(std::move(entry), loc);
    }

    service_container& add_entry(service_entry entry, std::source_location loc);

    std::shared_ptr<void> resolve_internal(std::type_index type);
    void notify_registered(std::vector<std::pair<std::type_index, std::shared_ptr<void>>> events);
    std::shared_ptr<void> construct(const service_entry& entry);

    struct impl;
    std::unique_ptr<impl> impl_;
};

} // namespace librtboot

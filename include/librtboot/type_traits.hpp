#pragma once

#include <cstddef>
#include <memory>
#include <tuple>
#include <type_traits>

namespace librtboot {

// ---------------------------------------------------------------
// Dependency declaration tag
// ---------------------------------------------------------------

/// A zero-size tag type that carries a compile-time dependency type list.
/// Each listed type is injected into the constructor as `std::shared_ptr<D>`.
template <typename... Deps>
struct deps_tag {
    using type_list = std::tuple<Deps...>;
    static constexpr std::size_t count = sizeof...(Deps);
};

template <typename... Deps>
inline constexpr deps_tag<Deps...> deps{};

template <typename T>
struct is_deps_tag : std::false_type {};

template <typename... Deps>
struct is_deps_tag<deps_tag<Deps...>> : std::true_type {};

template <typename T>
inline constexpr bool is_deps_tag_v = is_deps_tag<T>::value;

/// Alternative constructor signatures, one deps_tag per constructor.
/// Resolution tries the longest first and falls back to shorter ones.
template <typename... Tags>
struct ctor_list {};

template <typename... Tags>
inline constexpr ctor_list<Tags...> ctors{};

// ---------------------------------------------------------------
// Core concepts
// ---------------------------------------------------------------

/// TDerived derives from TBase (or TDerived == TBase for self-registration).
template <typename TDerived, typename TBase>
concept derived_from_base = std::is_base_of_v<TBase, TDerived>;

/// T is default-constructible (for zero-dependency registrations).
template <typename T>
concept default_constructible = std::is_default_constructible_v<T>;

/// TImpl can be built from one shared_ptr per declared dependency.
template <typename TImpl, typename... Deps>
concept constructible_from_deps =
    std::is_constructible_v<TImpl, std::shared_ptr<Deps>...>;

namespace detail {

template <typename TImpl, typename Tag>
struct constructible_from_tag : std::false_type {};

template <typename TImpl, typename... Deps>
struct constructible_from_tag<TImpl, deps_tag<Deps...>>
    : std::bool_constant<constructible_from_deps<TImpl, Deps...>> {};

} // namespace detail

/// Every tag in Tags is a deps_tag whose types TImpl can be constructed from.
template <typename TImpl, typename... Tags>
concept constructible_from_tags =
    (is_deps_tag_v<Tags> && ...)
    && (detail::constructible_from_tag<TImpl, Tags>::value && ...);

// ---------------------------------------------------------------
// Lifecycle hook detection
// ---------------------------------------------------------------

/// Component has a custom initialization step run after construction.
template <typename T>
concept has_initialize_hook = requires(T& t) { t.on_initialize(); };

/// Component wants to be told once its dependencies are in place.
/// Components that declare dependencies are expected to satisfy this;
/// validation warns when they do not.
template <typename T>
concept dependency_aware = requires(T& t) { t.on_dependencies_resolved(); };

/// Component releases resources on registry teardown.
template <typename T>
concept has_dispose_hook = requires(T& t) { t.on_dispose(); };

} // namespace librtboot

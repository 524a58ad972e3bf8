#pragma once

/// @file fwd.hpp
/// Forward declarations for the public librtboot symbols.
/// Include this header when you only need to name a type (pointers,
/// references, function parameters) without requiring its full definition.

#include "export.hpp"

namespace librtboot {

// lifetime.hpp
enum class lifetime_kind;

// type_traits.hpp
template <typename... Deps>
struct deps_tag;
template <typename... Tags>
struct ctor_list;

// exceptions.hpp
class bootstrap_error;
class missing_dependency;
class cyclic_dependency;
class unregistered_service;
class instance_creation_error;
class lifecycle_hook_error;

// registration.hpp
class instance_source;
struct component_registration;
struct constructor_candidate;
struct service_entry;

// registration_store.hpp
class registration_store;

// dependency_graph.hpp
struct graph_node;
class dependency_graph;
struct validation_options;
struct validation_result;
struct dependency_analysis;
enum class complexity_rating;

// scheduler.hpp
struct initialize_options;
struct initialization_report;
class initializer;

// resolution_cache.hpp
class resolution_cache;

// discovery.hpp
class implementation_catalog;
class discovery;

// service_container.hpp
struct container_options;
struct container_statistics;
struct resolution;
class service_container;

// registry.hpp
struct registry_options;
class registry;

} // namespace librtboot

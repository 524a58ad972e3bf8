#pragma once

#include "export.hpp"

#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>
#include <source_location>
#include <typeindex>
#include <vector>

namespace librtboot {

namespace internal {
/// Demangle a type_index to human-readable name (GCC/Clang ABI-based).
LIBRTBOOT_EXPORT std::string demangle(std::type_index type);

/// Join demangled type names with " -> ".
LIBRTBOOT_EXPORT std::string format_type_path(const std::vector<std::type_index>& path);
} // namespace internal

class LIBRTBOOT_EXPORT bootstrap_error : public std::runtime_error {
public:
    explicit bootstrap_error(const std::string& message,
                             std::source_location loc = std::source_location::current());

    const std::source_location& location() const noexcept { return location_; }

    /// Set extended diagnostic detail (e.g. registration stacktrace).
    void set_diagnostic_detail(std::string detail);

    /// Get extended diagnostic detail (empty if none).
    const std::string& diagnostic_detail() const noexcept { return diagnostic_detail_; }

    /// Return what() plus diagnostic detail (if present), separated by newline.
    std::string full_diagnostic() const;

    /// Append resolution context to this exception.  Each enclosing
    /// resolution layer appends its component so the final what() shows the
    /// chain, e.g. "... (while resolving Engine -> Game)".
    void append_resolution_context(const std::string& component_info);

    const char* what() const noexcept override;

private:
    std::source_location location_;
    std::string diagnostic_detail_;
    std::string resolution_context_;
    mutable std::string cached_what_;

    static std::string format_message(const std::string& msg,
                                      const std::source_location& loc);
};

/// A declared dependency type was never registered.
class LIBRTBOOT_EXPORT missing_dependency : public bootstrap_error {
public:
    missing_dependency(std::type_index dependent, std::type_index dependency,
                       std::source_location loc = std::source_location::current());

    std::type_index dependent() const noexcept { return dependent_; }
    std::type_index dependency() const noexcept { return dependency_; }

private:
    std::type_index dependent_;
    std::type_index dependency_;
};

/// The dependency relation loops back on itself.  cycle() holds the loop in
/// traversal order with the first type repeated at the end ([X, Y, X]).
class LIBRTBOOT_EXPORT cyclic_dependency : public bootstrap_error {
public:
    explicit cyclic_dependency(const std::vector<std::type_index>& cycle,
                               std::source_location loc = std::source_location::current());

    /// Resolution-time form: `path` is the whole resolution stack plus the
    /// repeated type; the cycle is sliced from the first occurrence.
    cyclic_dependency(const std::vector<std::type_index>& cycle,
                      const std::vector<std::type_index>& path,
                      std::source_location loc = std::source_location::current());

    const std::vector<std::type_index>& cycle() const noexcept { return cycle_; }
    const std::vector<std::type_index>& resolution_path() const noexcept { return path_; }

private:
    std::vector<std::type_index> cycle_;
    std::vector<std::type_index> path_;
    static std::string build_message(const std::vector<std::type_index>& cycle,
                                     const std::vector<std::type_index>& path);
};

/// Resolution requested for a type with no registration, no factory and no
/// discoverable implementation.
class LIBRTBOOT_EXPORT unregistered_service : public bootstrap_error {
public:
    explicit unregistered_service(std::type_index type,
                                  std::source_location loc = std::source_location::current());

    unregistered_service(std::type_index type, std::string_view hint,
                         std::source_location loc = std::source_location::current());

    std::type_index service_type() const noexcept { return service_type_; }

private:
    std::type_index service_type_;
};

/// Every construction strategy was exhausted, or the chosen one threw.
class LIBRTBOOT_EXPORT instance_creation_error : public bootstrap_error {
public:
    instance_creation_error(std::type_index type, std::string_view reason,
                            std::source_location loc = std::source_location::current());

    instance_creation_error(std::type_index type, const std::exception& inner,
                            std::source_location loc = std::source_location::current());

    std::type_index component_type() const noexcept { return component_type_; }

private:
    std::type_index component_type_;
};

/// on_initialize() or on_dependencies_resolved() threw.  Always aborts
/// initialization, lenient mode included.
class LIBRTBOOT_EXPORT lifecycle_hook_error : public instance_creation_error {
public:
    lifecycle_hook_error(std::type_index type, std::string hook_name,
                         const std::exception& inner,
                         std::source_location loc = std::source_location::current());

    lifecycle_hook_error(std::type_index type, std::string hook_name,
                         std::string_view reason,
                         std::source_location loc = std::source_location::current());

    const std::string& hook_name() const noexcept { return hook_name_; }

private:
    std::string hook_name_;
};

} // namespace librtboot

#include "librtboot/exceptions.hpp"

#include <cstdlib>
#include <typeindex>
#include <string>
#include <memory>

#if defined(__GNUC__)
#include <cxxabi.h>
#endif

namespace librtboot {

namespace internal {

std::string demangle(std::type_index type) {
#if defined(__GNUC__)
    int status = 0;
    std::unique_ptr<char, decltype(&std::free)> demangled(
        abi::__cxa_demangle(type.name(), nullptr, nullptr, &status),
        &std::free);
    if (status == 0 && demangled) {
        return std::string(demangled.get());
    }
#endif
    return std::string(type.name());
}

std::string format_type_path(const std::vector<std::type_index>& path) {
    std::string out;
    for (std::size_t i = 0; i < path.size(); ++i) {
        if (i > 0) out += " -> ";
        out += demangle(path[i]);
    }
    return out;
}

} // namespace internal

std::string bootstrap_error::format_message(const std::string& msg,
                                            const std::source_location& loc) {
    return msg + " [at " + loc.file_name() + ":"
           + std::to_string(loc.line()) + "]";
}

bootstrap_error::bootstrap_error(const std::string& message, std::source_location loc)
    : std::runtime_error(format_message(message, loc))
    , location_(loc)
{}

void bootstrap_error::set_diagnostic_detail(std::string detail) {
    diagnostic_detail_ = std::move(detail);
}

void bootstrap_error::append_resolution_context(const std::string& component_info) {
    if (!resolution_context_.empty()) {
        resolution_context_ += " -> ";
    }
    resolution_context_ += component_info;
    cached_what_.clear();
}

const char* bootstrap_error::what() const noexcept {
    if (resolution_context_.empty()) {
        return std::runtime_error::what();
    }
    if (cached_what_.empty()) {
        try {
            cached_what_ = std::string(std::runtime_error::what())
                           + " (while resolving " + resolution_context_ + ")";
        } catch (const std::bad_alloc&) {
            return std::runtime_error::what();
        }
    }
    return cached_what_.c_str();
}

std::string bootstrap_error::full_diagnostic() const {
    if (diagnostic_detail_.empty()) {
        return what();
    }
    return std::string(what()) + "\n" + diagnostic_detail_;
}

missing_dependency::missing_dependency(std::type_index dependent,
                                       std::type_index dependency,
                                       std::source_location loc)
    : bootstrap_error("Missing dependency: " + internal::demangle(dependent)
                      + " depends on " + internal::demangle(dependency)
                      + ", which is not registered", loc)
    , dependent_(dependent)
    , dependency_(dependency)
{}

std::string cyclic_dependency::build_message(const std::vector<std::type_index>& cycle,
                                             const std::vector<std::type_index>& path) {
    std::string msg = "Circular dependency detected: " + internal::format_type_path(cycle);
    if (!path.empty() && path.size() != cycle.size()) {
        msg += " (resolution path: " + internal::format_type_path(path) + ")";
    }
    return msg;
}

cyclic_dependency::cyclic_dependency(const std::vector<std::type_index>& cycle,
                                     std::source_location loc)
    : bootstrap_error(build_message(cycle, {}), loc)
    , cycle_(cycle)
{}

cyclic_dependency::cyclic_dependency(const std::vector<std::type_index>& cycle,
                                     const std::vector<std::type_index>& path,
                                     std::source_location loc)
    : bootstrap_error(build_message(cycle, path), loc)
    , cycle_(cycle)
    , path_(path)
{}

unregistered_service::unregistered_service(std::type_index type, std::source_location loc)
    : bootstrap_error("Service not registered: " + internal::demangle(type), loc)
    , service_type_(type)
{}

unregistered_service::unregistered_service(std::type_index type, std::string_view hint,
                                           std::source_location loc)
    : bootstrap_error([&]() {
          std::string msg = "Service not registered: " + internal::demangle(type);
          if (!hint.empty())
              msg += "; " + std::string(hint);
          return msg;
      }(), loc)
    , service_type_(type)
{}

instance_creation_error::instance_creation_error(std::type_index type,
                                                 std::string_view reason,
                                                 std::source_location loc)
    : bootstrap_error("Cannot create instance of " + internal::demangle(type)
                      + ": " + std::string(reason), loc)
    , component_type_(type)
{}

instance_creation_error::instance_creation_error(std::type_index type,
                                                 const std::exception& inner,
                                                 std::source_location loc)
    : bootstrap_error("Cannot create instance of " + internal::demangle(type)
                      + ": " + inner.what(), loc)
    , component_type_(type)
{}

lifecycle_hook_error::lifecycle_hook_error(std::type_index type, std::string hook_name,
                                           const std::exception& inner,
                                           std::source_location loc)
    : instance_creation_error(type, hook_name + "() failed: " + inner.what(), loc)
    , hook_name_(std::move(hook_name))
{}

lifecycle_hook_error::lifecycle_hook_error(std::type_index type, std::string hook_name,
                                           std::string_view reason,
                                           std::source_location loc)
    : instance_creation_error(type, hook_name + "() failed: " + std::string(reason), loc)
    , hook_name_(std::move(hook_name))
{}

} // namespace librtboot

#pragma once

// Internal helper for stacktrace formatting.
// This header is NOT installed; only the library's .cpp files use it.

#include "librtboot/exceptions.hpp"
#include "librtboot/registration.hpp"

#include <any>
#include <sstream>
#include <string>

#ifdef LIBRTBOOT_HAS_STACKTRACE
#include <boost/stacktrace.hpp>
#endif

namespace librtboot::internal {

/// Render a stacktrace held in a std::any.  Empty when nothing was captured
/// or stacktrace support is compiled out.
inline std::string format_stacktrace(const std::any& st) {
#ifdef LIBRTBOOT_HAS_STACKTRACE
    if (const auto* trace = std::any_cast<boost::stacktrace::stacktrace>(&st)) {
        if (trace->size() > 0) {
            std::ostringstream oss;
            oss << *trace;
            return oss.str();
        }
    }
#else
    (void)st;
#endif
    return {};
}

inline std::string format_location(const std::source_location& loc) {
    if (loc.line() == 0) return {};
    return std::string(loc.file_name()) + ":" + std::to_string(loc.line());
}

/// "Registered at file:line (via register_component<T>)" plus the captured
/// trace, or an empty string when neither is known.
inline std::string format_registration_trace(const component_registration& reg) {
    std::string where = format_location(reg.registration_location);
    std::string trace = format_stacktrace(reg.registration_stacktrace);
    if (where.empty() && trace.empty()) return {};

    std::string out = "Component " + reg.name + " registered";
    if (!where.empty()) out += " at " + where;
    if (!reg.api_name.empty()) out += " (via " + reg.api_name + ")";
    if (!trace.empty()) out += ":\n" + trace;
    return out;
}

inline std::string format_registration_trace(const service_entry& entry) {
    std::string where = format_location(entry.registration_location);
    std::string trace = format_stacktrace(entry.registration_stacktrace);
    if (where.empty() && trace.empty()) return {};

    std::string out = "Service " + demangle(entry.service_type);
    if (entry.implementation_type != entry.service_type
        && entry.implementation_type != std::type_index(typeid(void))) {
        out += " [impl: " + demangle(entry.implementation_type) + "]";
    }
    out += " registered";
    if (!where.empty()) out += " at " + where;
    if (!trace.empty()) out += ":\n" + trace;
    return out;
}

} // namespace librtboot::internal

#include "librtboot/registration.hpp"

#include <any>

#ifdef LIBRTBOOT_HAS_STACKTRACE
#include <boost/stacktrace.hpp>
#endif

namespace librtboot::internal {

std::any capture_stacktrace() {
#ifdef LIBRTBOOT_HAS_STACKTRACE
    return std::any(boost::stacktrace::stacktrace());
#else
    return {};
#endif
}

} // namespace librtboot::internal

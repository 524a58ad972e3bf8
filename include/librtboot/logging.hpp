#pragma once

#include "export.hpp"

#include <memory>

#include <spdlog/logger.h>

namespace librtboot {

/// The library-wide logger ("librtboot").  Created on first use with a
/// colour stdout sink unless one was installed with set_logger().
LIBRTBOOT_EXPORT std::shared_ptr<spdlog::logger> logger();

/// Replace the library logger.  Passing nullptr restores the default.
LIBRTBOOT_EXPORT void set_logger(std::shared_ptr<spdlog::logger> replacement);

} // namespace librtboot

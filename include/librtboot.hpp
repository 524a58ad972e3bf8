#pragma once

#include "librtboot/export.hpp"
#include "librtboot/fwd.hpp"
#include "librtboot/lifetime.hpp"
#include "librtboot/type_traits.hpp"
#include "librtboot/exceptions.hpp"
#include "librtboot/logging.hpp"
#include "librtboot/registration.hpp"
#include "librtboot/registration_store.hpp"
#include "librtboot/dependency_graph.hpp"
#include "librtboot/scheduler.hpp"
#include "librtboot/resolution_cache.hpp"
#include "librtboot/discovery.hpp"
#include "librtboot/service_container.hpp"
#include "librtboot/registry.hpp"

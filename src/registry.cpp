#include "librtboot/registry.hpp"
#include "librtboot/logging.hpp"
#include "librtboot/registration_store.hpp"
#include "librtboot/service_container.hpp"

#include <algorithm>
#include <mutex>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace librtboot {

// ---------------------------------------------------------------
// Impl
// ---------------------------------------------------------------

using publication = std::pair<std::type_index, std::shared_ptr<void>>;

struct registry::impl {
    service_container* container = nullptr;
    registry_options options;
    mutable std::recursive_mutex mutex;

    registration_store store;
    std::vector<std::type_index> creation_order;
    std::vector<std::type_index> published;
    initialization_report report;
    bool initialized = false;

    impl(service_container* c, registry_options opts)
        : container(c), options(opts) {}

    /// Remember instances an initializer created.  Returns what should be
    /// handed to the container once the registry lock is released.
    std::vector<publication> adopt(const std::vector<std::type_index>& created) {
        std::vector<publication> pending;
        for (const auto& type : created) {
            creation_order.push_back(type);
            if (!options.publish_to_container || !container) continue;
            if (auto instance = store.instance_of(type)) {
                pending.emplace_back(type, std::move(instance));
            }
        }
        return pending;
    }

    /// Called without the registry lock held: the container is never
    /// entered while the registry lock is taken.
    void publish(std::vector<publication> pending) {
        for (auto& [type, instance] : pending) {
            if (container->is_registered(type)) continue;
            container->register_service(type, type, lifetime_kind::singleton, std::move(instance));
            std::lock_guard lock(mutex);
            published.push_back(type);
        }
    }

    /// Run on_dispose() for `type` if it has an instance, then drop it.
    bool dispose_one(std::type_index type) {
        const auto* reg = store.find(type);
        if (!reg || !reg->instance) return false;
        if (reg->on_dispose) {
            try {
                reg->on_dispose(reg->instance.get());
            } catch (const std::exception& e) {
                logger()->error("on_dispose() of {} failed: {}", reg->name, e.what());
            } catch (...) {
                logger()->error("on_dispose() of {} failed: unknown exception", reg->name);
            }
        }
        store.detach_instance(type);
        return true;
    }

    /// Undo a failed initialize_all(): dispose what it created, newest first.
    void roll_back(const std::vector<std::type_index>& created) {
        for (auto it = created.rbegin(); it != created.rend(); ++it) {
            dispose_one(*it);
        }
    }
};

// ---------------------------------------------------------------
// Constructors / Destructor
// ---------------------------------------------------------------

registry::registry(service_container* container, registry_options options)
    : impl_(std::make_unique<impl>(container, options))
{}

registry::registry(registry_options options)
    : registry(nullptr, options)
{}

registry::~registry() = default;
registry::registry(registry&&) noexcept = default;
registry& registry::operator=(registry&&) noexcept = default;

// ---------------------------------------------------------------
// Registration
// ---------------------------------------------------------------

registry& registry::add(component_registration reg, std::source_location loc) {
    std::lock_guard lock(impl_->mutex);
    if (impl_->initialized) {
        logger()->warn("Cannot register {} after initialization; ignored", reg.name);
        return *this;
    }

    reg.registration_location = loc;
    reg.registration_stacktrace = internal::capture_stacktrace();

    const auto name = reg.name;
    const auto priority = reg.priority;
    const auto dep_count = reg.dependencies.size();
    if (impl_->store.add(std::move(reg))) {
        logger()->warn("{} was already registered; replacing the earlier registration", name);
    } else {
        logger()->debug("Registered {} (priority {}, {} dependencies)", name, priority, dep_count);
    }
    return *this;
}

// ---------------------------------------------------------------
// Access
// ---------------------------------------------------------------

std::shared_ptr<void> registry::get_manager(std::type_index type) {
    auto& s = *impl_;
    std::shared_ptr<void> instance;
    std::vector<publication> pending;
    bool registered = false;
    {
        std::lock_guard lock(s.mutex);
        if (auto existing = s.store.instance_of(type)) {
            return existing;
        }
        registered = s.store.contains(type);
        if (registered) {
            initializer init(s.store, {.strict = true});
            try {
                instance = init.ensure(type);
            } catch (const std::exception& e) {
                logger()->warn("get_manager<{}> failed: {}", internal::demangle(type), e.what());
            } catch (...) {
                logger()->warn("get_manager<{}> failed: unknown exception",
                               internal::demangle(type));
            }
            pending = s.adopt(init.report().initialized);
        }
    }

    if (registered) {
        s.publish(std::move(pending));
        return instance;
    }

    // The registry lock is released before entering the container.
    if (s.container) {
        if (auto found = s.container->try_resolve(type)) {
            return found;
        }
    }
    logger()->debug("get_manager<{}>: not registered", internal::demangle(type));
    return nullptr;
}

// ---------------------------------------------------------------
// Diagnostics
// ---------------------------------------------------------------

validation_result registry::validate_dependencies() const {
    std::lock_guard lock(impl_->mutex);
    return validate(impl_->store.graph());
}

dependency_analysis registry::analyze_dependencies() const {
    std::lock_guard lock(impl_->mutex);
    return analyze(impl_->store.graph());
}

std::vector<std::type_index> registry::initialization_order() const {
    std::lock_guard lock(impl_->mutex);
    return compute_order(impl_->store.graph());
}

dependency_graph registry::graph() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->store.graph();
}

// ---------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------

void registry::initialize_all() {
    auto& s = *impl_;
    std::vector<publication> pending;
    {
        std::lock_guard lock(s.mutex);
        if (s.initialized) {
            logger()->warn("initialize_all() called on an initialized registry; ignored");
            return;
        }

        auto graph = s.store.graph();
        if (s.options.validate_before_initialize) {
            auto result = validate(graph);
            for (const auto& w : result.warnings) {
                logger()->warn("{}", w);
            }
            if (!result.is_valid) {
                for (const auto& msg : result.missing_dependency_messages) {
                    logger()->error("{}", msg);
                }
                if (result.has_circular_dependencies) {
                    logger()->error("Circular dependency: {}", result.cycle_description);
                    throw cyclic_dependency(graph.canonical_cycle(result.cycle));
                }
                const auto& first = result.missing_dependencies.front();
                throw missing_dependency(first.dependent, first.dependency);
            }
        }

        auto order = compute_order(graph);
        logger()->debug("Initialization order: {}", internal::format_type_path(order));

        initializer init(s.store, {.strict = s.options.strict_initialization});
        try {
            init.initialize(order);
        } catch (...) {
            s.report = init.report();
            s.roll_back(init.report().initialized);
            throw;
        }

        s.report = init.report();
        pending = s.adopt(s.report.initialized);
        s.initialized = true;

        if (s.report.succeeded()) {
            logger()->info("Initialized {} component(s)", s.report.initialized.size());
        } else {
            logger()->warn("Initialized {} component(s); {} failed, {} blocked",
                           s.report.initialized.size(), s.report.failed.size(),
                           s.report.blocked.size());
        }
    }
    s.publish(std::move(pending));
}

void registry::dispose() {
    auto& s = *impl_;
    std::vector<std::type_index> published;
    {
        std::lock_guard lock(s.mutex);
        if (s.store.empty() && s.creation_order.empty()) {
            return;
        }

        std::size_t disposed = 0;
        for (auto it = s.creation_order.rbegin(); it != s.creation_order.rend(); ++it) {
            if (s.dispose_one(*it)) ++disposed;
        }
        // Pre-built instances, newest registration first.
        auto remaining = s.store.types();
        for (auto it = remaining.rbegin(); it != remaining.rend(); ++it) {
            if (s.dispose_one(*it)) ++disposed;
        }

        published.swap(s.published);
        s.store.clear();
        s.creation_order.clear();
        s.report = {};
        s.initialized = false;
        logger()->info("Disposed {} component(s)", disposed);
    }

    if (s.container) {
        for (const auto& type : published) {
            s.container->unregister(type);
        }
    }
}

bool registry::is_registered(std::type_index type) const {
    std::lock_guard lock(impl_->mutex);
    return impl_->store.contains(type);
}

std::size_t registry::registered_count() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->store.size();
}

bool registry::is_initialized() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->initialized;
}

initialization_report registry::last_report() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->report;
}

service_container* registry::container() const noexcept {
    return impl_->container;
}

} // namespace librtboot

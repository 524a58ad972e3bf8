#include "librtboot/service_container.hpp"
#include "librtboot/logging.hpp"
#include "stacktrace_utils.hpp"

#include <algorithm>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace librtboot {

// ---------------------------------------------------------------
// Constructor ranking
// ---------------------------------------------------------------

std::vector<const constructor_candidate*>
rank_constructors(const std::vector<constructor_candidate>& candidates) {
    std::vector<const constructor_candidate*> ranked;
    ranked.reserve(candidates.size());
    for (const auto& c : candidates) ranked.push_back(&c);
    std::stable_sort(ranked.begin(), ranked.end(),
        [](const constructor_candidate* a, const constructor_candidate* b) {
            return a->parameters.size() > b->parameters.size();
        });
    return ranked;
}

// ---------------------------------------------------------------
// Statistics
// ---------------------------------------------------------------

double container_statistics::success_rate() const noexcept {
    if (total_resolutions == 0) return 1.0;
    return static_cast<double>(successful_resolutions)
           / static_cast<double>(total_resolutions);
}

std::string container_statistics::report() const {
    std::ostringstream out;
    out << "Services: " << services
        << " (singleton instances: " << singletons
        << ", transient: " << transients
        << ", factory: " << factories << ")\n";
    out << "Resolutions: " << total_resolutions << " total, "
        << successful_resolutions << " succeeded, "
        << failed_resolutions << " failed ("
        << std::fixed << std::setprecision(1) << success_rate() * 100.0 << "%)\n";
    out << "Cache: " << cached_entries << " entries, "
        << cache_hits << " hits, " << cache_misses << " misses\n";
    out << "Discovered: " << discovered;
    for (const auto& [name, count] : resolutions_by_type) {
        out << "\n  " << name << ": " << count;
    }
    return out.str();
}

// ---------------------------------------------------------------
// Impl
// ---------------------------------------------------------------

using registration_event = std::pair<std::type_index, std::shared_ptr<void>>;

struct service_container::impl {
    container_options options;
    std::recursive_mutex mutex;

    // Entries are shared so an in-flight resolution keeps its entry alive
    // when a factory re-registers the same type.
    std::unordered_map<std::type_index, std::shared_ptr<const service_entry>> entries;
    std::vector<std::type_index> order;
    std::unordered_map<std::type_index, std::shared_ptr<void>> singletons;
    std::uint64_t next_sequence = 1;

    resolution_cache cache;
    discovery finder;
    std::vector<std::type_index> resolution_stack;

    std::vector<instance_listener> registered_listeners;
    std::vector<instance_listener> resolved_listeners;
    std::vector<failure_listener> failed_listeners;
    // Registrations made during a resolution (discovery), announced once it
    // finishes.
    std::vector<registration_event> pending_registrations;

    std::uint64_t total = 0;
    std::uint64_t successful = 0;
    std::uint64_t failed = 0;
    std::unordered_map<std::type_index, std::uint64_t> per_type;

    impl(container_options opts, implementation_catalog catalog)
        : options(opts)
        , cache(opts.cache_ttl)
        , finder(std::move(catalog))
    {
        cache.set_enabled(opts.enable_cache);
    }

    std::shared_ptr<const service_entry> find(std::type_index type) const {
        auto it = entries.find(type);
        return it == entries.end() ? nullptr : it->second;
    }

    bool has(std::type_index type) const {
        return entries.contains(type) || singletons.contains(type);
    }

    void insert(service_entry entry) {
        auto type = entry.service_type;
        entry.sequence = next_sequence++;
        if (entry.instance && entry.lifetime == lifetime_kind::singleton) {
            singletons.insert_or_assign(type, entry.instance);
        }
        entries.insert_or_assign(type, std::make_shared<const service_entry>(std::move(entry)));
        order.push_back(type);
    }

    bool remove(std::type_index type) {
        bool existed = entries.erase(type) > 0;
        singletons.erase(type);
        cache.erase(type);
        std::erase(order, type);
        return existed;
    }
};

namespace {

/// Pushes a type onto the resolution stack for the lifetime of the frame.
class resolution_frame {
public:
    resolution_frame(std::vector<std::type_index>& stack, std::type_index type)
        : stack_(stack) { stack_.push_back(type); }
    ~resolution_frame() { stack_.pop_back(); }

    resolution_frame(const resolution_frame&) = delete;
    resolution_frame& operator=(const resolution_frame&) = delete;

private:
    std::vector<std::type_index>& stack_;
};

/// Counts a resolution as failed unless marked successful before it ends.
struct outcome_counter {
    std::uint64_t& successful;
    std::uint64_t& failed;
    bool ok = false;

    ~outcome_counter() { ok ? ++successful : ++failed; }
};

std::string join(const std::vector<std::string>& parts, const char* sep) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

template <typename Listener, typename Arg>
void notify(const std::vector<Listener>& listeners, const char* event,
            std::type_index type, const Arg& arg) {
    for (const auto& listener : listeners) {
        try {
            listener(type, arg);
        } catch (const std::exception& e) {
            logger()->error("{} listener for {} threw: {}",
                            event, internal::demangle(type), e.what());
        } catch (...) {
            logger()->error("{} listener for {} threw an unknown exception",
                            event, internal::demangle(type));
        }
    }
}

} // anonymous namespace

// ---------------------------------------------------------------
// Constructors / Destructor
// ---------------------------------------------------------------

service_container::service_container(container_options options, implementation_catalog catalog)
    : impl_(std::make_unique<impl>(options, std::move(catalog)))
{}

service_container::~service_container() = default;
service_container::service_container(service_container&&) noexcept = default;
service_container& service_container::operator=(service_container&&) noexcept = default;

// ---------------------------------------------------------------
// Registration
// ---------------------------------------------------------------

service_container& service_container::register_service(service_entry entry,
                                                        std::source_location loc) {
    return add_entry(std::move(entry), loc);
}

service_container& service_container::register_service(std::type_index service_type,
                                                        std::type_index implementation_type,
                                                        lifetime_kind lifetime,
                                                        std::shared_ptr<void> instance,
                                                        service_factory factory,
                                                        std::source_location loc) {
    service_entry entry;
    entry.service_type = service_type;
    entry.implementation_type = implementation_type;
    entry.lifetime = lifetime;
    entry.instance = std::move(instance);
    entry.factory = std::move(factory);
    return add_entry(std::move(entry), loc);
}

service_container& service_container::add_entry(service_entry entry, std::source_location loc) {
    const auto type = entry.service_type;
    if (entry.lifetime == lifetime_kind::factory && !entry.factory) {
        throw bootstrap_error("Service " + internal::demangle(type)
                              + " has factory lifetime but no factory", loc);
    }
    if (!entry.factory && !entry.instance && entry.constructors.empty()) {
        throw bootstrap_error("Service " + internal::demangle(type)
                              + " has no instance, factory or constructor", loc);
    }

    entry.registration_location = loc;
    entry.registration_stacktrace = internal::capture_stacktrace();

    std::vector<registration_event> events;
    {
        std::lock_guard lock(impl_->mutex);
        if (impl_->remove(type)) {
            logger()->debug("Replacing registration of {}", internal::demangle(type));
        }
        logger()->debug("Registered {} ({})", internal::demangle(type), to_string(entry.lifetime));
        events.emplace_back(type, entry.instance);
        impl_->insert(std::move(entry));
    }
    notify_registered(std::move(events));
    return *this;
}

void service_container::notify_registered(std::vector<registration_event> events) {
    if (events.empty()) return;
    std::vector<instance_listener> listeners;
    {
        std::lock_guard lock(impl_->mutex);
        listeners = impl_->registered_listeners;
    }
    for (const auto& [type, instance] : events) {
        notify(listeners, "on_registered", type, instance);
    }
}

bool service_container::unregister(std::type_index type) {
    std::lock_guard lock(impl_->mutex);
    return impl_->remove(type);
}

// ---------------------------------------------------------------
// Resolution
// ---------------------------------------------------------------

resolution service_container::resolve_result(std::type_index type) {
    resolution out;
    std::vector<registration_event> registered;
    std::vector<instance_listener> resolved;
    std::vector<failure_listener> failed;
    {
        std::lock_guard lock(impl_->mutex);
        try {
            out.instance = resolve_internal(type);
        } catch (const std::exception& e) {
            out.error = std::current_exception();
            out.message = e.what();
        } catch (...) {
            out.error = std::current_exception();
            out.message = "unknown exception";
        }
        registered.swap(impl_->pending_registrations);
        if (out.error) {
            failed = impl_->failed_listeners;
        } else {
            resolved = impl_->resolved_listeners;
        }
    }

    notify_registered(std::move(registered));
    if (out.error) {
        notify(failed, "on_resolution_failed", type, out.error);
    } else {
        notify(resolved, "on_resolved", type, out.instance);
    }
    return out;
}

std::shared_ptr<void> service_container::resolve(std::type_index type) {
    auto result = resolve_result(type);
    if (result.error) {
        std::rethrow_exception(result.error);
    }
    return result.instance;
}

std::shared_ptr<void> service_container::try_resolve(std::type_index type) {
    auto result = resolve_result(type);
    if (result.error) {
        logger()->debug("try_resolve({}) failed: {}", internal::demangle(type), result.message);
        return nullptr;
    }
    return result.instance;
}

std::shared_ptr<void> service_container::resolve_internal(std::type_index type) {
    auto& s = *impl_;
    ++s.total;
    if (s.options.enable_metrics) ++s.per_type[type];
    outcome_counter counter{s.successful, s.failed};

    if (auto it = s.singletons.find(type); it != s.singletons.end()) {
        counter.ok = true;
        return it->second;
    }

    auto pos = std::find(s.resolution_stack.begin(), s.resolution_stack.end(), type);
    if (pos != s.resolution_stack.end()) {
        std::vector<std::type_index> cycle(pos, s.resolution_stack.end());
        cycle.push_back(type);
        auto path = s.resolution_stack;
        path.push_back(type);
        throw cyclic_dependency(cycle, path);
    }
    resolution_frame frame(s.resolution_stack, type);

    if (auto hit = s.cache.try_get(type)) {
        counter.ok = true;
        return hit;
    }

    auto entry = s.find(type);
    if (!entry) {
        if (s.options.enable_discovery) {
            if (auto found = s.finder.try_discover(type)) {
                service_entry discovered;
                discovered.service_type = type;
                discovered.implementation_type = type;
                discovered.lifetime = lifetime_kind::singleton;
                discovered.instance = found;
                s.insert(std::move(discovered));
                s.pending_registrations.emplace_back(type, found);
                counter.ok = true;
                return found;
            }
            throw unregistered_service(type, "no registration and no discoverable implementation");
        }
        throw unregistered_service(type, "no registration (discovery disabled)");
    }

    std::shared_ptr<void> instance;
    if (entry->factory) {
        try {
            instance = entry->factory(*this);
        } catch (bootstrap_error& e) {
            e.append_resolution_context(internal::demangle(type));
            if (e.diagnostic_detail().empty()) {
                auto trace = internal::format_registration_trace(*entry);
                if (!trace.empty()) e.set_diagnostic_detail(trace);
            }
            throw;
        } catch (const std::exception& e) {
            instance_creation_error ex(type, e);
            ex.set_diagnostic_detail(internal::format_registration_trace(*entry));
            throw ex;
        } catch (...) {
            instance_creation_error ex(type, "factory threw an unknown exception");
            ex.set_diagnostic_detail(internal::format_registration_trace(*entry));
            throw ex;
        }
        if (!instance) {
            throw instance_creation_error(type, "factory returned null");
        }
        // Factory results are never promoted to singletons.
        if (entry->cacheable) s.cache.put(type, instance);
        counter.ok = true;
        return instance;
    }

    instance = entry->instance ? entry->instance : construct(*entry);

    if (entry->lifetime == lifetime_kind::singleton) {
        s.singletons.insert_or_assign(type, instance);
    } else if (entry->cacheable) {
        s.cache.put(type, instance);
    }
    counter.ok = true;
    return instance;
}

std::shared_ptr<void> service_container::construct(const service_entry& entry) {
    const auto type = entry.service_type;
    std::vector<std::string> reasons;

    for (const auto* candidate : rank_constructors(entry.constructors)) {
        std::vector<std::shared_ptr<void>> args;
        args.reserve(candidate->parameters.size());

        bool satisfied = true;
        for (const auto& param : candidate->parameters) {
            try {
                args.push_back(resolve_internal(param));
            } catch (const cyclic_dependency&) {
                throw;
            } catch (const bootstrap_error& e) {
                reasons.push_back(std::to_string(candidate->parameters.size())
                                  + "-argument constructor: " + e.what());
                satisfied = false;
                break;
            }
        }
        if (!satisfied) {
            logger()->debug("{}: falling back from {}-argument constructor",
                            internal::demangle(type), candidate->parameters.size());
            continue;
        }

        std::shared_ptr<void> obj;
        try {
            obj = candidate->invoke(args);
        } catch (const std::exception& e) {
            instance_creation_error ex(type, e);
            ex.set_diagnostic_detail(internal::format_registration_trace(entry));
            throw ex;
        } catch (...) {
            instance_creation_error ex(type, "constructor threw an unknown exception");
            ex.set_diagnostic_detail(internal::format_registration_trace(entry));
            throw ex;
        }
        if (!obj) {
            throw instance_creation_error(type, "constructor returned null");
        }
        return obj;
    }

    instance_creation_error ex(type, reasons.empty()
        ? std::string("no constructor registered")
        : "no constructor could be satisfied (" + join(reasons, "; ") + ")");
    ex.set_diagnostic_detail(internal::format_registration_trace(entry));
    throw ex;
}

// ---------------------------------------------------------------
// Introspection
// ---------------------------------------------------------------

bool service_container::is_registered(std::type_index type) const {
    std::lock_guard lock(impl_->mutex);
    return impl_->has(type);
}

std::vector<std::type_index> service_container::registered_types() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->order;
}

std::size_t service_container::service_count() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->entries.size();
}

std::size_t service_container::singleton_count() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->singletons.size();
}

void service_container::clear() {
    std::lock_guard lock(impl_->mutex);
    auto& s = *impl_;
    s.entries.clear();
    s.order.clear();
    s.singletons.clear();
    s.cache.clear();
    s.finder.clear();
    s.total = s.successful = s.failed = 0;
    s.per_type.clear();
}

container_statistics service_container::statistics() const {
    std::lock_guard lock(impl_->mutex);
    const auto& s = *impl_;

    container_statistics stats;
    stats.services = s.entries.size();
    stats.singletons = s.singletons.size();
    for (const auto& [type, entry] : s.entries) {
        if (entry->factory) {
            ++stats.factories;
        } else if (entry->lifetime == lifetime_kind::transient) {
            ++stats.transients;
        }
    }
    stats.total_resolutions = s.total;
    stats.successful_resolutions = s.successful;
    stats.failed_resolutions = s.failed;
    stats.cache_hits = s.cache.hits();
    stats.cache_misses = s.cache.misses();
    stats.cached_entries = s.cache.size();
    stats.discovered = s.finder.discovered_count();
    for (const auto& [type, count] : s.per_type) {
        stats.resolutions_by_type[internal::demangle(type)] = count;
    }
    return stats;
}

validation_result service_container::verify() const {
    std::lock_guard lock(impl_->mutex);
    const auto& s = *impl_;

    dependency_graph graph;
    for (const auto& type : s.order) {
        const auto& entry = *s.entries.at(type);

        // Edges of the constructor resolution would pick: the longest one
        // whose parameters are all registered, else the longest overall.
        std::vector<std::type_index> deps;
        if (!entry.factory && !entry.instance && !entry.constructors.empty()) {
            auto ranked = rank_constructors(entry.constructors);
            const constructor_candidate* chosen = ranked.front();
            for (const auto* c : ranked) {
                bool all = std::all_of(c->parameters.begin(), c->parameters.end(),
                    [&](std::type_index p) { return s.has(p); });
                if (all) { chosen = c; break; }
            }
            deps = chosen->parameters;
        }
        graph.add_node(graph_node{type, internal::demangle(type), 0, entry.sequence, true},
                       std::move(deps));
    }
    return validate(graph, {.warn_shared_priorities = false,
                            .warn_dependency_unaware = false});
}

// ---------------------------------------------------------------
// Cache and discovery control
// ---------------------------------------------------------------

void service_container::set_caching(bool enabled) {
    std::lock_guard lock(impl_->mutex);
    impl_->options.enable_cache = enabled;
    impl_->cache.set_enabled(enabled);
}

void service_container::set_discovery(bool enabled) {
    std::lock_guard lock(impl_->mutex);
    impl_->options.enable_discovery = enabled;
}

void service_container::clear_cache() {
    std::lock_guard lock(impl_->mutex);
    impl_->cache.clear();
}

std::size_t service_container::sweep_cache() {
    std::lock_guard lock(impl_->mutex);
    return impl_->cache.invalidate_expired();
}

const resolution_cache& service_container::cache() const {
    return impl_->cache;
}

service_container& service_container::add_discoverable(implementation_catalog extra) {
    std::lock_guard lock(impl_->mutex);
    impl_->finder.add_candidates(std::move(extra));
    return *this;
}

const implementation_catalog& service_container::catalog() const {
    return impl_->finder.catalog();
}

// ---------------------------------------------------------------
// Notifications
// ---------------------------------------------------------------

void service_container::on_registered(instance_listener listener) {
    std::lock_guard lock(impl_->mutex);
    impl_->registered_listeners.push_back(std::move(listener));
}

void service_container::on_resolved(instance_listener listener) {
    std::lock_guard lock(impl_->mutex);
    impl_->resolved_listeners.push_back(std::move(listener));
}

void service_container::on_resolution_failed(failure_listener listener) {
    std::lock_guard lock(impl_->mutex);
    impl_->failed_listeners.push_back(std::move(listener));
}

} // namespace librtboot

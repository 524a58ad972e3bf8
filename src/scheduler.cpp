#include "librtboot/scheduler.hpp"
#include "librtboot/dependency_graph.hpp"
#include "librtboot/exceptions.hpp"
#include "librtboot/logging.hpp"
#include "librtboot/registration_store.hpp"
#include "stacktrace_utils.hpp"

#include <algorithm>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace librtboot {

// ---------------------------------------------------------------
// compute_order: Kahn's algorithm with a priority tie-break
// ---------------------------------------------------------------

std::vector<std::type_index> compute_order(const dependency_graph& graph) {
    std::vector<const graph_node*> remaining;
    remaining.reserve(graph.size());
    for (const auto& n : graph.nodes()) {
        remaining.push_back(&n);
    }
    std::stable_sort(remaining.begin(), remaining.end(),
        [](const graph_node* a, const graph_node* b) {
            if (a->priority != b->priority) return a->priority > b->priority;
            return a->sequence < b->sequence;
        });

    std::unordered_set<std::type_index> placed;
    std::vector<std::type_index> order;
    order.reserve(remaining.size());

    auto ready = [&](const graph_node* n) {
        const auto& deps = graph.dependencies_of(n->type);
        return std::all_of(deps.begin(), deps.end(), [&](std::type_index d) {
            return placed.contains(d) || !graph.contains(d);
        });
    };

    while (!remaining.empty()) {
        // Rescan from the top after every placement so a newly unblocked
        // high-priority node goes ahead of lower-priority ones.
        auto it = std::find_if(remaining.begin(), remaining.end(), ready);
        if (it == remaining.end()) {
            std::vector<std::type_index> stuck;
            for (const auto* n : remaining) stuck.push_back(n->type);
            logger()->error("Cannot order {} remaining component(s): {}",
                            stuck.size(), internal::format_type_path(stuck));

            // Every stuck set contains a cycle; report that one.
            auto result = validate(graph, {.warn_shared_priorities = false,
                                           .warn_dependency_unaware = false});
            if (result.has_circular_dependencies) {
                throw cyclic_dependency(graph.canonical_cycle(result.cycle));
            }
            throw cyclic_dependency(stuck);
        }
        placed.insert((*it)->type);
        order.push_back((*it)->type);
        remaining.erase(it);
    }
    return order;
}

// ---------------------------------------------------------------
// initializer
// ---------------------------------------------------------------

namespace {

/// Marks a type as under construction for the lifetime of the frame.
class construction_frame {
public:
    construction_frame(std::vector<std::type_index>& stack, std::type_index type)
        : stack_(stack) { stack_.push_back(type); }
    ~construction_frame() { stack_.pop_back(); }

    construction_frame(const construction_frame&) = delete;
    construction_frame& operator=(const construction_frame&) = delete;

private:
    std::vector<std::type_index>& stack_;
};

std::shared_ptr<void> call_factory(const component_registration& reg, instance_source& src) {
    if (!reg.factory) {
        throw instance_creation_error(reg.component_type, "no factory registered");
    }
    return reg.factory(src);
}

} // anonymous namespace

initializer::initializer(registration_store& store,
                         initialize_options options,
                         construct_fn construct)
    : store_(store)
    , options_(options)
    , construct_(construct ? std::move(construct) : construct_fn(&call_factory))
{}

std::shared_ptr<void> initializer::require(std::type_index type) {
    return ensure(type);
}

void initializer::initialize(const std::vector<std::type_index>& order) {
    for (const auto& type : order) {
        const auto* found = store_.find(type);
        if (!found) {
            throw unregistered_service(type, "it appears in the initialization order");
        }
        if (found->instance) continue;

        if (const auto* blocker = failed_dependency_of(*found)) {
            blocked_.insert(type);
            report_.blocked.push_back(type);
            logger()->warn("Skipping {}: dependency {} failed to initialize",
                           found->name, internal::demangle(*blocker));
            continue;
        }

        if (options_.strict) {
            ensure(type);
            continue;
        }

        try {
            ensure(type);
        } catch (const lifecycle_hook_error&) {
            throw;
        } catch (const cyclic_dependency&) {
            throw;
        } catch (const bootstrap_error& e) {
            record_failure(type, e.what());
            logger()->warn("Continuing without {}", internal::demangle(type));
        } catch (const std::exception& e) {
            record_failure(type, e.what());
            logger()->warn("Continuing without {}", internal::demangle(type));
        }
    }
}

std::shared_ptr<void> initializer::ensure(std::type_index type) {
    const auto* found = store_.find(type);
    if (!found) {
        throw unregistered_service(type);
    }
    if (found->instance) {
        return found->instance;
    }
    if (failed_.contains(type)) {
        throw instance_creation_error(type, "construction failed earlier");
    }
    if (blocked_.contains(type)) {
        throw instance_creation_error(type, "blocked by a failed dependency");
    }

    auto pos = std::find(in_progress_.begin(), in_progress_.end(), type);
    if (pos != in_progress_.end()) {
        std::vector<std::type_index> cycle(pos, in_progress_.end());
        cycle.push_back(type);
        auto path = in_progress_;
        path.push_back(type);
        throw cyclic_dependency(cycle, path);
    }

    // Copy: a factory may register further components and move the store.
    const component_registration reg = *found;
    construction_frame frame(in_progress_, type);

    for (const auto& dep : reg.dependencies) {
        ensure(dep);
    }

    auto instance = construct(reg);
    store_.attach_instance(type, instance);

    try {
        run_hook(reg, reg.on_initialize, "on_initialize", instance.get());
        run_hook(reg, reg.on_dependencies_resolved, "on_dependencies_resolved",
                 instance.get());
    } catch (const lifecycle_hook_error&) {
        store_.detach_instance(type);
        throw;
    }

    report_.initialized.push_back(type);
    logger()->debug("Initialized {} (priority {})", reg.name, reg.priority);
    return instance;
}

std::shared_ptr<void> initializer::construct(const component_registration& reg) {
    std::shared_ptr<void> instance;
    try {
        instance = construct_(reg, *this);
    } catch (cyclic_dependency&) {
        throw;
    } catch (bootstrap_error& e) {
        e.append_resolution_context(reg.name);
        if (e.diagnostic_detail().empty()) {
            auto trace = internal::format_registration_trace(reg);
            if (!trace.empty()) e.set_diagnostic_detail(trace);
        }
        record_failure(reg.component_type, e.what());
        throw;
    } catch (const std::exception& e) {
        instance_creation_error ex(reg.component_type, e);
        ex.set_diagnostic_detail(internal::format_registration_trace(reg));
        record_failure(reg.component_type, ex.what());
        throw ex;
    } catch (...) {
        instance_creation_error ex(reg.component_type, "unknown exception");
        ex.set_diagnostic_detail(internal::format_registration_trace(reg));
        record_failure(reg.component_type, ex.what());
        throw ex;
    }

    if (!instance) {
        instance_creation_error ex(reg.component_type, "factory returned null");
        record_failure(reg.component_type, ex.what());
        throw ex;
    }
    return instance;
}

void initializer::run_hook(const component_registration& reg, const component_hook& hook,
                           const char* hook_name, void* instance) {
    if (!hook) return;
    try {
        hook(instance);
    } catch (const std::exception& e) {
        lifecycle_hook_error ex(reg.component_type, hook_name, e);
        ex.set_diagnostic_detail(internal::format_registration_trace(reg));
        record_failure(reg.component_type, ex.what());
        throw ex;
    } catch (...) {
        lifecycle_hook_error ex(reg.component_type, hook_name, "unknown exception");
        ex.set_diagnostic_detail(internal::format_registration_trace(reg));
        record_failure(reg.component_type, ex.what());
        throw ex;
    }
}

const std::type_index* initializer::failed_dependency_of(const component_registration& reg) const {
    for (const auto& dep : reg.dependencies) {
        if (failed_.contains(dep) || blocked_.contains(dep)) return &dep;
    }
    return nullptr;
}

void initializer::record_failure(std::type_index type, const std::string& message) {
    if (!failed_.insert(type).second) return;
    report_.failed.push_back(type);
    report_.errors.push_back(message);
    logger()->error("Failed to initialize {}: {}", internal::demangle(type), message);
}

} // namespace librtboot

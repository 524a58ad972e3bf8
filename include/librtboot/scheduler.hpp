#pragma once

#include "export.hpp"
#include "registration.hpp"

#include <functional>
#include <memory>
#include <string>
#include <typeindex>
#include <unordered_set>
#include <vector>

namespace librtboot {

class dependency_graph;
class registration_store;

// ---------------------------------------------------------------
// Ordering
// ---------------------------------------------------------------

/// Deterministic initialization order: dependencies first, then higher
/// priority, then earlier registration.  Dependencies that are not nodes
/// are ignored.  Throws cyclic_dependency when no order exists.
LIBRTBOOT_EXPORT std::vector<std::type_index> compute_order(const dependency_graph& graph);

// ---------------------------------------------------------------
// Initialization
// ---------------------------------------------------------------

struct initialize_options {
    /// true: the first construction failure aborts the run.
    /// false: it is logged, and everything depending on it is skipped.
    bool strict = true;
};

struct initialization_report {
    std::vector<std::type_index> initialized;   // creation order
    std::vector<std::type_index> failed;
    std::vector<std::type_index> blocked;       // depends on a failed component
    std::vector<std::string>     errors;

    bool succeeded() const noexcept { return failed.empty() && blocked.empty(); }
};

/// Creates the instances of a registration_store in a given order.  Each
/// component's dependencies are ensured before it is built, then its
/// on_initialize() and on_dependencies_resolved() hooks run.
class LIBRTBOOT_EXPORT initializer : public instance_source {
public:
    using construct_fn = std::function<std::shared_ptr<void>(
        const component_registration&, instance_source&)>;

    /// `construct` defaults to calling the registration's own factory.
    explicit initializer(registration_store& store,
                         initialize_options options = {},
                         construct_fn construct = {});

    void initialize(const std::vector<std::type_index>& order);

    /// Instance for `type`, building it (and its dependencies) if needed.
    std::shared_ptr<void> ensure(std::type_index type);

    std::shared_ptr<void> require(std::type_index type) override;

    const initialization_report& report() const noexcept { return report_; }

private:
    std::shared_ptr<void> construct(const component_registration& reg);
    void run_hook(const component_registration& reg, const component_hook& hook,
                  const char* hook_name, void* instance);
    const std::type_index* failed_dependency_of(const component_registration& reg) const;
    void record_failure(std::type_index type, const std::string& message);

    registration_store& store_;
    initialize_options  options_;
    construct_fn        construct_;

    std::vector<std::type_index>        in_progress_;
    std::unordered_set<std::type_index> failed_;
    std::unordered_set<std::type_index> blocked_;
    initialization_report               report_;
};

} // namespace librtboot

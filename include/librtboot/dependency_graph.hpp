#pragma once

#include "export.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace librtboot {

// ---------------------------------------------------------------
// dependency_graph: derived view over a set of registrations
// ---------------------------------------------------------------

struct graph_node {
    std::type_index type;
    std::string     name;
    int             priority = 0;
    std::uint64_t   sequence = 0;
    bool            dependency_aware = false;
};

class LIBRTBOOT_EXPORT dependency_graph {
public:
    /// Add a node with its direct dependencies (declaration order kept).
    /// Adding an existing type replaces it.
    void add_node(graph_node node, std::vector<std::type_index> dependencies);

    bool contains(std::type_index type) const;
    const graph_node* node(std::type_index type) const;

    /// Nodes in the order they were added.
    const std::vector<graph_node>& nodes() const noexcept { return nodes_; }

    /// Direct dependencies of `type`; empty for unknown types.
    const std::vector<std::type_index>& dependencies_of(std::type_index type) const;

    std::size_t size() const noexcept { return nodes_.size(); }
    bool empty() const noexcept { return nodes_.empty(); }

    /// Display name of `type` (node name if known, demangled otherwise).
    std::string name_of(std::type_index type) const;

    /// Rotate a closed cycle ([X, Y, X]) so it starts at its
    /// earliest-added node, keeping the closing repeat.
    std::vector<std::type_index> canonical_cycle(const std::vector<std::type_index>& cycle) const;

private:
    std::vector<graph_node> nodes_;
    std::unordered_map<std::type_index, std::size_t> index_;
    std::unordered_map<std::type_index, std::vector<std::type_index>> edges_;
};

// ---------------------------------------------------------------
// Validation
// ---------------------------------------------------------------

struct missing_dependency_info {
    std::type_index dependent;
    std::type_index dependency;
};

struct validation_options {
    bool warn_shared_priorities = true;
    bool warn_dependency_unaware = true;
};

struct validation_result {
    bool is_valid = true;

    std::vector<missing_dependency_info> missing_dependencies;
    std::vector<std::string> missing_dependency_messages;

    bool has_circular_dependencies = false;
    std::vector<std::type_index> cycle;
    std::string cycle_description;

    std::vector<std::string> warnings;

    /// One line: "valid" or the error counts plus warning count.
    std::string summary() const;
};

/// Check the graph: all edges point at nodes, no cycles, plus informational
/// warnings.  Every category is collected; nothing is thrown.
LIBRTBOOT_EXPORT validation_result validate(const dependency_graph& graph,
                                            const validation_options& options = {});

// ---------------------------------------------------------------
// Analysis (diagnostic only)
// ---------------------------------------------------------------

enum class complexity_rating {
    low,
    moderate,
    high,
    very_high
};

constexpr std::string_view to_string(complexity_rating rating) noexcept {
    constexpr std::string_view names[] = {"low", "moderate", "high", "very high"};
    return names[static_cast<int>(rating)];
}

struct dependency_analysis {
    std::size_t total_dependencies = 0;
    std::size_t max_per_component = 0;
    double      avg_per_component = 0.0;
    std::size_t longest_chain = 0;
    complexity_rating complexity = complexity_rating::low;
};

LIBRTBOOT_EXPORT dependency_analysis analyze(const dependency_graph& graph);

} // namespace librtboot

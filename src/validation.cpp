#include "librtboot/dependency_graph.hpp"
#include "librtboot/exceptions.hpp"

#include <algorithm>
#include <map>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace librtboot {

// ------------------------------------------------------------------
// dependency_graph
// ------------------------------------------------------------------

void dependency_graph::add_node(graph_node node, std::vector<std::type_index> dependencies) {
    auto type = node.type;
    auto it = index_.find(type);
    if (it != index_.end()) {
        nodes_[it->second] = std::move(node);
    } else {
        index_.emplace(type, nodes_.size());
        nodes_.push_back(std::move(node));
    }
    edges_.insert_or_assign(type, std::move(dependencies));
}

bool dependency_graph::contains(std::type_index type) const {
    return index_.contains(type);
}

const graph_node* dependency_graph::node(std::type_index type) const {
    auto it = index_.find(type);
    if (it == index_.end()) return nullptr;
    return &nodes_[it->second];
}

const std::vector<std::type_index>& dependency_graph::dependencies_of(std::type_index type) const {
    static const std::vector<std::type_index> none;
    auto it = edges_.find(type);
    if (it == edges_.end()) return none;
    return it->second;
}

std::string dependency_graph::name_of(std::type_index type) const {
    const auto* n = node(type);
    if (n && !n->name.empty()) return n->name;
    return internal::demangle(type);
}

std::vector<std::type_index>
dependency_graph::canonical_cycle(const std::vector<std::type_index>& cycle) const {
    if (cycle.size() < 2) return cycle;

    // Drop the closing repeat, rotate, close again.
    std::vector<std::type_index> body(cycle.begin(), cycle.end() - 1);
    auto rank = [this](std::type_index t) {
        const auto* n = node(t);
        return n ? n->sequence : UINT64_MAX;
    };
    auto first = std::min_element(body.begin(), body.end(),
        [&](std::type_index a, std::type_index b) {
            auto ra = rank(a), rb = rank(b);
            if (ra != rb) return ra < rb;
            return a < b;
        });
    std::rotate(body.begin(), first, body.end());
    body.push_back(body.front());
    return body;
}

// ------------------------------------------------------------------
// validation_result
// ------------------------------------------------------------------

std::string validation_result::summary() const {
    std::string out = is_valid ? "valid" : "invalid";
    out += " (missing: " + std::to_string(missing_dependencies.size());
    out += ", cycle: " + std::string(has_circular_dependencies ? "yes" : "no");
    out += ", warnings: " + std::to_string(warnings.size()) + ")";
    return out;
}

namespace {

// ------------------------------------------------------------------
// Every edge target must be a node
// ------------------------------------------------------------------
void check_missing_dependencies(const dependency_graph& graph, validation_result& result) {
    for (const auto& n : graph.nodes()) {
        for (const auto& dep : graph.dependencies_of(n.type)) {
            if (graph.contains(dep)) continue;
            result.missing_dependencies.push_back({n.type, dep});
            result.missing_dependency_messages.push_back(
                graph.name_of(n.type) + " depends on "
                + internal::demangle(dep) + ", which is not registered");
        }
    }
}

// ------------------------------------------------------------------
// Cycle detection (DFS on the component dependency graph)
// ------------------------------------------------------------------
enum class visit_state { unvisited, in_progress, done };

/// Returns true once a cycle has been recorded in `cycle`.
bool dfs(std::type_index current,
         const dependency_graph& graph,
         std::unordered_map<std::type_index, visit_state>& states,
         std::vector<std::type_index>& path,
         std::vector<std::type_index>& cycle) {
    states[current] = visit_state::in_progress;
    path.push_back(current);

    for (const auto& dep : graph.dependencies_of(current)) {
        if (!graph.contains(dep)) continue;  // reported as missing

        auto state = states[dep];
        if (state == visit_state::in_progress) {
            // Cycle runs from where dep first appears through current.
            auto it = std::find(path.begin(), path.end(), dep);
            cycle.assign(it, path.end());
            cycle.push_back(dep);
            return true;
        }
        if (state == visit_state::unvisited
            && dfs(dep, graph, states, path, cycle)) {
            return true;
        }
    }

    path.pop_back();
    states[current] = visit_state::done;
    return false;
}

void check_cycles(const dependency_graph& graph, validation_result& result) {
    std::unordered_map<std::type_index, visit_state> states;
    std::vector<std::type_index> path;
    std::vector<std::type_index> cycle;

    for (const auto& n : graph.nodes()) {
        if (states[n.type] != visit_state::unvisited) continue;
        path.clear();
        if (dfs(n.type, graph, states, path, cycle)) {
            result.has_circular_dependencies = true;
            result.cycle = std::move(cycle);
            std::string description;
            for (std::size_t i = 0; i < result.cycle.size(); ++i) {
                if (i > 0) description += " -> ";
                description += graph.name_of(result.cycle[i]);
            }
            result.cycle_description = std::move(description);
            return;
        }
    }
}

// ------------------------------------------------------------------
// Informational warnings
// ------------------------------------------------------------------
void collect_warnings(const dependency_graph& graph,
                      const validation_options& options,
                      validation_result& result) {
    if (options.warn_shared_priorities) {
        std::map<int, std::vector<const graph_node*>, std::greater<>> by_priority;
        for (const auto& n : graph.nodes()) {
            by_priority[n.priority].push_back(&n);
        }
        for (const auto& [priority, members] : by_priority) {
            if (members.size() < 2) continue;
            std::string msg = "Priority " + std::to_string(priority) + " is shared by "
                              + std::to_string(members.size()) + " components:";
            for (std::size_t i = 0; i < members.size(); ++i) {
                msg += (i == 0 ? " " : ", ") + members[i]->name;
            }
            msg += " (ordered by registration)";
            result.warnings.push_back(std::move(msg));
        }
    }

    if (options.warn_dependency_unaware) {
        for (const auto& n : graph.nodes()) {
            const auto& deps = graph.dependencies_of(n.type);
            if (deps.empty() || n.dependency_aware) continue;
            result.warnings.push_back(
                n.name + " declares " + std::to_string(deps.size())
                + " dependencies but has no on_dependencies_resolved() hook");
        }
    }
}

// ------------------------------------------------------------------
// Longest chain (nodes on the longest dependency path)
// ------------------------------------------------------------------
std::size_t chain_length(std::type_index current,
                         const dependency_graph& graph,
                         std::unordered_map<std::type_index, std::size_t>& memo,
                         std::unordered_set<std::type_index>& on_stack) {
    if (auto it = memo.find(current); it != memo.end()) return it->second;

    on_stack.insert(current);
    std::size_t deepest = 0;
    for (const auto& dep : graph.dependencies_of(current)) {
        if (!graph.contains(dep) || on_stack.contains(dep)) continue;
        deepest = std::max(deepest, chain_length(dep, graph, memo, on_stack));
    }
    on_stack.erase(current);

    memo[current] = deepest + 1;
    return deepest + 1;
}

complexity_rating rate(std::size_t longest_chain, double avg) {
    if (longest_chain <= 2 && avg <= 1.0) return complexity_rating::low;
    if (longest_chain <= 4 && avg <= 2.0) return complexity_rating::moderate;
    if (longest_chain <= 6 && avg <= 3.0) return complexity_rating::high;
    return complexity_rating::very_high;
}

} // anonymous namespace

// ------------------------------------------------------------------
// Public entry points
// ------------------------------------------------------------------

validation_result validate(const dependency_graph& graph, const validation_options& options) {
    validation_result result;

    check_missing_dependencies(graph, result);
    check_cycles(graph, result);
    collect_warnings(graph, options, result);

    result.is_valid = result.missing_dependencies.empty()
                      && !result.has_circular_dependencies;
    return result;
}

dependency_analysis analyze(const dependency_graph& graph) {
    dependency_analysis analysis;
    if (graph.empty()) return analysis;

    std::unordered_map<std::type_index, std::size_t> memo;
    std::unordered_set<std::type_index> on_stack;

    for (const auto& n : graph.nodes()) {
        auto count = graph.dependencies_of(n.type).size();
        analysis.total_dependencies += count;
        analysis.max_per_component = std::max(analysis.max_per_component, count);
        analysis.longest_chain = std::max(analysis.longest_chain,
                                          chain_length(n.type, graph, memo, on_stack));
    }

    analysis.avg_per_component = static_cast<double>(analysis.total_dependencies)
                                 / static_cast<double>(graph.size());
    analysis.complexity = rate(analysis.longest_chain, analysis.avg_per_component);
    return analysis;
}

} // namespace librtboot

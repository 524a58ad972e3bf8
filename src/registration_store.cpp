#include "librtboot/registration_store.hpp"
#include "librtboot/dependency_graph.hpp"

#include <algorithm>
#include <chrono>

namespace librtboot {

bool registration_store::add(component_registration registration) {
    bool replaced = false;
    auto it = index_.find(registration.component_type);
    if (it != index_.end()) {
        entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(it->second));
        replaced = true;
    }

    registration.sequence = next_sequence_++;
    registration.registered_at = std::chrono::steady_clock::now();
    entries_.push_back(std::move(registration));

    if (replaced) {
        reindex();
    } else {
        index_.emplace(entries_.back().component_type, entries_.size() - 1);
    }
    return replaced;
}

bool registration_store::contains(std::type_index type) const {
    return index_.contains(type);
}

const component_registration* registration_store::find(std::type_index type) const {
    auto it = index_.find(type);
    if (it == index_.end()) return nullptr;
    return &entries_[it->second];
}

component_registration* registration_store::find_mutable(std::type_index type) {
    auto it = index_.find(type);
    if (it == index_.end()) return nullptr;
    return &entries_[it->second];
}

void registration_store::attach_instance(std::type_index type, std::shared_ptr<void> instance) {
    if (auto* reg = find_mutable(type)) {
        reg->instance = std::move(instance);
    }
}

void registration_store::detach_instance(std::type_index type) {
    if (auto* reg = find_mutable(type)) {
        reg->instance.reset();
    }
}

std::shared_ptr<void> registration_store::instance_of(std::type_index type) const {
    const auto* reg = find(type);
    return reg ? reg->instance : nullptr;
}

std::vector<std::type_index> registration_store::types() const {
    std::vector<std::type_index> out;
    out.reserve(entries_.size());
    for (const auto& reg : entries_) {
        out.push_back(reg.component_type);
    }
    return out;
}

void registration_store::clear() {
    entries_.clear();
    index_.clear();
}

dependency_graph registration_store::graph() const {
    dependency_graph g;
    for (const auto& reg : entries_) {
        g.add_node(graph_node{reg.component_type, reg.name, reg.priority,
                              reg.sequence, reg.dependency_aware},
                   reg.dependencies);
    }
    return g;
}

void registration_store::reindex() {
    index_.clear();
    for (std::size_t i = 0; i < entries_.size(); ++i) {
        index_.emplace(entries_[i].component_type, i);
    }
}

} // namespace librtboot

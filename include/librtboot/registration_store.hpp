#pragma once

#include "export.hpp"
#include "registration.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace librtboot {

class dependency_graph;

/// Component type → registration metadata, kept in registration order.
/// Holds data only; ordering and validation live elsewhere.
class LIBRTBOOT_EXPORT registration_store {
public:
    /// Insert `registration`, stamping its sequence number and time.  An
    /// earlier registration of the same type is replaced and the new one
    /// goes to the back.  Returns true when something was replaced.
    bool add(component_registration registration);

    bool contains(std::type_index type) const;

    /// nullptr when `type` is not registered.
    const component_registration* find(std::type_index type) const;

    void attach_instance(std::type_index type, std::shared_ptr<void> instance);
    void detach_instance(std::type_index type);
    std::shared_ptr<void> instance_of(std::type_index type) const;

    const std::vector<component_registration>& registrations() const noexcept {
        return entries_;
    }

    std::vector<std::type_index> types() const;
    std::size_t size() const noexcept { return entries_.size(); }
    bool empty() const noexcept { return entries_.empty(); }
    void clear();

    dependency_graph graph() const;

private:
    component_registration* find_mutable(std::type_index type);
    void reindex();

    std::vector<component_registration> entries_;
    std::unordered_map<std::type_index, std::size_t> index_;
    std::uint64_t next_sequence_ = 1;
};

} // namespace librtboot

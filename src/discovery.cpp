#include "librtboot/discovery.hpp"
#include "librtboot/exceptions.hpp"
#include "librtboot/logging.hpp"

#include <utility>

namespace librtboot {

void implementation_catalog::add_candidate(std::type_index interface_type,
                                           std::type_index implementation_type,
                                           create_fn create) {
    if (!create) {
        throw bootstrap_error("Discovery candidate " + internal::demangle(implementation_type)
                              + " for " + internal::demangle(interface_type)
                              + " has no create function");
    }
    candidates_[interface_type].push_back({implementation_type, std::move(create)});
}

const std::vector<implementation_catalog::candidate>&
implementation_catalog::candidates_for(std::type_index interface_type) const {
    static const std::vector<candidate> none;
    auto it = candidates_.find(interface_type);
    if (it == candidates_.end()) return none;
    return it->second;
}

std::vector<std::type_index> implementation_catalog::merge(implementation_catalog other) {
    std::vector<std::type_index> touched;
    for (auto& [type, list] : other.candidates_) {
        auto& mine = candidates_[type];
        for (auto& c : list) mine.push_back(std::move(c));
        touched.push_back(type);
    }
    return touched;
}

std::size_t implementation_catalog::size() const noexcept {
    std::size_t total = 0;
    for (const auto& [type, list] : candidates_) total += list.size();
    return total;
}

discovery::discovery(implementation_catalog catalog)
    : catalog_(std::move(catalog))
{}

std::shared_ptr<void> discovery::try_discover(std::type_index type) {
    if (auto it = outcomes_.find(type); it != outcomes_.end()) {
        return it->second;
    }

    std::shared_ptr<void> found;
    for (const auto& c : catalog_.candidates_for(type)) {
        try {
            found = c.create();
        } catch (const std::exception& e) {
            logger()->debug("Discovery candidate {} for {} threw: {}",
                            internal::demangle(c.implementation_type),
                            internal::demangle(type), e.what());
            continue;
        } catch (...) {
            logger()->debug("Discovery candidate {} for {} threw an unknown exception",
                            internal::demangle(c.implementation_type),
                            internal::demangle(type));
            continue;
        }
        if (found) {
            logger()->info("Discovered {} for {}",
                           internal::demangle(c.implementation_type),
                           internal::demangle(type));
            ++discovered_;
            break;
        }
    }

    if (!found) {
        logger()->debug("No discoverable implementation of {}", internal::demangle(type));
    }
    outcomes_.emplace(type, found);
    return found;
}

void discovery::add_candidates(implementation_catalog extra) {
    for (const auto& type : catalog_.merge(std::move(extra))) {
        outcomes_.erase(type);
    }
}

bool discovery::attempted(std::type_index type) const {
    return outcomes_.contains(type);
}

void discovery::clear() {
    outcomes_.clear();
    discovered_ = 0;
}

} // namespace librtboot

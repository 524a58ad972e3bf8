#pragma once

#include "export.hpp"
#include "type_traits.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <type_traits>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace librtboot {

// ---------------------------------------------------------------
// implementation_catalog: known implementations per abstract type
// ---------------------------------------------------------------

class LIBRTBOOT_EXPORT implementation_catalog {
public:
    /// Returns the new instance as a void pointer addressing the interface.
    using create_fn = std::function<std::shared_ptr<void>()>;

    struct candidate {
        std::type_index implementation_type;
        create_fn       create;
    };

    template <typename TInterface, typename TImpl>
        requires derived_from_base<TImpl, TInterface> && default_constructible<TImpl>
    void add() {
        static_assert(!std::is_abstract_v<TImpl>,
                      "a discoverable implementation must be concrete");
        add_candidate(std::type_index(typeid(TInterface)),
                      std::type_index(typeid(TImpl)),
                      [] {
                          std::shared_ptr<TInterface> obj = std::make_shared<TImpl>();
                          return std::static_pointer_cast<void>(obj);
                      });
    }

    /// Candidates are tried in the order they were added.
    void add_candidate(std::type_index interface_type,
                       std::type_index implementation_type,
                       create_fn create);

    const std::vector<candidate>& candidates_for(std::type_index interface_type) const;

    /// Append every candidate of `other` after this catalog's own; returns
    /// the interface types that gained candidates.
    std::vector<std::type_index> merge(implementation_catalog other);

    std::size_t size() const noexcept;
    bool empty() const noexcept { return candidates_.empty(); }

private:
    std::unordered_map<std::type_index, std::vector<candidate>> candidates_;
};

// ---------------------------------------------------------------
// discovery: best-effort fallback for unregistered types
// ---------------------------------------------------------------

class LIBRTBOOT_EXPORT discovery {
public:
    explicit discovery(implementation_catalog catalog = {});

    /// First candidate for `type` that constructs, or nullptr.  Each type is
    /// attempted once; later calls return the remembered outcome.
    std::shared_ptr<void> try_discover(std::type_index type);

    /// Add candidates and forget the remembered outcome of every interface
    /// they cover.
    void add_candidates(implementation_catalog extra);

    bool attempted(std::type_index type) const;
    std::size_t attempts() const noexcept { return outcomes_.size(); }
    std::size_t discovered_count() const noexcept { return discovered_; }

    /// Forget every remembered outcome.
    void clear();

    implementation_catalog& catalog() noexcept { return catalog_; }
    const implementation_catalog& catalog() const noexcept { return catalog_; }

private:
    implementation_catalog catalog_;
    std::unordered_map<std::type_index, std::shared_ptr<void>> outcomes_;
    std::size_t discovered_ = 0;
};

} // namespace librtboot

#pragma once

#include "export.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <typeindex>
#include <unordered_map>

namespace librtboot {

/// Time-bounded cache of resolved instances, keyed by requested type.
/// Entries older than the TTL count as misses and are evicted on read.
class LIBRTBOOT_EXPORT resolution_cache {
public:
    using clock      = std::chrono::steady_clock;
    using clock_fn   = std::function<clock::time_point()>;

    static constexpr std::chrono::milliseconds default_ttl = std::chrono::seconds(300);

    explicit resolution_cache(std::chrono::milliseconds ttl = default_ttl,
                              clock_fn now = {});

    /// The cached instance, or nullptr on a miss.
    std::shared_ptr<void> try_get(std::type_index type);

    /// Store `instance`.  A no-op while the cache is disabled.
    void put(std::type_index type, std::shared_ptr<void> instance);

    /// Drop every expired entry; returns how many were dropped.
    std::size_t invalidate_expired();

    bool erase(std::type_index type);
    void clear();

    /// Disabling drops all entries.
    void set_enabled(bool enabled);
    bool enabled() const noexcept { return enabled_; }

    std::size_t size() const noexcept { return entries_.size(); }
    std::uint64_t hits() const noexcept { return hits_; }
    std::uint64_t misses() const noexcept { return misses_; }
    std::chrono::milliseconds ttl() const noexcept { return ttl_; }

private:
    struct entry {
        std::shared_ptr<void> instance;
        clock::time_point     created;
    };

    bool expired(const entry& e, clock::time_point now) const;

    std::unordered_map<std::type_index, entry> entries_;
    std::chrono::milliseconds ttl_;
    clock_fn now_;
    bool enabled_ = true;
    std::uint64_t hits_ = 0;
    std::uint64_t misses_ = 0;
};

} // namespace librtboot

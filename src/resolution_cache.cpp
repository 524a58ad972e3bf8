#include "librtboot/resolution_cache.hpp"
#include "librtboot/exceptions.hpp"
#include "librtboot/logging.hpp"

#include <utility>

namespace librtboot {

resolution_cache::resolution_cache(std::chrono::milliseconds ttl, clock_fn now)
    : ttl_(ttl)
    , now_(now ? std::move(now) : clock_fn([] { return clock::now(); }))
{}

bool resolution_cache::expired(const entry& e, clock::time_point now) const {
    return now - e.created > ttl_;
}

std::shared_ptr<void> resolution_cache::try_get(std::type_index type) {
    if (!enabled_) return nullptr;

    auto it = entries_.find(type);
    if (it == entries_.end()) {
        ++misses_;
        return nullptr;
    }
    if (expired(it->second, now_())) {
        logger()->debug("Cache entry for {} expired", internal::demangle(type));
        entries_.erase(it);
        ++misses_;
        return nullptr;
    }
    ++hits_;
    return it->second.instance;
}

void resolution_cache::put(std::type_index type, std::shared_ptr<void> instance) {
    if (!enabled_ || !instance) return;
    entries_.insert_or_assign(type, entry{std::move(instance), now_()});
}

std::size_t resolution_cache::invalidate_expired() {
    auto now = now_();
    std::size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (expired(it->second, now)) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    if (removed > 0) {
        logger()->debug("Evicted {} expired cache entries", removed);
    }
    return removed;
}

bool resolution_cache::erase(std::type_index type) {
    return entries_.erase(type) > 0;
}

void resolution_cache::clear() {
    entries_.clear();
}

void resolution_cache::set_enabled(bool enabled) {
    enabled_ = enabled;
    if (!enabled_) {
        entries_.clear();
    }
}

} // namespace librtboot

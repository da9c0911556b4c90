#include "dsync/cache/response_cache.hpp"

namespace dsync::cache {

ResponseCache::ResponseCache(governor::Clock& clock, governor::Clock::duration ttl)
    : clock_(clock), ttl_(ttl) {}

std::optional<std::any> ResponseCache::get(const std::string& key) {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        ++stats_.misses;
        return std::nullopt;
    }

    if (clock_.now() - it->second.stored_at >= ttl_) {
        entries_.erase(it);
        ++stats_.expirations;
        ++stats_.misses;
        return std::nullopt;
    }

    ++stats_.hits;
    return it->second.value;
}

void ResponseCache::set(const std::string& key, std::any value) {
    std::lock_guard lock(mutex_);
    entries_[key] = Entry{std::move(value), clock_.now()};
}

bool ResponseCache::remove(const std::string& key) {
    std::lock_guard lock(mutex_);
    return entries_.erase(key) > 0;
}

void ResponseCache::clear() {
    std::lock_guard lock(mutex_);
    entries_.clear();
}

std::size_t ResponseCache::size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

ResponseCache::Stats ResponseCache::stats() const {
    std::lock_guard lock(mutex_);
    return stats_;
}

} // namespace dsync::cache

#pragma once

/**
 * @file response_cache.hpp
 * @brief Time-bounded memo of remote query results
 *
 * WHY THIS FILE EXISTS:
 * Enumerating a large tree, validating it and re-running the sync all ask the
 * remote store the same questions. Answers are memoised here for 30 minutes so
 * a repeated enumeration costs no requests at all.
 *
 * DESIGN DECISIONS:
 * - Values are type-erased (std::any); callers read them back with get_as<T>()
 * - Large values (tree snapshots) are stored as shared_ptr<const T> so a hit
 *   never copies them
 * - Expiry is lazy: the get() that finds an expired entry deletes it, there is
 *   no background sweeper
 * - The cache never invalidates itself. Callers that mutate the remote store
 *   remove the keys they know went stale (see cache/keys.hpp)
 *
 * THREAD SAFETY:
 * Every read-modify-write happens under one mutex.
 */

#include "dsync/governor/clock.hpp"

#include <any>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace dsync::cache {

class ResponseCache {
public:
    static constexpr std::chrono::minutes kDefaultTtl{30};

    struct Stats {
        std::uint64_t hits = 0;
        std::uint64_t misses = 0;
        std::uint64_t expirations = 0;
    };

    explicit ResponseCache(governor::Clock& clock,
                           governor::Clock::duration ttl = kDefaultTtl);

    ResponseCache(const ResponseCache&) = delete;
    ResponseCache& operator=(const ResponseCache&) = delete;

    /// Value stored under key, or nullopt when never set or older than the TTL
    std::optional<std::any> get(const std::string& key);

    template<typename T>
    std::optional<T> get_as(const std::string& key) {
        auto value = get(key);
        if (!value) {
            return std::nullopt;
        }
        if (const auto* typed = std::any_cast<T>(&*value)) {
            return *typed;
        }
        return std::nullopt;
    }

    void set(const std::string& key, std::any value);

    /// Returns true when an entry was removed
    bool remove(const std::string& key);

    void clear();

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] Stats stats() const;
    [[nodiscard]] governor::Clock::duration ttl() const noexcept { return ttl_; }

private:
    struct Entry {
        std::any value;
        governor::Clock::time_point stored_at;
    };

    governor::Clock& clock_;
    const governor::Clock::duration ttl_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
    Stats stats_;
};

} // namespace dsync::cache

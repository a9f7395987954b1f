#ifndef CACHENODE_HPP
#define CACHENODE_HPP

#include <chrono>
#include <cstddef>
#include <limits>
#include <optional>

using CacheClock = std::chrono::steady_clock;

// Slot index used for the intrusive links; kNoSlot marks the end of the list.
using Slot = std::size_t;
static constexpr Slot kNoSlot = std::numeric_limits<Slot>::max();

template <typename K, typename V>
struct CacheEntry {
    K key;
    V value;
    std::optional<CacheClock::time_point> expiry; // nullopt: never expires

    // Expired iff an expiry is set and it is not strictly after now.
    bool isExpired(CacheClock::time_point now) const {
        return expiry.has_value() && *expiry <= now;
    }
};

// One arena slot. A slot without an entry is on the free list.
template <typename K, typename V>
struct CacheNode {
    std::optional<CacheEntry<K, V>> entry;
    Slot prev = kNoSlot;
    Slot next = kNoSlot;
};

#endif // CACHENODE_HPP

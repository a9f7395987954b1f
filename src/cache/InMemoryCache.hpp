#ifndef INMEMORYCACHE_HPP
#define INMEMORYCACHE_HPP

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "CacheErrors.hpp"
#include "CacheNode.hpp"
#include "RecencyList.hpp"
#include "../config/AppConfig.hpp"
#include "../core/Reaper.hpp"
#include "../interfaces/CacheInterface.hpp"
#include "../interfaces/ILogger.hpp"
#include "../logging/NullLogger.hpp"

// Bounded LRU cache with optional per-entry TTL, safe for concurrent use.
//
// One mutex covers the index and the recency list for every public call and
// every sweep batch. Expired entries are dropped lazily by get() and
// periodically by a Reaper started in the constructor. A non-positive TTL
// produces an entry that is already expired: the next get() or sweep removes it.
//
// After stop() every operation keeps working; only background expiry ceases.
template <typename K, typename V, typename Hash = std::hash<K>, typename KeyEqual = std::equal_to<K>>
class InMemoryCache : public CacheInterface<K, V> {
public:
    // Throws InvalidCapacity if capacity <= 0, std::invalid_argument if
    // reaper_interval <= 0. A null logger discards all messages.
    // sweep_batch_size bounds how many arena slots one sweep inspects per
    // lock acquisition; 0 sweeps everything at once.
    explicit InMemoryCache(int capacity,
                           std::shared_ptr<ILogger> logger = nullptr,
                           std::chrono::milliseconds reaper_interval = CacheDefaults::REAPER_INTERVAL,
                           std::size_t sweep_batch_size = CacheDefaults::SWEEP_BATCH_SIZE)
        : capacity_(validateCapacity(capacity)),
          sweep_batch_size_(sweep_batch_size),
          logger_(orNullLogger(std::move(logger))) {
        reaper_ = std::make_unique<Reaper>([this]() { return removeExpired(); }, reaper_interval, logger_);
        logger_->setup("InMemoryCache created with capacity " + std::to_string(capacity_));
    }

    ~InMemoryCache() override {
        stop();
    }

    InMemoryCache(const InMemoryCache&) = delete;
    InMemoryCache& operator=(const InMemoryCache&) = delete;
    InMemoryCache(InMemoryCache&&) = delete;
    InMemoryCache& operator=(InMemoryCache&&) = delete;

    int capacity() const override { return capacity_; }

    // Inserts or updates a permanent entry. Updating clears any expiry.
    void add(const K& key, const V& value) override {
        std::lock_guard<std::mutex> lock(mutex_);
        upsert(key, value, std::nullopt);
    }

    // Inserts or updates an entry that expires ttl from now. A ttl too long
    // for the clock saturates to the clock's maximum.
    void addWithTTL(const K& key, const V& value, std::chrono::milliseconds ttl) override {
        std::lock_guard<std::mutex> lock(mutex_);
        upsert(key, value, deadlineAfter(ttl));
    }

    std::optional<V> get(const K& key) override {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = index_.find(key);
        if (it == index_.end()) {
            return std::nullopt;
        }

        const Slot slot = it->second;
        if (order_.entry(slot).isExpired(CacheClock::now())) {
            order_.erase(slot);
            index_.erase(it);
            return std::nullopt;
        }

        order_.moveToFront(slot);
        return order_.entry(slot).value;
    }

    void remove(const K& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(key);
        if (it != index_.end()) {
            order_.erase(it->second);
            index_.erase(it);
        }
    }

    void clear() override {
        std::lock_guard<std::mutex> lock(mutex_);
        index_.clear();
        order_.clear();
    }

    // Stops background expiry. Idempotent.
    void stop() override {
        reaper_->stop();
    }

    bool isReaperRunning() const { return reaper_->isRunning(); }

    // Live entries, including expired ones no sweep has reached yet.
    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return index_.size();
    }

    // True if the key is present and unexpired. Leaves recency untouched.
    bool exists(const K& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(key);
        return it != index_.end() && !order_.entry(it->second).isExpired(CacheClock::now());
    }

    // Keys from most to least recently used, expired-but-unswept included.
    std::vector<K> keys() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<K> result;
        result.reserve(order_.size());
        order_.forEach([&result](const CacheEntry<K, V>& entry) { result.push_back(entry.key); });
        return result;
    }

    // Runs one sweep on the calling thread, honouring the batch size.
    // Returns the number of entries removed.
    std::size_t removeExpired() {
        if (sweep_batch_size_ == 0) {
            std::lock_guard<std::mutex> lock(mutex_);
            return sweepSlots(0, order_.slotCount(), CacheClock::now());
        }

        std::size_t removed = 0;
        Slot begin = 0;
        while (true) {
            std::lock_guard<std::mutex> lock(mutex_);
            // The arena may have grown or been cleared since the last batch
            const std::size_t slot_count = order_.slotCount();
            if (begin >= slot_count) {
                break;
            }
            const Slot end = std::min(begin + sweep_batch_size_, slot_count);
            removed += sweepSlots(begin, end, CacheClock::now());
            begin = end;
        }
        return removed;
    }

private:
    static int validateCapacity(int capacity) {
        if (capacity <= 0) {
            throw InvalidCapacity(capacity);
        }
        return capacity;
    }

    static std::shared_ptr<ILogger> orNullLogger(std::shared_ptr<ILogger> logger) {
        if (logger) {
            return logger;
        }
        return NullLogger::getInstance();
    }

    // now + ttl without overflowing the clock's representation.
    static CacheClock::time_point deadlineAfter(std::chrono::milliseconds ttl) {
        const CacheClock::time_point now = CacheClock::now();
        if (ttl.count() <= 0) {
            return now;
        }
        const auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(CacheClock::time_point::max() - now);
        if (ttl >= headroom) {
            return CacheClock::time_point::max();
        }
        return now + ttl;
    }

    // Caller holds mutex_.
    void upsert(const K& key, const V& value, std::optional<CacheClock::time_point> expiry) {
        auto it = index_.find(key);
        if (it != index_.end()) {
            CacheEntry<K, V>& entry = order_.entry(it->second);
            entry.value = value;
            entry.expiry = expiry;
            order_.moveToFront(it->second);
            return;
        }

        if (index_.size() >= static_cast<std::size_t>(capacity_)) {
            evictLeastRecentlyUsed();
        }
        const Slot slot = order_.pushFront(CacheEntry<K, V>{key, value, expiry});
        index_.emplace(key, slot);
    }

    // Caller holds mutex_.
    void evictLeastRecentlyUsed() {
        const Slot victim = order_.back();
        if (victim == kNoSlot) {
            return;
        }
        index_.erase(order_.entry(victim).key);
        order_.erase(victim);
        if (logger_->getLogLevel() <= LogUtils::LogLevel::DEBUG) {
            logger_->debug("InMemoryCache evicted least recently used entry, size " + std::to_string(index_.size()));
        }
    }

    // Caller holds mutex_.
    std::size_t sweepSlots(Slot begin, Slot end, CacheClock::time_point now) {
        std::size_t removed = 0;
        for (Slot slot = begin; slot < end; ++slot) {
            if (!order_.occupied(slot) || !order_.entry(slot).isExpired(now)) {
                continue;
            }
            index_.erase(order_.entry(slot).key);
            order_.erase(slot);
            ++removed;
        }
        return removed;
    }

    const int capacity_;
    const std::size_t sweep_batch_size_;
    std::shared_ptr<ILogger> logger_;

    mutable std::mutex mutex_;
    std::unordered_map<K, Slot, Hash, KeyEqual> index_; // key -> slot in order_
    RecencyList<K, V> order_;                            // front = most recent

    // Declared last so it is destroyed (and joined) before the data it sweeps
    std::unique_ptr<Reaper> reaper_;
};

#endif // INMEMORYCACHE_HPP

#ifndef CACHEINTERFACE_HPP
#define CACHEINTERFACE_HPP

#include <chrono>
#include <optional>

template <typename K, typename V>
class CacheInterface {
public:
    virtual ~CacheInterface() = default;
    virtual int capacity() const = 0;
    virtual void add(const K& key, const V& value) = 0;
    virtual void addWithTTL(const K& key, const V& value, std::chrono::milliseconds ttl) = 0;
    virtual std::optional<V> get(const K& key) = 0;
    virtual void remove(const K& key) = 0;
    virtual void clear() = 0;
    virtual void stop() = 0;
};

#endif // CACHEINTERFACE_HPP

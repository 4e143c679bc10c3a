#ifndef INMEMORYCACHE_HPP
#define INMEMORYCACHE_HPP

#include <chrono>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "../interfaces/CacheInterface.hpp"

// Process-local response cache with per-entry TTL and LRU eviction.
class InMemoryCache : public CacheInterface {
private:
    using clock = std::chrono::steady_clock;

    struct CacheEntry {
        std::string value;
        clock::time_point expiry;
        std::list<std::string>::iterator lru_position;
    };

    std::unordered_map<std::string, CacheEntry> cache_;
    std::list<std::string> lru_list_; // front = most recently used

    mutable std::mutex mutex_;
    const int default_ttl_seconds_;
    const size_t max_size_;

    // Callers hold mutex_.
    void erase(std::unordered_map<std::string, CacheEntry>::iterator it);
    size_t removeExpired(clock::time_point now);
    void evictIfNeeded(clock::time_point now);

public:
    explicit InMemoryCache(int default_ttl_seconds = 300, size_t max_size = 10000);

    ~InMemoryCache() override = default;

    bool set(const std::string& key, const std::string& value, int ttl = 0) override;
    std::optional<std::string> get(const std::string& key) override;
    bool remove(const std::string& key) override;
    bool clear() override;
    bool exists(const std::string& key) override;

    size_t size() const;
};

#endif // INMEMORYCACHE_HPP

#include "InMemoryCache.hpp"

#include <stdexcept>

InMemoryCache::InMemoryCache(int default_ttl_seconds, size_t max_size)
    : default_ttl_seconds_(default_ttl_seconds), max_size_(max_size) {
    if (default_ttl_seconds_ <= 0) {
        throw std::invalid_argument("InMemoryCache default TTL must be positive");
    }
    if (max_size_ == 0) {
        throw std::invalid_argument("InMemoryCache max size must be positive");
    }
}

bool InMemoryCache::set(const std::string& key, const std::string& value, int ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = clock::now();
    int effective_ttl = (ttl > 0) ? ttl : default_ttl_seconds_;

    auto it = cache_.find(key);
    if (it != cache_.end()) {
        it->second.value = value;
        it->second.expiry = now + std::chrono::seconds(effective_ttl);
        lru_list_.splice(lru_list_.begin(), lru_list_, it->second.lru_position);
        return true;
    }

    evictIfNeeded(now);
    lru_list_.push_front(key);
    cache_.emplace(key, CacheEntry{value, now + std::chrono::seconds(effective_ttl), lru_list_.begin()});
    return true;
}

std::optional<std::string> InMemoryCache::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_.find(key);
    if (it == cache_.end()) {
        return std::nullopt;
    }
    if (it->second.expiry <= clock::now()) {
        erase(it);
        return std::nullopt;
    }
    lru_list_.splice(lru_list_.begin(), lru_list_, it->second.lru_position);
    return it->second.value;
}

bool InMemoryCache::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_.find(key);
    if (it == cache_.end()) {
        return false;
    }
    erase(it);
    return true;
}

bool InMemoryCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.clear();
    lru_list_.clear();
    return true;
}

bool InMemoryCache::exists(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_.find(key);
    if (it == cache_.end()) {
        return false;
    }
    if (it->second.expiry <= clock::now()) {
        erase(it);
        return false;
    }
    return true;
}

size_t InMemoryCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

void InMemoryCache::erase(std::unordered_map<std::string, CacheEntry>::iterator it) {
    lru_list_.erase(it->second.lru_position);
    cache_.erase(it);
}

size_t InMemoryCache::removeExpired(clock::time_point now) {
    size_t removed = 0;
    for (auto it = cache_.begin(); it != cache_.end(); ) {
        if (it->second.expiry <= now) {
            lru_list_.erase(it->second.lru_position);
            it = cache_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

void InMemoryCache::evictIfNeeded(clock::time_point now) {
    if (cache_.size() < max_size_) {
        return;
    }
    // Expired entries go first; only then the least recently used ones.
    removeExpired(now);
    while (cache_.size() >= max_size_ && !lru_list_.empty()) {
        auto oldest = cache_.find(lru_list_.back());
        if (oldest == cache_.end()) {
            lru_list_.pop_back();
            continue;
        }
        erase(oldest);
    }
}

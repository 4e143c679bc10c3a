#include "RateLimiter.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>
#include <vector>

namespace {

// Visitors copied out of the table per shared-lock hold during a sweep.
constexpr size_t kSweepChunkSize = 16;

} // namespace

RateLimiter::RateLimiter(Options options, std::shared_ptr<ILogger> logger)
    : options_(options), logger_(logger) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for RateLimiter");
    }
    if (options_.per_minute <= 0) {
        throw std::invalid_argument("Rate limit per minute must be positive");
    }
    if (options_.burst_capacity < 1) {
        throw std::invalid_argument("Rate limit burst capacity must be at least 1");
    }
    if (options_.cleanup_interval <= std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("Rate limit cleanup interval must be positive");
    }

    if (options_.enable_cleanup) {
        cleanup_thread_ = std::thread(&RateLimiter::cleanupLoop, this);
    }
}

RateLimiter::~RateLimiter() {
    stop();
}

void RateLimiter::stop() {
    {
        std::lock_guard<std::mutex> lock(cleanup_mutex_);
        stopping_ = true;
    }
    cleanup_cv_.notify_all();
    if (cleanup_thread_.joinable()) {
        cleanup_thread_.join();
    }
}

bool RateLimiter::allow(const std::string& key) {
    return allow(key, clock::now());
}

bool RateLimiter::allow(const std::string& key, clock::time_point now) {
    auto visitor = getVisitor(key, now);

    std::lock_guard<std::mutex> lock(visitor->mutex);
    if (now > visitor->last_refill) {
        double elapsed_seconds = std::chrono::duration<double>(now - visitor->last_refill).count();
        visitor->tokens = std::min(static_cast<double>(options_.burst_capacity),
                                   visitor->tokens + elapsed_seconds * (options_.per_minute / 60.0));
        visitor->last_refill = now;
    }

    if (visitor->tokens >= 1.0) {
        visitor->tokens -= 1.0;
        return true;
    }
    return false;
}

std::shared_ptr<RateLimiter::Visitor> RateLimiter::getVisitor(const std::string& key, clock::time_point now) {
    {
        std::shared_lock<std::shared_mutex> lock(visitors_mutex_);
        auto it = visitors_.find(key);
        if (it != visitors_.end()) {
            return it->second;
        }
    }

    std::unique_lock<std::shared_mutex> lock(visitors_mutex_);
    auto [it, inserted] = visitors_.try_emplace(key, nullptr);
    if (inserted) {
        it->second = std::make_shared<Visitor>(static_cast<double>(options_.burst_capacity), now);
    }
    return it->second;
}

size_t RateLimiter::removeIdleVisitors(clock::time_point now) {
    std::vector<std::string> candidates;
    std::vector<std::pair<std::string, std::shared_ptr<Visitor>>> chunk;
    chunk.reserve(kSweepChunkSize);

    // Walks the table bucket by bucket, holding the table lock only while a
    // chunk is copied out. A rehash between chunks may skip or repeat a few
    // visitors; the next sweep picks up what this one missed.
    size_t bucket = 0;
    bool scanned = false;
    while (!scanned) {
        chunk.clear();
        {
            std::shared_lock<std::shared_mutex> lock(visitors_mutex_);
            size_t bucket_count = visitors_.bucket_count();
            while (bucket < bucket_count && chunk.size() < kSweepChunkSize) {
                for (auto it = visitors_.begin(bucket); it != visitors_.end(bucket); ++it) {
                    chunk.emplace_back(it->first, it->second);
                }
                ++bucket;
            }
            scanned = bucket >= bucket_count;
        }

        for (const auto& [key, visitor] : chunk) {
            std::lock_guard<std::mutex> visitor_lock(visitor->mutex);
            if (now - visitor->last_refill > options_.cleanup_interval) {
                candidates.push_back(key);
            }
        }
    }

    size_t removed = 0;
    for (const auto& key : candidates) {
        std::unique_lock<std::shared_mutex> lock(visitors_mutex_);
        auto it = visitors_.find(key);
        if (it == visitors_.end()) {
            continue;
        }
        // The visitor may have been seen again since the scan.
        std::lock_guard<std::mutex> visitor_lock(it->second->mutex);
        if (now - it->second->last_refill > options_.cleanup_interval) {
            visitors_.erase(it);
            ++removed;
        }
    }
    return removed;
}

size_t RateLimiter::visitorCount() const {
    std::shared_lock<std::shared_mutex> lock(visitors_mutex_);
    return visitors_.size();
}

void RateLimiter::cleanupLoop() {
    std::unique_lock<std::mutex> lock(cleanup_mutex_);
    while (!stopping_) {
        if (cleanup_cv_.wait_for(lock, options_.cleanup_interval, [this] { return stopping_; })) {
            break;
        }
        lock.unlock();
        size_t removed = removeIdleVisitors(clock::now());
        if (removed > 0) {
            logger_->debug("Rate limiter removed " + std::to_string(removed) + " idle visitors");
        }
        lock.lock();
    }
}

EndpointRateLimiterRegistry::EndpointRateLimiterRegistry(RateLimiter::Options default_options,
                                                         std::shared_ptr<ILogger> logger)
    : default_options_(default_options), logger_(logger) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for EndpointRateLimiterRegistry");
    }
    default_limiter_ = std::make_unique<RateLimiter>(default_options_, logger_);
}

void EndpointRateLimiterRegistry::addEndpoint(const std::string& path_prefix, double per_minute, int burst_capacity) {
    if (path_prefix.empty()) {
        throw std::invalid_argument("Rate limit override prefix cannot be empty");
    }
    RateLimiter::Options options = default_options_;
    options.per_minute = per_minute;
    options.burst_capacity = burst_capacity;
    auto limiter = std::make_unique<RateLimiter>(options, logger_);

    std::unique_lock<std::shared_mutex> lock(mutex_);
    // Limiters handed out by limiterFor() must stay valid, so a prefix is registered once.
    if (!overrides_.emplace(path_prefix, std::move(limiter)).second) {
        throw std::invalid_argument("Rate limit override already registered for prefix: " + path_prefix);
    }
}

RateLimiter& EndpointRateLimiterRegistry::limiterFor(const std::string& path) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    RateLimiter* best = nullptr;
    size_t best_length = 0;
    for (const auto& [prefix, limiter] : overrides_) {
        if (prefix.size() >= best_length && prefixMatches(prefix, path)) {
            best = limiter.get();
            best_length = prefix.size();
        }
    }
    return best ? *best : *default_limiter_;
}

void EndpointRateLimiterRegistry::stop() {
    default_limiter_->stop();
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (auto& [prefix, limiter] : overrides_) {
        limiter->stop();
    }
}

bool EndpointRateLimiterRegistry::prefixMatches(const std::string& prefix, const std::string& path) {
    if (prefix.empty() || path.compare(0, prefix.size(), prefix) != 0) {
        return false;
    }
    return path.size() == prefix.size() || prefix.back() == '/' || path[prefix.size()] == '/';
}

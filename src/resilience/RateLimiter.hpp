#ifndef RATELIMITER_HPP
#define RATELIMITER_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>

#include "../interfaces/ILogger.hpp"

// Token bucket admission control keyed by client identity. Each client
// starts with a full bucket of `burst_capacity` tokens that refills at
// `per_minute / 60` tokens per second.
class RateLimiter {
public:
    using clock = std::chrono::steady_clock;

    struct Options {
        double per_minute = 100;
        int burst_capacity = 20;
        // Sweep period; visitors idle for longer are dropped.
        std::chrono::milliseconds cleanup_interval = std::chrono::minutes(5);
        bool enable_cleanup = true;
    };

    RateLimiter(Options options, std::shared_ptr<ILogger> logger);
    ~RateLimiter();

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    bool allow(const std::string& key);
    bool allow(const std::string& key, clock::time_point now);

    // Drops visitors idle for longer than the cleanup interval. Returns the number removed.
    size_t removeIdleVisitors(clock::time_point now);

    // Stops the sweep thread. Idempotent.
    void stop();

    size_t visitorCount() const;
    const Options& options() const { return options_; }

private:
    struct Visitor {
        explicit Visitor(double tokens, clock::time_point now) : tokens(tokens), last_refill(now) {}

        std::mutex mutex;
        double tokens;
        clock::time_point last_refill;
    };

    std::shared_ptr<Visitor> getVisitor(const std::string& key, clock::time_point now);
    void cleanupLoop();

    Options options_;
    std::shared_ptr<ILogger> logger_;

    mutable std::shared_mutex visitors_mutex_;
    std::unordered_map<std::string, std::shared_ptr<Visitor>> visitors_;

    std::mutex cleanup_mutex_;
    std::condition_variable cleanup_cv_;
    bool stopping_ = false;
    std::thread cleanup_thread_;
};

// Default limiter plus overrides keyed by path prefix. The longest
// registered prefix that matches the request path wins.
class EndpointRateLimiterRegistry {
public:
    EndpointRateLimiterRegistry(RateLimiter::Options default_options, std::shared_ptr<ILogger> logger);

    // Throws std::invalid_argument if `path_prefix` is already registered.
    void addEndpoint(const std::string& path_prefix, double per_minute, int burst_capacity);

    RateLimiter& limiterFor(const std::string& path);
    RateLimiter& defaultLimiter() { return *default_limiter_; }

    void stop();

private:
    static bool prefixMatches(const std::string& prefix, const std::string& path);

    RateLimiter::Options default_options_;
    std::shared_ptr<ILogger> logger_;
    std::unique_ptr<RateLimiter> default_limiter_;

    mutable std::shared_mutex mutex_;
    std::map<std::string, std::unique_ptr<RateLimiter>> overrides_;
};

#endif // RATELIMITER_HPP

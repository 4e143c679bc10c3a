#ifndef CIRCUITBREAKER_HPP
#define CIRCUITBREAKER_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "../interfaces/ILogger.hpp"
#include "../models/GatewayError.hpp"

enum class BreakerState {
    Closed,
    Open,
    HalfOpen
};

std::string to_string(BreakerState state);

// Counters scoped to the breaker's current generation.
struct BreakerCounts {
    uint32_t requests = 0;
    uint32_t totalSuccesses = 0;
    uint32_t totalFailures = 0;
    uint32_t consecutiveSuccesses = 0;
    uint32_t consecutiveFailures = 0;

    void onRequest() { ++requests; }

    void onSuccess() {
        ++totalSuccesses;
        ++consecutiveSuccesses;
        consecutiveFailures = 0;
    }

    void onFailure() {
        ++totalFailures;
        ++consecutiveFailures;
        consecutiveSuccesses = 0;
    }

    void clear() { *this = BreakerCounts{}; }
};

using StateChangeCallback = std::function<void(const std::string& name, BreakerState from, BreakerState to)>;

// Zero values fall back to: 1 probe, 60s window, 60s open timeout,
// 5 requests minimum, 0.5 failure rate.
struct CircuitBreakerSettings {
    uint32_t maxHalfOpenProbes = 0;
    std::chrono::milliseconds closedWindowDuration{0};
    std::chrono::milliseconds openTimeout{0};
    uint32_t minRequestThreshold = 0;
    double failureRateThreshold = 0.0;
    StateChangeCallback onStateChange;

    // Settings the dispatcher uses for every backend service unless configured otherwise.
    static CircuitBreakerSettings gatewayDefaults() {
        CircuitBreakerSettings settings;
        settings.maxHalfOpenProbes = 3;
        settings.closedWindowDuration = std::chrono::seconds(60);
        settings.openTimeout = std::chrono::seconds(30);
        settings.minRequestThreshold = 5;
        settings.failureRateThreshold = 0.5;
        return settings;
    }
};

class CircuitBreaker {
public:
    using clock = std::chrono::steady_clock;
    using Call = std::function<std::optional<GatewayError>()>;

    CircuitBreaker(std::string name, CircuitBreakerSettings settings, std::shared_ptr<ILogger> logger);

    // Runs `fn` if the breaker admits the call and records its outcome.
    // Rejections come back as CircuitOpen or ProbeLimitExceeded without
    // invoking `fn`. An exception thrown by `fn` counts as a failure and
    // is rethrown.
    std::optional<GatewayError> execute(const Call& fn);

    BreakerState state();
    BreakerCounts counts();
    uint64_t generation();
    const std::string& name() const { return name_; }

    // Forces Closed with a fresh generation. Observers are not notified.
    void reset();

    std::string to_string();

private:
    using Transition = std::pair<BreakerState, BreakerState>;

    std::optional<GatewayError> beforeRequest(uint64_t& generation);
    void afterRequest(uint64_t generation, bool success);

    // Callers hold mutex_.
    BreakerState currentState(clock::time_point now, std::vector<Transition>& transitions);
    void onSuccess(BreakerState state, clock::time_point now, std::vector<Transition>& transitions);
    void onFailure(BreakerState state, clock::time_point now, std::vector<Transition>& transitions);
    bool readyToTrip() const;
    void setState(BreakerState state, clock::time_point now, std::vector<Transition>& transitions);
    void toNewGeneration(clock::time_point now);

    // Called without mutex_ held.
    void notify(const std::vector<Transition>& transitions);

    std::string name_;
    CircuitBreakerSettings settings_;
    std::shared_ptr<ILogger> logger_;

    std::mutex mutex_;
    BreakerState state_ = BreakerState::Closed;
    uint64_t generation_ = 0;
    BreakerCounts counts_;
    std::optional<clock::time_point> expiry_;
};

#endif // CIRCUITBREAKER_HPP

#include "CircuitBreaker.hpp"

#include <sstream>
#include <stdexcept>

std::string to_string(BreakerState state) {
    switch (state) {
        case BreakerState::Closed:
            return "closed";
        case BreakerState::Open:
            return "open";
        case BreakerState::HalfOpen:
            return "half-open";
    }
    return "unknown";
}

CircuitBreaker::CircuitBreaker(std::string name, CircuitBreakerSettings settings, std::shared_ptr<ILogger> logger)
    : name_(std::move(name)), settings_(std::move(settings)), logger_(logger) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for CircuitBreaker");
    }
    if (settings_.failureRateThreshold < 0.0 || settings_.failureRateThreshold > 1.0) {
        throw std::invalid_argument("Circuit breaker failure rate must be within [0, 1]");
    }

    if (settings_.maxHalfOpenProbes == 0) {
        settings_.maxHalfOpenProbes = 1;
    }
    if (settings_.closedWindowDuration <= std::chrono::milliseconds::zero()) {
        settings_.closedWindowDuration = std::chrono::seconds(60);
    }
    if (settings_.openTimeout <= std::chrono::milliseconds::zero()) {
        settings_.openTimeout = std::chrono::seconds(60);
    }
    if (settings_.minRequestThreshold == 0) {
        settings_.minRequestThreshold = 5;
    }
    if (settings_.failureRateThreshold == 0.0) {
        settings_.failureRateThreshold = 0.5;
    }

    toNewGeneration(clock::now());
}

std::optional<GatewayError> CircuitBreaker::execute(const Call& fn) {
    uint64_t generation = 0;
    if (auto rejection = beforeRequest(generation)) {
        return rejection;
    }

    std::optional<GatewayError> result;
    try {
        result = fn();
    } catch (...) {
        afterRequest(generation, false);
        throw;
    }

    afterRequest(generation, !result.has_value());
    return result;
}

BreakerState CircuitBreaker::state() {
    std::vector<Transition> transitions;
    BreakerState state;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state = currentState(clock::now(), transitions);
    }
    notify(transitions);
    return state;
}

BreakerCounts CircuitBreaker::counts() {
    std::vector<Transition> transitions;
    BreakerCounts counts;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        currentState(clock::now(), transitions);
        counts = counts_;
    }
    notify(transitions);
    return counts;
}

uint64_t CircuitBreaker::generation() {
    std::vector<Transition> transitions;
    uint64_t generation;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        currentState(clock::now(), transitions);
        generation = generation_;
    }
    notify(transitions);
    return generation;
}

void CircuitBreaker::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = BreakerState::Closed;
    toNewGeneration(clock::now());
}

std::string CircuitBreaker::to_string() {
    BreakerState state = this->state();
    BreakerCounts counts = this->counts();
    std::stringstream ss;
    ss << "CircuitBreaker[name=" << name_
       << ", state=" << ::to_string(state)
       << ", requests=" << counts.requests
       << ", failures=" << counts.totalFailures
       << ", successes=" << counts.totalSuccesses << "]";
    return ss.str();
}

std::optional<GatewayError> CircuitBreaker::beforeRequest(uint64_t& generation) {
    std::vector<Transition> transitions;
    std::optional<GatewayError> rejection;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        BreakerState state = currentState(clock::now(), transitions);

        if (state == BreakerState::Open) {
            rejection = GatewayError(GatewayErrc::CircuitOpen, "circuit breaker '" + name_ + "' is open");
        } else if (state == BreakerState::HalfOpen && counts_.requests >= settings_.maxHalfOpenProbes) {
            rejection = GatewayError(GatewayErrc::ProbeLimitExceeded,
                                     "circuit breaker '" + name_ + "' has too many probe requests");
        } else {
            counts_.onRequest();
            generation = generation_;
        }
    }
    notify(transitions);
    return rejection;
}

void CircuitBreaker::afterRequest(uint64_t generation, bool success) {
    std::vector<Transition> transitions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = clock::now();
        BreakerState state = currentState(now, transitions);

        // Result from a previous generation.
        if (generation == generation_) {
            if (success) {
                onSuccess(state, now, transitions);
            } else {
                onFailure(state, now, transitions);
            }
        }
    }
    notify(transitions);
}

BreakerState CircuitBreaker::currentState(clock::time_point now, std::vector<Transition>& transitions) {
    switch (state_) {
        case BreakerState::Closed:
            if (expiry_ && *expiry_ <= now) {
                toNewGeneration(now);
            }
            break;
        case BreakerState::Open:
            if (expiry_ && *expiry_ <= now) {
                setState(BreakerState::HalfOpen, now, transitions);
            }
            break;
        case BreakerState::HalfOpen:
            break;
    }
    return state_;
}

void CircuitBreaker::onSuccess(BreakerState state, clock::time_point now, std::vector<Transition>& transitions) {
    switch (state) {
        case BreakerState::Closed:
            counts_.onSuccess();
            break;
        case BreakerState::HalfOpen:
            counts_.onSuccess();
            if (counts_.consecutiveSuccesses >= settings_.maxHalfOpenProbes) {
                setState(BreakerState::Closed, now, transitions);
            }
            break;
        case BreakerState::Open:
            break;
    }
}

void CircuitBreaker::onFailure(BreakerState state, clock::time_point now, std::vector<Transition>& transitions) {
    switch (state) {
        case BreakerState::Closed:
            counts_.onFailure();
            if (readyToTrip()) {
                setState(BreakerState::Open, now, transitions);
            }
            break;
        case BreakerState::HalfOpen:
            // Any failed probe reopens, whatever the other probes report.
            setState(BreakerState::Open, now, transitions);
            break;
        case BreakerState::Open:
            break;
    }
}

bool CircuitBreaker::readyToTrip() const {
    if (counts_.requests < settings_.minRequestThreshold) {
        return false;
    }
    double failure_rate = static_cast<double>(counts_.totalFailures) / static_cast<double>(counts_.requests);
    return failure_rate >= settings_.failureRateThreshold;
}

void CircuitBreaker::setState(BreakerState state, clock::time_point now, std::vector<Transition>& transitions) {
    if (state_ == state) {
        return;
    }
    BreakerState previous = state_;
    state_ = state;
    toNewGeneration(now);
    transitions.emplace_back(previous, state);
}

void CircuitBreaker::toNewGeneration(clock::time_point now) {
    ++generation_;
    counts_.clear();

    switch (state_) {
        case BreakerState::Closed:
            expiry_ = now + settings_.closedWindowDuration;
            break;
        case BreakerState::Open:
            expiry_ = now + settings_.openTimeout;
            break;
        case BreakerState::HalfOpen:
            expiry_.reset();
            break;
    }
}

void CircuitBreaker::notify(const std::vector<Transition>& transitions) {
    for (const auto& [from, to] : transitions) {
        if (to == BreakerState::Open) {
            logger_->warn("Circuit breaker '" + name_ + "' changed from " + ::to_string(from) + " to " + ::to_string(to));
        } else {
            logger_->info("Circuit breaker '" + name_ + "' changed from " + ::to_string(from) + " to " + ::to_string(to));
        }
        if (settings_.onStateChange) {
            settings_.onStateChange(name_, from, to);
        }
    }
}

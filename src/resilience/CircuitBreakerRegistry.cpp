#include "CircuitBreakerRegistry.hpp"

#include <mutex>
#include <stdexcept>

#include "../config/AppConfig.hpp" // For MetricsDefinitions

CircuitBreakerRegistry::CircuitBreakerRegistry(CircuitBreakerSettings settings,
                                               std::shared_ptr<ILogger> logger,
                                               std::shared_ptr<IStatsDClient> statsd_client)
    : settings_(std::move(settings)), logger_(logger), statsd_client_(statsd_client) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for CircuitBreakerRegistry");
    }
    if (!statsd_client_) {
        throw std::invalid_argument("StatsDClient cannot be null for CircuitBreakerRegistry");
    }
}

std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::getOrCreate(const std::string& service_name) {
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = breakers_.find(service_name);
        if (it != breakers_.end()) {
            return it->second;
        }
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = breakers_.find(service_name);
    if (it != breakers_.end()) {
        return it->second;
    }

    CircuitBreakerSettings settings = settings_;
    auto statsd_client = statsd_client_;
    StateChangeCallback user_callback = settings_.onStateChange;
    settings.onStateChange = [statsd_client, user_callback](const std::string& name, BreakerState from, BreakerState to) {
        statsd_client->increment(MetricsDefinitions::BREAKER_TRANSITION);
        if (user_callback) {
            user_callback(name, from, to);
        }
    };

    auto breaker = std::make_shared<CircuitBreaker>(service_name, std::move(settings), logger_);
    breakers_.emplace(service_name, breaker);
    logger_->debug("Created circuit breaker for service: " + service_name);
    return breaker;
}

std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::find(const std::string& service_name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = breakers_.find(service_name);
    return it != breakers_.end() ? it->second : nullptr;
}

std::vector<std::shared_ptr<CircuitBreaker>> CircuitBreakerRegistry::breakers() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::shared_ptr<CircuitBreaker>> result;
    result.reserve(breakers_.size());
    for (const auto& [name, breaker] : breakers_) {
        result.push_back(breaker);
    }
    return result;
}

size_t CircuitBreakerRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return breakers_.size();
}

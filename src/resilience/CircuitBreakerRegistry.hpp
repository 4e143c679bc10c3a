#ifndef CIRCUITBREAKERREGISTRY_HPP
#define CIRCUITBREAKERREGISTRY_HPP

#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"
#include "CircuitBreaker.hpp"

// One breaker per backend service, created on first use.
class CircuitBreakerRegistry {
public:
    CircuitBreakerRegistry(CircuitBreakerSettings settings,
                           std::shared_ptr<ILogger> logger,
                           std::shared_ptr<IStatsDClient> statsd_client);

    std::shared_ptr<CircuitBreaker> getOrCreate(const std::string& service_name);

    // nullptr if no breaker exists for the service yet.
    std::shared_ptr<CircuitBreaker> find(const std::string& service_name) const;

    std::vector<std::shared_ptr<CircuitBreaker>> breakers() const;

    size_t size() const;

private:
    CircuitBreakerSettings settings_;
    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<IStatsDClient> statsd_client_;

    mutable std::shared_mutex mutex_;
    std::map<std::string, std::shared_ptr<CircuitBreaker>> breakers_;
};

#endif // CIRCUITBREAKERREGISTRY_HPP

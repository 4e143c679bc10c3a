#include "RetryExecutor.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <string>

namespace {

constexpr double kJitterFraction = 0.05;

std::mt19937& jitterEngine() {
    thread_local std::mt19937 engine{std::random_device{}()};
    return engine;
}

GatewayError cancelledError(int attempts) {
    return GatewayError(GatewayErrc::Cancelled,
                        "retry cancelled after " + std::to_string(attempts) + " attempt(s)");
}

} // namespace

std::optional<GatewayError> RetryExecutor::retry(Deadline& deadline, const RetryPolicy& policy,
                                                 const Attempt& fn) const {
    int attempts = 0;
    return run(deadline, policy, fn, attempts);
}

std::chrono::microseconds RetryExecutor::computeBackoffDelay(int attempt, const RetryPolicy& policy) {
    auto initial_us = std::chrono::duration_cast<std::chrono::microseconds>(policy.initialDelay).count();
    auto max_us = std::chrono::duration_cast<std::chrono::microseconds>(policy.maxDelay).count();

    double delay = static_cast<double>(initial_us) * std::pow(policy.multiplier, std::max(0, attempt - 1));
    if (delay > static_cast<double>(max_us) || std::isinf(delay)) {
        delay = static_cast<double>(max_us);
    }
    return std::chrono::microseconds(static_cast<long long>(delay));
}

std::chrono::microseconds RetryExecutor::applyJitter(std::chrono::microseconds delay) {
    std::uniform_real_distribution<double> dist(-kJitterFraction, kJitterFraction);
    double base = static_cast<double>(delay.count());
    double jittered = base + base * dist(jitterEngine());
    return std::chrono::microseconds(static_cast<long long>(std::max(0.0, jittered)));
}

std::optional<GatewayError> RetryExecutor::run(Deadline& deadline, const RetryPolicy& policy, const Attempt& fn,
                                               int& attempts) const {
    policy.validate();

    std::optional<GatewayError> last_error;
    for (int attempt = 1; attempt <= policy.maxAttempts; ++attempt) {
        if (deadline.expired()) {
            return cancelledError(attempts);
        }

        ++attempts;
        last_error = fn();
        if (!last_error) {
            return std::nullopt;
        }

        if (!policy.isRetryable(*last_error)) {
            return last_error;
        }

        if (attempt == policy.maxAttempts) {
            break;
        }

        auto delay = computeBackoffDelay(attempt, policy);
        if (policy.jitterEnabled) {
            delay = applyJitter(delay);
        }

        logger_->warn("Attempt " + std::to_string(attempt) + "/" + std::to_string(policy.maxAttempts) +
                      " failed: " + last_error->to_string() + ". Retrying in " +
                      std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(delay).count()) + "ms");

        if (!deadline.sleepFor(delay)) {
            return cancelledError(attempts);
        }
    }

    return GatewayError::retryExhausted(attempts, *last_error);
}

#ifndef RETRYEXECUTOR_HPP
#define RETRYEXECUTOR_HPP

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>

#include "../interfaces/ILogger.hpp"
#include "../models/GatewayError.hpp"
#include "Deadline.hpp"
#include "RetryPolicy.hpp"

template <typename T>
struct RetryOutcome {
    std::optional<T> value;
    std::optional<GatewayError> error;
    int attempts = 0;

    bool ok() const { return !error.has_value(); }
};

class RetryExecutor {
public:
    using Attempt = std::function<std::optional<GatewayError>()>;

    explicit RetryExecutor(std::shared_ptr<ILogger> logger) : logger_(logger) {
        if (!logger_) {
            throw std::invalid_argument("Logger cannot be null for RetryExecutor");
        }
    }

    // Runs `fn` until it succeeds, fails with a non-retryable error, the
    // attempts run out or the deadline fires.
    std::optional<GatewayError> retry(Deadline& deadline, const RetryPolicy& policy, const Attempt& fn) const;

    template <typename T>
    RetryOutcome<T> retryWithResult(Deadline& deadline, const RetryPolicy& policy,
                                    const std::function<RetryOutcome<T>()>& fn) const {
        RetryOutcome<T> outcome;
        outcome.error = run(deadline, policy, [&]() -> std::optional<GatewayError> {
            RetryOutcome<T> attempt = fn();
            if (attempt.error) {
                return attempt.error;
            }
            outcome.value = std::move(attempt.value);
            return std::nullopt;
        }, outcome.attempts);
        if (outcome.error) {
            outcome.value.reset();
        }
        return outcome;
    }

    // Delay before the attempt following `attempt` (1-based), without jitter.
    static std::chrono::microseconds computeBackoffDelay(int attempt, const RetryPolicy& policy);

    // Spreads `delay` uniformly over +/-5%.
    static std::chrono::microseconds applyJitter(std::chrono::microseconds delay);

private:
    std::optional<GatewayError> run(Deadline& deadline, const RetryPolicy& policy, const Attempt& fn,
                                    int& attempts) const;

    std::shared_ptr<ILogger> logger_;
};

#endif // RETRYEXECUTOR_HPP

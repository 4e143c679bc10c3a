#ifndef RETRYPOLICY_HPP
#define RETRYPOLICY_HPP

#include <algorithm>
#include <chrono>
#include <functional>
#include <stdexcept>
#include <vector>

#include "../models/GatewayError.hpp"

struct RetryPolicy {
    int maxAttempts = 3;
    std::chrono::milliseconds initialDelay{100};
    std::chrono::milliseconds maxDelay{10000};
    double multiplier = 2.0;
    bool jitterEnabled = true;

    // Allow-list of retryable kinds. Empty means every error is retryable.
    std::vector<GatewayErrc> retryableErrors;

    // Overrides the allow-list when set.
    std::function<bool(const GatewayError&)> retryablePredicate;

    static RetryPolicy defaults() {
        return RetryPolicy{};
    }

    bool isRetryable(const GatewayError& error) const {
        if (error.is(GatewayErrc::Cancelled)) {
            return false;
        }
        if (retryablePredicate) {
            return retryablePredicate(error);
        }
        if (retryableErrors.empty()) {
            return true;
        }
        return std::find(retryableErrors.begin(), retryableErrors.end(), error.code()) != retryableErrors.end();
    }

    void validate() const {
        if (maxAttempts < 1) {
            throw std::invalid_argument("Retry policy maxAttempts must be >= 1");
        }
        if (initialDelay < std::chrono::milliseconds::zero() || maxDelay < std::chrono::milliseconds::zero()) {
            throw std::invalid_argument("Retry policy delays must be >= 0");
        }
        if (maxDelay < initialDelay) {
            throw std::invalid_argument("Retry policy maxDelay must be >= initialDelay");
        }
        if (multiplier < 1.0) {
            throw std::invalid_argument("Retry policy multiplier must be >= 1.0");
        }
    }
};

// HTTP statuses worth another attempt: request timeout, rate limited, and server errors.
inline bool isRetryableHttpStatus(int status_code) {
    return status_code == 408 || status_code == 429 || (status_code >= 500 && status_code <= 599);
}

#endif // RETRYPOLICY_HPP

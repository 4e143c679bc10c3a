#include "GatewayError.hpp"

#include <sstream>

namespace {

class GatewayErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "gateway";
    }

    std::string message(int ev) const override {
        switch (static_cast<GatewayErrc>(ev)) {
            case GatewayErrc::AdmissionDenied:
                return "rate limit exceeded";
            case GatewayErrc::CircuitOpen:
                return "circuit breaker is open";
            case GatewayErrc::ProbeLimitExceeded:
                return "too many probe requests";
            case GatewayErrc::DiscoveryFailed:
                return "service discovery failed";
            case GatewayErrc::TransportFailed:
                return "transport failed";
            case GatewayErrc::RetryableBackendStatus:
                return "retryable backend status";
            case GatewayErrc::TerminalBackendStatus:
                return "terminal backend status";
            case GatewayErrc::RetryExhausted:
                return "max retry attempts exceeded";
            case GatewayErrc::CacheWriteFailed:
                return "cache write failed";
            case GatewayErrc::Cancelled:
                return "request cancelled";
        }
        return "unknown gateway error";
    }
};

} // namespace

const std::error_category& gateway_category() noexcept {
    static GatewayErrorCategory category;
    return category;
}

std::error_code make_error_code(GatewayErrc e) noexcept {
    return {static_cast<int>(e), gateway_category()};
}

GatewayError GatewayError::backendStatus(GatewayErrc code, int status_code, std::string message) {
    GatewayError error(code, std::move(message));
    error.status_code_ = status_code;
    return error;
}

GatewayError GatewayError::retryExhausted(int attempts, const GatewayError& last_error) {
    GatewayError error(GatewayErrc::RetryExhausted,
                       "max retry attempts (" + std::to_string(attempts) + ") exceeded");
    error.attempts_ = attempts;
    error.status_code_ = last_error.status_code_;
    error.cause_ = std::make_shared<const GatewayError>(last_error);
    return error;
}

const GatewayError& GatewayError::rootCause() const {
    const GatewayError* current = this;
    while (current->cause_) {
        current = current->cause_.get();
    }
    return *current;
}

bool GatewayError::wraps(GatewayErrc code) const {
    for (const GatewayError* current = this; current != nullptr; current = current->cause_.get()) {
        if (current->code_ == code) {
            return true;
        }
    }
    return false;
}

std::string GatewayError::to_string() const {
    std::ostringstream oss;
    oss << message_;
    if (cause_) {
        oss << ": " << cause_->to_string();
    }
    return oss.str();
}

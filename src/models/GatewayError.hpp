#ifndef GATEWAYERROR_HPP
#define GATEWAYERROR_HPP

#include <memory>
#include <optional>
#include <string>
#include <system_error>

// Error kinds produced by the dispatch pipeline.
enum class GatewayErrc {
    AdmissionDenied = 1,
    CircuitOpen,
    ProbeLimitExceeded,
    DiscoveryFailed,
    TransportFailed,
    RetryableBackendStatus,
    TerminalBackendStatus,
    RetryExhausted,
    CacheWriteFailed,
    Cancelled
};

const std::error_category& gateway_category() noexcept;

std::error_code make_error_code(GatewayErrc e) noexcept;

namespace std {
template <>
struct is_error_code_enum<GatewayErrc> : true_type {};
}

class GatewayError {
public:
    GatewayError(GatewayErrc code, std::string message)
        : code_(code), message_(std::move(message)) {}

    static GatewayError backendStatus(GatewayErrc code, int status_code, std::string message);

    // Wraps the last failure of an exhausted retry loop.
    static GatewayError retryExhausted(int attempts, const GatewayError& last_error);

    GatewayErrc code() const { return code_; }
    const std::string& message() const { return message_; }
    int attempts() const { return attempts_; }
    std::optional<int> statusCode() const { return status_code_; }
    const GatewayError* cause() const { return cause_.get(); }

    // Walks the cause chain and returns the innermost error.
    const GatewayError& rootCause() const;

    bool is(GatewayErrc code) const { return code_ == code; }

    // True if this error or any wrapped cause has the given kind.
    bool wraps(GatewayErrc code) const;

    std::string to_string() const;

private:
    GatewayErrc code_;
    std::string message_;
    int attempts_ = 0;
    std::optional<int> status_code_;
    std::shared_ptr<const GatewayError> cause_;
};

#endif // GATEWAYERROR_HPP

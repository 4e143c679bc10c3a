#ifndef DISPATCHER_HPP
#define DISPATCHER_HPP

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <boost/beast/http.hpp>

#include "../interfaces/CacheInterface.hpp"
#include "../interfaces/IBackendClient.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IServiceLocator.hpp"
#include "../interfaces/IStatsDClient.hpp"
#include "../models/GatewayError.hpp"
#include "../models/ProxyRequest.hpp"
#include "../resilience/CircuitBreakerRegistry.hpp"
#include "../resilience/Deadline.hpp"
#include "../resilience/RetryExecutor.hpp"
#include "../resilience/RetryPolicy.hpp"

namespace beast = boost::beast;
namespace http = beast::http;

struct DispatcherOptions {
    CircuitBreakerSettings breaker_settings = CircuitBreakerSettings::gatewayDefaults();
    RetryPolicy retry_policy = RetryPolicy::defaults();
    std::chrono::seconds cache_ttl{300};
};

struct DispatchResult {
    std::optional<http::response<http::string_body>> response;
    std::optional<GatewayError> error;
    bool cache_hit = false;
};

// Proxies one inbound request to one backend service. The breaker sees a
// single outcome per request; retries run underneath it.
class Dispatcher {
public:
    // `cache` may be null, in which case nothing is cached.
    Dispatcher(DispatcherOptions options,
               std::shared_ptr<IServiceLocator> locator,
               std::shared_ptr<IBackendClient> backend_client,
               std::shared_ptr<CacheInterface> cache,
               std::shared_ptr<ILogger> logger,
               std::shared_ptr<IStatsDClient> statsd_client);

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    DispatchResult dispatch(const std::string& service_name, const ProxyRequest& request, Deadline& deadline);

    CircuitBreakerRegistry& breakers() { return breakers_; }
    const DispatcherOptions& options() const { return options_; }

    static std::string cacheKey(const std::string& service_name, const std::string& target);

    // Copy of the inbound request addressed to `instance`, with forwarding headers added.
    static http::request<http::string_body> buildOutboundRequest(const ProxyRequest& request,
                                                                 const BackendUrlInfo& instance);

    static http::status statusForError(const GatewayError& error);

    // JSON denial body. Never exposes backend addresses or internals.
    static http::response<http::string_body> errorResponse(const GatewayError& error,
                                                           unsigned version,
                                                           bool keep_alive);

    static http::response<http::string_body> jsonResponse(http::status status,
                                                          const std::string& message,
                                                          unsigned version,
                                                          bool keep_alive);

private:
    using Response = http::response<http::string_body>;

    RetryOutcome<Response> attempt(const std::string& service_name, const ProxyRequest& request, Deadline& deadline);

    std::optional<Response> lookupCache(const std::string& cache_key, unsigned version);
    void storeInCache(const std::string& cache_key, const Response& response);
    void recordFailure(const std::string& service_name, const GatewayError& error);

    DispatcherOptions options_;
    std::shared_ptr<IServiceLocator> locator_;
    std::shared_ptr<IBackendClient> backend_client_;
    std::shared_ptr<CacheInterface> cache_;
    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<IStatsDClient> statsd_client_;

    CircuitBreakerRegistry breakers_;
    RetryExecutor retry_executor_;
};

#endif // DISPATCHER_HPP

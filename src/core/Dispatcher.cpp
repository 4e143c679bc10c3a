#include "Dispatcher.hpp"

#include <stdexcept>

#include <boost/beast/version.hpp>
#include <nlohmann/json.hpp>

#include "../config/AppConfig.hpp" // For MetricsDefinitions
#include "../models/CachedResponse.hpp"

using json = nlohmann::json;

Dispatcher::Dispatcher(DispatcherOptions options,
                       std::shared_ptr<IServiceLocator> locator,
                       std::shared_ptr<IBackendClient> backend_client,
                       std::shared_ptr<CacheInterface> cache,
                       std::shared_ptr<ILogger> logger,
                       std::shared_ptr<IStatsDClient> statsd_client)
    : options_(std::move(options)),
      locator_(locator),
      backend_client_(backend_client),
      cache_(cache),
      logger_(logger),
      statsd_client_(statsd_client),
      breakers_(options_.breaker_settings, logger, statsd_client),
      retry_executor_(logger) {
    if (!locator_) {
        throw std::invalid_argument("ServiceLocator cannot be null for Dispatcher");
    }
    if (!backend_client_) {
        throw std::invalid_argument("BackendClient cannot be null for Dispatcher");
    }
    options_.retry_policy.validate();

    if (options_.retry_policy.retryableErrors.empty() && !options_.retry_policy.retryablePredicate) {
        options_.retry_policy.retryableErrors = {
            GatewayErrc::DiscoveryFailed,
            GatewayErrc::TransportFailed,
            GatewayErrc::RetryableBackendStatus
        };
    }
    logger_->debug("Dispatcher initialized");
}

DispatchResult Dispatcher::dispatch(const std::string& service_name, const ProxyRequest& request, Deadline& deadline) {
    auto start = std::chrono::steady_clock::now();
    const auto& inbound = request.message;

    bool cacheable = cache_ && inbound.method() == http::verb::get;
    std::string cache_key = cacheKey(service_name, std::string(inbound.target()));

    if (cacheable) {
        if (auto cached = lookupCache(cache_key, inbound.version())) {
            statsd_client_->increment(MetricsDefinitions::CACHE_HIT);
            logger_->debug("Cache hit for key: " + cache_key);
            DispatchResult result;
            result.response = std::move(cached);
            result.cache_hit = true;
            return result;
        }
        statsd_client_->increment(MetricsDefinitions::CACHE_MISS);
    }

    auto breaker = breakers_.getOrCreate(service_name);

    std::optional<Response> response;
    auto error = breaker->execute([&]() -> std::optional<GatewayError> {
        auto outcome = retry_executor_.retryWithResult<Response>(
            deadline, options_.retry_policy,
            [&]() { return attempt(service_name, request, deadline); });
        if (outcome.error) {
            return outcome.error;
        }
        response = std::move(outcome.value);
        return std::nullopt;
    });

    statsd_client_->timing(MetricsDefinitions::DISPATCH_LATENCY,
                           std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start));

    DispatchResult result;
    if (error) {
        recordFailure(service_name, *error);
        result.error = std::move(error);
        return result;
    }

    if (cacheable && response->result() == http::status::ok) {
        storeInCache(cache_key, *response);
    }
    response->set("X-Cache", "MISS");
    result.response = std::move(response);
    return result;
}

RetryOutcome<Dispatcher::Response> Dispatcher::attempt(const std::string& service_name,
                                                       const ProxyRequest& request,
                                                       Deadline& deadline) {
    RetryOutcome<Response> outcome;

    auto instance = locator_->resolveHealthy(service_name);
    if (!instance) {
        outcome.error = GatewayError(GatewayErrc::DiscoveryFailed,
                                     "no healthy instance for service '" + service_name + "'");
        return outcome;
    }

    BackendCallResult call = backend_client_->send(*instance, buildOutboundRequest(request, *instance), deadline);

    if (call.error || !call.response) {
        if (deadline.expired()) {
            outcome.error = GatewayError(GatewayErrc::Cancelled,
                                         "deadline exceeded calling service '" + service_name + "'");
            return outcome;
        }
        std::string reason = call.error ? call.error.message() : "no response";
        logger_->warn("Transport failure calling " + instance->url + " for service " + service_name + ": " + reason);
        locator_->reportFailure(service_name, *instance);
        outcome.error = GatewayError(GatewayErrc::TransportFailed, "transport failed: " + reason);
        return outcome;
    }

    int status = call.response->result_int();
    if (isRetryableHttpStatus(status)) {
        outcome.error = GatewayError::backendStatus(GatewayErrc::RetryableBackendStatus, status,
                                                    "backend returned status " + std::to_string(status));
        return outcome;
    }

    if (status >= 400) {
        logger_->debug("Service " + service_name + " returned terminal status " + std::to_string(status));
    }
    outcome.value = std::move(*call.response);
    return outcome;
}

std::optional<Dispatcher::Response> Dispatcher::lookupCache(const std::string& cache_key, unsigned version) {
    auto cached = cache_->get(cache_key);
    if (!cached) {
        return std::nullopt;
    }

    CachedResponse entry;
    try {
        entry = json::parse(*cached).get<CachedResponse>();
    } catch (const json::exception& e) {
        logger_->warn("Discarding unreadable cache entry for key " + cache_key + ": " + e.what());
        return std::nullopt;
    }

    Response response{static_cast<http::status>(entry.status_code), version};
    response.set(http::field::server, BOOST_BEAST_VERSION_STRING);
    if (!entry.content_type.empty()) {
        response.set(http::field::content_type, entry.content_type);
    }
    response.set("X-Cache", "HIT");
    response.body() = std::move(entry.body);
    response.prepare_payload();
    return response;
}

void Dispatcher::storeInCache(const std::string& cache_key, const Response& response) {
    CachedResponse entry;
    entry.status_code = response.result_int();
    entry.body = response.body();
    auto content_type = response.find(http::field::content_type);
    if (content_type != response.end()) {
        entry.content_type = std::string(content_type->value());
    }

    if (!cache_->set(cache_key, json(entry).dump(), static_cast<int>(options_.cache_ttl.count()))) {
        GatewayError error(GatewayErrc::CacheWriteFailed, "failed to cache response for key " + cache_key);
        logger_->warn(error.to_string());
        statsd_client_->increment(MetricsDefinitions::CACHE_WRITE_FAILED);
    }
}

void Dispatcher::recordFailure(const std::string& service_name, const GatewayError& error) {
    switch (error.code()) {
        case GatewayErrc::CircuitOpen:
        case GatewayErrc::ProbeLimitExceeded:
            statsd_client_->increment(MetricsDefinitions::CIRCUIT_OPEN);
            break;
        case GatewayErrc::RetryExhausted:
            statsd_client_->increment(MetricsDefinitions::RETRY_EXHAUSTED);
            break;
        case GatewayErrc::Cancelled:
            statsd_client_->increment(MetricsDefinitions::DISPATCH_CANCELLED);
            break;
        default:
            break;
    }
    logger_->error("Dispatch to service " + service_name + " failed: " + error.to_string());
}

std::string Dispatcher::cacheKey(const std::string& service_name, const std::string& target) {
    return "proxy:" + service_name + ":" + target;
}

http::request<http::string_body> Dispatcher::buildOutboundRequest(const ProxyRequest& request,
                                                                  const BackendUrlInfo& instance) {
    http::request<http::string_body> outbound = request.message;

    auto inbound_host = request.message.find(http::field::host);
    if (outbound.find("X-Forwarded-Host") == outbound.end() && inbound_host != request.message.end()) {
        outbound.set("X-Forwarded-Host", inbound_host->value());
    }
    if (outbound.find("X-Forwarded-Proto") == outbound.end()) {
        outbound.set("X-Forwarded-Proto", "http");
    }
    if (!request.client_address.empty()) {
        auto forwarded_for = outbound.find("X-Forwarded-For");
        if (forwarded_for != outbound.end() && !forwarded_for->value().empty()) {
            outbound.set("X-Forwarded-For", std::string(forwarded_for->value()) + ", " + request.client_address);
        } else {
            outbound.set("X-Forwarded-For", request.client_address);
        }
    }

    outbound.set(http::field::host, instance.hostHeader());
    outbound.keep_alive(false);
    outbound.prepare_payload();
    return outbound;
}

http::status Dispatcher::statusForError(const GatewayError& error) {
    switch (error.code()) {
        case GatewayErrc::AdmissionDenied:
            return http::status::too_many_requests;
        case GatewayErrc::CircuitOpen:
        case GatewayErrc::ProbeLimitExceeded:
            return http::status::service_unavailable;
        case GatewayErrc::Cancelled:
            return http::status::gateway_timeout;
        default:
            return http::status::bad_gateway;
    }
}

http::response<http::string_body> Dispatcher::errorResponse(const GatewayError& error,
                                                            unsigned version,
                                                            bool keep_alive) {
    http::status status = statusForError(error);

    std::string message;
    switch (status) {
        case http::status::too_many_requests:
            message = "Rate limit exceeded. Please try again later.";
            break;
        case http::status::service_unavailable:
            message = "Service temporarily unavailable";
            break;
        case http::status::gateway_timeout:
            message = "Gateway timeout";
            break;
        default:
            message = "Service error";
            break;
    }

    auto res = jsonResponse(status, message, version, keep_alive);
    if (status == http::status::too_many_requests) {
        res.set(http::field::retry_after, "60");
    }
    return res;
}

http::response<http::string_body> Dispatcher::jsonResponse(http::status status,
                                                           const std::string& message,
                                                           unsigned version,
                                                           bool keep_alive) {
    http::response<http::string_body> res{status, version};
    res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
    res.set(http::field::content_type, "application/json");
    res.keep_alive(keep_alive);
    res.body() = R"({"success": false, "message": ")" + message + R"("})";
    res.prepare_payload();
    return res;
}

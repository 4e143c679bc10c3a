#include "Gateway.hpp"

#include <set>
#include <stdexcept>

#include <boost/beast/version.hpp>
#include <nlohmann/json.hpp>

#include "../config/AppConfig.hpp" // For MetricsDefinitions

using json = nlohmann::json;

Gateway::Gateway(GatewayOptions options,
                 std::shared_ptr<RouteTable> routes,
                 std::shared_ptr<EndpointRateLimiterRegistry> rate_limiters,
                 std::shared_ptr<Dispatcher> dispatcher,
                 std::shared_ptr<IServiceLocator> locator,
                 std::shared_ptr<IBackendClient> backend_client,
                 std::shared_ptr<ILogger> logger,
                 std::shared_ptr<IStatsDClient> statsd_client)
    : options_(options),
      routes_(routes),
      rate_limiters_(rate_limiters),
      dispatcher_(dispatcher),
      locator_(locator),
      backend_client_(backend_client),
      logger_(logger),
      statsd_client_(statsd_client) {
    if (!routes_) {
        throw std::invalid_argument("RouteTable cannot be null");
    }
    if (!rate_limiters_) {
        throw std::invalid_argument("Rate limiters cannot be null");
    }
    if (!dispatcher_) {
        throw std::invalid_argument("Dispatcher cannot be null");
    }
    if (!locator_) {
        throw std::invalid_argument("ServiceLocator cannot be null");
    }
    if (!backend_client_) {
        throw std::invalid_argument("BackendClient cannot be null");
    }
    if (!logger_) {
        throw std::invalid_argument("Logger pointer cannot be null");
    }
    if (!statsd_client_) {
        throw std::invalid_argument("StatsDClient pointer cannot be null");
    }
    if (options_.request_timeout <= std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("Request timeout must be positive");
    }
    workers_ = std::make_unique<ThreadPoolQueue>(options_.worker_threads, logger_, statsd_client_);
    logger_->debug("Gateway initialized with " + std::to_string(routes_->routes().size()) + " routes");
}

Gateway::~Gateway() {
    shutdown();
}

void Gateway::processRequest(http::request<http::string_body> req,
                             const std::string& remote_address,
                             std::chrono::steady_clock::time_point request_received_time,
                             ResponseCallback send_response_cb) {
    std::string target(req.target());
    std::string path = target.substr(0, target.find('?'));

    if (req.method() == http::verb::get && path == "/status") {
        return send_response_cb(statusResponse(req.version(), req.keep_alive()));
    }
    if (req.method() == http::verb::get && path == "/health") {
        return send_response_cb(healthResponse(req.version(), req.keep_alive()));
    }

    auto route = routes_->match(target);
    if (!route) {
        logger_->debug("No route for target: " + target);
        http::response<http::string_body> res{http::status::not_found, req.version()};
        res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
        res.set(http::field::content_type, "text/plain");
        res.keep_alive(req.keep_alive());
        res.body() = "The resource '" + path + "' was not found.";
        res.prepare_payload();
        return send_response_cb(std::move(res));
    }

    RateLimiter& limiter = rate_limiters_->limiterFor(path);
    std::string client = clientKey(req, remote_address);
    if (!limiter.allow(client)) {
        statsd_client_->increment(MetricsDefinitions::RATE_LIMITED);
        logger_->debug("Rate limit exceeded for client " + client + " on " + path);
        return send_response_cb(rateLimitedResponse(req.version(), req.keep_alive()));
    }

    if (shutting_down_) {
        return send_response_cb(Dispatcher::jsonResponse(http::status::service_unavailable,
                                                         "Service temporarily unavailable",
                                                         req.version(), req.keep_alive()));
    }

    auto deadline = std::make_shared<Deadline>(request_received_time + options_.request_timeout);
    trackDeadline(deadline);
    if (shutting_down_) {
        deadline->cancel();
    }

    ProxyRequest proxy_request;
    proxy_request.client_address = remote_address;
    proxy_request.message = std::move(req);
    proxy_request.message.target(route->forward_target);

    unsigned version = proxy_request.message.version();
    bool keep_alive = proxy_request.message.keep_alive();

    bool enqueued = workers_->enqueue(
        [this, route = *route, request = std::move(proxy_request), deadline, send_response_cb]() mutable {
            runDispatch(route, std::move(request), deadline, send_response_cb);
        });

    if (!enqueued) {
        untrackDeadline(deadline);
        send_response_cb(Dispatcher::jsonResponse(http::status::service_unavailable,
                                                  "Service temporarily unavailable", version, keep_alive));
    }
}

void Gateway::runDispatch(const RouteMatch& route,
                          ProxyRequest request,
                          std::shared_ptr<Deadline> deadline,
                          const ResponseCallback& send_response_cb) {
    unsigned version = request.message.version();
    bool keep_alive = request.message.keep_alive();

    std::optional<http::response<http::string_body>> response;
    try {
        DispatchResult result = dispatcher_->dispatch(route.service_name, request, *deadline);
        if (result.response) {
            response = std::move(result.response);
            response->version(version);
            response->keep_alive(keep_alive);
            response->prepare_payload();
        } else if (result.error) {
            response = Dispatcher::errorResponse(*result.error, version, keep_alive);
        } else {
            response = Dispatcher::jsonResponse(http::status::bad_gateway, "Service error", version, keep_alive);
        }
    } catch (const std::exception& e) {
        statsd_client_->increment(MetricsDefinitions::CODE_EXCEPTION);
        logger_->error("Exception while dispatching to " + route.service_name + ": " + e.what());
        response = Dispatcher::jsonResponse(http::status::internal_server_error, "Internal server error",
                                            version, keep_alive);
    }

    untrackDeadline(deadline);
    send_response_cb(std::move(response));
}

http::response<http::string_body> Gateway::statusResponse(unsigned version, bool keep_alive) const {
    http::response<http::string_body> res{http::status::ok, version};
    res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
    res.set(http::field::content_type, "text/plain");
    res.keep_alive(keep_alive);
    res.body() = "Gateway is running";
    res.prepare_payload();
    return res;
}

http::response<http::string_body> Gateway::healthResponse(unsigned version, bool keep_alive) const {
    json body;
    bool any_open = false;

    body["breakers"] = json::object();
    for (const auto& breaker : dispatcher_->breakers().breakers()) {
        BreakerState state = breaker->state();
        BreakerCounts counts = breaker->counts();
        any_open = any_open || state == BreakerState::Open;
        body["breakers"][breaker->name()] = {
            {"state", to_string(state)},
            {"requests", counts.requests},
            {"failures", counts.totalFailures}
        };
    }

    std::set<std::string> services;
    for (const auto& route : routes_->routes()) {
        services.insert(route.service_name);
    }
    body["services"] = json::object();
    for (const auto& service : services) {
        body["services"][service] = {{"healthy_instances", locator_->resolveAll(service).size()}};
    }
    body["status"] = any_open ? "degraded" : "ok";

    http::response<http::string_body> res{any_open ? http::status::service_unavailable : http::status::ok, version};
    res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
    res.set(http::field::content_type, "application/json");
    res.keep_alive(keep_alive);
    res.body() = body.dump();
    res.prepare_payload();
    return res;
}

void Gateway::shutdown() {
    if (shutting_down_.exchange(true)) {
        return;
    }
    logger_->info("Gateway shutting down, cancelling " + std::to_string(activeDispatchCount()) + " in-flight dispatches");
    {
        std::lock_guard<std::mutex> lock(deadlines_mutex_);
        for (const auto& deadline : active_deadlines_) {
            deadline->cancel();
        }
    }
    backend_client_->cancelAll();
    rate_limiters_->stop();
    workers_->shutdown();
}

size_t Gateway::activeDispatchCount() const {
    std::lock_guard<std::mutex> lock(deadlines_mutex_);
    return active_deadlines_.size();
}

std::string Gateway::clientKey(const http::request<http::string_body>& req, const std::string& remote_address) {
    auto forwarded_for = req.find("X-Forwarded-For");
    if (forwarded_for != req.end() && !forwarded_for->value().empty()) {
        std::string value(forwarded_for->value());
        std::string first = value.substr(0, value.find(','));
        size_t begin = first.find_first_not_of(" \t");
        size_t end = first.find_last_not_of(" \t");
        if (begin != std::string::npos) {
            return first.substr(begin, end - begin + 1);
        }
    }
    auto real_ip = req.find("X-Real-IP");
    if (real_ip != req.end() && !real_ip->value().empty()) {
        return std::string(real_ip->value());
    }
    return remote_address;
}

http::response<http::string_body> Gateway::rateLimitedResponse(unsigned version, bool keep_alive) {
    return Dispatcher::errorResponse(GatewayError(GatewayErrc::AdmissionDenied, "rate limit exceeded"),
                                     version, keep_alive);
}

void Gateway::trackDeadline(const std::shared_ptr<Deadline>& deadline) {
    std::lock_guard<std::mutex> lock(deadlines_mutex_);
    active_deadlines_.insert(deadline);
}

void Gateway::untrackDeadline(const std::shared_ptr<Deadline>& deadline) {
    std::lock_guard<std::mutex> lock(deadlines_mutex_);
    active_deadlines_.erase(deadline);
}

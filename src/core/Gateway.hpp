#ifndef GATEWAY_HPP
#define GATEWAY_HPP

#include <boost/beast/http.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>

#include "Dispatcher.hpp"
#include "RouteTable.hpp"
#include "ThreadPoolQueue.hpp"
#include "../interfaces/IBackendClient.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IServiceLocator.hpp"
#include "../interfaces/IStatsDClient.hpp"
#include "../resilience/Deadline.hpp"
#include "../resilience/RateLimiter.hpp"

namespace beast = boost::beast;
namespace http = beast::http;

struct GatewayOptions {
    std::chrono::milliseconds request_timeout{25000};
    size_t worker_threads = 4;
};

// Request entry point: routing, admission, hand-off to the worker pool and
// the built-in /status and /health endpoints.
class Gateway {
public:
    using ResponseCallback = std::function<void(std::optional<http::response<http::string_body>>)>;

    Gateway(GatewayOptions options,
            std::shared_ptr<RouteTable> routes,
            std::shared_ptr<EndpointRateLimiterRegistry> rate_limiters,
            std::shared_ptr<Dispatcher> dispatcher,
            std::shared_ptr<IServiceLocator> locator,
            std::shared_ptr<IBackendClient> backend_client,
            std::shared_ptr<ILogger> logger,
            std::shared_ptr<IStatsDClient> statsd_client);

    ~Gateway();

    Gateway(const Gateway&) = delete;
    Gateway& operator=(const Gateway&) = delete;
    Gateway(Gateway&&) = delete;
    Gateway& operator=(Gateway&&) = delete;

    // Called by HttpServerSession for every request read off the wire.
    // `send_response_cb` may run on a worker thread.
    void processRequest(http::request<http::string_body> req,
                        const std::string& remote_address,
                        std::chrono::steady_clock::time_point request_received_time,
                        ResponseCallback send_response_cb);

    http::response<http::string_body> statusResponse(unsigned version, bool keep_alive) const;
    http::response<http::string_body> healthResponse(unsigned version, bool keep_alive) const;

    // Cancels in-flight dispatches and backend calls, then drains the worker pool.
    void shutdown();

    size_t activeDispatchCount() const;

    // First X-Forwarded-For entry, else X-Real-IP, else the socket address.
    static std::string clientKey(const http::request<http::string_body>& req, const std::string& remote_address);

    static http::response<http::string_body> rateLimitedResponse(unsigned version, bool keep_alive);

private:
    void runDispatch(const RouteMatch& route,
                     ProxyRequest request,
                     std::shared_ptr<Deadline> deadline,
                     const ResponseCallback& send_response_cb);

    void trackDeadline(const std::shared_ptr<Deadline>& deadline);
    void untrackDeadline(const std::shared_ptr<Deadline>& deadline);

    GatewayOptions options_;
    std::shared_ptr<RouteTable> routes_;
    std::shared_ptr<EndpointRateLimiterRegistry> rate_limiters_;
    std::shared_ptr<Dispatcher> dispatcher_;
    std::shared_ptr<IServiceLocator> locator_;
    std::shared_ptr<IBackendClient> backend_client_;
    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<IStatsDClient> statsd_client_;

    std::atomic<bool> shutting_down_{false};
    mutable std::mutex deadlines_mutex_;
    std::unordered_set<std::shared_ptr<Deadline>> active_deadlines_;

    // Declared last so workers stop before the members they use go away.
    std::unique_ptr<ThreadPoolQueue> workers_;
};

#endif // GATEWAY_HPP

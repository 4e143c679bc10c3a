#include "BeastBackendClient.hpp"

#include <algorithm>
#include <future>
#include <stdexcept>

namespace {

// Slice used to notice deadline cancellation while waiting on a session.
constexpr std::chrono::milliseconds kWaitSlice{50};

// Time a cancelled session gets to deliver its completion.
constexpr std::chrono::milliseconds kCancelGrace{1000};

} // namespace

BeastBackendClient::BeastBackendClient(net::io_context& ioc,
                                       std::chrono::milliseconds attempt_timeout,
                                       std::shared_ptr<ILogger> logger)
    : ioc_(ioc), attempt_timeout_(attempt_timeout), logger_(logger) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for BeastBackendClient");
    }
    if (attempt_timeout_ <= std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("Backend attempt timeout must be positive");
    }
}

BackendCallResult BeastBackendClient::send(const BackendUrlInfo& backend,
                                           http::request<http::string_body> request,
                                           Deadline& deadline) {
    if (backend.is_https) {
        logger_->error("HTTPS backends are not supported: " + backend.url);
        return {std::nullopt, net::error::operation_not_supported};
    }

    auto timeout = std::min(attempt_timeout_, deadline.remaining());
    if (timeout <= std::chrono::milliseconds::zero()) {
        return {std::nullopt, beast::errc::make_error_code(beast::errc::timed_out)};
    }

    auto promise = std::make_shared<std::promise<BackendCallResult>>();
    std::future<BackendCallResult> future = promise->get_future();

    auto session = std::make_shared<AsyncHttpClientSession>(
        ioc_, backend, std::move(request), timeout,
        [promise](http::response<http::string_body> res, beast::error_code ec) {
            BackendCallResult result;
            if (ec) {
                result.error = ec;
            } else {
                result.response = std::move(res);
            }
            promise->set_value(std::move(result));
        },
        logger_);

    {
        std::lock_guard<std::mutex> lock(active_sessions_mutex_);
        active_sessions_.insert(session);
    }

    session->run();

    while (future.wait_for(kWaitSlice) != std::future_status::ready) {
        if (deadline.expired()) {
            session->cancel();
            if (future.wait_for(kCancelGrace) != std::future_status::ready) {
                logger_->error("Backend session for " + backend.url + " did not complete after cancellation");
                std::lock_guard<std::mutex> lock(active_sessions_mutex_);
                active_sessions_.erase(session);
                return {std::nullopt, net::error::operation_aborted};
            }
            break;
        }
    }

    {
        std::lock_guard<std::mutex> lock(active_sessions_mutex_);
        active_sessions_.erase(session);
    }
    return future.get();
}

void BeastBackendClient::cancelAll() {
    std::lock_guard<std::mutex> lock(active_sessions_mutex_);
    logger_->info("Cancelling " + std::to_string(active_sessions_.size()) + " active backend calls");
    for (const auto& session : active_sessions_) {
        session->cancel();
    }
}

size_t BeastBackendClient::activeSessionCount() const {
    std::lock_guard<std::mutex> lock(active_sessions_mutex_);
    return active_sessions_.size();
}

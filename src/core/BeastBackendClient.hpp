#ifndef BEASTBACKENDCLIENT_HPP
#define BEASTBACKENDCLIENT_HPP

#include <chrono>
#include <memory>
#include <mutex>
#include <unordered_set>

#include <boost/asio/io_context.hpp>

#include "AsyncHttpClientSession.hpp"
#include "../interfaces/IBackendClient.hpp"
#include "../interfaces/ILogger.hpp"

// Runs AsyncHttpClientSession on the shared io_context and blocks the
// calling worker thread until the exchange completes.
class BeastBackendClient : public IBackendClient {
public:
    BeastBackendClient(net::io_context& ioc,
                       std::chrono::milliseconds attempt_timeout,
                       std::shared_ptr<ILogger> logger);

    BackendCallResult send(const BackendUrlInfo& backend,
                           http::request<http::string_body> request,
                           Deadline& deadline) override;

    void cancelAll() override;

    size_t activeSessionCount() const;

private:
    net::io_context& ioc_;
    std::chrono::milliseconds attempt_timeout_;
    std::shared_ptr<ILogger> logger_;

    mutable std::mutex active_sessions_mutex_;
    std::unordered_set<std::shared_ptr<AsyncHttpClientSession>> active_sessions_;
};

#endif // BEASTBACKENDCLIENT_HPP

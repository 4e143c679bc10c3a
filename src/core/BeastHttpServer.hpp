#ifndef BEAST_HTTP_SERVER_HPP
#define BEAST_HTTP_SERVER_HPP

#include <boost/beast/core.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <mutex>
#include <unordered_set>

#include "../interfaces/ILogger.hpp"
#include "../config/AppConfig.hpp"
#include "HttpServerSession.hpp"

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = net::ip::tcp;

// Forward declaration
class Gateway;

// Accepts connections and runs one HttpServerSession per connection.
class BeastHttpServer : public std::enable_shared_from_this<BeastHttpServer> {
    net::io_context& ioc_;
    tcp::acceptor acceptor_;
    std::shared_ptr<Gateway> gateway_;
    std::shared_ptr<ILogger> logger_;
    const AppConfig& config_;
    std::mutex sessions_mutex_;
    std::unordered_set<std::shared_ptr<HttpServerSession>> active_sessions_;
    unsigned short bound_port_ = 0;

public:
    BeastHttpServer(
        net::io_context& ioc,
        tcp::endpoint endpoint,
        std::shared_ptr<Gateway> gateway,
        std::shared_ptr<ILogger> logger,
        const AppConfig& config)
        : ioc_(ioc),
          acceptor_(ioc),
          gateway_(gateway),
          logger_(logger),
          config_(config) {
        openAcceptor(endpoint);
        bound_port_ = acceptor_.local_endpoint().port();
    }

    void run() {
        do_accept();
    }

    void stop() {
        logger_->info("BeastHttpServer stopping...");
        beast::error_code ec;
        acceptor_.cancel(ec); // Cancel pending async_accept
        if (ec) logger_->error("BeastHttpServer acceptor cancel error: " + ec.message());
        acceptor_.close(ec);  // Close the acceptor
        if (ec) logger_->error("BeastHttpServer acceptor close error: " + ec.message());
        logger_->info("BeastHttpServer stopped accepting new connections.");

        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (const auto& session_ptr : active_sessions_) {
            if (session_ptr) session_ptr->stop();
        }
        active_sessions_.clear();
    }

    size_t activeSessionCount() {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        return active_sessions_.size();
    }

    // Port actually bound; differs from the configured one when that was 0.
    unsigned short port() const {
        return bound_port_;
    }

private:
    void openAcceptor(const tcp::endpoint& endpoint);
    void do_accept();
    void on_accept(beast::error_code ec, tcp::socket socket);
    void on_session_finish(std::shared_ptr<HttpServerSession> session);
};

#endif // BEAST_HTTP_SERVER_HPP
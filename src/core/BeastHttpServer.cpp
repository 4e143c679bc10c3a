#include "BeastHttpServer.hpp"
#include "HttpServerSession.hpp"
#include "Gateway.hpp"

void BeastHttpServer::openAcceptor(const tcp::endpoint& endpoint) {
    auto check = [this](const beast::error_code& ec, const std::string& step) {
        if (ec) {
            logger_->error("BeastHttpServer " + step + " error: " + ec.message());
            throw std::runtime_error("Failed to " + step + ": " + ec.message());
        }
    };

    beast::error_code ec;
    acceptor_.open(endpoint.protocol(), ec);
    check(ec, "open acceptor");

    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    check(ec, "set_option");

    acceptor_.bind(endpoint, ec);
    check(ec, "bind");

    acceptor_.listen(net::socket_base::max_listen_connections, ec);
    check(ec, "listen");
}

void BeastHttpServer::do_accept() {
    acceptor_.async_accept(
        net::make_strand(ioc_),
        beast::bind_front_handler(
            &BeastHttpServer::on_accept,
            shared_from_this()));
}

void BeastHttpServer::on_accept(beast::error_code ec, tcp::socket socket) {
    if (ec) {
        if (ec == net::error::operation_aborted) {
            return;
        }
        logger_->error("BeastHttpServer accept error: " + ec.message());
        return do_accept();
    }

    auto self = shared_from_this();
    auto session = std::make_shared<HttpServerSession>(
        std::move(socket),
        gateway_,
        logger_,
        config_,
        [self](std::shared_ptr<HttpServerSession> finished) {
            self->on_session_finish(finished);
        });

    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        active_sessions_.insert(session);
    }

    session->run();
    do_accept();
}

void BeastHttpServer::on_session_finish(std::shared_ptr<HttpServerSession> session) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    if (active_sessions_.erase(session) == 0) {
        logger_->debug("BeastHttpServer::on_session_finish - session already removed. Active sessions: " +
                       std::to_string(active_sessions_.size()));
    }
}

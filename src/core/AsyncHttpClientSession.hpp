#ifndef ASYNC_HTTP_CLIENT_SESSION_HPP
#define ASYNC_HTTP_CLIENT_SESSION_HPP

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "../models/BackendUrlInfo.hpp"
#include "../interfaces/ILogger.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

// One request/response exchange with a backend instance, bounded by an
// overall timeout. Every handler runs on the session's strand and the
// completion callback is invoked exactly once.
class AsyncHttpClientSession : public std::enable_shared_from_this<AsyncHttpClientSession> {
public:
    using CompletionHandler = std::function<void(http::response<http::string_body>, beast::error_code)>;

private:
    net::strand<net::io_context::executor_type> strand_;
    tcp::resolver resolver_;
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_; // Must persist for reads
    http::request<http::string_body> req_;
    http::response<http::string_body> res_;
    BackendUrlInfo backend_info_;
    CompletionHandler on_complete_;
    std::shared_ptr<ILogger> logger_;
    net::steady_timer timer_;
    std::chrono::milliseconds timeout_;
    std::atomic<bool> completed_{false};

public:
    AsyncHttpClientSession(
        net::io_context& ioc,
        BackendUrlInfo backend_info,
        http::request<http::string_body> request,
        std::chrono::milliseconds timeout,
        CompletionHandler on_complete,
        std::shared_ptr<ILogger> logger = nullptr)
        : strand_(net::make_strand(ioc)),
          resolver_(strand_),
          stream_(strand_),
          req_(std::move(request)),
          backend_info_(std::move(backend_info)),
          on_complete_(std::move(on_complete)),
          logger_(logger),
          timer_(strand_),
          timeout_(timeout) {
        req_.version(11);
        req_.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    }

    void run() {
        net::dispatch(strand_, [self = shared_from_this()]() {
            self->timer_.expires_after(self->timeout_);
            self->timer_.async_wait(beast::bind_front_handler(&AsyncHttpClientSession::on_timeout, self));
            self->do_resolve();
        });
    }

    // Aborts the exchange; the completion callback receives operation_aborted.
    void cancel() {
        net::post(strand_, [self = shared_from_this()]() {
            self->timer_.cancel();
            self->resolver_.cancel();
            beast::error_code ec;
            self->stream_.socket().close(ec);
            self->complete({}, net::error::operation_aborted);
        });
    }

private:
    void complete(http::response<http::string_body> res, beast::error_code ec) {
        if (completed_.exchange(true)) {
            return;
        }
        auto handler = std::move(on_complete_);
        on_complete_ = nullptr;
        if (handler) {
            handler(std::move(res), ec);
        }
    }

    void on_timeout(beast::error_code ec) {
        if (ec == net::error::operation_aborted || completed_.load()) {
            return;
        }
        if (logger_) logger_->warn("AsyncHttpClientSession timeout for " + backend_info_.url);
        resolver_.cancel();
        beast::error_code close_ec;
        stream_.socket().close(close_ec);
        complete({}, beast::errc::make_error_code(beast::errc::timed_out));
    }

    void do_resolve() {
        resolver_.async_resolve(
            backend_info_.backend_host,
            std::to_string(backend_info_.backend_port),
            beast::bind_front_handler(&AsyncHttpClientSession::on_resolve, shared_from_this()));
    }

    void on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) return fail(ec);
        stream_.async_connect(
            results,
            beast::bind_front_handler(&AsyncHttpClientSession::on_connect, shared_from_this()));
    }

    void on_connect(beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
        if (ec) return fail(ec);
        http::async_write(stream_, req_,
            beast::bind_front_handler(&AsyncHttpClientSession::on_write, shared_from_this()));
    }

    void on_write(beast::error_code ec, std::size_t bytes_transferred) {
        boost::ignore_unused(bytes_transferred);
        if (ec) return fail(ec);
        http::async_read(stream_, buffer_, res_,
            beast::bind_front_handler(&AsyncHttpClientSession::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t bytes_transferred) {
        boost::ignore_unused(bytes_transferred);
        timer_.cancel();

        beast::error_code shut_ec;
        stream_.socket().shutdown(tcp::socket::shutdown_both, shut_ec);
        if (shut_ec && shut_ec != beast::errc::not_connected && logger_) {
            logger_->debug("AsyncHttpClientSession shutdown error: " + shut_ec.message());
        }

        if (ec && ec != http::error::end_of_stream) {
            return fail(ec);
        }
        complete(std::move(res_), {});
    }

    void fail(beast::error_code ec) {
        timer_.cancel();
        if (logger_ && ec != net::error::operation_aborted) {
            logger_->debug("AsyncHttpClientSession error for " + backend_info_.url + ": " + ec.message());
        }
        complete({}, ec);
    }
};

#endif // ASYNC_HTTP_CLIENT_SESSION_HPP

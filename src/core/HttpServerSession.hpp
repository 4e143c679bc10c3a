#ifndef HTTP_SERVER_SESSION_HPP
#define HTTP_SERVER_SESSION_HPP

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/system/error_code.hpp>
#include <boost/config.hpp>
#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

#include "../config/AppConfig.hpp"
#include "../interfaces/ILogger.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

// Forward declaration
class Gateway;

// One inbound connection. Reads a request, hands it to the Gateway and
// writes responses back in order from a bounded queue.
class HttpServerSession : public std::enable_shared_from_this<HttpServerSession> {
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    std::shared_ptr<Gateway> gateway_;
    std::shared_ptr<ILogger> logger_;
    const AppConfig& config_;
    std::function<void(std::shared_ptr<HttpServerSession>)> on_finish_callback_; // Called when session is done
    std::string remote_address_;

    std::deque<std::shared_ptr<http::response<http::string_body>>> response_queue_;
    bool write_in_progress_ = false;

    // Closes the socket if an async_write does not complete in time.
    net::steady_timer write_watchdog_timer_;
    std::atomic<bool> current_write_op_completed_{false};

    // Temporary storage for the request, cleared before each read.
    http::request<http::string_body> req_;
    bool current_keep_alive_ = true;
    std::chrono::steady_clock::time_point request_received_time_;

public:
    HttpServerSession(
        tcp::socket&& socket,
        std::shared_ptr<Gateway> gateway,
        std::shared_ptr<ILogger> logger,
        const AppConfig& config,
        std::function<void(std::shared_ptr<HttpServerSession>)> on_finish)
        : stream_(std::move(socket)),
          gateway_(gateway),
          logger_(logger),
          config_(config),
          on_finish_callback_(std::move(on_finish)),
          write_watchdog_timer_(stream_.get_executor()) {
        beast::error_code ec;
        auto endpoint = stream_.socket().remote_endpoint(ec);
        remote_address_ = ec ? std::string() : endpoint.address().to_string();
        logger_->debug("HttpServerSession " + id() + " created for " + remote_address_);
    }

    ~HttpServerSession() {
        logger_->debug("HttpServerSession " + id() + " destroyed.");
    }

    void run() {
        net::dispatch(stream_.get_executor(),
                      beast::bind_front_handler(
                          &HttpServerSession::do_read,
                          shared_from_this()));
    }

    void stop() {
        net::post(stream_.get_executor(), [self = shared_from_this()]() {
            self->current_write_op_completed_.store(true);
            self->write_watchdog_timer_.cancel();
            beast::error_code ec;
            if (self->stream_.socket().is_open()) {
                self->stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
                if (ec && ec != beast::errc::not_connected) {
                    self->logger_->error("HttpServerSession " + self->id() + " socket shutdown error during stop: " + ec.message());
                }
                self->stream_.socket().close(ec);
            }
        });
    }

private:
    std::string id() const {
        std::ostringstream oss;
        oss << static_cast<const void*>(this);
        return oss.str();
    }

    void do_read() {
        req_ = {};
        stream_.expires_after(std::chrono::seconds(30));

        http::async_read(stream_, buffer_, req_,
                         beast::bind_front_handler(
                             &HttpServerSession::on_read,
                             shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t bytes_transferred) {
        boost::ignore_unused(bytes_transferred);

        if (ec == http::error::end_of_stream) {
            return do_close();
        }
        if (ec) {
            if (ec != net::error::operation_aborted && ec != beast::error::timeout) {
                logger_->error("HttpServerSession " + id() + " on_read error: " + ec.message());
            }
            return do_close();
        }

        request_received_time_ = std::chrono::steady_clock::now();
        current_keep_alive_ = req_.keep_alive();
        stream_.expires_never();
        handle_request(std::move(req_));
    }

    // Implemented in HttpServerSession.cpp
    void handle_request(http::request<http::string_body>&& req);

    // Queues a response. If opt_res is std::nullopt the request is dropped
    // and the session reads the next request or closes. Runs on the strand.
    void send_response(std::optional<http::response<http::string_body>>&& opt_res);

    void do_write() {
        if (response_queue_.empty()) {
            write_in_progress_ = false;
            return;
        }
        if (!stream_.socket().is_open()) {
            logger_->error("HttpServerSession " + id() + "::do_write - socket is not open. Clearing queue and closing.");
            response_queue_.clear();
            write_in_progress_ = false;
            return do_close();
        }

        write_in_progress_ = true;
        auto current_response_ptr = response_queue_.front();

        current_write_op_completed_.store(false);
        write_watchdog_timer_.expires_after(std::chrono::seconds(5));
        write_watchdog_timer_.async_wait(
            [self = shared_from_this()](beast::error_code ec_timer) {
                if (self->current_write_op_completed_.load() || ec_timer) {
                    return;
                }
                self->logger_->error("HttpServerSession " + self->id() + " write did not complete within 5s. Closing socket.");
                boost::system::error_code close_ec;
                if (self->stream_.socket().is_open()) {
                    self->stream_.socket().close(close_ec);
                }
            });

        http::async_write(stream_, *current_response_ptr,
            beast::bind_front_handler(
                &HttpServerSession::on_write,
                shared_from_this(),
                current_response_ptr->keep_alive()));
    }

    void on_write(bool keep_alive, beast::error_code ec, std::size_t bytes_transferred) {
        boost::ignore_unused(bytes_transferred);

        bool watchdog_fired = current_write_op_completed_.exchange(true);
        write_watchdog_timer_.cancel();

        if (ec || watchdog_fired) {
            if (ec && ec != net::error::operation_aborted) {
                logger_->error("HttpServerSession " + id() + " on_write error: " + ec.message());
            }
            response_queue_.clear();
            write_in_progress_ = false;
            return do_close();
        }

        if (!response_queue_.empty()) {
            response_queue_.pop_front();
        }

        if (!response_queue_.empty()) {
            return do_write();
        }

        write_in_progress_ = false;
        if (!keep_alive) {
            return do_close();
        }
        do_read();
    }

    void do_close() {
        current_write_op_completed_.store(true);
        write_watchdog_timer_.cancel();

        boost::system::error_code ec_shutdown;
        if (stream_.socket().is_open()) {
            stream_.socket().shutdown(tcp::socket::shutdown_send, ec_shutdown);
        }
        if (ec_shutdown && ec_shutdown != beast::errc::not_connected) {
            logger_->debug("HttpServerSession " + id() + " socket shutdown in do_close: " + ec_shutdown.message());
        }

        if (on_finish_callback_) {
            // The callback may release the last reference to this session.
            auto cb = std::move(on_finish_callback_);
            on_finish_callback_ = nullptr;
            net::dispatch(stream_.get_executor(), beast::bind_front_handler(std::move(cb), shared_from_this()));
        }
    }
};

#endif // HTTP_SERVER_SESSION_HPP

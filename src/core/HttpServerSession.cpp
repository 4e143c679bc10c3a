#include "HttpServerSession.hpp"
#include "Gateway.hpp"

void HttpServerSession::handle_request(http::request<http::string_body>&& req) {
    logger_->debug("HttpServerSession " + id() + " handle_request for target: " + std::string(req.target()));

    if (!gateway_) {
        logger_->error("HttpServerSession " + id() + ": Gateway is null.");
        http::response<http::string_body> res{http::status::internal_server_error, req.version()};
        res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
        res.set(http::field::content_type, "text/plain");
        res.keep_alive(req.keep_alive());
        res.body() = "Internal server error: service not available.";
        res.prepare_payload();
        return send_response(std::move(res));
    }

    // The Gateway may answer from a worker thread; hop back onto the strand.
    gateway_->processRequest(
        std::move(req), remote_address_, request_received_time_,
        [self = shared_from_this()](std::optional<http::response<http::string_body>> opt_res) {
            net::post(self->stream_.get_executor(),
                      [self, res = std::move(opt_res)]() mutable {
                          self->send_response(std::move(res));
                      });
        });
}

void HttpServerSession::send_response(std::optional<http::response<http::string_body>>&& opt_res) {
    if (!opt_res) {
        logger_->warn("HttpServerSession " + id() + "::send_response: no response produced, dropping request.");
        if (write_in_progress_) {
            return;
        }
        return current_keep_alive_ ? do_read() : do_close();
    }

    if (response_queue_.size() >= static_cast<size_t>(config_.max_response_queue_size)) {
        logger_->warn("HttpServerSession " + id() + "::send_response: response queue is full (max " +
                      std::to_string(config_.max_response_queue_size) + "). Discarding oldest response (status " +
                      std::to_string(response_queue_.front()->result_int()) + ").");
        response_queue_.pop_front();
    }

    response_queue_.push_back(std::make_shared<http::response<http::string_body>>(std::move(*opt_res)));

    if (!write_in_progress_) {
        do_write();
    }
}

#include <sstream>
#include <stdexcept>

#include "StatsDClient.hpp"

StatsDClient::StatsDClient(const AppConfig& config,
                           std::shared_ptr<ILogger> logger,
                           const std::string& statsd_address)
    : logger_(logger) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for StatsDClient");
    }

    auto [host, port] = parseAddress(statsd_address);
    udp_sender_ = std::make_unique<Statsd::UDPSender>(
        host, port,
        static_cast<uint64_t>(config.metrics_batch_size),
        static_cast<uint64_t>(config.metrics_send_interval_in_millis));
    if (!udp_sender_->initialized()) {
        throw std::runtime_error("Failed to initialize UDPSender: " + udp_sender_->errorMessage());
    }
    logger_->setup("UDPSender initialized for " + host + ":" + std::to_string(port));
}

StatsDClient::~StatsDClient() {
    logger_->debug("StatsDClient destroyed.");
}

std::pair<std::string, uint16_t> StatsDClient::parseAddress(const std::string& statsd_address) {
    auto colon_pos = statsd_address.rfind(':');
    if (colon_pos == std::string::npos || colon_pos == 0 || colon_pos + 1 == statsd_address.size()) {
        throw std::runtime_error("STATSD_SERVER must be in the format <host>:<port>");
    }

    std::string host = statsd_address.substr(0, colon_pos);
    if (host == "localhost") {
        host = "127.0.0.1";
    }

    int port = 0;
    try {
        port = std::stoi(statsd_address.substr(colon_pos + 1));
    } catch (const std::exception& e) {
        throw std::runtime_error("Invalid port in STATSD_SERVER: " + std::string(e.what()));
    }
    if (port <= 0 || port > 65535) {
        throw std::runtime_error("Invalid port in STATSD_SERVER: " + std::to_string(port));
    }
    return {host, static_cast<uint16_t>(port)};
}

void StatsDClient::send(const std::string& message) {
    udp_sender_->send(message);
}

void StatsDClient::increment(const std::string& key, int value) {
    std::stringstream ss;
    ss << key << ":" << value << "|c";
    send(ss.str());
}

void StatsDClient::decrement(const std::string& key, int value) {
    increment(key, -value);
}

void StatsDClient::gauge(const std::string& key, double value) {
    std::stringstream ss;
    ss << key << ":" << value << "|g";
    send(ss.str());
}

void StatsDClient::timing(const std::string& key, std::chrono::milliseconds value) {
    std::stringstream ss;
    ss << key << ":" << value.count() << "|ms";
    send(ss.str());
}

void StatsDClient::set(const std::string& key, const std::string& value) {
    std::stringstream ss;
    ss << key << ":" << value << "|s";
    send(ss.str());
}

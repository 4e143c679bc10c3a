#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include <cpp-statsd-client/UDPSender.hpp>

#include "../config/AppConfig.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"

// StatsD sink over UDP. Messages are batched by the sender thread owned by
// Statsd::UDPSender.
class StatsDClient : public IStatsDClient {
public:
    // `statsd_address` is "<host>:<port>".
    StatsDClient(const AppConfig& config,
                 std::shared_ptr<ILogger> logger,
                 const std::string& statsd_address);
    ~StatsDClient() override;

    StatsDClient(const StatsDClient&) = delete;
    StatsDClient& operator=(const StatsDClient&) = delete;

    void increment(const std::string& key, int value = 1) override;
    void decrement(const std::string& key, int value = 1) override;
    void gauge(const std::string& key, double value) override;
    void timing(const std::string& key, std::chrono::milliseconds value) override;
    void set(const std::string& key, const std::string& value) override;

    // Splits "<host>:<port>", mapping localhost to 127.0.0.1. Throws on a malformed address.
    static std::pair<std::string, uint16_t> parseAddress(const std::string& statsd_address);

private:
    void send(const std::string& message);

    std::shared_ptr<ILogger> logger_;
    std::unique_ptr<Statsd::UDPSender> udp_sender_;
};

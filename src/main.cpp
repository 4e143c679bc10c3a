#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp> // For make_work_guard
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp> // For graceful shutdown

#include "cache/InMemoryCache.hpp"
#include "cache/RedisCache.hpp"
#include "config/AppConfig.hpp"
#include "core/BeastBackendClient.hpp"
#include "core/BeastHttpServer.hpp"
#include "core/Dispatcher.hpp"
#include "core/Gateway.hpp"
#include "core/RouteTable.hpp"
#include "discovery/StaticServiceLocator.hpp"
#include "logging/ConsoleLogger.hpp"
#include "metrics/DummyStatsDClient.hpp"
#include "metrics/StatsDClient.hpp"
#include "resilience/RateLimiter.hpp"
#include "utils/Utils.hpp"

// --- Helper Function to Initialize Cache ---
std::shared_ptr<CacheInterface> initializeCache(const AppConfig& config, std::shared_ptr<ILogger> logger) {
    if (config.use_redis) {
        auto redis_cache = std::make_shared<RedisCache>(config, logger);
        if (redis_cache->isConnected()) {
            logger->setup("Redis cache connected at " + config.redis_host + ":" + std::to_string(config.redis_port));
            return redis_cache;
        }
        logger->error("Redis unavailable, falling back to InMemoryCache.");
    }
    logger->setup("Creating InMemoryCache.");
    return std::make_shared<InMemoryCache>(config.cache_ttl_in_seconds,
                                           static_cast<size_t>(config.in_memory_cache_max_size));
}

// --- Helper Function to Initialize StatsD Client ---
std::shared_ptr<IStatsDClient> initializeStatsDClient(const AppConfig& config, std::shared_ptr<ILogger> logger) {
    const char* statsd_server_value = std::getenv("STATSD_SERVER");
    std::string statsd_server_endpoint = statsd_server_value ? statsd_server_value : "";
    if (statsd_server_endpoint.empty()) {
        logger->setup("STATSD_SERVER not set. Metrics are disabled.");
        return std::make_shared<DummyStatsDClient>();
    }

    try {
        return std::make_shared<StatsDClient>(config, logger, statsd_server_endpoint);
    } catch (const std::exception& e) {
        logger->error("StatsDClient failed to get created (" + std::string(e.what()) + "). Creating DummyStatsDClient instance.");
    }
    return std::make_shared<DummyStatsDClient>();
}

DispatcherOptions dispatcherOptionsFrom(const AppConfig& config) {
    DispatcherOptions options;
    options.breaker_settings.maxHalfOpenProbes = static_cast<uint32_t>(config.breaker_max_half_open_probes);
    options.breaker_settings.closedWindowDuration = std::chrono::milliseconds(config.breaker_closed_window_in_millis);
    options.breaker_settings.openTimeout = std::chrono::milliseconds(config.breaker_open_timeout_in_millis);
    options.breaker_settings.minRequestThreshold = static_cast<uint32_t>(config.breaker_min_requests);
    options.breaker_settings.failureRateThreshold = config.breaker_failure_rate;

    options.retry_policy.maxAttempts = config.retry_max_attempts;
    options.retry_policy.initialDelay = std::chrono::milliseconds(config.retry_initial_delay_in_millis);
    options.retry_policy.maxDelay = std::chrono::milliseconds(config.retry_max_delay_in_millis);
    options.retry_policy.multiplier = config.retry_multiplier;
    options.retry_policy.jitterEnabled = config.retry_jitter;

    options.cache_ttl = std::chrono::seconds(config.cache_ttl_in_seconds);
    return options;
}

std::shared_ptr<EndpointRateLimiterRegistry> buildRateLimiters(const AppConfig& config, std::shared_ptr<ILogger> logger) {
    RateLimiter::Options defaults;
    defaults.per_minute = config.rate_limit_per_minute;
    defaults.burst_capacity = config.rate_limit_burst;
    defaults.cleanup_interval = std::chrono::seconds(config.rate_limit_cleanup_interval_in_seconds);

    auto registry = std::make_shared<EndpointRateLimiterRegistry>(defaults, logger);
    for (const auto& [prefix, rule] : config.rate_limit_overrides) {
        registry->addEndpoint(prefix, rule.per_minute, rule.burst);
    }
    return registry;
}

// --- Main Function ---
int main(int argc, char** argv) {
    try {
        std::vector<std::string> args_vec;
        for (int i = 1; i < argc; ++i) {
            args_vec.push_back(argv[i]);
        }

        std::optional<std::map<std::string, std::string>> parsedArgsOpt = Utils::parseArguments(args_vec);
        if (!parsedArgsOpt) {
            std::cerr << LogUtils::CERROR_LOG_PREFIX << "Failed to parse command-line arguments. Exiting." << std::endl;
            return 1;
        }

        AppConfig config_ = Utils::loadConfiguration(*parsedArgsOpt);

        std::shared_ptr<ILogger> logger_ = std::make_shared<ConsoleLogger>(config_.log_level);
        logger_->setup("Configuration loaded.");
        logger_->setup(config_.to_string());

        if (config_.routes.empty()) {
            logger_->error("No routes configured. Every request will be answered with 404.");
        }

        std::shared_ptr<IStatsDClient> statsd_client = initializeStatsDClient(config_, logger_);
        std::shared_ptr<CacheInterface> cache_instance = initializeCache(config_, logger_);

        boost::asio::io_context ioc;
        auto work_guard = boost::asio::make_work_guard(ioc);

        auto locator = std::make_shared<StaticServiceLocator>(
            config_.services, std::chrono::milliseconds(config_.instance_quarantine_in_millis), logger_);
        auto backend_client = std::make_shared<BeastBackendClient>(
            ioc,
            std::chrono::milliseconds(config_.connection_timeout_in_millis + config_.read_timeout_in_millis),
            logger_);
        auto dispatcher = std::make_shared<Dispatcher>(
            dispatcherOptionsFrom(config_), locator, backend_client, cache_instance, logger_, statsd_client);
        auto routes = std::make_shared<RouteTable>(config_.routes);

        GatewayOptions gateway_options;
        gateway_options.request_timeout = std::chrono::milliseconds(config_.request_timeout_in_millis);
        gateway_options.worker_threads = std::max(1u, std::thread::hardware_concurrency()) *
                                         static_cast<size_t>(config_.number_of_threads_per_core);

        auto gateway = std::make_shared<Gateway>(
            gateway_options, routes, buildRateLimiters(config_, logger_), dispatcher,
            locator, backend_client, logger_, statsd_client);

        auto beast_server = std::make_shared<BeastHttpServer>(
            ioc,
            tcp::endpoint{net::ip::make_address("0.0.0.0"), static_cast<unsigned short>(config_.gateway_port)},
            gateway,
            logger_,
            config_);
        beast_server->run();
        logger_->setup("Gateway listening on 0.0.0.0:" + std::to_string(beast_server->port()) +
                       " with " + std::to_string(config_.routes.size()) + " routes and " +
                       std::to_string(gateway_options.worker_threads) + " workers. Press Ctrl+C to exit.");

        std::vector<std::thread> ioc_threads;
        logger_->setup("Starting " + std::to_string(config_.num_io_threads) + " I/O threads for Boost.Asio.");
        for (int i = 0; i < config_.num_io_threads; ++i) {
            ioc_threads.emplace_back([&ioc, logger_, i]() {
                try {
                    ioc.run();
                } catch (const std::exception& e) {
                    logger_->error("Exception in Boost.Asio I/O thread " + std::to_string(i) + ": " + e.what());
                }
                logger_->debug("Boost.Asio I/O thread " + std::to_string(i) + " exiting.");
            });
        }

        net::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait(
            [&](beast::error_code const&, int signal_number) {
                logger_->setup("Signal " + std::to_string(signal_number) + " received. Shutting down...");
                beast_server->stop();
                // Backend completions still run on the other I/O threads while in-flight dispatches unwind.
                gateway->shutdown();
                work_guard.reset();
                ioc.stop();
            });

        try {
            ioc.run();
        } catch (const std::exception& e) {
            logger_->error("Exception in main thread ioc.run(): " + std::string(e.what()));
        }

        for (auto& t : ioc_threads) {
            if (t.joinable()) t.join();
        }
        logger_->setup("All Boost.Asio I/O threads joined. Exiting.");
        return 0;
    } catch (const std::exception& e) {
        std::cerr << LogUtils::CERROR_LOG_PREFIX << "Unhandled exception: " << e.what() << std::endl;
        return 1;
    }
}

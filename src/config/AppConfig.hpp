#ifndef APPCONFIG_HPP
#define APPCONFIG_HPP

#include <iostream>
#include <map>
#include <regex>
#include <string>
#include <sstream>
#include <vector>

#include "../models/BackendUrlInfo.hpp"
#include "../models/RouteEntry.hpp"

namespace LogUtils {
    enum LogLevel {
        DEBUG = 0,
        INFO = 1,
        WARN = 2,
        CERROR = 3,
        SETUP = 4
    };

    static std::string DEBUG_LOG_PREFIX = "[Debug] ";
    static std::string INFO_LOG_PREFIX = "[Info] ";
    static std::string WARN_LOG_PREFIX = "[Warning] ";
    static std::string CERROR_LOG_PREFIX = "[Error] ";
    static std::string SETUP_LOG_PREFIX = "[Setup] ";
}

namespace MetricsDefinitions {
    static std::string CODE_EXCEPTION = "gateway.code_exception";

    static std::string RATE_LIMITED = "gateway.rate_limited";

    // Breaker rejections (open or probe limit).
    static std::string CIRCUIT_OPEN = "gateway.circuit_open";

    static std::string BREAKER_TRANSITION = "gateway.breaker_transition";

    static std::string CACHE_HIT = "gateway.cache_hit";
    static std::string CACHE_MISS = "gateway.cache_miss";
    static std::string CACHE_WRITE_FAILED = "gateway.cache_write_failed";

    static std::string RETRY_EXHAUSTED = "gateway.retry_exhausted";

    static std::string DISPATCH_CANCELLED = "gateway.dispatch_cancelled";

    static std::string DISPATCH_LATENCY = "gateway.dispatch_latency";
}

namespace Constants {
    static const std::regex url_regex(R"(^(https?):\/\/([^:\/?#]+)(?::(\d+))?\/?$)");

    static constexpr auto CONFIG_FILE_NAME = "gateway.config";

    static constexpr auto ROUTE_KEY_PREFIX = "route.";
    static constexpr auto SERVICE_KEY_PREFIX = "service.";
    static constexpr auto RATE_LIMIT_KEY_PREFIX = "ratelimit.";
};

// --- Configuration Struct ---
class AppConfig {
public:
    // Routing and discovery
    std::vector<RouteEntry> routes;
    std::map<std::string, std::vector<BackendUrlInfo>> services; // Key: service name
    std::map<std::string, RateLimitRule> rate_limit_overrides;   // Key: path prefix

    // Cache configuration
    bool use_redis;
    std::string redis_host;
    int redis_port;
    int cache_ttl_in_seconds;
    int in_memory_cache_max_size;

    // Server Configuration
    int gateway_port;
    int num_io_threads;
    int number_of_threads_per_core;
    int max_response_queue_size;

    // Logging Level
    LogUtils::LogLevel log_level;

    // Metrics
    int metrics_batch_size;
    int metrics_send_interval_in_millis;

    // --- Request Handling ---
    int request_timeout_in_millis;
    int connection_timeout_in_millis;
    int read_timeout_in_millis;

    // Rate limiting
    double rate_limit_per_minute;
    int rate_limit_burst;
    int rate_limit_cleanup_interval_in_seconds;

    // Circuit breaker
    int breaker_max_half_open_probes;
    int breaker_closed_window_in_millis;
    int breaker_open_timeout_in_millis;
    int breaker_min_requests;
    double breaker_failure_rate;

    // Retry
    int retry_max_attempts;
    int retry_initial_delay_in_millis;
    int retry_max_delay_in_millis;
    double retry_multiplier;
    bool retry_jitter;

    // Service discovery
    int instance_quarantine_in_millis;

    AppConfig() {
        // --- Set Defaults  ---
        use_redis = true;
        redis_host = "localhost";
        redis_port = 6379;
        cache_ttl_in_seconds = 300;
        in_memory_cache_max_size = 10000;

        gateway_port = 8080;
        num_io_threads = 2;
        number_of_threads_per_core = 2;
        max_response_queue_size = 64;

        log_level = LogUtils::LogLevel::CERROR;

        metrics_batch_size = 100;
        metrics_send_interval_in_millis = 1000;

        request_timeout_in_millis = 25000;
        connection_timeout_in_millis = 5000;
        read_timeout_in_millis = 10000;

        rate_limit_per_minute = 100;
        rate_limit_burst = 20;
        rate_limit_cleanup_interval_in_seconds = 300;

        breaker_max_half_open_probes = 3;
        breaker_closed_window_in_millis = 60000;
        breaker_open_timeout_in_millis = 30000;
        breaker_min_requests = 5;
        breaker_failure_rate = 0.5;

        retry_max_attempts = 3;
        retry_initial_delay_in_millis = 100;
        retry_max_delay_in_millis = 10000;
        retry_multiplier = 2.0;
        retry_jitter = true;

        instance_quarantine_in_millis = 10000;
    }

    std::string to_string() const {
        std::stringstream ss;
        ss << "// --- Configuration Params Start --- //" << std::endl
            << "gateway_port: " << gateway_port << std::endl
            << "num_io_threads: " << num_io_threads << std::endl
            << "number_of_threads_per_core: " << number_of_threads_per_core << std::endl
            << "max_response_queue_size: " << max_response_queue_size << std::endl
            << "// --- Cache Configuration --- //" << std::endl
            << "use_redis: " << std::boolalpha << use_redis << std::noboolalpha << std::endl
            << "redis_host: " << redis_host << std::endl
            << "redis_port: " << redis_port << std::endl
            << "cache_ttl_in_seconds: " << cache_ttl_in_seconds << std::endl
            << "in_memory_cache_max_size: " << in_memory_cache_max_size << std::endl
            << "// --- Logging & Metrics --- //" << std::endl
            << "log_level: " << static_cast<int>(log_level) << std::endl
            << "metrics_batch_size: " << metrics_batch_size << std::endl
            << "metrics_send_interval_in_millis: " << metrics_send_interval_in_millis << std::endl
            << "// --- Request Handling --- //" << std::endl
            << "request_timeout_in_millis: " << request_timeout_in_millis << std::endl
            << "connection_timeout_in_millis: " << connection_timeout_in_millis << std::endl
            << "read_timeout_in_millis: " << read_timeout_in_millis << std::endl
            << "// --- Resilience --- //" << std::endl
            << "rate_limit_per_minute: " << rate_limit_per_minute << std::endl
            << "rate_limit_burst: " << rate_limit_burst << std::endl
            << "rate_limit_cleanup_interval_in_seconds: " << rate_limit_cleanup_interval_in_seconds << std::endl
            << "breaker_max_half_open_probes: " << breaker_max_half_open_probes << std::endl
            << "breaker_closed_window_in_millis: " << breaker_closed_window_in_millis << std::endl
            << "breaker_open_timeout_in_millis: " << breaker_open_timeout_in_millis << std::endl
            << "breaker_min_requests: " << breaker_min_requests << std::endl
            << "breaker_failure_rate: " << breaker_failure_rate << std::endl
            << "retry_max_attempts: " << retry_max_attempts << std::endl
            << "retry_initial_delay_in_millis: " << retry_initial_delay_in_millis << std::endl
            << "retry_max_delay_in_millis: " << retry_max_delay_in_millis << std::endl
            << "retry_multiplier: " << retry_multiplier << std::endl
            << "retry_jitter: " << std::boolalpha << retry_jitter << std::noboolalpha << std::endl
            << "instance_quarantine_in_millis: " << instance_quarantine_in_millis << std::endl;

        ss << "--- Route prefix : Service ---" << std::endl;
        for (const auto& route : routes) {
            ss << route.path_prefix << " : " << route.service_name << std::endl;
        }
        ss << "--- Service : Instances ---" << std::endl;
        for (const auto& [service, instances] : services) {
            ss << service << " :";
            for (const auto& instance : instances) {
                ss << " " << instance.url;
            }
            ss << std::endl;
        }
        ss << "--- Rate limit overrides ---" << std::endl;
        for (const auto& [prefix, rule] : rate_limit_overrides) {
            ss << prefix << " : " << rule.per_minute << "/min burst " << rule.burst << std::endl;
        }
        ss << "// --- Configuration Params End --- //" << std::endl;
        return ss.str();
    }
};

#endif // APPCONFIG_HPP

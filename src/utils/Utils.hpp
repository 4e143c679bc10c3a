#ifndef UTILS_HPP
#define UTILS_HPP

#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "../config/AppConfig.hpp"

class Utils {
public:
    // Converts a string to a LogLevel enum
    static LogUtils::LogLevel stringToLogLevel(const std::string& level) {
        if (level == "DEBUG") return LogUtils::LogLevel::DEBUG;
        if (level == "INFO") return LogUtils::LogLevel::INFO;
        if (level == "WARNING") return LogUtils::LogLevel::WARN;
        if (level == "CERROR") return LogUtils::LogLevel::CERROR;
        throw std::invalid_argument("Invalid log level: " + level);
    }

    // Whole-string integer parse.
    static std::optional<int> stringToInt(const std::string& str) {
        try {
            size_t pos;
            int val = std::stoi(str, &pos);
            if (pos == str.length()) {
                return val;
            }
        } catch (const std::invalid_argument&) {
            // Not an integer
        } catch (const std::out_of_range&) {
            // Integer out of range
        }
        return std::nullopt;
    }

    // Whole-string floating point parse.
    static std::optional<double> stringToDouble(const std::string& str) {
        try {
            size_t pos;
            double val = std::stod(str, &pos);
            if (pos == str.length()) {
                return val;
            }
        } catch (const std::invalid_argument&) {
            // Not a number
        } catch (const std::out_of_range&) {
            // Out of range
        }
        return std::nullopt;
    }

    static std::string trim(const std::string& str) {
        size_t first = str.find_first_not_of(" \t\n\r");
        if (std::string::npos == first) return "";
        size_t last = str.find_last_not_of(" \t\n\r");
        return str.substr(first, (last - first + 1));
    }

    static std::vector<std::string> split(const std::string& str, char delimiter) {
        std::vector<std::string> parts;
        std::stringstream ss(str);
        std::string part;
        while (std::getline(ss, part, delimiter)) {
            part = trim(part);
            if (!part.empty()) {
                parts.push_back(part);
            }
        }
        return parts;
    }

    // Parses key=value pairs. Returns nullopt on the first malformed argument.
    static std::optional<std::map<std::string, std::string>> parseArguments(const std::vector<std::string>& args) {
        std::map<std::string, std::string> argMap;
        for (const std::string& arg : args) {
            size_t delimiterPos = arg.find('=');
            if (delimiterPos != std::string::npos && delimiterPos > 0) {
                argMap[arg.substr(0, delimiterPos)] = arg.substr(delimiterPos + 1);
            } else {
                std::cerr << "Error: Invalid argument format: '" << arg << "'. Expected non-empty key=value format." << std::endl;
                return std::nullopt;
            }
        }
        return argMap;
    }

    // Applies one configuration entry. Unknown keys and invalid values are
    // reported on stderr and leave the config untouched; returns false then.
    static bool applyConfigEntry(AppConfig& config, const std::string& key, const std::string& value) {
        if (key.rfind(Constants::ROUTE_KEY_PREFIX, 0) == 0) {
            return applyRoute(config, key.substr(std::string(Constants::ROUTE_KEY_PREFIX).size()), value);
        }
        if (key.rfind(Constants::SERVICE_KEY_PREFIX, 0) == 0) {
            return applyService(config, key.substr(std::string(Constants::SERVICE_KEY_PREFIX).size()), value);
        }
        if (key.rfind(Constants::RATE_LIMIT_KEY_PREFIX, 0) == 0) {
            return applyRateLimitOverride(config, key.substr(std::string(Constants::RATE_LIMIT_KEY_PREFIX).size()), value);
        }

        if (key == "redis_host") {
            config.redis_host = value;
            return true;
        }
        if (key == "log_level") {
            try {
                config.log_level = stringToLogLevel(value);
                return true;
            } catch (const std::invalid_argument& e) {
                std::cerr << "Warning: " << e.what() << std::endl;
                return false;
            }
        }
        if (key == "use_redis") {
            return assignBool(key, value, config.use_redis);
        }
        if (key == "retry_jitter") {
            return assignBool(key, value, config.retry_jitter);
        }
        if (key == "rate_limit_per_minute") {
            return assignPositiveDouble(key, value, config.rate_limit_per_minute);
        }
        if (key == "retry_multiplier") {
            return assignPositiveDouble(key, value, config.retry_multiplier);
        }
        if (key == "breaker_failure_rate") {
            auto val = stringToDouble(value);
            // Zero would make the breaker fall back to its own default rate.
            if (!val || *val <= 0.0 || *val > 1.0) {
                std::cerr << "Warning: breaker_failure_rate must be within (0, 1]: " << value << std::endl;
                return false;
            }
            config.breaker_failure_rate = *val;
            return true;
        }
        if (key == "gateway_port") {
            auto val = stringToInt(value);
            if (!val || *val <= 0 || *val > 65535) {
                std::cerr << "Warning: Invalid port for gateway_port: " << value << std::endl;
                return false;
            }
            config.gateway_port = *val;
            return true;
        }

        const std::map<std::string, int AppConfig::*> positive_ints = {
            {"redis_port", &AppConfig::redis_port},
            {"cache_ttl", &AppConfig::cache_ttl_in_seconds},
            {"in_memory_cache_max_size", &AppConfig::in_memory_cache_max_size},
            {"num_io_threads", &AppConfig::num_io_threads},
            {"number_of_threads_per_core", &AppConfig::number_of_threads_per_core},
            {"max_response_queue_size", &AppConfig::max_response_queue_size},
            {"metrics_batch_size", &AppConfig::metrics_batch_size},
            {"metrics_send_interval", &AppConfig::metrics_send_interval_in_millis},
            {"request_timeout", &AppConfig::request_timeout_in_millis},
            {"connection_timeout", &AppConfig::connection_timeout_in_millis},
            {"read_timeout", &AppConfig::read_timeout_in_millis},
            {"rate_limit_burst", &AppConfig::rate_limit_burst},
            {"rate_limit_cleanup_interval", &AppConfig::rate_limit_cleanup_interval_in_seconds},
            {"breaker_max_half_open_probes", &AppConfig::breaker_max_half_open_probes},
            {"breaker_closed_window", &AppConfig::breaker_closed_window_in_millis},
            {"breaker_open_timeout", &AppConfig::breaker_open_timeout_in_millis},
            {"breaker_min_requests", &AppConfig::breaker_min_requests},
            {"retry_max_attempts", &AppConfig::retry_max_attempts},
            {"retry_initial_delay", &AppConfig::retry_initial_delay_in_millis},
            {"retry_max_delay", &AppConfig::retry_max_delay_in_millis}
        };
        auto it = positive_ints.find(key);
        if (it != positive_ints.end()) {
            auto val = stringToInt(value);
            if (!val || *val <= 0) {
                std::cerr << "Warning: Invalid positive integer for " << key << ": " << value << std::endl;
                return false;
            }
            config.*(it->second) = *val;
            return true;
        }

        // Zero disables quarantine.
        if (key == "instance_quarantine") {
            auto val = stringToInt(value);
            if (!val || *val < 0) {
                std::cerr << "Warning: Invalid integer for instance_quarantine: " << value << std::endl;
                return false;
            }
            config.instance_quarantine_in_millis = *val;
            return true;
        }

        std::cerr << "Warning: Unknown configuration key: " << key << std::endl;
        return false;
    }

    // Reads the first config file found in `config_paths`. Returns the path read, if any.
    static std::optional<std::string> loadConfigFile(AppConfig& config, const std::vector<std::string>& config_paths) {
        for (const auto& config_path : config_paths) {
            std::ifstream configFile(config_path);
            if (!configFile.is_open()) {
                continue;
            }
            std::cout << "Reading configuration from " << config_path << "..." << std::endl;
            std::string line;
            while (std::getline(configFile, line)) {
                line = trim(line);
                if (line.empty() || line[0] == '#') {
                    continue;
                }
                size_t delimiterPos = line.find('=');
                if (delimiterPos == std::string::npos || delimiterPos == 0) {
                    std::cerr << "Warning: Ignoring malformed config line: " << line << std::endl;
                    continue;
                }
                applyConfigEntry(config, trim(line.substr(0, delimiterPos)), trim(line.substr(delimiterPos + 1)));
            }
            return config_path;
        }
        return std::nullopt;
    }

    static std::vector<std::string> defaultConfigPaths() {
        std::string name = Constants::CONFIG_FILE_NAME;
        return {
            name,               // Current directory
            "../" + name,       // Parent directory
            "/app/" + name,     // Docker container path
            "../../" + name     // Development path
        };
    }

    // Config file first, then command-line arguments on top.
    static AppConfig loadConfiguration(const std::map<std::string, std::string>& startupArguments,
                                       const std::vector<std::string>& config_paths = defaultConfigPaths()) {
        AppConfig config;

        if (!loadConfigFile(config, config_paths)) {
            std::cerr << "Warning: Configuration file not found in any standard location. Using defaults and command-line arguments." << std::endl;
        }

        for (const auto& [key, value] : startupArguments) {
            applyConfigEntry(config, key, value);
        }
        return config;
    }

    static bool parseUrl(const std::string& url, BackendUrlInfo* urlInfo) {
        std::smatch match;
        if (!std::regex_match(url, match, Constants::url_regex)) {
            std::cerr << "Error: URL format does not match expected pattern: " << url << std::endl;
            return false;
        }

        bool is_https = (match[1].str() == "https");
        int port = is_https ? 443 : 80;
        if (match[3].matched) {
            auto parsed = stringToInt(match[3].str());
            if (!parsed || *parsed <= 0 || *parsed > 65535) {
                std::cerr << "Warning: Invalid port number " << match[3].str() << " in URL " << url << std::endl;
                return false;
            }
            port = *parsed;
        }

        urlInfo->url = url;
        urlInfo->backend_host = match[2].str();
        urlInfo->backend_port = port;
        urlInfo->is_https = is_https;
        return true;
    }

private:
    static bool applyRoute(AppConfig& config, const std::string& prefix, const std::string& service) {
        if (prefix.empty() || prefix[0] != '/' || service.empty()) {
            std::cerr << "Warning: Invalid route entry '" << prefix << "=" << service
                      << "'. Expected route./<prefix>=<service>." << std::endl;
            return false;
        }
        for (auto& route : config.routes) {
            if (route.path_prefix == prefix) {
                route.service_name = service;
                return true;
            }
        }
        config.routes.push_back(RouteEntry{prefix, service});
        return true;
    }

    static bool applyService(AppConfig& config, const std::string& name, const std::string& urls) {
        if (name.empty()) {
            std::cerr << "Warning: Service entry is missing a name." << std::endl;
            return false;
        }
        std::vector<BackendUrlInfo> instances;
        for (const auto& url : split(urls, ',')) {
            BackendUrlInfo info;
            if (!parseUrl(url, &info)) {
                std::cerr << "Warning: Skipping invalid instance URL for service '" << name << "': " << url << std::endl;
                continue;
            }
            instances.push_back(std::move(info));
        }
        if (instances.empty()) {
            std::cerr << "Warning: No valid instance URLs for service '" << name << "'." << std::endl;
            return false;
        }
        config.services[name] = std::move(instances);
        return true;
    }

    static bool applyRateLimitOverride(AppConfig& config, const std::string& prefix, const std::string& value) {
        size_t colon = value.find(':');
        std::optional<double> per_minute = stringToDouble(trim(value.substr(0, colon)));
        std::optional<int> burst = colon == std::string::npos ? std::nullopt : stringToInt(trim(value.substr(colon + 1)));
        if (prefix.empty() || prefix[0] != '/' || !per_minute || *per_minute <= 0 || !burst || *burst < 1) {
            std::cerr << "Warning: Invalid rate limit override '" << prefix << "=" << value
                      << "'. Expected ratelimit./<prefix>=<perMinute>:<burst>." << std::endl;
            return false;
        }
        config.rate_limit_overrides[prefix] = RateLimitRule{*per_minute, *burst};
        return true;
    }

    static bool assignBool(const std::string& key, const std::string& value, bool& target) {
        if (value == "1" || value == "true") {
            target = true;
            return true;
        }
        if (value == "0" || value == "false") {
            target = false;
            return true;
        }
        std::cerr << "Warning: Invalid boolean for " << key << ": " << value << std::endl;
        return false;
    }

    static bool assignPositiveDouble(const std::string& key, const std::string& value, double& target) {
        auto val = stringToDouble(value);
        if (!val || *val <= 0.0) {
            std::cerr << "Warning: Invalid positive number for " << key << ": " << value << std::endl;
            return false;
        }
        target = *val;
        return true;
    }
};

#endif // UTILS_HPP

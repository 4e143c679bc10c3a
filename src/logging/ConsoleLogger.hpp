#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>

#include "../config/AppConfig.hpp"
#include "../interfaces/ILogger.hpp"

// Line-oriented logger writing to stdout (stderr for errors). Each line is
// prefixed with a UTC timestamp and the level tag.
class ConsoleLogger : public ILogger {
public:
    explicit ConsoleLogger(LogUtils::LogLevel logLevel);
    ~ConsoleLogger() override = default;

    ConsoleLogger(const ConsoleLogger&) = delete;
    ConsoleLogger& operator=(const ConsoleLogger&) = delete;

    void info(const std::string& message) override;
    void debug(const std::string& message) override;
    void warn(const std::string& message) override;
    void error(const std::string& message) override;
    void setup(const std::string& message) override;
    int getLogLevel() override { return logLevel_.load(); }

    void setLogLevel(LogUtils::LogLevel logLevel) { logLevel_.store(logLevel); }

private:
    void write(std::ostream& out, LogUtils::LogLevel level, const std::string& prefix, const std::string& message);

    std::atomic<int> logLevel_;
    std::mutex out_mutex_;
};

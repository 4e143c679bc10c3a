#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "ConsoleLogger.hpp"

namespace {

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return oss.str();
}

} // namespace

ConsoleLogger::ConsoleLogger(LogUtils::LogLevel logLevel) : logLevel_(logLevel) {}

void ConsoleLogger::write(std::ostream& out, LogUtils::LogLevel level, const std::string& prefix, const std::string& message) {
    if (level < logLevel_.load()) {
        return;
    }
    std::string line = timestamp() + " " + prefix + message;
    std::lock_guard<std::mutex> lock(out_mutex_);
    out << line << std::endl;
}

void ConsoleLogger::info(const std::string& message) {
    write(std::cout, LogUtils::LogLevel::INFO, LogUtils::INFO_LOG_PREFIX, message);
}

void ConsoleLogger::debug(const std::string& message) {
    write(std::cout, LogUtils::LogLevel::DEBUG, LogUtils::DEBUG_LOG_PREFIX, message);
}

void ConsoleLogger::warn(const std::string& message) {
    write(std::cout, LogUtils::LogLevel::WARN, LogUtils::WARN_LOG_PREFIX, message);
}

void ConsoleLogger::error(const std::string& message) {
    write(std::cerr, LogUtils::LogLevel::CERROR, LogUtils::CERROR_LOG_PREFIX, message);
}

// Setup lines are always printed.
void ConsoleLogger::setup(const std::string& message) {
    write(std::cout, LogUtils::LogLevel::SETUP, LogUtils::SETUP_LOG_PREFIX, message);
}

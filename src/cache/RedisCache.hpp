#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "../config/AppConfig.hpp"
#include "../interfaces/CacheInterface.hpp"

// Forward declarations
struct redisContext;
struct redisReply;
class ILogger;

// Response cache backed by a single synchronous hiredis connection.
// Commands are serialized; a dropped connection is re-established on the
// next command.
class RedisCache : public CacheInterface {
public:
    explicit RedisCache(const AppConfig& config, std::shared_ptr<ILogger> logger);
    ~RedisCache() override;

    RedisCache(const RedisCache&) = delete;
    RedisCache& operator=(const RedisCache&) = delete;

    bool set(const std::string& key, const std::string& value, int ttl = 0) override;
    std::optional<std::string> get(const std::string& key) override;
    bool remove(const std::string& key) override;

    // Deletes every key under the gateway's key prefix, not the whole database.
    bool clear() override;
    bool exists(const std::string& key) override;

    bool isConnected() const;

private:
    struct ReplyDeleter {
        void operator()(redisReply* reply) const;
    };
    using ReplyPtr = std::unique_ptr<redisReply, ReplyDeleter>;

    // Callers hold mutex_.
    bool ensureConnected();
    void connect();
    void disconnect();
    ReplyPtr command(const char* format, const std::string& arg);

    std::string host_;
    int port_;
    int default_ttl_seconds_;
    std::shared_ptr<ILogger> logger_;
    redisContext* redis_context_;
    mutable std::mutex mutex_;
};

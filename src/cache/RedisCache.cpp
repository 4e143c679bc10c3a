#include <stdexcept>

#include <hiredis/hiredis.h>

#include "RedisCache.hpp"
#include "../interfaces/ILogger.hpp"

namespace {

constexpr const char* kKeyPattern = "proxy:*";

} // namespace

void RedisCache::ReplyDeleter::operator()(redisReply* reply) const {
    if (reply) {
        freeReplyObject(reply);
    }
}

RedisCache::RedisCache(const AppConfig& config, std::shared_ptr<ILogger> logger)
    : host_(config.redis_host),
      port_(config.redis_port),
      default_ttl_seconds_(config.cache_ttl_in_seconds),
      logger_(logger),
      redis_context_(nullptr) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for RedisCache");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    connect();
}

RedisCache::~RedisCache() {
    std::lock_guard<std::mutex> lock(mutex_);
    disconnect();
}

void RedisCache::connect() {
    redis_context_ = redisConnect(host_.c_str(), port_);
    if (redis_context_ == nullptr || redis_context_->err) {
        std::string error_msg;
        if (redis_context_) {
            error_msg = "Redis connection error: " + std::string(redis_context_->errstr);
            disconnect();
        } else {
            error_msg = "Redis connection error: can't allocate redis context";
        }
        logger_->error(error_msg);
    }
}

void RedisCache::disconnect() {
    if (redis_context_) {
        redisFree(redis_context_);
        redis_context_ = nullptr;
    }
}

bool RedisCache::ensureConnected() {
    if (!redis_context_) {
        connect();
    }
    return redis_context_ != nullptr;
}

RedisCache::ReplyPtr RedisCache::command(const char* format, const std::string& arg) {
    ReplyPtr reply(static_cast<redisReply*>(redisCommand(redis_context_, format, arg.data(), arg.size())));
    if (!reply) {
        // The context is unusable after an I/O error; reconnect on the next command.
        logger_->error("Redis command failed: " + std::string(redis_context_->errstr));
        disconnect();
    }
    return reply;
}

bool RedisCache::set(const std::string& key, const std::string& value, int ttl) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ensureConnected()) {
        logger_->error("Redis not connected. Cannot SET key: " + key);
        return false;
    }

    int effective_ttl = ttl > 0 ? ttl : default_ttl_seconds_;
    ReplyPtr reply(static_cast<redisReply*>(redisCommand(redis_context_, "SETEX %b %d %b",
                                                         key.data(), key.size(),
                                                         effective_ttl,
                                                         value.data(), value.size())));
    if (!reply) {
        logger_->error("Redis SETEX failed for key " + key + ": " + std::string(redis_context_->errstr));
        disconnect();
        return false;
    }
    if (reply->type == REDIS_REPLY_ERROR) {
        logger_->error("Redis SETEX rejected for key " + key + ": " + std::string(reply->str, reply->len));
        return false;
    }
    return true;
}

std::optional<std::string> RedisCache::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ensureConnected()) {
        logger_->error("Redis not connected. Cannot GET key: " + key);
        return std::nullopt;
    }

    ReplyPtr reply = command("GET %b", key);
    if (!reply || reply->type != REDIS_REPLY_STRING) {
        return std::nullopt;
    }
    return std::string(reply->str, reply->len);
}

bool RedisCache::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ensureConnected()) {
        logger_->error("Redis not connected. Cannot DEL key: " + key);
        return false;
    }

    ReplyPtr reply = command("DEL %b", key);
    return reply && reply->type == REDIS_REPLY_INTEGER && reply->integer > 0;
}

bool RedisCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ensureConnected()) {
        logger_->error("Redis not connected. Cannot clear cache keys.");
        return false;
    }

    std::string cursor = "0";
    do {
        ReplyPtr reply(static_cast<redisReply*>(redisCommand(redis_context_, "SCAN %s MATCH %s COUNT 100",
                                                             cursor.c_str(), kKeyPattern)));
        if (!reply) {
            logger_->error("Redis SCAN failed: " + std::string(redis_context_->errstr));
            disconnect();
            return false;
        }
        if (reply->type != REDIS_REPLY_ARRAY || reply->elements != 2) {
            return false;
        }

        cursor = std::string(reply->element[0]->str, reply->element[0]->len);
        redisReply* keys = reply->element[1];
        for (size_t i = 0; i < keys->elements; ++i) {
            ReplyPtr deleted = command("DEL %b", std::string(keys->element[i]->str, keys->element[i]->len));
            if (!deleted) {
                return false;
            }
        }
    } while (cursor != "0");

    return true;
}

bool RedisCache::exists(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ensureConnected()) {
        logger_->error("Redis not connected. Cannot check EXISTS for key: " + key);
        return false;
    }

    ReplyPtr reply = command("EXISTS %b", key);
    return reply && reply->type == REDIS_REPLY_INTEGER && reply->integer > 0;
}

bool RedisCache::isConnected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return redis_context_ != nullptr;
}

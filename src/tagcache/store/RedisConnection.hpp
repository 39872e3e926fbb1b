#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <hiredis/hiredis.h>
#include "tagcache/cache/metrics/CacheConfig.hpp"

namespace tagcache {
namespace store {
namespace detail {

struct ReplyDeleter {
    void operator()(redisReply* reply) const {
        if (reply) freeReplyObject(reply);
    }
};
using ReplyPtr = std::unique_ptr<redisReply, ReplyDeleter>;

/**
 * @brief Одно соединение hiredis с повторным подключением.
 * После ошибки ввода-вывода контекст помечается сломанным, следующий
 * command() один раз переподключается (AUTH и SELECT повторяются).
 * Не потокобезопасно: синхронизация на стороне владельца.
 */
class RedisConnection {
public:
    RedisConnection(std::string host, int port, cache::ConnectionOptions options,
                    std::optional<std::string> password = std::nullopt, int db = 0);
    ~RedisConnection();

    RedisConnection(const RedisConnection&) = delete;
    RedisConnection& operator=(const RedisConnection&) = delete;

    /// Выполнить команду. ConnectionError при сбое сети, StoreError при ответе-ошибке.
    ReplyPtr command(const std::vector<std::string>& args);

    const std::string& address() const { return address_; }

private:
    void connect();
    [[noreturn]] void fail(const std::string& what);

    std::string host_;
    int port_;
    std::string address_;
    cache::ConnectionOptions options_;
    std::optional<std::string> password_;
    int db_;
    std::unique_ptr<redisContext, void (*)(redisContext*)> context_;
};

// Разбор ответов
std::string replyString(const redisReply* reply);
long long replyInteger(const redisReply* reply);
const char* replyTypeName(int type);

} // namespace detail
} // namespace store
} // namespace tagcache

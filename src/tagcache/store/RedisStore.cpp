#include "tagcache/store/RedisStore.hpp"
#include <algorithm>
#include <mutex>
#include <spdlog/fmt/fmt.h>
#include "RedisConnection.hpp"
#include "tagcache/cache/base/CacheError.hpp"
#include "tagcache/log/Logger.hpp"

namespace tagcache {
namespace store {

namespace {

constexpr const char* kScanBatch = "1000";

// Экранирование спецсимволов glob для SCAN MATCH
std::string escapeGlob(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        if (c == '*' || c == '?' || c == '[' || c == ']' || c == '\\') {
            escaped.push_back('\\');
        }
        escaped.push_back(c);
    }
    return escaped;
}

std::string toString(const Bytes& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

} // namespace

struct RedisStore::Impl {
    detail::RedisConnection connection;
    std::mutex mutex;

    explicit Impl(const RedisEndpoint& endpoint)
        : connection(endpoint.host, endpoint.port, endpoint.connection, endpoint.password, endpoint.db) {}

    detail::ReplyPtr command(const std::vector<std::string>& args) {
        std::lock_guard<std::mutex> lock(mutex);
        return connection.command(args);
    }
};

RedisStore::RedisStore(const RedisEndpoint& endpoint)
    : pImpl(std::make_unique<Impl>(endpoint)) {
}

RedisStore::~RedisStore() = default;

std::optional<Bytes> RedisStore::get(const std::string& key) {
    auto reply = pImpl->command({"GET", key});
    if (reply->type == REDIS_REPLY_NIL) {
        return std::nullopt;
    }
    if (reply->type != REDIS_REPLY_STRING) {
        throw StoreError(fmt::format("GET {} returned {}", key, detail::replyTypeName(reply->type)));
    }
    return Bytes(reply->str, reply->str + reply->len);
}

void RedisStore::set(const std::string& key, const Bytes& value) {
    pImpl->command({"SET", key, toString(value)});
}

void RedisStore::setWithTtl(const std::string& key, const Bytes& value, std::chrono::seconds ttl) {
    pImpl->command({"SETEX", key, std::to_string(ttl.count()), toString(value)});
}

bool RedisStore::remove(const std::string& key) {
    auto reply = pImpl->command({"DEL", key});
    return detail::replyInteger(reply.get()) > 0;
}

bool RedisStore::exists(const std::string& key) {
    auto reply = pImpl->command({"EXISTS", key});
    return detail::replyInteger(reply.get()) > 0;
}

void RedisStore::expire(const std::string& key, std::chrono::seconds ttl) {
    pImpl->command({"EXPIRE", key, std::to_string(ttl.count())});
}

std::vector<std::string> RedisStore::keysWithPrefix(const std::string& prefix) {
    std::vector<std::string> keys;
    std::string pattern = escapeGlob(prefix) + "*";
    std::string cursor = "0";
    do {
        auto reply = pImpl->command({"SCAN", cursor, "MATCH", pattern, "COUNT", kScanBatch});
        if (reply->type != REDIS_REPLY_ARRAY || reply->elements != 2 ||
            reply->element[1]->type != REDIS_REPLY_ARRAY) {
            throw StoreError(fmt::format("SCAN on {} returned malformed reply", describe()));
        }
        cursor = detail::replyString(reply->element[0]);
        const redisReply* batch = reply->element[1];
        for (size_t i = 0; i < batch->elements; ++i) {
            auto key = detail::replyString(batch->element[i]);
            if (key.compare(0, prefix.size(), prefix) == 0) {
                keys.push_back(std::move(key));
            }
        }
    } while (cursor != "0");

    // SCAN может вернуть ключ повторно
    std::sort(keys.begin(), keys.end());
    keys.erase(std::unique(keys.begin(), keys.end()), keys.end());
    return keys;
}

void RedisStore::setAdd(const std::string& setKey, const std::vector<std::string>& members) {
    if (members.empty()) {
        return;
    }
    std::vector<std::string> args;
    args.reserve(members.size() + 2);
    args.push_back("SADD");
    args.push_back(setKey);
    args.insert(args.end(), members.begin(), members.end());
    pImpl->command(args);
}

void RedisStore::setRemove(const std::string& setKey, const std::string& member) {
    pImpl->command({"SREM", setKey, member});
}

std::unordered_set<std::string> RedisStore::setMembers(const std::string& setKey) {
    auto reply = pImpl->command({"SMEMBERS", setKey});
    std::unordered_set<std::string> members;
    if (reply->type != REDIS_REPLY_ARRAY && reply->type != REDIS_REPLY_SET) {
        throw StoreError(fmt::format("SMEMBERS {} returned {}", setKey, detail::replyTypeName(reply->type)));
    }
    for (size_t i = 0; i < reply->elements; ++i) {
        members.insert(detail::replyString(reply->element[i]));
    }
    return members;
}

size_t RedisStore::setCardinality(const std::string& setKey) {
    auto reply = pImpl->command({"SCARD", setKey});
    return static_cast<size_t>(detail::replyInteger(reply.get()));
}

std::string RedisStore::describe() const {
    return "redis://" + pImpl->connection.address();
}

void RedisStore::ping() {
    auto reply = pImpl->command({"PING"});
    auto pong = detail::replyString(reply.get());
    if (pong != "PONG") {
        throw StoreError(fmt::format("Unexpected PING reply from {}: {}", describe(), pong));
    }
}

std::string RedisStore::role() {
    auto reply = pImpl->command({"ROLE"});
    if (reply->type != REDIS_REPLY_ARRAY || reply->elements == 0) {
        throw StoreError(fmt::format("ROLE on {} returned malformed reply", describe()));
    }
    return detail::replyString(reply->element[0]);
}

} // namespace store
} // namespace tagcache

#include "RedisConnection.hpp"
#include <sys/time.h>
#include <spdlog/fmt/fmt.h>
#include "tagcache/cache/base/CacheError.hpp"
#include "tagcache/log/Logger.hpp"

namespace tagcache {
namespace store {
namespace detail {

namespace {

timeval toTimeval(std::chrono::milliseconds timeout) {
    timeval tv;
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    return tv;
}

} // namespace

RedisConnection::RedisConnection(std::string host, int port, cache::ConnectionOptions options,
                                 std::optional<std::string> password, int db)
    : host_(std::move(host))
    , port_(port)
    , address_(fmt::format("{}:{}", host_, port))
    , options_(options)
    , password_(std::move(password))
    , db_(db)
    , context_(nullptr, redisFree) {
    connect();
}

RedisConnection::~RedisConnection() = default;

void RedisConnection::connect() {
    redisContext* raw = nullptr;
    if (options_.connectTimeout.count() > 0) {
        raw = redisConnectWithTimeout(host_.c_str(), port_, toTimeval(options_.connectTimeout));
    } else {
        raw = redisConnect(host_.c_str(), port_);
    }
    if (!raw) {
        throw ConnectionError(fmt::format("Cannot allocate redis context for {}", address_));
    }
    std::unique_ptr<redisContext, void (*)(redisContext*)> context(raw, redisFree);
    if (context->err) {
        throw ConnectionError(fmt::format("Cannot connect to {}: {}", address_, context->errstr));
    }
    if (options_.socketTimeout.count() > 0 &&
        redisSetTimeout(context.get(), toTimeval(options_.socketTimeout)) != REDIS_OK) {
        throw ConnectionError(fmt::format("Cannot set socket timeout on {}: {}", address_, context->errstr));
    }
    if (options_.keepAlive &&
        redisEnableKeepAliveWithInterval(context.get(), static_cast<int>(options_.keepAliveInterval.count())) != REDIS_OK) {
        log::get()->warn("Cannot enable keep-alive on {}: {}", address_, context->errstr);
    }
    context_ = std::move(context);

    try {
        if (password_) {
            command({"AUTH", *password_});
        }
        if (db_ != 0) {
            command({"SELECT", std::to_string(db_)});
        }
    } catch (const StoreError& e) {
        context_.reset();
        throw ConnectionError(fmt::format("Handshake with {} failed: {}", address_, e.what()));
    }
    log::get()->debug("Connected to redis at {} (db {})", address_, db_);
}

void RedisConnection::fail(const std::string& what) {
    std::string reason = context_ ? context_->errstr : "no context";
    context_.reset();
    log::get()->warn("{} on {} failed: {}", what, address_, reason);
    throw ConnectionError(fmt::format("{} on {} failed: {}", what, address_, reason));
}

ReplyPtr RedisConnection::command(const std::vector<std::string>& args) {
    if (!context_) {
        log::get()->warn("Reconnecting to {}", address_);
        connect();
    }

    std::vector<const char*> argv;
    std::vector<size_t> argvlen;
    argv.reserve(args.size());
    argvlen.reserve(args.size());
    for (const auto& arg : args) {
        argv.push_back(arg.data());
        argvlen.push_back(arg.size());
    }

    void* raw = redisCommandArgv(context_.get(), static_cast<int>(args.size()), argv.data(), argvlen.data());
    if (!raw) {
        fail(args.front());
    }
    ReplyPtr reply(static_cast<redisReply*>(raw));
    if (reply->type == REDIS_REPLY_ERROR) {
        throw StoreError(fmt::format("{} on {} failed: {}", args.front(), address_,
                                     std::string(reply->str, reply->len)));
    }
    return reply;
}

std::string replyString(const redisReply* reply) {
    switch (reply->type) {
        case REDIS_REPLY_STRING:
        case REDIS_REPLY_STATUS:
        case REDIS_REPLY_VERB:
            return std::string(reply->str, reply->len);
        case REDIS_REPLY_INTEGER:
            return std::to_string(reply->integer);
        default:
            throw StoreError(fmt::format("Expected string reply, got {}", replyTypeName(reply->type)));
    }
}

long long replyInteger(const redisReply* reply) {
    if (reply->type != REDIS_REPLY_INTEGER) {
        throw StoreError(fmt::format("Expected integer reply, got {}", replyTypeName(reply->type)));
    }
    return reply->integer;
}

const char* replyTypeName(int type) {
    switch (type) {
        case REDIS_REPLY_STRING: return "string";
        case REDIS_REPLY_ARRAY: return "array";
        case REDIS_REPLY_INTEGER: return "integer";
        case REDIS_REPLY_NIL: return "nil";
        case REDIS_REPLY_STATUS: return "status";
        case REDIS_REPLY_ERROR: return "error";
        default: return "other";
    }
}

} // namespace detail
} // namespace store
} // namespace tagcache

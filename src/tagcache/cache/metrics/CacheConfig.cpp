#include "tagcache/cache/metrics/CacheConfig.hpp"
#include "tagcache/cache/base/CacheError.hpp"
#include <spdlog/spdlog.h>
#include "tagcache/codec/ValueCodec.hpp"

namespace tagcache {
namespace cache {

namespace {

void validatePort(int port, const std::string& what) {
    if (port <= 0 || port > 65535) {
        throw ConfigurationError(what + ": port out of range: " + std::to_string(port));
    }
}

void readConnection(const nlohmann::json& json, ConnectionOptions& options) {
    if (json.contains("connectTimeoutMs")) {
        options.connectTimeout = std::chrono::milliseconds(json.at("connectTimeoutMs").get<int64_t>());
    }
    if (json.contains("socketTimeoutMs")) {
        options.socketTimeout = std::chrono::milliseconds(json.at("socketTimeoutMs").get<int64_t>());
    }
    options.keepAlive = json.value("keepAlive", options.keepAlive);
    if (json.contains("keepAliveIntervalSec")) {
        options.keepAliveInterval = std::chrono::seconds(json.at("keepAliveIntervalSec").get<int64_t>());
    }
}

nlohmann::json writeConnection(const ConnectionOptions& options) {
    return {
        {"connectTimeoutMs", options.connectTimeout.count()},
        {"socketTimeoutMs", options.socketTimeout.count()},
        {"keepAlive", options.keepAlive},
        {"keepAliveIntervalSec", options.keepAliveInterval.count()}
    };
}

std::optional<std::string> readOptionalString(const nlohmann::json& json, const char* name) {
    if (!json.contains(name) || json.at(name).is_null()) {
        return std::nullopt;
    }
    return json.at(name).get<std::string>();
}

// Адрес Sentinel: {"host": ..., "port": ...} или строка "host:port"
SentinelAddress readSentinelAddress(const nlohmann::json& json) {
    SentinelAddress address;
    if (json.is_string()) {
        auto text = json.get<std::string>();
        auto colon = text.rfind(':');
        if (colon == std::string::npos) {
            address.host = text;
        } else {
            address.host = text.substr(0, colon);
            try {
                address.port = std::stoi(text.substr(colon + 1));
            } catch (const std::exception&) {
                throw ConfigurationError("Invalid sentinel address: " + text);
            }
        }
    } else {
        address.host = json.at("host").get<std::string>();
        address.port = json.value("port", address.port);
    }
    return address;
}

} // namespace

void ConnectionOptions::validate() const {
    if (connectTimeout.count() < 0 || socketTimeout.count() < 0) {
        throw ConfigurationError("Connection timeouts must not be negative");
    }
    if (keepAlive && keepAliveInterval.count() <= 0) {
        throw ConfigurationError("Keep-alive interval must be positive");
    }
}

void RedisConfig::validate() const {
    if (host.empty()) {
        throw ConfigurationError("Redis host is required");
    }
    validatePort(port, "Redis");
    if (db < 0) {
        throw ConfigurationError("Redis database index must not be negative");
    }
    connection.validate();
}

void SentinelConfig::validate() const {
    if (sentinels.empty()) {
        throw ConfigurationError("At least one sentinel address is required");
    }
    for (const auto& sentinel : sentinels) {
        if (sentinel.host.empty()) {
            throw ConfigurationError("Sentinel host is required");
        }
        validatePort(sentinel.port, "Sentinel " + sentinel.host);
    }
    if (serviceName.empty()) {
        throw ConfigurationError("Sentinel service name is required");
    }
    if (db < 0) {
        throw ConfigurationError("Redis database index must not be negative");
    }
    connection.validate();
}

void LogConfig::validate() const {
    // from_str превращает неизвестное имя в off
    if (!level.empty() && level != "off" && spdlog::level::from_str(level) == spdlog::level::off) {
        throw ConfigurationError("Unknown log level: " + level);
    }
}

void CacheConfig::validate() const {
    codec::parseFormat(codec);
    log.validate();
    if (backend == "memory") {
        return;
    }
    if (backend == "redis") {
        redis.validate();
        return;
    }
    if (backend == "redis-sentinel") {
        sentinel.validate();
        return;
    }
    throw ConfigurationError("Unsupported backend: " + backend);
}

CacheConfig CacheConfig::fromJson(const nlohmann::json& json) {
    CacheConfig config;
    try {
        config.backend = json.value("backend", config.backend);
        config.codec = json.value("codec", config.codec);

        if (json.contains("redis")) {
            const auto& r = json.at("redis");
            config.redis.host = r.value("host", config.redis.host);
            config.redis.port = r.value("port", config.redis.port);
            config.redis.db = r.value("db", config.redis.db);
            config.redis.password = readOptionalString(r, "password");
            config.redis.prefix = r.value("prefix", config.redis.prefix);
            readConnection(r, config.redis.connection);
        }

        if (json.contains("sentinel")) {
            const auto& s = json.at("sentinel");
            if (s.contains("sentinels")) {
                for (const auto& address : s.at("sentinels")) {
                    config.sentinel.sentinels.push_back(readSentinelAddress(address));
                }
            }
            config.sentinel.serviceName = s.value("serviceName", config.sentinel.serviceName);
            config.sentinel.db = s.value("db", config.sentinel.db);
            config.sentinel.password = readOptionalString(s, "password");
            config.sentinel.sentinelPassword = readOptionalString(s, "sentinelPassword");
            config.sentinel.prefix = s.value("prefix", config.sentinel.prefix);
            readConnection(s, config.sentinel.connection);
        }

        if (json.contains("log")) {
            const auto& l = json.at("log");
            config.log.level = l.value("level", config.log.level);
            config.log.file = l.value("file", config.log.file);
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError(std::string("Invalid cache configuration: ") + e.what());
    }
    return config;
}

nlohmann::json CacheConfig::toJson() const {
    auto redact = [](const std::optional<std::string>& secret) -> nlohmann::json {
        if (!secret) return nullptr;
        return "***";
    };

    nlohmann::json sentinelAddresses = nlohmann::json::array();
    for (const auto& address : sentinel.sentinels) {
        sentinelAddresses.push_back({{"host", address.host}, {"port", address.port}});
    }

    nlohmann::json redisJson = writeConnection(redis.connection);
    redisJson.update({
        {"host", redis.host},
        {"port", redis.port},
        {"db", redis.db},
        {"password", redact(redis.password)},
        {"prefix", redis.prefix}
    });

    nlohmann::json sentinelJson = writeConnection(sentinel.connection);
    sentinelJson.update({
        {"sentinels", sentinelAddresses},
        {"serviceName", sentinel.serviceName},
        {"db", sentinel.db},
        {"password", redact(sentinel.password)},
        {"sentinelPassword", redact(sentinel.sentinelPassword)},
        {"prefix", sentinel.prefix}
    });

    return {
        {"backend", backend},
        {"codec", codec},
        {"redis", redisJson},
        {"sentinel", sentinelJson},
        {"log", {{"level", log.level}, {"file", log.file}}}
    };
}

} // namespace cache
} // namespace tagcache

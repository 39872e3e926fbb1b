#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace tagcache {
namespace cache {

// Параметры сокета для соединений с Redis и Sentinel
struct ConnectionOptions {
    std::chrono::milliseconds connectTimeout{0};   // 0 = без ограничения
    std::chrono::milliseconds socketTimeout{0};    // 0 = без ограничения
    bool keepAlive = true;
    std::chrono::seconds keepAliveInterval{15};

    void validate() const;
};

// Один сервер Redis
struct RedisConfig {
    std::string host = "localhost";
    int port = 6379;
    int db = 0;
    std::optional<std::string> password;
    std::string prefix = "cache:";
    ConnectionOptions connection;

    void validate() const;
};

struct SentinelAddress {
    std::string host;
    int port = 26379;
};

// Redis под управлением Sentinel
struct SentinelConfig {
    std::vector<SentinelAddress> sentinels;
    std::string serviceName;
    int db = 0;
    std::optional<std::string> password;          // пароль primary/replica
    std::optional<std::string> sentinelPassword;  // пароль самих Sentinel
    std::string prefix = "cache:";
    ConnectionOptions connection{std::chrono::milliseconds(100), std::chrono::milliseconds(100)};

    void validate() const;
};

// Пустое поле не меняет текущую настройку общего логгера
struct LogConfig {
    std::string level;  // "trace", "debug", "info", "warning", "error", "critical", "off"
    std::string file;   // файл журнала в дополнение к stdout

    void validate() const;
};

/**
 * @brief Унифицированная конфигурация кэша.
 * backend: "memory", "redis" или "redis-sentinel".
 * codec: "msgpack", "cbor" или "json" (только для удалённых бэкендов).
 */
struct CacheConfig {
    std::string backend = "memory";
    std::string codec = "msgpack";
    RedisConfig redis;
    SentinelConfig sentinel;
    LogConfig log;

    /// Проверить параметры выбранного бэкенда. Бросает ConfigurationError.
    void validate() const;

    /// Разобрать конфигурацию из JSON. Отсутствующие поля получают значения по умолчанию.
    static CacheConfig fromJson(const nlohmann::json& json);
    /// Пароли в выводе скрываются.
    nlohmann::json toJson() const;
};

} // namespace cache
} // namespace tagcache

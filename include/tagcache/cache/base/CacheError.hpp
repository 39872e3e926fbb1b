#pragma once

#include <stdexcept>
#include <string>

namespace tagcache {

/**
 * @brief Базовое исключение библиотеки.
 * Отсутствие ключа или тега ошибкой не считается.
 */
class CacheError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Некорректная конфигурация: неизвестный бэкенд, пустой хост и т.п.
class ConfigurationError : public CacheError {
public:
    using CacheError::CacheError;
};

/// Хранилище недоступно, таймаут, ошибка ввода-вывода, primary не найден.
class ConnectionError : public CacheError {
public:
    using CacheError::CacheError;
};

/// Значение не кодируется или сохранённые байты не декодируются.
class SerializationError : public CacheError {
public:
    using CacheError::CacheError;
};

/// Сервер вернул ответ-ошибку или ответ неожиданного типа.
class StoreError : public CacheError {
public:
    using CacheError::CacheError;
};

} // namespace tagcache

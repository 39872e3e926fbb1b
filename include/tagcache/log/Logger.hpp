#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace tagcache {
namespace log {

// Имя общего логгера библиотеки в реестре spdlog
inline constexpr const char* kLoggerName = "tagcache";

/**
 * @brief Получить общий логгер "tagcache".
 * При первом вызове создаётся логгер с цветным выводом в stdout.
 */
std::shared_ptr<spdlog::logger> get();

/**
 * @brief Перенастроить логгер.
 * Пустой параметр оставляет текущую настройку; файл, уже подключённый
 * ранее, повторно не открывается.
 * @param level Уровень в формате spdlog ("trace", "debug", "info", ...)
 * @param file Путь к файлу журнала в дополнение к stdout
 */
void configure(const std::string& level, const std::string& file);

} // namespace log
} // namespace tagcache

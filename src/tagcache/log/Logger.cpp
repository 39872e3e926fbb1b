#include "tagcache/log/Logger.hpp"
#include <filesystem>
#include <iostream>
#include <mutex>
#include <vector>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace tagcache {
namespace log {

namespace {

constexpr size_t kMaxFileSize = 1024 * 1024 * 5;
constexpr size_t kMaxFiles = 3;
constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v";

std::mutex& registryMutex() {
    static std::mutex mutex;
    return mutex;
}

std::shared_ptr<spdlog::logger> makeLogger(const std::string& file) {
    std::vector<spdlog::sink_ptr> sinks;
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern(kPattern);
    sinks.push_back(console_sink);

    if (!file.empty()) {
        auto parent = std::filesystem::path(file).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            file, kMaxFileSize, kMaxFiles);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::info);
    return logger;
}

// Файл, подключённый последним вызовом configure
std::string& currentFile() {
    static std::string file;
    return file;
}

} // namespace

std::shared_ptr<spdlog::logger> get() {
    if (auto logger = spdlog::get(kLoggerName)) {
        return logger;
    }
    std::lock_guard<std::mutex> lock(registryMutex());
    if (auto logger = spdlog::get(kLoggerName)) {
        return logger;
    }
    auto logger = makeLogger("");
    spdlog::register_logger(logger);
    return logger;
}

void configure(const std::string& level, const std::string& file) {
    std::lock_guard<std::mutex> lock(registryMutex());
    auto logger = spdlog::get(kLoggerName);
    if (!file.empty() && file != currentFile()) {
        try {
            auto withFile = makeLogger(file);
            if (logger) {
                withFile->set_level(logger->level());
            }
            spdlog::drop(kLoggerName);
            spdlog::register_logger(withFile);
            logger = withFile;
            currentFile() = file;
        } catch (const std::exception& e) {
            // Остаёмся с прежними sink'ами
            std::cerr << "Failed to initialize tagcache log file '" << file << "': " << e.what() << std::endl;
        }
    }
    if (!logger) {
        logger = makeLogger("");
        spdlog::register_logger(logger);
    }
    if (!level.empty()) {
        logger->set_level(spdlog::level::from_str(level));
    }
}

} // namespace log
} // namespace tagcache

#include "core/cache/CacheLogger.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <filesystem>
#include <iostream>
#include <mutex>

namespace cachekit {
namespace core {
namespace cache {

namespace {
std::mutex loggerMutex;
}

std::shared_ptr<spdlog::logger> namedLogger(const std::string& name) {
    auto logger = spdlog::get(name);
    if (logger) {
        return logger;
    }
    std::lock_guard<std::mutex> lock(loggerMutex);
    logger = spdlog::get(name);
    if (logger) {
        return logger;
    }
    try {
        auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        consoleSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
        logger = std::make_shared<spdlog::logger>(name, consoleSink);
        logger->set_level(spdlog::level::info);
        spdlog::register_logger(logger);
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Ошибка инициализации логгера " << name << ": " << e.what() << std::endl;
        logger = spdlog::default_logger();
    }
    return logger;
}

void enableFileLogging(const std::string& path, size_t maxBytes, size_t maxFiles) {
    std::filesystem::path filePath(path);
    if (filePath.has_parent_path()) {
        std::filesystem::create_directories(filePath.parent_path());
    }
    auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(path, maxBytes, maxFiles);
    for (const char* name : {CACHE_LOGGER_NAME, SECURITY_LOGGER_NAME}) {
        auto logger = namedLogger(name);
        logger->sinks().push_back(fileSink);
    }
}

} // namespace cache
} // namespace core
} // namespace cachekit

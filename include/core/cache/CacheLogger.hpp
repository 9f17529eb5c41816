#pragma once
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace cachekit {
namespace core {
namespace cache {

constexpr const char* CACHE_LOGGER_NAME = "cachekit";
constexpr const char* SECURITY_LOGGER_NAME = "cachekit.security";

// Именованный логгер; создаётся при первом обращении (stdout_color_sink_mt)
std::shared_ptr<spdlog::logger> namedLogger(const std::string& name);
inline std::shared_ptr<spdlog::logger> cacheLogger() { return namedLogger(CACHE_LOGGER_NAME); }

// Добавить rotating-файл ко всем логгерам кэша (для хост-приложения)
void enableFileLogging(const std::string& path, size_t maxBytes = 5 * 1024 * 1024, size_t maxFiles = 2);

} // namespace cache
} // namespace core
} // namespace cachekit

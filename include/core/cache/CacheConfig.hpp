#pragma once
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/security/SecurityConfig.hpp"

namespace cachekit {
namespace core {
namespace cache {

// Стратегия задаёт значения по умолчанию для CacheConfig
enum class CacheStrategy {
    Fast,
    Balanced,
    Robust,
    AiOptimized
};

std::string toString(CacheStrategy strategy);
std::optional<CacheStrategy> strategyFromString(const std::string& name);

// Допустимые диапазоны параметров
constexpr int MIN_TTL_SECONDS = 60;
constexpr int MAX_TTL_SECONDS = 86400;
constexpr int MIN_CONNECTIONS = 1;
constexpr int MAX_CONNECTIONS = 100;
constexpr int MIN_TIMEOUT_SECONDS = 1;
constexpr int MAX_TIMEOUT_SECONDS = 30;
constexpr size_t MIN_COMPRESSION_THRESHOLD = 1024;
constexpr size_t MAX_COMPRESSION_THRESHOLD = 65536;
constexpr int MIN_COMPRESSION_LEVEL = 1;
constexpr int MAX_COMPRESSION_LEVEL = 9;
constexpr size_t MIN_MEMORY_CACHE_SIZE = 1;
constexpr size_t MAX_MEMORY_CACHE_SIZE = 10000;
constexpr size_t MAX_TEXT_HASH_THRESHOLD = 100000;

// Границы категорий размера текста (символы)
struct TextSizeTiers {
    size_t small = 500;
    size_t medium = 5000;
    size_t large = 50000;
    bool operator==(const TextSizeTiers& o) const { return small == o.small && medium == o.medium && large == o.large; }
};

// Результат проверки конфигурации
struct ValidationResult {
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    bool isValid() const { return errors.empty(); }
    nlohmann::json toJson() const {
        return {{"is_valid", isValid()}, {"errors", errors}, {"warnings", warnings}};
    }
};

// CacheConfig: параметры кэша (стратегия, TTL, пул, сжатие, AI, безопасность)
struct CacheConfig {
    CacheStrategy strategy = CacheStrategy::Balanced;
    std::optional<std::string> remoteUrl;     // redis:// | rediss://; пусто = только память
    int defaultTtlSeconds = 3600;             // TTL по умолчанию
    int maxConnections = 10;                  // Размер пула
    int connectionTimeoutSeconds = 5;         // Таймаут удалённых операций
    size_t compressionThresholdBytes = 1024;  // Порог сжатия
    int compressionLevel = 6;                 // zlib 1-9
    size_t memoryCacheSize = 100;             // Записей в L1
    bool enableAiFeatures = false;
    std::map<std::string, int> operationTtls; // Операция -> TTL
    std::optional<security::SecurityConfig> securityConfig;
    bool failOnConnectionError = false;       // Не переходить на память при сбое
    size_t textHashThreshold = 1000;          // Текст длиннее -> хеш в ключе
    TextSizeTiers textSizeTiers;
    size_t maxTextLength = 100000;            // Лимит длины текста AI-кэша
    bool enableMonitoring = true;
    std::string logLevel = "info";

    static CacheConfig forStrategy(CacheStrategy strategy); // Значения стратегии
    ValidationResult validate() const; // Не бросает

    int ttlFor(const std::string& operation) const; // operationTtls или defaultTtlSeconds

    nlohmann::json toJson() const;       // Полная форма, fromJson(toJson()) == *this
    nlohmann::json toMaskedJson() const; // Для логов и отчётов: пароли в URL и security скрыты
    static CacheConfig fromJson(const nlohmann::json& j); // Бросает ConfigurationError
    // Наложить частичные переопределения (CACHE_CUSTOM_CONFIG и т.п.)
    static CacheConfig applyOverrides(CacheConfig base, const nlohmann::json& overrides);

    bool operator==(const CacheConfig& other) const;
    bool operator!=(const CacheConfig& other) const { return !(*this == other); }

private:
    nlohmann::json serialize(bool maskSecrets) const;
};

// Разбор redis:// URL
struct RedisEndpoint {
    std::string host;
    int port = 6379;
    bool tls = false;
    std::string username;
    std::string password;
    int database = 0;
};

std::optional<RedisEndpoint> parseRedisUrl(const std::string& url);

} // namespace cache
} // namespace core
} // namespace cachekit

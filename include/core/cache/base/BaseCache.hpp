#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/cache/metrics/CacheMetrics.hpp"

namespace cachekit {
namespace core {
namespace cache {

using Bytes = std::vector<uint8_t>;

constexpr size_t MAX_PATTERN_LENGTH = 512;
constexpr size_t MAX_PATTERN_WILDCARDS = 32;

// ICache: общий интерфейс реализаций кэша (память, двухуровневый, AI)
// Операции get/set/remove не бросают исключений: сбой хранилища = промах или false
class ICache {
public:
    virtual ~ICache() = default;

    virtual bool get(const std::string& key, Bytes& value) = 0; // true = попадание
    virtual bool set(const std::string& key, const Bytes& value, int ttlSeconds = 0) = 0; // 0 = TTL по умолчанию
    virtual bool remove(const std::string& key) = 0; // true = ключ был удалён
    virtual bool exists(const std::string& key) = 0;
    // Glob-шаблон (*, ?, [..]); пустой шаблон -> ValidationError
    virtual size_t invalidatePattern(const std::string& pattern, const std::string& operationContext = {}) = 0;
    virtual bool ping() = 0; // Доступность хранилища
    virtual void close() = 0; // Освобождение ресурсов
    virtual bool isClosed() const = 0;

    virtual size_t size() const = 0; // Записей в L1
    virtual nlohmann::json getStats() const = 0;
    virtual MemoryUsageMeasurement memoryUsage() const = 0;
    virtual std::string cacheType() const = 0; // memory | redis | ai_redis

    bool getString(const std::string& key, std::string& value); // Строковые обёртки
    bool setString(const std::string& key, const std::string& value, int ttlSeconds = 0);
};

// Redis-совместимое сопоставление glob-шаблонов
bool globMatch(const std::string& pattern, const std::string& text);
// Проверка шаблона инвалидации: пустой, длиннее MAX_PATTERN_LENGTH или с избытком * -> ValidationError
void validatePattern(const std::string& pattern);

} // namespace cache
} // namespace core
} // namespace cachekit

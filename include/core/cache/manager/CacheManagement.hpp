#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/cache/CacheConfig.hpp"
#include "core/cache/base/BaseCache.hpp"
#include "core/cache/metrics/PerformanceMonitor.hpp"
#include "core/security/SecurityManager.hpp"

namespace cachekit {
namespace core {
namespace cache {

constexpr size_t MAX_INVALIDATION_PATTERN_LENGTH = MAX_PATTERN_LENGTH;
constexpr const char* HEALTH_CHECK_KEY = "cachekit:health_check";

// CacheManagement: функции для внешнего HTTP-слоя (здоровье, метрики, инвалидация, проверка конфигурации)
// Сам порт не открывает
class CacheManagement {
public:
    CacheManagement(std::shared_ptr<ICache> cache, std::shared_ptr<PerformanceMonitor> monitor, CacheConfig config);

    // {status: healthy|degraded|unhealthy, cache_type, ping_success, operation_test, ...}
    nlohmann::json healthSnapshot();
    nlohmann::json metricsSnapshot(); // Форма PerformanceMonitor::getStats() + статистика кэша
    // ValidationError для пустого, слишком общего (*) или слишком длинного шаблона
    nlohmann::json invalidate(const std::string& pattern, const std::string& operationContext = {});
    std::vector<std::string> validateConfiguration() const; // Понятные человеку проблемы
    nlohmann::json securityStatus() const;

    const CacheConfig& config() const { return config_; }

private:
    static void checkPattern(const std::string& pattern);

    std::shared_ptr<ICache> cache_;
    std::shared_ptr<PerformanceMonitor> monitor_;
    CacheConfig config_;
    std::unique_ptr<security::SecurityManager> security_;
};

} // namespace cache
} // namespace core
} // namespace cachekit

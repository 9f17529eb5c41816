#pragma once
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/cache/CacheConfig.hpp"
#include "core/cache/base/BaseCache.hpp"
#include "core/cache/metrics/PerformanceMonitor.hpp"
#include "core/cache/redis/AIResponseCache.hpp"
#include "core/cache/remote/RedisConnectionPool.hpp"
#include "core/security/SecurityConfig.hpp"

namespace cachekit {
namespace core {
namespace cache {

constexpr const char* DEFAULT_WEB_REDIS_URL = "redis://redis:6379";

// CacheFactory: сборка кэша из CacheConfig, проверка конфигурации и политики безопасности,
// пробное подключение, деградация до MemoryCache (или InfrastructureError в строгом режиме)
class CacheFactory {
public:
    explicit CacheFactory(std::shared_ptr<IPerformanceMonitor> monitor = nullMonitor());

    // ConfigurationError при неверной конфигурации; InfrastructureError при failOnConnectionError
    std::shared_ptr<ICache> createCache(const CacheConfig& config) const;
    // Использует внешний пул (общий для реестра); пул не закрывается кэшем
    std::shared_ptr<ICache> createCache(const CacheConfig& config,
                                        std::shared_ptr<remote::RedisConnectionPool> sharedPool) const;

    std::shared_ptr<ICache> forWebApp(const std::string& redisUrl = DEFAULT_WEB_REDIS_URL,
                                      std::optional<security::SecurityConfig> security = std::nullopt,
                                      bool failOnConnectionError = false) const;
    std::shared_ptr<AIResponseCache> forAiApp(const std::string& redisUrl = DEFAULT_WEB_REDIS_URL,
                                              std::optional<security::SecurityConfig> security = std::nullopt,
                                              bool failOnConnectionError = false) const;
    std::shared_ptr<ICache> forTesting() const; // Изолированный MemoryCache
    std::shared_ptr<ICache> createFromMap(const nlohmann::json& config) const;

    static void checkConfiguration(const CacheConfig& config); // validate() + политика безопасности
    // Пул без подключения; бросает ConfigurationError при неверном URL
    static std::shared_ptr<remote::RedisConnectionPool> makePool(const CacheConfig& config);
    static void checkConnection(remote::RedisConnectionPool& pool); // PING, бросает InfrastructureError

    std::shared_ptr<IPerformanceMonitor> monitor() const { return monitor_; }

private:
    std::shared_ptr<ICache> build(const CacheConfig& config, std::shared_ptr<remote::RedisConnectionPool> pool,
                                  bool ownsPool) const;
    std::shared_ptr<ICache> memoryFallback(const CacheConfig& config) const;

    std::shared_ptr<IPerformanceMonitor> monitor_;
};

} // namespace cache
} // namespace core
} // namespace cachekit

#include "core/cache/manager/CacheFactory.hpp"
#include "core/cache/CacheErrors.hpp"
#include "core/cache/CacheLogger.hpp"
#include "core/cache/base/MemoryCache.hpp"
#include "core/cache/redis/GenericRedisCache.hpp"
#include "core/security/SecurityManager.hpp"

namespace cachekit {
namespace core {
namespace cache {

CacheFactory::CacheFactory(std::shared_ptr<IPerformanceMonitor> monitor)
    : monitor_(monitor ? std::move(monitor) : nullMonitor()) {}

void CacheFactory::checkConfiguration(const CacheConfig& config) {
    const auto validation = config.validate();
    for (const auto& warning : validation.warnings) {
        cacheLogger()->warn("CacheFactory: {}", warning);
    }
    if (!validation.isValid()) {
        for (const auto& error : validation.errors) {
            cacheLogger()->error("CacheFactory: {}", error);
        }
        throw ConfigurationError("Invalid cache configuration", validation.errors);
    }
    if (config.securityConfig && config.remoteUrl) {
        security::SecurityManager manager(*config.securityConfig);
        manager.validateMandatorySecurity(*config.remoteUrl);
    }
}

std::shared_ptr<remote::RedisConnectionPool> CacheFactory::makePool(const CacheConfig& config) {
    if (!config.remoteUrl) {
        throw ConfigurationError("Remote cache URL is not configured", {"redis_url: required for remote cache"});
    }
    auto endpoint = parseRedisUrl(*config.remoteUrl);
    if (!endpoint) {
        throw ConfigurationError("Invalid remote cache URL", {"redis_url: must start with redis:// or rediss://"});
    }
    if (config.securityConfig && config.securityConfig->tlsEnabled) {
        endpoint->tls = true;
    }
    return std::make_shared<remote::RedisConnectionPool>(*endpoint, config.securityConfig,
                                                         static_cast<size_t>(config.maxConnections),
                                                         std::chrono::seconds(config.connectionTimeoutSeconds));
}

void CacheFactory::checkConnection(remote::RedisConnectionPool& pool) {
    auto connection = pool.acquire();
    auto reply = connection->command({"PING"});
    if (reply.isError() || reply.str != "PONG") {
        throw InfrastructureError("PING к " + pool.name() + " не прошёл: " + reply.str, pool.name());
    }
}

std::shared_ptr<ICache> CacheFactory::memoryFallback(const CacheConfig& config) const {
    return std::make_shared<MemoryCache>(config.memoryCacheSize, config.defaultTtlSeconds, monitor_);
}

std::shared_ptr<ICache> CacheFactory::build(const CacheConfig& config, std::shared_ptr<remote::RedisConnectionPool> pool,
                                            bool ownsPool) const {
    checkConfiguration(config);
    auto monitor = config.enableMonitoring ? monitor_ : nullMonitor();

    std::shared_ptr<ICache> cache;
    if (!config.remoteUrl) {
        cacheLogger()->info("CacheFactory: redis_url не задан, используется MemoryCache");
        cache = std::make_shared<MemoryCache>(config.memoryCacheSize, config.defaultTtlSeconds, monitor);
    } else {
        try {
            if (!pool) {
                pool = makePool(config);
            }
            checkConnection(*pool);
            auto redisCache = std::make_shared<GenericRedisCache>(pool, config, monitor, ownsPool);
            if (config.securityConfig) {
                security::SecurityManager manager(*config.securityConfig);
                auto result = manager.validateConnectionSecurity(pool->lastSecurityInfo());
                cacheLogger()->info("CacheFactory: безопасность соединения {} ({} баллов)", result.level, result.score);
            }
            cache = redisCache;
        } catch (const InfrastructureError& e) {
            if (ownsPool && pool) {
                pool->closeAll();
            }
            if (config.failOnConnectionError) {
                cacheLogger()->error("CacheFactory: удалённый кэш недоступен, строгий режим: {}", e.what());
                throw;
            }
            cacheLogger()->warn("CacheFactory: удалённый кэш недоступен ({}), переход на MemoryCache", e.what());
            cache = std::make_shared<MemoryCache>(config.memoryCacheSize, config.defaultTtlSeconds, monitor);
        }
    }
    if (config.enableAiFeatures) {
        return std::make_shared<AIResponseCache>(cache, config, monitor);
    }
    return cache;
}

std::shared_ptr<ICache> CacheFactory::createCache(const CacheConfig& config) const {
    return build(config, nullptr, true);
}

std::shared_ptr<ICache> CacheFactory::createCache(const CacheConfig& config,
                                                  std::shared_ptr<remote::RedisConnectionPool> sharedPool) const {
    return build(config, std::move(sharedPool), false);
}

std::shared_ptr<ICache> CacheFactory::forWebApp(const std::string& redisUrl,
                                                std::optional<security::SecurityConfig> security,
                                                bool failOnConnectionError) const {
    auto config = CacheConfig::forStrategy(CacheStrategy::Balanced);
    config.remoteUrl = redisUrl;
    config.defaultTtlSeconds = 1800;
    config.memoryCacheSize = 200;
    config.compressionThresholdBytes = 2048;
    config.compressionLevel = 6;
    config.securityConfig = std::move(security);
    config.failOnConnectionError = failOnConnectionError;
    return createCache(config);
}

std::shared_ptr<AIResponseCache> CacheFactory::forAiApp(const std::string& redisUrl,
                                                        std::optional<security::SecurityConfig> security,
                                                        bool failOnConnectionError) const {
    auto config = CacheConfig::forStrategy(CacheStrategy::AiOptimized);
    config.remoteUrl = redisUrl;
    config.defaultTtlSeconds = 3600;
    config.memoryCacheSize = 100;
    config.compressionThresholdBytes = 1024;
    config.compressionLevel = 6;
    config.textHashThreshold = 500;
    config.securityConfig = std::move(security);
    config.failOnConnectionError = failOnConnectionError;
    return std::static_pointer_cast<AIResponseCache>(createCache(config));
}

std::shared_ptr<ICache> CacheFactory::forTesting() const {
    auto config = CacheConfig::forStrategy(CacheStrategy::Fast);
    config.defaultTtlSeconds = 60;
    config.memoryCacheSize = 50;
    return memoryFallback(config);
}

std::shared_ptr<ICache> CacheFactory::createFromMap(const nlohmann::json& config) const {
    return createCache(CacheConfig::fromJson(config));
}

} // namespace cache
} // namespace core
} // namespace cachekit

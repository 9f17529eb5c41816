#include <cassert>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <unistd.h>
#include <spdlog/spdlog.h>
#include "core/cache/manager/CacheManagement.hpp"
#include "core/cache/manager/CacheRegistry.hpp"
#include "core/cache/redis/GenericRedisCache.hpp"

using namespace cachekit::core::cache;

// Тесты против живого Redis; адрес берётся из CACHEKIT_TEST_REDIS_URL
namespace {

std::string g_redisUrl;
std::string g_prefix;

CacheConfig remoteConfig() {
    auto config = CacheConfig::forStrategy(CacheStrategy::Balanced);
    config.remoteUrl = g_redisUrl;
    config.defaultTtlSeconds = 120;
    config.failOnConnectionError = true;
    return config;
}

} // namespace

void testTwoTierRoundTrip() {
    std::cout << "Testing GenericRedisCache against live Redis...\n";
    auto monitor = std::make_shared<PerformanceMonitor>();
    CacheFactory factory(monitor);
    auto cache = std::dynamic_pointer_cast<GenericRedisCache>(factory.createCache(remoteConfig()));
    assert(cache);
    assert(cache->cacheType() == "redis");
    assert(cache->ping());

    const std::string key = g_prefix + "plain";
    assert(cache->setString(key, "value"));
    cache->memoryTier().clear();
    std::string value;
    assert(cache->getString(key, value) && value == "value");
    assert(cache->getStats()["remote_hits"].get<size_t>() == 1);
    // Второе чтение обслуживается L1
    assert(cache->getString(key, value));
    assert(cache->getStats()["memory_hits"].get<size_t>() == 1);

    const std::string large(8192, 'z');
    assert(cache->setString(g_prefix + "large", large));
    cache->memoryTier().clear();
    assert(cache->getString(g_prefix + "large", value) && value == large);
    assert(cache->getStats()["compression"]["compressed_writes"].get<size_t>() == 1);

    assert(cache->remove(key));
    assert(!cache->exists(key));
    assert(cache->remoteMemoryBytes().has_value());
    cache->close();
    assert(cache->pool()->closed());
    std::cout << "[OK] GenericRedisCache live round trip test\n";
}

void testPatternInvalidation() {
    std::cout << "Testing remote pattern invalidation...\n";
    CacheFactory factory;
    auto cache = factory.createCache(remoteConfig());
    for (int i = 0; i < 5; ++i) {
        cache->setString(g_prefix + "batch:" + std::to_string(i), "v");
    }
    cache->setString(g_prefix + "other", "v");
    assert(cache->invalidatePattern(g_prefix + "batch:*", "integration") == 5);
    assert(cache->exists(g_prefix + "other"));
    cache->invalidatePattern(g_prefix + "*");
    std::cout << "[OK] Remote pattern invalidation test\n";
}

void testRegistrySharedPool() {
    std::cout << "Testing CacheRegistry shared pools...\n";
    CacheRegistry registry(std::make_shared<CacheFactory>());
    auto first = registry.getOrCreate(remoteConfig());
    auto secondConfig = remoteConfig();
    secondConfig.defaultTtlSeconds = 300;
    auto second = registry.getOrCreate(secondConfig);
    assert(first != second);

    auto firstRedis = std::dynamic_pointer_cast<GenericRedisCache>(first);
    auto secondRedis = std::dynamic_pointer_cast<GenericRedisCache>(second);
    assert(firstRedis && secondRedis);
    assert(firstRedis->pool() == secondRedis->pool());
    assert(registry.status()["pools"].size() == 1);

    // Пул живёт, пока его использует хотя бы один кэш
    first->close();
    auto stats = registry.cleanup();
    assert(stats.cleaned == 1);
    assert(stats.disconnected == 0);
    assert(second->ping());

    auto shutdownStats = registry.shutdown();
    assert(shutdownStats.remaining == 0);
    assert(secondRedis->pool()->closed());
    std::cout << "[OK] CacheRegistry shared pool test\n";
}

void testManagementHealth() {
    std::cout << "Testing CacheManagement against live Redis...\n";
    auto monitor = std::make_shared<PerformanceMonitor>();
    CacheFactory factory(monitor);
    auto config = remoteConfig();
    CacheManagement management(factory.createCache(config), monitor, config);
    auto health = management.healthSnapshot();
    assert(health["status"] == "healthy");
    assert(!health["fallback_active"].get<bool>());
    auto metrics = management.metricsSnapshot();
    assert(metrics["cache"]["cache_type"] == "redis");
    std::cout << "[OK] CacheManagement live health test\n";
}

int main() {
    const char* url = std::getenv("CACHEKIT_TEST_REDIS_URL");
    if (!url || std::string(url).empty()) {
        std::cout << "CACHEKIT_TEST_REDIS_URL не задан, интеграционные тесты пропущены\n";
        return 0;
    }
    g_redisUrl = url;
    g_prefix = "cachekit_test:" + std::to_string(getpid()) + ":";
    try {
        testTwoTierRoundTrip();
        testPatternInvalidation();
        testRegistrySharedPool();
        testManagementHealth();
        std::cout << "All Redis integration tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    spdlog::shutdown();
    return 0;
}

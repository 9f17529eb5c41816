#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include "core/cache/CacheErrors.hpp"
#include "core/cache/manager/CacheFactory.hpp"
#include "core/cache/metrics/PerformanceMonitor.hpp"

using namespace cachekit::core::cache;
using cachekit::core::security::SecurityConfig;
using cachekit::core::security::SecurityEnvironment;

namespace {
// Порт 1 на localhost не слушается, подключение отклоняется сразу
constexpr const char* UNREACHABLE_URL = "redis://127.0.0.1:1";
}

void testMemoryOnlyCache() {
    std::cout << "Testing CacheFactory memory-only creation...\n";
    CacheFactory factory;
    auto config = CacheConfig::forStrategy(CacheStrategy::Fast);
    auto cache = factory.createCache(config);
    assert(cache->cacheType() == "memory");
    assert(cache->setString("key", "value"));
    std::string value;
    assert(cache->getString("key", value) && value == "value");

    auto testing = factory.forTesting();
    assert(testing->cacheType() == "memory");
    assert(testing != factory.forTesting());

    auto fromMap = factory.createFromMap({{"strategy", "balanced"}, {"memory_cache_size", 10}});
    assert(fromMap->cacheType() == "memory");
    assert(fromMap->getStats()["memory_capacity"].get<size_t>() == 10);
    std::cout << "[OK] CacheFactory memory-only test\n";
}

void testFallbackToMemory() {
    std::cout << "Testing CacheFactory fallback on unreachable remote...\n";
    CacheFactory factory;
    auto config = CacheConfig::forStrategy(CacheStrategy::Balanced);
    config.remoteUrl = UNREACHABLE_URL;
    config.connectionTimeoutSeconds = 1;
    auto cache = factory.createCache(config);
    assert(cache->cacheType() == "memory");
    assert(cache->ping());

    auto web = factory.forWebApp(UNREACHABLE_URL);
    assert(web->cacheType() == "memory");

    auto ai = factory.forAiApp(UNREACHABLE_URL);
    assert(ai->cacheType() == "ai_memory");
    assert(ai->cacheResponse("some text", "summarize", nlohmann::json::object(), {{"summary", "text"}}));
    assert(ai->getCachedResponse("some text", "summarize"));
    std::cout << "[OK] CacheFactory fallback test\n";
}

void testStrictMode() {
    std::cout << "Testing CacheFactory strict mode...\n";
    CacheFactory factory;
    auto config = CacheConfig::forStrategy(CacheStrategy::Fast);
    config.remoteUrl = UNREACHABLE_URL;
    config.connectionTimeoutSeconds = 1;
    config.failOnConnectionError = true;
    bool thrown = false;
    try {
        factory.createCache(config);
    } catch (const InfrastructureError&) {
        thrown = true;
    }
    assert(thrown);

    thrown = false;
    try {
        factory.forWebApp(UNREACHABLE_URL, std::nullopt, true);
    } catch (const InfrastructureError&) {
        thrown = true;
    }
    assert(thrown);
    std::cout << "[OK] CacheFactory strict mode test\n";
}

void testConfigurationErrors() {
    std::cout << "Testing CacheFactory configuration errors...\n";
    CacheFactory factory;
    auto invalid = CacheConfig::forStrategy(CacheStrategy::Balanced);
    invalid.defaultTtlSeconds = 5;
    bool thrown = false;
    try {
        factory.createCache(invalid);
    } catch (const ConfigurationError& e) {
        thrown = !e.issues().empty();
    }
    assert(thrown);

    // Политика безопасности проверяется до подключения
    auto insecure = CacheConfig::forStrategy(CacheStrategy::Robust);
    insecure.remoteUrl = "redis://cache.internal:6379";
    SecurityConfig security;
    security.authPassword = "a-very-long-password-1234";
    security.environment = SecurityEnvironment::Production;
    insecure.securityConfig = security;
    thrown = false;
    try {
        factory.createCache(insecure);
    } catch (const ConfigurationError&) {
        thrown = true;
    }
    assert(thrown);

    thrown = false;
    try {
        factory.createFromMap({{"strategy", "fast"}, {"unknown_option", 1}});
    } catch (const ConfigurationError&) {
        thrown = true;
    }
    assert(thrown);

    thrown = false;
    try {
        auto config = CacheConfig::forStrategy(CacheStrategy::Fast);
        CacheFactory::makePool(config);
    } catch (const ConfigurationError&) {
        thrown = true;
    }
    assert(thrown);
    std::cout << "[OK] CacheFactory configuration errors test\n";
}

void testMonitoringToggle() {
    std::cout << "Testing CacheFactory monitoring wiring...\n";
    auto monitor = std::make_shared<PerformanceMonitor>();
    CacheFactory factory(monitor);

    auto monitored = factory.createCache(CacheConfig::forStrategy(CacheStrategy::Balanced));
    monitored->setString("a", "1");
    assert(monitor->getStats()["total_cache_operations"].get<size_t>() == 1);

    auto quietConfig = CacheConfig::forStrategy(CacheStrategy::Balanced);
    quietConfig.enableMonitoring = false;
    auto quiet = factory.createCache(quietConfig);
    quiet->setString("a", "1");
    assert(monitor->getStats()["total_cache_operations"].get<size_t>() == 1);
    std::cout << "[OK] CacheFactory monitoring test\n";
}

int main() {
    try {
        testMemoryOnlyCache();
        testFallbackToMemory();
        testStrictMode();
        testConfigurationErrors();
        testMonitoringToggle();
        std::cout << "All CacheFactory tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    spdlog::shutdown();
    return 0;
}

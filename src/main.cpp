#include <iostream>
#include <memory>
#include <atomic>
#include <signal.h>
#include <chrono>
#include <thread>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "core/cache/CacheErrors.hpp"
#include "core/cache/CacheLogger.hpp"
#include "core/cache/manager/CacheFactory.hpp"
#include "core/cache/manager/CacheManagement.hpp"
#include "core/cache/manager/CacheRegistry.hpp"
#include "core/cache/metrics/PerformanceMonitor.hpp"
#include "core/cache/presets/CachePresets.hpp"

using namespace cachekit::core;

std::atomic<bool> g_running{true};

void signalHandler(int) {
    g_running = false;
}

void initializeLogging() {
    try {
        auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        consoleSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
        auto logger = std::make_shared<spdlog::logger>("cachekit_service", consoleSink);
        spdlog::set_default_logger(logger);
        spdlog::set_level(spdlog::level::info);
        cache::enableFileLogging("logs/cachekit.log");
        spdlog::info("=== CacheKit Service Starting ===");
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
        throw;
    }
}

void applyLogLevel(const std::string& level) {
    const auto parsed = spdlog::level::from_str(level);
    for (const char* name : {cache::CACHE_LOGGER_NAME, cache::SECURITY_LOGGER_NAME}) {
        cache::namedLogger(name)->set_level(parsed);
    }
}

void runServiceLoop(cache::CacheManagement& management, cache::CacheRegistry& registry) {
    spdlog::info("Starting service loop...");
    auto lastHealthCheck = std::chrono::steady_clock::now();
    auto lastCleanup = std::chrono::steady_clock::now();
    while (g_running) {
        try {
            auto now = std::chrono::steady_clock::now();
            if (now - lastHealthCheck > std::chrono::seconds(30)) {
                auto health = management.healthSnapshot();
                auto metrics = management.metricsSnapshot();
                spdlog::info("[loop] Кэш {}: {}, hit rate {:.1f}%", health["cache_type"].get<std::string>(),
                             health["status"].get<std::string>(),
                             metrics.value("cache_hit_rate", 0.0));
                lastHealthCheck = now;
            }
            if (now - lastCleanup > std::chrono::minutes(5)) {
                auto stats = registry.cleanup();
                spdlog::debug("[loop] Очистка реестра: {}", stats.toJson().dump());
                lastCleanup = now;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        } catch (const std::exception& e) {
            spdlog::error("Error in service loop: {}", e.what());
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
    }
    spdlog::info("Service loop stopped");
}

int main() {
    try {
        signal(SIGINT, signalHandler);
        signal(SIGTERM, signalHandler);
        signal(SIGPIPE, SIG_IGN);

        initializeLogging();

        cache::CachePresetManager presets;
        auto recommendation = presets.recommendPreset();
        spdlog::info("Рекомендуемый пресет: {} ({})", recommendation.presetName, recommendation.reasoning);

        auto config = presets.loadFromEnvironment();
        applyLogLevel(config.logLevel);

        auto monitor = std::make_shared<cache::PerformanceMonitor>();
        auto factory = std::make_shared<cache::CacheFactory>(monitor);
        cache::CacheRegistry registry(factory);
        auto cacheInstance = registry.getOrCreate(config);
        cache::CacheManagement management(cacheInstance, monitor, config);

        auto health = management.healthSnapshot();
        spdlog::info("Кэш {} запущен, состояние {}", cacheInstance->cacheType(), health["status"].get<std::string>());
        for (const auto& issue : management.validateConfiguration()) {
            spdlog::warn("Конфигурация: {}", issue);
        }

        runServiceLoop(management, registry);

        auto stats = registry.shutdown();
        spdlog::info("Реестр остановлен: {}", stats.toJson().dump());
        spdlog::info("=== CacheKit Service Shutdown Complete ===");
        spdlog::shutdown();
        return 0;
    } catch (const cache::ConfigurationError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        for (const auto& error : e.issues()) {
            std::cerr << "  - " << error << std::endl;
        }
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}

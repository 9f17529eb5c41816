#pragma once
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace cachekit {
namespace core {
namespace cache {

using MetricsClock = std::chrono::system_clock;

// Категория измерения производительности
enum class MeasurementCategory {
    KeyGeneration,
    Get,
    Set,
    Delete,
    Exists,
    Compression,
    Invalidation
};

std::string toString(MeasurementCategory category);

// Контекст измерения; заполняются только поля, относящиеся к категории
struct MeasurementContext {
    size_t textLength = 0;
    std::string operationType;           // summarize, get, ...
    std::optional<bool> cacheHit;        // Только для get
    std::string tier;                    // memory | redis
    size_t originalSize = 0;             // Сжатие
    size_t compressedSize = 0;
    size_t keysAffected = 0;             // Инвалидация
    std::string pattern;
    std::string invalidationType;        // manual | automatic | ...
    std::string operationContext;
    nlohmann::json additional = nlohmann::json::object();
};

// PerformanceMeasurement: одно измерение операции кэша
struct PerformanceMeasurement {
    MeasurementCategory category = MeasurementCategory::Get;
    double durationSeconds = 0.0;
    MetricsClock::time_point timestamp{}; // Пусто -> время записи
    bool success = true;
    MeasurementContext context;

    double compressionRatio() const {
        return context.originalSize > 0
            ? static_cast<double>(context.compressedSize) / static_cast<double>(context.originalSize)
            : 1.0;
    }
    nlohmann::json toJson() const;
};

// MemoryUsageMeasurement: снимок потребления памяти кэшем
struct MemoryUsageMeasurement {
    size_t totalCacheSizeBytes = 0;      // L1 + удалённый
    size_t cacheEntryCount = 0;
    size_t memoryCacheSizeBytes = 0;     // Только L1
    size_t memoryCacheEntryCount = 0;
    size_t memoryCacheCapacity = 0;      // Ёмкость L1 (записей)
    double processMemoryMb = 0.0;
    MetricsClock::time_point timestamp{};
    nlohmann::json additional = nlohmann::json::object();

    double avgEntrySizeBytes() const {
        return memoryCacheEntryCount > 0
            ? static_cast<double>(memoryCacheSizeBytes) / static_cast<double>(memoryCacheEntryCount)
            : 0.0;
    }
    nlohmann::json toJson() const;
};

// CacheMetrics: счётчики одного экземпляра кэша (записи, hit rate, eviction)
struct CacheMetrics {
    size_t memoryEntries = 0;     // Записей в L1
    size_t memoryCapacity = 0;    // Ёмкость L1
    size_t memoryBytes = 0;       // Байт в L1
    size_t hits = 0;
    size_t misses = 0;
    size_t memoryHits = 0;
    size_t remoteHits = 0;
    size_t evictions = 0;
    size_t remoteErrors = 0;      // Сбои удалённого хранилища
    MetricsClock::time_point lastUpdate{};

    double hitRate() const {
        const auto total = hits + misses;
        return total > 0 ? static_cast<double>(hits) / static_cast<double>(total) * 100.0 : 0.0;
    }
    nlohmann::json toJson() const {
        return {
            {"memory_entries", memoryEntries},
            {"memory_capacity", memoryCapacity},
            {"memory_bytes", memoryBytes},
            {"hits", hits},
            {"misses", misses},
            {"memory_hits", memoryHits},
            {"remote_hits", remoteHits},
            {"hit_rate", hitRate()},
            {"evictions", evictions},
            {"remote_errors", remoteErrors},
            {"last_update", std::chrono::duration_cast<std::chrono::milliseconds>(lastUpdate.time_since_epoch()).count()}
        };
    }
};

} // namespace cache
} // namespace core
} // namespace cachekit

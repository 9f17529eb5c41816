#pragma once
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>
#include "core/cache/metrics/CacheMetrics.hpp"

namespace cachekit {
namespace core {
namespace cache {

// IPerformanceMonitor: приёмник измерений, внедряется в кэши и генератор ключей
class IPerformanceMonitor {
public:
    virtual ~IPerformanceMonitor() = default;
    virtual void record(const PerformanceMeasurement& measurement) = 0;
    virtual void recordMemoryUsage(const MemoryUsageMeasurement& measurement) = 0;
    virtual bool enabled() const { return true; }

    void recordKeyGeneration(double duration, size_t textLength, const std::string& operation,
                             nlohmann::json additional = nlohmann::json::object());
    void recordCacheOperation(MeasurementCategory category, double duration, bool success,
                              std::optional<bool> cacheHit, size_t textLength = 0,
                              const std::string& tier = {}, nlohmann::json additional = nlohmann::json::object());
    void recordCompression(size_t originalSize, size_t compressedSize, double duration,
                           const std::string& operation = {});
    void recordInvalidation(const std::string& pattern, size_t keysInvalidated, double duration,
                            const std::string& invalidationType = "manual", const std::string& context = {});
};

// NullPerformanceMonitor: пустая реализация по умолчанию
class NullPerformanceMonitor : public IPerformanceMonitor {
public:
    void record(const PerformanceMeasurement&) override {}
    void recordMemoryUsage(const MemoryUsageMeasurement&) override {}
    bool enabled() const override { return false; }
};

std::shared_ptr<IPerformanceMonitor> nullMonitor(); // Общий экземпляр

struct MonitorThresholds {
    double retentionHours = 1.0;
    size_t maxMeasurements = 1000;              // На каждый вид измерений
    size_t memoryWarningBytes = 50 * 1024 * 1024;
    size_t memoryCriticalBytes = 100 * 1024 * 1024;
    double keyGenerationSlowSeconds = 0.1;
    double cacheOperationSlowSeconds = 0.05;
    size_t invalidationWarningPerHour = 50;
    size_t invalidationCriticalPerHour = 100;
};

// PerformanceMonitor: сбор и анализ метрик кэша (hit rate, латентность, сжатие, память, инвалидации)
class PerformanceMonitor : public IPerformanceMonitor {
public:
    explicit PerformanceMonitor(MonitorThresholds thresholds = {});
    ~PerformanceMonitor() override;

    void record(const PerformanceMeasurement& measurement) override;
    void recordMemoryUsage(const MemoryUsageMeasurement& measurement) override;

    nlohmann::json getStats(); // Очищает устаревшие данные, затем считает
    nlohmann::json getMemoryUsageStats() const;
    nlohmann::json getInvalidationFrequencyStats() const;
    nlohmann::json getMemoryWarnings() const; // critical -> warning -> info
    nlohmann::json getInvalidationRecommendations() const;
    nlohmann::json getSlowOperations(double thresholdMultiplier = 2.0) const;
    void reset(); // Данные сбрасываются, пороги остаются
    nlohmann::json exportMetrics() const;

    double hitRate() const; // Проценты
    const MonitorThresholds& thresholds() const { return thresholds_; }

private:
    template<typename T>
    void trim(std::deque<T>& items, MetricsClock::time_point now) const;
    void purgeLocked(MetricsClock::time_point now);
    size_t invalidationsSinceLocked(MetricsClock::time_point since) const;
    nlohmann::json memoryStatsLocked() const;
    nlohmann::json invalidationStatsLocked() const;
    nlohmann::json memoryWarningsLocked() const;

    MonitorThresholds thresholds_;
    std::deque<PerformanceMeasurement> keyGeneration_;
    std::deque<PerformanceMeasurement> cacheOperations_;
    std::deque<PerformanceMeasurement> compression_;
    std::deque<PerformanceMeasurement> invalidations_;
    std::deque<MemoryUsageMeasurement> memory_;
    size_t cacheHits_ = 0;
    size_t cacheMisses_ = 0;
    size_t totalOperations_ = 0;
    size_t failedOperations_ = 0;
    size_t totalInvalidations_ = 0;
    size_t totalKeysInvalidated_ = 0;
    mutable std::mutex mutex_;
};

} // namespace cache
} // namespace core
} // namespace cachekit

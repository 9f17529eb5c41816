#include "core/cache/metrics/PerformanceMonitor.hpp"
#include "core/cache/CacheLogger.hpp"
#include <algorithm>
#include <cstddef>
#include <map>
#include <numeric>
#include <vector>

namespace cachekit {
namespace core {
namespace cache {

namespace {

constexpr double BYTES_PER_MB = 1024.0 * 1024.0;
constexpr size_t RECENT_INVALIDATIONS = 50;
constexpr size_t RECENT_MEMORY_SAMPLES = 10;
constexpr size_t TOP_PATTERNS = 10;

double mean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double median(std::vector<double> values) {
    if (values.empty()) return 0.0;
    std::sort(values.begin(), values.end());
    const size_t mid = values.size() / 2;
    return values.size() % 2 == 0 ? (values[mid - 1] + values[mid]) / 2.0 : values[mid];
}

double epochSeconds(MetricsClock::time_point tp) {
    return std::chrono::duration<double>(tp.time_since_epoch()).count();
}

int severityRank(const std::string& severity) {
    if (severity == "critical") return 0;
    if (severity == "warning") return 1;
    return 2;
}

void sortBySeverity(nlohmann::json& items) {
    std::stable_sort(items.begin(), items.end(), [](const nlohmann::json& a, const nlohmann::json& b) {
        return severityRank(a.value("severity", "info")) < severityRank(b.value("severity", "info"));
    });
}

std::vector<double> durations(const std::deque<PerformanceMeasurement>& items) {
    std::vector<double> out;
    out.reserve(items.size());
    for (const auto& m : items) out.push_back(m.durationSeconds);
    return out;
}

nlohmann::json durationSummary(const std::vector<double>& values) {
    return {
        {"avg_duration", mean(values)},
        {"median_duration", median(values)},
        {"max_duration", values.empty() ? 0.0 : *std::max_element(values.begin(), values.end())},
        {"min_duration", values.empty() ? 0.0 : *std::min_element(values.begin(), values.end())}
    };
}

} // namespace

void IPerformanceMonitor::recordKeyGeneration(double duration, size_t textLength, const std::string& operation,
                                              nlohmann::json additional) {
    PerformanceMeasurement m;
    m.category = MeasurementCategory::KeyGeneration;
    m.durationSeconds = duration;
    m.context.textLength = textLength;
    m.context.operationType = operation;
    m.context.additional = std::move(additional);
    record(m);
}

void IPerformanceMonitor::recordCacheOperation(MeasurementCategory category, double duration, bool success,
                                               std::optional<bool> cacheHit, size_t textLength,
                                               const std::string& tier, nlohmann::json additional) {
    PerformanceMeasurement m;
    m.category = category;
    m.durationSeconds = duration;
    m.success = success;
    m.context.cacheHit = cacheHit;
    m.context.textLength = textLength;
    m.context.operationType = toString(category);
    m.context.tier = tier;
    m.context.additional = std::move(additional);
    record(m);
}

void IPerformanceMonitor::recordCompression(size_t originalSize, size_t compressedSize, double duration,
                                            const std::string& operation) {
    PerformanceMeasurement m;
    m.category = MeasurementCategory::Compression;
    m.durationSeconds = duration;
    m.context.originalSize = originalSize;
    m.context.compressedSize = compressedSize;
    m.context.operationType = operation;
    record(m);
}

void IPerformanceMonitor::recordInvalidation(const std::string& pattern, size_t keysInvalidated, double duration,
                                             const std::string& invalidationType, const std::string& context) {
    PerformanceMeasurement m;
    m.category = MeasurementCategory::Invalidation;
    m.durationSeconds = duration;
    m.context.pattern = pattern;
    m.context.keysAffected = keysInvalidated;
    m.context.invalidationType = invalidationType;
    m.context.operationContext = context;
    record(m);
}

std::shared_ptr<IPerformanceMonitor> nullMonitor() {
    static auto instance = std::make_shared<NullPerformanceMonitor>();
    return instance;
}

PerformanceMonitor::PerformanceMonitor(MonitorThresholds thresholds) : thresholds_(thresholds) {
    cacheLogger()->debug("PerformanceMonitor: retention={}h, maxMeasurements={}",
                         thresholds_.retentionHours, thresholds_.maxMeasurements);
}

PerformanceMonitor::~PerformanceMonitor() = default;

template<typename T>
void PerformanceMonitor::trim(std::deque<T>& items, MetricsClock::time_point now) const {
    const auto cutoff = now - std::chrono::duration_cast<MetricsClock::duration>(
        std::chrono::duration<double, std::ratio<3600>>(thresholds_.retentionHours));
    items.erase(std::remove_if(items.begin(), items.end(), [&](const T& m) { return m.timestamp <= cutoff; }),
                items.end());
    while (items.size() > thresholds_.maxMeasurements) {
        items.pop_front();
    }
}

void PerformanceMonitor::purgeLocked(MetricsClock::time_point now) {
    trim(keyGeneration_, now);
    trim(cacheOperations_, now);
    trim(compression_, now);
    trim(invalidations_, now);
    trim(memory_, now);
}

void PerformanceMonitor::record(const PerformanceMeasurement& measurement) {
    auto logger = cacheLogger();
    const auto now = MetricsClock::now();
    PerformanceMeasurement m = measurement;
    if (m.timestamp == MetricsClock::time_point{}) {
        m.timestamp = now;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    switch (m.category) {
        case MeasurementCategory::KeyGeneration:
            keyGeneration_.push_back(m);
            trim(keyGeneration_, now);
            if (m.durationSeconds > thresholds_.keyGenerationSlowSeconds) {
                logger->warn("Медленная генерация ключа: {:.3f}s для {} символов ({})",
                             m.durationSeconds, m.context.textLength, m.context.operationType);
            }
            break;
        case MeasurementCategory::Get:
        case MeasurementCategory::Set:
        case MeasurementCategory::Delete:
        case MeasurementCategory::Exists:
            cacheOperations_.push_back(m);
            trim(cacheOperations_, now);
            ++totalOperations_;
            if (!m.success) {
                ++failedOperations_;
            }
            if (m.category == MeasurementCategory::Get && m.context.cacheHit) {
                if (*m.context.cacheHit) {
                    ++cacheHits_;
                } else {
                    ++cacheMisses_;
                }
            }
            if (m.durationSeconds > thresholds_.cacheOperationSlowSeconds) {
                logger->warn("Медленная операция кэша {}: {:.3f}s", toString(m.category), m.durationSeconds);
            }
            break;
        case MeasurementCategory::Compression:
            compression_.push_back(m);
            trim(compression_, now);
            break;
        case MeasurementCategory::Invalidation: {
            invalidations_.push_back(m);
            trim(invalidations_, now);
            ++totalInvalidations_;
            totalKeysInvalidated_ += m.context.keysAffected;
            const auto lastHour = invalidationsSinceLocked(now - std::chrono::hours(1));
            if (lastHour >= thresholds_.invalidationCriticalPerHour) {
                logger->error("Критическая частота инвалидаций: {} за последний час", lastHour);
            } else if (lastHour >= thresholds_.invalidationWarningPerHour) {
                logger->warn("Высокая частота инвалидаций: {} за последний час", lastHour);
            }
            break;
        }
    }
}

void PerformanceMonitor::recordMemoryUsage(const MemoryUsageMeasurement& measurement) {
    const auto now = MetricsClock::now();
    MemoryUsageMeasurement m = measurement;
    if (m.timestamp == MetricsClock::time_point{}) {
        m.timestamp = now;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    memory_.push_back(m);
    trim(memory_, now);
    const double mb = static_cast<double>(m.totalCacheSizeBytes) / BYTES_PER_MB;
    if (m.totalCacheSizeBytes >= thresholds_.memoryCriticalBytes) {
        cacheLogger()->error("Критическое потребление памяти кэшем: {:.1f}MB", mb);
    } else if (m.totalCacheSizeBytes >= thresholds_.memoryWarningBytes) {
        cacheLogger()->warn("Высокое потребление памяти кэшем: {:.1f}MB", mb);
    }
}

size_t PerformanceMonitor::invalidationsSinceLocked(MetricsClock::time_point since) const {
    return static_cast<size_t>(std::count_if(invalidations_.begin(), invalidations_.end(),
        [since](const PerformanceMeasurement& m) { return m.timestamp > since; }));
}

double PerformanceMonitor::hitRate() const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto total = cacheHits_ + cacheMisses_;
    return total > 0 ? static_cast<double>(cacheHits_) / static_cast<double>(total) * 100.0 : 0.0;
}

nlohmann::json PerformanceMonitor::getStats() {
    const auto now = MetricsClock::now();
    std::lock_guard<std::mutex> lock(mutex_);
    purgeLocked(now);

    const auto lookups = cacheHits_ + cacheMisses_;
    nlohmann::json stats = {
        {"timestamp", epochSeconds(now)},
        {"retention_hours", thresholds_.retentionHours},
        {"cache_hit_rate", lookups > 0 ? static_cast<double>(cacheHits_) / static_cast<double>(lookups) * 100.0 : 0.0},
        {"total_cache_operations", totalOperations_},
        {"failed_cache_operations", failedOperations_},
        {"cache_hits", cacheHits_},
        {"cache_misses", cacheMisses_}
    };

    if (!keyGeneration_.empty()) {
        auto values = durations(keyGeneration_);
        std::vector<double> lengths;
        for (const auto& m : keyGeneration_) lengths.push_back(static_cast<double>(m.context.textLength));
        auto section = durationSummary(values);
        section["total_operations"] = keyGeneration_.size();
        section["avg_text_length"] = mean(lengths);
        section["max_text_length"] = *std::max_element(lengths.begin(), lengths.end());
        section["slow_operations"] = std::count_if(values.begin(), values.end(),
            [this](double d) { return d > thresholds_.keyGenerationSlowSeconds; });
        stats["key_generation"] = section;
    }

    if (!cacheOperations_.empty()) {
        auto values = durations(cacheOperations_);
        std::map<std::string, std::vector<double>> byType;
        for (const auto& m : cacheOperations_) byType[toString(m.category)].push_back(m.durationSeconds);
        auto section = durationSummary(values);
        section["total_operations"] = cacheOperations_.size();
        section["slow_operations"] = std::count_if(values.begin(), values.end(),
            [this](double d) { return d > thresholds_.cacheOperationSlowSeconds; });
        nlohmann::json types = nlohmann::json::object();
        for (const auto& [type, list] : byType) {
            types[type] = {
                {"count", list.size()},
                {"avg_duration", mean(list)},
                {"max_duration", *std::max_element(list.begin(), list.end())}
            };
        }
        section["by_operation_type"] = types;
        stats["cache_operations"] = section;
    }

    if (!compression_.empty()) {
        std::vector<double> ratios;
        std::vector<double> times;
        size_t totalOriginal = 0;
        size_t totalCompressed = 0;
        for (const auto& m : compression_) {
            ratios.push_back(m.compressionRatio());
            times.push_back(m.durationSeconds);
            totalOriginal += m.context.originalSize;
            totalCompressed += m.context.compressedSize;
        }
        const double saved = static_cast<double>(totalOriginal) - static_cast<double>(totalCompressed);
        stats["compression"] = {
            {"total_operations", compression_.size()},
            {"avg_compression_ratio", mean(ratios)},
            {"median_compression_ratio", median(ratios)},
            {"best_compression_ratio", *std::min_element(ratios.begin(), ratios.end())},
            {"worst_compression_ratio", *std::max_element(ratios.begin(), ratios.end())},
            {"avg_compression_time", mean(times)},
            {"max_compression_time", *std::max_element(times.begin(), times.end())},
            {"total_bytes_processed", totalOriginal},
            {"total_bytes_saved", saved},
            {"overall_savings_percent", totalOriginal > 0 ? saved / static_cast<double>(totalOriginal) * 100.0 : 0.0}
        };
    }

    if (!memory_.empty()) {
        stats["memory_usage"] = memoryStatsLocked();
    }
    if (!invalidations_.empty()) {
        stats["invalidation"] = invalidationStatsLocked();
    }
    return stats;
}

nlohmann::json PerformanceMonitor::getMemoryUsageStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return memoryStatsLocked();
}

nlohmann::json PerformanceMonitor::memoryStatsLocked() const {
    const double warningMb = static_cast<double>(thresholds_.memoryWarningBytes) / BYTES_PER_MB;
    const double criticalMb = static_cast<double>(thresholds_.memoryCriticalBytes) / BYTES_PER_MB;
    if (memory_.empty()) {
        return {{"no_measurements", true}, {"warning_threshold_mb", warningMb}, {"critical_threshold_mb", criticalMb}};
    }
    const auto& latest = memory_.back();
    const size_t recentCount = std::min(memory_.size(), RECENT_MEMORY_SAMPLES);
    std::vector<double> totals;
    std::vector<double> memorySizes;
    std::vector<double> entries;
    for (auto it = memory_.end() - static_cast<std::ptrdiff_t>(recentCount); it != memory_.end(); ++it) {
        totals.push_back(static_cast<double>(it->totalCacheSizeBytes));
        memorySizes.push_back(static_cast<double>(it->memoryCacheSizeBytes));
        entries.push_back(static_cast<double>(it->cacheEntryCount));
    }
    const double utilization = thresholds_.memoryWarningBytes > 0
        ? static_cast<double>(latest.totalCacheSizeBytes) / static_cast<double>(thresholds_.memoryWarningBytes) * 100.0
        : 0.0;
    nlohmann::json stats = {
        {"current", {
            {"total_cache_size_mb", static_cast<double>(latest.totalCacheSizeBytes) / BYTES_PER_MB},
            {"memory_cache_size_mb", static_cast<double>(latest.memoryCacheSizeBytes) / BYTES_PER_MB},
            {"cache_entry_count", latest.cacheEntryCount},
            {"memory_cache_entry_count", latest.memoryCacheEntryCount},
            {"avg_entry_size_bytes", latest.avgEntrySizeBytes()},
            {"process_memory_mb", latest.processMemoryMb},
            {"cache_utilization_percent", utilization}
        }},
        {"thresholds", {
            {"warning_threshold_mb", warningMb},
            {"critical_threshold_mb", criticalMb},
            {"warning_threshold_reached", latest.totalCacheSizeBytes >= thresholds_.memoryWarningBytes},
            {"critical_threshold_reached", latest.totalCacheSizeBytes >= thresholds_.memoryCriticalBytes}
        }},
        {"trends", {
            {"total_measurements", memory_.size()},
            {"avg_total_cache_size_mb", mean(totals) / BYTES_PER_MB},
            {"max_total_cache_size_mb", *std::max_element(totals.begin(), totals.end()) / BYTES_PER_MB},
            {"avg_memory_cache_size_mb", mean(memorySizes) / BYTES_PER_MB},
            {"avg_entry_count", mean(entries)},
            {"max_entry_count", *std::max_element(entries.begin(), entries.end())}
        }}
    };
    if (recentCount >= 2) {
        const auto& first = *(memory_.end() - static_cast<std::ptrdiff_t>(recentCount));
        const double span = std::chrono::duration<double>(latest.timestamp - first.timestamp).count();
        if (span > 0) {
            const double growthBytesPerHour = (totals.back() - totals.front()) / span * 3600.0;
            stats["trends"]["growth_rate_mb_per_hour"] = growthBytesPerHour / BYTES_PER_MB;
            // Линейный прогноз до порогов
            if (growthBytesPerHour > 0) {
                const double current = static_cast<double>(latest.totalCacheSizeBytes);
                const double toWarning = static_cast<double>(thresholds_.memoryWarningBytes) - current;
                const double toCritical = static_cast<double>(thresholds_.memoryCriticalBytes) - current;
                stats["trends"]["hours_to_warning"] = toWarning > 0 ? toWarning / growthBytesPerHour : 0.0;
                stats["trends"]["hours_to_critical"] = toCritical > 0 ? toCritical / growthBytesPerHour : 0.0;
            }
        }
    }
    return stats;
}

nlohmann::json PerformanceMonitor::getInvalidationFrequencyStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return invalidationStatsLocked();
}

nlohmann::json PerformanceMonitor::invalidationStatsLocked() const {
    if (invalidations_.empty()) {
        return {
            {"no_invalidations", true},
            {"total_invalidations", 0},
            {"total_keys_invalidated", 0},
            {"warning_threshold_per_hour", thresholds_.invalidationWarningPerHour},
            {"critical_threshold_per_hour", thresholds_.invalidationCriticalPerHour}
        };
    }
    const auto now = MetricsClock::now();
    const size_t lastHour = invalidationsSinceLocked(now - std::chrono::hours(1));
    const size_t last24h = invalidationsSinceLocked(now - std::chrono::hours(24));

    const size_t recentCount = std::min(invalidations_.size(), RECENT_INVALIDATIONS);
    std::map<std::string, size_t> patternCounts;
    std::map<std::string, size_t> typeCounts;
    std::vector<double> recentDurations;
    for (auto it = invalidations_.end() - static_cast<std::ptrdiff_t>(recentCount); it != invalidations_.end(); ++it) {
        ++patternCounts[it->context.pattern];
        ++typeCounts[it->context.invalidationType];
        recentDurations.push_back(it->durationSeconds);
    }
    std::vector<std::pair<std::string, size_t>> sortedPatterns(patternCounts.begin(), patternCounts.end());
    std::stable_sort(sortedPatterns.begin(), sortedPatterns.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    if (sortedPatterns.size() > TOP_PATTERNS) {
        sortedPatterns.resize(TOP_PATTERNS);
    }
    nlohmann::json topPatterns = nlohmann::json::array();
    for (const auto& [pattern, count] : sortedPatterns) {
        topPatterns.push_back({{"pattern", pattern}, {"count", count}});
    }

    std::string alert = "normal";
    if (lastHour >= thresholds_.invalidationCriticalPerHour) {
        alert = "critical";
    } else if (lastHour >= thresholds_.invalidationWarningPerHour) {
        alert = "warning";
    }
    const double retention = thresholds_.retentionHours > 0 ? thresholds_.retentionHours : 1.0;
    return {
        {"total_invalidations", totalInvalidations_},
        {"total_keys_invalidated", totalKeysInvalidated_},
        {"rates", {
            {"last_hour", lastHour},
            {"last_24_hours", last24h},
            {"average_per_hour", static_cast<double>(invalidations_.size()) / retention}
        }},
        {"thresholds", {
            {"warning_per_hour", thresholds_.invalidationWarningPerHour},
            {"critical_per_hour", thresholds_.invalidationCriticalPerHour},
            {"current_alert_level", alert}
        }},
        {"patterns", {
            {"most_common_patterns", topPatterns},
            {"invalidation_types", typeCounts}
        }},
        {"efficiency", {
            {"avg_keys_per_invalidation", totalInvalidations_ > 0
                ? static_cast<double>(totalKeysInvalidated_) / static_cast<double>(totalInvalidations_) : 0.0},
            {"avg_duration", mean(recentDurations)},
            {"max_duration", *std::max_element(recentDurations.begin(), recentDurations.end())}
        }}
    };
}

nlohmann::json PerformanceMonitor::getMemoryWarnings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return memoryWarningsLocked();
}

nlohmann::json PerformanceMonitor::memoryWarningsLocked() const {
    nlohmann::json warnings = nlohmann::json::array();
    if (memory_.empty()) {
        return warnings;
    }
    const auto& latest = memory_.back();
    const double mb = static_cast<double>(latest.totalCacheSizeBytes) / BYTES_PER_MB;
    if (latest.totalCacheSizeBytes >= thresholds_.memoryCriticalBytes) {
        warnings.push_back({
            {"severity", "critical"},
            {"message", fmt::format("Cache memory usage is {:.1f}MB, exceeding critical threshold of {:.1f}MB",
                                    mb, static_cast<double>(thresholds_.memoryCriticalBytes) / BYTES_PER_MB)},
            {"recommendations", {"Consider reducing cache TTL values",
                                 "Reduce the memory cache size limit",
                                 "Review and optimize large cached responses"}}
        });
    } else if (latest.totalCacheSizeBytes >= thresholds_.memoryWarningBytes) {
        warnings.push_back({
            {"severity", "warning"},
            {"message", fmt::format("Cache memory usage is {:.1f}MB, exceeding warning threshold of {:.1f}MB",
                                    mb, static_cast<double>(thresholds_.memoryWarningBytes) / BYTES_PER_MB)},
            {"recommendations", {"Monitor cache growth closely",
                                 "Review cache key patterns for optimization"}}
        });
    }
    if (latest.memoryCacheCapacity > 0 && latest.memoryCacheEntryCount > 0) {
        const double utilization = static_cast<double>(latest.memoryCacheEntryCount) /
                                   static_cast<double>(latest.memoryCacheCapacity) * 100.0;
        if (utilization > 90.0) {
            warnings.push_back({
                {"severity", "info"},
                {"message", fmt::format("Memory cache is {:.1f}% full ({}/{} entries)", utilization,
                                        latest.memoryCacheEntryCount, latest.memoryCacheCapacity)},
                {"recommendations", nlohmann::json::array({"Consider increasing memory cache size if hit rates are good"})}
            });
        }
    }
    sortBySeverity(warnings);
    return warnings;
}

nlohmann::json PerformanceMonitor::getInvalidationRecommendations() const {
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json recommendations = nlohmann::json::array();
    if (invalidations_.empty()) {
        return recommendations;
    }
    const auto stats = invalidationStatsLocked();
    const size_t lastHour = stats["rates"]["last_hour"].get<size_t>();
    if (lastHour >= thresholds_.invalidationWarningPerHour) {
        recommendations.push_back({
            {"severity", stats["thresholds"]["current_alert_level"].get<std::string>() == "critical" ? "critical" : "warning"},
            {"issue", "High invalidation frequency"},
            {"message", fmt::format("Cache is being invalidated {} times per hour", lastHour)},
            {"suggestions", {"Review invalidation triggers to reduce unnecessary clearing",
                             "Use more specific patterns for selective invalidation",
                             "Check if TTL values are set too low"}}
        });
    }
    const auto& patterns = stats["patterns"]["most_common_patterns"];
    if (!patterns.empty()) {
        const auto pattern = patterns[0]["pattern"].get<std::string>();
        const auto count = patterns[0]["count"].get<size_t>();
        if (static_cast<double>(count) > static_cast<double>(invalidations_.size()) * 0.5) {
            recommendations.push_back({
                {"severity", "info"},
                {"issue", "Dominant invalidation pattern"},
                {"message", fmt::format("Pattern '{}' accounts for {} of recent invalidations", pattern, count)},
                {"suggestions", {fmt::format("Optimize operations that trigger '{}' invalidations", pattern),
                                 "Evaluate if this pattern could be made more specific"}}
            });
        }
    }
    const double avgKeys = stats["efficiency"]["avg_keys_per_invalidation"].get<double>();
    if (avgKeys < 1.0) {
        recommendations.push_back({
            {"severity", "info"},
            {"issue", "Low invalidation efficiency"},
            {"message", fmt::format("Average of {:.1f} keys invalidated per operation", avgKeys)},
            {"suggestions", {"Many invalidation operations are not finding keys to clear",
                             "Consider using more targeted patterns"}}
        });
    } else if (avgKeys > 100.0) {
        recommendations.push_back({
            {"severity", "warning"},
            {"issue", "High invalidation impact"},
            {"message", fmt::format("Average of {:.0f} keys invalidated per operation", avgKeys)},
            {"suggestions", {"Invalidation operations are clearing large numbers of entries",
                             "Use more selective patterns to preserve valid cache entries"}}
        });
    }
    sortBySeverity(recommendations);
    return recommendations;
}

nlohmann::json PerformanceMonitor::getSlowOperations(double thresholdMultiplier) const {
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json result = {
        {"key_generation", nlohmann::json::array()},
        {"cache_operations", nlohmann::json::array()},
        {"compression", nlohmann::json::array()},
        {"invalidation", nlohmann::json::array()}
    };
    auto collect = [thresholdMultiplier](const std::deque<PerformanceMeasurement>& items, nlohmann::json& out) {
        std::map<MeasurementCategory, std::vector<double>> byCategory;
        for (const auto& m : items) byCategory[m.category].push_back(m.durationSeconds);
        std::map<MeasurementCategory, double> averages;
        for (const auto& [category, list] : byCategory) averages[category] = mean(list);
        for (const auto& m : items) {
            const double avg = averages[m.category];
            if (avg > 0 && m.durationSeconds > avg * thresholdMultiplier) {
                auto entry = m.toJson();
                entry["times_slower"] = m.durationSeconds / avg;
                out.push_back(entry);
            }
        }
    };
    collect(keyGeneration_, result["key_generation"]);
    collect(cacheOperations_, result["cache_operations"]);
    collect(compression_, result["compression"]);
    collect(invalidations_, result["invalidation"]);
    return result;
}

void PerformanceMonitor::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    keyGeneration_.clear();
    cacheOperations_.clear();
    compression_.clear();
    invalidations_.clear();
    memory_.clear();
    cacheHits_ = 0;
    cacheMisses_ = 0;
    totalOperations_ = 0;
    failedOperations_ = 0;
    totalInvalidations_ = 0;
    totalKeysInvalidated_ = 0;
    cacheLogger()->info("PerformanceMonitor: статистика сброшена");
}

nlohmann::json PerformanceMonitor::exportMetrics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto dump = [](const auto& items) {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& m : items) out.push_back(m.toJson());
        return out;
    };
    return {
        {"key_generation_times", dump(keyGeneration_)},
        {"cache_operation_times", dump(cacheOperations_)},
        {"compression_ratios", dump(compression_)},
        {"memory_usage_measurements", dump(memory_)},
        {"invalidation_events", dump(invalidations_)},
        {"cache_hits", cacheHits_},
        {"cache_misses", cacheMisses_},
        {"total_operations", totalOperations_},
        {"failed_operations", failedOperations_},
        {"total_invalidations", totalInvalidations_},
        {"total_keys_invalidated", totalKeysInvalidated_},
        {"export_timestamp", epochSeconds(MetricsClock::now())}
    };
}

} // namespace cache
} // namespace core
} // namespace cachekit

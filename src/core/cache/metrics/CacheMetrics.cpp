#include "core/cache/metrics/CacheMetrics.hpp"

namespace cachekit {
namespace core {
namespace cache {

namespace {
double epochSeconds(MetricsClock::time_point tp) {
    return std::chrono::duration<double>(tp.time_since_epoch()).count();
}
}

std::string toString(MeasurementCategory category) {
    switch (category) {
        case MeasurementCategory::KeyGeneration: return "key_generation";
        case MeasurementCategory::Get: return "get";
        case MeasurementCategory::Set: return "set";
        case MeasurementCategory::Delete: return "delete";
        case MeasurementCategory::Exists: return "exists";
        case MeasurementCategory::Compression: return "compression";
        case MeasurementCategory::Invalidation: return "invalidation";
    }
    return "unknown";
}

nlohmann::json PerformanceMeasurement::toJson() const {
    nlohmann::json j = {
        {"category", toString(category)},
        {"duration", durationSeconds},
        {"timestamp", epochSeconds(timestamp)},
        {"success", success},
        {"text_length", context.textLength},
        {"operation_type", context.operationType},
        {"additional_data", context.additional}
    };
    if (context.cacheHit) j["cache_hit"] = *context.cacheHit;
    if (!context.tier.empty()) j["tier"] = context.tier;
    if (category == MeasurementCategory::Compression) {
        j["original_size"] = context.originalSize;
        j["compressed_size"] = context.compressedSize;
        j["compression_ratio"] = compressionRatio();
    }
    if (category == MeasurementCategory::Invalidation) {
        j["pattern"] = context.pattern;
        j["keys_invalidated"] = context.keysAffected;
        j["invalidation_type"] = context.invalidationType;
        j["operation_context"] = context.operationContext;
    }
    return j;
}

nlohmann::json MemoryUsageMeasurement::toJson() const {
    return {
        {"total_cache_size_bytes", totalCacheSizeBytes},
        {"cache_entry_count", cacheEntryCount},
        {"avg_entry_size_bytes", avgEntrySizeBytes()},
        {"memory_cache_size_bytes", memoryCacheSizeBytes},
        {"memory_cache_entry_count", memoryCacheEntryCount},
        {"memory_cache_capacity", memoryCacheCapacity},
        {"process_memory_mb", processMemoryMb},
        {"timestamp", epochSeconds(timestamp)},
        {"additional_data", additional}
    };
}

} // namespace cache
} // namespace core
} // namespace cachekit

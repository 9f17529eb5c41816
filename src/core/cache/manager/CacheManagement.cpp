#include "core/cache/manager/CacheManagement.hpp"
#include "core/cache/CacheErrors.hpp"
#include "core/cache/CacheLogger.hpp"
#include "core/cache/redis/AIResponseCache.hpp"
#include "core/cache/redis/GenericRedisCache.hpp"
#include <chrono>

namespace cachekit {
namespace core {
namespace cache {

namespace {

std::shared_ptr<GenericRedisCache> remoteTierOf(const std::shared_ptr<ICache>& cache) {
    if (auto redis = std::dynamic_pointer_cast<GenericRedisCache>(cache)) {
        return redis;
    }
    if (auto ai = std::dynamic_pointer_cast<AIResponseCache>(cache)) {
        return std::dynamic_pointer_cast<GenericRedisCache>(ai->inner());
    }
    return nullptr;
}

bool endsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

CacheManagement::CacheManagement(std::shared_ptr<ICache> cache, std::shared_ptr<PerformanceMonitor> monitor,
                                 CacheConfig config)
    : cache_(std::move(cache)), monitor_(std::move(monitor)), config_(std::move(config)) {
    if (!cache_) {
        throw ConfigurationError("CacheManagement: кэш не задан");
    }
    if (config_.securityConfig) {
        security_ = std::make_unique<security::SecurityManager>(*config_.securityConfig);
    }
}

nlohmann::json CacheManagement::healthSnapshot() {
    const std::string type = cache_->cacheType();
    const bool fallbackActive = config_.remoteUrl.has_value() && endsWith(type, "memory");
    nlohmann::json health = {
        {"status", "unknown"},
        {"cache_type", type},
        {"ping_available", true},
        {"ping_success", false},
        {"operation_test", false},
        {"remote_configured", config_.remoteUrl.has_value()},
        {"fallback_active", fallbackActive},
        {"errors", nlohmann::json::array()},
        {"warnings", nlohmann::json::array()}
    };
    std::string status;
    if (cache_->isClosed()) {
        status = "unhealthy";
        health["errors"].push_back("Cache is closed");
    } else if (cache_->ping()) {
        health["ping_success"] = true;
        status = "healthy";
    } else {
        health["warnings"].push_back("Cache ping failed, running operation test");
        std::string readBack;
        const bool written = cache_->setString(HEALTH_CHECK_KEY, "ok", MIN_TTL_SECONDS);
        const bool ok = cache_->getString(HEALTH_CHECK_KEY, readBack) && readBack == "ok";
        cache_->remove(HEALTH_CHECK_KEY);
        health["operation_test"] = ok;
        if (!written) {
            health["warnings"].push_back("Remote write failed during operation test");
        }
        status = ok ? "degraded" : "unhealthy";
        if (!ok) {
            health["errors"].push_back("Operation test failed");
        }
    }
    if (fallbackActive && status == "healthy") {
        status = "degraded";
        health["warnings"].push_back("Remote cache unavailable, serving from memory tier");
    }
    if (monitor_) {
        size_t critical = 0;
        const auto warnings = monitor_->getMemoryWarnings();
        for (const auto& warning : warnings) {
            if (warning.value("severity", std::string()) == "critical") {
                ++critical;
            }
        }
        health["memory_warnings"] = warnings.size();
        if (critical > 0 && status == "healthy") {
            status = "degraded";
            health["warnings"].push_back("Critical memory usage reported by performance monitor");
        }
    }
    health["status"] = status;
    health["statistics"] = cache_->getStats();
    health["timestamp"] = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    if (status == "healthy") {
        cacheLogger()->debug("CacheManagement: проверка здоровья: {}", status);
    } else {
        cacheLogger()->warn("CacheManagement: проверка здоровья: {}", status);
    }
    return health;
}

nlohmann::json CacheManagement::metricsSnapshot() {
    if (!monitor_) {
        auto stats = PerformanceMonitor().getStats();
        stats["cache"] = cache_->getStats();
        return stats;
    }
    monitor_->recordMemoryUsage(cache_->memoryUsage());
    auto stats = monitor_->getStats();
    stats["cache"] = cache_->getStats();
    return stats;
}

void CacheManagement::checkPattern(const std::string& pattern) {
    if (pattern.empty()) {
        throw ValidationError("Invalidation pattern must not be empty", "pattern");
    }
    if (pattern.size() > MAX_INVALIDATION_PATTERN_LENGTH) {
        throw ValidationError("Invalidation pattern is longer than " + std::to_string(MAX_INVALIDATION_PATTERN_LENGTH) +
                              " characters", "pattern");
    }
    if (pattern.find_first_not_of('*') == std::string::npos) {
        throw ValidationError("Invalidation pattern '" + pattern + "' is too broad", "pattern");
    }
}

nlohmann::json CacheManagement::invalidate(const std::string& pattern, const std::string& operationContext) {
    checkPattern(pattern);
    const auto start = std::chrono::steady_clock::now();
    const size_t removed = cache_->invalidatePattern(pattern, operationContext.empty() ? "management_api" : operationContext);
    const double durationMs = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    cacheLogger()->info("CacheManagement: инвалидация '{}' удалила {} ключей", pattern, removed);
    return {
        {"pattern", pattern},
        {"keys_invalidated", removed},
        {"operation_context", operationContext},
        {"duration_ms", durationMs},
        {"message", "Cache invalidated for pattern: " + pattern}
    };
}

std::vector<std::string> CacheManagement::validateConfiguration() const {
    const auto result = config_.validate();
    std::vector<std::string> issues = result.errors;
    for (const auto& warning : result.warnings) {
        issues.push_back("warning: " + warning);
    }
    if (security_) {
        for (const auto& recommendation : security_->getSecurityRecommendations()) {
            if (recommendation.severity == "critical" || recommendation.severity == "high") {
                issues.push_back("security (" + recommendation.severity + "): " + recommendation.message);
            }
        }
    }
    return issues;
}

nlohmann::json CacheManagement::securityStatus() const {
    if (!security_) {
        return {{"configured", false}, {"message", "No security configuration"}};
    }
    auto status = security_->getSecurityStatus();
    status["configured"] = true;
    if (auto remote = remoteTierOf(cache_)) {
        status["connection"] = security_->validateConnectionSecurity(remote->securityInfo()).toJson();
    }
    return status;
}

} // namespace cache
} // namespace core
} // namespace cachekit

#include "core/cache/redis/GenericRedisCache.hpp"
#include "core/cache/CacheErrors.hpp"
#include "core/cache/CacheLogger.hpp"
#include <algorithm>
#include <chrono>
#include <set>
#include <sstream>

namespace cachekit {
namespace core {
namespace cache {

namespace {

constexpr const char* SCAN_BATCH = "100";

double secondsSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

std::string toWire(const Bytes& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

std::optional<Bytes> encryptionKeyFor(const CacheConfig& config) {
    if (!config.securityConfig || config.securityConfig->encryptionKey.empty()) {
        return std::nullopt;
    }
    auto key = ValueCodec::parseEncryptionKey(config.securityConfig->encryptionKey);
    if (!key) {
        throw ConfigurationError("Invalid encryption key", {"security.encryption_key: must be base64 encoding of 32 bytes"});
    }
    return key;
}

void throwIfError(const remote::RespValue& reply, const std::string& command) {
    if (reply.isError()) {
        throw InfrastructureError(command + " вернул ошибку: " + reply.str, command);
    }
}

} // namespace

GenericRedisCache::GenericRedisCache(std::shared_ptr<remote::RedisConnectionPool> pool, const CacheConfig& config,
                                     std::shared_ptr<IPerformanceMonitor> monitor, bool ownsPool)
    : pool_(std::move(pool)),
      config_(config),
      monitor_(monitor ? std::move(monitor) : nullMonitor()),
      memory_(config.memoryCacheSize, config.defaultTtlSeconds),
      codec_(config.compressionThresholdBytes, config.compressionLevel, encryptionKeyFor(config)),
      ownsPool_(ownsPool) {
    if (!pool_) {
        throw ConfigurationError("GenericRedisCache: пул соединений не задан");
    }
    cacheLogger()->info("GenericRedisCache: создан для {} (L1={}, сжатие > {} байт, уровень {}, шифрование {})",
                        pool_->name(), config.memoryCacheSize, config.compressionThresholdBytes, config.compressionLevel,
                        codec_.encryptionEnabled() ? "AES-256-GCM" : "выключено");
}

GenericRedisCache::~GenericRedisCache() {
    close();
}

bool GenericRedisCache::get(const std::string& key, Bytes& value) {
    const auto start = std::chrono::steady_clock::now();
    if (closed_) {
        monitor_->recordCacheOperation(MeasurementCategory::Get, secondsSince(start), false, false, 0, "redis");
        return false;
    }
    if (memory_.get(key, value)) {
        ++hits_;
        ++memoryHits_;
        monitor_->recordCacheOperation(MeasurementCategory::Get, secondsSince(start), true, true, value.size(), "memory");
        fireCallbacks("get_success", key);
        return true;
    }
    try {
        auto reply = pool_->execute({"GET", key});
        throwIfError(reply, "GET");
        if (!reply.isNull()) {
            const Bytes stored(reply.str.begin(), reply.str.end());
            auto decoded = codec_.decode(stored);
            if (decoded) {
                value = std::move(*decoded);
                memory_.set(key, value);
                ++hits_;
                ++remoteHits_;
                monitor_->recordCacheOperation(MeasurementCategory::Get, secondsSince(start), true, true, value.size(), "redis");
                fireCallbacks("get_success", key);
                return true;
            }
            cacheLogger()->warn("GenericRedisCache: повреждённое значение для ключа '{}', считается промахом", key);
        }
        ++misses_;
        monitor_->recordCacheOperation(MeasurementCategory::Get, secondsSince(start), true, false, 0, "redis");
        fireCallbacks("get_miss", key);
        return false;
    } catch (const std::exception& e) {
        recordRemoteError("GET", key, e);
        ++misses_;
        monitor_->recordCacheOperation(MeasurementCategory::Get, secondsSince(start), false, false, 0, "redis");
        fireCallbacks("get_miss", key);
        return false;
    }
}

bool GenericRedisCache::set(const std::string& key, const Bytes& value, int ttlSeconds) {
    const auto start = std::chrono::steady_clock::now();
    if (closed_) {
        monitor_->recordCacheOperation(MeasurementCategory::Set, secondsSince(start), false, std::nullopt, value.size(), "redis");
        return false;
    }
    const int ttl = ttlSeconds > 0 ? ttlSeconds : config_.defaultTtlSeconds;
    memory_.set(key, value, ttl);

    EncodedValue encoded;
    try {
        encoded = codec_.encode(value);
    } catch (const CacheError& e) {
        // Открытый текст в L2 не пишется
        recordRemoteError("ENCODE", key, e);
        monitor_->recordCacheOperation(MeasurementCategory::Set, secondsSince(start), false, std::nullopt, value.size(), "redis");
        return false;
    }
    if (encoded.encrypted) {
        ++encryptedWrites_;
    }
    if (encoded.attempted) {
        monitor_->recordCompression(encoded.originalSize, encoded.compressedSize, encoded.durationSeconds, "set");
        if (encoded.compressed) {
            ++compressedWrites_;
            bytesSaved_ += encoded.originalSize - encoded.compressedSize;
        }
    }

    bool stored = false;
    try {
        auto reply = pool_->execute({"SET", key, toWire(encoded.payload), "EX", std::to_string(ttl)});
        throwIfError(reply, "SET");
        stored = reply.isOk();
    } catch (const std::exception& e) {
        recordRemoteError("SET", key, e);
    }
    monitor_->recordCacheOperation(MeasurementCategory::Set, secondsSince(start), stored, std::nullopt, value.size(), "redis",
                                   {{"compressed", encoded.compressed}, {"ttl", ttl}});
    fireCallbacks(stored ? "set_success" : "set_failure", key);
    return stored;
}

bool GenericRedisCache::remove(const std::string& key) {
    const auto start = std::chrono::steady_clock::now();
    if (closed_) {
        return false;
    }
    const bool removedLocal = memory_.remove(key);
    bool removedRemote = false;
    bool success = true;
    try {
        auto reply = pool_->execute({"DEL", key});
        throwIfError(reply, "DEL");
        removedRemote = reply.integer > 0;
    } catch (const std::exception& e) {
        recordRemoteError("DEL", key, e);
        success = false;
    }
    monitor_->recordCacheOperation(MeasurementCategory::Delete, secondsSince(start), success, std::nullopt, 0, "redis");
    if (success) {
        fireCallbacks("delete_success", key);
    }
    return removedLocal || removedRemote;
}

bool GenericRedisCache::exists(const std::string& key) {
    const auto start = std::chrono::steady_clock::now();
    if (closed_) {
        monitor_->recordCacheOperation(MeasurementCategory::Exists, secondsSince(start), false, std::nullopt, 0, "redis");
        return false;
    }
    if (memory_.exists(key)) {
        monitor_->recordCacheOperation(MeasurementCategory::Exists, secondsSince(start), true, std::nullopt, 0, "memory",
                                       {{"found", true}});
        return true;
    }
    bool found = false;
    bool success = true;
    try {
        auto reply = pool_->execute({"EXISTS", key});
        throwIfError(reply, "EXISTS");
        found = reply.integer > 0;
    } catch (const std::exception& e) {
        recordRemoteError("EXISTS", key, e);
        success = false;
    }
    monitor_->recordCacheOperation(MeasurementCategory::Exists, secondsSince(start), success, std::nullopt, 0, "redis",
                                   {{"found", found}});
    return found;
}

std::vector<std::string> GenericRedisCache::scanKeys(const std::string& pattern) {
    std::vector<std::string> keys;
    std::string cursor = "0";
    do {
        auto reply = pool_->execute({"SCAN", cursor, "MATCH", pattern, "COUNT", SCAN_BATCH});
        throwIfError(reply, "SCAN");
        if (reply.type != remote::RespType::Array || reply.elements.size() != 2) {
            throw InfrastructureError("SCAN: неожиданный формат ответа", "SCAN");
        }
        cursor = reply.elements[0].str;
        for (const auto& element : reply.elements[1].elements) {
            keys.push_back(element.str);
        }
    } while (cursor != "0");
    return keys;
}

size_t GenericRedisCache::invalidatePattern(const std::string& pattern, const std::string& operationContext) {
    validatePattern(pattern);
    const auto start = std::chrono::steady_clock::now();
    std::set<std::string> affected;
    for (const auto& key : memory_.keys()) {
        if (globMatch(pattern, key)) {
            affected.insert(key);
        }
    }
    memory_.invalidatePattern(pattern, operationContext);

    bool success = !closed_;
    if (success) {
        try {
            auto keys = scanKeys(pattern);
            for (size_t i = 0; i < keys.size(); i += 100) {
                std::vector<std::string> del{"DEL"};
                const size_t end = std::min(keys.size(), i + 100);
                del.insert(del.end(), keys.begin() + static_cast<std::ptrdiff_t>(i), keys.begin() + static_cast<std::ptrdiff_t>(end));
                throwIfError(pool_->execute(del), "DEL");
            }
            affected.insert(keys.begin(), keys.end());
        } catch (const std::exception& e) {
            recordRemoteError("SCAN/DEL", pattern, e);
            success = false;
        }
    }
    monitor_->recordInvalidation(pattern, affected.size(), secondsSince(start), "manual", operationContext);
    cacheLogger()->info("GenericRedisCache: инвалидировано {} ключей по шаблону '{}' (контекст: '{}', L2 {})",
                        affected.size(), pattern, operationContext, success ? "ok" : "недоступен");
    return affected.size();
}

bool GenericRedisCache::ping() {
    if (closed_) {
        return false;
    }
    try {
        auto reply = pool_->execute({"PING"});
        return !reply.isError() && reply.str == "PONG";
    } catch (const std::exception& e) {
        recordRemoteError("PING", {}, e);
        return false;
    }
}

void GenericRedisCache::close() {
    if (closed_.exchange(true)) {
        return;
    }
    memory_.close();
    if (ownsPool_) {
        pool_->closeAll();
    }
    cacheLogger()->info("GenericRedisCache: закрыт ({})", pool_->name());
}

bool GenericRedisCache::isClosed() const {
    return closed_;
}

size_t GenericRedisCache::size() const {
    return memory_.size();
}

std::optional<size_t> GenericRedisCache::remoteMemoryBytes() const {
    if (closed_) {
        return std::nullopt;
    }
    try {
        auto reply = pool_->execute({"INFO", "memory"});
        throwIfError(reply, "INFO");
        std::istringstream lines(reply.str);
        std::string line;
        const std::string field = "used_memory:";
        while (std::getline(lines, line)) {
            if (line.compare(0, field.size(), field) == 0) {
                return static_cast<size_t>(std::stoull(line.substr(field.size())));
            }
        }
    } catch (const std::exception& e) {
        ++remoteErrors_;
        cacheLogger()->warn("GenericRedisCache: INFO memory недоступен: {}", e.what());
    }
    return std::nullopt;
}

security::ConnectionSecurityInfo GenericRedisCache::securityInfo() const {
    return pool_->lastSecurityInfo();
}

nlohmann::json GenericRedisCache::getStats() const {
    const auto l1 = memory_.getStats();
    CacheMetrics metrics;
    metrics.memoryEntries = l1.value("memory_entries", size_t{0});
    metrics.memoryCapacity = l1.value("memory_capacity", size_t{0});
    metrics.memoryBytes = l1.value("memory_bytes", size_t{0});
    metrics.evictions = l1.value("evictions", size_t{0});
    metrics.hits = hits_;
    metrics.misses = misses_;
    metrics.memoryHits = memoryHits_;
    metrics.remoteHits = remoteHits_;
    metrics.remoteErrors = remoteErrors_;
    metrics.lastUpdate = MetricsClock::now();
    auto j = metrics.toJson();
    j["cache_type"] = cacheType();
    j["closed"] = isClosed();
    j["remote"] = {
        {"endpoint", pool_->name()},
        {"pool", pool_->stats().toJson()},
        {"owns_pool", ownsPool_}
    };
    j["compression"] = {
        {"threshold_bytes", codec_.threshold()},
        {"level", codec_.level()},
        {"compressed_writes", compressedWrites_.load()},
        {"bytes_saved", bytesSaved_.load()}
    };
    j["encryption"] = {
        {"enabled", codec_.encryptionEnabled()},
        {"algorithm", codec_.encryptionEnabled() ? "AES-256-GCM" : "none"},
        {"encrypted_writes", encryptedWrites_.load()}
    };
    return j;
}

MemoryUsageMeasurement GenericRedisCache::memoryUsage() const {
    auto m = memory_.memoryUsage();
    if (auto remoteBytes = remoteMemoryBytes()) {
        m.totalCacheSizeBytes = m.memoryCacheSizeBytes + *remoteBytes;
        m.additional["redis_used_memory"] = *remoteBytes;
    }
    m.timestamp = MetricsClock::now();
    return m;
}

void GenericRedisCache::registerCallback(const std::string& event, Callback callback) {
    static const std::set<std::string> events = {"get_success", "get_miss", "set_success", "set_failure",
                                                 "delete_success"};
    if (events.count(event) == 0) {
        throw ValidationError("Unknown cache event: " + event, "event");
    }
    if (!callback) {
        throw ValidationError("Empty callback for event " + event, "callback");
    }
    std::lock_guard<std::mutex> lock(callbacksMutex_);
    callbacks_[event].push_back(std::move(callback));
}

void GenericRedisCache::fireCallbacks(const std::string& event, const std::string& key) {
    std::vector<Callback> handlers;
    {
        std::lock_guard<std::mutex> lock(callbacksMutex_);
        auto it = callbacks_.find(event);
        if (it == callbacks_.end()) {
            return;
        }
        handlers = it->second;
    }
    for (const auto& handler : handlers) {
        try {
            handler(event, key);
        } catch (const std::exception& e) {
            cacheLogger()->error("GenericRedisCache: обработчик '{}' завершился ошибкой: {}", event, e.what());
        }
    }
}

void GenericRedisCache::recordRemoteError(const std::string& operation, const std::string& key, const std::exception& e) {
    ++remoteErrors_;
    cacheLogger()->warn("GenericRedisCache: {} '{}' не выполнен на {}: {}", operation, key, pool_->name(), e.what());
}

} // namespace cache
} // namespace core
} // namespace cachekit

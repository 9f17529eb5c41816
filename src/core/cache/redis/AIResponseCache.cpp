#include "core/cache/redis/AIResponseCache.hpp"
#include "core/cache/CacheErrors.hpp"
#include "core/cache/CacheLogger.hpp"
#include <chrono>
#include <ctime>

namespace cachekit {
namespace core {
namespace cache {

namespace {

double secondsSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

std::string isoNow() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&now, &tm);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buffer;
}

// Операция в ключе проходит ту же замену | и : что и в CacheKeyGenerator
std::string operationPattern(const std::string& operation) {
    std::string out = std::string(KEY_PREFIX) + ":op:";
    for (char c : operation) {
        if (c == '|' || c == ':') {
            out += '_';
        } else if (c == '*' || c == '?' || c == '[' || c == ']' || c == '\\') {
            out += '\\';
            out += c;
        } else {
            out += c;
        }
    }
    return out + "|*";
}

} // namespace

AIResponseCache::AIResponseCache(std::shared_ptr<ICache> inner, CacheConfig config,
                                 std::shared_ptr<IPerformanceMonitor> monitor)
    : inner_(std::move(inner)),
      config_(std::move(config)),
      monitor_(monitor ? std::move(monitor) : nullMonitor()),
      keyGenerator_(config_.textHashThreshold, monitor_, config_.textSizeTiers) {
    if (!inner_) {
        throw ConfigurationError("AIResponseCache: базовый кэш не задан");
    }
    cacheLogger()->info("AIResponseCache: создан поверх '{}' (hash threshold={}, операций с TTL: {})",
                        inner_->cacheType(), config_.textHashThreshold, config_.operationTtls.size());
}

AIResponseCache::~AIResponseCache() = default;

void AIResponseCache::validateRequest(const std::string& text, const std::string& operation,
                                      const nlohmann::json& options) const {
    if (text.empty()) {
        throw ValidationError("Текст запроса не может быть пустым", "text");
    }
    if (operation.empty()) {
        throw ValidationError("Операция не может быть пустой", "operation");
    }
    if (!options.is_object()) {
        throw ValidationError("options должен быть JSON-объектом", "options");
    }
    const size_t length = CacheKeyGenerator::utf8Length(text);
    if (length > config_.maxTextLength) {
        throw ValidationError("Текст длиной " + std::to_string(length) + " превышает max_text_length=" +
                              std::to_string(config_.maxTextLength), "text");
    }
}

std::string AIResponseCache::buildKey(const std::string& text, const std::string& operation,
                                      const nlohmann::json& options, const std::optional<std::string>& question) const {
    return question ? keyGenerator_.generateKey(operation, text, options, question)
                    : keyGenerator_.generateKey(operation, text, options);
}

bool AIResponseCache::cacheResponse(const std::string& text, const std::string& operation, const nlohmann::json& options,
                                    const nlohmann::json& response, const std::optional<std::string>& question) {
    validateRequest(text, operation, options);
    if (!response.is_object()) {
        throw ValidationError("response должен быть JSON-объектом", "response");
    }
    const auto start = std::chrono::steady_clock::now();
    const std::string key = buildKey(text, operation, options, question);
    const std::string tier = keyGenerator_.textTier(text);
    const int ttl = config_.ttlFor(operation);

    nlohmann::json record = response;
    record["cached_at"] = isoNow();
    record["cache_hit"] = false;
    record["text_length"] = CacheKeyGenerator::utf8Length(text);
    record["text_tier"] = tier;
    record["operation"] = operation;
    record["question_provided"] = question.has_value() || (operation == "qa" && options.contains("question"));

    bool stored = false;
    try {
        stored = inner_->setString(key, record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), ttl);
    } catch (const std::exception& e) {
        cacheLogger()->error("AIResponseCache: не удалось сохранить ответ {}: {}", operation, e.what());
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& counters = operations_[operation];
        if (stored) {
            ++counters.sets;
        } else {
            ++counters.failedSets;
        }
        ++tierDistribution_[tier];
    }
    cacheLogger()->debug("AIResponseCache: ответ {} сохранён={} (tier={}, ttl={}s, {:.3f}s)",
                         operation, stored, tier, ttl, secondsSince(start));
    return stored;
}

std::optional<nlohmann::json> AIResponseCache::getCachedResponse(const std::string& text, const std::string& operation,
                                                                 const nlohmann::json& options,
                                                                 const std::optional<std::string>& question) {
    validateRequest(text, operation, options);
    const auto start = std::chrono::steady_clock::now();
    const std::string key = buildKey(text, operation, options, question);

    std::optional<nlohmann::json> result;
    std::string raw;
    if (inner_->getString(key, raw)) {
        auto parsed = nlohmann::json::parse(raw, nullptr, false);
        if (parsed.is_discarded() || !parsed.is_object()) {
            cacheLogger()->warn("AIResponseCache: запись '{}' не является JSON-объектом, считается промахом", key);
        } else {
            parsed["cache_hit"] = true;
            result = std::move(parsed);
        }
    }
    const double duration = secondsSince(start);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& counters = operations_[operation];
        if (result) {
            ++counters.hits;
        } else {
            ++counters.misses;
        }
        ++counters.gets;
        counters.totalGetSeconds += duration;
    }
    cacheLogger()->debug("AIResponseCache: {} для {} ({:.3f}s)", result ? "попадание" : "промах", operation, duration);
    return result;
}

size_t AIResponseCache::invalidateByOperation(const std::string& operation, const std::string& operationContext) {
    if (operation.empty()) {
        throw ValidationError("Операция не может быть пустой", "operation");
    }
    const size_t removed = inner_->invalidatePattern(operationPattern(operation),
                                                     operationContext.empty() ? "operation:" + operation : operationContext);
    cacheLogger()->info("AIResponseCache: инвалидировано {} ответов операции {}", removed, operation);
    return removed;
}

size_t AIResponseCache::invalidateAll(const std::string& operationContext) {
    const size_t removed = inner_->invalidatePattern(std::string(KEY_PREFIX) + ":*",
                                                     operationContext.empty() ? "invalidate_all" : operationContext);
    cacheLogger()->warn("AIResponseCache: инвалидированы все AI-ответы ({})", removed);
    return removed;
}

nlohmann::json AIResponseCache::getAiPerformanceSummary() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t hits = 0;
    size_t misses = 0;
    nlohmann::json byOperation = nlohmann::json::object();
    for (const auto& [operation, c] : operations_) {
        hits += c.hits;
        misses += c.misses;
        const size_t lookups = c.hits + c.misses;
        byOperation[operation] = {
            {"hits", c.hits},
            {"misses", c.misses},
            {"sets", c.sets},
            {"failed_sets", c.failedSets},
            {"hit_rate", lookups > 0 ? static_cast<double>(c.hits) / static_cast<double>(lookups) * 100.0 : 0.0},
            {"avg_get_time", c.gets > 0 ? c.totalGetSeconds / static_cast<double>(c.gets) : 0.0},
            {"ttl", config_.ttlFor(operation)}
        };
    }
    const size_t total = hits + misses;
    return {
        {"hit_rate", total > 0 ? static_cast<double>(hits) / static_cast<double>(total) * 100.0 : 0.0},
        {"total_lookups", total},
        {"cache_hits", hits},
        {"cache_misses", misses},
        {"operations", byOperation},
        {"text_tier_distribution", tierDistribution_},
        {"backend", inner_->cacheType()}
    };
}

bool AIResponseCache::get(const std::string& key, Bytes& value) { return inner_->get(key, value); }

bool AIResponseCache::set(const std::string& key, const Bytes& value, int ttlSeconds) {
    return inner_->set(key, value, ttlSeconds);
}

bool AIResponseCache::remove(const std::string& key) { return inner_->remove(key); }

bool AIResponseCache::exists(const std::string& key) { return inner_->exists(key); }

size_t AIResponseCache::invalidatePattern(const std::string& pattern, const std::string& operationContext) {
    return inner_->invalidatePattern(pattern, operationContext);
}

bool AIResponseCache::ping() { return inner_->ping(); }

void AIResponseCache::close() { inner_->close(); }

bool AIResponseCache::isClosed() const { return inner_->isClosed(); }

size_t AIResponseCache::size() const { return inner_->size(); }

nlohmann::json AIResponseCache::getStats() const {
    auto j = inner_->getStats();
    j["cache_type"] = cacheType();
    j["ai"] = getAiPerformanceSummary();
    return j;
}

MemoryUsageMeasurement AIResponseCache::memoryUsage() const { return inner_->memoryUsage(); }

std::string AIResponseCache::cacheType() const {
    return "ai_" + inner_->cacheType();
}

} // namespace cache
} // namespace core
} // namespace cachekit

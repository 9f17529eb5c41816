#pragma once
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>
#include "core/cache/CacheConfig.hpp"
#include "core/cache/metrics/PerformanceMonitor.hpp"

namespace cachekit {
namespace core {
namespace cache {

constexpr size_t DEFAULT_TEXT_HASH_THRESHOLD = 1000;
constexpr size_t HASH_CHUNK_SIZE = 8192;
constexpr size_t KEY_HASH_LENGTH = 16;
constexpr const char* KEY_PREFIX = "ai_cache";

// CacheKeyGenerator: детерминированные ключи вида
// ai_cache:op:{operation}|txt:{text|hash:xxxx}[|opts:xxxx][|q:xxxx]
class CacheKeyGenerator {
public:
    explicit CacheKeyGenerator(size_t textHashThreshold = DEFAULT_TEXT_HASH_THRESHOLD,
                               std::shared_ptr<IPerformanceMonitor> monitor = nullMonitor(),
                               TextSizeTiers tiers = {});

    // Для операции qa поле options["question"] выносится в отдельный компонент
    std::string generateKey(const std::string& operation, const std::string& text,
                            const nlohmann::json& options = nlohmann::json::object()) const;
    std::string generateKey(const std::string& operation, const std::string& text,
                            const nlohmann::json& options, const std::optional<std::string>& question) const;

    std::string textTier(const std::string& text) const; // small | medium | large | xlarge
    size_t textHashThreshold() const { return textHashThreshold_; }

    static std::string sha256Hex(std::string_view data); // Потоковый SHA-256 (EVP)
    static size_t utf8Length(std::string_view text); // Кол-во символов

private:
    std::string textComponent(const std::string& text, size_t length) const;

    size_t textHashThreshold_;
    std::shared_ptr<IPerformanceMonitor> monitor_;
    TextSizeTiers tiers_;
};

} // namespace cache
} // namespace core
} // namespace cachekit

#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/cache/CacheConfig.hpp"

namespace cachekit {
namespace core {
namespace cache {

// CachePreset: именованная конфигурация (стратегия + переопределения под окружение)
struct CachePreset {
    std::string name;          // Ключ: simple, ai-production, ...
    std::string displayName;
    std::string description;
    std::vector<std::string> environmentContexts;
    CacheConfig config;        // Без redis_url
    nlohmann::json toJson() const;
};

// Рекомендация пресета для окружения
struct PresetRecommendation {
    std::string presetName;
    double confidence = 0.0;   // 0..1
    std::string reasoning;
    std::string environmentDetected;
    nlohmann::json toJson() const {
        return {{"preset", presetName}, {"confidence", confidence}, {"reasoning", reasoning},
                {"environment_detected", environmentDetected}};
    }
};

// CachePresetManager: каталог пресетов, рекомендации, загрузка из окружения
class CachePresetManager {
public:
    CachePresetManager();

    const CachePreset& getPreset(const std::string& name) const; // Бросает ConfigurationError
    std::vector<std::string> listPresets() const; // В порядке объявления
    nlohmann::json getAllPresetsSummary() const;

    // Без аргумента: автоопределение по CACHE_PRESET, ENVIRONMENT, NODE_ENV, ...
    PresetRecommendation recommendPreset(const std::optional<std::string>& environment = std::nullopt) const;

    // CACHE_PRESET (+ alias testing), CACHE_REDIS_URL, ENABLE_AI_CACHE, CACHE_CUSTOM_CONFIG,
    // REDIS_* для SecurityConfig; результат проверяется validate() (ConfigurationError)
    CacheConfig loadFromEnvironment() const;

private:
    PresetRecommendation autoDetect() const;
    PresetRecommendation matchPattern(const std::string& environment) const;
    bool hasPreset(const std::string& name) const;

    std::vector<CachePreset> presets_;
};

} // namespace cache
} // namespace core
} // namespace cachekit

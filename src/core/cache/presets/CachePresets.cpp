#include "core/cache/presets/CachePresets.hpp"
#include "core/cache/CacheErrors.hpp"
#include "core/cache/CacheLogger.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <map>
#include <tuple>

namespace cachekit {
namespace core {
namespace cache {

namespace {

std::optional<std::string> env(const char* name) {
    const char* value = std::getenv(name);
    if (!value || !*value) {
        return std::nullopt;
    }
    return std::string(value);
}

std::string lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    const auto first = value.find_first_not_of(" \t");
    const auto last = value.find_last_not_of(" \t");
    return first == std::string::npos ? std::string() : value.substr(first, last - first + 1);
}

bool containsAny(const std::string& value, std::initializer_list<const char*> needles) {
    return std::any_of(needles.begin(), needles.end(),
                       [&value](const char* needle) { return value.find(needle) != std::string::npos; });
}

CachePreset makePreset(std::string name, std::string displayName, std::string description,
                       std::vector<std::string> contexts, CacheStrategy strategy, int ttl, int connections,
                       int timeout, size_t memorySize, size_t compressionThreshold, int compressionLevel,
                       bool monitoring, std::string logLevel) {
    CachePreset preset;
    preset.name = std::move(name);
    preset.displayName = std::move(displayName);
    preset.description = std::move(description);
    preset.environmentContexts = std::move(contexts);
    preset.config = CacheConfig::forStrategy(strategy);
    preset.config.defaultTtlSeconds = ttl;
    preset.config.maxConnections = connections;
    preset.config.connectionTimeoutSeconds = timeout;
    preset.config.memoryCacheSize = memorySize;
    preset.config.compressionThresholdBytes = compressionThreshold;
    preset.config.compressionLevel = compressionLevel;
    preset.config.enableMonitoring = monitoring;
    preset.config.logLevel = std::move(logLevel);
    return preset;
}

} // namespace

nlohmann::json CachePreset::toJson() const {
    return {
        {"name", name},
        {"display_name", displayName},
        {"description", description},
        {"environment_contexts", environmentContexts},
        {"configuration", config.toMaskedJson()}
    };
}

CachePresetManager::CachePresetManager() {
    presets_.push_back(makePreset("disabled", "Disabled", "Memory-only cache without a remote connection",
                                  {"testing", "minimal"}, CacheStrategy::Fast,
                                  300, 1, 1, 10, 10000, 1, false, "warn"));
    presets_.push_back(makePreset("minimal", "Minimal", "Lightweight caching for resource-constrained environments",
                                  {"minimal", "embedded", "iot", "container", "serverless"}, CacheStrategy::Fast,
                                  900, 2, 3, 25, 5000, 1, false, "error"));
    presets_.push_back(makePreset("simple", "Simple", "Basic configuration suitable for most deployments",
                                  {"development", "testing", "staging", "production"}, CacheStrategy::Balanced,
                                  3600, 5, 5, 100, 1024, 6, true, "info"));
    presets_.push_back(makePreset("development", "Development", "Fast feedback for local development",
                                  {"development", "local"}, CacheStrategy::Fast,
                                  600, 3, 2, 50, 2048, 3, true, "debug"));
    presets_.push_back(makePreset("production", "Production", "High-throughput configuration for production",
                                  {"production", "staging"}, CacheStrategy::Robust,
                                  7200, 20, 10, 500, 1024, 9, true, "info"));

    auto aiDevelopment = makePreset("ai-development", "AI Development", "AI response caching for development",
                                    {"development", "ai-development"}, CacheStrategy::AiOptimized,
                                    1800, 5, 5, 100, 1024, 6, true, "debug");
    aiDevelopment.config.textHashThreshold = 500;
    aiDevelopment.config.textSizeTiers = TextSizeTiers{500, 2000, 10000};
    aiDevelopment.config.operationTtls = {
        {"summarize", 1800}, {"sentiment", 900}, {"key_points", 1200}, {"questions", 1500}, {"qa", 900}};
    aiDevelopment.config.maxTextLength = 50000;
    presets_.push_back(std::move(aiDevelopment));

    auto aiProduction = makePreset("ai-production", "AI Production", "AI response caching for production workloads",
                                   {"production", "ai-production"}, CacheStrategy::AiOptimized,
                                   14400, 25, 15, 1000, 1024, 9, true, "info");
    aiProduction.config.textHashThreshold = 1000;
    aiProduction.config.textSizeTiers = TextSizeTiers{1000, 5000, 25000};
    aiProduction.config.maxTextLength = 200000;
    presets_.push_back(std::move(aiProduction));

    cacheLogger()->debug("CachePresetManager: загружено пресетов: {}", presets_.size());
}

bool CachePresetManager::hasPreset(const std::string& name) const {
    return std::any_of(presets_.begin(), presets_.end(), [&name](const CachePreset& p) { return p.name == name; });
}

const CachePreset& CachePresetManager::getPreset(const std::string& name) const {
    for (const auto& preset : presets_) {
        if (preset.name == name) {
            return preset;
        }
    }
    std::string available;
    for (const auto& preset : presets_) {
        available += (available.empty() ? "" : ", ") + preset.name;
    }
    throw ConfigurationError("Unknown cache preset '" + name + "'", {"preset: unknown value '" + name + "', available: " + available});
}

std::vector<std::string> CachePresetManager::listPresets() const {
    std::vector<std::string> names;
    names.reserve(presets_.size());
    for (const auto& preset : presets_) {
        names.push_back(preset.name);
    }
    return names;
}

nlohmann::json CachePresetManager::getAllPresetsSummary() const {
    nlohmann::json summary = nlohmann::json::object();
    for (const auto& preset : presets_) {
        summary[preset.name] = preset.toJson();
    }
    return summary;
}

PresetRecommendation CachePresetManager::recommendPreset(const std::optional<std::string>& environment) const {
    if (!environment) {
        return autoDetect();
    }
    static const std::map<std::string, std::tuple<const char*, double, const char*>> exact = {
        {"development", {"development", 0.95, "Exact match for development environment"}},
        {"dev", {"development", 0.90, "Standard abbreviation for development"}},
        {"testing", {"development", 0.85, "Testing uses development-like settings"}},
        {"test", {"development", 0.85, "Test environment should fail fast"}},
        {"staging", {"production", 0.90, "Staging mirrors production settings"}},
        {"stage", {"production", 0.85, "Stage environment abbreviation"}},
        {"production", {"production", 0.95, "Exact match for production environment"}},
        {"prod", {"production", 0.90, "Standard abbreviation for production"}},
        {"live", {"production", 0.85, "Live environment implies production"}},
        {"ai-development", {"ai-development", 0.95, "Exact match for AI development"}},
        {"ai-dev", {"ai-development", 0.90, "AI development abbreviation"}},
        {"ai-production", {"ai-production", 0.95, "Exact match for AI production"}},
        {"ai-prod", {"ai-production", 0.90, "AI production abbreviation"}},
    };
    const std::string key = lower(*environment);
    auto it = exact.find(key);
    if (it != exact.end()) {
        return {std::get<0>(it->second), std::get<1>(it->second), std::get<2>(it->second), *environment};
    }
    auto recommendation = matchPattern(key);
    recommendation.environmentDetected = *environment;
    return recommendation;
}

PresetRecommendation CachePresetManager::matchPattern(const std::string& environment) const {
    if (environment.find("ai") != std::string::npos) {
        if (containsAny(environment, {"prod", "live"})) {
            return {"ai-production", 0.80, "Environment '" + environment + "' matches AI production pattern", {}};
        }
        return {"ai-development", 0.75, "Environment '" + environment + "' contains 'ai', using AI development preset", {}};
    }
    if (containsAny(environment, {"stag", "preprod", "pre-prod", "uat", "integration"})) {
        return {"production", 0.70, "Environment '" + environment + "' matches staging pattern", {}};
    }
    if (containsAny(environment, {"dev", "local", "test", "sandbox", "demo"})) {
        return {"development", 0.75, "Environment '" + environment + "' matches development pattern", {}};
    }
    if (containsAny(environment, {"prod", "live", "release", "stable", "main", "master"})) {
        return {"production", 0.75, "Environment '" + environment + "' matches production pattern", {}};
    }
    return {"simple", 0.40, "Unknown environment pattern '" + environment + "', using simple preset", {}};
}

PresetRecommendation CachePresetManager::autoDetect() const {
    if (auto preset = env("CACHE_PRESET"); preset && hasPreset(*preset)) {
        return {*preset, 0.95, "Explicit CACHE_PRESET=" + *preset, *preset + " (CACHE_PRESET)"};
    }
    const auto aiFlag = env("ENABLE_AI_CACHE");
    const bool enableAi = aiFlag && (lower(*aiFlag) == "true" || *aiFlag == "1" || lower(*aiFlag) == "yes");

    if (auto environment = env("ENVIRONMENT")) {
        const std::string value = lower(*environment);
        if (value == "staging" || value == "stage" || value == "production" || value == "prod") {
            return {"production", 0.70, "ENVIRONMENT=" + *environment + " maps to production preset", *environment + " (auto-detected)"};
        }
        if (value == "development" || value == "dev" || value == "testing" || value == "test") {
            return {"development", 0.70, "ENVIRONMENT=" + *environment + " detected", *environment + " (auto-detected)"};
        }
        if (value.find("ai") != std::string::npos) {
            const bool prod = containsAny(value, {"prod", "production"});
            return {prod ? "ai-production" : "ai-development", 0.75,
                    "AI environment detected from ENVIRONMENT=" + *environment, *environment + " (auto-detected)"};
        }
    }

    for (const char* var : {"NODE_ENV", "ENV", "DEPLOYMENT_ENV", "FLASK_ENV", "RAILS_ENV", "APP_ENV"}) {
        auto value = env(var);
        if (!value) {
            continue;
        }
        cacheLogger()->info("CachePresetManager: окружение определено по {}={}", var, *value);
        auto recommendation = recommendPreset(*value);
        if (enableAi && recommendation.presetName.compare(0, 3, "ai-") != 0 && hasPreset("ai-" + recommendation.presetName)) {
            recommendation.presetName = "ai-" + recommendation.presetName;
            recommendation.confidence *= 0.9;
            recommendation.reasoning += " with AI features enabled";
        }
        recommendation.environmentDetected = *value + " (auto-detected)";
        return recommendation;
    }

    const auto debug = env("DEBUG");
    const std::string host = lower(env("HOST").value_or(""));
    if ((debug && (*debug == "true" || *debug == "1")) || host.find("localhost") != std::string::npos ||
        host.find("127.0.0.1") != std::string::npos) {
        return {enableAi ? "ai-development" : "development", 0.75,
                "Development indicators detected (DEBUG, localhost)", "development (auto-detected)"};
    }
    if (env("PROD").value_or("") == "true" || env("PRODUCTION").value_or("") == "true" ||
        (debug && (*debug == "false" || *debug == "0")) || host.find("prod") != std::string::npos) {
        return {enableAi ? "ai-production" : "production", 0.70,
                "Production indicators detected (PROD, DEBUG=false, host name)", "production (auto-detected)"};
    }
    return {enableAi ? "ai-development" : "simple", 0.50,
            "No clear environment indicators found, using safe default", "unknown (auto-detected)"};
}

CacheConfig CachePresetManager::loadFromEnvironment() const {
    std::string presetName = env("CACHE_PRESET").value_or("");
    if (presetName.empty()) {
        presetName = autoDetect().presetName;
    }
    if (presetName == "testing") {
        presetName = "development";
    }
    CacheConfig config = getPreset(presetName).config;
    cacheLogger()->info("CachePresetManager: загружен пресет '{}'", presetName);

    if (auto url = env("CACHE_REDIS_URL")) {
        if (presetName == "disabled") {
            cacheLogger()->info("CachePresetManager: CACHE_REDIS_URL игнорируется для пресета disabled");
        } else {
            config.remoteUrl = *url;
            cacheLogger()->info("CachePresetManager: применён CACHE_REDIS_URL");
        }
    }
    if (auto flag = env("ENABLE_AI_CACHE")) {
        const std::string value = lower(*flag);
        if (value == "true" || value == "1" || value == "yes") {
            config.enableAiFeatures = true;
        } else if (value == "false" || value == "0" || value == "no") {
            config.enableAiFeatures = false;
        } else {
            throw ConfigurationError("Invalid ENABLE_AI_CACHE value", {"enable_ai_cache: expected true/false, got '" + *flag + "'"});
        }
    }
    if (auto custom = env("CACHE_CUSTOM_CONFIG")) {
        auto overrides = nlohmann::json::parse(*custom, nullptr, false);
        if (overrides.is_discarded()) {
            throw ConfigurationError("CACHE_CUSTOM_CONFIG is not valid JSON", {"CACHE_CUSTOM_CONFIG: invalid JSON"});
        }
        config = CacheConfig::applyOverrides(config, overrides);
        cacheLogger()->info("CachePresetManager: применены переопределения CACHE_CUSTOM_CONFIG ({} ключей)", overrides.size());
    }
    if (auto securityConfig = security::SecurityConfig::fromEnvironment()) {
        config.securityConfig = std::move(securityConfig);
    }

    auto validation = config.validate();
    for (const auto& warning : validation.warnings) {
        cacheLogger()->warn("CachePresetManager: {}", warning);
    }
    if (!validation.isValid()) {
        throw ConfigurationError("Cache configuration from environment is invalid", validation.errors);
    }
    return config;
}

} // namespace cache
} // namespace core
} // namespace cachekit

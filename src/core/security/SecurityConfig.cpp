#include "core/security/SecurityConfig.hpp"
#include "core/cache/CacheErrors.hpp"
#include "core/cache/compression/ValueCodec.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>

namespace cachekit {
namespace core {
namespace security {

namespace {

std::optional<std::string> readEnv(const char* name) {
    const char* value = std::getenv(name);
    if (!value || !*value) {
        return std::nullopt;
    }
    return std::string(value);
}

std::string toLower(const std::string& value) {
    std::string lower(value);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

bool parseBool(const std::string& value, const std::string& field) {
    const std::string lower = toLower(value);
    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") return true;
    if (lower == "false" || lower == "0" || lower == "no" || lower == "off") return false;
    throw cache::ConfigurationError("Invalid boolean value for " + field + ": " + value,
                                    {field + ": expected true/false, got '" + value + "'"});
}

int parseInt(const std::string& value, const std::string& field) {
    size_t consumed = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(value, &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }
    if (consumed == 0 || consumed != value.size()) {
        throw cache::ConfigurationError("Invalid integer value for " + field + ": " + value,
                                        {field + ": not an integer"});
    }
    return parsed;
}

double parseDouble(const std::string& value, const std::string& field) {
    size_t consumed = 0;
    double parsed = 0.0;
    try {
        parsed = std::stod(value, &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }
    if (consumed == 0 || consumed != value.size()) {
        throw cache::ConfigurationError("Invalid number value for " + field + ": " + value,
                                        {field + ": not a number"});
    }
    return parsed;
}

bool regularFileExists(const std::string& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

std::string mask(const std::string& secret) {
    return secret.empty() ? std::string() : std::string("***");
}

} // namespace

std::string toString(SecurityEnvironment env) {
    switch (env) {
        case SecurityEnvironment::Testing: return "testing";
        case SecurityEnvironment::Development: return "development";
        case SecurityEnvironment::Staging: return "staging";
        case SecurityEnvironment::Production: return "production";
    }
    return "development";
}

SecurityEnvironment securityEnvironmentFromString(const std::string& name) {
    const std::string lower = toLower(name);
    if (lower == "testing" || lower == "test") return SecurityEnvironment::Testing;
    if (lower == "development" || lower == "dev") return SecurityEnvironment::Development;
    if (lower == "staging" || lower == "stage") return SecurityEnvironment::Staging;
    if (lower == "production" || lower == "prod") return SecurityEnvironment::Production;
    throw cache::ConfigurationError("Unknown security environment: " + name,
                                    {"environment: expected testing, development, staging or production, got '" +
                                     name + "'"});
}

bool SecurityConfig::hasAuthentication() const {
    return !authPassword.empty() || (!aclUsername.empty() && !aclPassword.empty());
}

std::string SecurityConfig::securityLevel() const {
    if (tlsEnabled && hasAuthentication() && verifyCertificates) {
        return "HIGH";
    }
    if (tlsEnabled || hasAuthentication()) {
        return "MEDIUM";
    }
    return "LOW";
}

std::vector<std::string> SecurityConfig::validate() const {
    std::vector<std::string> issues;
    if (tlsEnabled) {
        // Взаимный TLS: сертификат, ключ и CA обязательны и должны существовать
        const std::pair<const char*, const std::string*> paths[] = {
            {"tls_cert_path", &tlsCertPath}, {"tls_key_path", &tlsKeyPath}, {"tls_ca_path", &tlsCaPath}};
        for (const auto& [field, path] : paths) {
            if (path->empty()) {
                issues.push_back(std::string(field) + ": required when TLS is enabled");
            } else if (!regularFileExists(*path)) {
                issues.push_back(std::string(field) + ": file not found: " + *path);
            }
        }
    } else if (!tlsCertPath.empty() || !tlsKeyPath.empty() || !tlsCaPath.empty()) {
        issues.push_back("use_tls: TLS file paths configured while TLS is disabled");
    }
    if (!aclUsername.empty() && aclPassword.empty()) {
        issues.push_back("acl_password: required when acl_username is provided");
    }
    if (minTlsVersion != "1.2" && minTlsVersion != "1.3") {
        issues.push_back("min_tls_version: must be 1.2 or 1.3");
    }
    if (connectionTimeoutSeconds <= 0) {
        issues.push_back("connection_timeout: must be positive");
    }
    if (maxRetries < 0) {
        issues.push_back("max_retries: cannot be negative");
    }
    if (retryDelaySeconds < 0.0) {
        issues.push_back("retry_delay: cannot be negative");
    }
    if (!encryptionKey.empty() && !cache::ValueCodec::parseEncryptionKey(encryptionKey)) {
        issues.push_back("encryption_key: must be base64 encoding of 32 bytes");
    }
    return issues;
}

std::optional<SecurityConfig> SecurityConfig::fromEnvironment() {
    SecurityConfig config;
    bool any = false;
    if (auto v = readEnv("REDIS_AUTH")) { config.authPassword = *v; any = true; }
    if (auto v = readEnv("REDIS_ACL_USERNAME")) { config.aclUsername = *v; any = true; }
    if (auto v = readEnv("REDIS_ACL_PASSWORD")) { config.aclPassword = *v; any = true; }
    if (auto v = readEnv("REDIS_USE_TLS")) { config.tlsEnabled = parseBool(*v, "REDIS_USE_TLS"); any = true; }
    if (auto v = readEnv("REDIS_TLS_CERT_PATH")) { config.tlsCertPath = *v; any = true; }
    if (auto v = readEnv("REDIS_TLS_KEY_PATH")) { config.tlsKeyPath = *v; any = true; }
    if (auto v = readEnv("REDIS_TLS_CA_PATH")) { config.tlsCaPath = *v; any = true; }
    if (auto v = readEnv("REDIS_VERIFY_CERTIFICATES")) {
        config.verifyCertificates = parseBool(*v, "REDIS_VERIFY_CERTIFICATES");
        any = true;
    }
    if (auto v = readEnv("REDIS_CONNECTION_TIMEOUT")) {
        config.connectionTimeoutSeconds = parseInt(*v, "REDIS_CONNECTION_TIMEOUT");
        any = true;
    }
    if (auto v = readEnv("REDIS_MAX_RETRIES")) { config.maxRetries = parseInt(*v, "REDIS_MAX_RETRIES"); any = true; }
    if (auto v = readEnv("REDIS_RETRY_DELAY")) {
        config.retryDelaySeconds = parseDouble(*v, "REDIS_RETRY_DELAY");
        any = true;
    }
    if (auto v = readEnv("REDIS_ENCRYPTION_KEY")) { config.encryptionKey = *v; any = true; }
    if (auto v = readEnv("CACHE_ENVIRONMENT")) {
        config.environment = securityEnvironmentFromString(*v);
    }
    if (!any) {
        return std::nullopt;
    }
    auto issues = config.validate();
    if (!issues.empty()) {
        throw cache::ConfigurationError("Invalid Redis security configuration in environment", issues);
    }
    return config;
}

nlohmann::json SecurityConfig::toJson() const {
    return serialize(false);
}

nlohmann::json SecurityConfig::toMaskedJson() const {
    return serialize(true);
}

nlohmann::json SecurityConfig::serialize(bool maskSecrets) const {
    return {
        {"redis_auth", maskSecrets ? mask(authPassword) : authPassword},
        {"acl_username", aclUsername},
        {"acl_password", maskSecrets ? mask(aclPassword) : aclPassword},
        {"use_tls", tlsEnabled},
        {"tls_cert_path", tlsCertPath},
        {"tls_key_path", tlsKeyPath},
        {"tls_ca_path", tlsCaPath},
        {"verify_certificates", verifyCertificates},
        {"min_tls_version", minTlsVersion},
        {"connection_timeout", connectionTimeoutSeconds},
        {"max_retries", maxRetries},
        {"retry_delay", retryDelaySeconds},
        {"encryption_key", maskSecrets ? mask(encryptionKey) : encryptionKey},
        {"environment", toString(environment)},
        {"security_level", securityLevel()}
    };
}

SecurityConfig SecurityConfig::fromJson(const nlohmann::json& j) {
    SecurityConfig config;
    try {
        config.authPassword = j.value("redis_auth", std::string());
        config.aclUsername = j.value("acl_username", std::string());
        config.aclPassword = j.value("acl_password", std::string());
        config.tlsEnabled = j.value("use_tls", false);
        config.tlsCertPath = j.value("tls_cert_path", std::string());
        config.tlsKeyPath = j.value("tls_key_path", std::string());
        config.tlsCaPath = j.value("tls_ca_path", std::string());
        config.verifyCertificates = j.value("verify_certificates", true);
        config.minTlsVersion = j.value("min_tls_version", std::string("1.2"));
        config.connectionTimeoutSeconds = j.value("connection_timeout", 5);
        config.maxRetries = j.value("max_retries", 3);
        config.retryDelaySeconds = j.value("retry_delay", 1.0);
        config.encryptionKey = j.value("encryption_key", std::string());
        config.environment = securityEnvironmentFromString(j.value("environment", std::string("development")));
    } catch (const nlohmann::json::exception& e) {
        throw cache::ConfigurationError(std::string("Invalid security configuration: ") + e.what(),
                                        {std::string("security: ") + e.what()});
    }
    return config;
}

bool SecurityConfig::operator==(const SecurityConfig& other) const {
    return authPassword == other.authPassword && aclUsername == other.aclUsername &&
           aclPassword == other.aclPassword && tlsEnabled == other.tlsEnabled &&
           tlsCertPath == other.tlsCertPath && tlsKeyPath == other.tlsKeyPath &&
           tlsCaPath == other.tlsCaPath && verifyCertificates == other.verifyCertificates &&
           minTlsVersion == other.minTlsVersion &&
           connectionTimeoutSeconds == other.connectionTimeoutSeconds &&
           maxRetries == other.maxRetries && retryDelaySeconds == other.retryDelaySeconds &&
           encryptionKey == other.encryptionKey &&
           environment == other.environment;
}

} // namespace security
} // namespace core
} // namespace cachekit

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <unistd.h>
#include <spdlog/spdlog.h>
#include "core/cache/CacheErrors.hpp"
#include "core/cache/compression/ValueCodec.hpp"
#include "core/security/SecurityManager.hpp"

using namespace cachekit::core::security;
using cachekit::core::cache::ConfigurationError;

namespace {

// Временные файлы сертификата, ключа и CA; содержимое не проверяется
struct TlsFiles {
    std::filesystem::path dir;
    std::string cert;
    std::string key;
    std::string ca;

    TlsFiles() {
        dir = std::filesystem::temp_directory_path() / ("cachekit_tls_" + std::to_string(getpid()));
        std::filesystem::create_directories(dir);
        cert = write("client.crt");
        key = write("client.key");
        ca = write("ca.crt");
    }
    ~TlsFiles() {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }
    std::string write(const std::string& name) const {
        const auto path = dir / name;
        std::ofstream(path) << "-----BEGIN PLACEHOLDER-----\n";
        return path.string();
    }
};

const TlsFiles& tlsFiles() {
    static TlsFiles files;
    return files;
}

void applyTlsFiles(SecurityConfig& config) {
    config.tlsEnabled = true;
    config.tlsCertPath = tlsFiles().cert;
    config.tlsKeyPath = tlsFiles().key;
    config.tlsCaPath = tlsFiles().ca;
}

bool envRejected(const char* var, const char* value, const std::string& expectedPrefix) {
    setenv(var, value, 1);
    bool rejected = false;
    try {
        SecurityConfig::fromEnvironment();
    } catch (const ConfigurationError& e) {
        for (const auto& issue : e.issues()) {
            rejected = rejected || issue.rfind(expectedPrefix, 0) == 0;
        }
    }
    unsetenv(var);
    return rejected;
}

SecurityConfig fullySecureConfig(SecurityEnvironment env) {
    SecurityConfig config;
    config.authPassword = "a-very-long-password-1234";
    config.aclUsername = "cache-service";
    config.aclPassword = "another-long-password";
    applyTlsFiles(config);
    config.verifyCertificates = true;
    config.environment = env;
    return config;
}

bool mandatoryFails(SecurityManager& manager, const std::string& url, const std::string& expectedPrefix) {
    try {
        manager.validateMandatorySecurity(url);
    } catch (const ConfigurationError& e) {
        for (const auto& issue : e.issues()) {
            if (issue.rfind(expectedPrefix, 0) == 0) {
                return true;
            }
        }
    }
    return false;
}

} // namespace

void testFullySecureConnection() {
    std::cout << "Testing SecurityManager fully secure connection...\n";
    SecurityManager manager(fullySecureConfig(SecurityEnvironment::Production));
    ConnectionSecurityInfo info;
    info.connected = true;
    info.authenticated = true;
    info.aclUsed = true;
    info.tlsActive = true;
    info.peerVerified = true;
    info.tlsVersion = "TLSv1.3";

    auto result = manager.validateConnectionSecurity(info);
    assert(result.score >= 80);
    assert(result.level == "HIGH");
    assert(result.isSecure);
    assert(result.vulnerabilities.empty());
    for (const auto& recommendation : result.recommendations) {
        assert(recommendation.severity == "optimization");
    }
    auto report = manager.generateSecurityReport();
    assert(report.find("Status: SECURE") != std::string::npos);
    assert(manager.getSecurityStatus()["last_validation"]["is_secure"].get<bool>());
    std::cout << "[OK] SecurityManager fully secure test\n";
}

void testInsecureConnections() {
    std::cout << "Testing SecurityManager insecure connections...\n";
    SecurityConfig open;
    open.environment = SecurityEnvironment::Production;
    SecurityManager openManager(open);
    ConnectionSecurityInfo plain;
    plain.connected = true;
    auto result = openManager.validateConnectionSecurity(plain);
    assert(result.score == 0);
    assert(result.level == "LOW");
    assert(!result.isSecure);
    assert(result.vulnerabilities.size() == 2);
    assert(result.recommendations.front().severity == "critical");

    SecurityConfig noVerify;
    noVerify.authPassword = "a-very-long-password-1234";
    applyTlsFiles(noVerify);
    noVerify.verifyCertificates = false;
    SecurityManager noVerifyManager(noVerify);
    ConnectionSecurityInfo tls;
    tls.connected = true;
    tls.authenticated = true;
    tls.tlsActive = true;
    result = noVerifyManager.validateConnectionSecurity(tls);
    assert(result.score == 55);
    assert(!result.isSecure);

    SecurityConfig weak;
    weak.authPassword = "short";
    SecurityManager weakManager(weak);
    ConnectionSecurityInfo authOnly;
    authOnly.connected = true;
    authOnly.authenticated = true;
    result = weakManager.validateConnectionSecurity(authOnly);
    assert(result.score == 10);
    assert(result.vulnerabilities.size() == 2);
    std::cout << "[OK] SecurityManager insecure connections test\n";
}

void testMandatorySecurity() {
    std::cout << "Testing SecurityManager mandatory requirements...\n";
    SecurityConfig testing;
    testing.environment = SecurityEnvironment::Testing;
    SecurityManager testingManager(testing);
    testingManager.validateMandatorySecurity("redis://localhost:6379");

    SecurityConfig development;
    SecurityManager developmentManager(development);
    assert(mandatoryFails(developmentManager, "redis://localhost:6379", "authentication"));

    SecurityManager production(fullySecureConfig(SecurityEnvironment::Production));
    production.validateMandatorySecurity("rediss://cache.internal:6380");
    assert(mandatoryFails(production, "redis://cache.internal:6379", "redis_url"));

    auto noVerify = fullySecureConfig(SecurityEnvironment::Production);
    noVerify.verifyCertificates = false;
    SecurityManager noVerifyManager(noVerify);
    assert(mandatoryFails(noVerifyManager, "rediss://cache.internal:6380", "verify_certificates"));

    auto staging = fullySecureConfig(SecurityEnvironment::Staging);
    staging.tlsEnabled = false;
    staging.tlsCertPath.clear();
    staging.tlsKeyPath.clear();
    staging.tlsCaPath.clear();
    SecurityManager stagingManager(staging);
    assert(mandatoryFails(stagingManager, "rediss://cache.internal:6380", "use_tls"));

    assert(SecurityManager::isSecureUrl("rediss://host"));
    assert(SecurityManager::isSecureUrl("redis://:secret@host:6379"));
    assert(!SecurityManager::isSecureUrl("redis://host:6379"));

    bool audited = false;
    for (const auto& event : production.recentEvents()) {
        audited = audited || event.type == "mandatory_security_failed";
    }
    assert(audited);
    std::cout << "[OK] SecurityManager mandatory requirements test\n";
}

void testConfigValidation() {
    std::cout << "Testing SecurityConfig validation...\n";
    SecurityConfig acl;
    acl.aclUsername = "user";
    assert(!acl.validate().empty());
    bool thrown = false;
    try {
        SecurityManager manager(acl);
    } catch (const ConfigurationError& e) {
        thrown = !e.issues().empty();
    }
    assert(thrown);

    SecurityConfig files;
    files.tlsCertPath = "/nonexistent/cert.pem";
    assert(files.validate().size() == 1);
    files.tlsEnabled = true;
    // Сертификат отсутствует, ключ и CA не заданы
    auto issues = files.validate();
    assert(issues.size() == 3);
    assert(issues[0] == "tls_cert_path: file not found: /nonexistent/cert.pem");
    assert(issues[1] == "tls_key_path: required when TLS is enabled");
    assert(issues[2] == "tls_ca_path: required when TLS is enabled");

    SecurityConfig tlsOnly;
    tlsOnly.tlsEnabled = true;
    assert(tlsOnly.validate().size() == 3);
    applyTlsFiles(tlsOnly);
    assert(tlsOnly.validate().empty());
    tlsOnly.tlsCaPath = tlsFiles().dir.string();
    issues = tlsOnly.validate();
    assert(issues.size() == 1 && issues[0].rfind("tls_ca_path: file not found", 0) == 0);

    SecurityConfig retries;
    retries.retryDelaySeconds = -1.0;
    assert(retries.validate().size() == 1);

    SecurityConfig encryption;
    encryption.encryptionKey = "c2hvcnQta2V5";
    issues = encryption.validate();
    assert(issues.size() == 1 && issues[0] == "encryption_key: must be base64 encoding of 32 bytes");
    encryption.encryptionKey = cachekit::core::cache::ValueCodec::generateEncryptionKey();
    assert(encryption.validate().empty());
    assert(encryption.toMaskedJson()["encryption_key"] == "***");
    assert(encryption.toJson()["encryption_key"] == encryption.encryptionKey);
    assert(SecurityConfig::fromJson(encryption.toJson()) == encryption);

    SecurityConfig version;
    version.minTlsVersion = "1.1";
    assert(version.validate().size() == 1);

    auto secure = fullySecureConfig(SecurityEnvironment::Production);
    assert(secure.securityLevel() == "HIGH");
    auto masked = secure.toMaskedJson();
    assert(masked["redis_auth"] == "***");
    assert(masked["acl_password"] == "***");
    assert(SecurityConfig::fromJson(secure.toJson()) == secure);
    std::cout << "[OK] SecurityConfig validation test\n";
}

void testFromEnvironment() {
    std::cout << "Testing SecurityConfig::fromEnvironment...\n";
    for (const char* var : {"REDIS_AUTH", "REDIS_ACL_USERNAME", "REDIS_ACL_PASSWORD", "REDIS_USE_TLS",
                            "REDIS_TLS_CERT_PATH", "REDIS_TLS_KEY_PATH", "REDIS_TLS_CA_PATH",
                            "REDIS_VERIFY_CERTIFICATES", "REDIS_CONNECTION_TIMEOUT", "REDIS_MAX_RETRIES",
                            "REDIS_RETRY_DELAY", "CACHE_ENVIRONMENT"}) {
        unsetenv(var);
    }
    assert(!SecurityConfig::fromEnvironment());

    setenv("REDIS_AUTH", "env-password-123456", 1);
    setenv("REDIS_USE_TLS", "yes", 1);
    setenv("CACHE_ENVIRONMENT", "production", 1);
    // TLS без файлов не проходит проверку
    bool missingFiles = false;
    try {
        SecurityConfig::fromEnvironment();
    } catch (const ConfigurationError& e) {
        missingFiles = e.issues().size() == 3;
    }
    assert(missingFiles);

    setenv("REDIS_TLS_CERT_PATH", tlsFiles().cert.c_str(), 1);
    setenv("REDIS_TLS_KEY_PATH", tlsFiles().key.c_str(), 1);
    setenv("REDIS_TLS_CA_PATH", tlsFiles().ca.c_str(), 1);
    setenv("REDIS_MAX_RETRIES", "5", 1);
    setenv("REDIS_RETRY_DELAY", "0.25", 1);
    auto config = SecurityConfig::fromEnvironment();
    assert(config);
    assert(config->authPassword == "env-password-123456");
    assert(config->tlsEnabled);
    assert(config->tlsCaPath == tlsFiles().ca);
    assert(config->maxRetries == 5);
    assert(config->retryDelaySeconds == 0.25);
    assert(config->environment == SecurityEnvironment::Production);

    // Неверные значения не превращаются молча в значения по умолчанию
    assert(envRejected("REDIS_USE_TLS", "ture", "REDIS_USE_TLS"));
    assert(envRejected("REDIS_VERIFY_CERTIFICATES", "maybe", "REDIS_VERIFY_CERTIFICATES"));
    assert(envRejected("CACHE_ENVIRONMENT", "prodution", "environment"));
    assert(envRejected("REDIS_MAX_RETRIES", "3x", "REDIS_MAX_RETRIES"));
    setenv("REDIS_USE_TLS", "yes", 1);
    setenv("CACHE_ENVIRONMENT", "production", 1);
    setenv("REDIS_VERIFY_CERTIFICATES", "OFF", 1);
    assert(!SecurityConfig::fromEnvironment()->verifyCertificates);
    unsetenv("REDIS_VERIFY_CERTIFICATES");
    assert(securityEnvironmentFromString("Staging") == SecurityEnvironment::Staging);

    assert(envRejected("REDIS_CONNECTION_TIMEOUT", "soon", "REDIS_CONNECTION_TIMEOUT"));
    for (const char* var : {"REDIS_AUTH", "REDIS_USE_TLS", "CACHE_ENVIRONMENT", "REDIS_TLS_CERT_PATH",
                            "REDIS_TLS_KEY_PATH", "REDIS_TLS_CA_PATH", "REDIS_MAX_RETRIES", "REDIS_RETRY_DELAY"}) {
        unsetenv(var);
    }
    std::cout << "[OK] SecurityConfig::fromEnvironment test\n";
}

int main() {
    try {
        testFullySecureConnection();
        testInsecureConnections();
        testMandatorySecurity();
        testConfigValidation();
        testFromEnvironment();
        std::cout << "All SecurityManager tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    spdlog::shutdown();
    return 0;
}

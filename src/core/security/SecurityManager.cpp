#include "core/security/SecurityManager.hpp"
#include "core/cache/CacheErrors.hpp"
#include "core/cache/CacheLogger.hpp"
#include <algorithm>
#include <filesystem>
#include <sstream>

namespace cachekit {
namespace core {
namespace security {

namespace {

constexpr size_t WEAK_PASSWORD_LENGTH = 12;
constexpr size_t STRONG_PASSWORD_LENGTH = 16;
constexpr int SECURE_SCORE = 70;

const char* const NO_AUTH = "No authentication configured";
const char* const UNENCRYPTED_PRODUCTION = "Unencrypted connection in production";

std::string levelForScore(int score) {
    if (score >= 80) return "HIGH";
    if (score >= 60) return "MEDIUM";
    return "LOW";
}

bool fileMissing(const std::string& path) {
    std::error_code ec;
    return !path.empty() && !std::filesystem::exists(path, ec);
}

std::vector<SecurityRecommendation> buildRecommendations(const SecurityConfig& config, bool tlsActive) {
    std::vector<SecurityRecommendation> out;
    if (!config.hasAuthentication()) {
        out.push_back({"critical", "Enable Redis authentication (AUTH password or ACL username/password)"});
    } else if (!config.authPassword.empty() && config.aclUsername.empty()) {
        out.push_back({"optimization", "Consider ACL authentication for per-user permissions"});
    }
    if (!tlsActive) {
        out.push_back({"high", "Enable TLS encryption to protect data in transit"});
    } else if (!config.verifyCertificates) {
        out.push_back({"high", "Enable certificate verification to prevent man-in-the-middle attacks"});
    }
    if (!config.authPassword.empty()) {
        if (config.authPassword.size() < WEAK_PASSWORD_LENGTH) {
            out.push_back({"medium", "Use a stronger password (at least 16 characters, mixed classes)"});
        } else if (config.authPassword.size() < STRONG_PASSWORD_LENGTH) {
            out.push_back({"optimization", "Increase password length to 16 characters or more"});
        }
    }
    if (tlsActive) {
        out.push_back({"optimization", "Regularly rotate TLS certificates"});
        out.push_back({"optimization", "Monitor certificate expiration dates"});
    }
    if (config.encryptionKey.empty()) {
        out.push_back({"optimization", "Encrypt cached values at rest (REDIS_ENCRYPTION_KEY)"});
    }
    out.push_back({"optimization", "Deploy Redis in a private network or VPN"});
    out.push_back({"optimization", "Configure firewall rules to restrict Redis port access"});
    out.push_back({"optimization", "Monitor failed authentication attempts"});
    return out;
}

} // namespace

nlohmann::json SecurityValidationResult::toJson() const {
    nlohmann::json recs = nlohmann::json::array();
    for (const auto& r : recommendations) {
        recs.push_back(r.toJson());
    }
    return {
        {"security_score", score},
        {"security_level", level},
        {"is_secure", isSecure},
        {"auth_configured", authConfigured},
        {"acl_enabled", aclEnabled},
        {"tls_enabled", tlsEnabled},
        {"certificate_valid", certificateValid},
        {"connection_encrypted", connectionEncrypted},
        {"vulnerabilities", vulnerabilities},
        {"recommendations", recs},
        {"warnings", warnings},
        {"timestamp", std::chrono::duration_cast<std::chrono::seconds>(timestamp.time_since_epoch()).count()}
    };
}

SecurityManager::SecurityManager(SecurityConfig config) : config_(std::move(config)) {
    auto issues = config_.validate();
    if (!issues.empty()) {
        throw cache::ConfigurationError("Invalid security configuration", issues);
    }
    cache::namedLogger(cache::SECURITY_LOGGER_NAME)->info(
        "SecurityManager создан: level={}, environment={}", config_.securityLevel(), toString(config_.environment));
}

SecurityManager::~SecurityManager() = default;

bool SecurityManager::isSecureUrl(const std::string& url) {
    if (url.rfind("rediss://", 0) == 0) {
        return true;
    }
    return url.rfind("redis://", 0) == 0 && url.find('@') != std::string::npos;
}

void SecurityManager::validateMandatorySecurity(const std::string& url) {
    const auto env = config_.environment;
    std::vector<std::string> issues;
    if (env != SecurityEnvironment::Testing && !config_.hasAuthentication()) {
        issues.push_back("authentication: mandatory for " + toString(env) + " environment");
    }
    const bool strict = env == SecurityEnvironment::Staging || env == SecurityEnvironment::Production;
    if (strict) {
        if (!config_.tlsEnabled) {
            issues.push_back("use_tls: TLS encryption is mandatory for " + toString(env) + " environment");
        }
        if (env == SecurityEnvironment::Production && !config_.verifyCertificates) {
            issues.push_back("verify_certificates: mandatory for production environment");
        }
        if (!isSecureUrl(url)) {
            auto scheme = url.substr(0, url.find("://"));
            issues.push_back("redis_url: insecure URL scheme '" + scheme + "://' not allowed in " + toString(env));
        }
    }
    if (!issues.empty()) {
        auditEvent("mandatory_security_failed", issues.front());
        throw cache::ConfigurationError("Mandatory security requirements are not met", issues);
    }
    auditEvent("mandatory_security_passed", toString(env));
}

SecurityValidationResult SecurityManager::validateConnectionSecurity(const ConnectionSecurityInfo& info) {
    SecurityValidationResult result;
    result.timestamp = std::chrono::system_clock::now();
    result.authConfigured = info.authenticated;
    result.aclEnabled = info.authenticated && info.aclUsed;
    result.tlsEnabled = info.tlsActive;
    result.connectionEncrypted = info.tlsActive;
    const bool certFilesOk = !fileMissing(config_.tlsCertPath) && !fileMissing(config_.tlsKeyPath);
    result.certificateValid = info.tlsActive && certFilesOk && (!config_.verifyCertificates || info.peerVerified);

    if (!info.connected) {
        result.warnings.push_back("Connection is not established; results reflect configuration only");
    }
    if (!result.authConfigured) {
        result.vulnerabilities.push_back(NO_AUTH);
    }
    if (!info.tlsActive) {
        result.vulnerabilities.push_back(config_.environment == SecurityEnvironment::Production
                                             ? UNENCRYPTED_PRODUCTION : "Unencrypted connection");
    } else if (!config_.verifyCertificates) {
        result.vulnerabilities.push_back("Certificate verification disabled");
    }
    if (!config_.authPassword.empty() && config_.authPassword.size() < WEAK_PASSWORD_LENGTH) {
        result.vulnerabilities.push_back("Weak password (shorter than 12 characters)");
    }
    if (config_.tlsEnabled && fileMissing(config_.tlsCertPath)) {
        result.vulnerabilities.push_back("Certificate file not found: " + config_.tlsCertPath);
    }
    if (config_.tlsEnabled && fileMissing(config_.tlsKeyPath)) {
        result.vulnerabilities.push_back("Private key file not found: " + config_.tlsKeyPath);
    }

    int score = 0;
    if (result.authConfigured) {
        score += 20;
        if (result.aclEnabled) score += 10;
    }
    if (result.tlsEnabled) {
        score += 25;
        if (result.certificateValid) score += 10;
        if (result.connectionEncrypted) score += 5;
        if (config_.verifyCertificates && info.peerVerified) score += 20;
    }
    const int penalty = std::min(static_cast<int>(result.vulnerabilities.size()) * 5, 15);
    result.score = std::min(100, std::max(0, score - penalty));
    result.level = levelForScore(result.score);

    bool critical = false;
    for (const auto& v : result.vulnerabilities) {
        if (v == NO_AUTH || v == UNENCRYPTED_PRODUCTION) {
            critical = true;
        }
    }
    result.isSecure = result.score >= SECURE_SCORE && !critical;
    result.recommendations = buildRecommendations(config_, info.tlsActive);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        lastValidation_ = result;
    }
    auditEvent("security_validation", "score=" + std::to_string(result.score) + " secure=" + (result.isSecure ? "true" : "false"));
    return result;
}

std::vector<SecurityRecommendation> SecurityManager::getSecurityRecommendations() const {
    return buildRecommendations(config_, config_.tlsEnabled);
}

nlohmann::json SecurityManager::getSecurityStatus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json status = {
        {"timestamp", std::chrono::duration_cast<std::chrono::seconds>(
                          std::chrono::system_clock::now().time_since_epoch()).count()},
        {"security_level", config_.securityLevel()},
        {"environment", toString(config_.environment)},
        {"configuration", {
            {"has_authentication", config_.hasAuthentication()},
            {"tls_enabled", config_.tlsEnabled},
            {"acl_configured", !config_.aclUsername.empty()},
            {"certificate_verification", config_.verifyCertificates},
            {"connection_timeout", config_.connectionTimeoutSeconds},
            {"max_retries", config_.maxRetries},
            {"value_encryption", !config_.encryptionKey.empty()}
        }},
        {"last_validation", nullptr},
        {"security_events_count", events_.size()},
        {"recommendations_count", buildRecommendations(config_, config_.tlsEnabled).size()}
    };
    if (lastValidation_) {
        status["last_validation"] = {
            {"is_secure", lastValidation_->isSecure},
            {"security_score", lastValidation_->score},
            {"vulnerabilities_count", lastValidation_->vulnerabilities.size()},
            {"recommendations_count", lastValidation_->recommendations.size()}
        };
    }
    return status;
}

std::string SecurityManager::generateSecurityReport(const std::optional<SecurityValidationResult>& result) const {
    std::optional<SecurityValidationResult> validation = result;
    if (!validation) {
        std::lock_guard<std::mutex> lock(mutex_);
        validation = lastValidation_;
    }
    std::ostringstream report;
    report << "Redis Security Report\n";
    report << "Environment: " << toString(config_.environment) << "\n";
    report << "Configured level: " << config_.securityLevel() << "\n";
    if (!validation) {
        report << "No connection validation has been performed\n";
        return report.str();
    }
    report << "Security Score: " << validation->score << "/100 (" << validation->level << ")\n";
    report << "Status: " << (validation->isSecure ? "SECURE" : "INSECURE") << "\n";
    if (!validation->vulnerabilities.empty()) {
        report << "Vulnerabilities:\n";
        for (const auto& v : validation->vulnerabilities) {
            report << "  - " << v << "\n";
        }
    }
    if (!validation->recommendations.empty()) {
        report << "Recommendations:\n";
        for (const auto& r : validation->recommendations) {
            report << "  [" << r.severity << "] " << r.message << "\n";
        }
    }
    return report.str();
}

void SecurityManager::auditEvent(const std::string& event, const std::string& details) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back({std::chrono::system_clock::now(), event, details, config_.securityLevel()});
        while (events_.size() > MAX_SECURITY_EVENTS) {
            events_.pop_front();
        }
    }
    cache::namedLogger(cache::SECURITY_LOGGER_NAME)->info("Security event: {} ({})", event, details);
}

std::vector<SecurityEvent> SecurityManager::recentEvents() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<SecurityEvent>(events_.begin(), events_.end());
}

} // namespace security
} // namespace core
} // namespace cachekit

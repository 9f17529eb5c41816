#include "core/cache/key/CacheKeyGenerator.hpp"
#include "core/cache/CacheErrors.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <iomanip>
#include <sstream>

namespace cachekit {
namespace core {
namespace cache {

namespace {

struct DigestContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

class Sha256Stream {
public:
    Sha256Stream() : ctx_(EVP_MD_CTX_new()) {
        if (!ctx_ || EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
            throw std::runtime_error("EVP_DigestInit_ex(sha256) failed");
        }
    }
    void update(std::string_view data) {
        for (size_t offset = 0; offset < data.size(); offset += HASH_CHUNK_SIZE) {
            const auto chunk = data.substr(offset, HASH_CHUNK_SIZE);
            if (EVP_DigestUpdate(ctx_.get(), chunk.data(), chunk.size()) != 1) {
                throw std::runtime_error("EVP_DigestUpdate failed");
            }
        }
    }
    std::string hex() {
        unsigned char digest[EVP_MAX_MD_SIZE];
        unsigned int length = 0;
        if (EVP_DigestFinal_ex(ctx_.get(), digest, &length) != 1) {
            throw std::runtime_error("EVP_DigestFinal_ex failed");
        }
        std::ostringstream out;
        for (unsigned int i = 0; i < length; ++i) {
            out << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
        }
        return out.str();
    }
private:
    DigestContext ctx_;
};

size_t wordCount(std::string_view text) {
    size_t words = 0;
    bool inWord = false;
    for (unsigned char c : text) {
        if (std::isspace(c)) {
            inWord = false;
        } else if (!inWord) {
            inWord = true;
            ++words;
        }
    }
    return words;
}

// Канонический вид options; строки с невалидным UTF-8 -> ValidationError
std::string canonicalDump(const nlohmann::json& value) {
    try {
        return value.dump();
    } catch (const nlohmann::json::type_error& e) {
        throw ValidationError(std::string("Options contain invalid UTF-8: ") + e.what(), "options");
    }
}

std::string sanitize(const std::string& text) {
    std::string out(text);
    std::replace(out.begin(), out.end(), '|', '_');
    std::replace(out.begin(), out.end(), ':', '_');
    return out;
}

} // namespace

CacheKeyGenerator::CacheKeyGenerator(size_t textHashThreshold, std::shared_ptr<IPerformanceMonitor> monitor,
                                     TextSizeTiers tiers)
    : textHashThreshold_(textHashThreshold),
      monitor_(monitor ? std::move(monitor) : nullMonitor()),
      tiers_(tiers) {}

std::string CacheKeyGenerator::sha256Hex(std::string_view data) {
    Sha256Stream stream;
    stream.update(data);
    return stream.hex();
}

size_t CacheKeyGenerator::utf8Length(std::string_view text) {
    return static_cast<size_t>(std::count_if(text.begin(), text.end(),
        [](char c) { return (static_cast<unsigned char>(c) & 0xC0) != 0x80; }));
}

std::string CacheKeyGenerator::textTier(const std::string& text) const {
    const auto length = utf8Length(text);
    if (length < tiers_.small) return "small";
    if (length < tiers_.medium) return "medium";
    if (length < tiers_.large) return "large";
    return "xlarge";
}

std::string CacheKeyGenerator::textComponent(const std::string& text, size_t length) const {
    if (length <= textHashThreshold_ && textHashThreshold_ > 0) {
        return sanitize(text);
    }
    // Длина и число слов входят в хеш вместе с текстом
    Sha256Stream stream;
    stream.update(text);
    stream.update("|len:" + std::to_string(length) + "|words:" + std::to_string(wordCount(text)));
    return "hash:" + stream.hex().substr(0, KEY_HASH_LENGTH);
}

std::string CacheKeyGenerator::generateKey(const std::string& operation, const std::string& text,
                                           const nlohmann::json& options) const {
    return generateKey(operation, text, options, std::nullopt);
}

std::string CacheKeyGenerator::generateKey(const std::string& operation, const std::string& text,
                                           const nlohmann::json& options,
                                           const std::optional<std::string>& question) const {
    if (operation.empty()) {
        throw ValidationError("Operation name must not be empty", "operation");
    }
    if (!options.is_null() && !options.is_object()) {
        throw ValidationError("Options must be a JSON object", "options");
    }
    const auto start = std::chrono::steady_clock::now();

    nlohmann::json effectiveOptions = options.is_null() ? nlohmann::json::object() : options;
    std::optional<std::string> effectiveQuestion = question;
    if (operation == "qa") {
        auto it = effectiveOptions.find("question");
        if (it != effectiveOptions.end()) {
            if (!effectiveQuestion) {
                effectiveQuestion = it->is_string() ? it->get<std::string>() : canonicalDump(*it);
            }
            effectiveOptions.erase(it);
        }
    }

    const auto length = utf8Length(text);
    std::string key = std::string(KEY_PREFIX) + ":op:" + sanitize(operation) + "|txt:" + textComponent(text, length);
    if (!effectiveOptions.empty()) {
        // nlohmann::json хранит объекты в std::map, dump() даёт отсортированные ключи
        key += "|opts:" + sha256Hex(canonicalDump(effectiveOptions)).substr(0, KEY_HASH_LENGTH);
    }
    if (effectiveQuestion) {
        key += "|q:" + sha256Hex(*effectiveQuestion).substr(0, KEY_HASH_LENGTH);
    }

    if (monitor_->enabled()) {
        const double duration = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        monitor_->recordKeyGeneration(duration, length, operation, {
            {"text_tier", textTier(text)},
            {"has_options", !effectiveOptions.empty()},
            {"has_question", effectiveQuestion.has_value()}
        });
    }
    return key;
}

} // namespace cache
} // namespace core
} // namespace cachekit

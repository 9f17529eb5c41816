#include "core/cache/compression/ValueCodec.hpp"
#include "core/cache/CacheErrors.hpp"
#include "core/cache/CacheLogger.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <zlib.h>
#include <algorithm>
#include <chrono>
#include <cstring>
#include <memory>

namespace cachekit {
namespace core {
namespace cache {

namespace {

bool hasPrefix(const Bytes& data, const char* prefix) {
    const size_t n = std::strlen(prefix);
    return data.size() >= n && std::memcmp(data.data(), prefix, n) == 0;
}

Bytes withPrefix(const char* prefix, const Bytes& body) {
    const size_t n = std::strlen(prefix);
    Bytes out;
    out.reserve(n + body.size());
    out.insert(out.end(), prefix, prefix + n);
    out.insert(out.end(), body.begin(), body.end());
    return out;
}

using CipherContext = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

CipherContext newCipherContext() {
    return CipherContext(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
}

} // namespace

ValueCodec::ValueCodec(size_t thresholdBytes, int level, std::optional<Bytes> encryptionKey)
    : threshold_(thresholdBytes), level_(level), key_(std::move(encryptionKey)) {
    if (key_ && key_->size() != ENCRYPTION_KEY_SIZE) {
        throw ConfigurationError("Encryption key must be 32 bytes",
                                 {"encryption_key: expected 32 bytes, got " + std::to_string(key_->size())});
    }
}

std::optional<Bytes> ValueCodec::encrypt(const Bytes& key, const Bytes& plain) {
    if (key.size() != ENCRYPTION_KEY_SIZE) {
        return std::nullopt;
    }
    Bytes out(GCM_IV_SIZE + plain.size() + GCM_TAG_SIZE);
    if (RAND_bytes(out.data(), static_cast<int>(GCM_IV_SIZE)) != 1) {
        cacheLogger()->error("ValueCodec: RAND_bytes не выдал IV");
        return std::nullopt;
    }
    auto ctx = newCipherContext();
    if (!ctx ||
        EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(GCM_IV_SIZE), nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), out.data()) != 1) {
        return std::nullopt;
    }
    uint8_t* cipher = out.data() + GCM_IV_SIZE;
    int len = 0;
    if (EVP_EncryptUpdate(ctx.get(), cipher, &len, plain.data(), static_cast<int>(plain.size())) != 1) {
        return std::nullopt;
    }
    int total = len;
    if (EVP_EncryptFinal_ex(ctx.get(), cipher + total, &len) != 1) {
        return std::nullopt;
    }
    total += len;
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(GCM_TAG_SIZE), cipher + total) != 1) {
        return std::nullopt;
    }
    out.resize(GCM_IV_SIZE + static_cast<size_t>(total) + GCM_TAG_SIZE);
    return out;
}

std::optional<Bytes> ValueCodec::decrypt(const Bytes& key, const uint8_t* data, size_t size) {
    if (key.size() != ENCRYPTION_KEY_SIZE || size < GCM_IV_SIZE + GCM_TAG_SIZE) {
        return std::nullopt;
    }
    const size_t cipherSize = size - GCM_IV_SIZE - GCM_TAG_SIZE;
    const uint8_t* cipher = data + GCM_IV_SIZE;
    Bytes tag(cipher + cipherSize, cipher + cipherSize + GCM_TAG_SIZE);
    auto ctx = newCipherContext();
    if (!ctx ||
        EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(GCM_IV_SIZE), nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), data) != 1) {
        return std::nullopt;
    }
    Bytes plain(cipherSize + GCM_TAG_SIZE);
    int len = 0;
    if (EVP_DecryptUpdate(ctx.get(), plain.data(), &len, cipher, static_cast<int>(cipherSize)) != 1) {
        return std::nullopt;
    }
    int total = len;
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(GCM_TAG_SIZE), tag.data()) != 1) {
        return std::nullopt;
    }
    // Неверный ключ или изменённые данные: тег не сходится
    if (EVP_DecryptFinal_ex(ctx.get(), plain.data() + total, &len) != 1) {
        return std::nullopt;
    }
    total += len;
    plain.resize(static_cast<size_t>(total));
    return plain;
}

std::optional<Bytes> ValueCodec::parseEncryptionKey(const std::string& base64) {
    std::string normalized;
    normalized.reserve(base64.size() + 3);
    for (char c : base64) {
        if (c == '-') c = '+';
        if (c == '_') c = '/';
        if (c != '\n' && c != '\r' && c != ' ') normalized.push_back(c);
    }
    while (normalized.size() % 4 != 0) {
        normalized.push_back('=');
    }
    if (normalized.empty()) {
        return std::nullopt;
    }
    Bytes decoded(normalized.size() / 4 * 3 + 1);
    const int n = EVP_DecodeBlock(decoded.data(), reinterpret_cast<const unsigned char*>(normalized.data()),
                                  static_cast<int>(normalized.size()));
    if (n < 0) {
        return std::nullopt;
    }
    const size_t padding = static_cast<size_t>(std::count(normalized.end() - 2, normalized.end(), '='));
    const size_t length = static_cast<size_t>(n) - std::min(padding, static_cast<size_t>(n));
    if (length != ENCRYPTION_KEY_SIZE) {
        return std::nullopt;
    }
    decoded.resize(length);
    return decoded;
}

std::string ValueCodec::generateEncryptionKey() {
    Bytes key(ENCRYPTION_KEY_SIZE);
    if (RAND_bytes(key.data(), static_cast<int>(key.size())) != 1) {
        throw CacheError("RAND_bytes failed while generating encryption key", "encryption");
    }
    std::string encoded(4 * ((key.size() + 2) / 3) + 1, '\0');
    const int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&encoded[0]), key.data(), static_cast<int>(key.size()));
    encoded.resize(static_cast<size_t>(n));
    return encoded;
}

std::optional<Bytes> ValueCodec::compress(const Bytes& data, int level) {
    uLongf destLen = compressBound(static_cast<uLong>(data.size()));
    Bytes out(destLen);
    const int rc = compress2(out.data(), &destLen, data.data(), static_cast<uLong>(data.size()), level);
    if (rc != Z_OK) {
        cacheLogger()->warn("ValueCodec: compress2 завершился с кодом {}", rc);
        return std::nullopt;
    }
    out.resize(destLen);
    return out;
}

std::optional<Bytes> ValueCodec::decompress(const uint8_t* data, size_t size) {
    z_stream stream{};
    if (inflateInit(&stream) != Z_OK) {
        return std::nullopt;
    }
    stream.next_in = const_cast<Bytef*>(data);
    stream.avail_in = static_cast<uInt>(size);
    Bytes out;
    uint8_t buffer[16384];
    int rc = Z_OK;
    do {
        stream.next_out = buffer;
        stream.avail_out = sizeof(buffer);
        rc = inflate(&stream, Z_NO_FLUSH);
        if (rc != Z_OK && rc != Z_STREAM_END) {
            inflateEnd(&stream);
            return std::nullopt;
        }
        out.insert(out.end(), buffer, buffer + (sizeof(buffer) - stream.avail_out));
    } while (rc != Z_STREAM_END && (stream.avail_in > 0 || stream.avail_out == 0));
    inflateEnd(&stream);
    if (rc != Z_STREAM_END) {
        return std::nullopt;
    }
    return out;
}

EncodedValue ValueCodec::encode(const Bytes& value) const {
    EncodedValue result;
    result.originalSize = value.size();
    result.payload = withPrefix(RAW_PREFIX, value);
    if (value.size() > threshold_) {
        result.attempted = true;
        const auto start = std::chrono::steady_clock::now();
        auto compressed = compress(value, level_);
        result.durationSeconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        if (compressed) {
            result.compressedSize = compressed->size();
            // Сжатие без выигрыша не сохраняется
            if (compressed->size() < value.size()) {
                result.payload = withPrefix(COMPRESSED_PREFIX, *compressed);
                result.compressed = true;
            }
        } else {
            result.compressedSize = value.size();
        }
    }
    if (key_) {
        auto sealed = encrypt(*key_, result.payload);
        if (!sealed) {
            throw CacheError("AES-256-GCM encryption failed", "encryption");
        }
        result.payload = withPrefix(ENCRYPTED_PREFIX, *sealed);
        result.encrypted = true;
    }
    return result;
}

std::optional<Bytes> ValueCodec::decode(const Bytes& stored) const {
    if (hasPrefix(stored, ENCRYPTED_PREFIX)) {
        if (!key_) {
            cacheLogger()->warn("ValueCodec: зашифрованное значение, ключ шифрования не задан");
            return std::nullopt;
        }
        const size_t n = std::strlen(ENCRYPTED_PREFIX);
        auto inner = decrypt(*key_, stored.data() + n, stored.size() - n);
        if (!inner) {
            cacheLogger()->warn("ValueCodec: не удалось расшифровать значение (ключ или данные)");
            return std::nullopt;
        }
        // Внутри только raw:/compressed:, вложенное шифрование не допускается
        if (hasPrefix(*inner, ENCRYPTED_PREFIX)) {
            return std::nullopt;
        }
        return decode(*inner);
    }
    if (hasPrefix(stored, COMPRESSED_PREFIX)) {
        const size_t n = std::strlen(COMPRESSED_PREFIX);
        return decompress(stored.data() + n, stored.size() - n);
    }
    if (hasPrefix(stored, RAW_PREFIX)) {
        const size_t n = std::strlen(RAW_PREFIX);
        return Bytes(stored.begin() + static_cast<std::ptrdiff_t>(n), stored.end());
    }
    // Значение записано без маркера (внешний клиент)
    return stored;
}

} // namespace cache
} // namespace core
} // namespace cachekit

#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cachekit {
namespace core {
namespace cache {

using Bytes = std::vector<uint8_t>;

constexpr const char* RAW_PREFIX = "raw:";
constexpr const char* COMPRESSED_PREFIX = "compressed:";
constexpr const char* ENCRYPTED_PREFIX = "encrypted:";
constexpr size_t ENCRYPTION_KEY_SIZE = 32; // AES-256
constexpr size_t GCM_IV_SIZE = 12;
constexpr size_t GCM_TAG_SIZE = 16;

// Результат кодирования значения для удалённого хранилища
struct EncodedValue {
    Bytes payload;          // С префиксом raw: / compressed:, либо encrypted: поверх них
    bool compressed = false;
    bool encrypted = false;
    bool attempted = false; // Значение превысило порог
    size_t originalSize = 0;
    size_t compressedSize = 0; // Размер zlib-блока (если была попытка)
    double durationSeconds = 0.0;
};

// ValueCodec: zlib-сжатие значений выше порога с маркером формата и, при заданном ключе,
// AES-256-GCM поверх результата: encrypted: | IV(12) | шифротекст | тег(16)
class ValueCodec {
public:
    // Бросает ConfigurationError, если ключ задан и его длина не ENCRYPTION_KEY_SIZE
    ValueCodec(size_t thresholdBytes, int level, std::optional<Bytes> encryptionKey = std::nullopt);
    EncodedValue encode(const Bytes& value) const; // CacheError при сбое шифрования
    // nullopt = повреждённые данные, неверный ключ или зашифрованное значение без ключа.
    // Незашифрованные значения читаются и при заданном ключе
    std::optional<Bytes> decode(const Bytes& stored) const;

    static std::optional<Bytes> compress(const Bytes& data, int level);
    static std::optional<Bytes> decompress(const uint8_t* data, size_t size);
    static std::optional<Bytes> encrypt(const Bytes& key, const Bytes& plain);
    static std::optional<Bytes> decrypt(const Bytes& key, const uint8_t* data, size_t size);

    // Ключ в base64 (стандартный или URL-safe алфавит), 32 байта после декодирования
    static std::optional<Bytes> parseEncryptionKey(const std::string& base64);
    static std::string generateEncryptionKey();

    size_t threshold() const { return threshold_; }
    int level() const { return level_; }
    bool encryptionEnabled() const { return key_.has_value(); }

private:
    size_t threshold_;
    int level_;
    std::optional<Bytes> key_;
};

} // namespace cache
} // namespace core
} // namespace cachekit

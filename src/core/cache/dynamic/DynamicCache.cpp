#include "core/cache/dynamic/DynamicCache.hpp"

namespace cachekit {
namespace core {
namespace cache {

// Явная инстанциация для L1-кэша байтовых значений
template class DynamicCache<std::string, std::vector<uint8_t>>;

} // namespace cache
} // namespace core
} // namespace cachekit

#include "tagcache/cache/base/TaggedCache.hpp"
#include <stdexcept>

namespace tagcache {
namespace cache {

void validateTtl(const Ttl& ttl) {
    if (ttl && ttl->count() <= 0) {
        throw std::invalid_argument("TTL must be positive, got " + std::to_string(ttl->count()) + "s");
    }
}

} // namespace cache
} // namespace tagcache

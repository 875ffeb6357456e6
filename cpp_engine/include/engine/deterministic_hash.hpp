#pragma once

#include <cstdint>
#include <string>

namespace tollgate::engine {

// FNV-1a over the raw bytes; stable across platforms so address buckets and
// replay digests do not depend on the standard library's std::hash.
inline uint64_t fnv1a64(const std::string &s, uint64_t seed = 1469598103934665603ULL) {
    uint64_t hash = seed;
    constexpr uint64_t prime = 1099511628211ULL;
    for (unsigned char c : s) {
        hash ^= static_cast<uint64_t>(c);
        hash *= prime;
    }
    return hash;
}

}  // namespace tollgate::engine

#pragma once

#include <chrono>
#include <cstdint>

namespace tollgate::utils {

inline std::chrono::nanoseconds now_ns() {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now().time_since_epoch());
}

// Wall-clock seconds, used for exchange deadlines.
inline int64_t unix_now_s() {
    return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
        .count();
}

}  // namespace tollgate::utils

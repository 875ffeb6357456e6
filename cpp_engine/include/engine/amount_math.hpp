#pragma once

#include <limits>

#include "engine/errors.hpp"
#include "engine/types.hpp"

namespace tollgate::engine {

// floor(a * b / denom) with a 128-bit intermediate.
inline Amount mul_div(Amount a, Amount b, Amount denom) {
    if (denom == 0) {
        throw EngineError(ErrorCode::Overflow, "mul_div by zero");
    }
    const unsigned __int128 wide = static_cast<unsigned __int128>(a) * b / denom;
    if (wide > std::numeric_limits<Amount>::max()) {
        throw EngineError(ErrorCode::Overflow, "mul_div result exceeds amount range");
    }
    return static_cast<Amount>(wide);
}

inline Amount checked_add(Amount a, Amount b) {
    if (a > std::numeric_limits<Amount>::max() - b) {
        throw EngineError(ErrorCode::Overflow, "amount addition overflows");
    }
    return a + b;
}

inline Amount isqrt(unsigned __int128 value) {
    if (value == 0) {
        return 0;
    }
    unsigned __int128 x = value;
    unsigned __int128 y = (x + 1) / 2;
    while (y < x) {
        x = y;
        y = (x + value / x) / 2;
    }
    return static_cast<Amount>(x);
}

}  // namespace tollgate::engine

#pragma once

#include "base/Base.h"

#include <bit>
#include <cstdint>
#include <cstring>

SEGMAP_UTIL_BEGIN

template <typename T>
constexpr T FromBytes(const unsigned char* seq, bool pLittleEndian) {
    T value;
    std::memcpy(&value, seq, sizeof(T));
    if (pLittleEndian != (std::endian::native == std::endian::little)) {
        T swapped{};
        for (size_t i = 0; i < sizeof(T); i++) {
            swapped = (T)((swapped << 8) | ((value >> (i * 8)) & 0xFF));
        }
        value = swapped;
    }
    return value;
}

constexpr uint64_t RoundUp4(uint64_t pValue) { return (pValue + 3) & ~(uint64_t)3; }

SEGMAP_UTIL_END

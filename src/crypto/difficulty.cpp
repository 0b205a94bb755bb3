/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "beanpow/crypto/difficulty.hpp"
#include "beanpow/chain/encoding_error.hpp"
#include "beanpow/crypto/word_ops.hpp"

#include <fmt/format.h>

namespace beanpow {
namespace crypto {

Target compact_to_target(std::uint32_t bits) {
    // bits = 0xEEMMMMMM where EE is the exponent (size in bytes) and MMMMMM the mantissa
    const int exponent = static_cast<int>((bits >> 24) & 0xFF);
    std::uint32_t mantissa = bits & 0x00FFFFFF;

    Target target{};
    if (exponent <= 3) {
        mantissa >>= 8 * (3 - exponent);
        target[29] = static_cast<std::uint8_t>(mantissa >> 16);
        target[30] = static_cast<std::uint8_t>(mantissa >> 8);
        target[31] = static_cast<std::uint8_t>(mantissa);
        return target;
    }

    // Mantissa bytes land big-endian starting 'exponent' bytes from the end
    for (int i = 0; i < 3; ++i) {
        const auto byte = static_cast<std::uint8_t>(mantissa >> (8 * (2 - i)));
        const int index = 32 - exponent + i;
        if (index < 0) {
            if (byte != 0) {
                throw chain::EncodingError(
                    fmt::format("compact target 0x{:08x} overflows 256 bits", bits));
            }
            continue;
        }
        target[index] = byte;
    }
    return target;
}

std::uint32_t target_to_compact(const Target& target) {
    std::size_t first = 0;
    while (first < target.size() && target[first] == 0) {
        ++first;
    }
    if (first == target.size()) {
        return 0;
    }

    std::uint32_t size = static_cast<std::uint32_t>(target.size() - first);
    std::uint32_t mantissa = 0;
    for (std::size_t i = 0; i < 3; ++i) {
        mantissa <<= 8;
        if (first + i < target.size()) {
            mantissa |= target[first + i];
        }
    }
    // Mantissa high bit is the sign bit in the compact format; keep it clear
    if (mantissa & 0x00800000) {
        mantissa >>= 8;
        ++size;
    }
    return (size << 24) | mantissa;
}

bool meets_target(const Digest& digest, const Target& target) {
    // Display order is the digest reversed, compare most significant first
    for (std::size_t i = 0; i < target.size(); ++i) {
        const std::uint8_t d = digest[digest.size() - 1 - i];
        if (d < target[i]) return true;
        if (d > target[i]) return false;
    }
    return true;
}

std::uint32_t target_top_word(const Target& target) {
    return ops::load_be32(target.data());
}

} // namespace crypto
} // namespace beanpow

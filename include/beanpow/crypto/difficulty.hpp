#pragma once

#include <array>
#include <cstdint>

#include <beanpow/crypto/sha256_engine.hpp>

namespace beanpow::crypto {

// 256-bit target, big-endian (most significant byte first)
using Target = std::array<std::uint8_t, 32>;

// Compact target (nBits) to 256-bit target: mantissa * 256^(exponent - 3).
// Throws chain::EncodingError if the value does not fit in 256 bits.
Target compact_to_target(std::uint32_t bits);

// Smallest compact encoding of a target (inverse of compact_to_target for
// targets it produced).
std::uint32_t target_to_compact(const Target& target);

// True if the digest (natural SHA-256 byte order) read as a big-endian
// integer over its display order is <= target.
bool meets_target(const Digest& digest, const Target& target);

// Most significant 32 bits of the target.
std::uint32_t target_top_word(const Target& target);

} // namespace beanpow::crypto

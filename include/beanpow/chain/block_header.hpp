/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

#include "beanpow/chain/encoding_error.hpp"
#include "beanpow/crypto/sha256_engine.hpp"

namespace beanpow {
namespace chain {

constexpr std::size_t kHeaderSize = 80;

// Byte offsets inside the encoded header
constexpr std::size_t kVersionOffset = 0;
constexpr std::size_t kPrevHashOffset = 4;
constexpr std::size_t kMerkleRootOffset = 36;
constexpr std::size_t kTimeOffset = 68;
constexpr std::size_t kBitsOffset = 72;
constexpr std::size_t kNonceOffset = 76;

using HeaderBytes = std::array<std::uint8_t, kHeaderSize>;
using Hash256 = std::array<std::uint8_t, 32>;

/**
 * Mining-relevant block header fields.
 *
 * Hashes are kept in internal byte order (reversed relative to how
 * explorers display them). Only the nonce changes during a search.
 */
struct BlockHeader {
    std::int32_t version{0};
    Hash256 prev_block_hash{};
    Hash256 merkle_root{};
    std::uint32_t timestamp{0};
    std::uint32_t bits{0};
    std::uint32_t nonce{0};
};

bool operator==(const BlockHeader& lhs, const BlockHeader& rhs);
inline bool operator!=(const BlockHeader& lhs, const BlockHeader& rhs) { return !(lhs == rhs); }

// 80-byte little-endian concatenation in field order
HeaderBytes encode(const BlockHeader& header);

// Inverse of encode. Throws EncodingError unless len == 80.
BlockHeader decode(const std::uint8_t* data, std::size_t len);
BlockHeader decode(const HeaderBytes& bytes);

// Copy of header with a different nonce
BlockHeader with_nonce(const BlockHeader& header, std::uint32_t nonce);

// Decode a header given as 160 hex characters
BlockHeader header_from_hex(const std::string& hex);

// SHA-256d of the encoded header (natural byte order)
crypto::Digest header_hash(const BlockHeader& header);

} // namespace chain
} // namespace beanpow

/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "beanpow/chain/block_header.hpp"
#include "beanpow/crypto/word_ops.hpp"
#include "beanpow/util/hex.hpp"

#include <algorithm>
#include <fmt/format.h>

namespace beanpow {
namespace chain {

using crypto::ops::load_le32;
using crypto::ops::store_le32;

bool operator==(const BlockHeader& lhs, const BlockHeader& rhs) {
    return lhs.version == rhs.version &&
           lhs.prev_block_hash == rhs.prev_block_hash &&
           lhs.merkle_root == rhs.merkle_root &&
           lhs.timestamp == rhs.timestamp &&
           lhs.bits == rhs.bits &&
           lhs.nonce == rhs.nonce;
}

HeaderBytes encode(const BlockHeader& header) {
    HeaderBytes out{};
    store_le32(out.data() + kVersionOffset, static_cast<std::uint32_t>(header.version));
    std::copy(header.prev_block_hash.begin(), header.prev_block_hash.end(), out.begin() + kPrevHashOffset);
    std::copy(header.merkle_root.begin(), header.merkle_root.end(), out.begin() + kMerkleRootOffset);
    store_le32(out.data() + kTimeOffset, header.timestamp);
    store_le32(out.data() + kBitsOffset, header.bits);
    store_le32(out.data() + kNonceOffset, header.nonce);
    return out;
}

BlockHeader decode(const std::uint8_t* data, std::size_t len) {
    if (len != kHeaderSize) {
        throw EncodingError(fmt::format("block header must be {} bytes, got {}", kHeaderSize, len));
    }
    BlockHeader header;
    header.version = static_cast<std::int32_t>(load_le32(data + kVersionOffset));
    std::copy(data + kPrevHashOffset, data + kPrevHashOffset + 32, header.prev_block_hash.begin());
    std::copy(data + kMerkleRootOffset, data + kMerkleRootOffset + 32, header.merkle_root.begin());
    header.timestamp = load_le32(data + kTimeOffset);
    header.bits = load_le32(data + kBitsOffset);
    header.nonce = load_le32(data + kNonceOffset);
    return header;
}

BlockHeader decode(const HeaderBytes& bytes) {
    return decode(bytes.data(), bytes.size());
}

BlockHeader with_nonce(const BlockHeader& header, std::uint32_t nonce) {
    BlockHeader out = header;
    out.nonce = nonce;
    return out;
}

BlockHeader header_from_hex(const std::string& hex) {
    const auto bytes = util::hex_to_bytes(hex);
    return decode(bytes.data(), bytes.size());
}

crypto::Digest header_hash(const BlockHeader& header) {
    const auto bytes = encode(header);
    return crypto::sha256d(bytes.data(), bytes.size());
}

} // namespace chain
} // namespace beanpow

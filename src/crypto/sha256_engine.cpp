/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "beanpow/crypto/sha256_engine.hpp"
#include "beanpow/crypto/word_ops.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <vector>

namespace beanpow {
namespace crypto {

namespace {

const HashState kIV{{
    0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a,
    0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19
}};

const std::array<std::uint32_t, kRounds> kK = {
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5, 0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
    0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3, 0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
    0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc, 0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7, 0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
    0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13, 0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
    0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3, 0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5, 0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
    0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208, 0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2
};

void check_range(RoundRange range) {
    if (range.start > range.end || range.end > kRounds) {
        throw InvalidCompressionInput(
            fmt::format("invalid round range [{}, {})", range.start, range.end));
    }
}

void check_block(std::size_t len) {
    if (len != kBlockSize) {
        throw InvalidCompressionInput(
            fmt::format("message block must be {} bytes, got {}", kBlockSize, len));
    }
}

} // namespace

const HashState& initial_state() {
    return kIV;
}

MessageSchedule expand_schedule(const MessageBlock& block) {
    MessageSchedule w{};
    for (std::size_t t = 0; t < 16; ++t) {
        w[t] = ops::load_be32(block.data() + t * 4);
    }
    for (std::size_t t = 16; t < kRounds; ++t) {
        w[t] = ops::add(ops::small_sigma1(w[t - 2]), w[t - 7],
                        ops::small_sigma0(w[t - 15]), w[t - 16]);
    }
    return w;
}

MessageSchedule expand_schedule(const std::uint8_t* block, std::size_t len) {
    check_block(len);
    MessageBlock copy;
    std::copy(block, block + kBlockSize, copy.begin());
    return expand_schedule(copy);
}

HashState round(const HashState& state, unsigned t, std::uint32_t w) {
    if (t >= kRounds) {
        throw InvalidCompressionInput(fmt::format("round index {} out of range", t));
    }
    const auto& r = state.words;
    const std::uint32_t t1 = ops::add(r[7], ops::big_sigma1(r[4]), ops::ch(r[4], r[5], r[6]), kK[t], w);
    const std::uint32_t t2 = ops::add(ops::big_sigma0(r[0]), ops::maj(r[0], r[1], r[2]));

    HashState next;
    next.words[0] = ops::add(t1, t2);
    next.words[1] = r[0];
    next.words[2] = r[1];
    next.words[3] = r[2];
    next.words[4] = ops::add(r[3], t1);
    next.words[5] = r[4];
    next.words[6] = r[5];
    next.words[7] = r[6];
    return next;
}

HashState run_rounds(const HashState& initial, const MessageSchedule& schedule, RoundRange range) {
    check_range(range);
    HashState state = initial;
    for (unsigned t = range.start; t < range.end; ++t) {
        state = round(state, t, schedule[t]);
    }
    return state;
}

HashState run_rounds(const HashState& initial, const MessageBlock& block, RoundRange range) {
    check_range(range);
    return run_rounds(initial, expand_schedule(block), range);
}

HashState run_rounds(const HashState& initial, const std::uint8_t* block, std::size_t len,
                     RoundRange range) {
    check_range(range);
    return run_rounds(initial, expand_schedule(block, len), range);
}

HashState feed_forward(const HashState& chaining, const HashState& working) {
    HashState out;
    for (std::size_t i = 0; i < out.words.size(); ++i) {
        out.words[i] = ops::add(chaining.words[i], working.words[i]);
    }
    return out;
}

HashState compress(const HashState& chaining, const MessageBlock& block) {
    return feed_forward(chaining, run_rounds(chaining, block, kFullRange));
}

Digest finalize(const HashState& state) {
    Digest out{};
    for (std::size_t i = 0; i < state.words.size(); ++i) {
        ops::store_be32(out.data() + i * 4, state.words[i]);
    }
    return out;
}

MessageBlock pad_digest_block(const Digest& digest) {
    MessageBlock block{};
    std::copy(digest.begin(), digest.end(), block.begin());
    block[kDigestSize] = 0x80;
    // 256-bit message length, big-endian in the last 8 bytes
    block[62] = 0x01;
    block[63] = 0x00;
    return block;
}

Digest sha256(const std::uint8_t* data, std::size_t len) {
    // Message + 0x80 + zero fill, then the 64-bit bit length
    const std::size_t padded_len = ((len + 8) / kBlockSize + 1) * kBlockSize;
    std::vector<std::uint8_t> padded(padded_len, 0);
    if (len > 0) {
        std::copy(data, data + len, padded.begin());
    }
    padded[len] = 0x80;
    const std::uint64_t bit_len = static_cast<std::uint64_t>(len) * 8;
    for (int i = 0; i < 8; ++i) {
        padded[padded_len - 1 - i] = static_cast<std::uint8_t>(bit_len >> (8 * i));
    }

    HashState state = kIV;
    for (std::size_t off = 0; off < padded_len; off += kBlockSize) {
        MessageBlock block;
        std::copy(padded.begin() + off, padded.begin() + off + kBlockSize, block.begin());
        state = compress(state, block);
    }
    return finalize(state);
}

Digest sha256d(const std::uint8_t* data, std::size_t len) {
    const Digest first = sha256(data, len);
    return finalize(compress(kIV, pad_digest_block(first)));
}

} // namespace crypto
} // namespace beanpow

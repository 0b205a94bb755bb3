/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>

namespace beanpow::crypto {

constexpr unsigned kRounds = 64;
constexpr std::size_t kBlockSize = 64;
constexpr std::size_t kDigestSize = 32;

using MessageBlock = std::array<std::uint8_t, kBlockSize>;
using MessageSchedule = std::array<std::uint32_t, kRounds>;
using Digest = std::array<std::uint8_t, kDigestSize>;

/**
 * Eight 32-bit registers at a round boundary of the compression function.
 *
 * Between rounds the words are the working variables a..h; after
 * feed_forward() they are the chaining value H0..H7. A state is a plain
 * value: every round returns a new one, so a partial result can be
 * copied and reused freely (midstates, worker threads).
 */
struct HashState {
    std::array<std::uint32_t, 8> words{};

    std::uint32_t a() const { return words[0]; }
    std::uint32_t e() const { return words[4]; }
    std::uint32_t h() const { return words[7]; }
};

inline bool operator==(const HashState& lhs, const HashState& rhs) { return lhs.words == rhs.words; }
inline bool operator!=(const HashState& lhs, const HashState& rhs) { return !(lhs == rhs); }

// Half-open interval of round indices [start, end)
struct RoundRange {
    unsigned start{0};
    unsigned end{kRounds};
};

constexpr RoundRange kFullRange{0, kRounds};

// Raised for a message block that is not exactly 64 bytes or a round range
// outside [0, 64]. Never seen with a correctly encoded header.
class InvalidCompressionInput : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// SHA-256 initial hash value H(0)
const HashState& initial_state();

/**
 * Expand a 64-byte block into the 64-word message schedule.
 * W0..W15 are the block's big-endian words, the rest follow
 * W[t] = s1(W[t-2]) + W[t-7] + s0(W[t-15]) + W[t-16].
 */
MessageSchedule expand_schedule(const MessageBlock& block);
MessageSchedule expand_schedule(const std::uint8_t* block, std::size_t len);

// One round transformation with round index t and scheduled word w.
HashState round(const HashState& state, unsigned t, std::uint32_t w);

/**
 * Run rounds [range.start, range.end) starting from `initial`, which must be
 * the register state at round boundary range.start. Returns the registers at
 * range.end. With range.end < 64 the result is a partial state, not a digest.
 * Throws InvalidCompressionInput for an invalid range or block length.
 */
HashState run_rounds(const HashState& initial, const MessageSchedule& schedule,
                     RoundRange range = kFullRange);
HashState run_rounds(const HashState& initial, const MessageBlock& block,
                     RoundRange range = kFullRange);
HashState run_rounds(const HashState& initial, const std::uint8_t* block, std::size_t len,
                     RoundRange range = kFullRange);

// Word-wise modular add of the chaining value and the round-64 registers.
HashState feed_forward(const HashState& chaining, const HashState& working);

// One full compression: feed_forward(chaining, run_rounds(chaining, block)).
HashState compress(const HashState& chaining, const MessageBlock& block);

// Serialize H0..H7 big-endian into the 32-byte digest.
Digest finalize(const HashState& state);

// 32-byte digest + 0x80 + zeros + 64-bit length (256 bits): the single block
// hashed by the second pass of SHA-256d.
MessageBlock pad_digest_block(const Digest& digest);

// Whole-message helpers with standard SHA-256 padding.
Digest sha256(const std::uint8_t* data, std::size_t len);
Digest sha256d(const std::uint8_t* data, std::size_t len);

} // namespace beanpow::crypto

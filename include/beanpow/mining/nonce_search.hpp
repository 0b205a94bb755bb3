/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <optional>

#include "beanpow/chain/block_header.hpp"
#include "beanpow/crypto/difficulty.hpp"
#include "beanpow/crypto/sha256_engine.hpp"
#include "beanpow/logging/logger.hpp"

namespace beanpow {
namespace mining {

// Tail block words W0..W2 (merkle tail, time, bits) do not depend on the
// nonce (W3), so the first three rounds of the second header block are
// computed once per search.
constexpr unsigned kTailPrefixRounds = 3;

// Register e after round 60 becomes h after round 63, so digest word H7,
// the most significant word in display order, is known once rounds
// [0, 61) of the second pass have run.
constexpr unsigned kEarlyExitRound = 61;

// Offset of the nonce inside the second (tail) block
constexpr std::size_t kTailNonceOffset = chain::kNonceOffset - crypto::kBlockSize;

enum class SearchStatus {
    Idle,
    Searching,
    Found,
    Exhausted,
    Stopped
};

const char* to_string(SearchStatus status);

// Inclusive nonce interval
struct NonceRange {
    std::uint32_t first{0};
    std::uint32_t last{0xFFFFFFFF};

    std::uint64_t size() const { return static_cast<std::uint64_t>(last) - first + 1; }
};

struct SearchOptions {
    NonceRange range;
    unsigned threads{1};
    std::uint64_t progress_interval{0}; // log every N nonces per worker, 0 = off
    bool verify{false};                 // recheck a hit with the OpenSSL reference
};

struct SearchStats {
    std::uint64_t nonces_tried{0};
    std::uint64_t early_exits{0};
    std::uint64_t full_hashes{0};
    double elapsed_seconds{0.0};

    double hashrate() const {
        return elapsed_seconds > 0.0 ? static_cast<double>(nonces_tried) / elapsed_seconds : 0.0;
    }

    SearchStats& operator+=(const SearchStats& other);
};

struct SearchResult {
    SearchStatus status{SearchStatus::Idle};
    std::uint32_t nonce{0};
    crypto::Digest digest{};        // natural SHA-256 byte order
    std::optional<bool> verified;   // set when SearchOptions::verify is on
    SearchStats stats;

    bool found() const { return status == SearchStatus::Found; }
};

/**
 * Everything about a header that does not change with the nonce.
 *
 * Built once per search and shared read-only by all workers.
 */
class SearchPlan {
public:
    // Throws chain::EncodingError if the header's compact target is invalid.
    explicit SearchPlan(const chain::BlockHeader& header);

    struct Attempt {
        bool early_exit{false};
        bool meets_target{false};
        crypto::Digest digest{}; // valid only when !early_exit
    };

    // Double-hash one nonce, abandoning it after round 61 of the second
    // pass when the top digest word already exceeds the target's.
    Attempt evaluate(std::uint32_t nonce) const;

    // Same pipeline without the early exit (always a full digest).
    crypto::Digest full_digest(std::uint32_t nonce) const;

    // Second header block for a given nonce (bytes 64..79 + padding)
    crypto::MessageBlock tail_block(std::uint32_t nonce) const;

    const chain::BlockHeader& header() const { return header_; }
    const crypto::Target& target() const { return target_; }
    const crypto::HashState& midstate() const { return midstate_; }
    const crypto::HashState& tail_prefix_state() const { return tail_prefix_; }

private:
    crypto::Digest first_pass(std::uint32_t nonce) const;

    chain::BlockHeader header_;
    crypto::Target target_{};
    std::uint32_t target_top_{0};
    crypto::HashState midstate_;
    crypto::MessageBlock tail_template_{};
    crypto::HashState tail_prefix_;
};

/**
 * Scans a nonce range for the first value whose SHA-256d meets the
 * header's target. Idle -> Searching -> {Found | Exhausted | Stopped}.
 *
 * Each run() is independent; nothing carries over between calls.
 */
class NonceSearcher {
public:
    // Throws std::invalid_argument if options.range.first > options.range.last.
    NonceSearcher(const chain::BlockHeader& header, SearchOptions options = {},
                  logging::Logger* log = nullptr);

    // `stop` is polled between nonces; setting it ends the run as Stopped.
    SearchResult run(const std::atomic<bool>* stop = nullptr);

    SearchStatus status() const { return status_.load(); }
    const SearchPlan& plan() const { return plan_; }
    const SearchOptions& options() const { return options_; }

private:
    void verify_hit(SearchResult& result) const;

    SearchPlan plan_;
    SearchOptions options_;
    logging::Logger* log_;
    std::atomic<SearchStatus> status_{SearchStatus::Idle};
};

// Decode an 80-byte header and search it. Decode errors propagate before
// any hashing starts.
SearchResult search_header_bytes(const std::uint8_t* data, std::size_t len,
                                 const SearchOptions& options = {},
                                 logging::Logger* log = nullptr);

} // namespace mining
} // namespace beanpow

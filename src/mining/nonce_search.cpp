/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "beanpow/mining/nonce_search.hpp"
#include "beanpow/mining/parallel_search.hpp"
#include "beanpow/crypto/sha256d.hpp"
#include "beanpow/crypto/word_ops.hpp"
#include "beanpow/util/hex.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <fmt/format.h>

namespace beanpow {
namespace mining {

using crypto::Digest;
using crypto::HashState;
using crypto::MessageBlock;
using crypto::RoundRange;
namespace ops = crypto::ops;

const char* to_string(SearchStatus status) {
    switch (status) {
        case SearchStatus::Idle:      return "idle";
        case SearchStatus::Searching: return "searching";
        case SearchStatus::Found:     return "found";
        case SearchStatus::Exhausted: return "exhausted";
        case SearchStatus::Stopped:   return "stopped";
    }
    return "unknown";
}

SearchStats& SearchStats::operator+=(const SearchStats& other) {
    nonces_tried += other.nonces_tried;
    early_exits += other.early_exits;
    full_hashes += other.full_hashes;
    return *this;
}

SearchPlan::SearchPlan(const chain::BlockHeader& header)
    : header_(header)
    , target_(crypto::compact_to_target(header.bits))
    , target_top_(crypto::target_top_word(target_)) {
    const auto bytes = chain::encode(header_);

    // First block: header bytes 0..63, no nonce in it
    MessageBlock head;
    std::copy(bytes.begin(), bytes.begin() + crypto::kBlockSize, head.begin());
    midstate_ = crypto::compress(crypto::initial_state(), head);

    // Second block: bytes 64..79, 0x80, zero fill, 640-bit length
    std::copy(bytes.begin() + crypto::kBlockSize, bytes.end(), tail_template_.begin());
    tail_template_[chain::kHeaderSize - crypto::kBlockSize] = 0x80;
    tail_template_[62] = 0x02;
    tail_template_[63] = 0x80;

    tail_prefix_ = crypto::run_rounds(midstate_, tail_template_, RoundRange{0, kTailPrefixRounds});
}

MessageBlock SearchPlan::tail_block(std::uint32_t nonce) const {
    MessageBlock block = tail_template_;
    ops::store_le32(block.data() + kTailNonceOffset, nonce);
    return block;
}

Digest SearchPlan::first_pass(std::uint32_t nonce) const {
    const auto schedule = crypto::expand_schedule(tail_block(nonce));
    const HashState working =
        crypto::run_rounds(tail_prefix_, schedule, RoundRange{kTailPrefixRounds, crypto::kRounds});
    return crypto::finalize(crypto::feed_forward(midstate_, working));
}

SearchPlan::Attempt SearchPlan::evaluate(std::uint32_t nonce) const {
    Attempt attempt;
    const auto& iv = crypto::initial_state();
    const auto schedule = crypto::expand_schedule(crypto::pad_digest_block(first_pass(nonce)));

    const HashState partial = crypto::run_rounds(iv, schedule, RoundRange{0, kEarlyExitRound});
    // H7 = IV7 + h(64) and h(64) == e(61); its byte-swapped value leads the display order
    const std::uint32_t top = ops::byteswap(ops::add(iv.words[7], partial.e()));
    if (top > target_top_) {
        attempt.early_exit = true;
        return attempt;
    }

    const HashState working =
        crypto::run_rounds(partial, schedule, RoundRange{kEarlyExitRound, crypto::kRounds});
    attempt.digest = crypto::finalize(crypto::feed_forward(iv, working));
    attempt.meets_target = crypto::meets_target(attempt.digest, target_);
    return attempt;
}

Digest SearchPlan::full_digest(std::uint32_t nonce) const {
    const auto& iv = crypto::initial_state();
    return crypto::finalize(crypto::compress(iv, crypto::pad_digest_block(first_pass(nonce))));
}

NonceSearcher::NonceSearcher(const chain::BlockHeader& header, SearchOptions options,
                             logging::Logger* log)
    : plan_(header)
    , options_(options)
    , log_(log) {
    if (options_.range.first > options_.range.last) {
        throw std::invalid_argument(fmt::format("nonce range [{}, {}] is empty",
                                                options_.range.first, options_.range.last));
    }
    if (options_.threads == 0) {
        options_.threads = 1;
    }
}

SearchResult NonceSearcher::run(const std::atomic<bool>* stop) {
    status_.store(SearchStatus::Searching);
    if (log_ && log_->debug_enabled()) {
        log_->debug(fmt::format("Searching nonces [{:#010x}, {:#010x}] with {} thread(s), target {}",
                                options_.range.first, options_.range.last, options_.threads,
                                util::bytes_to_hex(plan_.target())));
    }

    const auto start = std::chrono::steady_clock::now();
    SearchResult result = scan(plan_, options_.range, options_.threads, stop,
                               options_.progress_interval, log_);
    result.stats.elapsed_seconds =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    if (result.found() && options_.verify) {
        verify_hit(result);
    }

    if (log_ && log_->debug_enabled()) {
        log_->debug(fmt::format("Search {}: {} nonces, {} early exits, {} full hashes, {:.1f} H/s",
                                to_string(result.status), result.stats.nonces_tried,
                                result.stats.early_exits, result.stats.full_hashes,
                                result.stats.hashrate()));
    }
    status_.store(result.status);
    return result;
}

void NonceSearcher::verify_hit(SearchResult& result) const {
    const auto bytes = chain::encode(chain::with_nonce(plan_.header(), result.nonce));
    const Digest reference = crypto::reference_sha256d(bytes.data(), bytes.size());
    result.verified = (reference == result.digest);
    if (!*result.verified && log_) {
        log_->error(fmt::format("Digest mismatch for nonce {:#010x}: engine {} reference {}",
                                result.nonce, util::bytes_to_hex(result.digest),
                                util::bytes_to_hex(reference)));
    }
}

SearchResult search_header_bytes(const std::uint8_t* data, std::size_t len,
                                 const SearchOptions& options, logging::Logger* log) {
    NonceSearcher searcher(chain::decode(data, len), options, log);
    return searcher.run();
}

} // namespace mining
} // namespace beanpow

/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <atomic>
#include <vector>

#include "beanpow/mining/nonce_search.hpp"

namespace beanpow {
namespace mining {

// Split range into at most `parts` contiguous, non-overlapping shards.
std::vector<NonceRange> shard_range(const NonceRange& range, unsigned parts);

/**
 * Scan `range` with `threads` workers sharing one plan.
 *
 * A worker stops when `stop` is set or once its next nonce is above the
 * lowest hit published so far, so the result is the lowest satisfying
 * nonce in the range regardless of thread count. elapsed_seconds is left
 * for the caller to fill.
 */
SearchResult scan(const SearchPlan& plan, const NonceRange& range, unsigned threads,
                  const std::atomic<bool>* stop, std::uint64_t progress_interval,
                  logging::Logger* log);

} // namespace mining
} // namespace beanpow

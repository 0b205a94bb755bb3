/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "beanpow/mining/parallel_search.hpp"
#include "beanpow/util/hex.hpp"

#include <algorithm>
#include <exception>
#include <fmt/format.h>
#include <mutex>
#include <thread>

namespace beanpow {
namespace mining {

namespace {

constexpr std::uint64_t kNoHit = 0x100000000ULL;

// Lowest hit so far. Workers read `best` between nonces; `mutex` guards
// the winning nonce and digest.
// Only workers past `best` stop early. A worker on a lower shard keeps
// scanning up to `best`, since a lower hit there replaces it; a late hit
// on the full range can therefore leave most of the lower shards to scan.
struct SharedHit {
    std::atomic<std::uint64_t> best{kNoHit};
    std::mutex mutex;
    std::uint32_t nonce{0};
    crypto::Digest digest{};

    void publish(std::uint32_t candidate, const crypto::Digest& candidate_digest) {
        std::lock_guard<std::mutex> lock(mutex);
        if (candidate < best.load()) {
            nonce = candidate;
            digest = candidate_digest;
            best.store(candidate);
        }
    }
};

struct WorkerOutcome {
    SearchStats stats;
    bool stopped{false};
    std::exception_ptr error;
};

WorkerOutcome scan_shard(const SearchPlan& plan, const NonceRange& shard, int worker_id,
                         SharedHit& hit, const std::atomic<bool>* stop,
                         std::uint64_t progress_interval, logging::Logger* log) {
    WorkerOutcome out;
    for (std::uint64_t n = shard.first; n <= shard.last; ++n) {
        if (stop && stop->load()) {
            out.stopped = true;
            break;
        }
        if (n >= hit.best.load()) {
            break;
        }

        const auto nonce = static_cast<std::uint32_t>(n);
        const auto attempt = plan.evaluate(nonce);
        ++out.stats.nonces_tried;
        if (attempt.early_exit) {
            ++out.stats.early_exits;
        } else {
            ++out.stats.full_hashes;
            if (attempt.meets_target) {
                hit.publish(nonce, attempt.digest);
                if (log && log->debug_enabled()) {
                    log->debug(fmt::format("Worker {} hit nonce {:#010x} -> {}", worker_id, nonce,
                                           util::to_display_hex(attempt.digest)));
                }
                break;
            }
        }

        if (log && progress_interval > 0 && out.stats.nonces_tried % progress_interval == 0) {
            log->info(fmt::format("Worker {}: {} nonces scanned (at {:#010x}, {} early exits)",
                                  worker_id, out.stats.nonces_tried, nonce, out.stats.early_exits));
        }
    }
    return out;
}

} // namespace

std::vector<NonceRange> shard_range(const NonceRange& range, unsigned parts) {
    std::vector<NonceRange> shards;
    const std::uint64_t total = range.size();
    const std::uint64_t count = std::max<std::uint64_t>(1, std::min<std::uint64_t>(parts, total));
    const std::uint64_t step = (total + count - 1) / count;

    for (std::uint64_t begin = range.first; begin <= range.last; begin += step) {
        const std::uint64_t end = std::min<std::uint64_t>(begin + step - 1, range.last);
        shards.push_back(NonceRange{static_cast<std::uint32_t>(begin), static_cast<std::uint32_t>(end)});
    }
    return shards;
}

SearchResult scan(const SearchPlan& plan, const NonceRange& range, unsigned threads,
                  const std::atomic<bool>* stop, std::uint64_t progress_interval,
                  logging::Logger* log) {
    SharedHit hit;
    const auto shards = shard_range(range, threads);
    std::vector<WorkerOutcome> outcomes(shards.size());

    if (shards.size() == 1) {
        outcomes[0] = scan_shard(plan, shards[0], 0, hit, stop, progress_interval, log);
    } else {
        std::vector<std::thread> workers;
        workers.reserve(shards.size());
        for (std::size_t i = 0; i < shards.size(); ++i) {
            workers.emplace_back([&, i]() {
                try {
                    outcomes[i] = scan_shard(plan, shards[i], static_cast<int>(i), hit, stop,
                                             progress_interval, log);
                } catch (...) {
                    outcomes[i].error = std::current_exception();
                }
            });
        }
        for (auto& t : workers) {
            t.join();
        }
    }

    SearchResult result;
    bool stopped = false;
    for (const auto& o : outcomes) {
        if (o.error) {
            std::rethrow_exception(o.error);
        }
        result.stats += o.stats;
        stopped = stopped || o.stopped;
    }

    if (hit.best.load() != kNoHit) {
        result.status = SearchStatus::Found;
        result.nonce = hit.nonce;
        result.digest = hit.digest;
    } else if (stopped) {
        result.status = SearchStatus::Stopped;
    } else {
        result.status = SearchStatus::Exhausted;
    }
    return result;
}

} // namespace mining
} // namespace beanpow

/*
 * Unit tests for the nonce search driver
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <beanpow/chain/block_header.hpp>
#include <beanpow/crypto/sha256d.hpp>
#include <beanpow/mining/nonce_search.hpp>
#include <beanpow/mining/parallel_search.hpp>
#include <beanpow/util/hex.hpp>

#include <algorithm>
#include <atomic>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

using namespace beanpow;
using namespace beanpow::mining;

namespace {

const char* kGenesisHex =
    "0100000000000000000000000000000000000000000000000000000000000000"
    "000000003ba3edfd7a7b12b27ac72c3e67768f617fc81bc3888a51323a9fb8aa"
    "4b1e5e4a29ab5f49ffff001d1dac2b7c";

constexpr std::uint32_t kGenesisNonce = 2083236893;

chain::BlockHeader genesis_with_bits(std::uint32_t bits) {
    chain::BlockHeader h = chain::header_from_hex(kGenesisHex);
    h.bits = bits;
    h.nonce = 0;
    return h;
}

crypto::Digest reference_digest(const chain::BlockHeader& header, std::uint32_t nonce) {
    const auto bytes = chain::encode(chain::with_nonce(header, nonce));
    return crypto::reference_sha256d(bytes.data(), bytes.size());
}

struct RecordingLogger : logging::Logger {
    void info(std::string_view msg) override { record(infos, msg); }
    void warn(std::string_view msg) override { record(warns, msg); }
    void error(std::string_view msg) override { record(errors, msg); }
    void debug(std::string_view msg) override { record(debugs, msg); }
    bool debug_enabled() const override { return debug_on; }

    void record(std::vector<std::string>& into, std::string_view msg) {
        std::lock_guard<std::mutex> lock(mutex);
        into.emplace_back(msg);
    }

    bool debug_on{true};
    std::mutex mutex;
    std::vector<std::string> infos, warns, errors, debugs;
};

} // namespace

TEST_SUITE("Search Plan") {
    TEST_CASE("midstate is the compression of the first 64 header bytes") {
        const auto header = chain::header_from_hex(kGenesisHex);
        const SearchPlan plan(header);
        const auto bytes = chain::encode(header);
        crypto::MessageBlock head;
        std::copy(bytes.begin(), bytes.begin() + 64, head.begin());
        CHECK(plan.midstate() == crypto::compress(crypto::initial_state(), head));
        CHECK(plan.midstate().words[0] == 0xbc909a33u);
        CHECK(plan.midstate().words[7] == 0x4719f91bu);
    }

    TEST_CASE("nonce-independent rounds are bit-identical across nonces") {
        const SearchPlan plan(genesis_with_bits(0x1d00ffff));
        const auto range = crypto::RoundRange{0, kTailPrefixRounds};
        const auto a = crypto::run_rounds(plan.midstate(), plan.tail_block(1), range);
        const auto b = crypto::run_rounds(plan.midstate(), plan.tail_block(0xfedcba98), range);
        CHECK(a == b);
        CHECK(a == plan.tail_prefix_state());

        // One more round pulls in the nonce word
        const auto range4 = crypto::RoundRange{0, kTailPrefixRounds + 1};
        CHECK(crypto::run_rounds(plan.midstate(), plan.tail_block(1), range4) !=
              crypto::run_rounds(plan.midstate(), plan.tail_block(2), range4));
    }

    TEST_CASE("tail block carries the nonce little-endian at word 3") {
        const SearchPlan plan(genesis_with_bits(0x1d00ffff));
        const auto block = plan.tail_block(0x11223344);
        CHECK(block[kTailNonceOffset] == 0x44);
        CHECK(block[kTailNonceOffset + 3] == 0x11);
        CHECK(block[16] == 0x80);
        CHECK(block[62] == 0x02);
        CHECK(block[63] == 0x80);
    }

    TEST_CASE("full_digest matches the reference SHA-256d") {
        const auto header = genesis_with_bits(0x1d00ffff);
        const SearchPlan plan(header);
        for (std::uint32_t nonce : {0u, 1u, 77u, kGenesisNonce, 0xffffffffu}) {
            CAPTURE(nonce);
            CHECK(plan.full_digest(nonce) == reference_digest(header, nonce));
        }
    }

    TEST_CASE("early exit never rejects a satisfying nonce") {
        for (std::uint32_t bits : {0x2000ffffu, 0x207fffffu, 0x1f00ffffu}) {
            CAPTURE(bits);
            const auto header = genesis_with_bits(bits);
            const SearchPlan plan(header);
            int early = 0;
            int hits = 0;
            for (std::uint32_t nonce = 0; nonce < 1500; ++nonce) {
                const auto full = plan.full_digest(nonce);
                const bool ok = crypto::meets_target(full, plan.target());
                const auto attempt = plan.evaluate(nonce);
                if (attempt.early_exit) {
                    ++early;
                    CHECK_FALSE(ok);
                } else {
                    CHECK(attempt.digest == full);
                    CHECK(attempt.meets_target == ok);
                }
                hits += ok ? 1 : 0;
            }
            if (bits == 0x1f00ffffu) {
                CHECK(early == 1500);
            } else {
                CHECK(early > 0);
                CHECK(hits > 0);
            }
        }
    }

    TEST_CASE("invalid compact target aborts before the search") {
        CHECK_THROWS_AS(SearchPlan(genesis_with_bits(0x23000001)), chain::EncodingError);
    }
}

TEST_SUITE("Nonce Searcher") {
    TEST_CASE("reproduces the genesis nonce and digest") {
        SearchOptions opts;
        opts.range = NonceRange{kGenesisNonce - 1500, kGenesisNonce + 1500};
        NonceSearcher searcher(genesis_with_bits(0x1d00ffff), opts);
        CHECK(searcher.status() == SearchStatus::Idle);

        const auto result = searcher.run();
        REQUIRE(result.found());
        CHECK(searcher.status() == SearchStatus::Found);
        CHECK(result.nonce == kGenesisNonce);
        CHECK(util::to_display_hex(result.digest) ==
              "000000000019d6689c085ae165831e934ff763ae46a2a6c172b3f1b60a8ce26f");
        CHECK(result.stats.nonces_tried == 1501);
        CHECK(result.stats.early_exits == 1500);
        CHECK(result.stats.full_hashes == 1);
    }

    TEST_CASE("finds the lowest satisfying nonce from a start offset") {
        const auto header = genesis_with_bits(0x2000ffff);
        const SearchPlan plan(header);
        std::uint32_t expected = 0;
        while (!crypto::meets_target(reference_digest(header, expected), plan.target())) {
            ++expected;
        }

        NonceSearcher from_zero(header);
        const auto r0 = from_zero.run();
        REQUIRE(r0.found());
        CHECK(r0.nonce == expected);
        CHECK(r0.digest == reference_digest(header, expected));

        SearchOptions opts;
        opts.range.first = expected + 1;
        NonceSearcher after(header, opts);
        const auto r1 = after.run();
        REQUIRE(r1.found());
        CHECK(r1.nonce > expected);
    }

    TEST_CASE("unreachable target exhausts a small range") {
        SearchOptions opts;
        opts.range = NonceRange{0, 999};
        NonceSearcher searcher(genesis_with_bits(0x00000000), opts);
        const auto result = searcher.run();
        CHECK(result.status == SearchStatus::Exhausted);
        CHECK_FALSE(result.found());
        CHECK(result.stats.nonces_tried == 1000);
        CHECK(searcher.status() == SearchStatus::Exhausted);
    }

    TEST_CASE("single-nonce range at the top of the space") {
        SearchOptions opts;
        opts.range = NonceRange{0xffffffffu, 0xffffffffu};
        NonceSearcher searcher(genesis_with_bits(0x00000000), opts);
        const auto result = searcher.run();
        CHECK(result.status == SearchStatus::Exhausted);
        CHECK(result.stats.nonces_tried == 1);
    }

    TEST_CASE("inverted range is rejected up front") {
        SearchOptions opts;
        opts.range = NonceRange{10, 9};
        CHECK_THROWS_AS(NonceSearcher(genesis_with_bits(0x1d00ffff), opts), std::invalid_argument);

        const auto bytes = chain::encode(chain::header_from_hex(kGenesisHex));
        CHECK_THROWS_AS(search_header_bytes(bytes.data(), bytes.size(), opts),
                        std::invalid_argument);
    }

    TEST_CASE("stop flag ends the run as Stopped") {
        std::atomic<bool> stop{true};
        SearchOptions opts;
        opts.range = NonceRange{0, 999};
        NonceSearcher searcher(genesis_with_bits(0x00000000), opts);
        const auto result = searcher.run(&stop);
        CHECK(result.status == SearchStatus::Stopped);
        CHECK(result.stats.nonces_tried == 0);
    }

    TEST_CASE("parallel search returns the same nonce as sequential") {
        const auto header = genesis_with_bits(0x2000ffff);
        SearchOptions seq_opts;
        seq_opts.range = NonceRange{0, 4000};
        const auto seq = NonceSearcher(header, seq_opts).run();
        REQUIRE(seq.found());

        for (unsigned threads : {2u, 3u, 8u}) {
            CAPTURE(threads);
            SearchOptions par_opts = seq_opts;
            par_opts.threads = threads;
            const auto par = NonceSearcher(header, par_opts).run();
            REQUIRE(par.found());
            CHECK(par.nonce == seq.nonce);
            CHECK(par.digest == seq.digest);
        }
    }

    TEST_CASE("lower shard keeps scanning after a higher shard hits") {
        // Shards [0, 2000] and [2001, 4000]; the lowest hit is 201 in shard 0
        const auto header = genesis_with_bits(0x2000ffff);
        SearchOptions opts;
        opts.range = NonceRange{0, 4000};
        opts.threads = 2;
        const auto result = NonceSearcher(header, opts).run();
        REQUIRE(result.found());
        CHECK(result.nonce == 201u);
        CHECK(result.stats.nonces_tried >= 202u);
    }

    TEST_CASE("parallel search exhausts and counts every nonce") {
        SearchOptions opts;
        opts.range = NonceRange{100, 1099};
        opts.threads = 4;
        const auto result = NonceSearcher(genesis_with_bits(0x00000000), opts).run();
        CHECK(result.status == SearchStatus::Exhausted);
        CHECK(result.stats.nonces_tried == 1000);
    }

    TEST_CASE("verify cross-checks a hit with OpenSSL") {
        SearchOptions opts;
        opts.range = NonceRange{kGenesisNonce, kGenesisNonce};
        opts.verify = true;
        const auto result = NonceSearcher(genesis_with_bits(0x1d00ffff), opts).run();
        REQUIRE(result.found());
        REQUIRE(result.verified.has_value());
        CHECK(*result.verified);
    }

    TEST_CASE("search_header_bytes decodes first") {
        const auto bytes = util::hex_to_bytes(kGenesisHex);
        SearchOptions opts;
        opts.range = NonceRange{kGenesisNonce - 10, kGenesisNonce + 10};
        const auto result = search_header_bytes(bytes.data(), bytes.size(), opts);
        REQUIRE(result.found());
        CHECK(result.nonce == kGenesisNonce);

        CHECK_THROWS_AS(search_header_bytes(bytes.data(), 79, opts), chain::EncodingError);
    }
}

TEST_SUITE("Search Logging") {
    TEST_CASE("progress lines every interval per worker") {
        RecordingLogger log;
        SearchOptions opts;
        opts.range = NonceRange{0, 999};
        opts.progress_interval = 100;
        const auto result = NonceSearcher(genesis_with_bits(0x00000000), opts, &log).run();
        CHECK(result.status == SearchStatus::Exhausted);
        CHECK(log.infos.size() == 10);
        CHECK(log.infos.front().find("100 nonces scanned") != std::string::npos);
        CHECK(log.errors.empty());
        REQUIRE(log.debugs.size() == 2);
        CHECK(log.debugs.back().find("Search exhausted") != std::string::npos);
    }

    TEST_CASE("debug lines are skipped when the logger has debug off") {
        RecordingLogger log;
        log.debug_on = false;
        SearchOptions opts;
        opts.range = NonceRange{kGenesisNonce - 5, kGenesisNonce};
        opts.progress_interval = 2;
        const auto result = NonceSearcher(genesis_with_bits(0x1d00ffff), opts, &log).run();
        REQUIRE(result.found());
        CHECK(log.debugs.empty());
        CHECK(log.infos.size() == 2); // after nonces 2 and 4; the hit ends the loop
    }

    TEST_CASE("hit is reported at debug level") {
        RecordingLogger log;
        SearchOptions opts;
        opts.range = NonceRange{kGenesisNonce, kGenesisNonce};
        const auto result = NonceSearcher(genesis_with_bits(0x1d00ffff), opts, &log).run();
        REQUIRE(result.found());
        bool saw_hit = false;
        for (const auto& line : log.debugs) {
            saw_hit = saw_hit || line.find("hit nonce 0x7c2bac1d") != std::string::npos;
        }
        CHECK(saw_hit);
        CHECK(log.infos.empty());
    }
}

TEST_SUITE("Range Sharding") {
    TEST_CASE("shards are contiguous and cover the range") {
        const NonceRange range{10, 109};
        for (unsigned parts : {1u, 3u, 7u, 100u, 1000u}) {
            CAPTURE(parts);
            const auto shards = shard_range(range, parts);
            REQUIRE_FALSE(shards.empty());
            CHECK(shards.size() <= parts);
            CHECK(shards.front().first == range.first);
            CHECK(shards.back().last == range.last);
            std::uint64_t covered = 0;
            for (std::size_t i = 0; i < shards.size(); ++i) {
                covered += shards[i].size();
                if (i > 0) CHECK(shards[i].first == shards[i - 1].last + 1);
            }
            CHECK(covered == range.size());
        }
    }

    TEST_CASE("full 32-bit range") {
        const auto shards = shard_range(NonceRange{}, 4);
        REQUIRE(shards.size() == 4);
        CHECK(shards[0].first == 0u);
        CHECK(shards[3].last == 0xffffffffu);
        CHECK(shards[1].first == 0x40000000u);
    }
}

/*
 * Unit tests for compact target expansion and comparison
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <beanpow/chain/encoding_error.hpp>
#include <beanpow/crypto/difficulty.hpp>
#include <beanpow/util/hex.hpp>

#include <algorithm>

using namespace beanpow::crypto;
using beanpow::util::bytes_to_hex;

namespace {

// Digest whose display order equals the given big-endian value
Digest digest_from_display(const Target& value) {
    Digest d{};
    std::reverse_copy(value.begin(), value.end(), d.begin());
    return d;
}

} // namespace

TEST_SUITE("Difficulty Target") {
    TEST_CASE("compact_to_target - documented expansions") {
        // 0xffff * 256^(0x1d - 3)
        CHECK(bytes_to_hex(compact_to_target(0x1d00ffff)) ==
              "00000000ffff0000000000000000000000000000000000000000000000000000");
        // 0x0404cb * 256^(0x1b - 3)
        CHECK(bytes_to_hex(compact_to_target(0x1b0404cb)) ==
              "00000000000404cb000000000000000000000000000000000000000000000000");
        // 0x7fffff * 256^(0x20 - 3)
        CHECK(bytes_to_hex(compact_to_target(0x207fffff)) ==
              "7fffff0000000000000000000000000000000000000000000000000000000000");
    }

    TEST_CASE("compact_to_target - small exponents shift the mantissa right") {
        CHECK(bytes_to_hex(compact_to_target(0x03123456)) ==
              "0000000000000000000000000000000000000000000000000000000000123456");
        CHECK(bytes_to_hex(compact_to_target(0x02123456)) ==
              "0000000000000000000000000000000000000000000000000000000000001234");
        CHECK(bytes_to_hex(compact_to_target(0x01123456)) ==
              "0000000000000000000000000000000000000000000000000000000000000012");
        CHECK(compact_to_target(0x00123456) == Target{});
    }

    TEST_CASE("compact_to_target - zero mantissa and overflow") {
        CHECK(compact_to_target(0) == Target{});
        CHECK(compact_to_target(0xff000000) == Target{});
        // 0x21: most significant mantissa byte falls outside 256 bits
        CHECK_THROWS_AS(compact_to_target(0x21010000), beanpow::chain::EncodingError);
        CHECK_NOTHROW(compact_to_target(0x2100ffff));
        CHECK_THROWS_AS(compact_to_target(0x23000001), beanpow::chain::EncodingError);
    }

    TEST_CASE("target_to_compact round-trips canonical encodings") {
        for (std::uint32_t bits : {0x1d00ffffu, 0x1b0404cbu, 0x207fffffu, 0x1a0ccaa1u, 0x03123456u}) {
            CAPTURE(bits);
            CHECK(target_to_compact(compact_to_target(bits)) == bits);
        }
        CHECK(target_to_compact(Target{}) == 0u);
    }

    TEST_CASE("target_top_word") {
        CHECK(target_top_word(compact_to_target(0x1d00ffff)) == 0u);
        CHECK(target_top_word(compact_to_target(0x2000ffff)) == 0x00ffff00u);
    }

    TEST_CASE("meets_target - boundary") {
        const Target target = compact_to_target(0x1d00ffff);
        CHECK(meets_target(digest_from_display(target), target));

        Target below = target;
        below[5] = 0xfe;
        CHECK(meets_target(digest_from_display(below), target));

        Target above = target;
        above[31] = 0x01;
        CHECK_FALSE(meets_target(digest_from_display(above), target));
    }

    TEST_CASE("meets_target - reads the digest in display order") {
        const Target target = compact_to_target(0x1d00ffff);
        Digest natural_small{};
        natural_small[0] = 0xff; // least significant byte in display order
        CHECK(meets_target(natural_small, target));

        Digest natural_large{};
        natural_large[31] = 0x01; // most significant byte in display order
        CHECK_FALSE(meets_target(natural_large, target));
    }

    TEST_CASE("zero target only admits the zero digest") {
        const Target zero{};
        CHECK(meets_target(Digest{}, zero));
        Digest one{};
        one[0] = 1;
        CHECK_FALSE(meets_target(one, zero));
    }
}

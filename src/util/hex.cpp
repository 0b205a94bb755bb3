/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "beanpow/util/hex.hpp"
#include "beanpow/chain/encoding_error.hpp"

#include <algorithm>
#include <fmt/format.h>

namespace beanpow {
namespace util {

namespace {

int nibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string bytes_to_hex(const std::uint8_t* data, std::size_t len) {
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0F]);
    }
    return out;
}

std::vector<std::uint8_t> hex_to_bytes(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        throw chain::EncodingError(fmt::format("hex string has odd length {}", hex.size()));
    }
    std::vector<std::uint8_t> bytes;
    bytes.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        const int hi = nibble(hex[i]);
        const int lo = nibble(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            throw chain::EncodingError(fmt::format("invalid hex character at offset {}", hi < 0 ? i : i + 1));
        }
        bytes.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
    }
    return bytes;
}

template <std::size_t N>
std::array<std::uint8_t, N> hex_to_array(const std::string& hex) {
    if (hex.size() != N * 2) {
        throw chain::EncodingError(
            fmt::format("expected {} hex characters, got {}", N * 2, hex.size()));
    }
    const auto bytes = hex_to_bytes(hex);
    std::array<std::uint8_t, N> out{};
    std::copy(bytes.begin(), bytes.end(), out.begin());
    return out;
}

std::array<std::uint8_t, 32> from_display_hex(const std::string& hex) {
    auto bytes = hex_to_array<32>(hex);
    std::reverse(bytes.begin(), bytes.end());
    return bytes;
}

template std::array<std::uint8_t, 32> hex_to_array<32>(const std::string&);
template std::array<std::uint8_t, 80> hex_to_array<80>(const std::string&);

} // namespace util
} // namespace beanpow

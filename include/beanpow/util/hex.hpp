/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace beanpow::util {

std::string bytes_to_hex(const std::uint8_t* data, std::size_t len);

template <std::size_t N>
std::string bytes_to_hex(const std::array<std::uint8_t, N>& bytes) {
    return bytes_to_hex(bytes.data(), bytes.size());
}

// Throws chain::EncodingError on odd length or a non-hex character.
std::vector<std::uint8_t> hex_to_bytes(const std::string& hex);

// Exactly N bytes of hex; throws chain::EncodingError otherwise.
template <std::size_t N>
std::array<std::uint8_t, N> hex_to_array(const std::string& hex);

// Block explorers print hashes with the byte order reversed.
template <std::size_t N>
std::string to_display_hex(const std::array<std::uint8_t, N>& bytes) {
    std::array<std::uint8_t, N> reversed;
    for (std::size_t i = 0; i < N; ++i) reversed[i] = bytes[N - 1 - i];
    return bytes_to_hex(reversed);
}

// Parse a display-order hash into internal order.
std::array<std::uint8_t, 32> from_display_hex(const std::string& hex);

extern template std::array<std::uint8_t, 32> hex_to_array<32>(const std::string&);
extern template std::array<std::uint8_t, 80> hex_to_array<80>(const std::string&);

} // namespace beanpow::util

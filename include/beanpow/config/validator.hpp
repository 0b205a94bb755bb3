#pragma once

#include <cstdint>
#include <string>

namespace beanpow::config {

// Parses a decimal or 0x-prefixed hex unsigned integer. Returns error in 'err' if invalid.
bool parse_uint(const std::string& text, std::uint64_t& out, std::string& err);

// Parses a compact target given as hex, with or without 0x prefix.
bool parse_bits(const std::string& text, std::uint64_t& out, std::string& err);

// Parses true/false style flags (1, yes, true, y, t / 0, no, false, n, f).
bool parse_flag(const std::string& text, bool& out, std::string& err);

// Validates a hex string of exactly `bytes` bytes; `what` names the field in 'err'.
bool validate_hex(const std::string& hex, std::size_t bytes, const char* what, std::string& err);

// Validates an inclusive nonce range within 32 bits.
bool validate_nonce_range(std::uint64_t start, std::uint64_t end, std::string& err);

} // namespace beanpow::config

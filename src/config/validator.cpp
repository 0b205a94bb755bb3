#include <beanpow/config/validator.hpp>

#include <algorithm>
#include <cctype>
#include <fmt/format.h>

namespace beanpow::config {

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static bool parse_digits(const std::string& digits, int base, std::uint64_t& out, std::string& err) {
    if (digits.empty()) { err = "empty number"; return false; }
    std::uint64_t value = 0;
    for (char c : digits) {
        int d = -1;
        if (c >= '0' && c <= '9') d = c - '0';
        else if (base == 16 && c >= 'a' && c <= 'f') d = c - 'a' + 10;
        else if (base == 16 && c >= 'A' && c <= 'F') d = c - 'A' + 10;
        if (d < 0) { err = fmt::format("invalid digit '{}' in '{}'", c, digits); return false; }
        if (value > (UINT64_MAX - static_cast<std::uint64_t>(d)) / static_cast<std::uint64_t>(base)) {
            err = fmt::format("number '{}' is too large", digits); return false; }
        value = value * static_cast<std::uint64_t>(base) + static_cast<std::uint64_t>(d);
    }
    out = value;
    return true;
}

bool parse_uint(const std::string& text, std::uint64_t& out, std::string& err) {
    if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        return parse_digits(text.substr(2), 16, out, err);
    }
    return parse_digits(text, 10, out, err);
}

bool parse_bits(const std::string& text, std::uint64_t& out, std::string& err) {
    std::string digits = text;
    if (digits.size() > 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
        digits = digits.substr(2);
    }
    if (!parse_digits(digits, 16, out, err)) return false;
    if (out > 0xFFFFFFFFULL) { err = fmt::format("bits '{}' overflows 32 bits", text); return false; }
    return true;
}

bool parse_flag(const std::string& text, bool& out, std::string& err) {
    const std::string v = lower(text);
    if (v == "1" || v == "yes" || v == "true" || v == "y" || v == "t") { out = true; return true; }
    if (v == "0" || v == "no" || v == "false" || v == "n" || v == "f" || v.empty()) { out = false; return true; }
    err = fmt::format("invalid flag value '{}'", text);
    return false;
}

bool validate_hex(const std::string& hex, std::size_t bytes, const char* what, std::string& err) {
    if (hex.size() != bytes * 2) {
        err = fmt::format("{} must be {} hex characters, got {}", what, bytes * 2, hex.size());
        return false;
    }
    if (!std::all_of(hex.begin(), hex.end(), [](unsigned char c) { return std::isxdigit(c) != 0; })) {
        err = fmt::format("{} contains non-hex characters", what);
        return false;
    }
    return true;
}

bool validate_nonce_range(std::uint64_t start, std::uint64_t end, std::string& err) {
    if (start > 0xFFFFFFFFULL || end > 0xFFFFFFFFULL) { err = "nonce range exceeds 32 bits"; return false; }
    if (start > end) { err = fmt::format("nonce_start {} is above nonce_end {}", start, end); return false; }
    return true;
}

} // namespace beanpow::config

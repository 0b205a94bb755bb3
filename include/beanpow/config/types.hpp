#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace beanpow::config {

struct SearchConfig {
    // Raw 80-byte header as hex; when empty the header is built from fields
    std::string header;

    // Work-template fields (hashes in display order, as RPC prints them)
    std::int64_t version{1};
    std::string prev_hash;
    std::string merkle_root;
    std::uint64_t time{0};
    std::uint64_t bits{0};

    std::uint64_t nonce_start{0};
    std::uint64_t nonce_end{0xFFFFFFFF};
    unsigned threads{1};
    std::uint64_t progress_interval{0};
    bool verify{false};
    bool json{false};
    bool hash_only{false};

    bool uses_fields() const { return header.empty(); }
};

struct ParseResult {
    std::optional<SearchConfig> cfg; // present when valid and ready to run
    std::string config_path{"beanpow.conf"};
    bool show_only{false}; // true if --help/--version was printed
    bool debug{false};     // true if --debug was passed on CLI
};

} // namespace beanpow::config

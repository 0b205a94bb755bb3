#pragma once

#include <string>
#include <vector>

#include <beanpow/chain/block_header.hpp>
#include <beanpow/config/types.hpp>
#include <beanpow/mining/nonce_search.hpp>

namespace beanpow::config {

// Read configuration from file (JSON or key=value). Returns list of validation errors (empty if ok).
// A missing file is not an error.
std::vector<std::string> load_from_file(SearchConfig& cfg, const std::string& path);

// Same as load_from_file, from text already in memory.
std::vector<std::string> load_from_text(SearchConfig& cfg, const std::string& text);

// Apply BEANPOW_* environment variables (HEADER, THREADS, NONCE_START, NONCE_END, VERIFY)
// on top of current cfg. Returns errors for unparsable values.
std::vector<std::string> apply_env_overrides(SearchConfig& cfg);

// Validate final config (header source, hex lengths, field widths, nonce range, threads).
std::vector<std::string> validate_final(const SearchConfig& cfg);

// Build the header described by cfg. Throws chain::EncodingError on malformed
// hex or a field that does not fit its width.
chain::BlockHeader build_header(const SearchConfig& cfg);

mining::SearchOptions to_search_options(const SearchConfig& cfg);

} // namespace beanpow::config

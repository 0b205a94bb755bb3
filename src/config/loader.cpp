#include <beanpow/config/loader.hpp>

#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include <beanpow/config/validator.hpp>
#include <beanpow/util/hex.hpp>

namespace beanpow::config {

constexpr unsigned kMaxThreads = 256;

// Apply one textual key/value; shared by key=value files and environment overrides.
static void apply_value(SearchConfig& cfg, const std::string& key, const std::string& val,
                        std::vector<std::string>& errs) {
    std::string err;
    std::uint64_t n = 0;
    auto number = [&](std::uint64_t& dst) {
        if (parse_uint(val, n, err)) dst = n;
        else errs.push_back(fmt::format("'{}': {}", key, err));
    };

    if (key == "header") cfg.header = val;
    else if (key == "prev_hash") cfg.prev_hash = val;
    else if (key == "merkle_root") cfg.merkle_root = val;
    else if (key == "version") {
        bool negative = !val.empty() && val[0] == '-';
        if (parse_uint(negative ? val.substr(1) : val, n, err) &&
            n <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            cfg.version = negative ? -static_cast<std::int64_t>(n) : static_cast<std::int64_t>(n);
        } else {
            errs.push_back(fmt::format("'version': {}", err.empty() ? "out of range" : err));
        }
    }
    else if (key == "time") number(cfg.time);
    else if (key == "bits") {
        if (parse_bits(val, n, err)) cfg.bits = n;
        else errs.push_back(fmt::format("'bits': {}", err));
    }
    else if (key == "nonce_start") number(cfg.nonce_start);
    else if (key == "nonce_end") number(cfg.nonce_end);
    else if (key == "progress_interval") number(cfg.progress_interval);
    else if (key == "threads") {
        if (parse_uint(val, n, err) && n <= kMaxThreads) cfg.threads = static_cast<unsigned>(n);
        else errs.push_back(fmt::format("'threads': {}", err.empty() ? "out of range" : err));
    }
    else if (key == "verify" || key == "json") {
        bool flag = false;
        if (!parse_flag(val, flag, err)) errs.push_back(fmt::format("'{}': {}", key, err));
        else if (key == "verify") cfg.verify = flag;
        else cfg.json = flag;
    }
}

static void load_key_value(SearchConfig& cfg, const std::string& text, std::vector<std::string>& errs) {
    std::istringstream iss(text);
    std::string line;
    int lineno = 0;
    while (std::getline(iss, line)) {
        ++lineno;
        auto hash = line.find('#');
        if (hash != std::string::npos) line = line.substr(0, hash);
        auto first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos) continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) {
            errs.push_back(fmt::format("line {}: expected key=value", lineno));
            continue;
        }
        auto trim = [](std::string s) {
            auto b = s.find_first_not_of(" \t\r");
            auto e = s.find_last_not_of(" \t\r");
            return b == std::string::npos ? std::string{} : s.substr(b, e - b + 1);
        };
        std::string key = trim(line.substr(0, eq));
        std::string val = trim(line.substr(eq + 1));
        if (val.size() >= 2 && (val.front() == '"' || val.front() == '\'') && val.back() == val.front()) {
            val = val.substr(1, val.size() - 2);
        }
        apply_value(cfg, key, val, errs);
    }
}

static void load_json(SearchConfig& cfg, const std::string& text, std::vector<std::string>& errs) {
    try {
        nlohmann::json j = nlohmann::json::parse(text);
        if (!j.is_object()) {
            errs.push_back("config root must be a JSON object");
            return;
        }
        for (const auto& item : j.items()) {
            const std::string key = item.key();
            const auto& value = item.value();
            if (value.is_string()) {
                apply_value(cfg, key, value.get<std::string>(), errs);
            } else if (value.is_boolean()) {
                apply_value(cfg, key, value.get<bool>() ? "true" : "false", errs);
            } else if (value.is_number_unsigned()) {
                const auto n = value.get<std::uint64_t>();
                // JSON numbers for bits are the raw value, not hex text
                apply_value(cfg, key, key == "bits" ? fmt::format("{:x}", n) : std::to_string(n), errs);
            } else if (value.is_number_integer()) {
                apply_value(cfg, key, std::to_string(value.get<std::int64_t>()), errs);
            } else {
                errs.push_back(fmt::format("'{}' must be a string, number or boolean", key));
            }
        }
    } catch (const nlohmann::json::exception& ex) {
        errs.push_back(fmt::format("Failed to read config: {}", ex.what()));
    }
}

std::vector<std::string> load_from_text(SearchConfig& cfg, const std::string& text) {
    std::vector<std::string> errs;
    auto first_non_space = text.find_first_not_of(" \t\n\r");
    if (first_non_space == std::string::npos) return errs;

    if (text[first_non_space] == '{') {
        load_json(cfg, text, errs);
    } else {
        load_key_value(cfg, text, errs);
    }
    return errs;
}

std::vector<std::string> load_from_file(SearchConfig& cfg, const std::string& path) {
    std::ifstream in(path);
    if (!in.good()) return {}; // optional

    std::stringstream buffer; buffer << in.rdbuf();
    return load_from_text(cfg, buffer.str());
}

std::vector<std::string> apply_env_overrides(SearchConfig& cfg) {
    std::vector<std::string> errs;
    if (const char* v = std::getenv("BEANPOW_HEADER"))      apply_value(cfg, "header", v, errs);
    if (const char* v = std::getenv("BEANPOW_THREADS"))     apply_value(cfg, "threads", v, errs);
    if (const char* v = std::getenv("BEANPOW_NONCE_START")) apply_value(cfg, "nonce_start", v, errs);
    if (const char* v = std::getenv("BEANPOW_NONCE_END"))   apply_value(cfg, "nonce_end", v, errs);
    if (const char* v = std::getenv("BEANPOW_VERIFY"))      apply_value(cfg, "verify", v, errs);
    return errs;
}

std::vector<std::string> validate_final(const SearchConfig& cfg) {
    std::vector<std::string> errs;
    std::string e;
    if (!cfg.uses_fields()) {
        if (!validate_hex(cfg.header, chain::kHeaderSize, "header", e)) errs.push_back(e);
    } else {
        if (cfg.merkle_root.empty()) errs.push_back("header or merkle_root is required");
        else if (!validate_hex(cfg.merkle_root, 32, "merkle_root", e)) errs.push_back(e);
        if (!cfg.prev_hash.empty() && !validate_hex(cfg.prev_hash, 32, "prev_hash", e)) errs.push_back(e);
        if (cfg.version < std::numeric_limits<std::int32_t>::min() ||
            cfg.version > std::numeric_limits<std::int32_t>::max()) {
            errs.push_back(fmt::format("version {} overflows 32 bits", cfg.version));
        }
        if (cfg.time > 0xFFFFFFFFULL) errs.push_back(fmt::format("time {} overflows 32 bits", cfg.time));
        if (cfg.bits > 0xFFFFFFFFULL) errs.push_back(fmt::format("bits {:#x} overflows 32 bits", cfg.bits));
    }
    if (!validate_nonce_range(cfg.nonce_start, cfg.nonce_end, e)) errs.push_back(e);
    if (cfg.threads == 0 || cfg.threads > kMaxThreads) {
        errs.push_back(fmt::format("threads must be between 1 and {}", kMaxThreads));
    }
    return errs;
}

chain::BlockHeader build_header(const SearchConfig& cfg) {
    if (!cfg.uses_fields()) {
        return chain::header_from_hex(cfg.header);
    }
    if (cfg.version < std::numeric_limits<std::int32_t>::min() ||
        cfg.version > std::numeric_limits<std::int32_t>::max()) {
        throw chain::EncodingError(fmt::format("version {} overflows 32 bits", cfg.version));
    }
    if (cfg.time > 0xFFFFFFFFULL || cfg.bits > 0xFFFFFFFFULL) {
        throw chain::EncodingError("time/bits overflow 32 bits");
    }

    chain::BlockHeader header;
    header.version = static_cast<std::int32_t>(cfg.version);
    if (!cfg.prev_hash.empty()) header.prev_block_hash = util::from_display_hex(cfg.prev_hash);
    header.merkle_root = util::from_display_hex(cfg.merkle_root);
    header.timestamp = static_cast<std::uint32_t>(cfg.time);
    header.bits = static_cast<std::uint32_t>(cfg.bits);
    header.nonce = 0;
    return header;
}

mining::SearchOptions to_search_options(const SearchConfig& cfg) {
    mining::SearchOptions opts;
    opts.range.first = static_cast<std::uint32_t>(cfg.nonce_start);
    opts.range.last = static_cast<std::uint32_t>(cfg.nonce_end);
    opts.threads = cfg.threads;
    opts.progress_interval = cfg.progress_interval;
    opts.verify = cfg.verify;
    return opts;
}

} // namespace beanpow::config

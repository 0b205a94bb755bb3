/*
 * beanpow-search
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <string>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include <beanpow/chain/block_header.hpp>
#include <beanpow/cli/args.hpp>
#include <beanpow/config/loader.hpp>
#include <beanpow/logging/fmt_logger.hpp>
#include <beanpow/mining/nonce_search.hpp>
#include <beanpow/util/hex.hpp>

#ifndef BEANPOW_VERSION
#define BEANPOW_VERSION "0.0.0"
#endif

namespace {

std::atomic<bool> g_stop{false};

void on_signal(int) {
    g_stop.store(true);
}

int print_hash_only(const beanpow::chain::BlockHeader& header, bool as_json,
                    beanpow::logging::Logger& log) {
    const auto digest = beanpow::chain::header_hash(header);
    if (as_json) {
        nlohmann::json out = {
            {"nonce", header.nonce},
            {"hash", beanpow::util::bytes_to_hex(digest)},
            {"display_hash", beanpow::util::to_display_hex(digest)},
        };
        fmt::print("{}\n", out.dump(2));
        return 0;
    }
    log.info(fmt::format("hash         : {}", beanpow::util::bytes_to_hex(digest)));
    log.info(fmt::format("display hash : {}", beanpow::util::to_display_hex(digest)));
    return 0;
}

void print_result_json(const beanpow::mining::SearchResult& r) {
    nlohmann::json out = {
        {"status", beanpow::mining::to_string(r.status)},
        {"nonces_tried", r.stats.nonces_tried},
        {"early_exits", r.stats.early_exits},
        {"full_hashes", r.stats.full_hashes},
        {"elapsed_seconds", r.stats.elapsed_seconds},
    };
    if (r.found()) {
        out["nonce"] = r.nonce;
        out["hash"] = beanpow::util::bytes_to_hex(r.digest);
        out["display_hash"] = beanpow::util::to_display_hex(r.digest);
        if (r.verified) out["verified"] = *r.verified;
    }
    fmt::print("{}\n", out.dump(2));
}

} // namespace

int main(int argc, char** argv) {
    beanpow::logging::FmtLogger log;
    auto parsed = beanpow::cli::parse(argc, argv, log);
    if (parsed.show_only) {
        return 0;
    }
    if (!parsed.cfg.has_value()) {
        return 1;
    }
    log.set_debug(parsed.debug);
    const auto& cfg = *parsed.cfg;

    try {
        const auto header = beanpow::config::build_header(cfg);
        if (cfg.hash_only) {
            return print_hash_only(header, cfg.json, log);
        }

        std::signal(SIGINT, on_signal);
        std::signal(SIGTERM, on_signal);

        const auto options = beanpow::config::to_search_options(cfg);
        beanpow::mining::NonceSearcher searcher(header, options, &log);
        if (!cfg.json) {
            log.info(fmt::format("beanpow-search v{}: bits {:08x}, nonces {} .. {}, {} thread(s)",
                                 BEANPOW_VERSION, header.bits, options.range.first,
                                 options.range.last, options.threads));
        }

        const auto result = searcher.run(&g_stop);
        if (cfg.json) {
            print_result_json(result);
        } else if (result.found()) {
            log.info(fmt::format("Found nonce {} ({:#010x})", result.nonce, result.nonce));
            log.info(fmt::format("  hash         : {}", beanpow::util::bytes_to_hex(result.digest)));
            log.info(fmt::format("  display hash : {}", beanpow::util::to_display_hex(result.digest)));
        } else {
            log.warn(fmt::format("Search {} after {} nonces; vary time or extra-nonce and retry",
                                 beanpow::mining::to_string(result.status), result.stats.nonces_tried));
        }
        if (!cfg.json) {
            log.info(fmt::format("{} nonces in {:.2f}s ({:.1f} H/s), {} early exits",
                                 result.stats.nonces_tried, result.stats.elapsed_seconds,
                                 result.stats.hashrate(), result.stats.early_exits));
        }

        if (result.verified && !*result.verified) return 1;
        if (result.found()) return 0;
        return result.status == beanpow::mining::SearchStatus::Exhausted ? 2 : 1;
    } catch (const beanpow::chain::EncodingError& e) {
        log.error(fmt::format("Invalid header: {}", e.what()));
        return 1;
    } catch (const std::exception& e) {
        log.error(fmt::format("Search failed: {}", e.what()));
        return 1;
    }
}

#include <beanpow/cli/args.hpp>

#include <string>
#include <vector>

#include <cxxopts.hpp>
#include <fmt/core.h>

#include <beanpow/config/loader.hpp>

#ifndef BEANPOW_VERSION
#define BEANPOW_VERSION "0.0.0"
#endif

namespace beanpow::cli {

static bool report(const std::vector<std::string>& errs, beanpow::logging::Logger& log) {
    for (const auto& e : errs) log.error(e);
    return errs.empty();
}

beanpow::config::ParseResult parse(int argc, char** argv, beanpow::logging::Logger& log) {
    beanpow::config::ParseResult pr;
    cxxopts::Options options("beanpow-search", "SHA-256d block header nonce search");
    options.add_options()
        ("header",      "80-byte block header as hex", cxxopts::value<std::string>())
        ("version-field", "Header version (when building from fields)", cxxopts::value<std::string>())
        ("prev-hash",   "Previous block hash (display hex)", cxxopts::value<std::string>())
        ("merkle-root", "Merkle root (display hex)", cxxopts::value<std::string>())
        ("time",        "Header timestamp", cxxopts::value<std::string>())
        ("bits",        "Compact target (hex)", cxxopts::value<std::string>())
        ("start",       "First nonce to try", cxxopts::value<std::string>())
        ("end",         "Last nonce to try (inclusive)", cxxopts::value<std::string>())
        ("t,threads",   "Worker threads", cxxopts::value<std::string>())
        ("progress",    "Log progress every N nonces per worker", cxxopts::value<std::string>())
        ("verify",      "Recheck a hit with the OpenSSL reference digest")
        ("json",        "Print the result as JSON")
        ("hash-only",   "Print the header digest and exit without searching")
        ("config",      "Path to config file (beanpow.conf)", cxxopts::value<std::string>()->default_value("beanpow.conf"))
        ("d,debug",     "Enable debug logging")
        ("v,version",   "Show version and exit")
        ("h,help",      "Show help and exit");

    try {
        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            log.info(options.help());
            pr.show_only = true;
            return pr;
        }
        if (result.count("version")) {
            log.info(fmt::format("beanpow-search v{}", BEANPOW_VERSION));
            pr.show_only = true;
            return pr;
        }
        pr.config_path = result["config"].as<std::string>();
        pr.debug = result.count("debug") > 0;

        // Lowest to highest precedence: file, environment, command line
        beanpow::config::SearchConfig cfg;
        if (!report(beanpow::config::load_from_file(cfg, pr.config_path), log)) return pr;
        if (!report(beanpow::config::apply_env_overrides(cfg), log)) return pr;

        std::string cli_text;
        auto take = [&](const char* opt, const char* key) {
            if (result.count(opt)) {
                cli_text += fmt::format("{}={}\n", key, result[opt].as<std::string>());
            }
        };
        take("header", "header");
        take("version-field", "version");
        take("prev-hash", "prev_hash");
        take("merkle-root", "merkle_root");
        take("time", "time");
        take("bits", "bits");
        take("start", "nonce_start");
        take("end", "nonce_end");
        take("threads", "threads");
        take("progress", "progress_interval");
        if (result.count("verify")) cli_text += "verify=true\n";
        if (result.count("json")) cli_text += "json=true\n";
        if (!report(beanpow::config::load_from_text(cfg, cli_text), log)) return pr;
        cfg.hash_only = result.count("hash-only") > 0;

        if (!report(beanpow::config::validate_final(cfg), log)) {
            log.error(fmt::format("Missing or invalid options.\n\n{}", options.help()));
            return pr;
        }
        pr.cfg = cfg;
    } catch (const std::exception& e) {
        log.error(fmt::format("Argument error: {}\n\n{}", e.what(), options.help()));
        return pr;
    }
    return pr;
}

} // namespace beanpow::cli

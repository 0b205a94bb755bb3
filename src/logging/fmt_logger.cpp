#include <beanpow/logging/fmt_logger.hpp>

#include <chrono>
#include <cstdio>
#include <ctime>
#include <string>

#include <fmt/core.h>

namespace beanpow::logging {

static std::string now_hms() {
    using namespace std::chrono;
    std::time_t t = system_clock::to_time_t(system_clock::now());
    std::tm tm{};
    localtime_r(&t, &tm);
    return fmt::format("{:02d}:{:02d}:{:02d}", tm.tm_hour, tm.tm_min, tm.tm_sec);
}

static inline void print_line(std::FILE* out, std::string_view level, std::string_view msg) {
    fmt::print(out, "[{}] [{}] {}\n", now_hms(), level, msg);
}

void FmtLogger::info(std::string_view msg) { print_line(stdout, "INFO", msg); }
void FmtLogger::warn(std::string_view msg) { print_line(stdout, "WARN", msg); }
void FmtLogger::error(std::string_view msg) { print_line(stderr, "ERROR", msg); }
void FmtLogger::debug(std::string_view msg) {
    if (enable_debug_.load()) print_line(stdout, "DEBUG", msg);
}

} // namespace beanpow::logging

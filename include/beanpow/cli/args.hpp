#pragma once

#include <beanpow/config/types.hpp>
#include <beanpow/logging/logger.hpp>

namespace beanpow::cli {

// Parse CLI using cxxopts, then layer config file < environment < command line.
// Writes help/version and configuration errors through the provided logger.
beanpow::config::ParseResult parse(int argc, char** argv, beanpow::logging::Logger& log);

} // namespace beanpow::cli

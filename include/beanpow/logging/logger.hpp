#pragma once

#include <string_view>

namespace beanpow::logging {

class Logger {
public:
    virtual ~Logger() = default;
    virtual void info(std::string_view msg) = 0;
    virtual void warn(std::string_view msg) = 0;
    virtual void error(std::string_view msg) = 0;
    virtual void debug(std::string_view msg) = 0;
    virtual bool debug_enabled() const = 0;
};

} // namespace beanpow::logging

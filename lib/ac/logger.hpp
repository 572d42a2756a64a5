/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */
#ifndef APTOS_CLIENT_LOGGER_HPP
#define APTOS_CLIENT_LOGGER_HPP

#include <memory>
#include <string>
#include <string_view>
#include <ac/common/format.hpp>

namespace aptos_client::logger {
    enum class level {
        trace, debug, info, warn, error
    };

    extern void log(level lev, const std::string &msg);
    extern std::shared_ptr<std::string> last_error();
    extern void reset_last_error();
    extern bool &tracing_enabled();

    template<typename... Args>
    void log(const level lev, const std::string_view &fmt, Args&&... a)
    {
        log(lev, format(fmt::runtime(fmt), std::forward<Args>(a)...));
    }

    template<typename... Args>
    void trace(const std::string_view &fmt, Args&&... a)
    {
        if (tracing_enabled())
            log(level::trace, fmt, std::forward<Args>(a)...);
    }

    template<typename... Args>
    void debug(const std::string_view &fmt, Args&&... a)
    {
        log(level::debug, fmt, std::forward<Args>(a)...);
    }

    template<typename... Args>
    void info(const std::string_view &fmt, Args&&... a)
    {
        log(level::info, fmt, std::forward<Args>(a)...);
    }

    template<typename... Args>
    void warn(const std::string_view &fmt, Args&&... a)
    {
        log(level::warn, fmt, std::forward<Args>(a)...);
    }

    template<typename... Args>
    void error(const std::string_view &fmt, Args&&... a)
    {
        log(level::error, fmt, std::forward<Args>(a)...);
    }
}

#endif // !APTOS_CLIENT_LOGGER_HPP

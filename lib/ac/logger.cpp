/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */

#ifndef SPDLOG_FMT_EXTERNAL
#   define SPDLOG_FMT_EXTERNAL 1
#endif
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <ac/logger.hpp>

namespace aptos_client::logger {
    static std::mutex last_error_mutex {};
    static std::shared_ptr<std::string> last_error_ptr {};

    std::shared_ptr<std::string> last_error()
    {
        std::scoped_lock lk { last_error_mutex };
        return last_error_ptr;
    }

    void reset_last_error()
    {
        std::scoped_lock lk { last_error_mutex };
        last_error_ptr.reset();
    }

    bool &tracing_enabled()
    {
        static bool enabled = std::getenv("AC_DEBUG") != nullptr;
        return enabled;
    }

    static std::string log_path()
    {
        const char *env_log_path = std::getenv("AC_LOG");
        const std::filesystem::path path { env_log_path ? env_log_path : "./log/aptos-client.log" };
        return std::filesystem::absolute(path).string();
    }

    static bool console_enabled()
    {
        return !std::getenv("AC_LOG_NO_CONSOLE");
    }

    static spdlog::logger create(const std::string &path)
    {
        {
            const auto dir = std::filesystem::path { path }.parent_path();
            std::error_code ec {};
            std::filesystem::create_directories(dir, ec);
            std::ofstream os { path, std::ios_base::app };
            if (!os) {
                std::cerr << fmt::format("AC_INIT: Unable to write to the log file: {}; terminating.\n", path);
                std::terminate();
            }
        }

        std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> console_sink {};
        if (console_enabled()) {
            console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console_sink->set_level(spdlog::level::info);
            console_sink->set_pattern("[%^%l%$] %v");
        }
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path);
        file_sink->set_level(spdlog::level::trace);
        file_sink->set_pattern("[%Y-%m-%d %T %z] [%P:%t] [%n] [%l] %v");
        auto logger = console_sink
            ? spdlog::logger("aptos", { console_sink, file_sink })
            : spdlog::logger("aptos", { file_sink });
        if (tracing_enabled()) {
            logger.set_level(spdlog::level::trace);
        } else {
            logger.set_level(spdlog::level::debug);
        }
        logger.flush_on(spdlog::level::debug);
        logger.debug("log path: {}", path);
        return logger;
    }

    static spdlog::logger &get()
    {
        static spdlog::logger logger = create(log_path());
        return logger;
    }

    void log(level lev, const std::string &msg)
    {
        switch (lev) {
            case level::trace:
                get().trace(msg);
                break;
            case level::debug:
                get().debug(msg);
                break;
            case level::info:
                get().info(msg);
                break;
            case level::warn:
                get().warn(msg);
                break;
            case level::error: {
                get().error(msg);
                std::scoped_lock lk { last_error_mutex };
                last_error_ptr = std::make_shared<std::string>(msg);
                break;
            }
            default:
                throw aptos_client::error(fmt::format("unsupported log level: {}", static_cast<int>(lev)));
        }
    }
}

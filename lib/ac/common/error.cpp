/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */

#include <cerrno>
#include <cstring>
#include <typeinfo>
#include <boost/interprocess/streams/bufferstream.hpp>
#include <boost/stacktrace.hpp>
#include "error.hpp"
#include "format.hpp"
#include <ac/logger.hpp>

namespace aptos_client {
    base_error::base_error(const std::string_view msg):
        _msg { msg }
    {
        // skips safe_dump_to, base_error and the derived constructor
        boost::stacktrace::safe_dump_to(3, _trace.data(), _trace.size());
    }

    const char *base_error::what() const noexcept
    {
        if (!_trace_logged) {
            _trace_logged = true;
            thread_local std::array<char, 0x2000> buf {};
            boost::interprocess::obufferstream os { buf.data(), buf.size() - 1 };
            os << boost::stacktrace::stacktrace::from_dump(_trace.data(), _trace.size());
            buf[os.buffer().second] = 0;
            logger::debug("{} raised at:\n{}", _msg, buf.data());
        }
        return _msg.c_str();
    }

    error::error(const std::string_view msg)
        : base_error { msg }
    {
    }

    error::error(const std::string_view msg, const std::exception &ex)
        : error { fmt::format("{}: {} ({})", msg, ex.what(), typeid(ex).name()) }
    {
    }

    error_sys::error_sys(const std::string_view msg)
        : error_sys { msg, errno }
    {
    }

    error_sys::error_sys(const std::string_view msg, const int err_no)
        : error { fmt::format("{}: errno {} ({})", msg, err_no, std::strerror(err_no)) }
    {
    }
}

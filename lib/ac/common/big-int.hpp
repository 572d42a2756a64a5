/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */
#ifndef APTOS_CLIENT_COMMON_BIG_INT_HPP
#define APTOS_CLIENT_COMMON_BIG_INT_HPP

#define BOOST_DETAIL_EMPTY_VALUE_BASE
#include <algorithm>
#include <sstream>
#include <string>
#include <boost/multiprecision/cpp_int.hpp>
#include <ac/common/format.hpp>

namespace aptos_client {
    using boost::multiprecision::cpp_int;

    // the inclusive range of a Move integer type of the given width
    inline cpp_int big_uint_max(const size_t bits)
    {
        return (cpp_int { 1 } << bits) - 1;
    }

    inline cpp_int big_int_min(const size_t bits)
    {
        return -(cpp_int { 1 } << (bits - 1));
    }

    inline cpp_int big_int_max(const size_t bits)
    {
        return (cpp_int { 1 } << (bits - 1)) - 1;
    }

    // parses a decimal integer with an optional leading minus
    inline cpp_int big_int_from_string(const std::string_view s)
    {
        const auto digits = s.starts_with('-') ? s.substr(1) : s;
        if (digits.empty() || !std::all_of(digits.begin(), digits.end(), [](const char c) { return c >= '0' && c <= '9'; }))
            throw error(fmt::format("not a decimal integer: '{}'", s));
        const std::string digits_str { digits };
        cpp_int val { digits_str.c_str() };
        if (s.starts_with('-'))
            val = -val;
        return val;
    }
}

namespace fmt {
    template<typename T>
    struct formatter<boost::multiprecision::number<T>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            std::ostringstream ss {};
            ss << v;
            return fmt::format_to(ctx.out(), "{}", ss.str());
        }
    };
}

#endif // !APTOS_CLIENT_COMMON_BIG_INT_HPP

/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */
#ifndef APTOS_CLIENT_COMMON_TEST_HPP
#define APTOS_CLIENT_COMMON_TEST_HPP

#include <iostream>
#include <source_location>
#define BOOST_UT_DISABLE_MODULE 1
#include <boost/ut.hpp>
#include "bytes.hpp"
#include "format.hpp"

namespace aptos_client {
    using namespace boost::ut;

    struct test_printer: boost::ut::printer {
        template<class T>
        test_printer& operator<<(T &&t) {
            if constexpr (std::is_convertible_v<T, std::span<const uint8_t>>) {
                std::cerr << fmt::format("{}", t);
            } else {
                std::cerr << std::forward<T>(t);
            }
            return *this;
        }

        test_printer& operator<<(const std::string_view sv) {
            std::cerr << sv;
            return *this;
        }
    };

    template<typename X, typename Y>
    concept convertible_to_y = requires (X x, Y y)
    {
        { std::is_trivially_constructible_v<X, Y> };
    };

    template<typename T>
    bool test_same(const T &x, const T &y, const std::source_location &loc=std::source_location::current())
    {
        const auto res = x == y;
        expect(res, loc) << fmt::format("{} != {}", x, y);
        return res;
    }

    template<typename X, convertible_to_y<X> Y>
    bool test_same(const X &x, const Y &y, const std::source_location &loc=std::source_location::current())
    {
        const auto res = x == static_cast<X>(y);
        expect(res, loc) << fmt::format("{} != {}", x, y);
        return res;
    }

    template<typename T, typename Y>
    bool test_same(const std::string &name, const T &x, const Y &y, const std::source_location &loc=std::source_location::current())
    {
        const auto res = x == static_cast<T>(y);
        expect(res, loc) << fmt::format("{}: {} != {}", name, x, y);
        return res;
    }

    // compares a produced byte sequence against its expected hex representation
    inline bool test_hex(const std::string_view exp_hex, const buffer act, const std::source_location &loc=std::source_location::current())
    {
        const auto exp = uint8_vector::from_hex(exp_hex);
        const auto res = exp == act;
        expect(res, loc) << fmt::format("{} != {}", exp, act);
        return res;
    }
}

template <class... Ts>
inline auto boost::ut::cfg<boost::ut::override, Ts...> = boost::ut::runner<boost::ut::reporter<aptos_client::test_printer>> {};

#endif // !APTOS_CLIENT_COMMON_TEST_HPP

/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */
#ifndef APTOS_CLIENT_ABI_ARG_VALUE_HPP
#define APTOS_CLIENT_ABI_ARG_VALUE_HPP

#include <concepts>
#include <type_traits>
#include <variant>
#include <vector>
#include <ac/move/address.hpp>

namespace aptos_client::abi {
    struct arg_value;
    using arg_sequence = std::vector<arg_value>;

    /*
     * A user-supplied argument before it is checked against the declared Move type.
     * The same value may serialize differently depending on the parameter type, e.g. a string
     * is a decimal number for u64, an address for address and raw text for vector<u8>.
     */
    struct arg_value {
        using value_type = std::variant<std::monostate, bool, int64_t, uint64_t, double, cpp_int,
            std::string, uint8_vector, move::address, arg_sequence>;

        value_type val {};

        arg_value() =default;
        arg_value(std::nullptr_t) {}
        arg_value(const bool v): val { v } {}
        // any other integer type widens to the 64-bit alternative of its signedness
        template<std::integral T>
            requires (!std::same_as<T, bool>)
        arg_value(const T v)
        {
            if constexpr (std::is_signed_v<T>)
                val = static_cast<int64_t>(v);
            else
                val = static_cast<uint64_t>(v);
        }

        arg_value(const double v): val { v } {}
        arg_value(cpp_int v): val { std::move(v) } {}
        arg_value(const char *s): val { std::string { s } } {}
        arg_value(const std::string_view s): val { std::string { s } } {}
        arg_value(std::string s): val { std::move(s) } {}
        arg_value(uint8_vector v): val { std::move(v) } {}
        arg_value(const move::address &a): val { a } {}
        arg_value(arg_sequence items): val { std::move(items) } {}

        bool is_null() const noexcept
        {
            return std::holds_alternative<std::monostate>(val);
        }

        template<typename T>
        const T *get_if() const noexcept
        {
            return std::get_if<T>(&val);
        }

        // for error messages
        std::string_view type_name() const;
    };
}

#endif // !APTOS_CLIENT_ABI_ARG_VALUE_HPP

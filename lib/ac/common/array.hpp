/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */
#ifndef APTOS_CLIENT_COMMON_ARRAY_HPP
#define APTOS_CLIENT_COMMON_ARRAY_HPP

#include <array>
#include <cstring>
#include <initializer_list>
#include <span>
#include <ac/common/error.hpp>
#include <ac/common/format.hpp>
#include <ac/common/bytes.hpp>

namespace aptos_client {
    template<size_t SZ>
    struct byte_array: std::array<uint8_t, SZ> {
        using base_type = std::array<uint8_t, SZ>;

        static byte_array<SZ> from_hex(const std::string_view hex)
        {
            byte_array<SZ> data {};
            init_from_hex(data, strip_hex_prefix(hex));
            return data;
        }

        byte_array(): base_type {}
        {
        }

        byte_array(const std::initializer_list<uint8_t> s)
        {
            if (s.size() != SZ) [[unlikely]]
                throw error(fmt::format("span must be of size {} but got {}", SZ, s.size()));
            std::copy(s.begin(), s.end(), base_type::begin());
        }

        byte_array(const buffer s)
        {
            if (s.size() != SZ) [[unlikely]]
                throw error(fmt::format("buffer must be of size {} but got {}", SZ, s.size()));
            memcpy(base_type::data(), s.data(), SZ);
        }

        byte_array &operator=(const buffer s)
        {
            if (s.size() != SZ) [[unlikely]]
                throw error(fmt::format("buffer must be of size {} but got {}", SZ, s.size()));
            memcpy(base_type::data(), s.data(), SZ);
            return *this;
        }

        operator buffer() const noexcept
        {
            return { base_type::data(), SZ };
        }

        bool is_zero() const noexcept
        {
            return std::all_of(base_type::begin(), base_type::end(), [](const uint8_t b) { return b == 0; });
        }
    };

    extern void secure_clear(std::span<uint8_t> store);

    template<size_t SZ>
    struct secure_byte_array: byte_array<SZ>
    {
        using byte_array<SZ>::byte_array;

        static secure_byte_array<SZ> from_hex(const std::string_view hex)
        {
            secure_byte_array<SZ> data {};
            init_from_hex(data, strip_hex_prefix(hex));
            return data;
        }

        secure_byte_array() =default;
        secure_byte_array(const secure_byte_array<SZ> &) =default;
        secure_byte_array &operator=(const secure_byte_array<SZ> &) =default;

        ~secure_byte_array()
        {
            secure_clear(*this);
        }
    };
}

namespace fmt {
    template<size_t SZ>
    struct formatter<aptos_client::byte_array<SZ>>: formatter<int> {
        template<typename FormatContext>
        auto format(const auto &v, FormatContext &ctx) const -> decltype(ctx.out())
        {
            return fmt::format_to(ctx.out(), "{}", std::span<const uint8_t>(v));
        }
    };

    template<size_t SZ>
    struct formatter<aptos_client::secure_byte_array<SZ>>: formatter<aptos_client::byte_array<SZ>> {
    };
}

#endif // !APTOS_CLIENT_COMMON_ARRAY_HPP

/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */

#include <cctype>
#include <ac/move/address.hpp>

namespace aptos_client::move {
    address address::from_u8(const uint8_t v)
    {
        address res {};
        res[31] = v;
        return res;
    }

    address address::from_auth_key(const crypto::authentication_key &key)
    {
        return address { static_cast<buffer>(key) };
    }

    address address::from_string_relaxed(const std::string_view s)
    {
        const auto hex = strip_hex_prefix(s);
        if (hex.empty())
            throw address_error(fmt::format("address is too short: '{}'", s));
        if (hex.size() > 64)
            throw address_error(fmt::format("address is too long: '{}'", s));
        if (!std::all_of(hex.begin(), hex.end(), [](const char c) { return std::isxdigit(static_cast<unsigned char>(c)); }))
            throw address_error(fmt::format("address is not a hex string: '{}'", s));
        const auto bytes = bytes_from_hex(hex);
        address res {};
        std::copy(bytes.begin(), bytes.end(), res.begin() + (res.size() - bytes.size()));
        return res;
    }

    address address::from_string_strict(const std::string_view s)
    {
        if (!s.starts_with("0x"))
            throw address_error(fmt::format("address must start with 0x: '{}'", s));
        auto res = from_string_relaxed(s);
        const auto hex_size = s.size() - 2;
        if (hex_size != 64 && !(res.is_special() && hex_size == 1))
            throw address_error(fmt::format("only special addresses may use the short form: '{}'", s));
        return res;
    }

    bool address::is_special() const noexcept
    {
        for (size_t i = 0; i < size() - 1; ++i) {
            if ((*this)[i] != 0)
                return false;
        }
        return (*this)[31] < 0x10;
    }

    std::string address::to_string() const
    {
        if (is_special())
            return to_short_string();
        return to_long_string();
    }

    std::string address::to_short_string() const
    {
        const auto full = fmt::format("{}", buffer_lowercase { *this });
        const auto first_non_zero = full.find_first_not_of('0');
        if (first_non_zero == std::string::npos)
            return "0x0";
        return fmt::format("0x{}", full.substr(first_non_zero));
    }

    std::string address::to_long_string() const
    {
        return to_hex(*this);
    }

    address address::derive(const buffer data, const crypto::auth_scheme scheme) const
    {
        const auto scheme_byte = static_cast<uint8_t>(scheme);
        return address { static_cast<buffer>(crypto::sha3::digest({ *this, data, buffer { &scheme_byte, 1 } })) };
    }
}

/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */
#ifndef APTOS_CLIENT_MOVE_ADDRESS_HPP
#define APTOS_CLIENT_MOVE_ADDRESS_HPP

#include <string>
#include <ac/bcs/decoder.hpp>
#include <ac/bcs/encoder.hpp>
#include <ac/crypto/auth-key.hpp>

namespace aptos_client::move {
    struct address_error: error {
        using error::error;
    };

    /*
     * A 32-byte account or object address.
     * Textual forms:
     * - long: 0x followed by exactly 64 hex digits;
     * - short: 0x followed by the hex digits left after stripping leading zeros, 0x0 for the zero address;
     * - canonical (AIP-40): short for special addresses 0x0..0xf, long for everything else.
     */
    struct address: byte_array<32> {
        using byte_array<32>::byte_array;

        static address from_u8(uint8_t v);
        static address from_auth_key(const crypto::authentication_key &key);
        // optional 0x prefix, 1 to 64 hex digits, left-padded with zeros
        static address from_string_relaxed(std::string_view s);
        // requires 0x and the long form unless the address is special
        static address from_string_strict(std::string_view s);

        static address from_bcs(bcs::decoder &dec)
        {
            address res {};
            dec.fixed_bytes(res);
            return res;
        }

        void to_bcs(bcs::encoder &enc) const
        {
            enc.fixed_bytes(*this);
        }

        bool is_special() const noexcept;
        std::string to_string() const;
        std::string to_short_string() const;
        std::string to_long_string() const;

        crypto::authentication_key auth_key() const
        {
            return crypto::authentication_key { static_cast<buffer>(*this) };
        }

        // SHA3-256(this || data || scheme)
        address derive(buffer data, crypto::auth_scheme scheme) const;

        address named_object(const buffer seed) const
        {
            return derive(seed, crypto::auth_scheme::derive_object);
        }

        address object_from_object(const address &object) const
        {
            return derive(object, crypto::auth_scheme::derive_object);
        }

        address object_from_guid(const buffer guid) const
        {
            return derive(guid, crypto::auth_scheme::derive_object_from_guid);
        }

        address resource_account(const buffer seed) const
        {
            return derive(seed, crypto::auth_scheme::derive_resource_account);
        }
    };

    inline const address address_zero = address::from_u8(0);
    inline const address address_one = address::from_u8(1);
    inline const address address_two = address::from_u8(2);
    inline const address address_three = address::from_u8(3);
    inline const address address_four = address::from_u8(4);
}

namespace fmt {
    template<>
    struct formatter<aptos_client::move::address>: formatter<int> {
        template<typename FormatContext>
        auto format(const aptos_client::move::address &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", v.to_string());
        }
    };
}

#endif // !APTOS_CLIENT_MOVE_ADDRESS_HPP

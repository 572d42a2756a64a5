/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */
#ifndef APTOS_CLIENT_CRYPTO_AUTH_KEY_HPP
#define APTOS_CLIENT_CRYPTO_AUTH_KEY_HPP

#include <ac/crypto/sha3.hpp>

namespace aptos_client::crypto {
    // The last byte hashed into an authentication key or a derived address
    enum class auth_scheme: uint8_t {
        ed25519 = 0,
        multi_ed25519 = 1,
        single_key = 2,
        multi_key = 3,
        derive_object = 0xFC,
        derive_object_from_guid = 0xFD,
        derive_resource_account = 0xFF
    };

    struct authentication_key: byte_array<32> {
        using byte_array<32>::byte_array;

        // SHA3-256(data || scheme)
        static authentication_key from_bytes_and_scheme(const buffer data, const auth_scheme scheme)
        {
            const auto scheme_byte = static_cast<uint8_t>(scheme);
            return authentication_key { sha3::digest({ data, buffer { &scheme_byte, 1 } }) };
        }

        std::string to_string() const
        {
            return to_hex(*this);
        }
    };
}

namespace fmt {
    template<>
    struct formatter<aptos_client::crypto::auth_scheme>: formatter<int> {
        template<typename FormatContext>
        auto format(const aptos_client::crypto::auth_scheme &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", static_cast<int>(v));
        }
    };

    template<>
    struct formatter<aptos_client::crypto::authentication_key>: formatter<aptos_client::byte_array<32>> {
    };
}

#endif // !APTOS_CLIENT_CRYPTO_AUTH_KEY_HPP

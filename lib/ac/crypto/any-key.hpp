/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */
#ifndef APTOS_CLIENT_CRYPTO_ANY_KEY_HPP
#define APTOS_CLIENT_CRYPTO_ANY_KEY_HPP

#include <variant>
#include <ac/crypto/ed25519.hpp>
#include <ac/crypto/secp256k1.hpp>

namespace aptos_client::crypto {
    // A P-256 key, carried for its auth key and wire format only
    struct secp256r1_public_key: byte_array<65> {
        using byte_array<65>::byte_array;

        static secp256r1_public_key from_bcs(bcs::decoder &dec);
        void to_bcs(bcs::encoder &enc) const;
    };

    // An OIDC-backed key; verification requires on-chain JWKs and is not done locally
    struct keyless_public_key {
        std::string iss_val {};
        byte_array<32> idc {};

        static keyless_public_key from_bcs(bcs::decoder &dec);
        void to_bcs(bcs::encoder &enc) const;
        bool operator==(const keyless_public_key &o) const =default;
    };

    struct any_signature {
        enum class variant_type: uint32_t {
            ed25519 = 0,
            secp256k1 = 1,
            webauthn = 2,
            keyless = 3
        };
        using value_type = std::variant<ed25519::signature, secp256k1::signature>;

        value_type val;

        static any_signature from_bcs(bcs::decoder &dec);
        void to_bcs(bcs::encoder &enc) const;
        variant_type variant() const;
        bool operator==(const any_signature &o) const =default;
    };

    struct any_public_key {
        enum class variant_type: uint32_t {
            ed25519 = 0,
            secp256k1 = 1,
            secp256r1 = 2,
            keyless = 3
        };
        using value_type = std::variant<ed25519::public_key, secp256k1::public_key, secp256r1_public_key, keyless_public_key>;

        value_type val;

        static any_public_key from_bcs(bcs::decoder &dec);
        void to_bcs(bcs::encoder &enc) const;
        variant_type variant() const;
        // false when the signature kind does not match the key kind or the key cannot be verified locally
        bool verify(buffer msg, const any_signature &sig) const;
        // SHA3-256(bcs(key) || 0x02)
        authentication_key auth_key() const;
        bool operator==(const any_public_key &o) const =default;
    };
}

#endif // !APTOS_CLIENT_CRYPTO_ANY_KEY_HPP

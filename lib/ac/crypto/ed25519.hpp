/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */
#ifndef APTOS_CLIENT_CRYPTO_ED25519_HPP
#define APTOS_CLIENT_CRYPTO_ED25519_HPP

#include <ac/bcs/decoder.hpp>
#include <ac/bcs/encoder.hpp>
#include <ac/crypto/auth-key.hpp>

namespace aptos_client::crypto::ed25519 {
    using vkey = byte_array<32>;
    using skey = secure_byte_array<64>;
    using seed = secure_byte_array<32>;
    using signature_bytes = byte_array<64>;

    extern void ensure_initialized();
    extern void create(std::span<uint8_t> sk, std::span<uint8_t> vk);
    extern void create_from_seed(std::span<uint8_t> sk, std::span<uint8_t> vk, buffer sd);
    extern void sign(std::span<uint8_t> sig, buffer msg, buffer sk);
    // RFC 8032 pure Ed25519; throws crypto_error on wrong-length inputs
    extern bool verify(buffer sig, buffer vk, buffer msg);

    struct signature: signature_bytes {
        using signature_bytes::signature_bytes;

        static signature from_string(std::string_view hex);
        static signature from_bcs(bcs::decoder &dec);
        void to_bcs(bcs::encoder &enc) const;

        std::string to_string() const
        {
            return to_hex(*this);
        }
    };

    struct public_key: vkey {
        using vkey::vkey;

        static public_key from_string(std::string_view hex);
        static public_key from_bcs(bcs::decoder &dec);
        void to_bcs(bcs::encoder &enc) const;

        bool verify(const buffer msg, const signature &sig) const
        {
            return ed25519::verify(sig, *this, msg);
        }

        // SHA3-256(key || 0x00)
        authentication_key auth_key() const
        {
            return authentication_key::from_bytes_and_scheme(*this, auth_scheme::ed25519);
        }

        std::string to_string() const
        {
            return to_hex(*this);
        }
    };

    struct private_key {
        static private_key generate();
        static private_key from_seed(buffer sd);
        // accepts the AIP-80 form and, unless strict, raw hex
        static private_key from_string(std::string_view text, bool strict=false);

        signature sign(buffer msg) const;

        const public_key &pub_key() const noexcept
        {
            return _vk;
        }

        const seed &bytes() const noexcept
        {
            return _seed;
        }

        authentication_key auth_key() const
        {
            return _vk.auth_key();
        }

        // 0x-prefixed seed hex
        std::string to_hex() const;
        std::string to_aip80() const;
    private:
        seed _seed {};
        skey _sk {};
        public_key _vk {};

        private_key() =default;
    };
}

namespace fmt {
    template<>
    struct formatter<aptos_client::crypto::ed25519::public_key>: formatter<int> {
        template<typename FormatContext>
        auto format(const aptos_client::crypto::ed25519::public_key &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", v.to_string());
        }
    };

    template<>
    struct formatter<aptos_client::crypto::ed25519::signature>: formatter<int> {
        template<typename FormatContext>
        auto format(const aptos_client::crypto::ed25519::signature &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", v.to_string());
        }
    };
}

#endif // !APTOS_CLIENT_CRYPTO_ED25519_HPP

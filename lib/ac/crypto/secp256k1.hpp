/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */
#ifndef APTOS_CLIENT_CRYPTO_SECP256K1_HPP
#define APTOS_CLIENT_CRYPTO_SECP256K1_HPP

#include <ac/bcs/decoder.hpp>
#include <ac/bcs/encoder.hpp>
#include <ac/crypto/sha3.hpp>

namespace aptos_client::crypto::secp256k1 {
    using skey = secure_byte_array<32>;
    // 0x04 || X || Y
    using vkey = byte_array<65>;
    // r || s
    using signature_bytes = byte_array<64>;

    namespace ecdsa {
        // signs a 32-byte digest; the result is always low-S
        extern void sign(std::span<uint8_t> sig, buffer digest, buffer sk);
        // rejects high-S signatures; throws crypto_error on wrong-length inputs
        extern bool verify(buffer sig, buffer vk, buffer digest);
        extern void extract_vk(std::span<uint8_t> vk, buffer sk);
        extern bool valid_sk(buffer sk);
    }

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

        // verifies against SHA3-256(msg)
        bool verify(const buffer msg, const signature &sig) const
        {
            return ecdsa::verify(sig, *this, sha3::digest(msg));
        }

        std::string to_string() const
        {
            return to_hex(*this);
        }
    };

    struct private_key {
        static private_key generate();
        static private_key from_bytes(buffer bytes);
        static private_key from_string(std::string_view text, bool strict=false);

        // signs SHA3-256(msg) with a deterministic RFC 6979 nonce
        signature sign(buffer msg) const;

        const public_key &pub_key() const noexcept
        {
            return _vk;
        }

        const skey &bytes() const noexcept
        {
            return _sk;
        }

        std::string to_hex() const;
        std::string to_aip80() const;
    private:
        skey _sk {};
        public_key _vk {};

        private_key() =default;
    };
}

namespace fmt {
    template<>
    struct formatter<aptos_client::crypto::secp256k1::public_key>: formatter<int> {
        template<typename FormatContext>
        auto format(const aptos_client::crypto::secp256k1::public_key &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", v.to_string());
        }
    };

    template<>
    struct formatter<aptos_client::crypto::secp256k1::signature>: formatter<int> {
        template<typename FormatContext>
        auto format(const aptos_client::crypto::secp256k1::signature &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", v.to_string());
        }
    };
}

#endif // !APTOS_CLIENT_CRYPTO_SECP256K1_HPP

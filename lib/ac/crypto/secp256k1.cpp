/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */

extern "C" {
#   include <sodium.h>
};
#include <secp256k1.h>
#include <ac/crypto/ed25519.hpp>
#include <ac/crypto/private-key.hpp>
#include <ac/crypto/secp256k1.hpp>

namespace aptos_client::crypto::secp256k1 {
    struct context {
        static const secp256k1_context *get()
        {
            static context ctx { SECP256K1_CONTEXT_SIGN | SECP256K1_CONTEXT_VERIFY };
            return ctx.ptr();
        }

        context(const unsigned flags): _ctx { secp256k1_context_create(flags) }
        {
            if (!_ctx)
                throw crypto_error("failure to create a SECP256K1 context");
        }

        context(const context &) =delete;

        ~context()
        {
            secp256k1_context_destroy(_ctx);
        }

        const secp256k1_context *ptr()
        {
            return _ctx;
        }
    private:
        secp256k1_context *_ctx;
    };

    namespace ecdsa {
        bool valid_sk(const buffer sk)
        {
            return sk.size() == sizeof(skey) && secp256k1_ec_seckey_verify(context::get(), sk.data()) == 1;
        }

        void extract_vk(const std::span<uint8_t> vk, const buffer sk)
        {
            if (vk.size() != sizeof(vkey))
                throw crypto_error(fmt::format("ECDSA public key must have {} bytes but got {}", sizeof(vkey), vk.size()));
            if (!valid_sk(sk))
                throw crypto_error("ECDSA private key is not valid");
            secp256k1_pubkey vk_parsed;
            if (!secp256k1_ec_pubkey_create(context::get(), &vk_parsed, sk.data()))
                throw crypto_error("failed to derive an ECDSA public key");
            size_t out_len = vk.size();
            if (!secp256k1_ec_pubkey_serialize(context::get(), vk.data(), &out_len, &vk_parsed, SECP256K1_EC_UNCOMPRESSED) || out_len != vk.size())
                throw crypto_error("failed to serialize an ECDSA public key");
        }

        void sign(const std::span<uint8_t> sig, const buffer digest, const buffer sk)
        {
            if (sig.size() != sizeof(signature_bytes))
                throw crypto_error(fmt::format("ECDSA signature must have {} bytes but got {}", sizeof(signature_bytes), sig.size()));
            if (const auto exp_size = 32; digest.size() != exp_size)
                throw crypto_error(fmt::format("ECDSA message hash size must have {} bytes but got {}", exp_size, digest.size()));
            if (!valid_sk(sk))
                throw crypto_error("ECDSA private key is not valid");
            secp256k1_ecdsa_signature sig_parsed;
            if (!secp256k1_ecdsa_sign(context::get(), &sig_parsed, digest.data(), sk.data(), secp256k1_nonce_function_rfc6979, nullptr))
                throw crypto_error("failed to create an ECDSA signature");
            secp256k1_ecdsa_signature_normalize(context::get(), &sig_parsed, &sig_parsed);
            if (!secp256k1_ecdsa_signature_serialize_compact(context::get(), sig.data(), &sig_parsed))
                throw crypto_error("failed to serialize an ECDSA signature");
        }

        bool verify(const buffer sig, const buffer vk, const buffer digest)
        {
            if (const auto exp_size = 64; sig.size() != exp_size)
                throw crypto_error(fmt::format("ECDSA signature size must have {} bytes but got {}", exp_size, sig.size()));
            if (const auto exp_size = 65; vk.size() != exp_size)
                throw crypto_error(fmt::format("ECDSA public key must have {} bytes but got {}", exp_size, vk.size()));
            if (const auto exp_size = 32; digest.size() != exp_size)
                throw crypto_error(fmt::format("ECDSA message hash size must have {} bytes but got {}", exp_size, digest.size()));
            secp256k1_pubkey vk_parsed;
            if (!secp256k1_ec_pubkey_parse(context::get(), &vk_parsed, vk.data(), vk.size()))
                return false;
            secp256k1_ecdsa_signature sig_parsed;
            if (!secp256k1_ecdsa_signature_parse_compact(context::get(), &sig_parsed, sig.data()))
                return false;
            // normalize returns 1 when the input was high-S
            secp256k1_ecdsa_signature sig_low;
            if (secp256k1_ecdsa_signature_normalize(context::get(), &sig_low, &sig_parsed))
                return false;
            return secp256k1_ecdsa_verify(context::get(), &sig_parsed, digest.data(), &vk_parsed) == 1;
        }
    }

    signature signature::from_string(const std::string_view hex)
    {
        const auto bytes = bytes_from_hex(hex);
        if (bytes.size() != sizeof(signature_bytes))
            throw crypto_error(fmt::format("a secp256k1 signature must have {} bytes but got {}", sizeof(signature_bytes), bytes.size()));
        return signature { static_cast<buffer>(bytes) };
    }

    signature signature::from_bcs(bcs::decoder &dec)
    {
        signature sig {};
        const auto bytes = dec.bytes();
        if (!dec.ok())
            return sig;
        if (bytes.size() != sig.size()) {
            dec.set_error(fmt::format("a secp256k1 signature must have {} bytes but got {}", sig.size(), bytes.size()));
            return sig;
        }
        sig = static_cast<buffer>(bytes);
        return sig;
    }

    void signature::to_bcs(bcs::encoder &enc) const
    {
        enc.bytes(*this);
    }

    public_key public_key::from_string(const std::string_view hex)
    {
        const auto bytes = bytes_from_hex(hex);
        if (bytes.size() != sizeof(vkey) || bytes[0] != 0x04)
            throw crypto_error(fmt::format("a secp256k1 public key must have {} bytes and start with 0x04 but got {} bytes", sizeof(vkey), bytes.size()));
        return public_key { static_cast<buffer>(bytes) };
    }

    public_key public_key::from_bcs(bcs::decoder &dec)
    {
        public_key vk {};
        const auto bytes = dec.bytes();
        if (!dec.ok())
            return vk;
        if (bytes.size() != vk.size() || bytes[0] != 0x04) {
            dec.set_error(fmt::format("a secp256k1 public key must be {} uncompressed bytes but got {} bytes", vk.size(), bytes.size()));
            return vk;
        }
        vk = static_cast<buffer>(bytes);
        return vk;
    }

    void public_key::to_bcs(bcs::encoder &enc) const
    {
        enc.bytes(*this);
    }

    private_key private_key::generate()
    {
        private_key key {};
        ed25519::ensure_initialized();
        do {
            randombytes_buf(key._sk.data(), key._sk.size());
        } while (!ecdsa::valid_sk(key._sk));
        ecdsa::extract_vk(key._vk, key._sk);
        return key;
    }

    private_key private_key::from_bytes(const buffer bytes)
    {
        if (bytes.size() != sizeof(skey))
            throw crypto_error(fmt::format("a secp256k1 private key must have {} bytes but got {}", sizeof(skey), bytes.size()));
        private_key key {};
        key._sk = skey { bytes };
        ecdsa::extract_vk(key._vk, key._sk);
        return key;
    }

    private_key private_key::from_string(const std::string_view text, const bool strict)
    {
        auto bytes = parse_private_key(text, private_key_variant::secp256k1, strict);
        auto key = from_bytes(bytes);
        secure_clear(bytes);
        return key;
    }

    signature private_key::sign(const buffer msg) const
    {
        signature sig {};
        ecdsa::sign(sig, sha3::digest(msg), _sk);
        return sig;
    }

    std::string private_key::to_hex() const
    {
        return aptos_client::to_hex(_sk);
    }

    std::string private_key::to_aip80() const
    {
        return format_private_key(_sk, private_key_variant::secp256k1);
    }
}

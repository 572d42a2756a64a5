/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */

extern "C" {
#   include <sodium.h>
};
#include <ac/crypto/ed25519.hpp>
#include <ac/crypto/private-key.hpp>

namespace aptos_client::crypto::ed25519 {
    struct sodium_initializer {
        sodium_initializer() {
            if (sodium_init() == -1)
                throw crypto_error("Failed to initialize libsodium!");
        }
    };

    void ensure_initialized()
    {
        // will be initialized on the first call, after that do nothing
        static sodium_initializer init {};
    }

    void create(const std::span<uint8_t> sk, const std::span<uint8_t> vk)
    {
        if (sk.size() != sizeof(skey))
            throw crypto_error(fmt::format("private key must have {} bytes but got: {}!", sizeof(skey), sk.size()));
        if (vk.size() != sizeof(vkey))
            throw crypto_error(fmt::format("verification key must have {} bytes but got: {}!", sizeof(vkey), vk.size()));
        ensure_initialized();
        if (crypto_sign_keypair(vk.data(), sk.data()) != 0)
            throw crypto_error("failed to generate a cryptographic key pair!");
    }

    void create_from_seed(const std::span<uint8_t> sk, const std::span<uint8_t> vk, const buffer sd)
    {
        if (sk.size() != sizeof(skey))
            throw crypto_error(fmt::format("private key must have {} bytes but got: {}!", sizeof(skey), sk.size()));
        if (vk.size() != sizeof(vkey))
            throw crypto_error(fmt::format("verification key must have {} bytes but got: {}!", sizeof(vkey), vk.size()));
        if (sd.size() != sizeof(seed))
            throw crypto_error(fmt::format("seed must have {} bytes but got: {}!", sizeof(seed), sd.size()));
        ensure_initialized();
        if (crypto_sign_seed_keypair(vk.data(), sk.data(), sd.data()) != 0)
            throw crypto_error("failed to generate a cryptographic key pair!");
    }

    void sign(const std::span<uint8_t> sig, const buffer msg, const buffer sk)
    {
        if (sk.size() != sizeof(skey))
            throw crypto_error(fmt::format("private key must have {} bytes but got: {}!", sizeof(skey), sk.size()));
        if (sig.size() != sizeof(signature_bytes))
            throw crypto_error(fmt::format("signature buffer must have {} bytes but got: {}!", sizeof(signature_bytes), sig.size()));
        ensure_initialized();
        if (crypto_sign_detached(sig.data(), NULL, msg.data(), msg.size(), sk.data()) != 0)
            throw crypto_error("failed to cryptographically sign a message!");
    }

    bool verify(const buffer sig, const buffer vk, const buffer msg)
    {
        if (sig.size() != sizeof(signature_bytes))
            throw crypto_error(fmt::format("signature must have {} bytes but got: {}!", sizeof(signature_bytes), sig.size()));
        if (vk.size() != sizeof(vkey))
            throw crypto_error(fmt::format("public key must have {} bytes but got: {}!", sizeof(vkey), vk.size()));
        ensure_initialized();
        return crypto_sign_verify_detached(sig.data(), msg.data(), msg.size(), vk.data()) == 0;
    }

    signature signature::from_string(const std::string_view hex)
    {
        const auto bytes = bytes_from_hex(hex);
        if (bytes.size() != sizeof(signature_bytes))
            throw crypto_error(fmt::format("an ed25519 signature must have {} bytes but got {}", sizeof(signature_bytes), bytes.size()));
        return signature { static_cast<buffer>(bytes) };
    }

    signature signature::from_bcs(bcs::decoder &dec)
    {
        signature sig {};
        const auto bytes = dec.bytes();
        if (!dec.ok())
            return sig;
        if (bytes.size() != sig.size()) {
            dec.set_error(fmt::format("an ed25519 signature must have {} bytes but got {}", sig.size(), bytes.size()));
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
        if (bytes.size() != sizeof(vkey))
            throw crypto_error(fmt::format("an ed25519 public key must have {} bytes but got {}", sizeof(vkey), bytes.size()));
        return public_key { static_cast<buffer>(bytes) };
    }

    public_key public_key::from_bcs(bcs::decoder &dec)
    {
        public_key vk {};
        const auto bytes = dec.bytes();
        if (!dec.ok())
            return vk;
        if (bytes.size() != vk.size()) {
            dec.set_error(fmt::format("an ed25519 public key must have {} bytes but got {}", vk.size(), bytes.size()));
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
        ensure_initialized();
        randombytes_buf(key._seed.data(), key._seed.size());
        create_from_seed(key._sk, key._vk, key._seed);
        return key;
    }

    private_key private_key::from_seed(const buffer sd)
    {
        if (sd.size() != sizeof(seed))
            throw crypto_error(fmt::format("an ed25519 private key must have {} bytes but got {}", sizeof(seed), sd.size()));
        private_key key {};
        key._seed = seed { sd };
        create_from_seed(key._sk, key._vk, key._seed);
        return key;
    }

    private_key private_key::from_string(const std::string_view text, const bool strict)
    {
        auto bytes = parse_private_key(text, private_key_variant::ed25519, strict);
        auto key = from_seed(bytes);
        secure_clear(bytes);
        return key;
    }

    signature private_key::sign(const buffer msg) const
    {
        signature sig {};
        ed25519::sign(sig, msg, _sk);
        return sig;
    }

    std::string private_key::to_hex() const
    {
        return aptos_client::to_hex(_seed);
    }

    std::string private_key::to_aip80() const
    {
        return format_private_key(_seed, private_key_variant::ed25519);
    }
}

/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */
#ifndef APTOS_CLIENT_CRYPTO_MULTI_ED25519_HPP
#define APTOS_CLIENT_CRYPTO_MULTI_ED25519_HPP

#include <ac/crypto/bitmap.hpp>
#include <ac/crypto/ed25519.hpp>

namespace aptos_client::crypto::multi_ed25519 {
    static constexpr size_t max_keys = signer_bitmap::max_keys;

    struct signature {
        std::vector<ed25519::signature> sigs {};
        // always four bytes on the wire
        signer_bitmap bitmap {};

        // throws bitmap_error when the bitmap and the signature count disagree
        static signature from_indexed(std::vector<std::pair<uint8_t, ed25519::signature>> indexed);
        static signature from_bcs(bcs::decoder &dec);
        void to_bcs(bcs::encoder &enc) const;
        // concatenated signatures followed by the bitmap
        uint8_vector bytes() const;
        bool operator==(const signature &o) const =default;
    };

    struct public_key {
        std::vector<ed25519::public_key> keys {};
        uint8_t threshold = 0;

        // throws crypto_error when the key count or the threshold is out of range
        static public_key make(std::vector<ed25519::public_key> keys, uint8_t threshold);
        static public_key from_bcs(bcs::decoder &dec);
        void to_bcs(bcs::encoder &enc) const;
        // concatenated keys followed by the threshold
        uint8_vector bytes() const;
        // SHA3-256(bytes || 0x01)
        authentication_key auth_key() const;
        bool verify(buffer msg, const signature &sig) const;
        bool operator==(const public_key &o) const =default;
    };
}

#endif // !APTOS_CLIENT_CRYPTO_MULTI_ED25519_HPP

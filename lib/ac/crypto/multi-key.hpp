/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */
#ifndef APTOS_CLIENT_CRYPTO_MULTI_KEY_HPP
#define APTOS_CLIENT_CRYPTO_MULTI_KEY_HPP

#include <ac/crypto/any-key.hpp>
#include <ac/crypto/bitmap.hpp>

namespace aptos_client::crypto {
    struct indexed_signature {
        uint8_t index = 0;
        any_signature sig;

        static indexed_signature from_bcs(bcs::decoder &dec);
        void to_bcs(bcs::encoder &enc) const;
    };

    struct multi_key_signature {
        std::vector<any_signature> sigs {};
        // variable-length, at most four bytes
        signer_bitmap bitmap {};

        // sorts by index; throws bitmap_error on duplicate indices or indices beyond 31
        static multi_key_signature make(std::vector<indexed_signature> indexed);
        static multi_key_signature from_bcs(bcs::decoder &dec);
        void to_bcs(bcs::encoder &enc) const;
        bool operator==(const multi_key_signature &o) const =default;
    };

    struct multi_key {
        std::vector<any_public_key> keys {};
        uint8_t threshold = 0;

        static multi_key make(std::vector<any_public_key> keys, uint8_t threshold);
        static multi_key from_bcs(bcs::decoder &dec);
        void to_bcs(bcs::encoder &enc) const;
        // SHA3-256(bcs(multi_key) || 0x03)
        authentication_key auth_key() const;
        bool verify(buffer msg, const multi_key_signature &sig) const;
        bool operator==(const multi_key &o) const =default;
    };
}

#endif // !APTOS_CLIENT_CRYPTO_MULTI_KEY_HPP

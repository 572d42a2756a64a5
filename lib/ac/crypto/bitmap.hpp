/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */
#ifndef APTOS_CLIENT_CRYPTO_BITMAP_HPP
#define APTOS_CLIENT_CRYPTO_BITMAP_HPP

#include <ac/common/array.hpp>

namespace aptos_client::crypto {
    /*
     * Identifies the keys of a k-of-n scheme that produced the signatures.
     * Bit i lives in byte i / 8 counting from the most significant bit, so the indices
     * come out in ascending order, matching the order of the signatures.
     */
    struct signer_bitmap {
        static constexpr size_t max_keys = 32;
        static constexpr size_t max_bytes = max_keys / 8;

        // throws bitmap_error on duplicate or out-of-range indices
        static signer_bitmap from_indices(const std::vector<uint8_t> &indices);

        signer_bitmap() =default;

        explicit signer_bitmap(const buffer bytes): _bytes { bytes }
        {
            if (_bytes.size() > max_bytes)
                throw bitmap_error(fmt::format("a bitmap must have at most {} bytes but got {}", max_bytes, _bytes.size()));
        }

        void add(uint8_t index);
        bool contains(uint8_t index) const noexcept;
        std::vector<uint8_t> indices() const;
        size_t count() const noexcept;

        const uint8_vector &bytes() const noexcept
        {
            return _bytes;
        }

        // fixed-width form used by multi-ed25519 signatures
        byte_array<max_bytes> fixed() const;

        bool operator==(const signer_bitmap &o) const =default;
    private:
        uint8_vector _bytes {};
    };
}

#endif // !APTOS_CLIENT_CRYPTO_BITMAP_HPP

/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */

#include <bit>
#include <ac/crypto/bitmap.hpp>

namespace aptos_client::crypto {
    signer_bitmap signer_bitmap::from_indices(const std::vector<uint8_t> &indices)
    {
        signer_bitmap bm {};
        for (const auto idx: indices)
            bm.add(idx);
        return bm;
    }

    void signer_bitmap::add(const uint8_t index)
    {
        if (index >= max_keys)
            throw bitmap_error(fmt::format("signer index {} exceeds the maximum of {}", index, max_keys - 1));
        if (contains(index))
            throw bitmap_error(fmt::format("signer index {} is already in the bitmap", index));
        const size_t byte_idx = index / 8;
        if (byte_idx >= _bytes.size())
            _bytes.resize(byte_idx + 1);
        _bytes[byte_idx] |= 0x80 >> (index % 8);
    }

    bool signer_bitmap::contains(const uint8_t index) const noexcept
    {
        const size_t byte_idx = index / 8;
        if (index >= max_keys || byte_idx >= _bytes.size())
            return false;
        return (_bytes[byte_idx] & (0x80 >> (index % 8))) != 0;
    }

    std::vector<uint8_t> signer_bitmap::indices() const
    {
        std::vector<uint8_t> res {};
        for (uint8_t i = 0; i < max_keys; ++i) {
            if (contains(i))
                res.emplace_back(i);
        }
        return res;
    }

    size_t signer_bitmap::count() const noexcept
    {
        size_t cnt = 0;
        for (const auto b: _bytes)
            cnt += std::popcount(b);
        return cnt;
    }

    byte_array<signer_bitmap::max_bytes> signer_bitmap::fixed() const
    {
        byte_array<max_bytes> res {};
        std::copy(_bytes.begin(), _bytes.end(), res.begin());
        return res;
    }
}

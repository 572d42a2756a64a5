/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */

#include <ac/crypto/multi-ed25519.hpp>

namespace aptos_client::crypto::multi_ed25519 {
    signature signature::from_indexed(std::vector<std::pair<uint8_t, ed25519::signature>> indexed)
    {
        std::sort(indexed.begin(), indexed.end(), [](const auto &a, const auto &b) { return a.first < b.first; });
        signature res {};
        for (auto &&[idx, sig]: indexed) {
            res.bitmap.add(idx);
            res.sigs.emplace_back(sig);
        }
        return res;
    }

    signature signature::from_bcs(bcs::decoder &dec)
    {
        signature res {};
        const auto bytes = dec.bytes();
        if (!dec.ok())
            return res;
        static constexpr size_t sig_size = sizeof(ed25519::signature_bytes);
        if (bytes.size() < sig_size + signer_bitmap::max_bytes || (bytes.size() - signer_bitmap::max_bytes) % sig_size != 0) {
            dec.set_error(fmt::format("invalid multi-ed25519 signature size: {}", bytes.size()));
            return res;
        }
        const auto num_sigs = (bytes.size() - signer_bitmap::max_bytes) / sig_size;
        if (num_sigs > max_keys) {
            dec.set_error(fmt::format("a multi-ed25519 signature may have at most {} signatures but got {}", max_keys, num_sigs));
            return res;
        }
        const buffer data = bytes;
        for (size_t i = 0; i < num_sigs; ++i)
            res.sigs.emplace_back(data.subbuf(i * sig_size, sig_size));
        res.bitmap = signer_bitmap { data.subbuf(num_sigs * sig_size) };
        if (res.bitmap.count() != res.sigs.size())
            dec.set_error(fmt::format("the bitmap selects {} keys but there are {} signatures", res.bitmap.count(), res.sigs.size()));
        return res;
    }

    uint8_vector signature::bytes() const
    {
        uint8_vector res {};
        for (const auto &s: sigs)
            res << static_cast<buffer>(s);
        res << static_cast<buffer>(bitmap.fixed());
        return res;
    }

    void signature::to_bcs(bcs::encoder &enc) const
    {
        enc.bytes(bytes());
    }

    public_key public_key::make(std::vector<ed25519::public_key> keys, const uint8_t threshold)
    {
        if (keys.empty() || keys.size() > max_keys)
            throw crypto_error(fmt::format("a multi-ed25519 key must have between 1 and {} keys but got {}", max_keys, keys.size()));
        if (threshold == 0 || threshold > keys.size())
            throw crypto_error(fmt::format("a multi-ed25519 threshold must be between 1 and {} but got {}", keys.size(), threshold));
        return { std::move(keys), threshold };
    }

    public_key public_key::from_bcs(bcs::decoder &dec)
    {
        public_key res {};
        const auto bytes = dec.bytes();
        if (!dec.ok())
            return res;
        static constexpr size_t key_size = sizeof(ed25519::vkey);
        if (bytes.size() < key_size + 1 || (bytes.size() - 1) % key_size != 0) {
            dec.set_error(fmt::format("invalid multi-ed25519 public key size: {}", bytes.size()));
            return res;
        }
        const auto num_keys = (bytes.size() - 1) / key_size;
        const buffer data = bytes;
        for (size_t i = 0; i < num_keys; ++i)
            res.keys.emplace_back(data.subbuf(i * key_size, key_size));
        res.threshold = bytes.back();
        if (num_keys > max_keys || res.threshold == 0 || res.threshold > num_keys)
            dec.set_error(fmt::format("invalid multi-ed25519 public key: {} keys with threshold {}", num_keys, res.threshold));
        return res;
    }

    uint8_vector public_key::bytes() const
    {
        uint8_vector res {};
        for (const auto &k: keys)
            res << static_cast<buffer>(k);
        res << threshold;
        return res;
    }

    void public_key::to_bcs(bcs::encoder &enc) const
    {
        enc.bytes(bytes());
    }

    authentication_key public_key::auth_key() const
    {
        return authentication_key::from_bytes_and_scheme(bytes(), auth_scheme::multi_ed25519);
    }

    bool public_key::verify(const buffer msg, const signature &sig) const
    {
        const auto indices = sig.bitmap.indices();
        if (indices.size() != sig.sigs.size() || indices.size() < threshold)
            return false;
        size_t verified = 0;
        for (size_t i = 0; i < indices.size(); ++i) {
            if (indices[i] >= keys.size())
                return false;
            if (keys[indices[i]].verify(msg, sig.sigs[i]))
                ++verified;
        }
        return verified >= threshold;
    }
}

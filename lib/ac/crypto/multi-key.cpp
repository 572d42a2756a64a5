/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */

#include <ac/bcs.hpp>
#include <ac/crypto/multi-key.hpp>

namespace aptos_client::crypto {
    indexed_signature indexed_signature::from_bcs(bcs::decoder &dec)
    {
        const auto index = dec.u8();
        return { index, any_signature::from_bcs(dec) };
    }

    void indexed_signature::to_bcs(bcs::encoder &enc) const
    {
        enc.u8(index).obj(sig);
    }

    multi_key_signature multi_key_signature::make(std::vector<indexed_signature> indexed)
    {
        std::sort(indexed.begin(), indexed.end(), [](const auto &a, const auto &b) { return a.index < b.index; });
        multi_key_signature res {};
        for (auto &is: indexed) {
            res.bitmap.add(is.index);
            res.sigs.emplace_back(std::move(is.sig));
        }
        return res;
    }

    multi_key_signature multi_key_signature::from_bcs(bcs::decoder &dec)
    {
        multi_key_signature res {};
        res.sigs = dec.seq<any_signature>();
        const auto bm = dec.bytes();
        if (!dec.ok())
            return res;
        if (res.sigs.size() > signer_bitmap::max_keys || bm.size() > signer_bitmap::max_bytes) {
            dec.set_error(fmt::format("a multi-key signature may have at most {} signatures and {} bitmap bytes",
                signer_bitmap::max_keys, signer_bitmap::max_bytes));
            return res;
        }
        res.bitmap = signer_bitmap { bm };
        if (res.bitmap.count() != res.sigs.size())
            dec.set_error(fmt::format("the bitmap selects {} keys but there are {} signatures", res.bitmap.count(), res.sigs.size()));
        return res;
    }

    void multi_key_signature::to_bcs(bcs::encoder &enc) const
    {
        enc.seq(sigs).bytes(bitmap.bytes());
    }

    multi_key multi_key::make(std::vector<any_public_key> keys, const uint8_t threshold)
    {
        if (keys.empty() || keys.size() > signer_bitmap::max_keys)
            throw crypto_error(fmt::format("a multi-key must have between 1 and {} keys but got {}", signer_bitmap::max_keys, keys.size()));
        if (threshold == 0 || threshold > keys.size())
            throw crypto_error(fmt::format("a multi-key threshold must be between 1 and {} but got {}", keys.size(), threshold));
        return { std::move(keys), threshold };
    }

    multi_key multi_key::from_bcs(bcs::decoder &dec)
    {
        multi_key res {};
        res.keys = dec.seq<any_public_key>();
        res.threshold = dec.u8();
        if (dec.ok() && res.keys.size() > signer_bitmap::max_keys)
            dec.set_error(fmt::format("a multi-key may have at most {} keys but got {}", signer_bitmap::max_keys, res.keys.size()));
        return res;
    }

    void multi_key::to_bcs(bcs::encoder &enc) const
    {
        enc.seq(keys).u8(threshold);
    }

    authentication_key multi_key::auth_key() const
    {
        return authentication_key::from_bytes_and_scheme(bcs::serialize(*this), auth_scheme::multi_key);
    }

    bool multi_key::verify(const buffer msg, const multi_key_signature &sig) const
    {
        if (sig.bitmap.bytes().size() > (keys.size() + 7) / 8)
            return false;
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

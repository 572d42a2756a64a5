/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */

#include <ac/bcs.hpp>
#include <ac/crypto/any-key.hpp>

namespace aptos_client::crypto {
    secp256r1_public_key secp256r1_public_key::from_bcs(bcs::decoder &dec)
    {
        secp256r1_public_key vk {};
        const auto bytes = dec.bytes();
        if (!dec.ok())
            return vk;
        if (bytes.size() != vk.size()) {
            dec.set_error(fmt::format("a secp256r1 public key must have {} bytes but got {}", vk.size(), bytes.size()));
            return vk;
        }
        vk = static_cast<buffer>(bytes);
        return vk;
    }

    void secp256r1_public_key::to_bcs(bcs::encoder &enc) const
    {
        enc.bytes(*this);
    }

    keyless_public_key keyless_public_key::from_bcs(bcs::decoder &dec)
    {
        keyless_public_key vk {};
        vk.iss_val = dec.str();
        const auto idc = dec.bytes();
        if (!dec.ok())
            return vk;
        if (idc.size() != vk.idc.size()) {
            dec.set_error(fmt::format("a keyless identity commitment must have {} bytes but got {}", vk.idc.size(), idc.size()));
            return vk;
        }
        vk.idc = static_cast<buffer>(idc);
        return vk;
    }

    void keyless_public_key::to_bcs(bcs::encoder &enc) const
    {
        enc.str(iss_val).bytes(idc);
    }

    any_signature any_signature::from_bcs(bcs::decoder &dec)
    {
        switch (const auto typ = static_cast<variant_type>(dec.variant()); typ) {
            case variant_type::ed25519: return { ed25519::signature::from_bcs(dec) };
            case variant_type::secp256k1: return { secp256k1::signature::from_bcs(dec) };
            default:
                if (dec.ok())
                    dec.set_error(fmt::format("unsupported signature variant: {}", static_cast<uint32_t>(typ)));
                return {};
        }
    }

    void any_signature::to_bcs(bcs::encoder &enc) const
    {
        enc.variant(static_cast<uint32_t>(variant()));
        std::visit([&enc](const auto &v) { v.to_bcs(enc); }, val);
    }

    any_signature::variant_type any_signature::variant() const
    {
        switch (val.index()) {
            case 0: return variant_type::ed25519;
            case 1: return variant_type::secp256k1;
            default: throw crypto_error(fmt::format("unsupported signature type index: {}", val.index()));
        }
    }

    any_public_key any_public_key::from_bcs(bcs::decoder &dec)
    {
        switch (const auto typ = static_cast<variant_type>(dec.variant()); typ) {
            case variant_type::ed25519: return { ed25519::public_key::from_bcs(dec) };
            case variant_type::secp256k1: return { secp256k1::public_key::from_bcs(dec) };
            case variant_type::secp256r1: return { secp256r1_public_key::from_bcs(dec) };
            case variant_type::keyless: return { keyless_public_key::from_bcs(dec) };
            default:
                if (dec.ok())
                    dec.set_error(fmt::format("unsupported public key variant: {}", static_cast<uint32_t>(typ)));
                return {};
        }
    }

    void any_public_key::to_bcs(bcs::encoder &enc) const
    {
        enc.variant(static_cast<uint32_t>(variant()));
        std::visit([&enc](const auto &v) { v.to_bcs(enc); }, val);
    }

    any_public_key::variant_type any_public_key::variant() const
    {
        switch (val.index()) {
            case 0: return variant_type::ed25519;
            case 1: return variant_type::secp256k1;
            case 2: return variant_type::secp256r1;
            case 3: return variant_type::keyless;
            default: throw crypto_error(fmt::format("unsupported public key type index: {}", val.index()));
        }
    }

    bool any_public_key::verify(const buffer msg, const any_signature &sig) const
    {
        if (const auto *vk = std::get_if<ed25519::public_key>(&val); vk) {
            if (const auto *s = std::get_if<ed25519::signature>(&sig.val); s)
                return vk->verify(msg, *s);
            return false;
        }
        if (const auto *vk = std::get_if<secp256k1::public_key>(&val); vk) {
            if (const auto *s = std::get_if<secp256k1::signature>(&sig.val); s)
                return vk->verify(msg, *s);
            return false;
        }
        return false;
    }

    authentication_key any_public_key::auth_key() const
    {
        return authentication_key::from_bytes_and_scheme(bcs::serialize(*this), auth_scheme::single_key);
    }
}

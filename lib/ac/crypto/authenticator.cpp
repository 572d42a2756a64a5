/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */

#include <ac/crypto/authenticator.hpp>

namespace aptos_client::crypto {
    account_authenticator account_authenticator::from_bcs(bcs::decoder &dec)
    {
        switch (const auto typ = static_cast<variant_type>(dec.variant()); typ) {
            case variant_type::ed25519: return { ed25519_authenticator::from_bcs(dec) };
            case variant_type::multi_ed25519: return { multi_ed25519_authenticator::from_bcs(dec) };
            case variant_type::single_key: return { single_key_authenticator::from_bcs(dec) };
            case variant_type::multi_key: return { multi_key_authenticator::from_bcs(dec) };
            case variant_type::none: return { none_authenticator {} };
            default:
                if (dec.ok())
                    dec.set_error(fmt::format("unknown account authenticator variant: {}", static_cast<uint32_t>(typ)));
                return { none_authenticator {} };
        }
    }

    void account_authenticator::to_bcs(bcs::encoder &enc) const
    {
        enc.variant(static_cast<uint32_t>(variant()));
        std::visit([&enc](const auto &v) { v.to_bcs(enc); }, val);
    }

    account_authenticator::variant_type account_authenticator::variant() const
    {
        return static_cast<variant_type>(val.index());
    }

    bool account_authenticator::verify(const buffer msg) const
    {
        return std::visit([msg](const auto &v) { return v.verify(msg); }, val);
    }

    authentication_key account_authenticator::auth_key() const
    {
        return std::visit([](const auto &v) -> authentication_key {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, none_authenticator>) {
                throw crypto_error("the None authenticator has no authentication key");
            } else {
                return v.pub_key.auth_key();
            }
        }, val);
    }
}

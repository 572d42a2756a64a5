/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */
#ifndef APTOS_CLIENT_CRYPTO_AUTHENTICATOR_HPP
#define APTOS_CLIENT_CRYPTO_AUTHENTICATOR_HPP

#include <ac/crypto/multi-ed25519.hpp>
#include <ac/crypto/multi-key.hpp>

namespace aptos_client::crypto {
    template<typename K, typename S>
    struct key_signature_pair {
        K pub_key {};
        S sig {};

        static key_signature_pair from_bcs(bcs::decoder &dec)
        {
            auto pub_key = K::from_bcs(dec);
            if (!dec.ok())
                return { std::move(pub_key), S {} };
            return { std::move(pub_key), S::from_bcs(dec) };
        }

        void to_bcs(bcs::encoder &enc) const
        {
            pub_key.to_bcs(enc);
            sig.to_bcs(enc);
        }

        bool verify(const buffer msg) const
        {
            return pub_key.verify(msg, sig);
        }

        bool operator==(const key_signature_pair &o) const =default;
    };

    using ed25519_authenticator = key_signature_pair<ed25519::public_key, ed25519::signature>;
    using multi_ed25519_authenticator = key_signature_pair<multi_ed25519::public_key, multi_ed25519::signature>;
    using single_key_authenticator = key_signature_pair<any_public_key, any_signature>;
    using multi_key_authenticator = key_signature_pair<multi_key, multi_key_signature>;

    // Reserves a signer slot in simulations and for fee payers unknown at signing time
    struct none_authenticator {
        static none_authenticator from_bcs(bcs::decoder &)
        {
            return {};
        }

        void to_bcs(bcs::encoder &) const
        {
        }

        bool verify(const buffer) const
        {
            return false;
        }

        bool operator==(const none_authenticator &) const =default;
    };

    struct account_authenticator {
        enum class variant_type: uint32_t {
            ed25519 = 0,
            multi_ed25519 = 1,
            single_key = 2,
            multi_key = 3,
            none = 4
        };
        using value_type = std::variant<ed25519_authenticator, multi_ed25519_authenticator,
            single_key_authenticator, multi_key_authenticator, none_authenticator>;

        value_type val;

        static account_authenticator from_bcs(bcs::decoder &dec);
        void to_bcs(bcs::encoder &enc) const;
        variant_type variant() const;
        // never throws for well-formed authenticators; None never verifies
        bool verify(buffer msg) const;
        // throws crypto_error for None
        authentication_key auth_key() const;
        bool operator==(const account_authenticator &o) const =default;
    };
}

namespace fmt {
    template<>
    struct formatter<aptos_client::crypto::account_authenticator::variant_type>: formatter<int> {
        template<typename FormatContext>
        auto format(const aptos_client::crypto::account_authenticator::variant_type &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            using aptos_client::crypto::account_authenticator;
            switch (v) {
                case account_authenticator::variant_type::ed25519: return fmt::format_to(ctx.out(), "ed25519");
                case account_authenticator::variant_type::multi_ed25519: return fmt::format_to(ctx.out(), "multi_ed25519");
                case account_authenticator::variant_type::single_key: return fmt::format_to(ctx.out(), "single_key");
                case account_authenticator::variant_type::multi_key: return fmt::format_to(ctx.out(), "multi_key");
                case account_authenticator::variant_type::none: return fmt::format_to(ctx.out(), "none");
                default: return fmt::format_to(ctx.out(), "unknown({})", static_cast<uint32_t>(v));
            }
        }
    };
}

#endif // !APTOS_CLIENT_CRYPTO_AUTHENTICATOR_HPP

/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */
#ifndef APTOS_CLIENT_CRYPTO_SIGNER_HPP
#define APTOS_CLIENT_CRYPTO_SIGNER_HPP

#include <memory>
#include <ac/crypto/authenticator.hpp>

namespace aptos_client::crypto {
    /*
     * Produces account authenticators over arbitrary messages.
     * Implementations are immutable and can be shared between threads.
     */
    struct signer {
        virtual ~signer() =default;

        [[nodiscard]] account_authenticator sign(const buffer msg) const
        {
            return _sign_impl(msg);
        }

        // the bare signature without the public key
        [[nodiscard]] any_signature sign_message(const buffer msg) const
        {
            return _sign_message_impl(msg);
        }

        // the true public key with a zero signature, accepted by nodes for simulation only
        [[nodiscard]] account_authenticator simulation_authenticator() const
        {
            return _simulation_authenticator_impl();
        }

        [[nodiscard]] any_public_key public_key() const
        {
            return _public_key_impl();
        }

        [[nodiscard]] authentication_key auth_key() const
        {
            return _auth_key_impl();
        }
    private:
        virtual account_authenticator _sign_impl(buffer msg) const =0;
        virtual any_signature _sign_message_impl(buffer msg) const =0;
        virtual account_authenticator _simulation_authenticator_impl() const =0;
        virtual any_public_key _public_key_impl() const =0;
        virtual authentication_key _auth_key_impl() const =0;
    };

    using signer_ptr = std::shared_ptr<const signer>;

    // Produces legacy Ed25519 authenticators
    struct ed25519_signer: signer {
        explicit ed25519_signer(ed25519::private_key sk): _sk { std::move(sk) }
        {
        }

        const ed25519::private_key &private_key() const noexcept
        {
            return _sk;
        }
    private:
        const ed25519::private_key _sk;

        account_authenticator _sign_impl(buffer msg) const override;
        any_signature _sign_message_impl(buffer msg) const override;
        account_authenticator _simulation_authenticator_impl() const override;
        any_public_key _public_key_impl() const override;
        authentication_key _auth_key_impl() const override;
    };

    // Produces SingleKey authenticators for an Ed25519 or a Secp256k1 key
    struct single_key_signer: signer {
        using key_type = std::variant<ed25519::private_key, secp256k1::private_key>;

        explicit single_key_signer(key_type sk): _sk { std::move(sk) }
        {
        }

        const key_type &private_key() const noexcept
        {
            return _sk;
        }
    private:
        const key_type _sk;

        account_authenticator _sign_impl(buffer msg) const override;
        any_signature _sign_message_impl(buffer msg) const override;
        account_authenticator _simulation_authenticator_impl() const override;
        any_public_key _public_key_impl() const override;
        authentication_key _auth_key_impl() const override;
    };
}

#endif // !APTOS_CLIENT_CRYPTO_SIGNER_HPP

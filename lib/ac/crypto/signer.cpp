/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */

#include <ac/crypto/signer.hpp>

namespace aptos_client::crypto {
    account_authenticator ed25519_signer::_sign_impl(const buffer msg) const
    {
        return { ed25519_authenticator { _sk.pub_key(), _sk.sign(msg) } };
    }

    any_signature ed25519_signer::_sign_message_impl(const buffer msg) const
    {
        return { _sk.sign(msg) };
    }

    account_authenticator ed25519_signer::_simulation_authenticator_impl() const
    {
        return { ed25519_authenticator { _sk.pub_key(), ed25519::signature {} } };
    }

    any_public_key ed25519_signer::_public_key_impl() const
    {
        return { _sk.pub_key() };
    }

    authentication_key ed25519_signer::_auth_key_impl() const
    {
        return _sk.auth_key();
    }

    account_authenticator single_key_signer::_sign_impl(const buffer msg) const
    {
        return { single_key_authenticator { _public_key_impl(), _sign_message_impl(msg) } };
    }

    any_signature single_key_signer::_sign_message_impl(const buffer msg) const
    {
        return std::visit([msg](const auto &sk) { return any_signature { sk.sign(msg) }; }, _sk);
    }

    account_authenticator single_key_signer::_simulation_authenticator_impl() const
    {
        auto zero_sig = std::visit([](const auto &sk) {
            using T = std::decay_t<decltype(sk)>;
            if constexpr (std::is_same_v<T, ed25519::private_key>)
                return any_signature { ed25519::signature {} };
            else
                return any_signature { secp256k1::signature {} };
        }, _sk);
        return { single_key_authenticator { _public_key_impl(), std::move(zero_sig) } };
    }

    any_public_key single_key_signer::_public_key_impl() const
    {
        return std::visit([](const auto &sk) { return any_public_key { sk.pub_key() }; }, _sk);
    }

    authentication_key single_key_signer::_auth_key_impl() const
    {
        return _public_key_impl().auth_key();
    }
}

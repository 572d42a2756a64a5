/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */
#ifndef APTOS_CLIENT_ACCOUNT_HPP
#define APTOS_CLIENT_ACCOUNT_HPP

#include <optional>
#include <ac/crypto/signer.hpp>
#include <ac/move/address.hpp>

namespace aptos_client {
    /*
     * An on-chain address together with the signer that controls it.
     * A fresh account's address equals its authentication key; after a key rotation
     * the address must be given explicitly.
     */
    struct account {
        static account generate_ed25519();
        static account generate_single_key_ed25519();
        static account generate_secp256k1();
        static account from_ed25519(const crypto::ed25519::private_key &sk);
        static account from_secp256k1(const crypto::secp256k1::private_key &sk);
        // address defaults to the signer's authentication key
        static account from_signer(crypto::signer_ptr signer, std::optional<move::address> addr={});

        const move::address &address() const noexcept
        {
            return _address;
        }

        const crypto::signer &signer() const noexcept
        {
            return *_signer;
        }

        const crypto::signer_ptr &signer_ptr() const noexcept
        {
            return _signer;
        }

        crypto::authentication_key auth_key() const
        {
            return _signer->auth_key();
        }

        crypto::account_authenticator sign(const buffer msg) const
        {
            return _signer->sign(msg);
        }
    private:
        move::address _address;
        crypto::signer_ptr _signer;

        account(const move::address &addr, crypto::signer_ptr signer):
            _address { addr }, _signer { std::move(signer) }
        {
        }
    };
}

#endif // !APTOS_CLIENT_ACCOUNT_HPP

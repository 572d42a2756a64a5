/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */

#include <ac/account.hpp>

namespace aptos_client {
    account account::generate_ed25519()
    {
        return from_ed25519(crypto::ed25519::private_key::generate());
    }

    account account::generate_single_key_ed25519()
    {
        return from_signer(std::make_shared<crypto::single_key_signer>(crypto::ed25519::private_key::generate()));
    }

    account account::generate_secp256k1()
    {
        return from_secp256k1(crypto::secp256k1::private_key::generate());
    }

    account account::from_ed25519(const crypto::ed25519::private_key &sk)
    {
        return from_signer(std::make_shared<crypto::ed25519_signer>(sk));
    }

    account account::from_secp256k1(const crypto::secp256k1::private_key &sk)
    {
        return from_signer(std::make_shared<crypto::single_key_signer>(sk));
    }

    account account::from_signer(crypto::signer_ptr signer, std::optional<move::address> addr)
    {
        if (!signer)
            throw error("an account requires a signer");
        if (!addr)
            addr = move::address::from_auth_key(signer->auth_key());
        return { *addr, std::move(signer) };
    }
}

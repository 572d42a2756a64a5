/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */
#ifndef APTOS_CLIENT_CRYPTO_SHA3_HPP
#define APTOS_CLIENT_CRYPTO_SHA3_HPP

#include <initializer_list>
#include <ac/common/array.hpp>

namespace aptos_client::crypto::sha3 {
    using hash_256 = byte_array<32>;

    extern void digest(std::span<uint8_t> out, std::initializer_list<buffer> parts);

    inline hash_256 digest(const buffer in)
    {
        hash_256 out {};
        digest(out, { in });
        return out;
    }

    // hashes the concatenation of the parts without materializing it
    inline hash_256 digest(const std::initializer_list<buffer> parts)
    {
        hash_256 out {};
        digest(out, parts);
        return out;
    }
}

#endif // !APTOS_CLIENT_CRYPTO_SHA3_HPP

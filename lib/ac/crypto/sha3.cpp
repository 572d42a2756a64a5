/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */

#include <hash-library/sha3.h>
#include <ac/crypto/sha3.hpp>

namespace aptos_client::crypto::sha3 {
    void digest(const std::span<uint8_t> out, const std::initializer_list<buffer> parts)
    {
        if (out.size() != sizeof(hash_256)) [[unlikely]]
            throw crypto_error(fmt::format("SHA3-256 output buffer must have {} bytes but got {}", sizeof(hash_256), out.size()));
        SHA3 sha3 { SHA3::Bits256 };
        for (const auto &part: parts)
            sha3.add(part.data(), part.size());
        init_from_hex(out, sha3.getHash());
    }
}

/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */
#ifndef APTOS_CLIENT_CRYPTO_PRIVATE_KEY_HPP
#define APTOS_CLIENT_CRYPTO_PRIVATE_KEY_HPP

#include <ac/common/bytes.hpp>

namespace aptos_client::crypto {
    enum class private_key_variant {
        ed25519,
        secp256k1
    };

    // AIP-80 scheme prefixes: "ed25519-priv-" and "secp256k1-priv-"
    extern std::string_view aip80_prefix(private_key_variant variant);
    // prefix + 0x + lowercase hex
    extern std::string format_private_key(buffer key, private_key_variant variant);
    /*
     * Accepts "<prefix>0x<hex>". Unless strict, raw hex with an optional 0x is accepted as well
     * and the AIP-80 recommendation is logged. Throws crypto_error.
     */
    extern uint8_vector parse_private_key(std::string_view text, private_key_variant variant, bool strict=false);
}

#endif // !APTOS_CLIENT_CRYPTO_PRIVATE_KEY_HPP

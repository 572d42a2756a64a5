/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */

#include <cctype>
#include <ac/crypto/private-key.hpp>
#include <ac/logger.hpp>

namespace aptos_client::crypto {
    namespace {
        static uint8_vector parse_key_hex(const std::string_view hex)
        {
            const auto digits = strip_hex_prefix(hex);
            if (digits.empty() || digits.size() % 2 != 0)
                throw crypto_error(fmt::format("a private key must have an even non-zero number of hex digits but got {}", digits.size()));
            if (!std::all_of(digits.begin(), digits.end(), [](const char c) { return std::isxdigit(static_cast<unsigned char>(c)); }))
                throw crypto_error("a private key contains non-hex characters");
            return uint8_vector::from_hex(digits);
        }
    }

    std::string_view aip80_prefix(const private_key_variant variant)
    {
        switch (variant) {
            case private_key_variant::ed25519: return "ed25519-priv-";
            case private_key_variant::secp256k1: return "secp256k1-priv-";
            default: throw crypto_error(fmt::format("unsupported private key variant: {}", static_cast<int>(variant)));
        }
    }

    std::string format_private_key(const buffer key, const private_key_variant variant)
    {
        return fmt::format("{}{}", aip80_prefix(variant), to_hex(key));
    }

    uint8_vector parse_private_key(const std::string_view text, const private_key_variant variant, const bool strict)
    {
        const auto prefix = aip80_prefix(variant);
        if (text.starts_with(prefix)) {
            const auto hex = text.substr(prefix.size());
            if (!hex.starts_with("0x"))
                throw crypto_error(fmt::format("an AIP-80 private key must continue with 0x after {}", prefix));
            return parse_key_hex(hex);
        }
        if (strict)
            throw crypto_error(fmt::format("a private key must be AIP-80 compliant and start with {}", prefix));
        auto bytes = parse_key_hex(text);
        logger::info("it is recommended that private keys are AIP-80 compliant (https://github.com/aptos-foundation/AIPs/blob/main/aips/aip-80.md)");
        return bytes;
    }
}

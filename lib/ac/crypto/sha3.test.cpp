/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */

#include <ac/common/test.hpp>
#include <ac/crypto/sha3.hpp>

using namespace aptos_client;
using namespace aptos_client::crypto;

suite crypto_sha3_suite = [] {
    "crypto::sha3"_test = [] {
        "vectors"_test = [] {
            test_hex("a7ffc6f8bf1ed76651c14756a061d662f580ff4de43b49fa82d80a4b80f8434a", sha3::digest(buffer {}));
            test_hex("3a985da74fe225b2045c172d6bd390bd855f086e3e9d525b46bfe24511431532", sha3::digest(buffer { std::string_view { "abc" } }));
        };
        "parts"_test = [] {
            const auto whole = sha3::digest(buffer { std::string_view { "APTOS::RawTransaction" } });
            const auto parts = sha3::digest({ buffer { std::string_view { "APTOS::" } }, buffer { std::string_view { "RawTransaction" } } });
            expect(whole == parts);
        };
        "output size"_test = [] {
            std::array<uint8_t, 16> out {};
            expect(throws<crypto_error>([&] { sha3::digest(out, { buffer { std::string_view { "abc" } } }); }));
        };
    };
};

/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */

#include <ac/common/test.hpp>
#include <ac/bcs.hpp>
#include <ac/crypto/ed25519.hpp>

using namespace aptos_client;
using namespace aptos_client::crypto;

suite crypto_ed25519_suite = [] {
    "crypto::ed25519"_test = [] {
        static const std::string_view priv_aip80 { "ed25519-priv-0xc5338cd251c22daa8c9c9cc94f498cc8a5c7e1d2e75287a5dda91096fe64efa5" };
        static const std::string_view priv_hex { "0xc5338cd251c22daa8c9c9cc94f498cc8a5c7e1d2e75287a5dda91096fe64efa5" };
        static const std::string_view pub_hex { "0xde19e5d1880cac87d57484ce9ed2e84cf0f9599f12e7cc3a52e4e7657a763f2c" };
        static const std::string_view auth_key_hex { "0x978c213990c4833df71548df7ce49d54c759d6b6d932de22b24d56060b7af2aa" };
        static const std::string_view sig_hex { "0x9e653d56a09247570bb174a389e85b9226abd5c403ea6c504b386626a145158cd4efd66fc5e071c0e19538a96a05ddbda24d3c51e1e6a9dacc6bb1ce775cce07" };
        static const std::string_view msg { "hello world" };

        "known keys"_test = [] {
            const auto sk = ed25519::private_key::from_string(priv_aip80, true);
            test_same(std::string { priv_hex }, sk.to_hex());
            test_same(std::string { priv_aip80 }, sk.to_aip80());
            test_same(std::string { pub_hex }, sk.pub_key().to_string());
            test_same(std::string { auth_key_hex }, sk.auth_key().to_string());
            test_same(sk.auth_key(), authentication_key::from_bytes_and_scheme(sk.pub_key(), auth_scheme::ed25519));
            test_same(ed25519::public_key::from_string(pub_hex), sk.pub_key());
        };
        "known signature"_test = [] {
            const auto sk = ed25519::private_key::from_string(priv_hex);
            const auto sig = sk.sign(buffer { msg });
            test_same(std::string { sig_hex }, sig.to_string());
            expect(sk.pub_key().verify(buffer { msg }, sig));
            expect(!sk.pub_key().verify(buffer { std::string_view { "hello world!" } }, sig));
            auto tampered = sig;
            tampered[0] ^= 0x01;
            expect(!sk.pub_key().verify(buffer { msg }, tampered));
        };
        "generated keys"_test = [] {
            const auto sk1 = ed25519::private_key::generate();
            const auto sk2 = ed25519::private_key::generate();
            expect(sk1.pub_key() != sk2.pub_key());
            const auto sig = sk1.sign(buffer { msg });
            expect(sk1.pub_key().verify(buffer { msg }, sig));
            expect(!sk2.pub_key().verify(buffer { msg }, sig));
            test_same(sk1.pub_key(), ed25519::private_key::from_seed(sk1.bytes()).pub_key());
        };
        "bcs"_test = [] {
            const auto vk = ed25519::public_key::from_string(pub_hex);
            const auto data = bcs::serialize(vk);
            test_same(size_t { 33 }, data.size());
            test_same(uint8_t { 0x20 }, data[0]);
            test_same(vk, bcs::deserialize<ed25519::public_key>(data));
            const auto sig = ed25519::signature::from_string(sig_hex);
            const auto sig_data = bcs::serialize(sig);
            test_same(uint8_t { 0x40 }, sig_data[0]);
            test_same(sig, bcs::deserialize<ed25519::signature>(sig_data));
            expect(throws<bcs::error>([] { bcs::deserialize<ed25519::public_key>(uint8_vector::from_hex("020102")); }));
            expect(throws<bcs::error>([] { bcs::deserialize<ed25519::signature>(uint8_vector::from_hex("0101")); }));
        };
        "wrong lengths"_test = [] {
            expect(throws<crypto_error>([] { ed25519::private_key::from_seed(uint8_vector { 0x01 }); }));
            expect(throws<crypto_error>([] { ed25519::public_key::from_string("0x01"); }));
            expect(throws<crypto_error>([] { ed25519::signature::from_string("0x01"); }));
            expect(throws<crypto_error>([] { ed25519::verify(uint8_vector { 0x01 }, uint8_vector(32), uint8_vector {}); }));
        };
    };
};

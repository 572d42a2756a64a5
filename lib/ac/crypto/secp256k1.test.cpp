/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */

#include <ac/common/test.hpp>
#include <ac/bcs.hpp>
#include <ac/crypto/any-key.hpp>
#include <ac/crypto/secp256k1.hpp>

using namespace aptos_client;
using namespace aptos_client::crypto;

suite crypto_secp256k1_suite = [] {
    "crypto::secp256k1"_test = [] {
        static const std::string_view priv_hex { "0xd107155adf816a0a94c6db3c9489c13ad8a1eda7ada2e558ba3bfa47c020347e" };
        static const std::string_view pub_hex { "0x04acdd16651b839c24665b7e2033b55225f384554949fef46c397b5275f37f6ee95554d70fb5d9f93c5831ebf695c7206e7477ce708f03ae9bb2862dc6c9e033ea" };
        static const std::string_view auth_key_hex { "0x5792c985bc96f436270bd2a3c692210b09c7febb8889345ceefdbae4bacfe498" };
        static const std::string_view sig_hex { "0xd0d634e843b61339473b028105930ace022980708b2855954b977da09df84a770c0b68c29c8ca1b5409a5085b0ec263be80e433c83fcf6debb82f3447e71edca" };
        static const std::string_view msg { "hello world" };

        "known keys"_test = [] {
            const auto sk = secp256k1::private_key::from_string(priv_hex);
            test_same(std::string { priv_hex }, sk.to_hex());
            test_same(fmt::format("secp256k1-priv-{}", priv_hex), sk.to_aip80());
            test_same(std::string { pub_hex }, sk.pub_key().to_string());
            const any_public_key any_vk { sk.pub_key() };
            test_same(std::string { auth_key_hex }, any_vk.auth_key().to_string());
        };
        "known signature"_test = [] {
            const auto sk = secp256k1::private_key::from_string(fmt::format("secp256k1-priv-{}", priv_hex), true);
            const auto sig = sk.sign(buffer { msg });
            test_same(std::string { sig_hex }, sig.to_string());
            expect(sk.pub_key().verify(buffer { msg }, sig));
            expect(!sk.pub_key().verify(buffer { std::string_view { "hello world!" } }, sig));
        };
        "high-S signatures are rejected"_test = [] {
            const auto sk = secp256k1::private_key::generate();
            const auto sig = sk.sign(buffer { msg });
            expect(sk.pub_key().verify(buffer { msg }, sig));
            // s' = n - s has the same validity but is high-S
            const cpp_int n { "0xFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFEBAAEDCE6AF48A03BBFD25E8CD0364141" };
            cpp_int s = 0;
            for (size_t i = 32; i < 64; ++i)
                s = (s << 8) | sig[i];
            cpp_int high_s = n - s;
            auto high_sig = sig;
            for (size_t i = 64; i > 32; --i) {
                high_sig[i - 1] = static_cast<uint8_t>(high_s & 0xFF);
                high_s >>= 8;
            }
            expect(!sk.pub_key().verify(buffer { msg }, high_sig));
        };
        "bcs"_test = [] {
            const auto vk = secp256k1::public_key::from_string(pub_hex);
            const auto data = bcs::serialize(vk);
            test_same(size_t { 66 }, data.size());
            test_same(uint8_t { 65 }, data[0]);
            test_same(vk, bcs::deserialize<secp256k1::public_key>(data));
            const any_public_key any_vk { vk };
            test_hex(fmt::format("0141{}", strip_hex_prefix(pub_hex)), bcs::serialize(any_vk));
            expect(any_vk == bcs::deserialize<any_public_key>(bcs::serialize(any_vk)));
            const auto sig = secp256k1::signature::from_string(sig_hex);
            test_same(sig, bcs::deserialize<secp256k1::signature>(bcs::serialize(sig)));
        };
        "wrong lengths"_test = [] {
            expect(throws<crypto_error>([] { secp256k1::private_key::from_bytes(uint8_vector { 0x01 }); }));
            expect(throws<crypto_error>([] { secp256k1::private_key::from_bytes(uint8_vector(32)); })) << "zero is not a valid key";
            expect(throws<crypto_error>([] { secp256k1::public_key::from_string("0x02"); }));
            expect(throws<crypto_error>([] { secp256k1::signature::from_string("0x0102"); }));
        };
        "mismatched signature kinds"_test = [] {
            const auto sk = secp256k1::private_key::generate();
            const any_public_key any_vk { sk.pub_key() };
            const any_signature ed_sig { ed25519::signature {} };
            expect(!any_vk.verify(buffer { msg }, ed_sig));
            const any_signature sig { sk.sign(buffer { msg }) };
            expect(any_vk.verify(buffer { msg }, sig));
        };
    };
};

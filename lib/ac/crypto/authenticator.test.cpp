/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */

#include <ac/common/test.hpp>
#include <ac/bcs.hpp>
#include <ac/crypto/authenticator.hpp>
#include <ac/crypto/private-key.hpp>

using namespace aptos_client;
using namespace aptos_client::crypto;

suite crypto_authenticator_suite = [] {
    "crypto::account_authenticator"_test = [] {
        static const std::string_view msg { "authenticated message" };
        const auto ed_sk = ed25519::private_key::generate();
        const auto k1_sk = secp256k1::private_key::generate();

        "ed25519"_test = [&] {
            const account_authenticator auth { ed25519_authenticator { ed_sk.pub_key(), ed_sk.sign(buffer { msg }) } };
            test_same(account_authenticator::variant_type::ed25519, auth.variant());
            expect(auth.verify(buffer { msg }));
            expect(!auth.verify(buffer { std::string_view { "tampered" } }));
            test_same(ed_sk.auth_key(), auth.auth_key());
            const auto data = bcs::serialize(auth);
            test_same(size_t { 1 + 1 + 32 + 1 + 64 }, data.size());
            test_same(uint8_t { 0 }, data[0]);
            expect(auth == bcs::deserialize<account_authenticator>(data));
        };
        "multi_ed25519"_test = [&] {
            const auto sk2 = ed25519::private_key::generate();
            const auto vk = multi_ed25519::public_key::make({ ed_sk.pub_key(), sk2.pub_key() }, 1);
            const account_authenticator auth { multi_ed25519_authenticator { vk,
                multi_ed25519::signature::from_indexed({ { 1, sk2.sign(buffer { msg }) } }) } };
            expect(auth.verify(buffer { msg }));
            test_same(vk.auth_key(), auth.auth_key());
            expect(auth == bcs::deserialize<account_authenticator>(bcs::serialize(auth)));
        };
        "single_key"_test = [&] {
            const account_authenticator auth { single_key_authenticator { any_public_key { k1_sk.pub_key() }, any_signature { k1_sk.sign(buffer { msg }) } } };
            test_same(account_authenticator::variant_type::single_key, auth.variant());
            expect(auth.verify(buffer { msg }));
            const account_authenticator mixed { single_key_authenticator { any_public_key { k1_sk.pub_key() }, any_signature { ed_sk.sign(buffer { msg }) } } };
            expect(!mixed.verify(buffer { msg }));
            expect(auth == bcs::deserialize<account_authenticator>(bcs::serialize(auth)));
        };
        "multi_key"_test = [&] {
            const auto mk = multi_key::make({ any_public_key { ed_sk.pub_key() }, any_public_key { k1_sk.pub_key() } }, 2);
            const account_authenticator auth { multi_key_authenticator { mk, multi_key_signature::make({
                indexed_signature { 0, any_signature { ed_sk.sign(buffer { msg }) } },
                indexed_signature { 1, any_signature { k1_sk.sign(buffer { msg }) } }
            }) } };
            test_same(account_authenticator::variant_type::multi_key, auth.variant());
            expect(auth.verify(buffer { msg }));
            test_same(mk.auth_key(), auth.auth_key());
            expect(auth == bcs::deserialize<account_authenticator>(bcs::serialize(auth)));
        };
        "none"_test = [] {
            const account_authenticator auth { none_authenticator {} };
            test_hex("04", bcs::serialize(auth));
            expect(!auth.verify(buffer { msg }));
            expect(throws<crypto_error>([&] { auth.auth_key(); }));
            test_same(account_authenticator::variant_type::none, bcs::deserialize<account_authenticator>(uint8_vector::from_hex("04")).variant());
        };
        "unknown variant"_test = [] {
            expect(throws<bcs::error>([] { bcs::deserialize<account_authenticator>(uint8_vector::from_hex("05")); }));
        };
    };

    "crypto::private_key_format"_test = [] {
        static const std::string_view hex { "0xc5338cd251c22daa8c9c9cc94f498cc8a5c7e1d2e75287a5dda91096fe64efa5" };
        const auto expected = bytes_from_hex(hex);

        "aip-80 prefixes"_test = [] {
            test_same(std::string_view { "ed25519-priv-" }, aip80_prefix(private_key_variant::ed25519));
            test_same(std::string_view { "secp256k1-priv-" }, aip80_prefix(private_key_variant::secp256k1));
        };
        "format"_test = [&] {
            test_same(fmt::format("ed25519-priv-{}", hex), format_private_key(expected, private_key_variant::ed25519));
            test_same(fmt::format("secp256k1-priv-{}", hex), format_private_key(expected, private_key_variant::secp256k1));
        };
        "parse"_test = [&] {
            const auto aip80 = fmt::format("ed25519-priv-{}", hex);
            expect(parse_private_key(aip80, private_key_variant::ed25519) == expected);
            expect(parse_private_key(aip80, private_key_variant::ed25519, true) == expected);
            expect(parse_private_key(hex, private_key_variant::ed25519) == expected);
            expect(parse_private_key(hex.substr(2), private_key_variant::ed25519) == expected);
        };
        "parse errors"_test = [&] {
            expect(throws<crypto_error>([&] { parse_private_key(hex, private_key_variant::ed25519, true); }));
            expect(throws<crypto_error>([&] { parse_private_key(fmt::format("secp256k1-priv-{}", hex), private_key_variant::ed25519); }));
            expect(throws<crypto_error>([&] { parse_private_key(fmt::format("ed25519-priv-{}", hex.substr(2)), private_key_variant::ed25519); }));
            expect(throws<crypto_error>([] { parse_private_key("ed25519-priv-0xzz", private_key_variant::ed25519); }));
            expect(throws<crypto_error>([] { parse_private_key("", private_key_variant::secp256k1); }));
        };
    };
};

/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */

#include <ac/common/test.hpp>
#include <ac/account.hpp>
#include <ac/bcs.hpp>
#include <ac/tx/signed-transaction.hpp>

using namespace aptos_client;
using namespace aptos_client::tx;

namespace {
    static const std::string_view addr_one_hex { "0000000000000000000000000000000000000000000000000000000000000001" };

    raw_transaction sample_raw(const address &sender)
    {
        return {
            sender, 2,
            { entry_function::make("0x1::coin::transfer", {}, { uint8_vector { 0x01 } }) },
            3, 4, 5, 6
        };
    }
}

suite tx_transaction_suite = [] {
    "tx::payload"_test = [] {
        "module id"_test = [] {
            const auto mid = module_id::parse("0x1::coin");
            test_same(std::string { "0x1::coin" }, mid.to_string());
            test_hex(fmt::format("{}04636f696e", addr_one_hex), bcs::serialize(mid));
            expect(mid == bcs::deserialize<module_id>(bcs::serialize(mid)));
            expect(throws<value_error>([] { module_id::parse("0x1"); }));
            expect(throws<value_error>([] { module_id::parse("0x1::co-in"); }));
            expect(throws<value_error>([] { module_id::parse("zz::coin"); }));
        };
        "entry function"_test = [] {
            const auto ef = entry_function::make("0x1::coin::transfer", { move::aptos_coin_tag() }, { uint8_vector { 0x01, 0x02 } });
            test_same(std::string { "transfer" }, ef.function);
            const auto data = bcs::serialize(ef);
            expect(ef == bcs::deserialize<entry_function>(data));
            // the single argument is length-prefixed after its count
            test_hex("01020102", buffer { data.data() + data.size() - 4, 4 });
            expect(throws<value_error>([] { entry_function::make("0x1::coin"); }));
            expect(throws<value_error>([] { entry_function::make("0x1::coin::"); }));
        };
        "script arguments"_test = [] {
            test_hex("0501", bcs::serialize(script_argument { true }));
            test_hex("0007", bcs::serialize(script_argument { uint8_t { 7 } }));
            test_hex("010100000000000000", bcs::serialize(script_argument { uint64_t { 1 } }));
            test_hex("060100", bcs::serialize(script_argument { uint16_t { 1 } }));
            test_hex("0701000000", bcs::serialize(script_argument { uint32_t { 1 } }));
            test_hex("0202000000000000000000000000000000", bcs::serialize(script_argument { u128_arg { 2 } }));
            test_hex(fmt::format("03{}", addr_one_hex), bcs::serialize(script_argument { move::address_one }));
            test_hex("0402abcd", bcs::serialize(script_argument { uint8_vector { 0xAB, 0xCD } }));
            const script_argument big { u256_arg { cpp_int { 1 } << 255 } };
            const auto big_data = bcs::serialize(big);
            test_same(size_t { 33 }, big_data.size());
            test_same(uint8_t { 0x08 }, big_data[0]);
            test_same(uint8_t { 0x80 }, big_data[32]);
            expect(big == bcs::deserialize<script_argument>(big_data));
            expect(throws<bcs::error>([] { bcs::deserialize<script_argument>(uint8_vector::from_hex("0900")); }));
        };
        "script"_test = [] {
            const script s { uint8_vector { 0xA1, 0x1C }, { move::type_tag::parse("u8") }, { script_argument { true }, script_argument { uint8_t { 3 } } } };
            test_hex("02a11c0101020501" "0003", bcs::serialize(s));
            const transaction_payload p { s };
            test_same(transaction_payload::variant_type::script, p.variant());
            test_hex("0002a11c01010205010003", bcs::serialize(p));
            expect(p == bcs::deserialize<transaction_payload>(bcs::serialize(p)));
        };
        "multisig"_test = [] {
            const multisig proposal { move::address_one, {} };
            test_hex(fmt::format("{}00", addr_one_hex), bcs::serialize(proposal));
            const auto ef = entry_function::make("0x1::coin::transfer");
            const multisig inline_payload { move::address_one, multisig_payload { ef } };
            const transaction_payload p { inline_payload };
            test_same(transaction_payload::variant_type::multisig, p.variant());
            const auto data = bcs::serialize(p);
            test_hex(fmt::format("03{}0100", addr_one_hex), buffer { data.data(), 35 });
            expect(p == bcs::deserialize<transaction_payload>(data));
        };
        "module bundle is rejected"_test = [] {
            expect(throws<bcs::error>([] { bcs::deserialize<transaction_payload>(uint8_vector::from_hex("0100")); }));
            expect(throws<bcs::error>([] { bcs::deserialize<transaction_payload>(uint8_vector::from_hex("04")); }));
        };
    };

    "tx::raw_transaction"_test = [] {
        const auto raw = sample_raw(move::address_one);

        "wire format"_test = [&] {
            const auto exp = fmt::format("{}0200000000000000" "02{}04636f696e087472616e736665720001" "0101"
                "0300000000000000" "0400000000000000" "0500000000000000" "06", addr_one_hex, addr_one_hex);
            test_hex(exp, bcs::serialize(raw));
            expect(raw == bcs::deserialize<raw_transaction>(bcs::serialize(raw)));
        };
        "signing message"_test = [&] {
            const auto msg = raw.signing_message();
            test_same(raw_transaction_prefix(), crypto::sha3::digest(buffer { std::string_view { "APTOS::RawTransaction" } }));
            expect(buffer { msg.data(), 32 } == static_cast<buffer>(raw_transaction_prefix()));
            expect(buffer { msg.data() + 32, msg.size() - 32 } == static_cast<buffer>(bcs::serialize(raw)));
        };
        "with data"_test = [&] {
            const raw_transaction_with_data ma { multi_agent_transaction { raw, { move::address_two } } };
            const auto data = bcs::serialize(ma);
            test_same(uint8_t { 0 }, data[0]);
            expect(ma == bcs::deserialize<raw_transaction_with_data>(data));
            expect(!ma.fee_payer());
            const raw_transaction_with_data fp { fee_payer_transaction { raw, {}, move::address_three } };
            test_same(raw_transaction_with_data::variant_type::fee_payer == fp.variant(), true);
            test_same(move::address_three, *fp.fee_payer());
            const auto msg = fp.signing_message();
            expect(buffer { msg.data(), 32 } == static_cast<buffer>(raw_transaction_with_data_prefix()));
            test_same(uint8_t { 1 }, msg[32]);
            expect(throws<bcs::error>([] { bcs::deserialize<raw_transaction_with_data>(uint8_vector::from_hex("02")); }));
        };
    };

    "tx::signed_transaction"_test = [] {
        "ed25519"_test = [] {
            const auto acc = account::generate_ed25519();
            const auto raw = sample_raw(acc.address());
            const auto signed_tx = make_signed(raw, sign(acc.signer(), raw));
            test_same(transaction_authenticator::variant_type::ed25519, signed_tx.auth.variant());
            expect(signed_tx.verify());
            const auto data = bcs::serialize(signed_tx);
            const auto raw_size = bcs::serialize(raw).size();
            // variant 0 is followed directly by the length-prefixed key
            test_same(uint8_t { 0 }, data[raw_size]);
            test_same(uint8_t { 32 }, data[raw_size + 1]);
            expect(signed_tx == bcs::deserialize<signed_transaction>(data));
            auto tampered = signed_tx;
            tampered.raw.chain_id = 7;
            expect(!tampered.verify());
            static constexpr uint8_t zero = 0;
            test_same(crypto::sha3::digest({ transaction_prefix(), buffer { &zero, 1 }, data }), signed_tx.hash());
            test_same(to_hex(signed_tx.hash()), signed_tx.hash_hex());
        };
        "single sender"_test = [] {
            const auto acc = account::generate_secp256k1();
            const auto raw = sample_raw(acc.address());
            const auto signed_tx = make_signed(raw, sign(acc.signer(), raw));
            test_same(transaction_authenticator::variant_type::single_sender, signed_tx.auth.variant());
            expect(signed_tx.verify());
            expect(signed_tx == bcs::deserialize<signed_transaction>(bcs::serialize(signed_tx)));
        };
        "multi agent"_test = [] {
            const auto sender = account::generate_ed25519();
            const auto second = account::generate_single_key_ed25519();
            const raw_transaction_with_data rtwd { multi_agent_transaction { sample_raw(sender.address()), { second.address() } } };
            const auto signed_tx = make_signed(rtwd, sign(sender.signer(), rtwd), { sign(second.signer(), rtwd) });
            test_same(transaction_authenticator::variant_type::multi_agent, signed_tx.auth.variant());
            expect(signed_tx.verify());
            expect(with_data(signed_tx) == std::optional { rtwd });
            expect(signed_tx == bcs::deserialize<signed_transaction>(bcs::serialize(signed_tx)));
            const auto plain_sig = make_signed(rtwd, sign(sender.signer(), rtwd.raw()), { sign(second.signer(), rtwd) });
            expect(!plain_sig.verify()) << "the sender must sign the multi-agent message";
            expect(throws<error>([&] { make_signed(rtwd, sign(sender.signer(), rtwd), {}); }));
        };
        "fee payer"_test = [] {
            const auto sender = account::generate_ed25519();
            const auto payer = account::generate_secp256k1();
            const auto raw = sample_raw(sender.address());
            const raw_transaction_with_data unknown { fee_payer_transaction { raw, {}, move::address_zero } };
            const raw_transaction_with_data known { fee_payer_transaction { raw, {}, payer.address() } };
            const auto sender_auth = sign(sender.signer(), unknown);
            const auto signed_tx = make_signed(known, sender_auth, {}, sign(payer.signer(), known));
            test_same(transaction_authenticator::variant_type::fee_payer, signed_tx.auth.variant());
            expect(signed_tx.verify());
            const auto unpaid = make_signed(known, sender_auth, {});
            expect(!unpaid.verify());
            expect(throws<error>([&] {
                const raw_transaction_with_data ma { multi_agent_transaction { raw, {} } };
                make_signed(ma, sender_auth, {}, sign(payer.signer(), known));
            }));
        };
        "simulation"_test = [] {
            const auto sender = account::generate_single_key_ed25519();
            const auto raw = sample_raw(sender.address());
            const auto sim = make_simulated(raw, sender.signer());
            test_same(transaction_authenticator::variant_type::single_sender, sim.auth.variant());
            expect(!sim.verify());
            const auto &auth = std::get<single_sender_authenticator>(sim.auth.val).sender;
            test_same(sender.auth_key(), auth.auth_key());
            const raw_transaction_with_data rtwd { fee_payer_transaction { raw, { move::address_two }, move::address_zero } };
            const auto sim_fp = make_simulated(rtwd, sender.signer());
            const auto &fp = std::get<fee_payer_authenticator>(sim_fp.auth.val);
            test_same(size_t { 1 }, fp.secondary_signers.size());
            test_same(crypto::account_authenticator::variant_type::none, fp.secondary_signers[0].variant());
            test_same(crypto::account_authenticator::variant_type::none, fp.fee_payer.variant());
            test_same(crypto::account_authenticator::variant_type::single_key, fp.sender.variant());
        };
        "conversion of authenticators"_test = [] {
            expect(throws<crypto_error>([] {
                transaction_authenticator::from_account_authenticator(account_authenticator { crypto::none_authenticator {} });
            }));
        };
        "batch body"_test = [] {
            const auto acc = account::generate_ed25519();
            const auto raw = sample_raw(acc.address());
            const auto tx = make_signed(raw, sign(acc.signer(), raw));
            const auto body = batch_body({ tx, tx });
            test_same(uint8_t { 2 }, body[0]);
            expect(tx == bcs::deserialize_seq<signed_transaction>(body).at(1));
        };
    };
};

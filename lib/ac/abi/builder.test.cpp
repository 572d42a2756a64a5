/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */

#include <ac/common/test.hpp>
#include <ac/abi/builder.hpp>
#include <ac/bcs.hpp>

using namespace aptos_client;
using namespace aptos_client::abi;

namespace {
    static const std::string_view coin_abi_json { R"({
        "bytecode": "0xa11ceb0b",
        "abi": {
            "address": "0x1",
            "name": "coin",
            "friends": [],
            "exposed_functions": [
                {
                    "name": "transfer",
                    "visibility": "public",
                    "is_entry": true,
                    "is_view": false,
                    "generic_type_params": [ { "constraints": [] } ],
                    "params": [ "&signer", "address", "u64" ],
                    "return": []
                },
                {
                    "name": "balance",
                    "visibility": "public",
                    "is_entry": false,
                    "is_view": true,
                    "generic_type_params": [ { "constraints": [] } ],
                    "params": [ "address" ],
                    "return": [ "u64" ]
                },
                {
                    "name": "set_memo",
                    "visibility": "public",
                    "is_entry": true,
                    "is_view": false,
                    "generic_type_params": [],
                    "params": [ "signer", "&signer", "0x1::option::Option<0x1::string::String>" ],
                    "return": []
                }
            ],
            "structs": []
        }
    })" };

    module_abi coin_abi()
    {
        return module_abi::from_json(json::parse(buffer { coin_abi_json }));
    }
}

suite abi_builder_suite = [] {
    "abi::module_abi"_test = [] {
        const auto abi = coin_abi();
        test_same(move::address_one, abi.addr);
        test_same(std::string { "coin" }, abi.name);
        test_same(size_t { 3 }, abi.exposed_functions.size());
        const auto *fn = abi.find("balance");
        expect((fn != nullptr) >> fatal);
        expect(fn->is_view);
        expect(!fn->is_entry);
        test_same(size_t { 1 }, fn->generic_type_params);
        expect(fn->returns == std::vector<std::string> { "u64" });
        expect(abi.find("mint") == nullptr);
        expect(throws<error>([] { module_abi::from_json(json::parse(buffer { std::string_view { R"({"address":"0x1"})" } })); }));
    };

    "abi::entry_function_from_abi"_test = [] {
        const auto abi = coin_abi();

        "transfer"_test = [&] {
            const auto ef = entry_function_from_abi(abi, move::address_one, "coin", "transfer",
                { type_arg { std::string { "0x1::aptos_coin::AptosCoin" } } }, { "0xb0b", 1000 });
            test_same(std::string { "0x1::coin" }, ef.module.to_string());
            test_same(std::string { "transfer" }, ef.function);
            expect(ef.type_args == std::vector<move::type_tag> { move::aptos_coin_tag() });
            test_same(size_t { 2 }, ef.args.size());
            test_hex(fmt::format("{:0>64}", "b0b"), ef.args.at(0));
            test_hex("e803000000000000", ef.args.at(1));
        };
        "leading signers are skipped"_test = [&] {
            const auto ef = entry_function_from_abi(abi, move::address_one, "coin", "set_memo", {}, { "memo" });
            test_hex("01046d656d6f", ef.args.at(0));
            const auto none = entry_function_from_abi(abi, move::address_one, "coin", "set_memo", {}, { arg_value {} });
            test_hex("00", none.args.at(0));
        };
        "errors"_test = [&] {
            expect(throws<value_error>([&] { entry_function_from_abi(abi, move::address_one, "coin", "mint", {}, {}); }));
            expect(throws<value_error>([&] { entry_function_from_abi(abi, move::address_one, "coin", "balance", { type_arg { move::aptos_coin_tag() } }, { "0x1" }); }));
            expect(throws<value_error>([&] { entry_function_from_abi(abi, move::address_one, "coin", "transfer", {}, { "0x1", 1 }); }));
            expect(throws<value_error>([&] {
                entry_function_from_abi(abi, move::address_one, "coin", "transfer", { type_arg { move::aptos_coin_tag() } }, { "0x1" });
            }));
            expect(throws<value_error>([&] {
                entry_function_from_abi(abi, move::address_one, "coin", "transfer", { type_arg { move::aptos_coin_tag() } }, { "0x1", "-1" });
            }));
        };
    };

    "abi::view_payload_from_abi"_test = [] {
        const auto abi = coin_abi();
        const auto vp = view_payload_from_abi(abi, move::address_one, "coin", "balance", { type_arg { move::aptos_coin_tag() } }, { "0x1" });
        test_same(std::string { "balance" }, vp.function);
        test_hex(fmt::format("{:0>64}", "1"), vp.args.at(0));
        const auto decoded = bcs::deserialize<tx::view_payload>(bcs::serialize(vp));
        expect(decoded.module == vp.module && decoded.function == vp.function && decoded.type_args == vp.type_args && decoded.args == vp.args);
        expect(throws<value_error>([&] {
            view_payload_from_abi(abi, move::address_one, "coin", "transfer", { type_arg { move::aptos_coin_tag() } }, { "0x1", 1 });
        }));
    };
};

/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */

#include <ac/common/array.hpp>
#include <ac/common/test.hpp>

using namespace aptos_client;

suite common_format_suite = [] {
    "common::format"_test = [] {
        "bytes"_test = [] {
            const auto bytes = uint8_vector::from_hex("ab01");
            test_same(std::string { "AB01" }, fmt::format("{}", bytes));
            test_same(std::string { "AB01" }, fmt::format("{}", byte_array<2>::from_hex("ab01")));
            test_same(std::string { "ab01" }, fmt::format("{}", buffer_lowercase { bytes }));
            test_same(std::string { "0xab01" }, to_hex(bytes));
        };
        "containers"_test = [] {
            test_same(std::string { "[1, 2, 3]" }, fmt::format("{}", std::vector<int> { 1, 2, 3 }));
            test_same(std::string { "[]" }, fmt::format("{}", std::vector<int> {}));
            test_same(std::string { "7" }, fmt::format("{}", std::optional<int> { 7 }));
            test_same(std::string { "std::nullopt" }, fmt::format("{}", std::optional<int> {}));
        };
    };
};

/* This file is part of Aptos Client project
 * Copyright (c) 2025 Aptos Client developers */

#include <ac/common/test.hpp>
#include <ac/bcs.hpp>

using namespace aptos_client;

namespace {
    struct point {
        uint16_t x = 0;
        uint16_t y = 0;

        static point from_bcs(bcs::decoder &dec)
        {
            const auto x = dec.u16();
            const auto y = dec.u16();
            return { x, y };
        }

        void to_bcs(bcs::encoder &enc) const
        {
            enc.u16(x).u16(y);
        }

        bool operator==(const point &) const =default;
    };
}

suite bcs_suite = [] {
    "bcs"_test = [] {
        "integers"_test = [] {
            bcs::encoder enc {};
            enc.u64(1);
            test_hex("0100000000000000", enc.bcs());
            test_hex("0200", bcs::encoder {}.u16(2).bcs());
            test_hex("03000000", bcs::encoder {}.u32(3).bcs());
            test_hex("05000000000000000000000000000000", bcs::encoder {}.u128(5).bcs());
            test_hex("ffffffffffffffffffffffffffffffff", bcs::encoder {}.u128(big_uint_max(128)).bcs());
            test_hex("0600000000000000000000000000000000000000000000000000000000000000", bcs::encoder {}.u256(6).bcs());
            test_hex("ff", bcs::encoder {}.i8(-1).bcs());
            test_hex("feff", bcs::encoder {}.i16(-2).bcs());
            test_hex("ffffffffffffffffffffffffffffffff", bcs::encoder {}.i128(-1).bcs());
            test_hex("00000000000000000000000000000080", bcs::encoder {}.i128(big_int_min(128)).bcs());
        };
        "integer ranges"_test = [] {
            expect(throws<bcs::error>([] { bcs::encoder {}.u128(cpp_int { 1 } << 128); }));
            expect(throws<bcs::error>([] { bcs::encoder {}.u256(-1); }));
            expect(throws<bcs::error>([] { bcs::encoder {}.i128(big_int_max(128) + 1); }));
            expect(throws<bcs::error>([] { bcs::encoder {}.i256(big_int_min(256) - 1); }));
        };
        "signed round trip"_test = [] {
            const auto data = bcs::encoder {}.i8(-128).i64(-5).i256(big_int_min(256)).i128(42).bcs();
            bcs::decoder dec { data };
            test_same(-128, static_cast<int>(dec.i8()));
            test_same(int64_t { -5 }, dec.i64());
            test_same(big_int_min(256), dec.i256());
            test_same(cpp_int { 42 }, dec.i128());
            test_same(size_t { 0 }, dec.remaining());
            expect(dec.ok());
        };
        "uleb128"_test = [] {
            test_hex("00", bcs::encoder {}.uleb128(0).bcs());
            test_hex("7f", bcs::encoder {}.uleb128(127).bcs());
            test_hex("8001", bcs::encoder {}.uleb128(128).bcs());
            test_hex("ff7f", bcs::encoder {}.uleb128(16383).bcs());
            test_hex("ffff03", bcs::encoder {}.uleb128(65535).bcs());
            test_hex("ffffffff0f", bcs::encoder {}.uleb128(0xFFFFFFFF).bcs());
            expect(throws<bcs::error>([] { bcs::encoder {}.uleb128(0x100000000ULL); }));
            for (const uint32_t v: { 0U, 1U, 127U, 128U, 255U, 16383U, 16384U, 65535U, 0xFFFFFFFFU }) {
                const auto data = bcs::encoder {}.uleb128(v).bcs();
                bcs::decoder dec { data };
                test_same(v, dec.uleb128());
                expect(dec.ok());
            }
        };
        "uleb128 malformed"_test = [] {
            {
                const auto data = uint8_vector::from_hex("8080808080808080808080");
                bcs::decoder dec { data };
                test_same(uint32_t { 0 }, dec.uleb128());
                expect(!dec.ok());
            }
            {
                const auto data = uint8_vector::from_hex("8080808010");
                bcs::decoder dec { data };
                dec.uleb128();
                expect(!dec.ok()) << "values above 32 bits are rejected";
            }
            {
                const auto data = uint8_vector::from_hex("8000");
                bcs::decoder dec { data };
                dec.uleb128();
                expect(!dec.ok()) << "non-canonical encodings are rejected";
            }
            {
                const auto data = uint8_vector::from_hex("80");
                bcs::decoder dec { data };
                dec.uleb128();
                expect(!dec.ok());
            }
        };
        "bool"_test = [] {
            test_hex("01", bcs::encoder {}.boolean(true).bcs());
            test_hex("00", bcs::encoder {}.boolean(false).bcs());
            const auto data = uint8_vector::from_hex("0102");
            bcs::decoder dec { data };
            test_same(true, dec.boolean());
            expect(dec.ok());
            test_same(false, dec.boolean());
            expect(!dec.ok());
        };
        "bytes and strings"_test = [] {
            test_hex("0461626364", bcs::encoder {}.str("abcd").bcs());
            test_hex("0105", bcs::encoder {}.bytes(uint8_vector { 0x05 }).bcs());
            test_hex("00", bcs::encoder {}.str("").bcs());
            test_hex("0102", bcs::encoder {}.fixed_bytes(uint8_vector { 0x01, 0x02 }).bcs());
            const auto data = uint8_vector::from_hex("0461626364");
            bcs::decoder dec { data };
            test_same(std::string { "abcd" }, dec.str());
            expect(dec.ok());
        };
        "sequences and options"_test = [] {
            const std::vector<point> pts { { 1, 2 }, { 3, 4 } };
            const auto data = bcs::serialize_seq(pts);
            test_hex("02010002000300040000", data);
            expect(pts == bcs::deserialize_seq<point>(data));

            std::optional<point> some { point { 5, 6 } };
            test_hex("0105000600", bcs::encoder {}.option(some).bcs());
            test_hex("00", bcs::encoder {}.option(std::optional<point> {}).bcs());
            const auto opt_data = uint8_vector::from_hex("0105000600");
            bcs::decoder dec { opt_data };
            expect(some == dec.option<point>());
            const auto bad_opt = uint8_vector::from_hex("02");
            bcs::decoder bad_dec { bad_opt };
            expect(!bad_dec.option<point>());
            expect(!bad_dec.ok());
        };
        "sequence length beyond data"_test = [] {
            const auto data = uint8_vector::from_hex("05010002000300");
            expect(throws<bcs::error>([&] { bcs::deserialize_seq<point>(data); }));
        };
        "sticky errors"_test = [] {
            const auto data = uint8_vector::from_hex("0203");
            bcs::decoder dec { data };
            dec.u32();
            expect(!dec.ok());
            const auto first = *dec.error_message();
            test_same(uint8_t { 0 }, dec.u8());
            test_same(uint64_t { 0 }, dec.u64());
            test_same(false, dec.boolean());
            test_same(first, *dec.error_message());
            expect(throws<bcs::error>([&] { dec.throw_if_failed(); }));
        };
        "deserialize"_test = [] {
            expect(point { 1, 2 } == bcs::deserialize<point>(uint8_vector::from_hex("01000200")));
            expect(throws<bcs::error>([] { bcs::deserialize<point>(uint8_vector::from_hex("0100020000")); })) << "trailing bytes";
            expect(throws<bcs::error>([] { bcs::deserialize<point>(uint8_vector::from_hex("010002")); })) << "short buffer";
            expect(throws<bcs::error>([] { bcs::deserialize<point>(uint8_vector {}); }));
        };
    };
};
